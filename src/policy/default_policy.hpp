#pragma once

#include <string>
#include "core/errors/engine_errors.hpp"
#include "policy/policy.hpp"
#include "policy/policy_parser.hpp"

namespace execpolicy::policy {

// Source name reported by diagnostics for the embedded policy.
inline constexpr const char* kDefaultPolicySourceName = "default.policy";

// The embedded PDL text.
const std::string& default_policy_source();

// Parses the embedded policy into a fresh Policy.
core::errors::Result<Policy, ParseError> load_default_policy();

// Process-wide copy of the embedded policy, parsed on first use and never
// modified afterwards. Throws std::logic_error if the embedded text is broken.
const Policy& default_policy();

}  // namespace execpolicy::policy
