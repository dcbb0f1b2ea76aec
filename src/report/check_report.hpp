#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/engine_errors.hpp"
#include "policy/arg_matcher.hpp"
#include "policy/match_errors.hpp"
#include "policy/policy.hpp"
#include "protocol/exec_call.hpp"

namespace execpolicy::report {

// How the caller should treat a checked invocation.
enum class CheckVerdict {
    Safe,        // Matched and writes no files: run directly
    Match,       // Matched but writes files: caller must vet the write targets
    Unverified   // Error or unknown program: sandbox or ask the user
};

using CheckOutcome = core::errors::Result<protocol::MatchedExec, policy::MatchError>;

CheckVerdict classify(const CheckOutcome& outcome);

nlohmann::json to_json(const policy::ArgMatcher& matcher);
nlohmann::json to_json(const protocol::MatchedArg& arg);
nlohmann::json to_json(const protocol::ValidExec& exec);
nlohmann::json to_json(const policy::MatchError& error);
nlohmann::json to_json(const policy::ExampleViolation& violation);

// {"result": "safe" | "match", "match": {...}} or
// {"result": "unverified", "error": {...}}
nlohmann::json build_report(const CheckOutcome& outcome);

inline std::string to_string(const CheckVerdict verdict) {
    switch (verdict) {
        case CheckVerdict::Safe:
            return "safe";
        case CheckVerdict::Match:
            return "match";
        case CheckVerdict::Unverified:
            return "unverified";
    }
    return "unknown";
}

}  // namespace execpolicy::report
