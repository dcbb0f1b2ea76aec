#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include "core/errors/engine_errors.hpp"
#include "policy/policy.hpp"

namespace execpolicy::policy {

// A malformed policy source. line/column are 1-based; line 0 means the
// source could not be read at all.
struct ParseError {
    std::string source_name;
    std::size_t line = 0;
    std::size_t column = 0;
    std::string message;
    std::string code = "syntax_error";
};

// "<source>:<line>:<column>: <message>"
std::string to_string(const ParseError& error);

// Parses PDL text, e.g.
//
//   define_program(
//       program="cp",
//       options=[flag("-r")],
//       args=[ARG_RFILES, ARG_WFILE],
//       system_path=["/bin/cp", "/usr/bin/cp"],
//       should_match=[["a", "b"]],
//       should_not_match=[["a"]],
//   )
//
// `source_name` only labels diagnostics.
class PolicyParser {
public:
    PolicyParser(std::string source_name, std::string source);

    core::errors::Result<Policy, ParseError> parse() const;

private:
    std::string source_name_;
    std::string source_;
};

core::errors::Result<Policy, ParseError> load_policy(const std::string& source_name,
                                                     const std::string& source);

// Reads and parses a policy file; the path is used as the source name.
core::errors::Result<Policy, ParseError> load_policy_file(const std::filesystem::path& path);

}  // namespace execpolicy::policy
