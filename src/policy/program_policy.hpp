#pragma once

#include <string>
#include <vector>
#include "core/errors/engine_errors.hpp"
#include "policy/arg_matcher.hpp"
#include "policy/match_errors.hpp"
#include "protocol/exec_call.hpp"

namespace execpolicy::policy {

// The accepted shape of one program's invocations.
class ProgramPolicy {
public:
    ProgramPolicy() = default;

    // Flag matchers found in `patterns` go to the flag set; the rest stay
    // in order as positional patterns.
    ProgramPolicy(std::string program,
                  const std::vector<ArgMatcher>& patterns,
                  std::vector<std::string> system_path = {});

    const std::string& program() const { return program_; }
    const std::vector<ArgMatcher>& arg_patterns() const { return arg_patterns_; }
    const std::vector<std::string>& flags() const { return flags_; }
    const std::vector<std::string>& system_path() const { return system_path_; }
    const std::vector<std::vector<std::string>>& should_match() const { return should_match_; }
    const std::vector<std::vector<std::string>>& should_not_match() const {
        return should_not_match_;
    }

    void add_flag(const std::string& flag);
    void add_should_match(std::vector<std::string> args);
    void add_should_not_match(std::vector<std::string> args);

    bool has_flag(const std::string& flag) const;

    // Pure and reentrant. `call.program` is not compared against program();
    // Policy::check does the lookup.
    core::errors::Result<protocol::MatchedExec, MatchError> check(
        const protocol::ExecCall& call) const;

private:
    std::string program_;
    std::vector<ArgMatcher> arg_patterns_;
    std::vector<std::string> flags_;
    std::vector<std::string> system_path_;
    std::vector<std::vector<std::string>> should_match_;
    std::vector<std::vector<std::string>> should_not_match_;
};

}  // namespace execpolicy::policy
