#pragma once

#include <map>
#include <string>
#include <vector>
#include "core/errors/engine_errors.hpp"
#include "policy/match_errors.hpp"
#include "policy/program_policy.hpp"
#include "protocol/exec_call.hpp"

namespace execpolicy::policy {

// A should_match / should_not_match example that the engine disagrees with.
struct ExampleViolation {
    std::string program;
    std::vector<std::string> args;
    bool expected_match = true;
    std::string detail;
};

// Program name -> ProgramPolicy. Built once, then only read; safe to share
// across threads without locking.
class Policy {
public:
    Policy() = default;

    // Returns false when `program_policy.program()` is already present.
    bool add(ProgramPolicy program_policy);

    const ProgramPolicy* find(const std::string& program) const;
    bool contains(const std::string& program) const { return find(program) != nullptr; }
    std::size_t size() const { return programs_.size(); }
    std::vector<std::string> programs() const;

    core::errors::Result<protocol::MatchedExec, MatchError> check(
        const protocol::ExecCall& call) const;

    // Runs every declared example through check().
    std::vector<ExampleViolation> check_examples() const;

private:
    std::map<std::string, ProgramPolicy> programs_;
};

inline core::errors::Result<protocol::MatchedExec, MatchError> check(
    const Policy& policy, const protocol::ExecCall& call) {
    return policy.check(call);
}

}  // namespace execpolicy::policy
