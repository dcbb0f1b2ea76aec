#include "policy/policy.hpp"

#include <utility>

namespace execpolicy::policy {

using protocol::ExecCall;
using protocol::MatchedExec;

bool Policy::add(ProgramPolicy program_policy) {
    const std::string name = program_policy.program();
    return programs_.emplace(name, std::move(program_policy)).second;
}

const ProgramPolicy* Policy::find(const std::string& program) const {
    const auto it = programs_.find(program);
    if (it == programs_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> Policy::programs() const {
    std::vector<std::string> names;
    names.reserve(programs_.size());
    for (const auto& entry : programs_) {
        names.push_back(entry.first);
    }
    return names;
}

core::errors::Result<MatchedExec, MatchError> Policy::check(const ExecCall& call) const {
    const ProgramPolicy* program_policy = find(call.program);
    if (program_policy == nullptr) {
        return MatchError{NoPolicyForProgram{call.program}};
    }
    return program_policy->check(call);
}

std::vector<ExampleViolation> Policy::check_examples() const {
    std::vector<ExampleViolation> violations;
    for (const auto& entry : programs_) {
        const ProgramPolicy& program_policy = entry.second;

        for (const auto& args : program_policy.should_match()) {
            const auto result = program_policy.check(ExecCall{entry.first, args});
            if (core::errors::is_error(result)) {
                violations.push_back(ExampleViolation{
                    entry.first, args, true, describe(core::errors::get_error(result))});
            }
        }

        for (const auto& args : program_policy.should_not_match()) {
            const auto result = program_policy.check(ExecCall{entry.first, args});
            if (!core::errors::is_error(result)) {
                violations.push_back(
                    ExampleViolation{entry.first, args, false, "call unexpectedly matched"});
            }
        }
    }
    return violations;
}

}  // namespace execpolicy::policy
