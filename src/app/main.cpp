#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/errors/engine_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/default_policy.hpp"
#include "policy/policy.hpp"
#include "policy/policy_parser.hpp"
#include "protocol/check_request.hpp"
#include "protocol/exec_call.hpp"
#include "report/check_report.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitViolations = 1;
constexpr int kExitInputError = 2;
constexpr int kExitPolicyError = 3;
constexpr int kExitMatchWritesFiles = 12;
constexpr int kExitUnverified = 13;

int run_check(const execpolicy::protocol::CheckRequest& req,
              const execpolicy::policy::Policy& policy) {
    const execpolicy::protocol::ExecCall call{req.program, req.args};
    const auto outcome = policy.check(call);
    const auto verdict = execpolicy::report::classify(outcome);

    if (execpolicy::core::errors::is_error(outcome)) {
        const auto& err = execpolicy::core::errors::get_error(outcome);
        if (execpolicy::policy::is_unknown_program(err)) {
            EXECPOLICY_LOG_INFO("No policy for " + req.program + "; treating as unverified");
        } else {
            EXECPOLICY_LOG_INFO("Call rejected [" + execpolicy::policy::error_code(err) +
                                "]: " + execpolicy::policy::describe(err));
        }
    } else {
        EXECPOLICY_LOG_DEBUG("Call matched with verdict " +
                             execpolicy::report::to_string(verdict));
    }

    std::cout << execpolicy::report::build_report(outcome).dump() << std::endl;

    if (!req.require_safe) {
        return kExitOk;
    }
    switch (verdict) {
        case execpolicy::report::CheckVerdict::Safe:
            return kExitOk;
        case execpolicy::report::CheckVerdict::Match:
            return kExitMatchWritesFiles;
        case execpolicy::report::CheckVerdict::Unverified:
            return kExitUnverified;
    }
    return kExitUnverified;
}

int run_verify(const execpolicy::policy::Policy& policy) {
    const auto violations = policy.check_examples();
    nlohmann::json payload = nlohmann::json::array();
    for (const auto& violation : violations) {
        EXECPOLICY_LOG_WARN("Example violation for " + violation.program + ": " +
                            violation.detail);
        payload.push_back(execpolicy::report::to_json(violation));
    }
    std::cout << payload.dump(2) << std::endl;

    EXECPOLICY_LOG_INFO("Checked examples of " + std::to_string(policy.size()) +
                        " programs, " + std::to_string(violations.size()) + " violations");
    return violations.empty() ? kExitOk : kExitViolations;
}

}  // namespace

int main(int argc, char* argv[]) {
    execpolicy::core::logging::Logger::get().set_source("execpolicy");

    // 1. Parse CLI input and return normalized input errors
    auto parsed = execpolicy::app::cli::parse_and_validate(argc, argv);
    if (execpolicy::core::errors::is_error(parsed)) {
        const auto& err = execpolicy::core::errors::get_error(parsed);
        EXECPOLICY_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            EXECPOLICY_LOG_INFO("Hint: " + err.hint);
        }
        return kExitInputError;
    }

    const auto& req = execpolicy::core::errors::get_value(parsed);
    if (req.verbose) {
        execpolicy::core::logging::Logger::get().set_min_level(
            execpolicy::core::logging::LogLevel::DEBUG);
    }

    // 2. Load the policy once; every check below borrows it
    std::optional<execpolicy::policy::Policy> file_policy;
    if (req.policy_file.has_value()) {
        EXECPOLICY_LOG_DEBUG("Loading policy file: " + req.policy_file->string());
        auto loaded = execpolicy::policy::load_policy_file(req.policy_file.value());
        if (execpolicy::core::errors::is_error(loaded)) {
            const auto& err = execpolicy::core::errors::get_error(loaded);
            EXECPOLICY_LOG_ERROR("Policy error [" + err.code + "]: " +
                                 execpolicy::policy::to_string(err));
            return kExitPolicyError;
        }
        file_policy = std::move(std::get<execpolicy::policy::Policy>(loaded));
    }
    const execpolicy::policy::Policy& policy =
        file_policy.has_value() ? *file_policy : execpolicy::policy::default_policy();
    EXECPOLICY_LOG_DEBUG("Policy covers " + std::to_string(policy.size()) + " programs");

    // 3. Dispatch
    switch (req.command) {
        case execpolicy::protocol::CliCommand::Check:
            return run_check(req, policy);
        case execpolicy::protocol::CliCommand::Verify:
            return run_verify(policy);
    }
    return kExitInputError;
}
