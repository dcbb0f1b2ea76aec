#include "cli_parser.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace execpolicy::app::cli {

    using namespace execpolicy::core::errors;
    using execpolicy::protocol::CheckRequest;
    using execpolicy::protocol::CliCommand;

    constexpr const char* kUsage =
        "Usage: execpolicy check [--policy FILE] [--require-safe] [--verbose] -- PROGRAM [ARGS...]\n"
        "       execpolicy verify [--policy FILE] [--verbose]";

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> policy_file;
        bool require_safe = false;
        bool verbose = false;
        std::vector<std::string> invocation;
        bool saw_separator = false;
    };

    Result<CheckRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return EngineError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const std::string command = argv[1];
        if (command != "check" && command != "verify") {
            return EngineError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings. Everything after "--"
        //    belongs to the invocation being checked.
        for (size_t i = 0; i < args.size(); ++i) {
            if (raw.saw_separator) {
                raw.invocation.push_back(args[i]);
            } else if (args[i] == "--") {
                raw.saw_separator = true;
            } else if (args[i] == "--policy") {
                if (i + 1 < args.size()) raw.policy_file = args[++i];
                else return EngineError{ErrorCategory::Input, "Missing value for --policy", "missing_value"};
            } else if (args[i] == "--require-safe") {
                raw.require_safe = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return EngineError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                   "Put the command to check after \"--\"."};
            }
        }

        // 3. Validator Phase
        CheckRequest req;
        req.verbose = raw.verbose;
        req.require_safe = raw.require_safe;
        req.command = command == "check" ? CliCommand::Check : CliCommand::Verify;

        if (req.command == CliCommand::Check) {
            if (raw.invocation.empty()) {
                return EngineError{ErrorCategory::Input, "No program to check.", "missing_program", kUsage};
            }
            if (raw.invocation.front().empty()) {
                return EngineError{ErrorCategory::Input, "Program name cannot be empty.", "missing_program"};
            }
            req.program = raw.invocation.front();
            req.args.assign(raw.invocation.begin() + 1, raw.invocation.end());
        } else {
            if (raw.saw_separator) {
                return EngineError{ErrorCategory::Input, "verify does not take a program to check.", "unexpected_program"};
            }
            if (raw.require_safe) {
                return EngineError{ErrorCategory::Input, "--require-safe only applies to check.", "conflicting_flags"};
            }
        }

        // Path validation
        if (raw.policy_file) {
            std::filesystem::path p(raw.policy_file.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return EngineError{ErrorCategory::Input, "Policy file does not exist or is not a regular file", "invalid_path"};
            }
            req.policy_file = std::move(p);
        }

        return req;
    }

} // namespace execpolicy::app::cli
