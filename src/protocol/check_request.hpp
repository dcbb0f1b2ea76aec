#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace execpolicy::protocol {

    enum class CliCommand {
        Check,   // Check one invocation against the policy
        Verify   // Run the policy's should_match / should_not_match examples
    };

    // Validated CLI input
    struct CheckRequest {
        CliCommand command = CliCommand::Check;
        std::optional<std::filesystem::path> policy_file; // Embedded default policy when empty
        std::string program;
        std::vector<std::string> args;
        bool require_safe = false;
        bool verbose = false;
    };

} // namespace execpolicy::protocol
