#pragma once
#include <string>
#include <variant>

namespace execpolicy::core::errors {

    // Typed error categories for everything outside the matching engine
    enum class ErrorCategory {
        Input,      // E.g., an invalid CLI flag or a missing program name
        Parse,      // E.g., a policy source that does not parse
        Policy,     // E.g., a call that the loaded policy does not accept
        Internal    // E.g., a broken invariant inside the engine
    };

    // The standardized error payload
    struct EngineError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";              // Helpful tips for the user
    };

    // A Result holds either a successful value of type T, OR an error of type E.
    // Most code uses EngineError; the parser and the matcher carry their own
    // typed errors.
    template <typename T, typename E = EngineError>
    using Result = std::variant<T, E>;

    template <typename T, typename E>
    bool is_error(const std::variant<T, E>& result) {
        return std::holds_alternative<E>(result);
    }

    template <typename T, typename E>
    const E& get_error(const std::variant<T, E>& result) {
        return std::get<E>(result);
    }

    template <typename T, typename E>
    const T& get_value(const std::variant<T, E>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Parse:
                return "parse";
            case ErrorCategory::Policy:
                return "policy";
            case ErrorCategory::Internal:
                return "internal";
        }
        return "unknown";
    }

} // namespace execpolicy::core::errors
