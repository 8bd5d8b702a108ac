#pragma once
#include <string>
#include <variant>

namespace hookguard::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,          // E.g., stdin is not JSON or the CLI flag is unknown
        Configuration,  // E.g., session cannot be scoped, unknown gate in registry
        State,          // E.g., session file unreadable, lock not acquired
        ExternalCheck,  // E.g., compliance checker timed out
        Gate,           // E.g., a gate raised while evaluating
        Internal        // E.g., C++ logic bug or serialization failure
    };

    // The standardized error payload
    struct HookError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Remediation shown to the user
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a HookError.
    template <typename T>
    using Result = std::variant<T, HookError>;

    // --- Helpers to work with std::variant ---

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<HookError>(result);
    }

    template <typename T>
    const HookError& get_error(const Result<T>& result) {
        return std::get<HookError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Configuration:
                return "configuration";
            case ErrorCategory::State:
                return "state";
            case ErrorCategory::ExternalCheck:
                return "external_check";
            case ErrorCategory::Gate:
                return "gate";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace hookguard::core::errors
