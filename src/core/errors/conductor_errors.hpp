#pragma once
#include <string>
#include <variant>

namespace conductor::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,                 // E.g., unknown run id or a bad CLI flag
        AgentInvocation,       // E.g., agent process timed out or crashed
        InvalidTransition,     // E.g., resume on a run that is not paused
        InvalidConfiguration,  // E.g., empty agent list, round count < 1
        Configuration,         // E.g., connection endpoint missing
        Cancelled,             // Run was cancelled between turns
        Internal               // E.g., state file could not be written
    };

    // The standardized error payload
    struct ConductorError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a ConductorError.
    template <typename T>
    using Result = std::variant<T, ConductorError>;

    // --- Helpers to work with std::variant ---

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ConductorError>(result);
    }

    template <typename T>
    const ConductorError& get_error(const Result<T>& result) {
        return std::get<ConductorError>(result);
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
            case ErrorCategory::AgentInvocation:
                return "agent_invocation";
            case ErrorCategory::InvalidTransition:
                return "invalid_transition";
            case ErrorCategory::InvalidConfiguration:
                return "invalid_configuration";
            case ErrorCategory::Configuration:
                return "configuration";
            case ErrorCategory::Cancelled:
                return "cancelled";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

    // Rendered form stored as a run's error detail: "[code] message"
    inline std::string format_error(const ConductorError& error) {
        return "[" + error.code + "] " + error.message;
    }

} // namespace conductor::core::errors
