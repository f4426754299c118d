#pragma once
#include <string>
#include <variant>

namespace arena::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,          // E.g., a malformed CLI flag or problems file
        Configuration,  // E.g., starting a contest with no problems loaded
        Agent,          // E.g., an agent timed out or threw during a round
        Ledger,         // E.g., a negative deposit or an insufficient transfer
        Ruleset,        // E.g., an unauthorized constitution update
        Sandbox,        // E.g., the submission process could not be launched
        Internal        // E.g., C++ logic bug or I/O failure
    };

    // The standardized error payload
    struct ContestError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a ContestError.
    template <typename T>
    using Result = std::variant<T, ContestError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ContestError>(result);
    }

    template <typename T>
    const ContestError& get_error(const Result<T>& result) {
        return std::get<ContestError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::Agent: return "agent";
            case ErrorCategory::Ledger: return "ledger";
            case ErrorCategory::Ruleset: return "ruleset";
            case ErrorCategory::Sandbox: return "sandbox";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace arena::core::errors
