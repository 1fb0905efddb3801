#pragma once
#include <string>
#include <variant>

namespace toolbridge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., a command is missing a required parameter
        NotFound,   // E.g., unknown command or unregistered service
        Execution,  // E.g., the backend tool reported a failure
        Transport,  // E.g., a subprocess died or an HTTP stream dropped
        Internal    // E.g., unexpected exception inside a handler
    };

    // The standardized error payload
    struct BridgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T or a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // 3. Wire error codes (JSON-RPC numbering without the JSON-RPC envelope)
    namespace codes {
        constexpr int kParseError = -32700;
        constexpr int kInvalidRequest = -32600;
        constexpr int kNotFound = -32601;
        constexpr int kInvalidParams = -32602;
        constexpr int kInternalError = -32603;
        constexpr int kToolError = -32000;
    }

    inline int to_wire_code(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return codes::kInvalidParams;
            case ErrorCategory::NotFound:  return codes::kNotFound;
            case ErrorCategory::Execution: return codes::kToolError;
            case ErrorCategory::Transport: return codes::kInternalError;
            case ErrorCategory::Internal:  return codes::kInternalError;
            default: return codes::kInternalError;
        }
    }

    inline std::string to_string(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::NotFound:  return "not_found";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace toolbridge::core::errors
