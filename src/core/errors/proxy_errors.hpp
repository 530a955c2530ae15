#pragma once
#include <string>
#include <variant>

namespace acptrace::core::errors {

    // Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., missing agent command or an unknown CLI flag
        Io,         // E.g., a pipe read/write failed while forwarding
        Spawn,      // E.g., fork/exec of the agent process failed
        Telemetry,  // E.g., exporter or provider could not be built
        Internal    // E.g., C++ logic bug
    };

    // The standardized error payload
    struct ProxyError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";              // Helpful tips for the user
    };

    // A Result holds either a successful value of type T, OR a ProxyError.
    template <typename T>
    using Result = std::variant<T, ProxyError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ProxyError>(result);
    }

    template <typename T>
    const ProxyError& get_error(const Result<T>& result) {
        return std::get<ProxyError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Io: return "io";
            case ErrorCategory::Spawn: return "spawn";
            case ErrorCategory::Telemetry: return "telemetry";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace acptrace::core::errors
