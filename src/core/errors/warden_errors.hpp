#pragma once
#include <string>
#include <variant>

namespace warden::core::errors {

    // Broad buckets used for exit codes and log routing
    enum class ErrorCategory {
        Input,      // E.g., empty command or malformed config
        Policy,     // E.g., blocked command, denied request
        Execution,  // E.g., timeout, spawn failure, dangerous output
        Resource,   // E.g., concurrency ceiling reached
        Internal    // E.g., invalid state transition
    };

    // Closed set of every failure the enforcement core can report
    enum class ErrorKind {
        BlockedCommand,
        NotWhitelisted,
        DangerousPattern,
        BlockedPath,
        ShellMetacharacter,
        EmptyCommand,
        OutputTooLarge,
        DangerousOutput,
        Timeout,
        RateLimited,
        ResourceExceeded,
        Cancelled,
        SpawnFailed,
        PolicyDenied,
        ConfirmationDeclined,
        PolicyNotFound,
        InvalidPolicy,
        EvaluationError,
        InvalidPattern,
        InvalidConfig,
        AuditWriteFailed,
        Internal
    };

    struct WardenError {
        ErrorKind kind;
        std::string message;
        std::string hint = "";
    };

    template <typename T>
    using Result = std::variant<T, WardenError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<WardenError>(result);
    }

    template <typename T>
    const WardenError& get_error(const Result<T>& result) {
        return std::get<WardenError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_code(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::BlockedCommand: return "blocked_command";
            case ErrorKind::NotWhitelisted: return "not_in_allowlist";
            case ErrorKind::DangerousPattern: return "dangerous_pattern";
            case ErrorKind::BlockedPath: return "blocked_path";
            case ErrorKind::ShellMetacharacter: return "shell_metacharacter";
            case ErrorKind::EmptyCommand: return "empty_command";
            case ErrorKind::OutputTooLarge: return "output_too_large";
            case ErrorKind::DangerousOutput: return "dangerous_output";
            case ErrorKind::Timeout: return "timeout";
            case ErrorKind::RateLimited: return "rate_limited";
            case ErrorKind::ResourceExceeded: return "resource_exceeded";
            case ErrorKind::Cancelled: return "cancelled";
            case ErrorKind::SpawnFailed: return "spawn_failed";
            case ErrorKind::PolicyDenied: return "policy_denied";
            case ErrorKind::ConfirmationDeclined: return "confirmation_declined";
            case ErrorKind::PolicyNotFound: return "policy_not_found";
            case ErrorKind::InvalidPolicy: return "invalid_policy";
            case ErrorKind::EvaluationError: return "evaluation_error";
            case ErrorKind::InvalidPattern: return "invalid_pattern";
            case ErrorKind::InvalidConfig: return "invalid_config";
            case ErrorKind::AuditWriteFailed: return "audit_write_failed";
            case ErrorKind::Internal: return "internal_error";
        }
        return "unknown_error";
    }

    inline ErrorCategory category_of(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::EmptyCommand:
            case ErrorKind::ShellMetacharacter:
            case ErrorKind::InvalidPattern:
            case ErrorKind::InvalidConfig:
            case ErrorKind::InvalidPolicy:
            case ErrorKind::PolicyNotFound:
                return ErrorCategory::Input;
            case ErrorKind::BlockedCommand:
            case ErrorKind::NotWhitelisted:
            case ErrorKind::DangerousPattern:
            case ErrorKind::BlockedPath:
            case ErrorKind::PolicyDenied:
            case ErrorKind::ConfirmationDeclined:
                return ErrorCategory::Policy;
            case ErrorKind::OutputTooLarge:
            case ErrorKind::DangerousOutput:
            case ErrorKind::Timeout:
            case ErrorKind::Cancelled:
            case ErrorKind::SpawnFailed:
                return ErrorCategory::Execution;
            case ErrorKind::RateLimited:
            case ErrorKind::ResourceExceeded:
                return ErrorCategory::Resource;
            case ErrorKind::EvaluationError:
            case ErrorKind::AuditWriteFailed:
            case ErrorKind::Internal:
                return ErrorCategory::Internal;
        }
        return ErrorCategory::Internal;
    }

    inline std::string to_string(const WardenError& error) {
        return "[" + to_code(error.kind) + "] " + error.message;
    }

} // namespace warden::core::errors
