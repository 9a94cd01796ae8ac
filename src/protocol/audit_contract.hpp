#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace warden::protocol {

enum class AuditEventType {
    AgentExecution,
    SecurityEvent,
    ResourceUsage,
    ConfigurationChange,
    Authentication,
    Authorization,
    DataAccess,
    SystemHealth
};

enum class AuditSeverity {
    Low,
    Medium,
    High,
    Critical
};

enum class AuditOutcome {
    Success,
    Failure,
    Warning
};

struct AuditResult {
    AuditOutcome outcome = AuditOutcome::Success;
    // Empty for Success
    std::string message;
};

struct AuditEvent {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    AuditEventType event_type = AuditEventType::Authorization;
    AuditSeverity severity = AuditSeverity::Low;
    std::optional<std::string> user_id;
    std::string operation;
    std::string resource;
    AuditResult result;
    std::map<std::string, std::string> details;
};

inline std::string to_string(const AuditEventType type) {
    switch (type) {
        case AuditEventType::AgentExecution:
            return "AGENT_EXECUTION";
        case AuditEventType::SecurityEvent:
            return "SECURITY_EVENT";
        case AuditEventType::ResourceUsage:
            return "RESOURCE_USAGE";
        case AuditEventType::ConfigurationChange:
            return "CONFIG_CHANGE";
        case AuditEventType::Authentication:
            return "AUTHENTICATION";
        case AuditEventType::Authorization:
            return "AUTHORIZATION";
        case AuditEventType::DataAccess:
            return "DATA_ACCESS";
        case AuditEventType::SystemHealth:
            return "SYSTEM_HEALTH";
        default:
            return "UNKNOWN";
    }
}

inline std::string to_string(const AuditSeverity severity) {
    switch (severity) {
        case AuditSeverity::Low:
            return "LOW";
        case AuditSeverity::Medium:
            return "MEDIUM";
        case AuditSeverity::High:
            return "HIGH";
        case AuditSeverity::Critical:
            return "CRITICAL";
        default:
            return "UNKNOWN";
    }
}

inline std::string to_string(const AuditResult& result) {
    switch (result.outcome) {
        case AuditOutcome::Success:
            return "SUCCESS";
        case AuditOutcome::Failure:
            return "FAILURE: " + result.message;
        case AuditOutcome::Warning:
            return "WARNING: " + result.message;
        default:
            return "UNKNOWN";
    }
}

}  // namespace warden::protocol
