#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden::protocol {

enum class RiskLevel {
    Low,
    Medium,
    High,
    Critical
};

// Ceilings the agent asks for when proposing an action.
struct RequestedLimits {
    std::uint64_t max_memory_mb = 0;
    double max_cpu_percent = 0.0;
    std::uint64_t max_execution_time_secs = 0;
    std::uint64_t max_output_size = 0;
    std::uint32_t max_processes = 0;
};

// One candidate action proposed by the agent layer.
struct PolicyRequest {
    std::optional<std::string> user_id;
    std::string tool_name;
    std::map<std::string, std::string> parameters;
    RequestedLimits resource_limits;
    bool contains_secrets = false;
    bool network_access = false;
    std::vector<std::string> file_paths;
    RiskLevel risk_assessment = RiskLevel::Low;
};

namespace condition {
struct UserId { std::string user_id; };
struct ToolName { std::string tool_name; };
struct CommandPattern { std::string pattern; };
// field is one of memory, cpu, time, output, processes; limit is "<op> <number>"
struct ResourceLimit { std::string field; std::string limit; };
// HH:MM bounds in local time
struct TimeOfDay { std::string start; std::string end; };
struct NetworkAccess { bool required; };
struct FilePath { std::string prefix; };
struct ContainsSecrets { bool required; };
struct Risk { RiskLevel level; };
}  // namespace condition

using PolicyCondition = std::variant<
    condition::UserId,
    condition::ToolName,
    condition::CommandPattern,
    condition::ResourceLimit,
    condition::TimeOfDay,
    condition::NetworkAccess,
    condition::FilePath,
    condition::ContainsSecrets,
    condition::Risk
>;

namespace action {
struct Allow {};
struct Deny { std::string reason; };
struct RequireApproval { std::string reason; };
struct Escalate { std::string reason; };
struct LogOnly {};
}  // namespace action

using PolicyAction = std::variant<
    action::Allow,
    action::Deny,
    action::RequireApproval,
    action::Escalate,
    action::LogOnly
>;

struct SecurityPolicy {
    std::string id;
    std::string name;
    std::string description;
    std::vector<PolicyCondition> conditions;
    PolicyAction action = action::Allow{};
    int priority = 0;
    bool enabled = true;
};

struct PolicyDecision {
    PolicyAction action = action::Allow{};
    std::string reason;
    std::vector<std::string> applied_policies;
    std::string audit_id;
};

struct PolicyAuditEntry {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    PolicyRequest request;
    PolicyDecision decision;
};

inline std::string to_string(const RiskLevel level) {
    switch (level) {
        case RiskLevel::Low:
            return "low";
        case RiskLevel::Medium:
            return "medium";
        case RiskLevel::High:
            return "high";
        case RiskLevel::Critical:
            return "critical";
        default:
            return "unknown";
    }
}

inline std::string action_name(const PolicyAction& action) {
    struct Visitor {
        std::string operator()(const action::Allow&) const { return "allow"; }
        std::string operator()(const action::Deny&) const { return "deny"; }
        std::string operator()(const action::RequireApproval&) const {
            return "require_approval";
        }
        std::string operator()(const action::Escalate&) const { return "escalate"; }
        std::string operator()(const action::LogOnly&) const { return "log_only"; }
    };
    return std::visit(Visitor{}, action);
}

inline std::string action_reason(const PolicyAction& action) {
    if (const auto* deny = std::get_if<action::Deny>(&action)) {
        return deny->reason;
    }
    if (const auto* approval = std::get_if<action::RequireApproval>(&action)) {
        return approval->reason;
    }
    if (const auto* escalate = std::get_if<action::Escalate>(&action)) {
        return escalate->reason;
    }
    return "";
}

// Deny > Escalate > RequireApproval > LogOnly > Allow
inline int severity(const PolicyAction& action) {
    struct Visitor {
        int operator()(const action::Allow&) const { return 0; }
        int operator()(const action::LogOnly&) const { return 1; }
        int operator()(const action::RequireApproval&) const { return 2; }
        int operator()(const action::Escalate&) const { return 3; }
        int operator()(const action::Deny&) const { return 4; }
    };
    return std::visit(Visitor{}, action);
}

inline bool is_deny(const PolicyAction& action) {
    return std::holds_alternative<action::Deny>(action);
}

}  // namespace warden::protocol
