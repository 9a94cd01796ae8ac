#include "policy/policy_engine.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <mutex>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/audit_id.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"

namespace warden::policy {

using core::errors::ErrorKind;
using core::errors::WardenError;
using nlohmann::json;
namespace cond = protocol::condition;
namespace act = protocol::action;

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

std::optional<double> requested_field(const protocol::RequestedLimits& limits,
                                      const std::string& field) {
    if (field == "memory") return static_cast<double>(limits.max_memory_mb);
    if (field == "cpu") return limits.max_cpu_percent;
    if (field == "time") return static_cast<double>(limits.max_execution_time_secs);
    if (field == "output") return static_cast<double>(limits.max_output_size);
    if (field == "processes") return static_cast<double>(limits.max_processes);
    return std::nullopt;
}

int minutes_of_day(const std::chrono::system_clock::time_point point) {
    const std::time_t raw = std::chrono::system_clock::to_time_t(point);
    std::tm local{};
    localtime_r(&raw, &local);
    return local.tm_hour * 60 + local.tm_min;
}

std::int64_t to_unix_ms(const std::chrono::system_clock::time_point point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               point.time_since_epoch())
        .count();
}

json request_to_json(const protocol::PolicyRequest& request) {
    json payload;
    payload["user_id"] = request.user_id.has_value() ? json(request.user_id.value()) : json();
    payload["tool_name"] = request.tool_name;
    payload["parameters"] = request.parameters;
    payload["resource_limits"] = {
        {"max_memory_mb", request.resource_limits.max_memory_mb},
        {"max_cpu_percent", request.resource_limits.max_cpu_percent},
        {"max_execution_time_secs", request.resource_limits.max_execution_time_secs},
        {"max_output_size", request.resource_limits.max_output_size},
        {"max_processes", request.resource_limits.max_processes}};
    payload["contains_secrets"] = request.contains_secrets;
    payload["network_access"] = request.network_access;
    payload["file_paths"] = request.file_paths;
    payload["risk_assessment"] = protocol::to_string(request.risk_assessment);
    return payload;
}

json decision_to_json(const protocol::PolicyDecision& decision) {
    json payload;
    payload["action"] = protocol::action_name(decision.action);
    payload["action_reason"] = protocol::action_reason(decision.action);
    payload["reason"] = decision.reason;
    payload["applied_policies"] = decision.applied_policies;
    payload["audit_id"] = decision.audit_id;
    return payload;
}

std::string describe_match(const protocol::SecurityPolicy& policy) {
    if (protocol::is_deny(policy.action)) {
        return "Policy '" + policy.name + "' denied request: " +
               protocol::action_reason(policy.action);
    }
    const std::string reason = protocol::action_reason(policy.action);
    if (reason.empty()) {
        return "Policy '" + policy.name + "' matched (" +
               protocol::action_name(policy.action) + ")";
    }
    if (std::holds_alternative<protocol::action::Escalate>(policy.action)) {
        return "Policy '" + policy.name + "' escalated request: " + reason;
    }
    return "Policy '" + policy.name + "' requires approval: " + reason;
}

}  // namespace

std::optional<bool> compare_limit(const double actual, const std::string& expression) {
    std::istringstream in(expression);
    std::string op;
    std::string number;
    std::string trailing;
    if (!(in >> op >> number) || (in >> trailing)) {
        return std::nullopt;
    }

    double limit = 0.0;
    try {
        std::size_t consumed = 0;
        limit = std::stod(number, &consumed);
        if (consumed != number.size()) {
            return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (op == ">") return actual > limit;
    if (op == "<") return actual < limit;
    if (op == ">=") return actual >= limit;
    if (op == "<=") return actual <= limit;
    if (op == "==") return actual == limit;
    if (op == "!=") return actual != limit;
    return std::nullopt;
}

std::optional<int> parse_clock_time(const std::string& text) {
    if (text.size() != 5 || text[2] != ':') {
        return std::nullopt;
    }
    for (const std::size_t i : {0u, 1u, 3u, 4u}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    const int hours = (text[0] - '0') * 10 + (text[1] - '0');
    const int minutes = (text[3] - '0') * 10 + (text[4] - '0');
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }
    return hours * 60 + minutes;
}

std::vector<protocol::SecurityPolicy> PolicyEngine::builtin_policies() {
    std::vector<protocol::SecurityPolicy> policies;

    protocol::SecurityPolicy dangerous;
    dangerous.id = "block_dangerous_commands";
    dangerous.name = "Block Dangerous Commands";
    dangerous.description = "Prevents execution of potentially destructive commands";
    for (const auto& signature : destructive_signatures()) {
        dangerous.conditions.push_back(cond::CommandPattern{signature});
    }
    dangerous.action = act::Deny{"Command contains destructive operations"};
    dangerous.priority = 100;
    policies.push_back(std::move(dangerous));

    protocol::SecurityPolicy secrets;
    secrets.id = "secrets_deny";
    secrets.name = "Deny Operations with Secrets";
    secrets.description = "Blocks requests that carry credentials or keys";
    secrets.conditions.push_back(cond::ContainsSecrets{true});
    secrets.action = act::Deny{"Operation contains sensitive information"};
    secrets.priority = 95;
    policies.push_back(std::move(secrets));

    protocol::SecurityPolicy high_risk;
    high_risk.id = "high_risk_requires_approval";
    high_risk.name = "High Risk Requires Approval";
    high_risk.description = "High and critical risk operations need a human";
    high_risk.conditions.push_back(cond::Risk{protocol::RiskLevel::High});
    high_risk.conditions.push_back(cond::Risk{protocol::RiskLevel::Critical});
    high_risk.action = act::RequireApproval{"High-risk operation detected"};
    high_risk.priority = 90;
    policies.push_back(std::move(high_risk));

    protocol::SecurityPolicy system_paths;
    system_paths.id = "system_paths_protection";
    system_paths.name = "System Paths Protection";
    system_paths.description = "Protects critical system directories";
    for (const char* prefix : {"/etc", "/sys", "/dev", "/proc", "/root"}) {
        system_paths.conditions.push_back(cond::FilePath{prefix});
    }
    system_paths.action = act::Deny{"Access to system directories is not allowed"};
    system_paths.priority = 85;
    policies.push_back(std::move(system_paths));

    protocol::SecurityPolicy limits;
    limits.id = "resource_limits";
    limits.name = "Enforce Resource Limits";
    limits.description = "Rejects requests asking for excessive resources";
    limits.conditions.push_back(cond::ResourceLimit{"memory", "> 1024"});
    limits.conditions.push_back(cond::ResourceLimit{"cpu", "> 80"});
    limits.action = act::Deny{"Resource limits exceed safe thresholds"};
    limits.priority = 80;
    policies.push_back(std::move(limits));

    protocol::SecurityPolicy network;
    network.id = "network_restrictions";
    network.name = "Network Access Restrictions";
    network.description = "Logs every request that needs network access";
    network.conditions.push_back(cond::NetworkAccess{true});
    network.action = act::LogOnly{};
    network.priority = 70;
    policies.push_back(std::move(network));

    return policies;
}

PolicyEngine::PolicyEngine(const std::size_t audit_capacity, Clock clock)
    : policies_(builtin_policies()),
      audit_capacity_(audit_capacity == 0 ? 1 : audit_capacity),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {
    sort_policies();
}

void PolicyEngine::sort_policies() {
    std::stable_sort(policies_.begin(), policies_.end(),
                     [](const protocol::SecurityPolicy& a, const protocol::SecurityPolicy& b) {
                         return a.priority > b.priority;
                     });
}

bool PolicyEngine::condition_matches(const protocol::PolicyCondition& condition,
                                     const protocol::PolicyRequest& request) const {
    if (const auto* user = std::get_if<cond::UserId>(&condition)) {
        return request.user_id.has_value() && request.user_id.value() == user->user_id;
    }
    if (const auto* tool = std::get_if<cond::ToolName>(&condition)) {
        return request.tool_name == tool->tool_name;
    }
    if (const auto* pattern = std::get_if<cond::CommandPattern>(&condition)) {
        // Every value, so renaming the parameter key does not evade the rule.
        for (const auto& entry : request.parameters) {
            if (entry.second.find(pattern->pattern) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
    if (const auto* limit = std::get_if<cond::ResourceLimit>(&condition)) {
        const auto actual = requested_field(request.resource_limits, limit->field);
        if (!actual.has_value()) {
            return false;
        }
        const auto result = compare_limit(actual.value(), limit->limit);
        return result.has_value() && result.value();
    }
    if (const auto* window = std::get_if<cond::TimeOfDay>(&condition)) {
        const auto start = parse_clock_time(window->start);
        const auto end = parse_clock_time(window->end);
        if (!start.has_value() || !end.has_value()) {
            return false;
        }
        const int now = minutes_of_day(clock_());
        if (start.value() <= end.value()) {
            return now >= start.value() && now <= end.value();
        }
        return now >= start.value() || now <= end.value();
    }
    if (const auto* network = std::get_if<cond::NetworkAccess>(&condition)) {
        return request.network_access == network->required;
    }
    if (const auto* path = std::get_if<cond::FilePath>(&condition)) {
        return std::any_of(request.file_paths.begin(), request.file_paths.end(),
                           [&](const std::string& file) {
                               return starts_with(file, path->prefix);
                           });
    }
    if (const auto* secrets = std::get_if<cond::ContainsSecrets>(&condition)) {
        return request.contains_secrets == secrets->required;
    }
    if (const auto* risk = std::get_if<cond::Risk>(&condition)) {
        return protocol::to_string(request.risk_assessment) ==
               protocol::to_string(risk->level);
    }
    return false;
}

protocol::PolicyDecision PolicyEngine::evaluate_request(const protocol::PolicyRequest& request) {
    protocol::PolicyDecision decision;
    decision.action = act::Allow{};
    decision.reason = "Request allowed by default policy";
    decision.audit_id = core::config::generate_audit_id();

    {
        std::shared_lock<std::shared_mutex> lock(policies_mutex_);
        for (const auto& policy : policies_) {
            if (!policy.enabled) {
                continue;
            }
            const bool matched = std::any_of(
                policy.conditions.begin(), policy.conditions.end(),
                [&](const protocol::PolicyCondition& c) { return condition_matches(c, request); });
            if (!matched) {
                continue;
            }

            decision.applied_policies.push_back(policy.id);
            if (protocol::severity(policy.action) > protocol::severity(decision.action)) {
                decision.action = policy.action;
                decision.reason = describe_match(policy);
            }
            if (protocol::is_deny(decision.action)) {
                break;
            }
        }
    }

    if (protocol::is_deny(decision.action)) {
        LOG_WARN("PolicyEngine: " + decision.reason + " (" + decision.audit_id + ")");
    } else {
        LOG_DEBUG("PolicyEngine: " + protocol::action_name(decision.action) + " for tool '" +
                  request.tool_name + "' (" + decision.audit_id + ")");
    }

    protocol::PolicyAuditEntry entry;
    entry.id = decision.audit_id;
    entry.timestamp = clock_();
    entry.request = request;
    entry.decision = decision;
    record_audit(std::move(entry));

    return decision;
}

void PolicyEngine::record_audit(protocol::PolicyAuditEntry entry) {
    std::unique_lock<std::shared_mutex> lock(audit_mutex_);
    audit_trail_.push_back(std::move(entry));
    while (audit_trail_.size() > audit_capacity_) {
        audit_trail_.pop_front();
    }
}

core::errors::Result<std::size_t> PolicyEngine::add_policy(protocol::SecurityPolicy policy) {
    if (policy.id.empty()) {
        return WardenError{ErrorKind::InvalidPolicy, "Policy id cannot be empty."};
    }
    if (policy.conditions.empty()) {
        return WardenError{ErrorKind::InvalidPolicy,
                           "Policy '" + policy.id + "' has no conditions."};
    }

    std::unique_lock<std::shared_mutex> lock(policies_mutex_);
    const auto existing = std::find_if(
        policies_.begin(), policies_.end(),
        [&](const protocol::SecurityPolicy& p) { return p.id == policy.id; });
    if (existing != policies_.end()) {
        return WardenError{ErrorKind::InvalidPolicy,
                           "Policy '" + policy.id + "' already exists.",
                           "Remove it first or choose another id."};
    }

    LOG_INFO("PolicyEngine: added policy '" + policy.id + "' (priority " +
             std::to_string(policy.priority) + ")");
    policies_.push_back(std::move(policy));
    sort_policies();
    return policies_.size();
}

core::errors::Result<std::size_t> PolicyEngine::remove_policy(const std::string& policy_id) {
    std::unique_lock<std::shared_mutex> lock(policies_mutex_);
    const auto existing = std::find_if(
        policies_.begin(), policies_.end(),
        [&](const protocol::SecurityPolicy& p) { return p.id == policy_id; });
    if (existing == policies_.end()) {
        return WardenError{ErrorKind::PolicyNotFound,
                           "Policy not found: " + policy_id};
    }
    policies_.erase(existing);
    sort_policies();
    LOG_INFO("PolicyEngine: removed policy '" + policy_id + "'");
    return policies_.size();
}

core::errors::Result<bool> PolicyEngine::set_policy_enabled(const std::string& policy_id,
                                                            const bool enabled) {
    std::unique_lock<std::shared_mutex> lock(policies_mutex_);
    const auto existing = std::find_if(
        policies_.begin(), policies_.end(),
        [&](const protocol::SecurityPolicy& p) { return p.id == policy_id; });
    if (existing == policies_.end()) {
        return WardenError{ErrorKind::PolicyNotFound,
                           "Policy not found: " + policy_id};
    }
    existing->enabled = enabled;
    sort_policies();
    LOG_INFO("PolicyEngine: policy '" + policy_id + "' " +
             (enabled ? "enabled" : "disabled"));
    return enabled;
}

std::vector<protocol::SecurityPolicy> PolicyEngine::get_policies() const {
    std::shared_lock<std::shared_mutex> lock(policies_mutex_);
    return policies_;
}

std::vector<protocol::PolicyAuditEntry> PolicyEngine::get_audit_trail() const {
    std::shared_lock<std::shared_mutex> lock(audit_mutex_);
    return {audit_trail_.begin(), audit_trail_.end()};
}

std::string PolicyEngine::export_audit_log() const {
    std::shared_lock<std::shared_mutex> lock(audit_mutex_);
    std::string out;
    for (const auto& entry : audit_trail_) {
        json line;
        line["id"] = entry.id;
        line["timestamp"] = to_unix_ms(entry.timestamp);
        line["request"] = request_to_json(entry.request);
        line["decision"] = decision_to_json(entry.decision);
        out += line.dump();
        out += "\n";
    }
    return out;
}

protocol::RiskLevel PolicyEngine::assess_risk_level(
    const std::string& tool_name, const std::map<std::string, std::string>& parameters) {
    if (tool_name == "file_write") {
        const auto path = parameters.find("path");
        if (path != parameters.end() &&
            (starts_with(path->second, "/etc") || starts_with(path->second, "/sys"))) {
            return protocol::RiskLevel::Critical;
        }
        return protocol::RiskLevel::Medium;
    }
    if (tool_name == "file_read" || tool_name == "directory_list" ||
        tool_name == "process_list") {
        return protocol::RiskLevel::Low;
    }
    return protocol::RiskLevel::Medium;
}

}  // namespace warden::policy
