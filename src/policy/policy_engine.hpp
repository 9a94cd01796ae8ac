#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "core/errors/warden_errors.hpp"
#include "protocol/policy_contract.hpp"

namespace warden::policy {

// Decision point. Evaluates a PolicyRequest against an ordered set of
// declarative rules and never performs the action itself.
class PolicyEngine {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit PolicyEngine(std::size_t audit_capacity = 10000, Clock clock = {});

    // Never fails: a request that matches nothing is allowed.
    protocol::PolicyDecision evaluate_request(const protocol::PolicyRequest& request);

    // Returns the new policy count.
    core::errors::Result<std::size_t> add_policy(protocol::SecurityPolicy policy);
    core::errors::Result<std::size_t> remove_policy(const std::string& policy_id);
    core::errors::Result<bool> set_policy_enabled(const std::string& policy_id, bool enabled);

    // Highest priority first.
    std::vector<protocol::SecurityPolicy> get_policies() const;

    std::vector<protocol::PolicyAuditEntry> get_audit_trail() const;
    // One JSON object per line: {id, timestamp, request, decision}.
    std::string export_audit_log() const;

    static protocol::RiskLevel assess_risk_level(
        const std::string& tool_name,
        const std::map<std::string, std::string>& parameters);

    static std::vector<protocol::SecurityPolicy> builtin_policies();

    // Exposed for tests; pure apart from the clock.
    bool condition_matches(const protocol::PolicyCondition& condition,
                           const protocol::PolicyRequest& request) const;

private:
    void sort_policies();
    void record_audit(protocol::PolicyAuditEntry entry);

    mutable std::shared_mutex policies_mutex_;
    std::vector<protocol::SecurityPolicy> policies_;

    mutable std::shared_mutex audit_mutex_;
    std::deque<protocol::PolicyAuditEntry> audit_trail_;
    std::size_t audit_capacity_;

    Clock clock_;
};

// "<op> <number>" with op one of > < >= <= == !=. Returns nullopt when the
// expression is malformed.
std::optional<bool> compare_limit(double actual, const std::string& expression);

// Minutes since midnight for "HH:MM", nullopt if malformed.
std::optional<int> parse_clock_time(const std::string& text);

}  // namespace warden::policy
