#include <algorithm>
#include <chrono>
#include <ctime>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/warden_errors.hpp"
#include "policy/policy_engine.hpp"
#include "policy/policy_guard.hpp"

namespace {

using warden::core::errors::ErrorKind;
using warden::core::errors::get_error;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::policy::PolicyEngine;
using warden::protocol::PolicyRequest;
using warden::protocol::RiskLevel;
using warden::protocol::SecurityPolicy;
namespace cond = warden::protocol::condition;
namespace act = warden::protocol::action;

PolicyRequest command_request(const std::string& command) {
    PolicyRequest request;
    request.tool_name = "execute_command";
    request.parameters["command"] = command;
    return request;
}

std::chrono::system_clock::time_point local_time(int hour, int minute) {
    std::tm parts{};
    parts.tm_year = 2024 - 1900;
    parts.tm_mon = 5;
    parts.tm_mday = 15;
    parts.tm_hour = hour;
    parts.tm_min = minute;
    parts.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&parts));
}

TEST(PolicyEngineTest, BuiltinPoliciesAreOrderedByPriority) {
    PolicyEngine engine;
    const auto policies = engine.get_policies();
    const std::vector<std::string> expected = {
        "block_dangerous_commands", "secrets_deny", "high_risk_requires_approval",
        "system_paths_protection", "resource_limits", "network_restrictions"};
    ASSERT_EQ(policies.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(policies[i].id, expected[i]);
        EXPECT_TRUE(policies[i].enabled);
    }
}

TEST(PolicyEngineTest, DestructiveCommandDeniedAndEvaluationStops) {
    PolicyEngine engine;
    auto request = command_request("rm -rf /");
    request.network_access = true;

    const auto decision = engine.evaluate_request(request);
    ASSERT_TRUE(warden::protocol::is_deny(decision.action));
    EXPECT_EQ(warden::protocol::action_reason(decision.action),
              "Command contains destructive operations");
    EXPECT_NE(decision.reason.find("Block Dangerous Commands"), std::string::npos);
    EXPECT_EQ(decision.applied_policies,
              std::vector<std::string>{"block_dangerous_commands"});
    EXPECT_FALSE(decision.audit_id.empty());
}

TEST(PolicyEngineTest, EveryDestructiveSignatureIsDenied) {
    PolicyEngine engine;
    for (const auto& signature : warden::policy::destructive_signatures()) {
        const auto decision = engine.evaluate_request(command_request("sudo " + signature));
        EXPECT_TRUE(warden::protocol::is_deny(decision.action)) << signature;
    }
}

TEST(PolicyEngineTest, HighestSeverityWinsAndAllMatchesAreRecorded) {
    PolicyEngine engine;
    auto request = command_request("git push");
    request.risk_assessment = RiskLevel::High;
    request.network_access = true;

    const auto decision = engine.evaluate_request(request);
    ASSERT_TRUE(std::holds_alternative<act::RequireApproval>(decision.action));
    EXPECT_EQ(decision.reason,
              "Policy 'High Risk Requires Approval' requires approval: "
              "High-risk operation detected");
    EXPECT_EQ(decision.applied_policies,
              (std::vector<std::string>{"high_risk_requires_approval",
                                        "network_restrictions"}));
}

TEST(PolicyEngineTest, NetworkOnlyRequestIsLogged) {
    PolicyEngine engine;
    auto request = command_request("git fetch");
    request.network_access = true;

    const auto decision = engine.evaluate_request(request);
    EXPECT_TRUE(std::holds_alternative<act::LogOnly>(decision.action));
    EXPECT_EQ(decision.reason, "Policy 'Network Access Restrictions' matched (log_only)");
}

TEST(PolicyEngineTest, UnmatchedRequestIsAllowedByDefault) {
    PolicyEngine engine;
    const auto decision = engine.evaluate_request(command_request("ls -la"));
    EXPECT_TRUE(std::holds_alternative<act::Allow>(decision.action));
    EXPECT_EQ(decision.reason, "Request allowed by default policy");
    EXPECT_TRUE(decision.applied_policies.empty());
}

TEST(PolicyEngineTest, CommandPatternChecksEveryParameterValue) {
    PolicyEngine engine;
    PolicyRequest request;
    request.tool_name = "execute_command";
    request.parameters["script"] = "mkfs.ext4 /dev/sdb1";
    EXPECT_TRUE(warden::protocol::is_deny(engine.evaluate_request(request).action));
}

TEST(PolicyEngineTest, SecretsAndSystemPathsAreDenied) {
    PolicyEngine engine;

    auto secrets = command_request("cat notes.txt");
    secrets.contains_secrets = true;
    EXPECT_TRUE(warden::protocol::is_deny(engine.evaluate_request(secrets).action));

    auto system = command_request("cat hosts");
    system.file_paths = {"/tmp/a.txt", "/etc/hosts"};
    const auto decision = engine.evaluate_request(system);
    ASSERT_TRUE(warden::protocol::is_deny(decision.action));
    EXPECT_EQ(decision.applied_policies,
              std::vector<std::string>{"system_paths_protection"});
}

TEST(PolicyEngineTest, ResourceLimitThresholdIsStrict) {
    PolicyEngine engine;

    auto heavy = command_request("make -j64");
    heavy.resource_limits.max_memory_mb = 2048;
    EXPECT_TRUE(warden::protocol::is_deny(engine.evaluate_request(heavy).action));

    auto boundary = command_request("make");
    boundary.resource_limits.max_cpu_percent = 80.0;
    boundary.resource_limits.max_memory_mb = 1024;
    EXPECT_TRUE(std::holds_alternative<act::Allow>(engine.evaluate_request(boundary).action));
}

TEST(PolicyEngineTest, CompareLimitParsesOperators) {
    using warden::policy::compare_limit;
    EXPECT_EQ(compare_limit(5.0, "> 4"), std::optional<bool>(true));
    EXPECT_EQ(compare_limit(4.0, "> 4"), std::optional<bool>(false));
    EXPECT_EQ(compare_limit(4.0, ">= 4"), std::optional<bool>(true));
    EXPECT_EQ(compare_limit(3.0, "< 3.5"), std::optional<bool>(true));
    EXPECT_EQ(compare_limit(3.0, "<= 2"), std::optional<bool>(false));
    EXPECT_EQ(compare_limit(7.0, "== 7"), std::optional<bool>(true));
    EXPECT_EQ(compare_limit(7.0, "!= 7"), std::optional<bool>(false));

    EXPECT_FALSE(compare_limit(1.0, ">4").has_value());
    EXPECT_FALSE(compare_limit(1.0, "~ 4").has_value());
    EXPECT_FALSE(compare_limit(1.0, "> four").has_value());
    EXPECT_FALSE(compare_limit(1.0, "> 4 extra").has_value());
    EXPECT_FALSE(compare_limit(1.0, "").has_value());
}

TEST(PolicyEngineTest, MalformedLimitNeverMatches) {
    PolicyEngine engine;
    auto request = command_request("ls");
    request.resource_limits.max_memory_mb = 99999;
    EXPECT_FALSE(engine.condition_matches(cond::ResourceLimit{"memory", "bogus"}, request));
    EXPECT_FALSE(engine.condition_matches(cond::ResourceLimit{"disk", "> 1"}, request));
    EXPECT_TRUE(engine.condition_matches(cond::ResourceLimit{"memory", "> 1"}, request));
}

TEST(PolicyEngineTest, TimeOfDayWindowWrapsMidnight) {
    auto now = local_time(23, 30);
    PolicyEngine engine(100, [&now] { return now; });
    const auto request = command_request("ls");
    const cond::TimeOfDay night{"22:00", "06:00"};

    EXPECT_TRUE(engine.condition_matches(night, request));
    now = local_time(5, 0);
    EXPECT_TRUE(engine.condition_matches(night, request));
    now = local_time(6, 0);
    EXPECT_TRUE(engine.condition_matches(night, request));
    now = local_time(12, 0);
    EXPECT_FALSE(engine.condition_matches(night, request));

    EXPECT_TRUE(engine.condition_matches(cond::TimeOfDay{"09:00", "17:00"}, request));
    EXPECT_FALSE(engine.condition_matches(cond::TimeOfDay{"25:00", "06:00"}, request));
    EXPECT_FALSE(engine.condition_matches(cond::TimeOfDay{"9:00", "17:00"}, request));
}

TEST(PolicyEngineTest, CustomTimeWindowPolicyEscalates) {
    auto now = local_time(2, 15);
    PolicyEngine engine(100, [&now] { return now; });

    SecurityPolicy after_hours;
    after_hours.id = "after_hours";
    after_hours.name = "After Hours";
    after_hours.conditions.push_back(cond::TimeOfDay{"22:00", "06:00"});
    after_hours.action = act::Escalate{"Outside working hours"};
    after_hours.priority = 50;
    ASSERT_FALSE(is_error(engine.add_policy(after_hours)));

    const auto decision = engine.evaluate_request(command_request("ls"));
    EXPECT_TRUE(std::holds_alternative<act::Escalate>(decision.action));
    EXPECT_EQ(decision.reason, "Policy 'After Hours' escalated request: Outside working hours");

    now = local_time(10, 0);
    EXPECT_TRUE(std::holds_alternative<act::Allow>(
        engine.evaluate_request(command_request("ls")).action));
}

TEST(PolicyEngineTest, UserAndToolConditions) {
    PolicyEngine engine;
    auto request = command_request("ls");
    EXPECT_FALSE(engine.condition_matches(cond::UserId{"alice"}, request));
    request.user_id = "alice";
    EXPECT_TRUE(engine.condition_matches(cond::UserId{"alice"}, request));
    EXPECT_TRUE(engine.condition_matches(cond::ToolName{"execute_command"}, request));
    EXPECT_FALSE(engine.condition_matches(cond::ToolName{"file_write"}, request));
}

TEST(PolicyEngineTest, AddPolicyValidatesAndSorts) {
    PolicyEngine engine;

    SecurityPolicy urgent;
    urgent.id = "urgent";
    urgent.name = "Urgent";
    urgent.conditions.push_back(cond::ToolName{"file_write"});
    urgent.action = act::Deny{"No writes"};
    urgent.priority = 200;

    auto added = engine.add_policy(urgent);
    ASSERT_FALSE(is_error(added));
    EXPECT_EQ(get_value(added), 7u);
    EXPECT_EQ(engine.get_policies().front().id, "urgent");

    auto duplicate = engine.add_policy(urgent);
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).kind, ErrorKind::InvalidPolicy);

    SecurityPolicy empty;
    empty.id = "empty";
    auto no_conditions = engine.add_policy(empty);
    ASSERT_TRUE(is_error(no_conditions));
    EXPECT_EQ(get_error(no_conditions).kind, ErrorKind::InvalidPolicy);
}

TEST(PolicyEngineTest, RemoveAndToggleReportUnknownIds) {
    PolicyEngine engine;

    auto missing = engine.remove_policy("nope");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).kind, ErrorKind::PolicyNotFound);

    auto toggle = engine.set_policy_enabled("nope", false);
    ASSERT_TRUE(is_error(toggle));
    EXPECT_EQ(get_error(toggle).kind, ErrorKind::PolicyNotFound);

    auto removed = engine.remove_policy("network_restrictions");
    ASSERT_FALSE(is_error(removed));
    EXPECT_EQ(get_value(removed), 5u);
}

TEST(PolicyEngineTest, DisabledPolicyIsSkipped) {
    PolicyEngine engine;
    ASSERT_FALSE(is_error(engine.set_policy_enabled("block_dangerous_commands", false)));

    const auto decision = engine.evaluate_request(command_request("rm -rf /"));
    EXPECT_TRUE(std::holds_alternative<act::Allow>(decision.action));

    ASSERT_FALSE(is_error(engine.set_policy_enabled("block_dangerous_commands", true)));
    EXPECT_TRUE(warden::protocol::is_deny(
        engine.evaluate_request(command_request("rm -rf /")).action));
}

TEST(PolicyEngineTest, AuditTrailIsBoundedAndExportsJsonLines) {
    PolicyEngine engine(2);
    const auto first = engine.evaluate_request(command_request("ls"));
    const auto second = engine.evaluate_request(command_request("rm -rf /"));
    const auto third = engine.evaluate_request(command_request("pwd"));

    const auto trail = engine.get_audit_trail();
    ASSERT_EQ(trail.size(), 2u);
    EXPECT_EQ(trail[0].id, second.audit_id);
    EXPECT_EQ(trail[1].id, third.audit_id);
    EXPECT_NE(first.audit_id, second.audit_id);

    std::istringstream lines(engine.export_audit_log());
    std::string line;
    std::vector<nlohmann::json> parsed;
    while (std::getline(lines, line)) {
        parsed.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0]["id"], second.audit_id);
    EXPECT_EQ(parsed[0]["decision"]["action"], "deny");
    EXPECT_EQ(parsed[0]["request"]["parameters"]["command"], "rm -rf /");
    EXPECT_TRUE(parsed[1]["timestamp"].is_number_integer());
}

TEST(PolicyEngineTest, AssessesRiskFromToolAndPath) {
    EXPECT_EQ(PolicyEngine::assess_risk_level("file_write", {{"path", "/etc/hosts"}}),
              RiskLevel::Critical);
    EXPECT_EQ(PolicyEngine::assess_risk_level("file_write", {{"path", "/sys/power"}}),
              RiskLevel::Critical);
    EXPECT_EQ(PolicyEngine::assess_risk_level("file_write", {{"path", "/tmp/x"}}),
              RiskLevel::Medium);
    EXPECT_EQ(PolicyEngine::assess_risk_level("file_read", {}), RiskLevel::Low);
    EXPECT_EQ(PolicyEngine::assess_risk_level("directory_list", {}), RiskLevel::Low);
    EXPECT_EQ(PolicyEngine::assess_risk_level("process_list", {}), RiskLevel::Low);
    EXPECT_EQ(PolicyEngine::assess_risk_level("execute_command", {}), RiskLevel::Medium);
}

}  // namespace
