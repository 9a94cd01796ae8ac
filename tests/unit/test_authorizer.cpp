#include <deque>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/guard_config.hpp"
#include "core/errors/warden_errors.hpp"
#include "policy/policy_guard.hpp"
#include "runtime/authorizer.hpp"
#include "runtime/confirmation_prompter.hpp"
#include "runtime/guard_context.hpp"
#include "safety/resource_probe.hpp"

namespace {

using warden::core::config::GuardConfig;
using warden::core::errors::ErrorKind;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::protocol::AuditEventType;
using warden::protocol::AuditSeverity;
using warden::protocol::RiskLevel;
using warden::runtime::ActionRequest;
using warden::runtime::AuthorizationOutcome;
using warden::runtime::AuthorizationState;
using warden::runtime::Authorizer;
using warden::runtime::ConfirmationPrompter;
using warden::runtime::GuardContext;
using S = AuthorizationState;

class ScriptedPrompter : public ConfirmationPrompter {
public:
    std::optional<std::string> ask(const std::string& prompt) override {
        prompts.push_back(prompt);
        if (answers.empty()) {
            return std::nullopt;
        }
        std::string answer = answers.front();
        answers.pop_front();
        return answer;
    }

    std::deque<std::string> answers;
    std::vector<std::string> prompts;
};

class IdleProbe : public warden::safety::ResourceProbe {
public:
    warden::safety::ResourceSample sample() override { return {}; }
};

GuardConfig fast_config() {
    GuardConfig config;
    config.safety.command_min_interval_ms = 0;
    config.safety.api_min_interval_ms = 0;
    return config;
}

ActionRequest make_request(const std::string& program, std::vector<std::string> args,
                           RiskLevel risk = RiskLevel::Low) {
    ActionRequest request;
    request.program = program;
    request.args = std::move(args);
    request.policy_request.tool_name = "execute_command";
    request.policy_request.risk_assessment = risk;
    return request;
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

class AuthorizerTest : public ::testing::Test {
protected:
    explicit AuthorizerTest(GuardConfig config = fast_config())
        : context_(config, std::make_shared<IdleProbe>()), authorizer_(context_, prompter_) {}

    AuthorizationOutcome run(const ActionRequest& request) {
        auto result = authorizer_.authorize(request);
        EXPECT_FALSE(is_error(result));
        return get_value(result);
    }

    GuardContext context_;
    ScriptedPrompter prompter_;
    Authorizer authorizer_;
};

TEST_F(AuthorizerTest, DestructiveWriteIsDeniedBeforeAnythingRuns) {
    auto request = make_request("rm", {"-rf", "/"}, RiskLevel::High);
    request.policy_request.tool_name = "file_write";

    const auto outcome = run(request);
    EXPECT_EQ(outcome.state, S::Denied);
    EXPECT_EQ(outcome.trail, (std::vector<S>{S::Proposed, S::PolicyChecked, S::Denied}));
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::PolicyDenied);
    EXPECT_FALSE(outcome.output.has_value());
    EXPECT_TRUE(prompter_.prompts.empty());
    EXPECT_TRUE(context_.safety().get_command_history(10).empty());

    // The enforcement layer refuses it on its own as well.
    EXPECT_TRUE(is_error(context_.sandbox().validate_command("rm", {"-rf", "/"})));

    const auto events = context_.audit_trail().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, AuditEventType::Authorization);
    EXPECT_EQ(events[0].severity, AuditSeverity::High);
    EXPECT_EQ(events[0].details.at("state"), "denied");
    EXPECT_EQ(events[0].details.at("policy_audit_id"), outcome.decision.audit_id);
}

TEST_F(AuthorizerTest, EveryDestructiveSignatureIsRefusedByEveryLayer) {
    for (const auto& signature : warden::policy::destructive_signatures()) {
        const auto words = split_words(signature);
        ASSERT_FALSE(words.empty());
        const std::string program = words.front();
        const std::vector<std::string> args(words.begin() + 1, words.end());

        warden::protocol::PolicyRequest policy_request;
        policy_request.tool_name = "execute_command";
        policy_request.parameters["command"] = signature;
        EXPECT_TRUE(warden::protocol::is_deny(
            context_.policy_engine().evaluate_request(policy_request).action))
            << signature;
        EXPECT_TRUE(is_error(context_.sandbox().validate_command(program, args))) << signature;
        EXPECT_TRUE(is_error(context_.safety().check_command(program, args))) << signature;
    }
}

TEST_F(AuthorizerTest, AllowedCommandCompletes) {
    const auto outcome = run(make_request("echo", {"hello"}));
    EXPECT_EQ(outcome.state, S::Completed);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.trail, (std::vector<S>{S::Proposed, S::PolicyChecked, S::RateLimited,
                                             S::SandboxValidated, S::Executing, S::Completed}));
    ASSERT_TRUE(outcome.output.has_value());
    EXPECT_EQ(outcome.output->stdout_text, "hello\n");
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_TRUE(prompter_.prompts.empty());

    const auto history = context_.safety().get_command_history(5);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_FALSE(history[0].blocked);

    const auto events = context_.audit_trail().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, AuditEventType::AgentExecution);
    EXPECT_EQ(events[0].severity, AuditSeverity::Low);
    EXPECT_EQ(events[0].details.at("exit_code"), "0");
}

TEST_F(AuthorizerTest, NonZeroExitCompletesWithWarning) {
    const auto outcome = run(make_request("bash", {"-c", "exit 2"}));
    EXPECT_EQ(outcome.state, S::Completed);
    ASSERT_TRUE(outcome.output.has_value());
    EXPECT_EQ(outcome.output->exit_code, 2);

    const auto events = context_.audit_trail().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].result.outcome, warden::protocol::AuditOutcome::Warning);
    EXPECT_EQ(events[0].result.message, "exit code 2");
}

TEST_F(AuthorizerTest, ApprovalRequiredAndGranted) {
    prompter_.answers.push_back("yes");
    const auto outcome = run(make_request("echo", {"deploy"}, RiskLevel::High));

    EXPECT_EQ(outcome.state, S::Completed);
    EXPECT_EQ(outcome.trail,
              (std::vector<S>{S::Proposed, S::PolicyChecked, S::RateLimited,
                              S::SandboxValidated, S::ConfirmationPending, S::Executing,
                              S::Completed}));
    ASSERT_EQ(prompter_.prompts.size(), 1u);
    EXPECT_EQ(prompter_.prompts[0].rfind("Policy: ", 0), 0u);
    EXPECT_NE(prompter_.prompts[0].find("High-risk operation detected"), std::string::npos);
    EXPECT_NE(prompter_.prompts[0].find("Operation: echo"), std::string::npos);
}

TEST_F(AuthorizerTest, ApprovalRequiredAndRefused) {
    prompter_.answers.push_back("no");
    const auto outcome = run(make_request("echo", {"deploy"}, RiskLevel::High));

    EXPECT_EQ(outcome.state, S::Declined);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::ConfirmationDeclined);
    EXPECT_FALSE(outcome.output.has_value());
    // The slot reserved at admission is returned.
    EXPECT_EQ(context_.safety().system_stats().active_commands, 0u);
}

TEST_F(AuthorizerTest, UnreadableAnswerCountsAsDeclined) {
    auto request = make_request("cat", {"notes.txt"});
    request.operation = "delete";
    const auto outcome = run(request);
    EXPECT_EQ(outcome.state, S::Declined);
    ASSERT_EQ(prompter_.prompts.size(), 1u);
    EXPECT_EQ(prompter_.prompts[0].rfind("WARNING: ", 0), 0u);
}

TEST_F(AuthorizerTest, ShellSyntaxIsRejected) {
    ActionRequest request;
    request.command_string = "ls | grep foo";
    request.policy_request.tool_name = "execute_command";

    const auto outcome = run(request);
    EXPECT_EQ(outcome.state, S::Rejected);
    EXPECT_EQ(outcome.trail, (std::vector<S>{S::Proposed, S::PolicyChecked, S::Rejected}));
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::ShellMetacharacter);
}

TEST_F(AuthorizerTest, CommandStringIsParsedWithoutShell) {
    ActionRequest request;
    request.command_string = "echo 'two words'";
    request.policy_request.tool_name = "execute_command";

    const auto outcome = run(request);
    EXPECT_EQ(outcome.state, S::Completed);
    ASSERT_TRUE(outcome.output.has_value());
    EXPECT_EQ(outcome.output->stdout_text, "two words\n");
}

TEST_F(AuthorizerTest, ProgramOutsideAllowListIsRejected) {
    const auto outcome = run(make_request("printf", {"hi"}));
    EXPECT_EQ(outcome.state, S::Rejected);
    EXPECT_EQ(outcome.trail,
              (std::vector<S>{S::Proposed, S::PolicyChecked, S::RateLimited, S::Rejected}));
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::NotWhitelisted);
    EXPECT_EQ(context_.safety().system_stats().active_commands, 0u);
}

TEST_F(AuthorizerTest, BlockedBySafetyManagerIsRejected) {
    context_.safety().add_blocked_command("uptime");
    const auto outcome = run(make_request("uptime", {}));
    EXPECT_EQ(outcome.state, S::Rejected);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::BlockedCommand);
}

TEST_F(AuthorizerTest, DangerousOutputIsFlagged) {
    const auto outcome = run(make_request("echo", {"Operation", "not", "permitted"}));
    EXPECT_EQ(outcome.state, S::DangerousOutputDetected);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::DangerousOutput);

    const auto events = context_.audit_trail().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, AuditEventType::SecurityEvent);
    EXPECT_EQ(events[0].severity, AuditSeverity::Critical);
}

TEST_F(AuthorizerTest, CrashSignatureInOutputIsFlagged) {
    const auto outcome = run(make_request("echo", {"Segmentation", "fault"}));
    EXPECT_EQ(outcome.state, S::DangerousOutputDetected);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::DangerousOutput);
    EXPECT_EQ(outcome.error->message, "Command produced dangerous output: Segmentation fault");
    ASSERT_TRUE(outcome.output.has_value());
    EXPECT_EQ(outcome.output->stdout_text, "Segmentation fault\n");
    EXPECT_EQ(outcome.trail.back(), S::DangerousOutputDetected);

    const auto events = context_.audit_trail().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, AuditEventType::SecurityEvent);
    EXPECT_EQ(events[0].details.at("state"), "dangerous_output_detected");
}

TEST_F(AuthorizerTest, CallerCommandParameterCannotMaskRealCommand) {
    auto request = make_request("rm", {"-rf", "/"});
    request.policy_request.parameters["command"] = "ls -la";

    const auto outcome = run(request);
    EXPECT_EQ(outcome.state, S::Denied);
    EXPECT_EQ(outcome.decision.applied_policies,
              (std::vector<std::string>{"block_dangerous_commands"}));
    EXPECT_TRUE(context_.safety().get_command_history(10).empty());
}

TEST_F(AuthorizerTest, CancelledBeforeStart) {
    auto request = make_request("echo", {"late"});
    request.cancel_token = warden::tools::make_cancel_token();
    request.cancel_token->store(true);

    const auto outcome = run(request);
    EXPECT_EQ(outcome.state, S::Cancelled);
}

GuardConfig short_timeout_config() {
    GuardConfig config = fast_config();
    config.sandbox.max_execution_time_ms = 200;
    return config;
}

class AuthorizerTimeoutTest : public AuthorizerTest {
protected:
    AuthorizerTimeoutTest() : AuthorizerTest(short_timeout_config()) {}
};

TEST_F(AuthorizerTimeoutTest, SandboxTimeoutCapsTheRun) {
    context_.sandbox().allow_command("sleep");
    const auto outcome = run(make_request("sleep", {"5"}));
    EXPECT_EQ(outcome.state, S::TimedOut);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::Timeout);
}

TEST(AuthorizerStateTest, TransitionsOnlyMoveForward) {
    EXPECT_TRUE(Authorizer::can_transition(S::Proposed, S::PolicyChecked));
    EXPECT_TRUE(Authorizer::can_transition(S::PolicyChecked, S::Denied));
    EXPECT_TRUE(Authorizer::can_transition(S::SandboxValidated, S::Executing));
    EXPECT_TRUE(Authorizer::can_transition(S::ConfirmationPending, S::Declined));
    EXPECT_TRUE(Authorizer::can_transition(S::Executing, S::Completed));

    EXPECT_FALSE(Authorizer::can_transition(S::Proposed, S::Executing));
    EXPECT_FALSE(Authorizer::can_transition(S::Denied, S::PolicyChecked));
    EXPECT_FALSE(Authorizer::can_transition(S::Completed, S::Executing));
    EXPECT_FALSE(Authorizer::can_transition(S::Executing, S::ConfirmationPending));
    EXPECT_FALSE(Authorizer::can_transition(S::RateLimited, S::Executing));
}

TEST(AuthorizerStateTest, TerminalStatesHaveNoExits) {
    const std::vector<S> all = {S::Proposed, S::PolicyChecked, S::Denied, S::RateLimited,
                                S::SandboxValidated, S::Rejected, S::ConfirmationPending,
                                S::Declined, S::Executing, S::TimedOut, S::OutputTooLarge,
                                S::DangerousOutputDetected, S::Completed, S::Cancelled,
                                S::Failed};
    for (const auto from : all) {
        if (!Authorizer::is_terminal(from)) {
            continue;
        }
        for (const auto to : all) {
            EXPECT_FALSE(Authorizer::can_transition(from, to))
                << Authorizer::to_string(from) << " -> " << Authorizer::to_string(to);
        }
    }
    EXPECT_EQ(Authorizer::to_string(S::DangerousOutputDetected), "dangerous_output_detected");
}

}  // namespace
