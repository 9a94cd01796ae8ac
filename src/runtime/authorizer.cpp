#include "runtime/authorizer.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/audit_contract.hpp"
#include "sandbox/sandbox.hpp"

namespace warden::runtime {

using core::errors::ErrorKind;
using core::errors::WardenError;

namespace {

bool needs_human(const protocol::PolicyAction& action) {
    return std::holds_alternative<protocol::action::RequireApproval>(action) ||
           std::holds_alternative<protocol::action::Escalate>(action);
}

AuthorizationState state_for_failure(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout:
            return AuthorizationState::TimedOut;
        case ErrorKind::OutputTooLarge:
            return AuthorizationState::OutputTooLarge;
        case ErrorKind::DangerousOutput:
            return AuthorizationState::DangerousOutputDetected;
        case ErrorKind::Cancelled:
            return AuthorizationState::Cancelled;
        default:
            return AuthorizationState::Failed;
    }
}

protocol::AuditSeverity severity_for(const AuthorizationState state) {
    switch (state) {
        case AuthorizationState::DangerousOutputDetected:
            return protocol::AuditSeverity::Critical;
        case AuthorizationState::Denied:
        case AuthorizationState::Rejected:
            return protocol::AuditSeverity::High;
        case AuthorizationState::Declined:
        case AuthorizationState::TimedOut:
        case AuthorizationState::OutputTooLarge:
        case AuthorizationState::Failed:
            return protocol::AuditSeverity::Medium;
        default:
            return protocol::AuditSeverity::Low;
    }
}

protocol::AuditEventType event_type_for(const AuthorizationState state) {
    switch (state) {
        case AuthorizationState::Denied:
        case AuthorizationState::Rejected:
        case AuthorizationState::Declined:
            return protocol::AuditEventType::Authorization;
        case AuthorizationState::DangerousOutputDetected:
            return protocol::AuditEventType::SecurityEvent;
        default:
            return protocol::AuditEventType::AgentExecution;
    }
}

std::string join_ids(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += id;
    }
    return joined;
}

}  // namespace

Authorizer::Authorizer(GuardContext& context, ConfirmationPrompter& prompter)
    : context_(context), prompter_(prompter) {}

bool Authorizer::is_terminal(const AuthorizationState state) {
    switch (state) {
        case AuthorizationState::Denied:
        case AuthorizationState::Rejected:
        case AuthorizationState::Declined:
        case AuthorizationState::TimedOut:
        case AuthorizationState::OutputTooLarge:
        case AuthorizationState::DangerousOutputDetected:
        case AuthorizationState::Completed:
        case AuthorizationState::Cancelled:
        case AuthorizationState::Failed:
            return true;
        default:
            return false;
    }
}

bool Authorizer::can_transition(const AuthorizationState from, const AuthorizationState to) {
    using S = AuthorizationState;
    switch (from) {
        case S::Proposed:
            return to == S::PolicyChecked;
        case S::PolicyChecked:
            // Rejected covers command strings that cannot be parsed.
            return to == S::Denied || to == S::RateLimited || to == S::Rejected;
        case S::RateLimited:
            return to == S::SandboxValidated || to == S::Rejected;
        case S::SandboxValidated:
            return to == S::Rejected || to == S::ConfirmationPending || to == S::Executing;
        case S::ConfirmationPending:
            return to == S::Declined || to == S::Executing;
        case S::Executing:
            return to == S::TimedOut || to == S::OutputTooLarge ||
                   to == S::DangerousOutputDetected || to == S::Completed ||
                   to == S::Cancelled || to == S::Failed;
        default:
            return false;
    }
}

std::string Authorizer::to_string(const AuthorizationState state) {
    switch (state) {
        case AuthorizationState::Proposed:
            return "proposed";
        case AuthorizationState::PolicyChecked:
            return "policy_checked";
        case AuthorizationState::Denied:
            return "denied";
        case AuthorizationState::RateLimited:
            return "rate_limited";
        case AuthorizationState::SandboxValidated:
            return "sandbox_validated";
        case AuthorizationState::Rejected:
            return "rejected";
        case AuthorizationState::ConfirmationPending:
            return "confirmation_pending";
        case AuthorizationState::Declined:
            return "declined";
        case AuthorizationState::Executing:
            return "executing";
        case AuthorizationState::TimedOut:
            return "timed_out";
        case AuthorizationState::OutputTooLarge:
            return "output_too_large";
        case AuthorizationState::DangerousOutputDetected:
            return "dangerous_output_detected";
        case AuthorizationState::Completed:
            return "completed";
        case AuthorizationState::Cancelled:
            return "cancelled";
        case AuthorizationState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

core::errors::Result<AuthorizationState> Authorizer::transition(
    AuthorizationOutcome& outcome, const AuthorizationState next) const {
    const AuthorizationState current = outcome.state;
    if (!can_transition(current, next)) {
        return WardenError{ErrorKind::Internal,
                           "Invalid authorization transition " + to_string(current) +
                               " -> " + to_string(next)};
    }
    LOG_DEBUG("Authorizer: " + outcome.decision.audit_id + " transition " +
              to_string(current) + " -> " + to_string(next));
    outcome.state = next;
    outcome.trail.push_back(next);
    return next;
}

core::errors::Result<AuthorizationOutcome> Authorizer::finish(AuthorizationOutcome outcome,
                                                              const AuthorizationState terminal,
                                                              const ActionRequest& request,
                                                              const std::string& command_line) {
    auto moved = transition(outcome, terminal);
    if (core::errors::is_error(moved)) {
        return core::errors::get_error(moved);
    }
    if (outcome.error.has_value()) {
        LOG_WARN("Authorizer: '" + command_line + "' ended " + to_string(terminal) + ": " +
                 core::errors::to_string(outcome.error.value()));
    } else {
        LOG_INFO("Authorizer: '" + command_line + "' ended " + to_string(terminal));
    }
    record_audit(outcome, request, command_line);
    return outcome;
}

void Authorizer::record_audit(const AuthorizationOutcome& outcome, const ActionRequest& request,
                              const std::string& command_line) {
    protocol::AuditEvent event;
    event.event_type = event_type_for(outcome.state);
    event.severity = severity_for(outcome.state);
    event.user_id = request.user;
    event.operation = request.operation.value_or(
        request.policy_request.tool_name.empty() ? std::string("execute_command")
                                                 : request.policy_request.tool_name);
    event.resource = command_line;

    if (outcome.error.has_value()) {
        event.result.outcome = protocol::AuditOutcome::Failure;
        event.result.message = outcome.error->message;
        event.details["error"] = core::errors::to_code(outcome.error->kind);
    } else if (outcome.output.has_value() && !outcome.output->success()) {
        event.result.outcome = protocol::AuditOutcome::Warning;
        event.result.message = "exit code " + std::to_string(outcome.output->exit_code);
    }

    event.details["state"] = to_string(outcome.state);
    event.details["policy_action"] = protocol::action_name(outcome.decision.action);
    event.details["policy_audit_id"] = outcome.decision.audit_id;
    event.details["applied_policies"] = join_ids(outcome.decision.applied_policies);
    if (outcome.output.has_value()) {
        event.details["exit_code"] = std::to_string(outcome.output->exit_code);
        event.details["duration_ms"] =
            std::to_string(static_cast<long long>(outcome.output->duration_ms));
    }

    auto recorded = context_.audit_trail().record(std::move(event));
    if (core::errors::is_error(recorded)) {
        LOG_ERROR("Authorizer: audit event for '" + command_line + "' was not persisted: " +
                  core::errors::get_error(recorded).message);
    }
}

core::errors::Result<AuthorizationOutcome> Authorizer::authorize(const ActionRequest& request) {
    AuthorizationOutcome outcome;
    outcome.trail.push_back(AuthorizationState::Proposed);

    std::string command_line =
        request.command_string.has_value()
            ? request.command_string.value()
            : policy::PolicyGuard::join_command_line(request.program, request.args);

    protocol::PolicyRequest policy_request = request.policy_request;
    if (policy_request.parameters.count("command") == 0) {
        policy_request.parameters["command"] = command_line;
    }
    policy_request.parameters["argv"] = command_line;
    if (!policy_request.user_id.has_value()) {
        policy_request.user_id = request.user;
    }

    outcome.decision = context_.policy_engine().evaluate_request(policy_request);
    auto checked = transition(outcome, AuthorizationState::PolicyChecked);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    if (protocol::is_deny(outcome.decision.action)) {
        outcome.error = WardenError{ErrorKind::PolicyDenied, outcome.decision.reason};
        return finish(std::move(outcome), AuthorizationState::Denied, request, command_line);
    }

    std::string program = request.program;
    std::vector<std::string> args = request.args;
    if (request.command_string.has_value()) {
        auto parsed = sandbox::Sandbox::parse_command_string(request.command_string.value());
        if (core::errors::is_error(parsed)) {
            outcome.error = core::errors::get_error(parsed);
            return finish(std::move(outcome), AuthorizationState::Rejected, request,
                          command_line);
        }
        program = core::errors::get_value(parsed).first;
        args = core::errors::get_value(parsed).second;
        command_line = policy::PolicyGuard::join_command_line(program, args);
    }

    auto throttled = transition(outcome, AuthorizationState::RateLimited);
    if (core::errors::is_error(throttled)) {
        return core::errors::get_error(throttled);
    }
    auto permit = context_.safety().admit(program, args, request.user);
    if (core::errors::is_error(permit)) {
        outcome.error = core::errors::get_error(permit);
        return finish(std::move(outcome), AuthorizationState::Rejected, request, command_line);
    }

    auto validated = context_.sandbox().validate_command(program, args);
    if (core::errors::is_error(validated)) {
        outcome.error = core::errors::get_error(validated);
        return finish(std::move(outcome), AuthorizationState::Rejected, request, command_line);
    }
    auto sandboxed = transition(outcome, AuthorizationState::SandboxValidated);
    if (core::errors::is_error(sandboxed)) {
        return core::errors::get_error(sandboxed);
    }

    const std::string operation = request.operation.value_or(program);
    std::string target = request.target.value_or("");
    if (!request.target.has_value()) {
        for (const auto& arg : args) {
            target += target.empty() ? arg : " " + arg;
        }
    }

    const bool policy_wants_human = needs_human(outcome.decision.action);
    if (policy_wants_human ||
        context_.confirmation().requires_confirmation(operation, target)) {
        auto pending = transition(outcome, AuthorizationState::ConfirmationPending);
        if (core::errors::is_error(pending)) {
            return core::errors::get_error(pending);
        }

        std::string prompt;
        if (policy_wants_human) {
            prompt = "Policy: " + outcome.decision.reason + "\n";
        }
        prompt += context_.confirmation().get_confirmation_prompt(operation, target);
        const auto answer = prompter_.ask(prompt);
        if (!answer.has_value() ||
            !context_.confirmation().validate_confirmation(answer.value())) {
            outcome.error = WardenError{ErrorKind::ConfirmationDeclined,
                                        "Operation '" + operation + "' on '" + target +
                                            "' was not confirmed"};
            return finish(std::move(outcome), AuthorizationState::Declined, request,
                          command_line);
        }
    }

    auto executing = transition(outcome, AuthorizationState::Executing);
    if (core::errors::is_error(executing)) {
        return core::errors::get_error(executing);
    }

    safety::RunLimits ceiling;
    ceiling.timeout_ms =
        static_cast<std::uint64_t>(context_.sandbox().max_execution_time().count());
    ceiling.max_output_bytes = context_.sandbox().max_output_size();

    auto run = context_.safety().run_admitted(std::move(core::errors::get_value(permit)),
                                              request.cancel_token, ceiling);
    if (core::errors::is_error(run)) {
        const auto& error = core::errors::get_error(run);
        outcome.error = error;
        return finish(std::move(outcome), state_for_failure(error.kind), request, command_line);
    }
    outcome.output = std::move(core::errors::get_value(run));

    // Sandbox output signatures apply on this path too.
    const auto indicator =
        policy::PolicyGuard::find_dangerous_output(outcome.output->combined());
    if (indicator.has_value()) {
        LOG_WARN("Authorizer: dangerous output from '" + command_line + "': " +
                 indicator.value());
        outcome.error = WardenError{ErrorKind::DangerousOutput,
                                    "Command produced dangerous output: " + indicator.value()};
        return finish(std::move(outcome), AuthorizationState::DangerousOutputDetected, request,
                      command_line);
    }
    return finish(std::move(outcome), AuthorizationState::Completed, request, command_line);
}

}  // namespace warden::runtime
