#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/errors/warden_errors.hpp"
#include "protocol/command_contract.hpp"
#include "protocol/policy_contract.hpp"
#include "runtime/confirmation_prompter.hpp"
#include "runtime/guard_context.hpp"
#include "tools/process_runner.hpp"

namespace warden::runtime {

enum class AuthorizationState {
    Proposed,
    PolicyChecked,
    Denied,
    RateLimited,
    SandboxValidated,
    Rejected,
    ConfirmationPending,
    Declined,
    Executing,
    TimedOut,
    OutputTooLarge,
    DangerousOutputDetected,
    Completed,
    Cancelled,
    Failed
};

// One candidate action from the agent layer.
struct ActionRequest {
    protocol::PolicyRequest policy_request;
    std::string program;
    std::vector<std::string> args;
    // When set, parsed without a shell and used instead of program/args.
    std::optional<std::string> command_string;
    std::string user = "agent";
    // Confirmation gate inputs; default to the program and joined args.
    std::optional<std::string> operation;
    std::optional<std::string> target;
    tools::CancelToken cancel_token;
};

struct AuthorizationOutcome {
    AuthorizationState state = AuthorizationState::Proposed;
    // Every state visited, in order, ending with the terminal one.
    std::vector<AuthorizationState> trail;
    protocol::PolicyDecision decision;
    std::optional<protocol::CommandOutput> output;
    std::optional<core::errors::WardenError> error;

    bool succeeded() const { return state == AuthorizationState::Completed; }
};

// Drives one action through policy, admission, sandbox validation,
// confirmation and execution. Transitions only move forward and nothing is
// retried; every terminal outcome produces one audit event.
class Authorizer {
public:
    Authorizer(GuardContext& context, ConfirmationPrompter& prompter);

    core::errors::Result<AuthorizationOutcome> authorize(const ActionRequest& request);

    static bool is_terminal(AuthorizationState state);
    static bool can_transition(AuthorizationState from, AuthorizationState to);
    static std::string to_string(AuthorizationState state);

private:
    core::errors::Result<AuthorizationState> transition(AuthorizationOutcome& outcome,
                                                        AuthorizationState next) const;
    core::errors::Result<AuthorizationOutcome> finish(AuthorizationOutcome outcome,
                                                      AuthorizationState terminal,
                                                      const ActionRequest& request,
                                                      const std::string& command_line);
    void record_audit(const AuthorizationOutcome& outcome, const ActionRequest& request,
                      const std::string& command_line);

    GuardContext& context_;
    ConfirmationPrompter& prompter_;
};

}  // namespace warden::runtime
