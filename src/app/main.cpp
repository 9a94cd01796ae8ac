#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>
#include "core/config/audit_id.hpp"
#include "core/config/guard_config.hpp"
#include "core/errors/warden_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_engine.hpp"
#include "runtime/authorizer.hpp"
#include "runtime/confirmation_prompter.hpp"
#include "runtime/guard_context.hpp"

namespace {

int exit_code_for(const warden::runtime::AuthorizationOutcome& outcome) {
    using warden::runtime::AuthorizationState;
    switch (outcome.state) {
        case AuthorizationState::Completed:
            return outcome.output.has_value() && outcome.output->success() ? 0 : 1;
        case AuthorizationState::Denied:
            return 10;
        case AuthorizationState::Rejected:
            return 11;
        case AuthorizationState::Declined:
            return 12;
        case AuthorizationState::TimedOut:
            return 13;
        case AuthorizationState::OutputTooLarge:
            return 14;
        case AuthorizationState::DangerousOutputDetected:
            return 15;
        case AuthorizationState::Cancelled:
            return 16;
        case AuthorizationState::Failed:
            return 17;
        default:
            return 70;
    }
}

std::string current_user() {
    const char* user = std::getenv("USER");
    if (user != nullptr && user[0] != '\0') {
        return user;
    }
    return "uid-" + std::to_string(getuid());
}

}  // namespace

int main(int argc, char* argv[]) {
    warden::core::logging::Logger::get().set_session_id(
        warden::core::config::generate_audit_id());

    if (argc < 2) {
        std::cerr << "usage: warden_cli <command> [args...]" << std::endl;
        return 2;
    }

    std::string command_string;
    for (int i = 1; i < argc; ++i) {
        if (!command_string.empty()) {
            command_string += " ";
        }
        command_string += argv[i];
    }

    warden::core::config::GuardConfig config;
    const char* config_path = std::getenv("WARDEN_CONFIG");
    if (config_path != nullptr && config_path[0] != '\0') {
        auto loaded = warden::core::config::load_guard_config(config_path);
        if (warden::core::errors::is_error(loaded)) {
            const auto& err = warden::core::errors::get_error(loaded);
            LOG_ERROR("Config error " + warden::core::errors::to_string(err));
            if (!err.hint.empty()) {
                LOG_INFO("Hint: " + err.hint);
            }
            return 2;
        }
        config = warden::core::errors::get_value(loaded);
    }
    warden::core::logging::Logger::get().set_min_level(config.log_level);
    warden::core::logging::Logger::get().set_structured(config.audit.structured_logging);

    warden::runtime::GuardContext context(config);
    warden::runtime::StreamConfirmationPrompter prompter(std::cin, std::cout);
    warden::runtime::Authorizer authorizer(context, prompter);

    warden::runtime::ActionRequest request;
    request.command_string = command_string;
    request.user = current_user();
    request.policy_request.tool_name = "execute_command";
    request.policy_request.parameters["command"] = command_string;
    request.policy_request.risk_assessment = warden::policy::PolicyEngine::assess_risk_level(
        request.policy_request.tool_name, request.policy_request.parameters);
    request.cancel_token = warden::tools::make_cancel_token();

    auto authorized = authorizer.authorize(request);
    if (warden::core::errors::is_error(authorized)) {
        const auto& err = warden::core::errors::get_error(authorized);
        LOG_ERROR("Authorization failed " + warden::core::errors::to_string(err));
        return 70;
    }

    const auto& outcome = warden::core::errors::get_value(authorized);
    if (outcome.output.has_value()) {
        std::cout << outcome.output->stdout_text;
        std::cerr << outcome.output->stderr_text;
    }
    if (outcome.error.has_value()) {
        std::cerr << "warden: " << warden::runtime::Authorizer::to_string(outcome.state)
                  << ": " << warden::core::errors::to_string(outcome.error.value())
                  << std::endl;
    }
    LOG_INFO("Final state: " + warden::runtime::Authorizer::to_string(outcome.state));
    return exit_code_for(outcome);
}
