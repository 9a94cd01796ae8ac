#pragma once

#include <memory>
#include "core/config/guard_config.hpp"
#include "policy/policy_engine.hpp"
#include "safety/resource_probe.hpp"
#include "safety/safety_manager.hpp"
#include "sandbox/sandbox.hpp"
#include "session/audit_trail.hpp"
#include "session/confirmation_manager.hpp"

namespace warden::runtime {

// Owns every enforcement component for the lifetime of the process. Build
// one at start-up and pass it by reference.
class GuardContext {
public:
    explicit GuardContext(const core::config::GuardConfig& config,
                          std::shared_ptr<safety::ResourceProbe> probe = nullptr,
                          policy::PolicyEngine::Clock clock = {});

    GuardContext(const GuardContext&) = delete;
    GuardContext& operator=(const GuardContext&) = delete;

    const core::config::GuardConfig& config() const { return config_; }

    policy::PolicyEngine& policy_engine() { return policy_engine_; }
    sandbox::Sandbox& sandbox() { return sandbox_; }
    safety::SafetyManager& safety() { return safety_; }
    session::ConfirmationManager& confirmation() { return confirmation_; }
    session::AuditTrail& audit_trail() { return audit_trail_; }

private:
    core::config::GuardConfig config_;
    policy::PolicyEngine policy_engine_;
    sandbox::Sandbox sandbox_;
    safety::SafetyManager safety_;
    session::ConfirmationManager confirmation_;
    session::AuditTrail audit_trail_;
};

}  // namespace warden::runtime
