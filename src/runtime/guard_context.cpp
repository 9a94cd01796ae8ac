#include "runtime/guard_context.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace warden::runtime {

GuardContext::GuardContext(const core::config::GuardConfig& config,
                           std::shared_ptr<safety::ResourceProbe> probe,
                           policy::PolicyEngine::Clock clock)
    : config_(config),
      policy_engine_(config.audit.policy_audit_capacity, std::move(clock)),
      sandbox_(config.sandbox),
      safety_(config.safety, std::move(probe)),
      audit_trail_(config.audit) {
    safety_.set_structured_export(config.audit.structured_logging);
    LOG_DEBUG("GuardContext: " + std::to_string(policy_engine_.get_policies().size()) +
              " policies, " + std::to_string(sandbox_.get_allowed_commands().size()) +
              " allowed commands");
}

}  // namespace warden::runtime
