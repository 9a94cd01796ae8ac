#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "core/config/guard_config.hpp"
#include "core/errors/warden_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/command_contract.hpp"
#include "safety/command_history.hpp"
#include "safety/concurrency_slots.hpp"
#include "safety/rate_limiter.hpp"
#include "safety/resource_probe.hpp"
#include "tools/process_runner.hpp"

namespace warden::safety {

// Proof that a command passed validation, throttling and the resource
// ceilings. Owns one concurrency slot until it is consumed or dropped.
class ExecutionPermit {
public:
    ExecutionPermit(ExecutionPermit&&) noexcept = default;
    ExecutionPermit& operator=(ExecutionPermit&&) noexcept = default;
    ExecutionPermit(const ExecutionPermit&) = delete;
    ExecutionPermit& operator=(const ExecutionPermit&) = delete;

    const std::string& program() const { return program_; }
    const std::vector<std::string>& args() const { return args_; }
    const std::string& user() const { return user_; }
    const std::string& command_line() const { return command_line_; }

private:
    friend class SafetyManager;
    ExecutionPermit(SlotPermit slot, std::string program, std::vector<std::string> args,
                    std::string user, std::string command_line);

    SlotPermit slot_;
    std::string program_;
    std::vector<std::string> args_;
    std::string user_;
    std::string command_line_;
};

// Tighter ceilings a caller can impose on a single run.
struct RunLimits {
    std::uint64_t timeout_ms = 0;
    std::size_t max_output_bytes = 0;
};

class SafetyManager {
public:
    explicit SafetyManager(const core::config::SafetySettings& settings = {},
                           std::shared_ptr<ResourceProbe> probe = nullptr);

    // Validate, throttle, check ceilings and reserve a slot.
    core::errors::Result<ExecutionPermit> admit(const std::string& program,
                                                const std::vector<std::string>& args,
                                                const std::string& user);

    // Spawn, record and scan the output. The slot is released on return.
    // A ceiling only ever lowers the configured limits.
    core::errors::Result<protocol::CommandOutput> run_admitted(
        ExecutionPermit permit, const tools::CancelToken& cancel_token = nullptr,
        const std::optional<RunLimits>& ceiling = std::nullopt);

    core::errors::Result<protocol::CommandOutput> execute_safe_command(
        const std::string& program, const std::vector<std::string>& args,
        const std::string& user, const tools::CancelToken& cancel_token = nullptr);

    core::errors::Result<std::chrono::milliseconds> enforce_command_rate_limit();
    core::errors::Result<std::chrono::milliseconds> enforce_api_rate_limit();

    // Samples the probe, then compares current usage against the ceilings.
    core::errors::Result<protocol::SystemStats> check_resource_limits();

    // Dry run of the validation step.
    core::errors::Result<std::string> check_command(const std::string& program,
                                                    const std::vector<std::string>& args) const;

    std::map<std::string, std::string> get_stats() const;
    protocol::SystemStats system_stats() const;
    std::vector<protocol::CommandRecord> get_command_history(std::size_t limit) const;
    std::string export_audit_log() const;

    void add_blocked_command(const std::string& command);
    void remove_blocked_command(const std::string& command);
    void add_blocked_path(const std::string& path);
    void update_resource_limits(const protocol::ResourceLimits& limits);
    protocol::ResourceLimits resource_limits() const;
    // Returns the number of records removed.
    std::size_t clear_history(std::chrono::milliseconds older_than);

    void set_structured_export(bool structured);

private:
    void record_command(const std::string& command_line, const std::string& user,
                        bool blocked, std::optional<std::string> reason,
                        std::optional<std::uint64_t> execution_time_ms);
    void refresh_usage();

    mutable std::shared_mutex rules_mutex_;
    policy::PolicyGuard guard_;
    protocol::ResourceLimits limits_;
    std::size_t max_output_size_;
    bool structured_export_ = false;

    mutable std::shared_mutex stats_mutex_;
    protocol::SystemStats stats_;

    CommandHistory history_;
    RateLimiter command_limiter_;
    RateLimiter api_limiter_;
    ConcurrencySlots slots_;
    std::shared_ptr<ResourceProbe> probe_;
};

}  // namespace warden::safety
