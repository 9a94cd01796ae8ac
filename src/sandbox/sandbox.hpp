#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include "core/config/guard_config.hpp"
#include "core/errors/warden_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/command_contract.hpp"
#include "tools/process_runner.hpp"

namespace warden::sandbox {

using ParsedCommand = std::pair<std::string, std::vector<std::string>>;

// Enforcement point. Validates independently of the PolicyEngine and runs
// the command directly (never through a shell) under a timeout and an
// output cap.
class Sandbox {
public:
    explicit Sandbox(const core::config::SandboxSettings& settings = {});

    core::errors::Result<std::string> validate_command(
        const std::string& program, const std::vector<std::string>& args) const;

    // Dry run, nothing is spawned.
    core::errors::Result<std::string> test_command(
        const std::string& program, const std::vector<std::string>& args) const;

    // A non-zero exit is not an error, check CommandOutput::success().
    core::errors::Result<protocol::CommandOutput> execute_safe(
        const std::string& program, const std::vector<std::string>& args,
        const tools::CancelToken& cancel_token = nullptr) const;

    core::errors::Result<protocol::CommandOutput> execute_command_string(
        const std::string& command_string,
        const tools::CancelToken& cancel_token = nullptr) const;

    static core::errors::Result<ParsedCommand> parse_command_string(
        const std::string& command_string);

    void allow_command(const std::string& command);
    void block_command(const std::string& command);
    void allow_path(const std::string& path);
    void block_path(const std::string& path);
    void configure(std::chrono::milliseconds max_execution_time, std::size_t max_output_size);
    core::errors::Result<std::size_t> add_dangerous_pattern(const std::string& pattern);

    std::chrono::milliseconds max_execution_time() const;
    std::size_t max_output_size() const;

    std::vector<std::string> get_allowed_commands() const;
    std::vector<std::string> get_blocked_commands() const;
    std::map<std::string, std::string> get_stats() const;

private:
    mutable std::shared_mutex mutex_;
    policy::PolicyGuard guard_;
    // Reported only; access is decided by the blocked prefixes.
    std::set<std::string> allowed_paths_;
    std::chrono::milliseconds max_execution_time_;
    std::size_t max_output_size_;
};

}  // namespace warden::sandbox
