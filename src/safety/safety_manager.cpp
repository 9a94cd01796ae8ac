#include "safety/safety_manager.hpp"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace warden::safety {

using core::errors::ErrorKind;
using core::errors::WardenError;
using nlohmann::json;

namespace {

policy::CommandRules build_rules(const core::config::SafetySettings& settings) {
    policy::CommandRules rules;
    rules.blocked_commands.insert(settings.blocked_commands.begin(),
                                  settings.blocked_commands.end());
    rules.blocked_paths.insert(settings.blocked_paths.begin(), settings.blocked_paths.end());
    for (const auto& source : policy::default_dangerous_patterns(false)) {
        auto compiled = policy::PolicyGuard::compile_pattern(source);
        if (core::errors::is_error(compiled)) {
            LOG_ERROR("SafetyManager: " + core::errors::get_error(compiled).message);
            continue;
        }
        rules.dangerous_patterns.push_back(std::move(core::errors::get_value(compiled)));
    }
    return rules;
}

std::int64_t unix_seconds(const std::chrono::system_clock::time_point point) {
    return std::chrono::duration_cast<std::chrono::seconds>(point.time_since_epoch()).count();
}

std::string format_percent(const double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f", value);
    return buffer;
}

}  // namespace

ExecutionPermit::ExecutionPermit(SlotPermit slot, std::string program,
                                 std::vector<std::string> args, std::string user,
                                 std::string command_line)
    : slot_(std::move(slot)),
      program_(std::move(program)),
      args_(std::move(args)),
      user_(std::move(user)),
      command_line_(std::move(command_line)) {}

SafetyManager::SafetyManager(const core::config::SafetySettings& settings,
                             std::shared_ptr<ResourceProbe> probe)
    : guard_(build_rules(settings)),
      limits_(settings.resource_limits),
      max_output_size_(settings.max_output_size),
      history_(settings.history_capacity),
      command_limiter_("command", std::chrono::milliseconds(settings.command_min_interval_ms),
                       std::chrono::milliseconds(settings.max_throttle_wait_ms)),
      api_limiter_("api", std::chrono::milliseconds(settings.api_min_interval_ms),
                   std::chrono::milliseconds(settings.max_throttle_wait_ms)),
      slots_(settings.resource_limits.max_concurrent_commands),
      probe_(probe ? std::move(probe) : std::make_shared<ProcResourceProbe>()) {
    stats_.last_updated = std::chrono::system_clock::now();
}

core::errors::Result<std::string> SafetyManager::check_command(
    const std::string& program, const std::vector<std::string>& args) const {
    std::shared_lock<std::shared_mutex> lock(rules_mutex_);
    return guard_.validate_command(program, args);
}

core::errors::Result<std::chrono::milliseconds> SafetyManager::enforce_command_rate_limit() {
    return command_limiter_.acquire();
}

core::errors::Result<std::chrono::milliseconds> SafetyManager::enforce_api_rate_limit() {
    return api_limiter_.acquire();
}

core::errors::Result<protocol::SystemStats> SafetyManager::check_resource_limits() {
    refresh_usage();
    const auto limits = resource_limits();
    auto stats = system_stats();

    if (stats.active_commands >= limits.max_concurrent_commands) {
        return WardenError{ErrorKind::ResourceExceeded,
                           "Too many concurrent commands (" +
                               std::to_string(stats.active_commands) + "/" +
                               std::to_string(limits.max_concurrent_commands) + ")"};
    }
    if (stats.memory_usage_mb >= limits.max_memory_mb) {
        return WardenError{ErrorKind::ResourceExceeded,
                           "Memory limit exceeded (" + std::to_string(stats.memory_usage_mb) +
                               " MB >= " + std::to_string(limits.max_memory_mb) + " MB)"};
    }
    if (stats.cpu_usage_percent >= limits.max_cpu_percent) {
        return WardenError{ErrorKind::ResourceExceeded,
                           "CPU limit exceeded (" + format_percent(stats.cpu_usage_percent) +
                               "% >= " + format_percent(limits.max_cpu_percent) + "%)"};
    }
    return stats;
}

core::errors::Result<ExecutionPermit> SafetyManager::admit(
    const std::string& program, const std::vector<std::string>& args,
    const std::string& user) {
    const std::string command_line = policy::PolicyGuard::join_command_line(program, args);

    auto validated = check_command(program, args);
    if (core::errors::is_error(validated)) {
        const auto& error = core::errors::get_error(validated);
        LOG_WARN("SafetyManager: blocked '" + command_line + "' for " + user + ": " +
                 error.message);
        record_command(command_line, user, true, error.message, std::nullopt);
        return error;
    }

    auto throttled = enforce_command_rate_limit();
    if (core::errors::is_error(throttled)) {
        const auto& error = core::errors::get_error(throttled);
        LOG_WARN("SafetyManager: " + error.message);
        record_command(command_line, user, true, error.message, std::nullopt);
        return error;
    }

    auto within_limits = check_resource_limits();
    if (core::errors::is_error(within_limits)) {
        const auto& error = core::errors::get_error(within_limits);
        LOG_WARN("SafetyManager: " + error.message);
        record_command(command_line, user, true, error.message, std::nullopt);
        return error;
    }

    SlotPermit slot = slots_.try_acquire();
    if (!slot.held()) {
        WardenError error{ErrorKind::ResourceExceeded,
                          "Too many concurrent commands (" +
                              std::to_string(slots_.capacity()) + " slots in use)"};
        LOG_WARN("SafetyManager: " + error.message);
        record_command(command_line, user, true, error.message, std::nullopt);
        return error;
    }
    {
        std::unique_lock<std::shared_mutex> lock(stats_mutex_);
        stats_.active_commands = slots_.active();
    }

    return ExecutionPermit(std::move(slot), program, args, user, command_line);
}

core::errors::Result<protocol::CommandOutput> SafetyManager::run_admitted(
    ExecutionPermit permit, const tools::CancelToken& cancel_token,
    const std::optional<RunLimits>& ceiling) {
    tools::ProcessSpec spec;
    spec.program = permit.program();
    spec.args = permit.args();
    spec.cancel_token = cancel_token;
    {
        std::shared_lock<std::shared_mutex> lock(rules_mutex_);
        spec.timeout_ms = limits_.max_execution_time_secs * 1000;
        spec.max_output_bytes = max_output_size_;
    }
    if (ceiling.has_value()) {
        if (ceiling->timeout_ms > 0) {
            spec.timeout_ms = std::min(spec.timeout_ms, ceiling->timeout_ms);
        }
        if (ceiling->max_output_bytes > 0) {
            spec.max_output_bytes = std::min(spec.max_output_bytes, ceiling->max_output_bytes);
        }
    }

    const auto started = std::chrono::steady_clock::now();
    auto run = tools::run_process(spec);
    const auto elapsed_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)
            .count());

    permit.slot_.release();
    refresh_usage();

    const std::string& command_line = permit.command_line();
    const std::string& user = permit.user();

    std::optional<WardenError> failure;
    protocol::CommandOutput output;
    if (core::errors::is_error(run)) {
        failure = core::errors::get_error(run);
    } else {
        const auto& capture = core::errors::get_value(run);
        if (capture.timed_out) {
            failure = WardenError{ErrorKind::Timeout,
                                  "Command timed out after " +
                                      std::to_string(spec.timeout_ms) + " ms"};
        } else if (capture.cancelled) {
            failure = WardenError{ErrorKind::Cancelled, "Command was cancelled"};
        } else if (capture.output_exceeded) {
            failure = WardenError{ErrorKind::OutputTooLarge,
                                  "Command output exceeded " +
                                      std::to_string(spec.max_output_bytes) + " bytes"};
        } else {
            output.command_line = command_line;
            output.exit_code = capture.exit_code;
            output.stdout_text = capture.stdout_text;
            output.stderr_text = capture.stderr_text;
            output.duration_ms = capture.duration_ms;
            const auto indicator = policy::PolicyGuard::find_privilege_failure(output.combined());
            if (indicator.has_value()) {
                failure = WardenError{ErrorKind::DangerousOutput,
                                      "Command execution blocked: dangerous output detected (" +
                                          indicator.value() + ")"};
                record_command(command_line, user, true, std::string("Dangerous output detected"),
                               elapsed_ms);
                LOG_WARN("SafetyManager: " + failure->message + " from '" + command_line + "'");
                return failure.value();
            }
        }
    }

    if (failure.has_value()) {
        LOG_WARN("SafetyManager: '" + command_line + "' failed: " +
                 core::errors::to_string(failure.value()));
        record_command(command_line, user, true, failure->message, elapsed_ms);
        return failure.value();
    }

    LOG_INFO("SafetyManager: '" + command_line + "' for " + user + " exited with " +
             std::to_string(output.exit_code) + " in " + std::to_string(elapsed_ms) + " ms");
    record_command(command_line, user, false, std::nullopt, elapsed_ms);
    return output;
}

core::errors::Result<protocol::CommandOutput> SafetyManager::execute_safe_command(
    const std::string& program, const std::vector<std::string>& args,
    const std::string& user, const tools::CancelToken& cancel_token) {
    auto permit = admit(program, args, user);
    if (core::errors::is_error(permit)) {
        return core::errors::get_error(permit);
    }
    return run_admitted(std::move(core::errors::get_value(permit)), cancel_token);
}

void SafetyManager::record_command(const std::string& command_line, const std::string& user,
                                   const bool blocked, std::optional<std::string> reason,
                                   const std::optional<std::uint64_t> execution_time_ms) {
    protocol::CommandRecord record;
    record.command = command_line;
    record.timestamp = std::chrono::system_clock::now();
    record.user = user;
    record.blocked = blocked;
    record.reason = std::move(reason);
    record.execution_time_ms = execution_time_ms;
    history_.append(std::move(record));

    std::unique_lock<std::shared_mutex> lock(stats_mutex_);
    if (blocked) {
        ++stats_.total_commands_blocked;
    } else {
        ++stats_.total_commands_executed;
    }
}

void SafetyManager::refresh_usage() {
    const ResourceSample sample = probe_->sample();
    std::unique_lock<std::shared_mutex> lock(stats_mutex_);
    stats_.memory_usage_mb = sample.memory_mb;
    stats_.cpu_usage_percent = sample.cpu_percent;
    stats_.active_commands = slots_.active();
    stats_.last_updated = std::chrono::system_clock::now();
}

protocol::SystemStats SafetyManager::system_stats() const {
    std::shared_lock<std::shared_mutex> lock(stats_mutex_);
    auto stats = stats_;
    stats.active_commands = slots_.active();
    return stats;
}

std::map<std::string, std::string> SafetyManager::get_stats() const {
    const auto stats = system_stats();
    std::map<std::string, std::string> result = {
        {"total_commands_executed", std::to_string(stats.total_commands_executed)},
        {"total_commands_blocked", std::to_string(stats.total_commands_blocked)},
        {"active_commands", std::to_string(stats.active_commands)},
        {"memory_usage_mb", std::to_string(stats.memory_usage_mb)},
        {"cpu_usage_percent", format_percent(stats.cpu_usage_percent)},
        {"history_size", std::to_string(history_.size())},
    };
    std::shared_lock<std::shared_mutex> lock(rules_mutex_);
    result["blocked_commands_count"] = std::to_string(guard_.rules().blocked_commands.size());
    result["blocked_paths_count"] = std::to_string(guard_.rules().blocked_paths.size());
    return result;
}

std::vector<protocol::CommandRecord> SafetyManager::get_command_history(
    const std::size_t limit) const {
    return history_.recent(limit);
}

std::string SafetyManager::export_audit_log() const {
    bool structured = false;
    {
        std::shared_lock<std::shared_mutex> lock(rules_mutex_);
        structured = structured_export_;
    }
    const auto records = history_.snapshot();

    std::string log;
    if (structured) {
        for (const auto& record : records) {
            json line;
            line["timestamp"] = unix_seconds(record.timestamp);
            line["user"] = record.user;
            line["command"] = record.command;
            line["blocked"] = record.blocked;
            line["reason"] = record.reason.has_value() ? json(record.reason.value()) : json();
            line["execution_time_ms"] = record.execution_time_ms.has_value()
                                            ? json(record.execution_time_ms.value())
                                            : json();
            log += line.dump();
            log += "\n";
        }
        return log;
    }

    log = "Safety Audit Log\n================\n\n";
    for (const auto& record : records) {
        log += "[" + std::to_string(unix_seconds(record.timestamp)) + "] User: " + record.user +
               " | Command: " + record.command +
               " | Blocked: " + (record.blocked ? "true" : "false") + " | Time: " +
               (record.execution_time_ms.has_value()
                    ? std::to_string(record.execution_time_ms.value()) + " ms"
                    : std::string("n/a")) +
               "\n";
        if (record.reason.has_value()) {
            log += "  Reason: " + record.reason.value() + "\n";
        }
        log += "\n";
    }
    return log;
}

void SafetyManager::add_blocked_command(const std::string& command) {
    std::unique_lock<std::shared_mutex> lock(rules_mutex_);
    guard_.rules().blocked_commands.insert(command);
    LOG_INFO("SafetyManager: blocked command '" + command + "'");
}

void SafetyManager::remove_blocked_command(const std::string& command) {
    std::unique_lock<std::shared_mutex> lock(rules_mutex_);
    guard_.rules().blocked_commands.erase(command);
    LOG_INFO("SafetyManager: unblocked command '" + command + "'");
}

void SafetyManager::add_blocked_path(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(rules_mutex_);
    guard_.rules().blocked_paths.insert(path);
    LOG_INFO("SafetyManager: blocked path '" + path + "'");
}

void SafetyManager::update_resource_limits(const protocol::ResourceLimits& limits) {
    {
        std::unique_lock<std::shared_mutex> lock(rules_mutex_);
        limits_ = limits;
    }
    slots_.set_capacity(limits.max_concurrent_commands);
}

protocol::ResourceLimits SafetyManager::resource_limits() const {
    std::shared_lock<std::shared_mutex> lock(rules_mutex_);
    return limits_;
}

std::size_t SafetyManager::clear_history(const std::chrono::milliseconds older_than) {
    return history_.clear_older_than(std::chrono::system_clock::now() - older_than);
}

void SafetyManager::set_structured_export(const bool structured) {
    std::unique_lock<std::shared_mutex> lock(rules_mutex_);
    structured_export_ = structured;
}

}  // namespace warden::safety
