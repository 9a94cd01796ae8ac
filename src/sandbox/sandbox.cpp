#include "sandbox/sandbox.hpp"

#include <cctype>
#include <mutex>
#include "core/logging/logger.hpp"

namespace warden::sandbox {

using core::errors::ErrorKind;
using core::errors::WardenError;

namespace {

constexpr const char* kShellMetacharacters = "|&;()<>`${}[]*?~";

policy::CommandRules build_rules(const core::config::SandboxSettings& settings) {
    policy::CommandRules rules;
    rules.allowed_commands.insert(settings.allowed_commands.begin(),
                                  settings.allowed_commands.end());
    rules.blocked_commands.insert(settings.blocked_commands.begin(),
                                  settings.blocked_commands.end());
    rules.blocked_paths.insert(settings.blocked_paths.begin(),
                               settings.blocked_paths.end());
    for (const auto& source : policy::default_dangerous_patterns(true)) {
        auto compiled = policy::PolicyGuard::compile_pattern(source);
        if (core::errors::is_error(compiled)) {
            LOG_ERROR("Sandbox: " + core::errors::get_error(compiled).message);
            continue;
        }
        rules.dangerous_patterns.push_back(std::move(core::errors::get_value(compiled)));
    }
    return rules;
}

}  // namespace

Sandbox::Sandbox(const core::config::SandboxSettings& settings)
    : guard_(build_rules(settings)),
      allowed_paths_(settings.allowed_paths.begin(), settings.allowed_paths.end()),
      max_execution_time_(std::chrono::milliseconds(settings.max_execution_time_ms)),
      max_output_size_(settings.max_output_size) {}

core::errors::Result<std::string> Sandbox::validate_command(
    const std::string& program, const std::vector<std::string>& args) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto validated = guard_.validate_command(program, args);
    if (core::errors::is_error(validated)) {
        LOG_WARN("Sandbox: rejected '" + policy::PolicyGuard::join_command_line(program, args) +
                 "': " + core::errors::to_string(core::errors::get_error(validated)));
    }
    return validated;
}

core::errors::Result<std::string> Sandbox::test_command(
    const std::string& program, const std::vector<std::string>& args) const {
    return validate_command(program, args);
}

core::errors::Result<protocol::CommandOutput> Sandbox::execute_safe(
    const std::string& program, const std::vector<std::string>& args,
    const tools::CancelToken& cancel_token) const {
    auto validated = validate_command(program, args);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }

    tools::ProcessSpec spec;
    spec.program = program;
    spec.args = args;
    spec.cancel_token = cancel_token;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        spec.timeout_ms = static_cast<std::uint64_t>(max_execution_time_.count());
        spec.max_output_bytes = max_output_size_;
    }

    auto run = tools::run_process(spec);
    if (core::errors::is_error(run)) {
        return core::errors::get_error(run);
    }
    const auto& capture = core::errors::get_value(run);

    if (capture.timed_out) {
        return WardenError{ErrorKind::Timeout,
                           "Command timed out after " + std::to_string(spec.timeout_ms) +
                               " ms: " + core::errors::get_value(validated)};
    }
    if (capture.cancelled) {
        return WardenError{ErrorKind::Cancelled,
                           "Command was cancelled: " + core::errors::get_value(validated)};
    }
    if (capture.output_exceeded) {
        return WardenError{ErrorKind::OutputTooLarge,
                           "Command output exceeded " +
                               std::to_string(spec.max_output_bytes) + " bytes"};
    }

    protocol::CommandOutput output;
    output.command_line = core::errors::get_value(validated);
    output.exit_code = capture.exit_code;
    output.stdout_text = capture.stdout_text;
    output.stderr_text = capture.stderr_text;
    output.duration_ms = capture.duration_ms;

    const auto indicator = policy::PolicyGuard::find_dangerous_output(output.combined());
    if (indicator.has_value()) {
        LOG_WARN("Sandbox: dangerous output from '" + output.command_line + "': " +
                 indicator.value());
        return WardenError{ErrorKind::DangerousOutput,
                           "Command produced dangerous output: " + indicator.value()};
    }

    LOG_DEBUG("Sandbox: '" + output.command_line + "' exited with " +
              std::to_string(output.exit_code));
    return output;
}

core::errors::Result<protocol::CommandOutput> Sandbox::execute_command_string(
    const std::string& command_string, const tools::CancelToken& cancel_token) const {
    auto parsed = parse_command_string(command_string);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const auto& command = core::errors::get_value(parsed);
    return execute_safe(command.first, command.second, cancel_token);
}

core::errors::Result<ParsedCommand> Sandbox::parse_command_string(
    const std::string& command_string) {
    const auto metachar = command_string.find_first_of(kShellMetacharacters);
    if (metachar != std::string::npos) {
        return WardenError{ErrorKind::ShellMetacharacter,
                           std::string("Command contains shell metacharacter '") +
                               command_string[metachar] +
                               "' and cannot run without a shell",
                           "Run a single program with plain arguments."};
    }

    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;
    char quote_char = '"';
    for (const char ch : command_string) {
        if (ch == '"' || ch == '\'') {
            if (in_quotes && ch == quote_char) {
                in_quotes = false;
                if (!current.empty()) {
                    tokens.push_back(current);
                    current.clear();
                }
            } else if (!in_quotes) {
                in_quotes = true;
                quote_char = ch;
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (!in_quotes && std::isspace(static_cast<unsigned char>(ch))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
            continue;
        }
        current.push_back(ch);
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    if (tokens.empty()) {
        return WardenError{ErrorKind::EmptyCommand, "Command cannot be empty."};
    }

    ParsedCommand command;
    command.first = tokens.front();
    command.second.assign(tokens.begin() + 1, tokens.end());
    return command;
}

void Sandbox::allow_command(const std::string& command) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    guard_.rules().allowed_commands.insert(command);
    LOG_INFO("Sandbox: allowed command '" + command + "'");
}

void Sandbox::block_command(const std::string& command) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    guard_.rules().blocked_commands.insert(command);
    LOG_INFO("Sandbox: blocked command '" + command + "'");
}

void Sandbox::allow_path(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    allowed_paths_.insert(path);
}

void Sandbox::block_path(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    guard_.rules().blocked_paths.insert(path);
    LOG_INFO("Sandbox: blocked path '" + path + "'");
}

void Sandbox::configure(const std::chrono::milliseconds max_execution_time,
                        const std::size_t max_output_size) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    max_execution_time_ = max_execution_time;
    max_output_size_ = max_output_size;
}

core::errors::Result<std::size_t> Sandbox::add_dangerous_pattern(const std::string& pattern) {
    auto compiled = policy::PolicyGuard::compile_pattern(pattern);
    if (core::errors::is_error(compiled)) {
        return core::errors::get_error(compiled);
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& patterns = guard_.rules().dangerous_patterns;
    patterns.push_back(std::move(core::errors::get_value(compiled)));
    return patterns.size();
}

std::chrono::milliseconds Sandbox::max_execution_time() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return max_execution_time_;
}

std::size_t Sandbox::max_output_size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return max_output_size_;
}

std::vector<std::string> Sandbox::get_allowed_commands() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto& allowed = guard_.rules().allowed_commands;
    return {allowed.begin(), allowed.end()};
}

std::vector<std::string> Sandbox::get_blocked_commands() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto& blocked = guard_.rules().blocked_commands;
    return {blocked.begin(), blocked.end()};
}

std::map<std::string, std::string> Sandbox::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto& rules = guard_.rules();
    return {
        {"allowed_commands", std::to_string(rules.allowed_commands.size())},
        {"blocked_commands", std::to_string(rules.blocked_commands.size())},
        {"allowed_paths", std::to_string(allowed_paths_.size())},
        {"blocked_paths", std::to_string(rules.blocked_paths.size())},
        {"dangerous_patterns", std::to_string(rules.dangerous_patterns.size())},
        {"max_execution_time_secs",
         std::to_string(std::chrono::duration_cast<std::chrono::seconds>(max_execution_time_).count())},
        {"max_output_size_kb", std::to_string(max_output_size_ / 1024)},
    };
}

}  // namespace warden::sandbox
