#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace warden::protocol {

// What a finished child process produced.
struct CommandOutput {
    std::string command_line;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;

    bool success() const { return exit_code == 0; }

    std::string combined() const { return stdout_text + " " + stderr_text; }
};

struct CommandRecord {
    std::string command;
    std::chrono::system_clock::time_point timestamp;
    std::string user;
    bool blocked = false;
    std::optional<std::string> reason;
    std::optional<std::uint64_t> execution_time_ms;
};

// Configured ceilings enforced before a command is spawned.
struct ResourceLimits {
    std::uint64_t max_memory_mb = 1024;
    double max_cpu_percent = 80.0;
    std::uint64_t max_execution_time_secs = 300;
    std::size_t max_concurrent_commands = 5;
};

struct SystemStats {
    std::uint64_t total_commands_executed = 0;
    std::uint64_t total_commands_blocked = 0;
    std::size_t active_commands = 0;
    std::uint64_t memory_usage_mb = 0;
    double cpu_usage_percent = 0.0;
    std::chrono::system_clock::time_point last_updated;
};

}  // namespace warden::protocol
