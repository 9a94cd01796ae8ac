#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/warden_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/command_contract.hpp"

namespace warden::core::config {

struct SandboxSettings {
    std::vector<std::string> allowed_commands = {
        "ls", "cat", "grep", "find", "head", "tail", "wc", "sort", "uniq",
        "pwd", "echo", "bash", "cargo", "rustc", "npm", "node", "python",
        "python3", "pip", "pip3", "git", "make", "cmake", "ps", "top", "htop",
        "df", "du", "free", "uptime", "whoami", "id", "date", "systemctl",
        "journalctl", "hostname", "uname", "lsblk", "blkid", "lscpu", "lspci",
        "lsusb", "sensors", "iostat", "vmstat", "sar", "sysctl"};
    std::vector<std::string> blocked_commands = {
        "rm", "rmdir", "del", "deltree", "format", "mkfs", "dd", "fdisk",
        "mount", "umount", "kill", "killall", "pkill", "killpg", "shutdown",
        "reboot", "halt", "poweroff", "iptables", "ufw", "firewall-cmd",
        "wget", "curl"};
    std::vector<std::string> allowed_paths = {
        "/usr/bin", "/bin", "/usr/local/bin", "/home", "/tmp", "/var/log"};
    std::vector<std::string> blocked_paths = {
        "/etc", "/sys", "/dev", "/proc", "/boot", "/root", "/usr/sbin"};
    std::uint64_t max_execution_time_ms = 30000;
    std::size_t max_output_size = 1024 * 1024;
};

struct SafetySettings {
    std::vector<std::string> blocked_commands = {
        "rm", "rmdir", "del", "deltree", "format", "mkfs", "dd", "fdisk",
        "mount", "umount", "kill", "killall", "pkill", "killpg", "shutdown",
        "reboot", "halt", "poweroff", "iptables", "ufw", "firewall-cmd"};
    std::vector<std::string> blocked_paths = {
        "/etc", "/sys", "/dev", "/proc", "/boot", "/", "~/.ssh", "~/.gnupg"};
    std::uint64_t command_min_interval_ms = 600;
    std::uint64_t api_min_interval_ms = 1200;
    // 0 waits as long as needed
    std::uint64_t max_throttle_wait_ms = 0;
    std::size_t history_capacity = 1000;
    std::size_t max_output_size = 1024 * 1024;
    protocol::ResourceLimits resource_limits;
};

struct AuditSettings {
    bool structured_logging = true;
    std::filesystem::path log_directory;
    std::uint32_t max_log_files = 10;
    std::uint64_t max_log_size_bytes = 10 * 1024 * 1024;
    std::size_t policy_audit_capacity = 10000;
};

struct GuardConfig {
    SandboxSettings sandbox;
    SafetySettings safety;
    AuditSettings audit;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

errors::Result<GuardConfig> guard_config_from_json(const nlohmann::json& document);

errors::Result<GuardConfig> load_guard_config(const std::filesystem::path& path);

}  // namespace warden::core::config
