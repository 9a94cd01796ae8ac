#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

namespace warden::policy {

using core::errors::ErrorKind;
using core::errors::WardenError;

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

std::string normalize_path(const std::string& path) {
    std::string normalized =
        std::filesystem::path(path).lexically_normal().generic_string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

// "--file=/etc/passwd" is checked as "/etc/passwd" too.
std::vector<std::string> path_candidates(const std::string& arg) {
    std::vector<std::string> candidates{arg};
    const auto eq = arg.find('=');
    if (eq != std::string::npos && eq + 1 < arg.size()) {
        candidates.push_back(arg.substr(eq + 1));
    }
    return candidates;
}

}  // namespace

const std::vector<std::string>& destructive_signatures() {
    static const std::vector<std::string> signatures = {
        "rm -rf /", "mkfs", "dd if=", "shutdown", "reboot"};
    return signatures;
}

const std::vector<std::string>& system_path_prefixes() {
    static const std::vector<std::string> prefixes = {
        "/etc", "/sys", "/dev", "/proc", "/boot"};
    return prefixes;
}

std::vector<std::string> default_dangerous_patterns(const bool include_shell_chaining) {
    std::vector<std::string> patterns = {
        R"(rm\s+-rf\s+/)",
        R"(rm\s+-rf\s+\*)",
        R"(:\(\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)",
        R"(>\s*/dev/sd[a-z])",
        R"(dd\s+if=.*of=/dev/)",
        R"(mkfs\.)",
        R"(chmod\s+777\s+/)",
        R"(chown\s+root)",
        R"(sudo\s+.*rm)",
        R"(curl.*\|.*bash)",
        R"(wget.*\|.*sh)",
    };
    if (include_shell_chaining) {
        const std::vector<std::string> chaining = {
            R"(os\.fork)",
            R"(&&)",
            R"(\|\|)",
            R"(\|.*\bbash\b)",
            R"(\|.*\bsh\b)",
            R"(\beval\s+)",
            R"(\bexec\s+)",
            R"(\bsource\s+)",
        };
        patterns.insert(patterns.end(), chaining.begin(), chaining.end());
    }
    return patterns;
}

PolicyGuard::PolicyGuard(CommandRules rules) : rules_(std::move(rules)) {}

std::string PolicyGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Result<CompiledPattern> PolicyGuard::compile_pattern(
    const std::string& source) {
    try {
        return CompiledPattern{
            source, std::regex(source, std::regex::ECMAScript | std::regex::optimize)};
    } catch (const std::regex_error& e) {
        return WardenError{ErrorKind::InvalidPattern,
                           "Invalid dangerous pattern '" + source + "': " + e.what()};
    }
}

core::errors::Result<std::vector<CompiledPattern>> PolicyGuard::compile_patterns(
    const std::vector<std::string>& sources) {
    std::vector<CompiledPattern> compiled;
    compiled.reserve(sources.size());
    for (const auto& source : sources) {
        auto pattern = compile_pattern(source);
        if (core::errors::is_error(pattern)) {
            return core::errors::get_error(pattern);
        }
        compiled.push_back(std::move(core::errors::get_value(pattern)));
    }
    return compiled;
}

std::string PolicyGuard::join_command_line(const std::string& program,
                                           const std::vector<std::string>& args) {
    std::string line = program;
    for (const auto& arg : args) {
        line += " ";
        line += arg;
    }
    return line;
}

bool PolicyGuard::looks_like_path(const std::string& arg) {
    return starts_with(arg, "/") || starts_with(arg, "./") ||
           starts_with(arg, "../") || starts_with(arg, "~") ||
           arg.find('/') != std::string::npos;
}

bool PolicyGuard::is_blocked_path(const std::string& path) const {
    const std::string normalized = normalize_path(path);
    for (const auto& candidate : {path, normalized}) {
        for (const auto& blocked : rules_.blocked_paths) {
            if (blocked == "/") {
                // Root itself, not everything beneath it.
                if (candidate == "/") {
                    return true;
                }
                continue;
            }
            if (starts_with(candidate, blocked)) {
                return true;
            }
        }
        for (const auto& prefix : system_path_prefixes()) {
            if (starts_with(candidate, prefix)) {
                return true;
            }
        }
    }
    return false;
}

core::errors::Result<std::string> PolicyGuard::validate_path(
    const std::string& path) const {
    if (is_blocked_path(path)) {
        return WardenError{ErrorKind::BlockedPath, "Access to blocked path: " + path};
    }
    return path;
}

core::errors::Result<std::string> PolicyGuard::validate_command(
    const std::string& program, const std::vector<std::string>& args) const {
    if (program.empty()) {
        return WardenError{ErrorKind::EmptyCommand, "Command cannot be empty."};
    }

    if (rules_.blocked_commands.count(program) > 0) {
        return WardenError{ErrorKind::BlockedCommand,
                           "Command '" + program + "' is blocked for security reasons"};
    }

    if (!rules_.allowed_commands.empty() &&
        rules_.allowed_commands.count(program) == 0) {
        return WardenError{ErrorKind::NotWhitelisted,
                           "Command '" + program +
                               "' is not in the allowed commands list",
                           "Add it with allow_command() if it is safe."};
    }

    const std::string command_line = join_command_line(program, args);
    for (const auto& pattern : rules_.dangerous_patterns) {
        if (std::regex_search(command_line, pattern.regex)) {
            return WardenError{ErrorKind::DangerousPattern,
                               "Command matches dangerous pattern: " + pattern.source};
        }
    }

    const std::string lowered = lowercase(command_line);
    for (const auto& signature : destructive_signatures()) {
        if (lowered.find(signature) != std::string::npos) {
            return WardenError{ErrorKind::DangerousPattern,
                               "Command contains destructive operation: " + signature};
        }
    }

    for (const auto& arg : args) {
        if (!looks_like_path(arg)) {
            continue;
        }
        for (const auto& candidate : path_candidates(arg)) {
            auto checked = validate_path(candidate);
            if (core::errors::is_error(checked)) {
                return core::errors::get_error(checked);
            }
        }
    }

    return command_line;
}

std::optional<std::string> PolicyGuard::find_dangerous_output(const std::string& output) {
    static const std::vector<std::string> indicators = {
        "Permission denied",
        "Operation not permitted",
        "Device or resource busy",
        "No such file or directory",
        "Segmentation fault",
        "Bus error",
        "Illegal instruction"};
    for (const auto& indicator : indicators) {
        if (output.find(indicator) != std::string::npos) {
            return indicator;
        }
    }
    return std::nullopt;
}

std::optional<std::string> PolicyGuard::find_privilege_failure(const std::string& output) {
    if (output.find("Permission denied") != std::string::npos &&
        output.find("root") != std::string::npos) {
        return std::string("Permission denied (root)");
    }
    for (const char* indicator : {"Operation not permitted", "Device or resource busy"}) {
        if (output.find(indicator) != std::string::npos) {
            return std::string(indicator);
        }
    }
    return std::nullopt;
}

}  // namespace warden::policy
