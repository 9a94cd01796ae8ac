#pragma once

#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>
#include "core/errors/warden_errors.hpp"

namespace warden::policy {

// Substrings that mark a proposed command as destructive. The PolicyEngine
// built-in deny rule and PolicyGuard::validate_command both read this list,
// so a command the engine denies is also rejected by every guard.
const std::vector<std::string>& destructive_signatures();

// Always refused as path arguments, whatever the configured blocked paths.
const std::vector<std::string>& system_path_prefixes();

// Regex sources matched against the joined command line. Shell chaining
// patterns (&&, ||, pipes into a shell, eval/exec/source) are only part of
// the stricter sandbox set.
std::vector<std::string> default_dangerous_patterns(bool include_shell_chaining);

struct CompiledPattern {
    std::string source;
    std::regex regex;
};

struct CommandRules {
    // Empty means no allow-list is enforced.
    std::set<std::string> allowed_commands;
    std::set<std::string> blocked_commands;
    std::set<std::string> blocked_paths;
    std::vector<CompiledPattern> dangerous_patterns;
};

class PolicyGuard {
public:
    explicit PolicyGuard(CommandRules rules = {});

    // Returns the joined command line when every check passes.
    core::errors::Result<std::string> validate_command(
        const std::string& program, const std::vector<std::string>& args) const;

    core::errors::Result<std::string> validate_path(const std::string& path) const;

    CommandRules& rules() { return rules_; }
    const CommandRules& rules() const { return rules_; }

    static core::errors::Result<CompiledPattern> compile_pattern(
        const std::string& source);
    static core::errors::Result<std::vector<CompiledPattern>> compile_patterns(
        const std::vector<std::string>& sources);

    static std::string join_command_line(const std::string& program,
                                         const std::vector<std::string>& args);
    static bool looks_like_path(const std::string& arg);

    // Full indicator list, used by the sandbox output scan.
    static std::optional<std::string> find_dangerous_output(const std::string& output);
    // Narrower signature used by the safety manager's post-execution scan.
    static std::optional<std::string> find_privilege_failure(const std::string& output);

private:
    bool is_blocked_path(const std::string& path) const;
    static std::string lowercase(std::string value);

    CommandRules rules_;
};

}  // namespace warden::policy
