#include "core/config/guard_config.hpp"

#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace warden::core::config {

using errors::ErrorKind;
using errors::WardenError;
using nlohmann::json;

namespace {

WardenError invalid(const std::string& key, const std::string& expectation) {
    return WardenError{ErrorKind::InvalidConfig,
                       "Config key '" + key + "' " + expectation,
                       "Fix the value or remove the key to use the default."};
}

// Each reader leaves the target untouched when the key is absent.
std::optional<WardenError> read_string_list(const json& section,
                                            const std::string& section_name,
                                            const char* key,
                                            std::vector<std::string>& target) {
    if (!section.contains(key)) {
        return std::nullopt;
    }
    const auto& value = section.at(key);
    const std::string qualified = section_name + "." + key;
    if (!value.is_array()) {
        return invalid(qualified, "must be an array of strings");
    }
    std::vector<std::string> parsed;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return invalid(qualified, "must be an array of strings");
        }
        parsed.push_back(item.get<std::string>());
    }
    target = std::move(parsed);
    return std::nullopt;
}

template <typename T>
std::optional<WardenError> read_unsigned(const json& section,
                                         const std::string& section_name,
                                         const char* key, T& target,
                                         const T min_value,
                                         const T max_value) {
    if (!section.contains(key)) {
        return std::nullopt;
    }
    const auto& value = section.at(key);
    const std::string qualified = section_name + "." + key;
    if (!value.is_number_unsigned() &&
        !(value.is_number_integer() && value.get<std::int64_t>() >= 0)) {
        return invalid(qualified, "must be a non-negative integer");
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw < static_cast<std::uint64_t>(min_value) ||
        raw > static_cast<std::uint64_t>(max_value)) {
        return invalid(qualified, "is out of bounds (" + std::to_string(min_value) +
                                      ".." + std::to_string(max_value) + ")");
    }
    target = static_cast<T>(raw);
    return std::nullopt;
}

std::optional<WardenError> read_bool(const json& section,
                                     const std::string& section_name,
                                     const char* key, bool& target) {
    if (!section.contains(key)) {
        return std::nullopt;
    }
    const auto& value = section.at(key);
    if (!value.is_boolean()) {
        return invalid(section_name + "." + key, "must be a boolean");
    }
    target = value.get<bool>();
    return std::nullopt;
}

std::optional<WardenError> read_section(const json& document, const char* key,
                                        const json*& section) {
    section = nullptr;
    if (!document.contains(key)) {
        return std::nullopt;
    }
    const auto& value = document.at(key);
    if (!value.is_object()) {
        return invalid(key, "must be an object");
    }
    section = &value;
    return std::nullopt;
}

std::optional<WardenError> parse_sandbox(const json& section, SandboxSettings& out) {
    const std::string name = "sandbox";
    if (auto err = read_string_list(section, name, "allowed_commands", out.allowed_commands)) return err;
    if (auto err = read_string_list(section, name, "blocked_commands", out.blocked_commands)) return err;
    if (auto err = read_string_list(section, name, "allowed_paths", out.allowed_paths)) return err;
    if (auto err = read_string_list(section, name, "blocked_paths", out.blocked_paths)) return err;
    if (auto err = read_unsigned<std::uint64_t>(section, name, "max_execution_time_ms",
                                                out.max_execution_time_ms, 1,
                                                24ULL * 60 * 60 * 1000)) return err;
    if (auto err = read_unsigned<std::size_t>(section, name, "max_output_size",
                                              out.max_output_size, 1,
                                              std::numeric_limits<std::size_t>::max())) return err;
    return std::nullopt;
}

std::optional<WardenError> parse_safety(const json& section, SafetySettings& out) {
    const std::string name = "safety";
    if (auto err = read_string_list(section, name, "blocked_commands", out.blocked_commands)) return err;
    if (auto err = read_string_list(section, name, "blocked_paths", out.blocked_paths)) return err;
    if (auto err = read_unsigned<std::uint64_t>(section, name, "command_min_interval_ms",
                                                out.command_min_interval_ms, 0, 3600000)) return err;
    if (auto err = read_unsigned<std::uint64_t>(section, name, "api_min_interval_ms",
                                                out.api_min_interval_ms, 0, 3600000)) return err;
    if (auto err = read_unsigned<std::uint64_t>(section, name, "max_throttle_wait_ms",
                                                out.max_throttle_wait_ms, 0, 3600000)) return err;
    if (auto err = read_unsigned<std::size_t>(section, name, "history_capacity",
                                              out.history_capacity, 1, 1000000)) return err;
    if (auto err = read_unsigned<std::size_t>(section, name, "max_output_size",
                                              out.max_output_size, 1,
                                              std::numeric_limits<std::size_t>::max())) return err;

    if (!section.contains("resource_limits")) {
        return std::nullopt;
    }
    const auto& limits = section.at("resource_limits");
    const std::string limits_name = "safety.resource_limits";
    if (!limits.is_object()) {
        return invalid(limits_name, "must be an object");
    }
    auto& target = out.resource_limits;
    if (auto err = read_unsigned<std::uint64_t>(limits, limits_name, "max_memory_mb",
                                                target.max_memory_mb, 1,
                                                std::numeric_limits<std::uint32_t>::max())) return err;
    if (auto err = read_unsigned<std::uint64_t>(limits, limits_name, "max_execution_time_secs",
                                                target.max_execution_time_secs, 1, 86400)) return err;
    if (auto err = read_unsigned<std::size_t>(limits, limits_name, "max_concurrent_commands",
                                              target.max_concurrent_commands, 1, 1024)) return err;
    if (limits.contains("max_cpu_percent")) {
        const auto& cpu = limits.at("max_cpu_percent");
        if (!cpu.is_number()) {
            return invalid(limits_name + ".max_cpu_percent", "must be a number");
        }
        const double value = cpu.get<double>();
        if (value <= 0.0 || value > 100.0) {
            return invalid(limits_name + ".max_cpu_percent", "must be in (0, 100]");
        }
        target.max_cpu_percent = value;
    }
    return std::nullopt;
}

std::optional<WardenError> parse_audit(const json& section, AuditSettings& out) {
    const std::string name = "audit";
    if (auto err = read_bool(section, name, "structured_logging", out.structured_logging)) return err;
    if (section.contains("log_directory")) {
        const auto& dir = section.at("log_directory");
        if (!dir.is_string()) {
            return invalid("audit.log_directory", "must be a string");
        }
        out.log_directory = dir.get<std::string>();
    }
    if (auto err = read_unsigned<std::uint32_t>(section, name, "max_log_files",
                                                out.max_log_files, 1, 1000)) return err;
    if (auto err = read_unsigned<std::uint64_t>(section, name, "max_log_size_bytes",
                                                out.max_log_size_bytes, 1024,
                                                std::numeric_limits<std::uint64_t>::max())) return err;
    if (auto err = read_unsigned<std::size_t>(section, name, "policy_audit_capacity",
                                              out.policy_audit_capacity, 1, 10000000)) return err;
    return std::nullopt;
}

std::optional<logging::LogLevel> parse_level(const std::string& text) {
    if (text == "debug") return logging::LogLevel::DEBUG;
    if (text == "info") return logging::LogLevel::INFO;
    if (text == "warn") return logging::LogLevel::WARN;
    if (text == "error") return logging::LogLevel::ERROR;
    return std::nullopt;
}

}  // namespace

errors::Result<GuardConfig> guard_config_from_json(const json& document) {
    if (!document.is_object()) {
        return WardenError{ErrorKind::InvalidConfig,
                           "Config document must be a JSON object."};
    }

    GuardConfig config;
    const json* section = nullptr;

    if (auto err = read_section(document, "sandbox", section)) return *err;
    if (section != nullptr) {
        if (auto err = parse_sandbox(*section, config.sandbox)) return *err;
    }

    if (auto err = read_section(document, "safety", section)) return *err;
    if (section != nullptr) {
        if (auto err = parse_safety(*section, config.safety)) return *err;
    }

    if (auto err = read_section(document, "audit", section)) return *err;
    if (section != nullptr) {
        if (auto err = parse_audit(*section, config.audit)) return *err;
    }

    if (document.contains("log_level")) {
        const auto& level = document.at("log_level");
        if (!level.is_string()) {
            return invalid("log_level", "must be a string");
        }
        const auto parsed = parse_level(level.get<std::string>());
        if (!parsed.has_value()) {
            return invalid("log_level", "must be one of debug, info, warn, error");
        }
        config.log_level = parsed.value();
    }

    return config;
}

errors::Result<GuardConfig> load_guard_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return WardenError{ErrorKind::InvalidConfig,
                           "Config file does not exist: " + path.string()};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return WardenError{ErrorKind::InvalidConfig,
                           "Unable to open config file: " + path.string()};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return WardenError{ErrorKind::InvalidConfig,
                           "Config file is not valid JSON: " + path.string()};
    }
    return guard_config_from_json(document);
}

}  // namespace warden::core::config
