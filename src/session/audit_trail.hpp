#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "core/config/guard_config.hpp"
#include "core/errors/warden_errors.hpp"
#include "protocol/audit_contract.hpp"

namespace warden::session {

// Records AuditEvents in memory and, when a log directory is configured,
// appends them to audit_<unix>_<n>.log files with size-based rotation.
class AuditTrail {
public:
    explicit AuditTrail(core::config::AuditSettings settings,
                        std::size_t memory_capacity = 1000);

    // Fills in id and timestamp when missing. The event is kept in memory
    // even when the file write fails. Returns the number of events held.
    core::errors::Result<std::size_t> record(protocol::AuditEvent event);

    std::vector<protocol::AuditEvent> events() const;
    // One rendered line per event, oldest first.
    std::string export_log() const;

    std::string render(const protocol::AuditEvent& event) const;
    static std::string render_text(const protocol::AuditEvent& event);
    static std::string render_json(const protocol::AuditEvent& event);

    std::optional<std::filesystem::path> current_log_file() const;

private:
    core::errors::Result<std::filesystem::path> append_line(const std::string& line);
    core::errors::Result<std::filesystem::path> open_log_file();
    void rotate_if_needed(const std::filesystem::path& file);
    void prune_old_files();

    core::config::AuditSettings settings_;
    std::size_t memory_capacity_;

    mutable std::shared_mutex mutex_;
    std::deque<protocol::AuditEvent> events_;
    std::optional<std::filesystem::path> current_file_;
    std::uint32_t rotation_ = 0;
};

}  // namespace warden::session
