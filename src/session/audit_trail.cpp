#include "session/audit_trail.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <mutex>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/audit_id.hpp"
#include "core/logging/logger.hpp"

namespace warden::session {

using core::errors::ErrorKind;
using core::errors::WardenError;
using nlohmann::json;

namespace {

std::int64_t unix_seconds(const std::chrono::system_clock::time_point point) {
    return std::chrono::duration_cast<std::chrono::seconds>(point.time_since_epoch()).count();
}

std::int64_t unix_ms(const std::chrono::system_clock::time_point point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch())
        .count();
}

std::string outcome_name(const protocol::AuditOutcome outcome) {
    switch (outcome) {
        case protocol::AuditOutcome::Success:
            return "success";
        case protocol::AuditOutcome::Failure:
            return "failure";
        case protocol::AuditOutcome::Warning:
            return "warning";
        default:
            return "unknown";
    }
}

bool is_audit_file(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    return path.extension() == ".log" && name.rfind("audit_", 0) == 0;
}

}  // namespace

AuditTrail::AuditTrail(core::config::AuditSettings settings, const std::size_t memory_capacity)
    : settings_(std::move(settings)),
      memory_capacity_(memory_capacity == 0 ? 1 : memory_capacity) {}

std::string AuditTrail::render_text(const protocol::AuditEvent& event) {
    std::string details = "{";
    bool first = true;
    for (const auto& entry : event.details) {
        if (!first) {
            details += ", ";
        }
        details += entry.first + "=" + entry.second;
        first = false;
    }
    details += "}";

    return "[" + std::to_string(unix_seconds(event.timestamp)) + "] " +
           protocol::to_string(event.severity) + " " + protocol::to_string(event.event_type) +
           " " + event.operation + " " + event.resource + " - " +
           protocol::to_string(event.result) + " " + details;
}

std::string AuditTrail::render_json(const protocol::AuditEvent& event) {
    json line;
    line["id"] = event.id;
    line["timestamp"] = unix_ms(event.timestamp);
    line["event_type"] = protocol::to_string(event.event_type);
    line["severity"] = protocol::to_string(event.severity);
    line["user_id"] = event.user_id.has_value() ? json(event.user_id.value()) : json();
    line["operation"] = event.operation;
    line["resource"] = event.resource;
    line["result"] = {{"outcome", outcome_name(event.result.outcome)},
                      {"message", event.result.message}};
    line["details"] = event.details;
    return line.dump();
}

std::string AuditTrail::render(const protocol::AuditEvent& event) const {
    return settings_.structured_logging ? render_json(event) : render_text(event);
}

core::errors::Result<std::size_t> AuditTrail::record(protocol::AuditEvent event) {
    if (event.id.empty()) {
        event.id = core::config::generate_audit_id();
    }
    if (event.timestamp.time_since_epoch().count() == 0) {
        event.timestamp = std::chrono::system_clock::now();
    }
    const std::string line = render(event);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    events_.push_back(std::move(event));
    while (events_.size() > memory_capacity_) {
        events_.pop_front();
    }
    const std::size_t held = events_.size();

    if (settings_.log_directory.empty()) {
        return held;
    }
    auto written = append_line(line);
    if (core::errors::is_error(written)) {
        LOG_ERROR("AuditTrail: " + core::errors::get_error(written).message);
        return core::errors::get_error(written);
    }
    return held;
}

core::errors::Result<std::filesystem::path> AuditTrail::open_log_file() {
    if (current_file_.has_value()) {
        return current_file_.value();
    }

    std::error_code ec;
    std::filesystem::create_directories(settings_.log_directory, ec);
    if (ec) {
        return WardenError{ErrorKind::AuditWriteFailed,
                           "Unable to create audit directory: " +
                               settings_.log_directory.string()};
    }

    const auto now = unix_seconds(std::chrono::system_clock::now());
    const auto file = settings_.log_directory /
                      ("audit_" + std::to_string(now) + "_" + std::to_string(rotation_) + ".log");
    current_file_ = file;
    return file;
}

core::errors::Result<std::filesystem::path> AuditTrail::append_line(const std::string& line) {
    auto file_result = open_log_file();
    if (core::errors::is_error(file_result)) {
        return core::errors::get_error(file_result);
    }
    const auto file = core::errors::get_value(file_result);

    {
        std::ofstream out(file, std::ios::app);
        if (!out.is_open()) {
            return WardenError{ErrorKind::AuditWriteFailed,
                               "Unable to open audit file: " + file.string()};
        }
        out << line << "\n";
        if (!out.good()) {
            return WardenError{ErrorKind::AuditWriteFailed,
                               "Unable to write audit event: " + file.string()};
        }
    }

    rotate_if_needed(file);
    return file;
}

void AuditTrail::rotate_if_needed(const std::filesystem::path& file) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec || size < settings_.max_log_size_bytes) {
        return;
    }
    LOG_INFO("AuditTrail: rotating " + file.string() + " at " + std::to_string(size) + " bytes");
    current_file_.reset();
    ++rotation_;
    prune_old_files();
}

// Leaves room for the file the next event opens.
void AuditTrail::prune_old_files() {
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    std::filesystem::directory_iterator it(settings_.log_directory, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && is_audit_file(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        LOG_WARN("AuditTrail: unable to list " + settings_.log_directory.string());
        return;
    }

    std::sort(files.begin(), files.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  std::error_code time_ec;
                  const auto ta = std::filesystem::last_write_time(a, time_ec);
                  const auto tb = std::filesystem::last_write_time(b, time_ec);
                  if (ta != tb) {
                      return ta < tb;
                  }
                  return a.filename().string() < b.filename().string();
              });

    std::size_t remaining = files.size();
    for (const auto& file : files) {
        if (remaining < settings_.max_log_files) {
            break;
        }
        std::error_code remove_ec;
        std::filesystem::remove(file, remove_ec);
        if (remove_ec) {
            LOG_WARN("AuditTrail: unable to remove " + file.string());
            continue;
        }
        --remaining;
    }
}

std::vector<protocol::AuditEvent> AuditTrail::events() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return {events_.begin(), events_.end()};
}

std::string AuditTrail::export_log() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::string out;
    for (const auto& event : events_) {
        out += render(event);
        out += "\n";
    }
    return out;
}

std::optional<std::filesystem::path> AuditTrail::current_log_file() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return current_file_;
}

}  // namespace warden::session
