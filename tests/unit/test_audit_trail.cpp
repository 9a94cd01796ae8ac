#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/audit_id.hpp"
#include "core/config/guard_config.hpp"
#include "core/errors/warden_errors.hpp"
#include "session/audit_trail.hpp"

namespace {

using warden::core::config::AuditSettings;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::protocol::AuditEvent;
using warden::protocol::AuditEventType;
using warden::protocol::AuditOutcome;
using warden::protocol::AuditSeverity;
using warden::session::AuditTrail;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_audit_trail_" + warden::core::config::generate_audit_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

AuditEvent make_event(const std::string& operation) {
    AuditEvent event;
    event.event_type = AuditEventType::AgentExecution;
    event.severity = AuditSeverity::Medium;
    event.user_id = "agent";
    event.operation = operation;
    event.resource = "echo hi";
    return event;
}

std::vector<std::string> read_lines(const std::filesystem::path& file) {
    std::ifstream in(file);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::size_t count_audit_files(const std::filesystem::path& dir) {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind("audit_", 0) == 0) {
            ++count;
        }
    }
    return count;
}

TEST(AuditTrailTest, RendersTextLine) {
    auto event = make_event("execute");
    event.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    event.result.outcome = AuditOutcome::Failure;
    event.result.message = "blocked";
    event.details = {{"state", "rejected"}, {"code", "blocked_command"}};

    EXPECT_EQ(AuditTrail::render_text(event),
              "[1700000000] MEDIUM AGENT_EXECUTION execute echo hi - FAILURE: blocked "
              "{code=blocked_command, state=rejected}");
}

TEST(AuditTrailTest, RendersJsonLine) {
    auto event = make_event("execute");
    event.id = "audit-0000000000000001";
    event.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1500));
    event.result.outcome = AuditOutcome::Warning;
    event.result.message = "exit code 2";
    event.details["exit_code"] = "2";

    const auto line = nlohmann::json::parse(AuditTrail::render_json(event));
    EXPECT_EQ(line["id"], "audit-0000000000000001");
    EXPECT_EQ(line["timestamp"], 1500);
    EXPECT_EQ(line["event_type"], "AGENT_EXECUTION");
    EXPECT_EQ(line["severity"], "MEDIUM");
    EXPECT_EQ(line["user_id"], "agent");
    EXPECT_EQ(line["result"]["message"], "exit code 2");
    EXPECT_EQ(line["details"]["exit_code"], "2");
}

TEST(AuditTrailTest, FillsIdAndTimestampAndKeepsInMemory) {
    AuditSettings settings;
    AuditTrail trail(settings);

    auto held = trail.record(make_event("execute"));
    ASSERT_FALSE(is_error(held));
    EXPECT_EQ(get_value(held), 1u);

    const auto events = trail.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].id.rfind("audit-", 0), 0u);
    EXPECT_NE(events[0].timestamp.time_since_epoch().count(), 0);
    EXPECT_FALSE(trail.current_log_file().has_value());
}

TEST(AuditTrailTest, MemoryIsBounded) {
    AuditTrail trail(AuditSettings{}, 3);
    for (int i = 0; i < 5; ++i) {
        ASSERT_FALSE(is_error(trail.record(make_event("op-" + std::to_string(i)))));
    }
    const auto events = trail.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.front().operation, "op-2");
    EXPECT_EQ(events.back().operation, "op-4");
}

TEST(AuditTrailTest, AppendsToLogFile) {
    TempWorkspace workspace;
    AuditSettings settings;
    settings.log_directory = workspace.root() / "audit";
    AuditTrail trail(settings);

    ASSERT_FALSE(is_error(trail.record(make_event("first"))));
    ASSERT_FALSE(is_error(trail.record(make_event("second"))));

    const auto file = trail.current_log_file();
    ASSERT_TRUE(file.has_value());
    const auto lines = read_lines(file.value());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(lines[0])["operation"], "first");
    EXPECT_EQ(nlohmann::json::parse(lines[1])["operation"], "second");

    std::string exported = trail.export_log();
    EXPECT_EQ(exported, lines[0] + "\n" + lines[1] + "\n");
}

TEST(AuditTrailTest, RotatesAndPrunesOldFiles) {
    TempWorkspace workspace;
    AuditSettings settings;
    settings.log_directory = workspace.root();
    settings.max_log_size_bytes = 200;
    settings.max_log_files = 2;
    AuditTrail trail(settings);

    for (int i = 0; i < 6; ++i) {
        ASSERT_FALSE(is_error(trail.record(make_event("rotating-" + std::to_string(i)))));
        EXPECT_LE(count_audit_files(workspace.root()), 2u);
    }
    EXPECT_GE(count_audit_files(workspace.root()), 1u);
}

TEST(AuditTrailTest, TextModeExportUsesTextLines) {
    AuditSettings settings;
    settings.structured_logging = false;
    AuditTrail trail(settings);
    ASSERT_FALSE(is_error(trail.record(make_event("execute"))));
    const std::string exported = trail.export_log();
    EXPECT_NE(exported.find("MEDIUM AGENT_EXECUTION execute echo hi - SUCCESS {}"),
              std::string::npos);
}

}  // namespace
