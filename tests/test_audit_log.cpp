#include "audit_log.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>

using namespace routecompose;
using routecompose::test::TempDir;

TEST(AuditLogTest, AppendsAndReadsBackInOrder) {
    TempDir dir;
    AuditLog audit(dir.file("logs/audit.log"));

    audit.record("apply office", "add 10.0.0.0/24 via 192.168.1.1 dev eth0 (ifindex 2) metric 5", "ok");
    audit.record("apply office", "session", "failed: rejected: Error: invalid gateway\nsecond line");
    audit.record("rollback snap-20260101-120000-0a1f", "session", "ok: 1 operation(s)");

    std::vector<AuditEvent> events = audit.readAll();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].intent, "apply office");
    EXPECT_EQ(events[0].outcome, "ok");
    EXPECT_EQ(events[1].outcome, "failed: rejected: Error: invalid gateway second line");
    EXPECT_FALSE(events[2].timestamp.empty());

    // Exactly one line per event
    std::string content = dir.read("logs/audit.log");
    EXPECT_EQ(std::count(content.begin(), content.end(), '\n'), 3);

    std::vector<AuditEvent> last = audit.tail(2);
    ASSERT_EQ(last.size(), 2u);
    EXPECT_EQ(last[0].operation, "session");
    EXPECT_EQ(last[1].intent, "rollback snap-20260101-120000-0a1f");
}

TEST(AuditLogTest, SurvivesPunctuationInFields) {
    AuditEvent event;
    event.timestamp = "2026-01-01T12:00:00.000Z";
    event.intent = "apply home: {test}";
    event.operation = "delete 10.0.0.0/24 via 192.168.1.1, \"quoted\"";
    event.outcome = "failed: [bracketed]";

    AuditEvent parsed = AuditLog::parseEvent(AuditLog::formatEvent(event));
    EXPECT_EQ(parsed.intent, event.intent);
    EXPECT_EQ(parsed.operation, event.operation);
    EXPECT_EQ(parsed.outcome, event.outcome);
}

TEST(AuditLogTest, SkipsUnreadableLines) {
    TempDir dir;
    std::string path = dir.write("audit.log",
        "{timestamp: \"2026-01-01T12:00:00.000Z\", intent: apply, operation: session, outcome: ok}\n"
        "garbage without structure\n"
        "\n");
    AuditLog audit(path);
    EXPECT_EQ(audit.readAll().size(), 1u);
    EXPECT_THROW(AuditLog::parseEvent("[1, 2]"), std::runtime_error);
}

TEST(AuditLogTest, EmptyPathDisablesLogging) {
    AuditLog audit("");
    audit.record("apply", "session", "ok");
    EXPECT_TRUE(audit.readAll().empty());
}
