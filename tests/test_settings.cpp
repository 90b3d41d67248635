#include "settings.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace routecompose;
using routecompose::test::TempDir;

TEST(SettingsTest, EmptyDocumentGivesDefaults) {
    AppSettings settings = SettingsParser::loadFromString("");
    EXPECT_EQ(settings.route_table, "main");
    EXPECT_EQ(settings.route_protocol, "250");
    EXPECT_EQ(settings.snapshot_retention, 20);
    EXPECT_EQ(settings.log_level, LogLevel::Info);
    EXPECT_TRUE(settings.probe.enabled);
    EXPECT_EQ(settings.probe.max_hops, 8);
}

TEST(SettingsTest, OverridesIndividualKeys) {
    AppSettings settings = SettingsParser::loadFromString(
        "snapshot_dir: /srv/snapshots\n"
        "route_table: \"100\"\n"
        "log_level: debug\n"
        "snapshot_retention: 0\n"
        "probe:\n"
        "  enabled: false\n"
        "  max_hops: 4\n");

    EXPECT_EQ(settings.snapshot_dir, "/srv/snapshots");
    EXPECT_EQ(settings.route_table, "100");
    EXPECT_EQ(settings.log_level, LogLevel::Debug);
    EXPECT_EQ(settings.snapshot_retention, 0);
    EXPECT_FALSE(settings.probe.enabled);
    EXPECT_EQ(settings.probe.max_hops, 4);
    EXPECT_EQ(settings.probe.hop_timeout_ms, 1000);
    EXPECT_EQ(settings.profiles_dir, "/etc/route-compose/profiles");
}

TEST(SettingsTest, RejectsInvalidValues) {
    EXPECT_THROW(SettingsParser::loadFromString("log_level: chatty\n"), std::runtime_error);
    EXPECT_THROW(SettingsParser::loadFromString("probe:\n  max_hops: 0\n"), std::runtime_error);
    EXPECT_THROW(SettingsParser::loadFromString("snapshot_retention: -1\n"), std::runtime_error);
    EXPECT_THROW(SettingsParser::loadFromString("command_timeout_ms: soon\n"), std::runtime_error);
    EXPECT_THROW(SettingsParser::loadFromString("[not, a, map]\n"), std::runtime_error);
}

TEST(SettingsTest, RouteProtocolMustBeAnUnreservedNumber) {
    EXPECT_EQ(SettingsParser::loadFromString("route_protocol: 201\n").route_protocol, "201");
    EXPECT_THROW(SettingsParser::loadFromString("route_protocol: ospf\n"), std::runtime_error);
    EXPECT_THROW(SettingsParser::loadFromString("route_protocol: \"4\"\n"), std::runtime_error);
    EXPECT_THROW(SettingsParser::loadFromString("route_protocol: \"256\"\n"), std::runtime_error);
    EXPECT_THROW(SettingsParser::loadFromString("route_protocol: \"\"\n"), std::runtime_error);
}

TEST(SettingsTest, DefaultTargetMustBeAnAddress) {
    EXPECT_TRUE(SettingsParser::loadFromString("").probe.default_target.empty());
    EXPECT_EQ(SettingsParser::loadFromString("probe:\n  default_target: 1.1.1.1\n").probe.default_target, "1.1.1.1");
    EXPECT_THROW(SettingsParser::loadFromString("probe:\n  default_target: example.com\n"), std::runtime_error);
}

TEST(SettingsTest, MissingFileIsOnlyAnErrorWhenRequired) {
    TempDir dir;
    EXPECT_EQ(SettingsParser::loadFromFile(dir.file("absent.yaml"), false).route_table, "main");
    EXPECT_THROW(SettingsParser::loadFromFile(dir.file("absent.yaml"), true), std::runtime_error);

    std::string path = dir.write("settings.yaml", "audit_log: /tmp/audit.log\n");
    EXPECT_EQ(SettingsParser::loadFromFile(path, true).audit_log, "/tmp/audit.log");
}
