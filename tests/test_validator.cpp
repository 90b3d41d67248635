#include "fake_network_backend.hpp"
#include "temp_dir.hpp"
#include "validator.hpp"
#include <gtest/gtest.h>

using namespace routecompose;
using routecompose::test::FakeNetworkBackend;
using routecompose::test::TempDir;

namespace {

class ValidatorTest : public ::testing::Test {
protected:
    ValidatorTest()
        : audit(dir.file("audit.log")),
          reader(backend),
          validator(backend, reader, audit) {
        backend.addInterface("eth0", 2);
        backend.addInterface("wlan0", 3);
    }

    ResolvedRoute route(const std::string& destination, int prefix_length, uint32_t index = 2) {
        ResolvedRoute resolved;
        resolved.key.destination = destination;
        resolved.key.prefix_length = prefix_length;
        resolved.key.gateway = "192.168.1.1";
        resolved.interface_index = index;
        resolved.interface_name = backend.interfaceName(index);
        resolved.metric = 5;
        resolved.source_key = resolved.key;
        return resolved;
    }

    static ProbeResult answered(int hops) {
        ProbeResult result;
        result.responded = true;
        result.hops_answered = hops;
        result.first_hop = "192.168.1.1";
        return result;
    }

    TempDir dir;
    FakeNetworkBackend backend;
    AuditLog audit;
    LiveStateReader reader;
    Validator validator;
};

} // namespace

TEST_F(ValidatorTest, CombinesTablePresenceWithProbe) {
    backend.seed("10.0.0.0", 24, "192.168.1.1", 2, 5, "250");
    backend.seed("10.1.0.0", 24, "192.168.1.1", 2, 5, "250");
    backend.probe_answers["10.0.0.1"] = answered(2);

    std::vector<ResolvedRoute> routes = {route("10.0.0.0", 24), route("10.1.0.0", 24), route("10.2.0.0", 24)};
    auto results = validator.validate(routes, ValidatorOptions());

    ASSERT_EQ(results.size(), 3u);
    const ValidationResult& verified = results.at(routes[0].key);
    EXPECT_EQ(verified.status(), ValidationStatus::Verified);
    EXPECT_EQ(verified.reachability, Reachability::Reachable);
    EXPECT_EQ(verified.probe_target, "10.0.0.1");
    EXPECT_EQ(verified.hops_answered, 2);
    EXPECT_EQ(verified.route_hit, RouteHit::Hit);
    EXPECT_EQ(verified.effective_interface, "eth0");

    const ValidationResult& silent = results.at(routes[1].key);
    EXPECT_EQ(silent.table_status, TableStatus::Verified);
    EXPECT_EQ(silent.reachability, Reachability::Unreachable);
    EXPECT_EQ(silent.status(), ValidationStatus::Unreachable);

    // Missing dominates whatever the probe says
    const ValidationResult& missing = results.at(routes[2].key);
    EXPECT_EQ(missing.table_status, TableStatus::Missing);
    EXPECT_EQ(missing.status(), ValidationStatus::Missing);
    EXPECT_EQ(missing.route_hit, RouteHit::NotChecked);

    EXPECT_EQ(audit.readAll().size(), 3u);
}

TEST_F(ValidatorTest, EntryOnOtherInterfaceIsMissing) {
    backend.seed("10.0.0.0", 24, "192.168.1.1", 3, 5, "250");
    ValidatorOptions options;
    options.probe_enabled = false;

    auto results = validator.validate({route("10.0.0.0", 24, 2)}, options);
    EXPECT_EQ(results.begin()->second.table_status, TableStatus::Missing);
}

TEST_F(ValidatorTest, DisabledProbingReportsTableOnly) {
    backend.seed("10.0.0.0", 24, "192.168.1.1", 2, 5, "250");
    ValidatorOptions options;
    options.probe_enabled = false;

    auto results = validator.validate({route("10.0.0.0", 24)}, options);
    const ValidationResult& result = results.begin()->second;
    EXPECT_EQ(result.reachability, Reachability::NotProbed);
    EXPECT_EQ(result.status(), ValidationStatus::Verified);
    EXPECT_TRUE(backend.probed.empty());
}

TEST_F(ValidatorTest, CancelledBeforeStartProbesNothing) {
    backend.seed("10.0.0.0", 24, "192.168.1.1", 2, 5, "250");
    CancellationToken cancel;
    cancel.cancel();

    auto results = validator.validate({route("10.0.0.0", 24), route("10.1.0.0", 24)}, ValidatorOptions(), &cancel);
    ASSERT_EQ(results.size(), 2u);
    for (const auto& item : results) {
        EXPECT_EQ(item.second.reachability, Reachability::NotProbed);
        EXPECT_EQ(item.second.detail, "cancelled");
    }
    EXPECT_TRUE(backend.probed.empty());
}

TEST_F(ValidatorTest, OneProbePerTarget) {
    backend.seed("10.0.0.5", 32, "192.168.1.1", 2, 5, "250");
    backend.seed("10.0.0.5", 32, "192.168.1.254", 2, 5, "250");
    backend.probe_answers["10.0.0.5"] = answered(1);

    ResolvedRoute first = route("10.0.0.5", 32);
    ResolvedRoute second = route("10.0.0.5", 32);
    second.key.gateway = "192.168.1.254";

    auto results = validator.validate({first, second}, ValidatorOptions());
    EXPECT_EQ(results.size(), 2u);
    EXPECT_EQ(backend.probed.size(), 1u);
}

TEST_F(ValidatorTest, ProbeToolErrorIsNotUnreachable) {
    backend.seed("10.0.0.0", 24, "192.168.1.1", 2, 5, "250");
    ProbeResult broken;
    broken.error = "traceroute not available";
    backend.probe_answers["10.0.0.1"] = broken;

    auto results = validator.validate({route("10.0.0.0", 24)}, ValidatorOptions());
    const ValidationResult& result = results.begin()->second;
    EXPECT_EQ(result.reachability, Reachability::NotProbed);
    EXPECT_EQ(result.status(), ValidationStatus::Verified);
    EXPECT_EQ(result.detail, "traceroute not available");
}

TEST_F(ValidatorTest, DefaultRouteWithDeadGatewayIsUnreachable) {
    backend.seed("0.0.0.0", 0, "192.168.1.1", 2, 5, "250");

    auto results = validator.validate({route("0.0.0.0", 0)}, ValidatorOptions());
    const ValidationResult& result = results.begin()->second;
    EXPECT_EQ(result.table_status, TableStatus::Verified);
    EXPECT_EQ(result.probe_target, "192.168.1.1");
    EXPECT_EQ(result.reachability, Reachability::Unreachable);
    EXPECT_EQ(result.status(), ValidationStatus::Unreachable);
    EXPECT_EQ(backend.probed, std::vector<std::string>{"192.168.1.1"});

    // Nothing inside 0.0.0.0/0 is safe to look up without a configured target
    EXPECT_EQ(result.route_hit, RouteHit::NotChecked);
    EXPECT_TRUE(backend.looked_up.empty());
}

TEST_F(ValidatorTest, DefaultRouteUsesConfiguredTarget) {
    backend.seed("0.0.0.0", 0, "192.168.1.1", 2, 5, "250");
    backend.probe_answers["1.1.1.1"] = answered(3);
    ValidatorOptions options;
    options.default_target = "1.1.1.1";

    auto results = validator.validate({route("0.0.0.0", 0)}, options);
    const ValidationResult& result = results.begin()->second;
    EXPECT_EQ(result.probe_target, "1.1.1.1");
    EXPECT_EQ(result.reachability, Reachability::Reachable);
    EXPECT_EQ(result.lookup_target, "1.1.1.1");
    EXPECT_EQ(result.route_hit, RouteHit::Hit);
}

TEST_F(ValidatorTest, ShadowedRouteIsReportedButStaysVerified) {
    backend.seed("10.0.0.0", 16, "192.168.1.1", 2, 5, "250");
    backend.seed("10.0.0.0", 24, "192.168.1.254", 3, 5, "static");
    ValidatorOptions options;
    options.probe_enabled = false;

    auto results = validator.validate({route("10.0.0.0", 16)}, options);
    const ValidationResult& result = results.begin()->second;
    EXPECT_EQ(result.table_status, TableStatus::Verified);
    EXPECT_EQ(result.status(), ValidationStatus::Verified);
    EXPECT_EQ(result.lookup_target, "10.0.0.1");
    EXPECT_EQ(result.route_hit, RouteHit::Shadowed);
    EXPECT_EQ(result.effective_gateway, "192.168.1.254");
    EXPECT_EQ(result.effective_interface, "wlan0");

    std::vector<AuditEvent> events = audit.readAll();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_NE(events[0].outcome.find("leaves via 192.168.1.254 dev wlan0"), std::string::npos);
}

TEST_F(ValidatorTest, FailedLookupIsNotChecked) {
    backend.seed("10.0.0.0", 24, "192.168.1.1", 2, 5, "250");
    backend.lookup_fails = true;
    ValidatorOptions options;
    options.probe_enabled = false;

    auto results = validator.validate({route("10.0.0.0", 24)}, options);
    EXPECT_EQ(results.begin()->second.route_hit, RouteHit::NotChecked);
    EXPECT_EQ(results.begin()->second.status(), ValidationStatus::Verified);
}
