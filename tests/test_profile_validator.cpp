#include "profile_validator.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace routecompose;

namespace {

RouteSpec spec(const std::string& destination, const std::string& gateway, bool enabled = true) {
    RouteSpec route;
    route.destination = destination;
    route.gateway = gateway;
    route.interface_name = "eth0";
    route.enabled = enabled;
    return route;
}

std::size_t countOf(const std::vector<ProfileWarning>& warnings, ProfileWarning::Type type) {
    return static_cast<std::size_t>(std::count_if(warnings.begin(), warnings.end(),
        [type](const ProfileWarning& w) { return w.type == type; }));
}

} // namespace

TEST(ProfileValidatorTest, CleanProfileHasNoWarnings) {
    Profile profile;
    profile.name = "clean";
    profile.routes = {spec("10.0.0.0/24", "192.168.1.1"), spec("10.1.0.0/24", "192.168.1.1"),
                      spec("git.example.com", "192.168.1.2")};
    EXPECT_TRUE(ProfileValidator::validateProfile(profile).empty());
}

TEST(ProfileValidatorTest, FlagsDefaultAndSpecialRanges) {
    Profile profile;
    profile.name = "odd";
    profile.routes = {spec("0.0.0.0/0", "192.168.1.254"), spec("169.254.10.0/24", "192.168.1.254"),
                      spec("239.1.1.1", "192.168.1.254"), spec("127.0.0.1", "192.168.1.254")};

    std::vector<ProfileWarning> warnings = ProfileValidator::validateProfile(profile);
    EXPECT_EQ(countOf(warnings, ProfileWarning::Type::DefaultRoute), 1u);
    EXPECT_EQ(countOf(warnings, ProfileWarning::Type::SpecialRange), 3u);
    EXPECT_EQ(countOf(warnings, ProfileWarning::Type::PrefixOverlap), 0u);

    EXPECT_EQ(ProfileValidator::specialRangeName(AddressUtils::parseCIDR("127.0.0.0/8")), "loopback");
    EXPECT_EQ(ProfileValidator::specialRangeName(AddressUtils::parseCIDR("224.0.0.0/4")), "multicast");
    EXPECT_FALSE(ProfileValidator::specialRangeName(AddressUtils::parseCIDR("10.0.0.0/8")).has_value());
}

TEST(ProfileValidatorTest, OverlapWithDifferentGatewayIsReported) {
    Profile profile;
    profile.name = "overlap";
    profile.routes = {spec("10.0.0.0/8", "10.8.0.1"),
                      spec("10.20.0.0/16", "192.168.1.1"),
                      spec("10.30.0.0/16", "10.8.0.1")};

    std::vector<ProfileWarning> warnings = ProfileValidator::validateProfile(profile);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].type, ProfileWarning::Type::PrefixOverlap);
    EXPECT_EQ(warnings[0].route_index, 1u);
    ASSERT_TRUE(warnings[0].related_index.has_value());
    EXPECT_EQ(*warnings[0].related_index, 0u);
    EXPECT_NE(warnings[0].message.find("more specific prefix wins"), std::string::npos);
}

TEST(ProfileValidatorTest, DisabledRoutesOnlyGetTheirOwnWarning) {
    Profile profile;
    profile.name = "disabled";
    profile.routes = {spec("10.0.0.0/8", "10.8.0.1"),
                      spec("0.0.0.0/0", "192.168.1.1", false),
                      spec("10.20.0.0/16", "192.168.1.1", false)};

    std::vector<ProfileWarning> warnings = ProfileValidator::validateProfile(profile);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(countOf(warnings, ProfileWarning::Type::DisabledRoute), 2u);
    EXPECT_EQ(ProfileWarning::typeToString(warnings[0].type), "DisabledRoute");
}

namespace {

LiveRouteEntry liveRoute(const std::string& destination, int prefix_length, const std::string& device) {
    LiveRouteEntry entry;
    entry.destination = destination;
    entry.prefix_length = prefix_length;
    entry.interface_name = device;
    entry.interface_index = 7;
    return entry;
}

} // namespace

TEST(ProfileValidatorTest, DetectsSplitDefaultFullTunnel) {
    std::vector<LiveRouteEntry> live = {liveRoute("0.0.0.0", 0, "eth0"),
                                        liveRoute("0.0.0.0", 1, "client0"),
                                        liveRoute("128.0.0.0", 1, "client0")};

    std::optional<ProfileWarning> warning = ProfileValidator::detectFullTunnel(live);
    ASSERT_TRUE(warning.has_value());
    EXPECT_EQ(warning->type, ProfileWarning::Type::FullTunnel);
    EXPECT_NE(warning->message.find("client0"), std::string::npos);
}

TEST(ProfileValidatorTest, DetectsDefaultRouteThroughTunnelDevice) {
    EXPECT_TRUE(ProfileValidator::detectFullTunnel({liveRoute("0.0.0.0", 0, "wg0")}).has_value());
    EXPECT_TRUE(ProfileValidator::isTunnelInterface("tun1"));
    EXPECT_FALSE(ProfileValidator::isTunnelInterface("eth0"));
}

TEST(ProfileValidatorTest, HalvesOnDifferentDevicesAreNotAFullTunnel) {
    std::vector<LiveRouteEntry> live = {liveRoute("0.0.0.0", 0, "eth0"),
                                        liveRoute("0.0.0.0", 1, "eth1"),
                                        liveRoute("128.0.0.0", 1, "eth2"),
                                        liveRoute("10.8.0.0", 24, "wg0")};
    EXPECT_FALSE(ProfileValidator::detectFullTunnel(live).has_value());
}
