#include <gtest/gtest.h>

#include "landrop/AddressUtils.h"
#include "landrop/LinkLocalCache.h"

using namespace LanDrop;

//=============================================================================
// AddressUtils
//=============================================================================

TEST(AddressUtilsTest, NormalizesMappedIpv4) {
    EXPECT_EQ(AddressUtils::normalizeMapped("::ffff:192.0.2.5"), "192.0.2.5");
    EXPECT_EQ(AddressUtils::normalizeMapped("::FFFF:192.0.2.5"), "192.0.2.5");
    EXPECT_EQ(AddressUtils::normalizeMapped("192.0.2.5"), "192.0.2.5");
    EXPECT_EQ(AddressUtils::normalizeMapped("2001:db8::1"), "2001:db8::1");
    EXPECT_EQ(AddressUtils::normalizeMapped("::ffff:"), "::ffff:");
    EXPECT_EQ(AddressUtils::normalizeMapped("::ffff:1:2"), "::ffff:1:2");
}

TEST(AddressUtilsTest, NormalizesToPeerKey) {
    EXPECT_EQ(AddressUtils::normalize(" [2001:db8::2]\n"), "2001:db8::2");
    EXPECT_EQ(AddressUtils::normalize("[::ffff:192.0.2.5]"), "192.0.2.5");
    EXPECT_EQ(AddressUtils::normalize("\t192.0.2.5 "), "192.0.2.5");
    EXPECT_EQ(AddressUtils::normalize("   "), "");
}

TEST(AddressUtilsTest, ValidatesNumericAddresses) {
    EXPECT_TRUE(AddressUtils::isValidAddress("192.0.2.5"));
    EXPECT_TRUE(AddressUtils::isValidAddress("2001:db8::1"));
    EXPECT_TRUE(AddressUtils::isValidAddress("[2001:db8::1]"));
    EXPECT_FALSE(AddressUtils::isValidAddress(""));
    EXPECT_FALSE(AddressUtils::isValidAddress("example.com"));
    EXPECT_FALSE(AddressUtils::isValidAddress("1.2.3.4.5"));
}

TEST(AddressUtilsTest, DetectsLinkLocal) {
    EXPECT_TRUE(AddressUtils::isLinkLocalIpv6("fe80::1"));
    EXPECT_TRUE(AddressUtils::isLinkLocalIpv6("fe80::1%eth0"));
    EXPECT_TRUE(AddressUtils::isLinkLocalIpv6("febf::1"));
    EXPECT_FALSE(AddressUtils::isLinkLocalIpv6("fec0::1"));
    EXPECT_FALSE(AddressUtils::isLinkLocalIpv6("2001:db8::1"));
    EXPECT_FALSE(AddressUtils::isLinkLocalIpv6("192.0.2.5"));
}

TEST(AddressUtilsTest, BuildsEndpointUrls) {
    EXPECT_EQ(AddressUtils::endpointUrl("192.0.2.5", 56934, "connect"), "https://192.0.2.5:56934/connect");
    EXPECT_EQ(AddressUtils::endpointUrl("2001:db8::1", 56934, "connect"), "https://[2001:db8::1]:56934/connect");
    EXPECT_EQ(AddressUtils::endpointUrl("fe80::1%eth0", 56934, "start-transaction"),
              "https://[fe80::1%25eth0]:56934/start-transaction");
}

//=============================================================================
// LinkLocalCache
//=============================================================================

/**
 * @test Unscoped link-local addresses resolve to the scope they were heard on
 */
TEST(LinkLocalCacheTest, ResolvesRememberedScope) {
    LinkLocalCache cache;
    cache.remember("fe80::1%eth0");

    EXPECT_EQ(cache.resolve("fe80::1"), "fe80::1%eth0");
    EXPECT_EQ(cache.resolve("[fe80::1]"), "fe80::1%eth0");
    EXPECT_EQ(cache.resolve("fe80::1%wlan0"), "fe80::1%wlan0");
}

TEST(LinkLocalCacheTest, MissLeavesAddressUnqualified) {
    LinkLocalCache cache;
    EXPECT_EQ(cache.resolve("fe80::2"), "fe80::2");
    EXPECT_EQ(cache.resolve("192.0.2.5"), "192.0.2.5");
}

TEST(LinkLocalCacheTest, IgnoresNonLinkLocalAndUnscoped) {
    LinkLocalCache cache;
    cache.remember("2001:db8::1%eth0");
    cache.remember("fe80::1");
    EXPECT_EQ(cache.size(), 0u);
}
