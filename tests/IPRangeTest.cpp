#include <gtest/gtest.h>

#include "config/IPRange.hpp"

static CIP ip(const std::string& s) {
    auto parsed = CIP::fromString(s);
    EXPECT_TRUE(parsed.has_value()) << s;
    return parsed.value_or(CIP{});
}

TEST(IP, ParsesV4) {
    const auto IP = ip("192.168.1.20");
    EXPECT_FALSE(IP.m_v6);
    EXPECT_EQ(IP.m_blocks, (std::vector<uint16_t>{192, 168, 1, 20}));
    EXPECT_EQ(IP.toString(), "192.168.1.20");
}

TEST(IP, RejectsBadV4) {
    for (const auto& s : {"256.0.0.1", "1.2.3", "1.2.3.4.5", "a.b.c.d", "", "1..2.3", "1.2.3.4 ", "-1.2.3.4", "1234.1.1.1"}) {
        EXPECT_FALSE(CIP::fromString(s).has_value()) << s;
    }
}

TEST(IP, ParsesV6) {
    EXPECT_EQ(ip("::1").m_blocks, (std::vector<uint16_t>{0, 0, 0, 0, 0, 0, 0, 1}));
    EXPECT_EQ(ip("::").m_blocks, (std::vector<uint16_t>(8, 0)));
    EXPECT_EQ(ip("2001:db8::").m_blocks, (std::vector<uint16_t>{0x2001, 0xdb8, 0, 0, 0, 0, 0, 0}));
    EXPECT_EQ(ip("2001:DB8:0:0:8:800:200C:417A").m_blocks, (std::vector<uint16_t>{0x2001, 0xdb8, 0, 0, 8, 0x800, 0x200c, 0x417a}));
    EXPECT_EQ(ip("fe80::1:2").m_blocks, (std::vector<uint16_t>{0xfe80, 0, 0, 0, 0, 0, 1, 2}));
    EXPECT_TRUE(ip("::1").m_v6);
}

TEST(IP, RejectsBadV6) {
    for (const auto& s : {"1::2::3", "12345::", "[::1]", "fe80::1%eth0", ":::", "1:2:3:4:5:6:7", "1:2:3:4:5:6:7:8:9", "1:2:3:4:5:6:7::8", "g::1", ":1::"}) {
        EXPECT_FALSE(CIP::fromString(s).has_value()) << s;
    }
}

TEST(IP, V4Mapped) {
    const auto MAPPED = ip("::ffff:10.0.0.1");
    EXPECT_TRUE(MAPPED.isV4Mapped());
    EXPECT_EQ(MAPPED.toV4(), ip("10.0.0.1"));

    EXPECT_TRUE(ip("::FFFF:a00:1").isV4Mapped());
    EXPECT_FALSE(ip("::1").isV4Mapped());
    EXPECT_FALSE(ip("10.0.0.1").isV4Mapped());
    EXPECT_EQ(ip("::1").toV4(), ip("::1"));
}

TEST(IPRange, Subnet) {
    const auto RANGE = CIPRange::fromString("10.0.0.0/8");
    ASSERT_TRUE(RANGE.has_value());

    EXPECT_TRUE(RANGE->ipMatches(ip("10.0.0.0")));
    EXPECT_TRUE(RANGE->ipMatches(ip("10.255.255.255")));
    EXPECT_FALSE(RANGE->ipMatches(ip("11.0.0.0")));
    EXPECT_FALSE(RANGE->ipMatches(ip("9.255.255.255")));
    EXPECT_FALSE(RANGE->ipMatches(ip("::a00:1")));
}

TEST(IPRange, SubnetHostBitsAreMasked) {
    const auto RANGE = CIPRange::fromString("192.168.1.77/24");
    ASSERT_TRUE(RANGE.has_value());

    EXPECT_EQ(RANGE->start(), ip("192.168.1.0"));
    EXPECT_EQ(RANGE->end(), ip("192.168.1.255"));
}

TEST(IPRange, OddPrefixes) {
    const auto V4 = CIPRange::fromString("172.16.0.0/12");
    ASSERT_TRUE(V4.has_value());
    EXPECT_EQ(V4->end(), ip("172.31.255.255"));

    const auto V6 = CIPRange::fromString("2001:db8::/33");
    ASSERT_TRUE(V6.has_value());
    EXPECT_TRUE(V6->ipMatches(ip("2001:db8:7fff:ffff::1")));
    EXPECT_FALSE(V6->ipMatches(ip("2001:db8:8000::")));
}

TEST(IPRange, V6Subnet) {
    const auto RANGE = CIPRange::fromString("2001:db8::/32");
    ASSERT_TRUE(RANGE.has_value());

    EXPECT_TRUE(RANGE->ipMatches(ip("2001:db8:ffff::1")));
    EXPECT_FALSE(RANGE->ipMatches(ip("2001:db9::")));

    const auto HOST = CIPRange::fromString("::1/128");
    ASSERT_TRUE(HOST.has_value());
    EXPECT_TRUE(HOST->ipMatches(ip("::1")));
    EXPECT_FALSE(HOST->ipMatches(ip("::2")));
}

TEST(IPRange, ZeroPrefixIsWholeFamily) {
    const auto RANGE = CIPRange::fromString("0.0.0.0/0");
    ASSERT_TRUE(RANGE.has_value());

    EXPECT_TRUE(RANGE->ipMatches(ip("8.8.8.8")));
    EXPECT_TRUE(RANGE->ipMatches(ip("255.255.255.255")));
    EXPECT_FALSE(RANGE->ipMatches(ip("::1")));
}

TEST(IPRange, ExplicitRange) {
    const auto RANGE = CIPRange::fromString("10.0.0.5 - 10.0.0.10");
    ASSERT_TRUE(RANGE.has_value());

    EXPECT_TRUE(RANGE->ipMatches(ip("10.0.0.5")));
    EXPECT_TRUE(RANGE->ipMatches(ip("10.0.0.10")));
    EXPECT_FALSE(RANGE->ipMatches(ip("10.0.0.4")));
    EXPECT_FALSE(RANGE->ipMatches(ip("10.0.0.11")));
    EXPECT_EQ(RANGE->toString(), "10.0.0.5-10.0.0.10");
}

TEST(IPRange, SingleAddress) {
    const auto RANGE = CIPRange::fromString(" 203.0.113.9 ");
    ASSERT_TRUE(RANGE.has_value());

    EXPECT_TRUE(RANGE->ipMatches(ip("203.0.113.9")));
    EXPECT_FALSE(RANGE->ipMatches(ip("203.0.113.10")));
    EXPECT_EQ(RANGE->toString(), "203.0.113.9");
}

TEST(IPRange, RejectsGarbage) {
    for (const auto& s : {"", "10.0.0.0/33", "::/129", "10.0.0.0/", "10.0.0.0/a", "10.0.0.0/-1", "10.0.0.10-10.0.0.5", "10.0.0.1-::1", "localhost", "10.0.0/8"}) {
        EXPECT_FALSE(CIPRange::fromString(s).has_value()) << s;
    }
}

TEST(IPRange, Merge) {
    auto       a = CIPRange::fromString("10.0.0.0/24").value();
    const auto B = CIPRange::fromString("10.0.0.128-10.0.1.5").value();
    const auto C = CIPRange::fromString("10.0.2.0/24").value();

    EXPECT_TRUE(a.overlaps(B));
    EXPECT_FALSE(a.overlaps(C));
    EXPECT_FALSE(a.overlaps(CIPRange::fromString("::/0").value()));

    a.merge(B);
    EXPECT_EQ(a.start(), ip("10.0.0.0"));
    EXPECT_EQ(a.end(), ip("10.0.1.5"));
}
