#include <gtest/gtest.h>

#include "core/Forwarded.hpp"

TEST(Forwarded, ParsesAllParameters) {
    const auto ELEMENT = NForwarded::parseFirstElement("for=203.0.113.7;proto=https;by=198.51.100.1;host=example.com");
    ASSERT_TRUE(ELEMENT.has_value());

    EXPECT_EQ(ELEMENT->forNode, "203.0.113.7");
    EXPECT_EQ(ELEMENT->byNode, "198.51.100.1");
    EXPECT_EQ(ELEMENT->proto, "https");
    EXPECT_EQ(ELEMENT->host, "example.com");
}

TEST(Forwarded, KeysAreCaseInsensitive) {
    const auto ELEMENT = NForwarded::parseFirstElement("For=192.0.2.60; PROTO=http ;BY=203.0.113.43");
    ASSERT_TRUE(ELEMENT.has_value());

    EXPECT_EQ(ELEMENT->forNode, "192.0.2.60");
    EXPECT_EQ(ELEMENT->proto, "http");
    EXPECT_EQ(ELEMENT->byNode, "203.0.113.43");
    EXPECT_FALSE(ELEMENT->host.has_value());
}

TEST(Forwarded, OnlyFirstElementIsRead) {
    const auto ELEMENT = NForwarded::parseFirstElement("for=192.0.2.43, for=198.51.100.17;proto=https");
    ASSERT_TRUE(ELEMENT.has_value());

    EXPECT_EQ(ELEMENT->forNode, "192.0.2.43");
    EXPECT_FALSE(ELEMENT->proto.has_value());
}

TEST(Forwarded, QuotedValues) {
    const auto ELEMENT = NForwarded::parseFirstElement("for=\"[2001:db8:cafe::17]:4711\";host=\"a.example, b\"");
    ASSERT_TRUE(ELEMENT.has_value());

    EXPECT_EQ(ELEMENT->forNode, "[2001:db8:cafe::17]:4711");
    EXPECT_EQ(ELEMENT->host, "a.example, b");
}

TEST(Forwarded, UnknownParametersAreIgnored) {
    const auto ELEMENT = NForwarded::parseFirstElement("secret=abc;for=192.0.2.1;;");
    ASSERT_TRUE(ELEMENT.has_value());

    EXPECT_EQ(ELEMENT->forNode, "192.0.2.1");
}

TEST(Forwarded, MalformedIsNullopt) {
    for (const auto& s : {"", " ", "for=;;;", "for", "=1.2.3.4", "for=\"1.2.3.4", "for=1.1.1.1;for=2.2.2.2", "for=\"\"", "for=\"a\"b\"", ", for=1.2.3.4"}) {
        EXPECT_FALSE(NForwarded::parseFirstElement(s).has_value()) << s;
    }
}

TEST(Forwarded, NodeAddress) {
    EXPECT_EQ(NForwarded::nodeAddress("192.0.2.43"), "192.0.2.43");
    EXPECT_EQ(NForwarded::nodeAddress("192.0.2.43:47011"), "192.0.2.43");
    EXPECT_EQ(NForwarded::nodeAddress("[2001:db8:cafe::17]:4711"), "2001:db8:cafe::17");
    EXPECT_EQ(NForwarded::nodeAddress("\"[::1]\""), "::1");
    EXPECT_EQ(NForwarded::nodeAddress("2001:db8::1"), "2001:db8::1");
    EXPECT_EQ(NForwarded::nodeAddress("unknown"), "unknown");
    EXPECT_EQ(NForwarded::nodeAddress("_hidden"), "_hidden");
}

TEST(Forwarded, NonAsciiKeysAreSkipped) {
    const auto ELEMENT = NForwarded::parseFirstElement("\xC3\xA9=x;for=192.0.2.1;\xFF\x80=y");
    ASSERT_TRUE(ELEMENT.has_value());

    EXPECT_EQ(ELEMENT->forNode, "192.0.2.1");
    EXPECT_FALSE(ELEMENT->byNode.has_value());
}
