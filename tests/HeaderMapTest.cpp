#include <gtest/gtest.h>

#include "core/HeaderMap.hpp"
#include "helpers/StringUtils.hpp"

TEST(HeaderMap, CaseInsensitiveLookup) {
    CHeaderMap headers;
    headers.add("X-Forwarded-For", "1.2.3.4");

    EXPECT_TRUE(headers.has("x-forwarded-for"));
    EXPECT_TRUE(headers.has("X-FORWARDED-FOR"));
    EXPECT_EQ(headers.get("x-forwarded-for"), "1.2.3.4");
    EXPECT_FALSE(headers.get("x-real-ip").has_value());
}

TEST(HeaderMap, RemoveTakesEveryDuplicate) {
    CHeaderMap headers;
    headers.add("Forwarded", "for=1.1.1.1");
    headers.add("Host", "example.com");
    headers.add("forwarded", "for=2.2.2.2");

    EXPECT_EQ(headers.remove("FORWARDED"), 2u);
    EXPECT_EQ(headers.remove("forwarded"), 0u);
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.list().front().name, "Host");
}

TEST(HeaderMap, SetReplaces) {
    CHeaderMap headers;
    headers.add("X-Real-IP", "1.1.1.1");
    headers.add("x-real-ip", "2.2.2.2");
    headers.set("X-Real-IP", "3.3.3.3");

    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.get("x-real-ip"), "3.3.3.3");
}

TEST(HeaderMap, FirstOfFollowsListOrder) {
    CHeaderMap headers;
    headers.add("X-Forwarded-For", "1.1.1.1");
    headers.add("X-Real-IP", "2.2.2.2");

    const auto MATCH = headers.firstOf({"x-real-ip", "x-forwarded-for"});
    ASSERT_TRUE(MATCH.has_value());
    EXPECT_EQ(MATCH->name, "x-real-ip");
    EXPECT_EQ(MATCH->value, "2.2.2.2");

    EXPECT_FALSE(headers.firstOf({}).has_value());
    EXPECT_FALSE(headers.firstOf({"cf-connecting-ip"}).has_value());
}

TEST(HeaderMap, FirstOfSkipsEmptyValues) {
    CHeaderMap headers;
    headers.add("X-Real-IP", "  ");
    headers.add("X-Forwarded-For", "1.1.1.1");

    const auto MATCH = headers.firstOf({"x-real-ip", "x-forwarded-for"});
    ASSERT_TRUE(MATCH.has_value());
    EXPECT_EQ(MATCH->name, "x-forwarded-for");
}

TEST(HeaderMap, KeepsInsertionOrder) {
    CHeaderMap headers;
    headers.add("B", "1");
    headers.add("A", "2");
    headers.add("C", "3");

    ASSERT_EQ(headers.size(), 3u);
    EXPECT_EQ(headers.list()[0].name, "B");
    EXPECT_EQ(headers.list()[1].name, "A");
    EXPECT_EQ(headers.list()[2].name, "C");
}

TEST(HeaderMap, HighBytesInNamesDoNotMatchAscii) {
    CHeaderMap headers;
    headers.add("X-R\xC3\xA9" "al-IP", "1.1.1.1");

    EXPECT_FALSE(headers.has("x-real-ip"));
    EXPECT_TRUE(headers.has("x-r\xC3\xA9" "al-ip"));
    EXPECT_EQ(NStringUtils::toLower("\xC3\x89\xFF" "AB"), "\xC3\x89\xFF" "ab");
}
