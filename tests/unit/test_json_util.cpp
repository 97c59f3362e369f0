#include <gtest/gtest.h>
#include <limits>
#include <string>

#include "io/json_util.hpp"

using namespace tracemark;

// ─── Objects and arrays ──────────────────────────────────────────────────────

TEST(JsonUtil, ObjectMembersKeepRawValues)
{
    auto members = json::object_members(
        R"({"a": 1, "b": "x,y", "c": {"d": [1, 2]}, "e": [3, {"f": 4}], "g": null})");
    ASSERT_EQ(members.size(), 5u);
    EXPECT_EQ(members[0].key, "a");
    EXPECT_EQ(members[0].raw, "1");
    EXPECT_EQ(members[1].raw, "\"x,y\"");
    EXPECT_EQ(members[2].raw, R"({"d": [1, 2]})");
    EXPECT_EQ(members[3].raw, R"([3, {"f": 4}])");
    EXPECT_TRUE(json::is_null(members[4].raw));
}

TEST(JsonUtil, NotAnObject)
{
    EXPECT_TRUE(json::object_members("[1, 2]").empty());
    EXPECT_TRUE(json::object_members("").empty());
    EXPECT_TRUE(json::object_members("{}").empty());
}

TEST(JsonUtil, ArrayElements)
{
    auto elements = json::array_elements(R"([ "a", 2.5, {"k": [1]}, [] ])");
    ASSERT_EQ(elements.size(), 4u);
    EXPECT_EQ(elements[0], "\"a\"");
    EXPECT_EQ(elements[1], "2.5");
    EXPECT_EQ(elements[2], R"({"k": [1]})");
    EXPECT_EQ(elements[3], "[]");
    EXPECT_TRUE(json::array_elements("[]").empty());
}

TEST(JsonUtil, EscapedQuotesInStrings)
{
    auto members = json::object_members(R"({"note": "say \"hi\", ok", "n": 1})");
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(json::as_string(members[0].raw), "say \"hi\", ok");
}

// ─── Scalars ─────────────────────────────────────────────────────────────────

TEST(JsonUtil, EscapeRoundTrip)
{
    std::string text = "line\n\t\"quoted\" \\ end";
    EXPECT_EQ(json::as_string("\"" + json::escape(text) + "\""), text);
}

TEST(JsonUtil, Numbers)
{
    EXPECT_EQ(json::as_number(" 12.5 "), 12.5);
    EXPECT_EQ(json::as_number("-3e2"), -300.0);
    EXPECT_FALSE(json::as_number("12abc").has_value());
    EXPECT_FALSE(json::as_number("\"12\"").has_value());
    EXPECT_TRUE(json::is_integer("42"));
    EXPECT_FALSE(json::is_integer("42.0"));
    EXPECT_FALSE(json::is_integer("1e3"));
}

TEST(JsonUtil, Bools)
{
    EXPECT_EQ(json::as_bool("true"), true);
    EXPECT_EQ(json::as_bool(" false "), false);
    EXPECT_FALSE(json::as_bool("1").has_value());
}

TEST(JsonUtil, FormatDoubleRoundTrips)
{
    EXPECT_EQ(json::format_double(20.0), "20.0");
    EXPECT_EQ(json::format_double(0.1), "0.1");
    EXPECT_EQ(json::format_double(1.7e9), "1700000000.0");
    double tricky = 1704067200.123456;
    EXPECT_EQ(json::as_number(json::format_double(tricky)), tricky);
}

TEST(JsonUtil, NonFiniteIsNull)
{
    EXPECT_EQ(json::format_double(std::numeric_limits<double>::infinity()), "null");
}

TEST(JsonUtil, ReadersFallBack)
{
    auto members = json::object_members(R"({"s": "v", "n": 2, "b": true, "wrong": "x"})");
    EXPECT_EQ(json::read_string(members, "s"), "v");
    EXPECT_EQ(json::read_string(members, "missing", "def"), "def");
    EXPECT_EQ(json::read_number(members, "n", 0.0), 2.0);
    EXPECT_EQ(json::read_number(members, "wrong", 7.0), 7.0);
    EXPECT_TRUE(json::read_bool(members, "b", false));
    EXPECT_FALSE(json::read_bool(members, "n", false));
}
