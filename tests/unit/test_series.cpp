#include <chrono>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

#include <tracemark/label.hpp>
#include <tracemark/metadata.hpp>
#include <tracemark/series.hpp>

using namespace tracemark;

// ─── Construction ────────────────────────────────────────────────────────────

TEST(Series, FromValuesUsesPositionalIndex)
{
    auto s = Series::from_values({5.0, 6.0, 7.0}, "abc");
    ASSERT_TRUE(s.valid());
    EXPECT_EQ(s.size(), 3u);
    EXPECT_EQ(s.index_kind(), IndexKind::Number);
    EXPECT_DOUBLE_EQ(s.first_index(), 0.0);
    EXPECT_DOUBLE_EQ(s.last_index(), 2.0);
    ASSERT_TRUE(s.name().has_value());
    EXPECT_EQ(*s.name(), "abc");
}

TEST(Series, EmptyNameIsNoName)
{
    auto s = Series::from_values({1.0});
    EXPECT_FALSE(s.name().has_value());
}

TEST(Series, FromTimePointsGivesEpochSeconds)
{
    using namespace std::chrono;
    std::vector<Series::TimePoint> index = {system_clock::time_point(seconds(100)),
                                            system_clock::time_point(seconds(160))};
    auto s = Series::from_time_points(index, {1.0, 2.0});
    ASSERT_TRUE(s.valid());
    EXPECT_EQ(s.index_kind(), IndexKind::Time);
    EXPECT_DOUBLE_EQ(s.first_index(), 100.0);
    EXPECT_DOUBLE_EQ(s.last_index(), 160.0);
}

TEST(Series, LengthMismatchIsInvalid)
{
    Series s({0.0, 1.0}, {1.0});
    EXPECT_FALSE(s.valid());
    EXPECT_FALSE(s.error().empty());
}

TEST(Series, NonIncreasingIndexIsInvalid)
{
    Series dup({0.0, 1.0, 1.0}, {1.0, 2.0, 3.0});
    EXPECT_FALSE(dup.valid());

    Series back({0.0, 2.0, 1.0}, {1.0, 2.0, 3.0});
    EXPECT_FALSE(back.valid());
}

TEST(Series, NonFiniteIndexIsInvalid)
{
    Series s({0.0, std::numeric_limits<double>::quiet_NaN()}, {1.0, 2.0});
    EXPECT_FALSE(s.valid());
}

TEST(Series, NaNValuesAreAllowed)
{
    Series s({0.0, 1.0}, {std::nan(""), 2.0});
    EXPECT_TRUE(s.valid());
}

TEST(Series, EmptySeriesIsValidButEmpty)
{
    Series s;
    EXPECT_TRUE(s.valid());
    EXPECT_TRUE(s.empty());
}

// ─── Slicing ─────────────────────────────────────────────────────────────────

TEST(Series, SliceBoundsIsInclusiveOnBothEnds)
{
    Series s({0.0, 1.0, 2.0, 3.0, 4.0}, {0.0, 1.0, 2.0, 3.0, 4.0});
    auto [first, last] = s.slice_bounds(1.0, 3.0);
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(last, 4u);
}

TEST(Series, SliceBoundsBetweenSamples)
{
    Series s({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 2.0, 3.0});
    auto [first, last] = s.slice_bounds(0.5, 2.5);
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(last, 3u);
}

TEST(Series, SliceBoundsSwapsReversedInterval)
{
    Series s({0.0, 1.0, 2.0}, {0.0, 1.0, 2.0});
    auto [first, last] = s.slice_bounds(2.0, 1.0);
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(last, 3u);
}

TEST(Series, SliceBoundsOutsideDataIsEmpty)
{
    Series s({0.0, 1.0, 2.0}, {0.0, 1.0, 2.0});
    auto [first, last] = s.slice_bounds(10.0, 20.0);
    EXPECT_EQ(first, last);
}

TEST(Series, ValueRangeSkipsNaN)
{
    Series s({0.0, 1.0, 2.0, 3.0}, {std::nan(""), -2.0, 5.0, std::nan("")});
    auto   range = s.value_range();
    ASSERT_TRUE(range.has_value());
    EXPECT_DOUBLE_EQ(range->first, -2.0);
    EXPECT_DOUBLE_EQ(range->second, 5.0);
}

TEST(Series, ValueRangeAllNaNIsEmpty)
{
    Series s({0.0, 1.0}, {std::nan(""), std::nan("")});
    EXPECT_FALSE(s.value_range().has_value());
    EXPECT_FALSE(s.value_range(0, 0).has_value());
}

// ─── Labels ──────────────────────────────────────────────────────────────────

TEST(Label, ParseKnownIds)
{
    EXPECT_EQ(parse_label("bfill"), Label::BFill);
    EXPECT_EQ(parse_label("linear-fill"), Label::LinearFill);
    EXPECT_EQ(parse_label("good"), Label::Good);
}

TEST(Label, ParseUnknownId)
{
    EXPECT_FALSE(parse_label("Good").has_value());
    EXPECT_FALSE(parse_label("").has_value());
    EXPECT_FALSE(parse_label("linear_fill").has_value());
}

TEST(Label, IdRoundTripsForEveryLabel)
{
    for (const auto& info : label_table)
    {
        EXPECT_EQ(parse_label(label_id(info.label)), info.label);
        EXPECT_EQ(label_color(info.label), info.color);
    }
}

TEST(Label, ShortcutsAreDistinct)
{
    for (size_t i = 0; i < label_table.size(); ++i)
        for (size_t j = i + 1; j < label_table.size(); ++j)
            EXPECT_NE(label_table[i].shortcut, label_table[j].shortcut);
}

TEST(Color, PacksAsAbgr)
{
    EXPECT_EQ(Color(1.0f, 0.0f, 0.0f, 1.0f).to_abgr(), 0xFF0000FFu);
    EXPECT_EQ(Color(0.0f, 0.0f, 1.0f, 0.0f).to_abgr(), 0x00FF0000u);
}

// ─── Metadata ────────────────────────────────────────────────────────────────

TEST(Metadata, PartialMatch)
{
    Metadata full    = {{"site", std::string("a")}, {"unit", int64_t(3)}};
    Metadata partial = {{"site", std::string("a")}};
    EXPECT_TRUE(metadata_matches(partial, full));
    EXPECT_TRUE(metadata_matches({}, full));

    Metadata other = {{"site", std::string("b")}};
    EXPECT_FALSE(metadata_matches(other, full));

    Metadata missing = {{"sensor", std::string("a")}};
    EXPECT_FALSE(metadata_matches(missing, full));
}

TEST(Metadata, ValueTypesMustAgree)
{
    Metadata full    = {{"unit", int64_t(3)}};
    Metadata partial = {{"unit", 3.0}};
    EXPECT_FALSE(metadata_matches(partial, full));
}

TEST(Metadata, IsTotal)
{
    EXPECT_TRUE(metadata_is_total({{"is_total", true}}));
    EXPECT_FALSE(metadata_is_total({{"is_total", false}}));
    EXPECT_FALSE(metadata_is_total({{"is_total", std::string("true")}}));
    EXPECT_FALSE(metadata_is_total({}));
}

TEST(Metadata, CanonicalString)
{
    Metadata m = {{"b", int64_t(2)}, {"a", std::string("x")}, {"c", true}};
    EXPECT_EQ(metadata_to_string(m), "{a='x', b=2, c=true}");
    EXPECT_EQ(metadata_to_string({}), "{}");
}

TEST(Metadata, CanonicalStringKeepsValuesApart)
{
    Metadata a = {{"id", 1700000000.25}};
    Metadata b = {{"id", 1700000000.75}};
    EXPECT_EQ(metadata_to_string(a), "{id=1700000000.25}");
    EXPECT_NE(metadata_to_string(a), metadata_to_string(b));

    EXPECT_EQ(metadata_to_string({{"n", int64_t(1)}}), "{n=1}");
    EXPECT_EQ(metadata_to_string({{"n", 1.0}}), "{n=1.0}");
    EXPECT_EQ(metadata_to_string({{"n", 0.1}}), "{n=0.1}");

    // A quote inside a string cannot fake a second key.
    Metadata tricky = {{"a", std::string("x', b='y")}};
    Metadata split  = {{"a", std::string("x")}, {"b", std::string("y")}};
    EXPECT_EQ(metadata_to_string(tricky), "{a='x\\', b=\\'y'}");
    EXPECT_NE(metadata_to_string(tricky), metadata_to_string(split));
}
