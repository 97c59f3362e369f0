#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#include "data/csv_loader.hpp"
#include <tracemark/session_model.hpp>

using namespace tracemark;

// ─── Parsing ─────────────────────────────────────────────────────────────────

TEST(CsvParse, HeaderAndColumns)
{
    auto data = parse_csv_text("a,b\n1,2\n3,4\n");
    ASSERT_TRUE(data.error.empty());
    EXPECT_EQ(data.num_rows, 2u);
    EXPECT_EQ(data.num_cols, 2u);
    ASSERT_EQ(data.headers.size(), 2u);
    EXPECT_EQ(data.headers[1], "b");
    EXPECT_DOUBLE_EQ(data.columns[1][1], 4.0);
    EXPECT_FALSE(data.time_index);
}

TEST(CsvParse, NoHeaderGetsGeneratedNames)
{
    auto data = parse_csv_text("1;2\n3;4\n");
    EXPECT_EQ(data.num_rows, 2u);
    EXPECT_EQ(data.headers[0], "Column 1");
    EXPECT_DOUBLE_EQ(data.columns[1][0], 2.0);
}

TEST(CsvParse, TabDelimiterAndBlankLines)
{
    auto data = parse_csv_text("x\ty\r\n\r\n1\t5\r\n2\t6\r\n");
    EXPECT_EQ(data.num_rows, 2u);
    EXPECT_DOUBLE_EQ(data.columns[1][1], 6.0);
}

TEST(CsvParse, UnparsableCellsAreNaN)
{
    auto data = parse_csv_text("a,b\n1,oops\n2\n");
    ASSERT_EQ(data.num_rows, 2u);
    EXPECT_TRUE(std::isnan(data.columns[1][0]));
    EXPECT_TRUE(std::isnan(data.columns[1][1]));
}

TEST(CsvParse, EmptyTextIsAnError)
{
    auto data = parse_csv_text("  \n\n");
    EXPECT_FALSE(data.error.empty());
}

TEST(CsvParse, TimestampFirstColumn)
{
    auto data = parse_csv_text("time,v\n2024-01-01T00:00:00Z,1\n2024-01-01T00:01:00Z,2\n");
    ASSERT_TRUE(data.time_index);
    EXPECT_DOUBLE_EQ(data.columns[0][0], 1704067200.0);
    EXPECT_DOUBLE_EQ(data.columns[0][1], 1704067260.0);
}

TEST(CsvParse, MissingFile)
{
    auto data = parse_csv("/nonexistent/tracemark/file.csv");
    EXPECT_FALSE(data.error.empty());
}

// ─── Timestamps ──────────────────────────────────────────────────────────────

TEST(ParseTimestamp, Formats)
{
    EXPECT_EQ(parse_timestamp("1970-01-02"), 86400.0);
    EXPECT_EQ(parse_timestamp("1970-01-01 00:01:00"), 60.0);
    EXPECT_EQ(parse_timestamp("1970-01-01T00:00:01.5Z"), 1.5);
}

TEST(ParseTimestamp, Rejects)
{
    EXPECT_FALSE(parse_timestamp("12.5").has_value());
    EXPECT_FALSE(parse_timestamp("2024-13-01").has_value());
    EXPECT_FALSE(parse_timestamp("2024-01-01X00:00:00").has_value());
    EXPECT_FALSE(parse_timestamp("2024-01-01T00:00:00+02").has_value());
}

// ─── Conversion ──────────────────────────────────────────────────────────────

TEST(CsvToSource, IndexColumnIsUsed)
{
    auto data    = parse_csv_text("x,a,b\n10,1,2\n20,3,4\n");
    auto entries = csv_to_source(data, "mem").flatten();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "a");
    EXPECT_DOUBLE_EQ(entries[0].series.first_index(), 10.0);
    EXPECT_EQ(entries[1].series.index_kind(), IndexKind::Number);
    EXPECT_EQ(metadata_to_string(entries[1].metadata), "{column='b', source='mem'}");
}

TEST(CsvToSource, PlainColumnsArePositional)
{
    auto data    = parse_csv_text("a,b\n10,1\n20,3\n");
    auto entries = csv_to_source(data, "mem").flatten();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_DOUBLE_EQ(entries[0].series.first_index(), 0.0);
    EXPECT_DOUBLE_EQ(entries[0].series.values()[1], 20.0);
}

TEST(CsvToSource, TimeIndex)
{
    auto data    = parse_csv_text("2024-01-01 00:00:00,1\n2024-01-01 00:00:10,2\n");
    auto entries = csv_to_source(data, "mem").flatten();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].series.index_kind(), IndexKind::Time);
    EXPECT_DOUBLE_EQ(entries[0].series.last_index() - entries[0].series.first_index(), 10.0);
}

TEST(CsvToSource, ErrorGivesNoEntries)
{
    CsvData data;
    data.error = "broken";
    EXPECT_TRUE(csv_to_source(data, "mem").flatten().empty());
}

// ─── Files and directories ───────────────────────────────────────────────────

class CsvFilesTest : public ::testing::Test
{
   protected:
    std::filesystem::path dir;

    void SetUp() override
    {
        dir = std::filesystem::temp_directory_path() / "tracemark_test_csv_loader";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override { std::filesystem::remove_all(dir); }

    std::string write(const std::string& name, const std::string& text)
    {
        auto          path = dir / name;
        std::ofstream f(path);
        f << text;
        return path.string();
    }
};

TEST_F(CsvFilesTest, ListsOnlyTableFilesSorted)
{
    write("b.csv", "1\n");
    write("a.TSV", "1\n");
    write("notes.md", "hello\n");
    std::filesystem::create_directories(dir / "sub.csv");

    auto files = list_csv_files(dir.string());
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(std::filesystem::path(files[0]).filename().string(), "a.TSV");
    EXPECT_EQ(std::filesystem::path(files[1]).filename().string(), "b.csv");
}

TEST_F(CsvFilesTest, LoadSeriesUsesPathAsSource)
{
    std::string path    = write("one.csv", "v\n1\n2\n3\n");
    auto        entries = load_csv_series(path).flatten();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(metadata_to_string(entries[0].metadata), "{column='v', source='" + path + "'}");
}

TEST_F(CsvFilesTest, LoadPathsExpandsDirectories)
{
    write("a.csv", "p,q\n1,2\n3,4\n");
    write("b.csv", "r\n5\n6\n");
    std::string single = write("c.txt", "s\n7\n");

    SessionModel model;
    EXPECT_EQ(load_csv_paths(model, {dir.string()}), 4u);
    EXPECT_EQ(model.item_count(), 4u);
    EXPECT_NE(model.find_item("q"), nullptr);

    EXPECT_EQ(load_csv_paths(model, {single, (dir / "missing.csv").string()}), 1u);
    EXPECT_EQ(model.item_count(), 5u);
}

TEST_F(CsvFilesTest, EmptyDirectoryLoadsNothing)
{
    SessionModel model;
    EXPECT_EQ(load_csv_paths(model, {dir.string()}), 0u);
}
