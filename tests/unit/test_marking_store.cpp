#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "storage/json_file_store.hpp"
#include "storage/memory_store.hpp"

using namespace tracemark;
using namespace tracemark::storage;

namespace
{

Metadata meta(const std::string& column)
{
    return Metadata{{"column", std::string(column)}, {"source", std::string("plant.csv")}};
}

MarkingRecord rec(double start, double end, Label label = Label::Good)
{
    return MarkingRecord{start, end, label, std::nullopt};
}

}   // namespace

// ─── MemoryMarkingStore ──────────────────────────────────────────────────────

TEST(MemoryMarkingStore, UpsertReplacesByRange)
{
    MemoryMarkingStore store;
    ASSERT_TRUE(store.upsert(meta("a"), {rec(0, 1), rec(2, 3)}));
    ASSERT_TRUE(store.upsert(meta("a"), {rec(0, 1, Label::Zero)}));

    auto records = store.fetch(meta("a"));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].label, Label::Zero);
    EXPECT_EQ(records[1], rec(2, 3));
    EXPECT_EQ(store.entry_count(), 1u);
    EXPECT_EQ(store.marking_count(), 2u);
}

TEST(MemoryMarkingStore, EntriesKeyedByFullMetadata)
{
    MemoryMarkingStore store;
    store.upsert(meta("a"), {rec(0, 1)});
    store.upsert(meta("b"), {rec(0, 1)});
    EXPECT_EQ(store.entry_count(), 2u);
    EXPECT_TRUE(store.fetch(Metadata{{"column", std::string("a")}}).empty());
}

TEST(MemoryMarkingStore, RemoveByRangeIsIdempotent)
{
    MemoryMarkingStore store;
    store.upsert(meta("a"), {rec(0, 1), rec(2, 3), rec(4, 5)});

    ASSERT_TRUE(store.remove(meta("a"), {{2, 3}, {9, 9}}));
    ASSERT_TRUE(store.remove(meta("a"), {{2, 3}}));
    auto records = store.fetch(meta("a"));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_DOUBLE_EQ(records[0].start, 0.0);
    EXPECT_DOUBLE_EQ(records[1].start, 4.0);

    EXPECT_TRUE(store.remove(meta("unknown"), {{0, 1}}));
}

TEST(MemoryMarkingStore, TagsAreNotDuplicated)
{
    MemoryMarkingStore store;
    TaggedInterval     cleaned{0.0, 10.0, "cleaned"};
    ASSERT_TRUE(store.tag(meta("a"), cleaned));
    ASSERT_TRUE(store.tag(meta("a"), cleaned));
    ASSERT_EQ(store.tags(meta("a")).size(), 1u);
    EXPECT_EQ(store.tags(meta("a"))[0], cleaned);
    EXPECT_TRUE(store.fetch(meta("a")).empty());
}

TEST(MemoryMarkingStore, ReadOnlyRejectsChanges)
{
    MemoryMarkingStore store;
    store.upsert(meta("a"), {rec(0, 1)});
    store.set_read_only(true);

    EXPECT_FALSE(store.upsert(meta("a"), {rec(2, 3)}));
    EXPECT_FALSE(store.remove(meta("a"), {{0, 1}}));
    EXPECT_FALSE(store.tag(meta("a"), TaggedInterval{0, 1, "x"}));
    EXPECT_EQ(store.fetch(meta("a")).size(), 1u);

    store.set_read_only(false);
    EXPECT_TRUE(store.upsert(meta("a"), {rec(2, 3)}));
    EXPECT_EQ(store.marking_count(), 2u);
}

// ─── JsonFileMarkingStore ────────────────────────────────────────────────────

class JsonFileStoreTest : public ::testing::Test
{
   protected:
    std::filesystem::path dir;
    std::string           path;

    void SetUp() override
    {
        dir = std::filesystem::temp_directory_path() / "tracemark_test_marking_store";
        std::filesystem::remove_all(dir);
        path = (dir / "sub" / "markings.json").string();
    }

    void TearDown() override { std::filesystem::remove_all(dir); }

    void write(const std::string& text)
    {
        std::filesystem::create_directories(std::filesystem::path(path).parent_path());
        std::ofstream f(path);
        f << text;
    }
};

TEST_F(JsonFileStoreTest, MissingFileIsEmpty)
{
    JsonFileMarkingStore store(path);
    EXPECT_EQ(store.entry_count(), 0u);
    EXPECT_TRUE(store.error().empty());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(JsonFileStoreTest, ChangesPersistAcrossInstances)
{
    Metadata mixed{{"column", std::string("flow \"in\"")},
                   {"unit", int64_t{3}},
                   {"scale", 0.5},
                   {"is_total", false}};
    {
        JsonFileMarkingStore store(path);
        MarkingRecord        noted{1.5, 2.5, Label::LinearFill, std::string("pump off")};
        ASSERT_TRUE(store.upsert(mixed, {noted, rec(10, 20, Label::BFill)}));
        ASSERT_TRUE(store.tag(mixed, TaggedInterval{1.5, 20.0, "cleaned"}));
        ASSERT_TRUE(store.remove(mixed, {{10, 20}}));
    }
    ASSERT_TRUE(std::filesystem::exists(path));

    JsonFileMarkingStore reopened(path);
    EXPECT_TRUE(reopened.error().empty());
    auto records = reopened.fetch(mixed);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].label, Label::LinearFill);
    EXPECT_EQ(records[0].note, std::optional<std::string>("pump off"));
    EXPECT_DOUBLE_EQ(records[0].start, 1.5);

    auto tags = reopened.tags(mixed);
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].tag, "cleaned");
}

TEST_F(JsonFileStoreTest, ReloadPicksUpExternalEdits)
{
    JsonFileMarkingStore store(path);
    EXPECT_EQ(store.marking_count(), 0u);

    write(R"({"version": 1, "entries": [
        {"metadata": {"column": "a"},
         "markings": [{"start": 0, "end": 5, "label": "zero", "note": null}],
         "tags": []}]})");
    ASSERT_TRUE(store.reload());
    auto records = store.fetch(Metadata{{"column", std::string("a")}});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].label, Label::Zero);
    EXPECT_FALSE(records[0].note.has_value());
}

TEST_F(JsonFileStoreTest, MalformedFileSetsError)
{
    write(R"({"version": 1, "entries": [{"metadata": {"column": "a"},
        "markings": [{"start": 0, "end": 5, "label": "sparkly"}]}]})");
    JsonFileMarkingStore store(path);
    EXPECT_FALSE(store.error().empty());
    EXPECT_EQ(store.entry_count(), 0u);
}

TEST_F(JsonFileStoreTest, UnreadableFileIsNeverOverwritten)
{
    const std::string original = R"({"version": 1, "entries": [
        {"metadata": {"column": "old"},
         "markings": [{"start": 0, "end": 5, "label": "good"},
                      {"start": 6, "end": 9, "label": "future-label"}],
         "tags": []}]})";
    write(original);

    JsonFileMarkingStore store(path);
    ASSERT_FALSE(store.error().empty());
    EXPECT_FALSE(store.writable());

    Metadata fresh{{"column", std::string("new")}};
    EXPECT_FALSE(store.upsert(fresh, {rec(0, 1)}));
    EXPECT_FALSE(store.tag(fresh, TaggedInterval{0, 1, "cleaned"}));
    EXPECT_EQ(store.entry_count(), 0u);

    std::ifstream      f(path);
    std::ostringstream on_disk;
    on_disk << f.rdbuf();
    EXPECT_EQ(on_disk.str(), original);

    // Once the file is repaired, a reload makes the store writable again.
    write(R"({"version": 1, "entries": []})");
    ASSERT_TRUE(store.reload());
    EXPECT_TRUE(store.writable());
    EXPECT_TRUE(store.upsert(fresh, {rec(0, 1)}));
    EXPECT_EQ(store.fetch(fresh).size(), 1u);
}

TEST(JsonFileStoreFormat, RejectsNewerVersions)
{
    std::map<std::string, MemoryMarkingStore::Entry> entries;
    std::string                                      error;
    EXPECT_FALSE(
        JsonFileMarkingStore::deserialize(R"({"version": 2, "entries": []})", entries, error));
    EXPECT_EQ(error, "unsupported version");
    EXPECT_FALSE(JsonFileMarkingStore::deserialize("[]", entries, error));
    EXPECT_FALSE(JsonFileMarkingStore::deserialize(R"({"version": 1})", entries, error));
}

TEST(JsonFileStoreFormat, SerializedEmptyStoreReadsBack)
{
    std::map<std::string, MemoryMarkingStore::Entry> entries;
    std::string                                      error;
    std::string text = JsonFileMarkingStore::serialize(entries);
    EXPECT_TRUE(JsonFileMarkingStore::deserialize(text, entries, error)) << error;
    EXPECT_TRUE(entries.empty());
}
