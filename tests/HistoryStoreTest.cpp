#include "cliptrail/HistoryStore.hpp"
#include "TestSupport.hpp"
#include <nlohmann/json.hpp>

using namespace cliptrail;
using cliptrail::test::ScratchDir;
using json = nlohmann::json;

namespace {

std::chrono::system_clock::time_point at(std::int64_t usecSinceEpoch) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(usecSinceEpoch)));
}

ClipboardEntry textEntry(const std::string& id, const std::string& text, std::int64_t usec) {
    return ClipboardEntry{id, at(usec), *ClipboardPayload::fromText(text)};
}

ClipboardEntry imageEntry(const std::string& id, const Bytes& bytes, std::int64_t usec) {
    return ClipboardEntry{id, at(usec), *ClipboardPayload::fromImageBytes(bytes)};
}

} // namespace

class HistoryStoreTest : public ::testing::Test {
protected:
    ScratchDir scratch;
    HistoryStore store{[this]() { return scratch.file("nested/dir/history.json"); }};
};

TEST(HistoryStoreTimestampTest, FormatsIso8601Utc) {
    // 2024-02-29T12:34:56.000789Z
    auto time = at(1709210096000789);
    EXPECT_EQ(HistoryStore::formatTimestamp(time), "2024-02-29T12:34:56.000789Z");
}

TEST(HistoryStoreTimestampTest, ParsesWhatItFormats) {
    auto time = at(1709210096123456);
    auto parsed = HistoryStore::parseTimestamp(HistoryStore::formatTimestamp(time));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, time);
}

TEST(HistoryStoreTimestampTest, MicrosecondsSurviveRoundTrip) {
    const std::int64_t base = 1760870130LL * 1000000;
    for (std::int64_t usec : {0, 1, 5, 499999, 500000, 500001, 123456, 999998, 999999,
                              250001, 749999, 333333, 666667}) {
        auto time = at(base + usec);
        std::string text = HistoryStore::formatTimestamp(time);
        auto parsed = HistoryStore::parseTimestamp(text);
        ASSERT_TRUE(parsed) << text;
        EXPECT_EQ(*parsed, time) << text;
    }

    // Pre-epoch values keep their microseconds too
    auto early = at(-1500001);
    auto parsed = HistoryStore::parseTimestamp(HistoryStore::formatTimestamp(early));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, early);
}

TEST(HistoryStoreTimestampTest, ParsesOffsetsAndRejectsGarbage) {
    auto parsed = HistoryStore::parseTimestamp("2024-02-29T14:34:56+02:00");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, at(1709210096000000));
    EXPECT_FALSE(HistoryStore::parseTimestamp("yesterday"));
}

TEST(HistoryStoreCodecTest, DocumentUsesTaggedContent) {
    std::vector<ClipboardEntry> entries = {
        textEntry("id-text", "hello", 1700000000000000),
        imageEntry("id-image", Bytes{'T', 'I', 'F', 'F'}, 1699999999000000),
    };

    json doc = json::parse(HistoryStore::serialize(entries));
    ASSERT_TRUE(doc.is_array());
    ASSERT_EQ(doc.size(), 2u);

    EXPECT_EQ(doc[0]["id"], "id-text");
    EXPECT_EQ(doc[0]["date"], "2023-11-14T22:13:20.000000Z");
    EXPECT_EQ(doc[0]["content"]["type"], "text");
    EXPECT_EQ(doc[0]["content"]["value"], "hello");

    EXPECT_EQ(doc[1]["content"]["type"], "image");
    EXPECT_EQ(doc[1]["content"]["bytes"], "VElGRg==");
}

TEST(HistoryStoreCodecTest, UnknownContentTypeIsSkipped) {
    const std::string document = R"([
        {"id": "a", "date": "2024-01-01T00:00:00Z", "content": {"type": "file", "path": "/x"}},
        {"id": "b", "date": "2024-01-01T00:00:01Z", "content": {"type": "text", "value": "kept"}}
    ])";

    auto entries = HistoryStore::deserialize(document);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].uuid, "b");
    EXPECT_EQ(entries[0].content.text(), "kept");
}

TEST(HistoryStoreCodecTest, EmptyPayloadIsSkipped) {
    const std::string document = R"([
        {"id": "a", "date": "2024-01-01T00:00:00Z", "content": {"type": "text", "value": ""}}
    ])";
    EXPECT_TRUE(HistoryStore::deserialize(document).empty());
}

TEST(HistoryStoreCodecTest, StructuralErrorsThrow) {
    EXPECT_ANY_THROW(HistoryStore::deserialize("{\"not\": \"an array\"}"));
    EXPECT_ANY_THROW(HistoryStore::deserialize("[{\"id\": \"a\"}]"));
    EXPECT_ANY_THROW(HistoryStore::deserialize(
        R"([{"id": 7, "date": "2024-01-01T00:00:00Z", "content": {"type": "text", "value": "x"}}])"));
    EXPECT_ANY_THROW(HistoryStore::deserialize(
        R"([{"id": "a", "date": "not a date", "content": {"type": "text", "value": "x"}}])"));
    EXPECT_ANY_THROW(HistoryStore::deserialize("[{"));
}

TEST_F(HistoryStoreTest, MissingFileLoadsEmptyWithoutError) {
    std::vector<ClipboardEntry> entries = {textEntry("stale", "x", 0)};
    std::string error;
    EXPECT_TRUE(store.load(entries, error));
    EXPECT_TRUE(entries.empty());
    EXPECT_TRUE(error.empty());
}

TEST_F(HistoryStoreTest, SaveCreatesDirectoryAndRoundTrips) {
    std::vector<ClipboardEntry> saved = {
        textEntry("3f6c1a52-0000-4000-8000-000000000002", "line one\nline two \xe2\x9c\x93", 1760870130654321),
        imageEntry("3f6c1a52-0000-4000-8000-000000000001", Bytes{0x00, 0xff, 0x10, 0x80, 0x00}, 1760870120000001),
    };

    std::string error;
    ASSERT_TRUE(store.save(saved, error)) << error;
    EXPECT_TRUE(std::filesystem::exists(store.path()));

    std::vector<ClipboardEntry> loaded;
    ASSERT_TRUE(store.load(loaded, error)) << error;
    EXPECT_EQ(loaded, saved);
}

TEST_F(HistoryStoreTest, SaveOverwritesInFull) {
    std::string error;
    ASSERT_TRUE(store.save({textEntry("a", "one", 1), textEntry("b", "two", 2)}, error));
    ASSERT_TRUE(store.save({textEntry("c", "three", 3)}, error));

    std::vector<ClipboardEntry> loaded;
    ASSERT_TRUE(store.load(loaded, error));
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].uuid, "c");
}

TEST_F(HistoryStoreTest, EmptyHistoryIsAnEmptyArray) {
    std::string error;
    ASSERT_TRUE(store.save({}, error));
    EXPECT_EQ(json::parse(scratch.read("nested/dir/history.json")), json::array());

    std::vector<ClipboardEntry> loaded;
    EXPECT_TRUE(store.load(loaded, error));
    EXPECT_TRUE(loaded.empty());
}

TEST_F(HistoryStoreTest, MalformedFileFailsSoft) {
    std::filesystem::create_directories(scratch.file("nested/dir"));
    scratch.write("nested/dir/history.json", "[{\"id\": \"a\", \"date\": ");

    std::vector<ClipboardEntry> loaded = {textEntry("stale", "x", 0)};
    std::string error;
    EXPECT_FALSE(store.load(loaded, error));
    EXPECT_TRUE(loaded.empty());
    EXPECT_NE(error.find("malformed"), std::string::npos);
}

TEST_F(HistoryStoreTest, ZeroLengthFileLoadsEmpty) {
    std::filesystem::create_directories(scratch.file("nested/dir"));
    scratch.write("nested/dir/history.json", "");

    std::vector<ClipboardEntry> loaded;
    std::string error;
    EXPECT_TRUE(store.load(loaded, error));
    EXPECT_TRUE(loaded.empty());
}

TEST_F(HistoryStoreTest, UnwritableLocationReportsError) {
    // A regular file where the directory should be
    scratch.write("nested", "not a directory");

    std::string error;
    EXPECT_FALSE(store.save({textEntry("a", "one", 1)}, error));
    EXPECT_FALSE(error.empty());
}
