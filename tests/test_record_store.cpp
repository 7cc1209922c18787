// ============================================================================
// Strongbox - RecordStore Unit Tests
// ============================================================================

#include <gtest/gtest.h>
#include "strongbox/envelope.hpp"
#include "strongbox/key_store.hpp"
#include "strongbox/record_store.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

namespace strongbox::tests {

class RecordStoreTest : public TempDirTest {
protected:
    std::filesystem::path data_path;

    void SetUp() override {
        TempDirTest::SetUp();
        data_path = temp_dir / "secrets.json";
    }
};

// ============================================================================
// In-Memory Operations
// ============================================================================

TEST_F(RecordStoreTest, AddThenGet) {
    RecordStore store(data_path);
    ASSERT_TRUE(store.add("github", "cmVjb3Jk").has_value());

    auto record = store.get("github");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(*record, "cmVjb3Jk");
    EXPECT_TRUE(store.contains("github"));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(RecordStoreTest, AddReplacesExistingRecord) {
    RecordStore store(data_path);
    ASSERT_TRUE(store.add("github", "first").has_value());
    ASSERT_TRUE(store.add("github", "second").has_value());

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get("github").value_or(""), "second");
}

TEST_F(RecordStoreTest, AddRejectsEmptyServiceName) {
    RecordStore store(data_path);

    auto result = store.add("", "record");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::InvalidServiceName);
    EXPECT_TRUE(store.empty());
}

TEST_F(RecordStoreTest, GetMissingServiceIsNotFound) {
    RecordStore store(data_path);

    auto record = store.get("nothing");
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error(), ErrorCode::ServiceNotFound);
}

TEST_F(RecordStoreTest, RemoveThenGetIsNotFound) {
    RecordStore store(data_path);
    ASSERT_TRUE(store.add("github", "record").has_value());

    EXPECT_TRUE(store.remove("github"));

    auto record = store.get("github");
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error(), ErrorCode::ServiceNotFound);
}

TEST_F(RecordStoreTest, RemoveAbsentIsNoOp) {
    RecordStore store(data_path);
    ASSERT_TRUE(store.add("github", "record").has_value());

    EXPECT_FALSE(store.remove("gitlab"));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(RecordStoreTest, ListIsSorted) {
    RecordStore store(data_path);
    ASSERT_TRUE(store.add("zulip", "a").has_value());
    ASSERT_TRUE(store.add("aws", "b").has_value());
    ASSERT_TRUE(store.add("github", "c").has_value());

    std::vector<std::string> expected = {"aws", "github", "zulip"};
    EXPECT_EQ(store.list(), expected);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(RecordStoreTest, MissingFileLoadsEmpty) {
    RecordStore store(data_path);

    ASSERT_TRUE(store.load().has_value());
    EXPECT_TRUE(store.empty());
    EXPECT_FALSE(std::filesystem::exists(data_path)) << "Loading must not create the file";
}

TEST_F(RecordStoreTest, EmptyStoreRoundTrip) {
    RecordStore store(data_path);
    ASSERT_TRUE(store.save().has_value());

    // The field is present as an empty object, not omitted
    auto document = nlohmann::json::parse(read_text(data_path));
    ASSERT_TRUE(document.contains("passwords"));
    EXPECT_TRUE(document["passwords"].is_object());
    EXPECT_TRUE(document["passwords"].empty());

    RecordStore reloaded(data_path);
    ASSERT_TRUE(reloaded.load().has_value());
    EXPECT_TRUE(reloaded.empty());
}

TEST_F(RecordStoreTest, SaveThenLoadPreservesEntries) {
    RecordStore store(data_path);
    ASSERT_TRUE(store.add("github", "Z2l0aHVi").has_value());
    ASSERT_TRUE(store.add("mail", "bWFpbA==").has_value());
    ASSERT_TRUE(store.save().has_value());

    RecordStore reloaded(data_path);
    ASSERT_TRUE(reloaded.load().has_value());
    EXPECT_EQ(reloaded.entries(), store.entries());
}

TEST_F(RecordStoreTest, DocumentLayout) {
    RecordStore store(data_path);
    ASSERT_TRUE(store.add("github", "Z2l0aHVi").has_value());
    ASSERT_TRUE(store.save().has_value());

    auto document = nlohmann::json::parse(read_text(data_path));
    ASSERT_TRUE(document.is_object());
    EXPECT_EQ(document.size(), 1u);
    EXPECT_EQ(document["passwords"]["github"].get<std::string>(), "Z2l0aHVi");
}

TEST_F(RecordStoreTest, LoadReplacesInMemoryEntries) {
    RecordStore writer(data_path);
    ASSERT_TRUE(writer.add("github", "a").has_value());
    ASSERT_TRUE(writer.save().has_value());

    RecordStore reader(data_path);
    ASSERT_TRUE(reader.add("stale", "b").has_value());
    ASSERT_TRUE(reader.load().has_value());

    EXPECT_FALSE(reader.contains("stale"));
    EXPECT_TRUE(reader.contains("github"));
}

TEST_F(RecordStoreTest, SealedRecordSurvivesPersistence) {
    auto key = KeyStore::generate_key();
    ASSERT_TRUE(key.has_value());

    auto record = EnvelopeCodec::seal_text("p@ss1", key->span());
    ASSERT_TRUE(record.has_value());

    RecordStore store(data_path);
    ASSERT_TRUE(store.add("github", *record).has_value());
    ASSERT_TRUE(store.save().has_value());

    RecordStore reloaded(data_path);
    ASSERT_TRUE(reloaded.load().has_value());
    auto stored = reloaded.get("github");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, *record);

    auto plaintext = EnvelopeCodec::open_text(*stored, key->span());
    ASSERT_TRUE(plaintext.has_value());
    EXPECT_EQ(*plaintext, "p@ss1");
}

// ============================================================================
// Corruption
// ============================================================================

TEST_F(RecordStoreTest, InvalidJsonIsCorrupt) {
    write_text(data_path, "{ this is not json");
    RecordStore store(data_path);

    auto result = store.load();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::CorruptDataFile);
    EXPECT_EQ(classify(result.error()), ErrorClass::Format);
}

TEST_F(RecordStoreTest, EmptyFileIsCorrupt) {
    write_text(data_path, "");
    RecordStore store(data_path);

    auto result = store.load();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::CorruptDataFile);
}

TEST_F(RecordStoreTest, MissingFieldIsCorrupt) {
    write_text(data_path, R"({"other": {}})");
    RecordStore store(data_path);

    auto result = store.load();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::CorruptDataFile);
}

TEST_F(RecordStoreTest, NonStringRecordIsCorrupt) {
    write_text(data_path, R"({"passwords": {"github": 42}})");
    RecordStore store(data_path);

    auto result = store.load();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::CorruptDataFile);
}

TEST_F(RecordStoreTest, TopLevelArrayIsCorrupt) {
    write_text(data_path, R"([1, 2, 3])");
    RecordStore store(data_path);

    auto result = store.load();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::CorruptDataFile);
}

TEST_F(RecordStoreTest, CorruptLoadKeepsFileUntouched) {
    const std::string garbage = "not json at all";
    write_text(data_path, garbage);

    RecordStore store(data_path);
    ASSERT_FALSE(store.load().has_value());
    EXPECT_EQ(read_text(data_path), garbage);
}

TEST_F(RecordStoreTest, InvalidUtf8ServiceNameCannotBeSaved) {
    RecordStore store(data_path);
    ASSERT_TRUE(store.add("bad\xff", "record").has_value());

    auto result = store.save();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::InvalidServiceName);
    EXPECT_FALSE(std::filesystem::exists(data_path));
}

TEST_F(RecordStoreTest, SaveIntoMissingDirectoryFails) {
    RecordStore store(temp_dir / "missing" / "secrets.json");
    ASSERT_TRUE(store.add("github", "record").has_value());

    auto result = store.save();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::FileWriteError);
}

} // namespace strongbox::tests
