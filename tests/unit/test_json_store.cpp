// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - JSON Record Store Unit Tests                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "internal/store/json_store.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace chartdb;

namespace notes {

// Minimal record type; the store only needs the JSON mapping and apply_patch.
struct Note {
    std::string id;
    std::string title;
    int priority = 0;

    bool operator==(const Note&) const = default;
};

struct NotePatch {
    std::optional<std::string> title;
    std::optional<int> priority;
};

void to_json(nlohmann::json& j, const Note& note) {
    j = nlohmann::json{{"id", note.id}, {"title", note.title}, {"priority", note.priority}};
}

void from_json(const nlohmann::json& j, Note& note) {
    j.at("id").get_to(note.id);
    j.at("title").get_to(note.title);
    note.priority = j.value("priority", 0);
}

void apply_patch(Note& note, const NotePatch& patch) {
    if (patch.title) note.title = *patch.title;
    if (patch.priority) note.priority = *patch.priority;
}

} // namespace notes

using notes::Note;
using notes::NotePatch;
using NoteStore = store::JsonStore<Note, NotePatch>;

class JsonStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "chartdb_store_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        StoreConfig config;
        config.document_path = test_dir_ / "notes.json";
        store_ = NoteStore(config);
        ASSERT_TRUE(store_.initialize().has_value());
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    void seed(std::vector<Note> notes) {
        ASSERT_TRUE(store_.bulk_create(std::move(notes)).has_value());
    }

    std::string document_text() const {
        std::ifstream file(store_.path());
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    void write_raw(const std::string& text) const {
        std::ofstream file(store_.path(), std::ios::trunc);
        file << text;
    }

    static NoteStore::Predicate by_id(std::string id) {
        return [id = std::move(id)](const Note& n) { return n.id == id; };
    }

    static NoteStore::Predicate by_title(std::string title) {
        return [title = std::move(title)](const Note& n) { return n.title == title; };
    }

    std::filesystem::path test_dir_;
    NoteStore store_;
};

// ==============================================================================
// Initialization
// ==============================================================================

TEST_F(JsonStoreTest, InitializeCreatesEmptyArray) {
    auto records = store_.select();
    ASSERT_TRUE(records.has_value());
    EXPECT_TRUE(records->empty());
    EXPECT_EQ(nlohmann::json::parse(document_text()), nlohmann::json::array());
}

TEST_F(JsonStoreTest, InitializeLeavesExistingDocumentAlone) {
    seed({{"1", "Sales", 1}});

    auto created = store_.initialize({{"9", "Other", 0}});
    ASSERT_TRUE(created.has_value());
    EXPECT_FALSE(*created);

    auto records = store_.select();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].title, "Sales");
}

TEST_F(JsonStoreTest, InitializeCreatesParentDirectories) {
    StoreConfig config;
    config.document_path = test_dir_ / "nested" / "deeper" / "notes.json";
    NoteStore nested(config);

    auto created = nested.initialize({{"1", "Seeded", 0}});
    ASSERT_TRUE(created.has_value());
    EXPECT_TRUE(*created);

    auto records = nested.select();
    ASSERT_TRUE(records.has_value());
    EXPECT_EQ(records->size(), 1u);
}

// ==============================================================================
// Create / Select
// ==============================================================================

TEST_F(JsonStoreTest, CreateThenSelectPreservesOrder) {
    ASSERT_TRUE(store_.create({"1", "Sales", 1}).has_value());
    ASSERT_TRUE(store_.create({"2", "Orders", 2}).has_value());

    auto records = store_.select();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 2u);
    EXPECT_EQ((*records)[0], (Note{"1", "Sales", 1}));
    EXPECT_EQ((*records)[1], (Note{"2", "Orders", 2}));
}

TEST_F(JsonStoreTest, BulkCreateAppendsAfterExisting) {
    seed({{"1", "A", 0}});
    seed({{"2", "B", 0}, {"3", "C", 0}});

    auto records = store_.select();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 3u);
    EXPECT_EQ((*records)[2].id, "3");
}

TEST_F(JsonStoreTest, SelectWithPredicateFilters) {
    seed({{"1", "A", 1}, {"2", "B", 5}, {"3", "C", 7}});

    auto records = store_.select([](const Note& n) { return n.priority > 2; });
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 2u);
    EXPECT_EQ((*records)[0].id, "2");
    EXPECT_EQ((*records)[1].id, "3");
}

TEST_F(JsonStoreTest, SelectDoesNotWrite) {
    seed({{"1", "A", 1}});
    const auto before = document_text();
    const auto mtime = std::filesystem::last_write_time(store_.path());

    ASSERT_TRUE(store_.select().has_value());

    EXPECT_EQ(document_text(), before);
    EXPECT_EQ(std::filesystem::last_write_time(store_.path()), mtime);
}

// ==============================================================================
// Find One
// ==============================================================================

TEST_F(JsonStoreTest, FindOneReturnsFirstMatch) {
    seed({{"1", "Dup", 1}, {"2", "Dup", 2}});

    auto note = store_.find_one(by_title("Dup"));
    ASSERT_TRUE(note.has_value());
    EXPECT_EQ(note->id, "1");
}

TEST_F(JsonStoreTest, FindOneWithoutMatchIsNotFound) {
    seed({{"1", "A", 0}});

    auto note = store_.find_one(by_id("42"));
    ASSERT_FALSE(note.has_value());
    EXPECT_EQ(note.error().code(), ErrorCode::NotFound);
}

TEST_F(JsonStoreTest, FindOneWithoutPredicateIsNotFound) {
    seed({{"1", "A", 0}});

    auto note = store_.find_one();
    ASSERT_FALSE(note.has_value());
    EXPECT_EQ(note.error().code(), ErrorCode::NotFound);
}

// ==============================================================================
// Update
// ==============================================================================

TEST_F(JsonStoreTest, UpdateMergesOnlyGivenFields) {
    seed({{"1", "Sales", 3}, {"2", "Orders", 4}});

    NotePatch patch;
    patch.title = "Revenue";

    auto updated = store_.update(by_id("1"), patch);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(*updated, 1u);

    auto records = store_.select();
    ASSERT_TRUE(records.has_value());
    EXPECT_EQ((*records)[0], (Note{"1", "Revenue", 3}));
    EXPECT_EQ((*records)[1], (Note{"2", "Orders", 4}));
}

TEST_F(JsonStoreTest, UpdateAppliesToEveryMatch) {
    seed({{"1", "X", 0}, {"2", "Y", 0}, {"3", "X", 0}});

    NotePatch patch;
    patch.priority = 9;

    auto updated = store_.update(by_title("X"), patch);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(*updated, 2u);

    auto matched = store_.select([](const Note& n) { return n.priority == 9; });
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->size(), 2u);
}

TEST_F(JsonStoreTest, UpdateWithoutPredicateIsInvalidArgument) {
    seed({{"1", "A", 0}});
    const auto before = document_text();

    auto updated = store_.update({}, NotePatch{"B", std::nullopt});
    ASSERT_FALSE(updated.has_value());
    EXPECT_EQ(updated.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(document_text(), before);
}

TEST_F(JsonStoreTest, UpdateWithoutMatchIsNotFoundAndDoesNotWrite) {
    seed({{"1", "A", 0}});
    const auto before = document_text();

    auto updated = store_.update(by_id("missing"), NotePatch{"B", std::nullopt});
    ASSERT_FALSE(updated.has_value());
    EXPECT_EQ(updated.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(document_text(), before);
}

TEST_F(JsonStoreTest, BulkUpdateSeesEarlierEntries) {
    seed({{"1", "A", 0}, {"2", "B", 0}});

    std::vector<NoteStore::UpdateEntry> entries;
    entries.push_back({by_id("1"), NotePatch{"Renamed", std::nullopt}});
    entries.push_back({by_title("Renamed"), NotePatch{std::nullopt, 5}});
    entries.push_back({by_id("missing"), NotePatch{"Never", std::nullopt}});

    auto updated = store_.bulk_update(entries);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(*updated, 2u);

    auto note = store_.find_one(by_id("1"));
    ASSERT_TRUE(note.has_value());
    EXPECT_EQ(*note, (Note{"1", "Renamed", 5}));
}

TEST_F(JsonStoreTest, BulkUpdateSkipsEmptyPredicates) {
    seed({{"1", "A", 0}});

    std::vector<NoteStore::UpdateEntry> entries;
    entries.push_back({{}, NotePatch{"Everyone", std::nullopt}});

    auto updated = store_.bulk_update(entries);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(*updated, 0u);

    auto note = store_.find_one(by_id("1"));
    ASSERT_TRUE(note.has_value());
    EXPECT_EQ(note->title, "A");
}

// ==============================================================================
// Remove
// ==============================================================================

TEST_F(JsonStoreTest, RemoveDeletesEveryMatch) {
    seed({{"1", "X", 0}, {"2", "Y", 0}, {"3", "X", 0}});

    auto removed = store_.remove(by_title("X"));
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 2u);

    auto records = store_.select();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].id, "2");
}

TEST_F(JsonStoreTest, RemoveWithoutMatchIsNotFoundAndDoesNotWrite) {
    seed({{"1", "A", 0}});
    const auto before = document_text();

    auto removed = store_.remove(by_id("missing"));
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(document_text(), before);
}

TEST_F(JsonStoreTest, RemoveWithoutPredicateDeletesNothing) {
    seed({{"1", "A", 0}, {"2", "B", 0}});

    auto removed = store_.remove();
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().code(), ErrorCode::NotFound);

    auto records = store_.select();
    ASSERT_TRUE(records.has_value());
    EXPECT_EQ(records->size(), 2u);
}

TEST_F(JsonStoreTest, BulkRemoveFiltersShrinkingCollection) {
    seed({{"1", "A", 1}, {"2", "B", 2}, {"3", "C", 3}});

    std::vector<NoteStore::Predicate> predicates = {
        by_id("1"),
        by_id("missing"),
        [](const Note& n) { return n.priority >= 3; },
        {},
    };

    auto removed = store_.bulk_remove(predicates);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 2u);

    auto records = store_.select();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].id, "2");
}

TEST_F(JsonStoreTest, BulkRemoveWithoutMatchesSucceeds) {
    seed({{"1", "A", 0}});

    auto removed = store_.bulk_remove({by_id("missing")});
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 0u);
}

// ==============================================================================
// Read / Write Contract
// ==============================================================================

TEST_F(JsonStoreTest, MissingDocumentIsReadFailure) {
    std::filesystem::remove(store_.path());

    auto records = store_.select();
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code(), ErrorCode::FileNotFound);
    EXPECT_TRUE(records.error().is_read_failure());

    // Never silently recreated
    EXPECT_FALSE(store_.create({"1", "A", 0}).has_value());
    EXPECT_FALSE(std::filesystem::exists(store_.path()));
}

TEST_F(JsonStoreTest, MalformedDocumentIsReadFailure) {
    write_raw("[{\"id\": \"1\", ");

    auto records = store_.select();
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code(), ErrorCode::DocumentCorrupted);
    EXPECT_TRUE(records.error().is_read_failure());
}

TEST_F(JsonStoreTest, NonArrayDocumentIsReadFailure) {
    write_raw(R"({"id": "1", "title": "A"})");

    auto records = store_.select();
    ASSERT_FALSE(records.has_value());
    EXPECT_TRUE(records.error().is_read_failure());
}

TEST_F(JsonStoreTest, SchemaMismatchIsReadFailure) {
    write_raw(R"([{"id": "1", "title": 7}])");

    auto records = store_.select();
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code(), ErrorCode::DocumentCorrupted);
}

TEST_F(JsonStoreTest, FailedWriteLeavesDocumentIntact) {
    seed({{"1", "A", 0}});
    const auto before = document_text();

    // Invalid UTF-8 cannot be serialized
    auto status = store_.create({"2", std::string("bad \xff\xfe title"), 0});
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code(), ErrorCode::StorageWriteFailure);

    EXPECT_EQ(document_text(), before);
    for (const auto& entry : std::filesystem::directory_iterator(test_dir_)) {
        EXPECT_EQ(entry.path().filename().string(), "notes.json");
    }
}

TEST_F(JsonStoreTest, DocumentIsIndentedWithTwoSpaces) {
    seed({{"1", "A", 0}});

    const auto text = document_text();
    EXPECT_NE(text.find("\n  {\n    \"id\": \"1\""), std::string::npos);
}
