#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <unordered_set>

#include "mrk/foundation/error_code.hpp"
#include "mrk/store/archive_outcome_store.hpp"
#include "mrk/store/memory_outcome_store.hpp"
#include "mrk/store/pair_outcome.hpp"

using namespace mrk::store;
using mrk::foundation::ErrorCode;

namespace {

PairOutcome makeOutcome(const std::string& a, const std::string& b) {
    return PairOutcome(a, b,
                       {{"Reasoning", 3, 1, 1}, {"Programming", 2, 2, 0}, {"Summarization", 0, 0, 0}});
}

}  // namespace

// ---------------------------------------------------------------------------
// PairOutcome / UnorderedPairKey
// ---------------------------------------------------------------------------

TEST(PairOutcomeTest, OverallTotalsSumCategories) {
    auto outcome = makeOutcome("alpha", "beta");
    EXPECT_EQ(outcome.overallWinsA(), 5u);
    EXPECT_EQ(outcome.overallWinsB(), 3u);
    EXPECT_EQ(outcome.overallTies(), 1u);
    EXPECT_EQ(outcome.overallTotal(), 9u);
}

TEST(PairOutcomeTest, OverallTotalsDoNotWrapAtUint32) {
    constexpr uint32_t kMax = std::numeric_limits<uint32_t>::max();
    PairOutcome outcome("a", "b", {{"Reasoning", kMax, kMax, kMax}, {"Programming", 1, 0, 0}});

    EXPECT_EQ(outcome.categories()[0].total(), 3ull * kMax);
    EXPECT_EQ(outcome.overallWinsA(), static_cast<uint64_t>(kMax) + 1);
    EXPECT_EQ(outcome.overallTotal(), 3ull * kMax + 1);
}

TEST(PairOutcomeTest, FindCategory) {
    auto outcome = makeOutcome("alpha", "beta");
    const auto* reasoning = outcome.findCategory("Reasoning");
    ASSERT_NE(reasoning, nullptr);
    EXPECT_EQ(reasoning->total(), 5u);
    EXPECT_EQ(outcome.findCategory("Creative Writing"), nullptr);
}

TEST(PairOutcomeTest, OrientedToSwapsSides) {
    auto outcome = makeOutcome("alpha", "beta");
    auto flipped = outcome.orientedTo("beta");
    EXPECT_EQ(flipped.modelA(), "beta");
    EXPECT_EQ(flipped.modelB(), "alpha");
    EXPECT_EQ(flipped.overallWinsA(), 3u);
    EXPECT_EQ(flipped.overallWinsB(), 5u);
    EXPECT_EQ(flipped.overallTies(), 1u);

    auto same = outcome.orientedTo("alpha");
    EXPECT_EQ(same.modelA(), "alpha");
    EXPECT_EQ(same.categories(), outcome.categories());
}

TEST(PairOutcomeTest, RestrictedToScope) {
    auto outcome = makeOutcome("alpha", "beta");
    Scope scope;
    scope.categories = {"Programming"};
    auto restricted = outcome.restrictedTo(scope);
    ASSERT_EQ(restricted.categories().size(), 1u);
    EXPECT_EQ(restricted.overallTotal(), 4u);

    EXPECT_EQ(outcome.restrictedTo(Scope{}).overallTotal(), 9u);
}

TEST(UnorderedPairKeyTest, OrderIndependent) {
    UnorderedPairKey ab("b", "a");
    UnorderedPairKey ba("a", "b");
    EXPECT_EQ(ab, ba);
    EXPECT_EQ(ab.first(), "a");
    EXPECT_EQ(ab.second(), "b");
    EXPECT_TRUE(ab.contains("b"));
    EXPECT_EQ(ab.other("a"), "b");

    std::unordered_set<UnorderedPairKey> keys{ab, ba};
    EXPECT_EQ(keys.size(), 1u);
}

// ---------------------------------------------------------------------------
// MemoryOutcomeStore
// ---------------------------------------------------------------------------

TEST(MemoryOutcomeStoreTest, LoadIsOrientedToRequest) {
    MemoryOutcomeStore store;
    store.put(PairOutcome("alpha", "beta", {{"Reasoning", 7, 3, 0}}));

    auto forward = store.load("alpha", "beta", Scope{});
    ASSERT_TRUE(forward.has_value());
    EXPECT_EQ(forward->overallWinsA(), 7u);

    auto reverse = store.load("beta", "alpha", Scope{});
    ASSERT_TRUE(reverse.has_value());
    EXPECT_EQ(reverse->modelA(), "beta");
    EXPECT_EQ(reverse->overallWinsA(), 3u);
}

TEST(MemoryOutcomeStoreTest, AbsentPairIsNotAnError) {
    MemoryOutcomeStore store;
    EXPECT_FALSE(store.load("alpha", "beta", Scope{}).has_value());
    EXPECT_TRUE(store.listAll(Scope{}).empty());
}

TEST(MemoryOutcomeStoreTest, RerunSupersedes) {
    MemoryOutcomeStore store;
    store.put(PairOutcome("alpha", "beta", {{"Reasoning", 7, 3, 0}}));
    store.put(PairOutcome("beta", "alpha", {{"Reasoning", 1, 1, 1}}));

    EXPECT_EQ(store.size(), 1u);
    auto outcome = store.load("alpha", "beta", Scope{});
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->overallTotal(), 3u);
}

TEST(MemoryOutcomeStoreTest, PromptsetsAreSeparate) {
    MemoryOutcomeStore store;
    store.put(PairOutcome("alpha", "beta", {{"Reasoning", 1, 0, 0}}), "basic1");

    Scope other;
    other.promptset = "coding2";
    EXPECT_FALSE(store.load("alpha", "beta", other).has_value());
    EXPECT_EQ(store.listAll(Scope{}).size(), 1u);

    EXPECT_TRUE(store.erase("beta", "alpha"));
    EXPECT_FALSE(store.erase("beta", "alpha"));
}

// ---------------------------------------------------------------------------
// ArchiveOutcomeStore
// ---------------------------------------------------------------------------

class ArchiveOutcomeStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path() /
                (std::string("mrk_archive_test_") + info->name());
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    void writeRaw(const std::string& filename, const std::string& content) {
        auto dir = root_ / "basic1" / "comparisons";
        std::filesystem::create_directories(dir);
        std::ofstream(dir / filename) << content;
    }

    std::filesystem::path root_;
};

TEST_F(ArchiveOutcomeStoreTest, FileNameIsSortedAndSanitized) {
    EXPECT_EQ(ArchiveOutcomeStore::comparisonFileName("mistral:7b", "llama3:8b"),
              "llama3_8b__vs__mistral_7b.json");
    EXPECT_EQ(ArchiveOutcomeStore::sanitizeModelName("org/model:q4"), "org_model_q4");
}

TEST_F(ArchiveOutcomeStoreTest, ParseComparisonFilename) {
    auto parsed = ArchiveOutcomeStore::parseComparisonFilename("llama3_8b__vs__mistral_7b.json");
    ASSERT_TRUE(parsed.hasValue());
    EXPECT_EQ(parsed.value().first, "llama3:8b");
    EXPECT_EQ(parsed.value().second, "mistral:7b");
}

TEST_F(ArchiveOutcomeStoreTest, ParseMalformedFilenameIsUsageError) {
    for (const char* name : {"notes.txt", "a__vs__b__vs__c.json", "__vs__b.json", "single.json"}) {
        auto parsed = ArchiveOutcomeStore::parseComparisonFilename(name);
        ASSERT_TRUE(parsed.hasError()) << name;
        EXPECT_EQ(parsed.error().code(), ErrorCode::InvalidComparisonFilename) << name;
    }
}

TEST_F(ArchiveOutcomeStoreTest, SaveThenLoad) {
    ArchiveOutcomeStore store(root_);
    ASSERT_TRUE(store.save(makeOutcome("mistral:7b", "llama3:8b"), "basic1").hasValue());

    EXPECT_TRUE(std::filesystem::exists(
        root_ / "basic1" / "comparisons" / "llama3_8b__vs__mistral_7b.json"));

    auto outcome = store.load("llama3:8b", "mistral:7b", Scope{});
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->modelA(), "llama3:8b");
    EXPECT_EQ(outcome->overallWinsA(), 3u);
    EXPECT_EQ(outcome->overallWinsB(), 5u);
    EXPECT_EQ(outcome->overallTies(), 1u);
}

TEST_F(ArchiveOutcomeStoreTest, ReadsJsonWrittenByOtherTools) {
    writeRaw("a__vs__b.json", R"({
  "model_a": "a",
  "model_b": "b",
  "comparisons": [],
  "category_results": {
    "Reasoning": {"category": "Reasoning", "wins_a": 4, "wins_b": 1, "ties": 0},
    "Programming": {"wins_a": 0, "wins_b": 2, "ties": 2}
  }
})");

    ArchiveOutcomeStore store(root_);
    auto outcome = store.load("b", "a", Scope{});
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->modelA(), "b");
    EXPECT_EQ(outcome->overallWinsA(), 3u);
    EXPECT_EQ(outcome->overallWinsB(), 4u);
    EXPECT_EQ(outcome->overallTies(), 2u);
}

TEST_F(ArchiveOutcomeStoreTest, CorruptFileIsTreatedAsAbsent) {
    writeRaw("a__vs__b.json", "{\"model_a\": \"a\", \"model_b\": ");
    writeRaw("a__vs__c.json", R"({"model_a": "a", "model_b": "c",
        "category_results": {"Reasoning": {"wins_a": -1, "wins_b": 0, "ties": 0}}})");

    ArchiveOutcomeStore store(root_);
    EXPECT_FALSE(store.load("a", "b", Scope{}).has_value());
    EXPECT_FALSE(store.load("a", "c", Scope{}).has_value());
    EXPECT_TRUE(store.listAll(Scope{}).empty());

    auto read = ArchiveOutcomeStore::readOutcomeFile(root_ / "basic1" / "comparisons" / "a__vs__b.json");
    ASSERT_TRUE(read.hasError());
    EXPECT_EQ(read.error().code(), ErrorCode::OutcomeCorrupted);
}

TEST_F(ArchiveOutcomeStoreTest, CountAboveUint32RangeIsCorrupt) {
    writeRaw("a__vs__b.json", R"({"model_a": "a", "model_b": "b",
        "category_results": {"Reasoning": {"wins_a": 4294967296, "wins_b": 0, "ties": 0}}})");
    writeRaw("a__vs__c.json", R"({"model_a": "a", "model_b": "c",
        "category_results": {"Reasoning": {"wins_a": 4294967295, "wins_b": 0, "ties": 0}}})");

    auto read = ArchiveOutcomeStore::readOutcomeFile(root_ / "basic1" / "comparisons" / "a__vs__b.json");
    ASSERT_TRUE(read.hasError());
    EXPECT_EQ(read.error().code(), ErrorCode::OutcomeCorrupted);

    ArchiveOutcomeStore store(root_);
    EXPECT_FALSE(store.load("a", "b", Scope{}).has_value());
    auto largest = store.load("a", "c", Scope{});
    ASSERT_TRUE(largest.has_value());
    EXPECT_EQ(largest->overallWinsA(), 4294967295u);
}

TEST_F(ArchiveOutcomeStoreTest, ListAllUsesIdentifiersFromFileBody) {
    ArchiveOutcomeStore store(root_);
    ASSERT_TRUE(store.save(PairOutcome("org/m_1", "b", {{"Reasoning", 1, 0, 0}}), "basic1")
                    .hasValue());
    writeRaw("README.json", "{}");

    auto keys = store.listAll(Scope{});
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0], UnorderedPairKey("b", "org/m_1"));
}

TEST_F(ArchiveOutcomeStoreTest, MissingArchiveListsNothing) {
    ArchiveOutcomeStore store(root_ / "nowhere");
    Scope scope;
    scope.promptset = "coding2";
    EXPECT_TRUE(store.listAll(scope).empty());
    EXPECT_FALSE(store.load("a", "b", scope).has_value());
}
