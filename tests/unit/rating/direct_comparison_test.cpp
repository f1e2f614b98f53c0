#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "mrk/foundation/error_code.hpp"
#include "mrk/rating/direct_comparison.hpp"
#include "mrk/store/memory_outcome_store.hpp"

using namespace mrk::rating;
using namespace mrk::store;
using mrk::foundation::ErrorCode;

class DirectComparisonTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.put(PairOutcome("A", "B", {{"Reasoning", 6, 2, 2}}));
        store_.put(PairOutcome("C", "B", {{"Reasoning", 1, 3, 0}, {"Programming", 0, 4, 0}}));
    }

    MemoryOutcomeStore store_;
};

TEST_F(DirectComparisonTest, MissingPairBlocksTheRanking) {
    DirectComparisonRanking ranking(store_);
    EXPECT_FALSE(ranking.computeRankings({"A", "B", "C"}, Scope{"basic1", {}}));
    EXPECT_FALSE(ranking.isComputed());

    ASSERT_EQ(ranking.missingComparisons().size(), 1u);
    EXPECT_EQ(ranking.missingComparisons()[0], (std::pair<std::string, std::string>{"A", "C"}));

    auto commands = ranking.getMissingComparisonCommands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], (MissingComparison{"A", "C", "basic1"}));

    auto rankings = ranking.getRankings();
    ASSERT_TRUE(rankings.hasError());
    EXPECT_EQ(rankings.error().code(), ErrorCode::RankingsNotComputed);
    EXPECT_TRUE(ranking.probabilityMatrix().hasError());
}

TEST_F(DirectComparisonTest, CompleteSubsetIsRankedByMeanProbability) {
    store_.put(PairOutcome("A", "C", {{"Reasoning", 3, 1, 0}}));

    DirectComparisonRanking ranking(store_);
    ASSERT_TRUE(ranking.computeRankings({"A", "B", "C"}, Scope{}));
    EXPECT_TRUE(ranking.missingComparisons().empty());
    EXPECT_TRUE(ranking.getMissingComparisonCommands().empty());

    auto table = ranking.probabilityMatrix();
    ASSERT_TRUE(table.hasValue());
    const auto& p = table.value();
    EXPECT_DOUBLE_EQ(*p[0][0], 0.5);
    EXPECT_DOUBLE_EQ(*p[0][1], 0.7);   // (6 + 0.5 * 2) / 10
    EXPECT_DOUBLE_EQ(*p[1][0], 0.3);
    EXPECT_DOUBLE_EQ(*p[1][2], 0.875); // 7 of 8 against C
    EXPECT_DOUBLE_EQ(*p[0][2], 0.75);

    auto rankings = ranking.getRankings();
    ASSERT_TRUE(rankings.hasValue());
    ASSERT_EQ(rankings.value().size(), 3u);
    EXPECT_EQ(rankings.value()[0].first, "A");
    EXPECT_DOUBLE_EQ(rankings.value()[0].second, (0.7 + 0.75) / 2);
    EXPECT_EQ(rankings.value()[1].first, "B");
    EXPECT_EQ(rankings.value()[2].first, "C");
}

TEST_F(DirectComparisonTest, CategoryScopeRestrictsTheCounts) {
    DirectComparisonRanking ranking(store_);
    ASSERT_TRUE(ranking.computeRankings({"B", "C"}, Scope{"basic1", {"Reasoning"}}));

    ASSERT_EQ(ranking.headToHead().size(), 1u);
    const auto& h2h = ranking.headToHead()[0];
    EXPECT_EQ(h2h.modelA, "B");
    EXPECT_EQ(h2h.winsA, 3u);
    EXPECT_EQ(h2h.winsB, 1u);
    EXPECT_EQ(h2h.total, 4u);

    auto table = ranking.probabilityMatrix();
    ASSERT_TRUE(table.hasValue());
    EXPECT_DOUBLE_EQ(*table.value()[0][1], 0.75);
}

TEST_F(DirectComparisonTest, DuplicateModelsAreIgnored) {
    DirectComparisonRanking ranking(store_);
    ASSERT_TRUE(ranking.computeRankings({"A", "B", "A"}, Scope{}));
    EXPECT_EQ(ranking.models(), (std::vector<std::string>{"A", "B"}));
}

TEST_F(DirectComparisonTest, OtherPromptsetHasEverythingMissing) {
    DirectComparisonRanking ranking(store_);
    EXPECT_FALSE(ranking.computeRankings({"A", "B", "C"}, Scope{"coding2", {}}));
    EXPECT_EQ(ranking.missingComparisons().size(), 3u);
    for (const auto& command : ranking.getMissingComparisonCommands()) {
        EXPECT_EQ(command.promptset, "coding2");
    }
}

TEST_F(DirectComparisonTest, RecomputeClearsEarlierState) {
    DirectComparisonRanking ranking(store_);
    ASSERT_TRUE(ranking.computeRankings({"A", "B"}, Scope{}));
    EXPECT_FALSE(ranking.computeRankings({"A", "C"}, Scope{}));
    EXPECT_FALSE(ranking.isComputed());
    EXPECT_TRUE(ranking.headToHead().empty());
}

TEST_F(DirectComparisonTest, StoredPairWithoutJudgementsHasNoProbability) {
    store_.put(PairOutcome("A", "D", {{"Reasoning", 0, 0, 0}}));

    DirectComparisonRanking ranking(store_);
    ASSERT_TRUE(ranking.computeRankings({"A", "D"}, Scope{}));
    auto table = ranking.probabilityMatrix();
    ASSERT_TRUE(table.hasValue());
    EXPECT_FALSE(table.value()[0][1].has_value());

    auto rankings = ranking.getRankings();
    ASSERT_TRUE(rankings.hasValue());
    EXPECT_DOUBLE_EQ(rankings.value()[0].second, 0.0);
}
