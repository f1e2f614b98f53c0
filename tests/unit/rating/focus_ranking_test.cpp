#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <set>
#include <string>
#include <vector>

#include "mrk/rating/focus_ranking.hpp"
#include "mrk/store/memory_outcome_store.hpp"

using namespace mrk::rating;
using namespace mrk::store;

// ---------------------------------------------------------------------------
// WinRatioGraph
// ---------------------------------------------------------------------------

TEST(WinRatioGraphTest, EdgesAreDirectedAndOverwritten) {
    WinRatioGraph graph;
    graph.addEdge("a", "b", 0.5);
    graph.addEdge("a", "c", 2.0);
    graph.addEdge("a", "b", 0.25);

    EXPECT_EQ(graph.edgeCount(), 2u);
    EXPECT_EQ(graph.weight("a", "b"), 0.25);
    EXPECT_FALSE(graph.weight("b", "a").has_value());

    const auto& neighbors = graph.neighbors("a");
    ASSERT_EQ(neighbors.size(), 2u);
    EXPECT_EQ(neighbors[0].first, "b");
    EXPECT_EQ(neighbors[1].first, "c");
    EXPECT_TRUE(graph.neighbors("z").empty());

    graph.clear();
    EXPECT_EQ(graph.edgeCount(), 0u);
    EXPECT_TRUE(graph.neighbors("a").empty());
}

TEST(WinRatioGraphTest, RatioKindNames) {
    EXPECT_EQ(ratioKindName(RatioKind::Direct), "direct");
    EXPECT_EQ(ratioKindName(RatioKind::Focus), "focus");
    EXPECT_EQ(ratioKindName(RatioKind::Transitive), "transitive");
}

// ---------------------------------------------------------------------------
// FocusRanking
// ---------------------------------------------------------------------------

class FocusRankingTest : public ::testing::Test {
protected:
    void SetUp() override {
        // A beats B 7-3; B beats C 7-3; A and C never met.
        store_.put(PairOutcome("A", "B", {{"Reasoning", 5, 2, 0}, {"Programming", 2, 1, 0}}));
        store_.put(PairOutcome("C", "B", {{"Reasoning", 3, 7, 0}}));
    }

    MemoryOutcomeStore store_;
};

TEST_F(FocusRankingTest, DirectAndTransitiveRatios) {
    FocusRanking focus("A", store_);
    auto ratios = focus.computeRankings(Scope{});

    ASSERT_EQ(ratios.size(), 3u);
    EXPECT_DOUBLE_EQ(ratios.at("A"), 1.0);
    EXPECT_NEAR(ratios.at("B"), 3.0 / 7.0, 1e-12);
    EXPECT_NEAR(ratios.at("C"), 9.0 / 49.0, 1e-12);

    auto path = focus.pathTo("C");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(focus.models(), (std::set<std::string>{"A", "B", "C"}));
    EXPECT_EQ(focus.graph().edgeCount(), 4u);
}

TEST_F(FocusRankingTest, DirectRatioTakesPriority) {
    store_.put(PairOutcome("A", "C", {{"Reasoning", 4, 4, 2}}));

    FocusRanking focus("A", store_);
    auto ratios = focus.computeRankings(Scope{});
    EXPECT_DOUBLE_EQ(ratios.at("C"), 1.0);

    auto table = focus.getRankingTable(ratios);
    ASSERT_EQ(table.size(), 3u);
    EXPECT_EQ(table[0].model, "A");
    EXPECT_EQ(table[0].kind, RatioKind::Focus);
    EXPECT_EQ(table[1].model, "C");
    EXPECT_EQ(table[1].kind, RatioKind::Direct);
    EXPECT_EQ(table[2].model, "B");
}

TEST_F(FocusRankingTest, DepthOneUsesDirectRatiosOnly) {
    FocusRanking focus("A", store_);
    auto ratios = focus.computeRankings(Scope{}, 1);
    EXPECT_EQ(ratios.size(), 2u);
    EXPECT_EQ(ratios.count("C"), 0u);
    EXPECT_FALSE(focus.pathTo("C").has_value());
}

TEST_F(FocusRankingTest, RankingTableTagsAndOrder) {
    FocusRanking focus("A", store_);
    auto table = focus.getRankingTable(focus.computeRankings(Scope{}));

    ASSERT_EQ(table.size(), 3u);
    EXPECT_EQ(table[0].model, "A");
    EXPECT_EQ(table[0].kind, RatioKind::Focus);
    EXPECT_EQ(table[1].model, "B");
    EXPECT_EQ(table[1].kind, RatioKind::Direct);
    EXPECT_EQ(table[2].model, "C");
    EXPECT_EQ(table[2].kind, RatioKind::Transitive);
}

TEST_F(FocusRankingTest, UnbeatenOpponentIsInfinite) {
    store_.put(PairOutcome("A", "D", {{"Reasoning", 0, 4, 0}}));

    FocusRanking focus("A", store_);
    auto ratios = focus.computeRankings(Scope{});
    EXPECT_TRUE(std::isinf(ratios.at("D")));
    EXPECT_FALSE(focus.graph().weight("A", "D").has_value());

    auto table = focus.getRankingTable(ratios);
    EXPECT_EQ(table.front().model, "D");
}

TEST_F(FocusRankingTest, UnknownFocusModelYieldsNothing) {
    FocusRanking focus("Z", store_);
    EXPECT_TRUE(focus.computeRankings(Scope{}).empty());
    EXPECT_TRUE(focus.getRawComparisonData().empty());
}

TEST_F(FocusRankingTest, UnreachableModelIsLeftOut) {
    store_.put(PairOutcome("X", "Y", {{"Reasoning", 2, 1, 0}}));

    FocusRanking focus("A", store_);
    auto ratios = focus.computeRankings(Scope{});
    EXPECT_EQ(ratios.count("X"), 0u);
    EXPECT_EQ(ratios.count("Y"), 0u);
    EXPECT_EQ(focus.models().size(), 5u);
}

TEST_F(FocusRankingTest, RawComparisonDataIsSeenFromTheFocusModel) {
    FocusRanking focus("B", store_);
    focus.computeRankings(Scope{});

    auto raw = focus.getRawComparisonData();
    ASSERT_EQ(raw.size(), 2u);

    const auto& vsA = raw.at("A");
    EXPECT_EQ(vsA.overall.focusWins, 3u);
    EXPECT_EQ(vsA.overall.otherWins, 7u);
    EXPECT_EQ(vsA.overall.total, 10u);
    ASSERT_EQ(vsA.categories.count("Programming"), 1u);
    EXPECT_EQ(vsA.categories.at("Programming").otherWins, 2u);

    EXPECT_EQ(raw.at("C").overall.focusWins, 7u);
}

TEST_F(FocusRankingTest, CategoryScopeChangesRatios) {
    FocusRanking focus("A", store_);
    auto ratios = focus.computeRankings(Scope{"basic1", {"Programming"}});
    EXPECT_NEAR(ratios.at("B"), 0.5, 1e-12);
    EXPECT_EQ(ratios.count("C"), 0u);
}
