/// @file ranking_pipeline_test.cpp
/// @brief Integration tests for the ranker commands over an on-disk archive:
///        ELO persistence, subset rankings, focus tables and suggestions.

#include <gtest/gtest.h>

#include "mrk/app/ranker_runner.hpp"
#include "mrk/foundation/error_code.hpp"
#include "mrk/rating/elo_rating_system.hpp"
#include "mrk/store/archive_outcome_store.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace mrk::app;
using mrk::foundation::ErrorCode;
using mrk::rating::EloRatingSystem;
using mrk::store::ArchiveOutcomeStore;
using mrk::store::PairOutcome;

// =============================================================================
// Fixture: archive with a chain llama3:8b > mistral:7b > phi3:mini
// =============================================================================

class RankingPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path() /
                (std::string("mrk_pipeline_") + info->name());
        std::filesystem::remove_all(root_);

        store_ = std::make_unique<ArchiveOutcomeStore>(root_ / "archive");
        ASSERT_TRUE(store_->save(PairOutcome("llama3:8b", "mistral:7b",
                                             {{"Reasoning", 4, 2, 0}, {"Programming", 3, 1, 0}}),
                                 "basic1")
                        .hasValue());
        ASSERT_TRUE(store_->save(PairOutcome("phi3:mini", "mistral:7b",
                                             {{"Reasoning", 2, 4, 0}, {"Programming", 1, 3, 0}}),
                                 "basic1")
                        .hasValue());

        config_.archiveDir = root_ / "archive";
        config_.leaderboardDir = root_ / "leaderboard";
        config_.categories = {"Reasoning", "Programming"};
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    mrk::foundation::RankResult<void> run(const std::string& name,
                                          std::vector<std::string> args = {}) {
        RankerRunner runner(config_, *store_, out_);
        return runner.run(Command{name, std::move(args)});
    }

    /// Position of @p text in the captured output (npos if absent).
    std::size_t find(const std::string& text) const { return out_.str().find(text); }

    std::filesystem::path root_;
    std::unique_ptr<ArchiveOutcomeStore> store_;
    RankerConfig config_;
    std::ostringstream out_;
};

// =============================================================================
// ELO
// =============================================================================

TEST_F(RankingPipelineTest, EloRebuildsSavesAndPrintsLeaderboard) {
    ASSERT_TRUE(run("elo").hasValue());

    ASSERT_TRUE(std::filesystem::exists(config_.ratingsPath()));
    EXPECT_EQ(config_.ratingsPath().filename().string(), "basic1_elo_ratings.json");

    EXPECT_NE(find("Overall Rankings (basic1)"), std::string::npos);
    EXPECT_NE(find("Programming Rankings"), std::string::npos);
    EXPECT_LT(find("llama3:8b"), find("phi3:mini"));

    auto loaded = EloRatingSystem::loadRatings(config_.ratingsPath());
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value().regularModels().size(), 3u);
    EXPECT_GT(loaded.value().getRating("llama3:8b"), loaded.value().getRating("phi3:mini"));
    EXPECT_EQ(loaded.value().matchHistory().size(), 6u);
}

TEST_F(RankingPipelineTest, EloReusesSavedRatingsUntilRefreshed) {
    ASSERT_TRUE(run("elo").hasValue());
    auto first = EloRatingSystem::loadRatings(config_.ratingsPath());
    ASSERT_TRUE(first.hasValue());

    ASSERT_TRUE(store_->save(PairOutcome("llama3:8b", "phi3:mini", {{"Reasoning", 5, 0, 0}}),
                             "basic1")
                    .hasValue());

    ASSERT_TRUE(run("elo").hasValue());
    auto cached = EloRatingSystem::loadRatings(config_.ratingsPath());
    ASSERT_TRUE(cached.hasValue());
    EXPECT_EQ(cached.value().matchHistory().size(), 6u);
    EXPECT_DOUBLE_EQ(cached.value().getRating("phi3:mini"),
                     first.value().getRating("phi3:mini"));

    ASSERT_TRUE(run("elo", {"--refresh"}).hasValue());
    auto refreshed = EloRatingSystem::loadRatings(config_.ratingsPath());
    ASSERT_TRUE(refreshed.hasValue());
    EXPECT_EQ(refreshed.value().matchHistory().size(), 8u);
    EXPECT_LT(refreshed.value().getRating("phi3:mini"), first.value().getRating("phi3:mini"));
}

TEST_F(RankingPipelineTest, EloRefreshIsReproducible) {
    ASSERT_TRUE(run("elo", {"--refresh"}).hasValue());
    auto first = EloRatingSystem::loadRatings(config_.ratingsPath());
    ASSERT_TRUE(run("elo", {"--refresh"}).hasValue());
    auto second = EloRatingSystem::loadRatings(config_.ratingsPath());

    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    EXPECT_DOUBLE_EQ(first.value().getRating("mistral:7b"),
                     second.value().getRating("mistral:7b"));
    EXPECT_EQ(second.value().matchHistory().size(), 6u);
}

TEST_F(RankingPipelineTest, EloRejectsUnknownOption) {
    auto result = run("elo", {"--force"});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_FALSE(std::filesystem::exists(config_.ratingsPath()));
}

// =============================================================================
// Subset rankings
// =============================================================================

TEST_F(RankingPipelineTest, BradleyTerryOverAllKnownModels) {
    ASSERT_TRUE(run("bt").hasValue());
    EXPECT_NE(find("Bradley-Terry Rankings (basic1"), std::string::npos);
    EXPECT_LT(find("llama3:8b"), find("mistral:7b"));
    EXPECT_LT(find("mistral:7b"), find("phi3:mini"));
}

TEST_F(RankingPipelineTest, BradleyTerryNeedsTwoModels) {
    auto result = run("bt", {"llama3:8b"});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(RankingPipelineTest, DirectListsMissingComparisons) {
    auto result = run("direct", {"llama3:8b", "mistral:7b", "phi3:mini"});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::RankingsNotComputed);
    EXPECT_NE(find("llama3:8b vs phi3:mini (promptset basic1)"), std::string::npos);
}

TEST_F(RankingPipelineTest, DirectRanksCompleteSubset) {
    ASSERT_TRUE(store_->save(PairOutcome("llama3:8b", "phi3:mini", {{"Reasoning", 3, 1, 0}}),
                             "basic1")
                    .hasValue());

    ASSERT_TRUE(run("direct", {"phi3:mini", "mistral:7b", "llama3:8b"}).hasValue());
    EXPECT_NE(find("Direct Comparison Rankings (basic1)"), std::string::npos);
    EXPECT_LT(find("llama3:8b"), find("phi3:mini"));
}

// =============================================================================
// Focus
// =============================================================================

TEST_F(RankingPipelineTest, FocusTableTagsEveryRow) {
    ASSERT_TRUE(run("focus", {"llama3:8b"}).hasValue());
    EXPECT_NE(find("Focus Rankings against llama3:8b"), std::string::npos);
    EXPECT_NE(find("focus"), std::string::npos);
    EXPECT_NE(find("direct"), std::string::npos);
    EXPECT_NE(find("transitive"), std::string::npos);
}

TEST_F(RankingPipelineTest, FocusOnUnknownModelFails) {
    auto result = run("focus", {"gemma:2b"});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);

    auto missingArg = run("focus");
    ASSERT_TRUE(missingArg.hasError());
    EXPECT_EQ(missingArg.error().code(), ErrorCode::InvalidArgument);
}

// =============================================================================
// Suggestions
// =============================================================================

TEST_F(RankingPipelineTest, SuggestPutsNeverComparedPairsFirst) {
    ASSERT_TRUE(run("elo").hasValue());
    out_.str("");

    ASSERT_TRUE(run("suggest").hasValue());
    EXPECT_NE(find("Suggested comparisons (basic1)"), std::string::npos);
    EXPECT_EQ(find("  [1] llama3:8b vs phi3:mini: These models have never been compared"),
              find("  [1]"));
}

TEST_F(RankingPipelineTest, SuggestSurvivesCorruptRatingsFile) {
    std::filesystem::create_directories(config_.leaderboardDir);
    std::ofstream(config_.ratingsPath()) << "{not json";

    ASSERT_TRUE(run("suggest").hasValue());
    EXPECT_NE(find("These models have never been compared"), std::string::npos);
}

TEST_F(RankingPipelineTest, UnknownCommandIsRejected) {
    auto result = run("export");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}
