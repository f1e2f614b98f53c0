#pragma once

/// @file leaderboard.hpp
/// @brief Feeding stored outcomes into an EloRatingSystem and reading
///        the resulting leaderboard.

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "mrk/foundation/rank_result.hpp"

#include "mrk/rating/elo_rating_system.hpp"
#include "mrk/store/outcome_store.hpp"

namespace mrk::rating {

/// One row of a leaderboard.
struct LeaderboardEntry {
    std::string model;
    double rating = 0.0;

    bool operator==(const LeaderboardEntry&) const = default;
};

/// Overall and per-category rankings, each sorted by rating (highest first).
struct Leaderboard {
    std::vector<LeaderboardEntry> overall;
    std::map<std::string, std::vector<LeaderboardEntry>> categories;
};

/// Register one comparison run: one overall match, then one match per
/// category that holds at least one judged comparison.
void applyOutcome(EloRatingSystem& system, const store::PairOutcome& outcome);

/// Build a fresh rating store from every outcome in @p scope, applied in
/// listAll() order.
[[nodiscard]] EloRatingSystem rebuildRatings(
    const store::OutcomeStore& store, const store::Scope& scope,
    int kFactor = EloRatingSystem::kDefaultKFactor,
    double startingElo = EloRatingSystem::kDefaultStartingElo);

/// Incremental update of the persisted store at @p path: load it (a
/// missing or corrupt file starts a fresh system with @p kFactor and
/// @p startingElo), apply @p outcomes in order, then save once.
[[nodiscard]] foundation::RankResult<EloRatingSystem> updateRatings(
    const std::filesystem::path& path, const std::vector<store::PairOutcome>& outcomes,
    std::string_view promptset, int kFactor = EloRatingSystem::kDefaultKFactor,
    double startingElo = EloRatingSystem::kDefaultStartingElo);

/// Ratings for the elo command. A readable store at @p path is returned
/// as is. Otherwise, or when @p refresh is set, every outcome in @p scope
/// is replayed and the result saved to @p path; a refresh starts from a
/// fresh system and replaces whatever the file held.
[[nodiscard]] foundation::RankResult<EloRatingSystem> generateRatings(
    const store::OutcomeStore& store, const store::Scope& scope,
    const std::filesystem::path& path, bool refresh,
    int kFactor = EloRatingSystem::kDefaultKFactor,
    double startingElo = EloRatingSystem::kDefaultStartingElo);

/// Overall rankings over the models holding an overall rating, and one
/// ranking per category over the models rated in it.
[[nodiscard]] Leaderboard buildLeaderboard(const EloRatingSystem& system);

}  // namespace mrk::rating
