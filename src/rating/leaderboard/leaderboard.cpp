/// @file leaderboard.cpp
/// @brief Outcome-driven ELO rebuild and leaderboard assembly.

#include "mrk/rating/leaderboard.hpp"

#include "mrk/foundation/rank_logger.hpp"
#include "mrk/store/outcome_aggregator.hpp"

#include <algorithm>

namespace mrk::rating {

using foundation::LogCategory;
using foundation::RankResult;

namespace {

void sortDescending(std::vector<LeaderboardEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const LeaderboardEntry& lhs, const LeaderboardEntry& rhs) {
                         return lhs.rating > rhs.rating;
                     });
}

}  // namespace

void applyOutcome(EloRatingSystem& system, const store::PairOutcome& outcome) {
    system.registerMatchResult(outcome.modelA(), outcome.modelB(), outcome.overallWinsA(),
                               outcome.overallWinsB(), outcome.overallTies());

    for (const auto& cat : outcome.categories()) {
        if (cat.total() == 0) {
            continue;
        }
        system.registerMatchResult(outcome.modelA(), outcome.modelB(), cat.winsA, cat.winsB,
                                   cat.ties, cat.category);
    }
}

EloRatingSystem rebuildRatings(const store::OutcomeStore& store, const store::Scope& scope,
                               int kFactor, double startingElo) {
    EloRatingSystem system(kFactor, startingElo, scope.promptset);

    store::OutcomeAggregator aggregator(store);
    auto outcomes = aggregator.loadAll(scope);
    for (const auto& outcome : outcomes) {
        applyOutcome(system, outcome);
    }

    MRK_LOG_INFO(LogCategory::Elo, "Updated ELO ratings based on " +
                                       std::to_string(outcomes.size()) +
                                       " comparison results");
    return system;
}

RankResult<EloRatingSystem> updateRatings(const std::filesystem::path& path,
                                          const std::vector<store::PairOutcome>& outcomes,
                                          std::string_view promptset, int kFactor,
                                          double startingElo) {
    EloRatingSystem fresh(kFactor, startingElo, std::string(promptset));

    std::error_code ec;
    auto system = std::filesystem::exists(path, ec)
                      ? EloRatingSystem::loadRatings(path, promptset).valueOr(std::move(fresh))
                      : std::move(fresh);

    for (const auto& outcome : outcomes) {
        applyOutcome(system, outcome);
    }

    auto saved = system.saveRatings(path);
    if (!saved) {
        return RankResult<EloRatingSystem>::err(saved.error());
    }
    MRK_LOG_INFO(LogCategory::Elo, "Updated ELO ratings based on " +
                                       std::to_string(outcomes.size()) +
                                       " comparison results");
    return RankResult<EloRatingSystem>::ok(std::move(system));
}

RankResult<EloRatingSystem> generateRatings(const store::OutcomeStore& store,
                                            const store::Scope& scope,
                                            const std::filesystem::path& path, bool refresh,
                                            int kFactor, double startingElo) {
    std::error_code ec;
    const bool cached = std::filesystem::exists(path, ec);

    if (refresh) {
        auto system = rebuildRatings(store, scope, kFactor, startingElo);
        auto saved = system.saveRatings(path);
        if (!saved) {
            return RankResult<EloRatingSystem>::err(saved.error());
        }
        return RankResult<EloRatingSystem>::ok(std::move(system));
    }

    if (cached) {
        auto loaded = EloRatingSystem::loadRatings(path, scope.promptset);
        if (loaded) {
            MRK_LOG_DEBUG(LogCategory::Elo, "Using cached ELO ratings from " + path.string());
            return loaded;
        }
        MRK_LOG_WARN(LogCategory::Elo, "Rebuilding unreadable ratings file " + path.string());
    }

    store::OutcomeAggregator aggregator(store);
    return updateRatings(path, aggregator.loadAll(scope), scope.promptset, kFactor,
                         startingElo);
}

Leaderboard buildLeaderboard(const EloRatingSystem& system) {
    Leaderboard board;

    const auto models = system.regularModels();
    for (const auto& model : models) {
        board.overall.push_back({model, system.getRating(RatingKey::overall(model))});
    }
    sortDescending(board.overall);

    for (const auto& category : system.categories()) {
        auto& entries = board.categories[category];
        for (const auto& model : models) {
            auto key = RatingKey::perCategory(model, category);
            if (system.hasRating(key)) {
                entries.push_back({model, system.getRating(key)});
            }
        }
        sortDescending(entries);
    }
    return board;
}

}  // namespace mrk::rating
