#pragma once

/// @file elo_rating_system.hpp
/// @brief Incremental ELO ratings for models and model x category pairs.
///
/// Uses the logistic Elo formula:
///   E(A) = 1 / (1 + 10^((R_B - R_A) / 400))
///   R'_A = R_A + K * (S_A - E(A)),  R'_B = R_B - K * (S_A - E(A))
///
/// The rating store is the only engine state that outlives an invocation:
/// load it with loadRatings(), apply zero or more registerMatchResult()
/// calls, then persist it once with saveRatings().

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mrk/foundation/rank_result.hpp"
#include "mrk/rating/rating_key.hpp"

namespace mrk::rating {

/// One applied rating update. Append-only audit history; never used to
/// re-derive current ratings.
struct MatchRecord {
    RatingKey keyA = RatingKey::overall("");
    RatingKey keyB = RatingKey::overall("");
    double oldRatingA = 0.0;
    double oldRatingB = 0.0;
    double newRatingA = 0.0;
    double newRatingB = 0.0;
    double scoreA = 0.0;
    std::optional<std::string> category;  ///< nullopt for overall matches.
};

/// Mutable ELO rating store.
///
/// A value type: callers own it and pass it explicitly to whatever needs
/// it. Ratings are kept in first-rated order, which also breaks ties in
/// getRankings().
class EloRatingSystem {
public:
    static constexpr int kDefaultKFactor = 32;
    static constexpr double kDefaultStartingElo = 1400.0;
    static constexpr std::string_view kDefaultPromptset = "basic1";

    explicit EloRatingSystem(int kFactor = kDefaultKFactor,
                             double startingElo = kDefaultStartingElo,
                             std::string promptset = std::string(kDefaultPromptset));

    [[nodiscard]] int kFactor() const noexcept { return kFactor_; }
    [[nodiscard]] double startingElo() const noexcept { return startingElo_; }
    [[nodiscard]] const std::string& promptset() const noexcept { return promptset_; }

    /// Stored rating, or startingElo() for a key never rated. Never fails.
    [[nodiscard]] double getRating(const RatingKey& key) const;

    /// Overall rating of @p model.
    [[nodiscard]] double getRating(std::string_view model) const;

    [[nodiscard]] bool hasRating(const RatingKey& key) const;

    /// Expected score of @p a against @p b from the current ratings.
    [[nodiscard]] double expectedScore(const RatingKey& a, const RatingKey& b) const;

    /// Expected score for raw ratings; expectedScore(x, y) + expectedScore(y, x) == 1.
    [[nodiscard]] static double expectedScore(double ratingA, double ratingB);

    /// Apply one ELO update with actual score @p scoreA for @p a.
    ///
    /// Both sides move by the same amount in opposite directions. Appends
    /// one MatchRecord.
    /// @return The new ratings of (a, b).
    std::pair<double, double> updateRatings(const RatingKey& a, const RatingKey& b,
                                            double scoreA,
                                            std::optional<std::string> category = std::nullopt);

    /// Register a batch of comparisons between two models as one match
    /// with score (winsA + 0.5 * draws) / total.
    ///
    /// With a category the update applies to the PerCategory keys of both
    /// models and leaves the overall ratings untouched. A batch with zero
    /// comparisons, a self-match or an identifier containing the reserved
    /// separator is logged and ignored.
    void registerMatchResult(std::string_view modelA, std::string_view modelB,
                             uint64_t winsA, uint64_t winsB, uint64_t draws = 0,
                             std::optional<std::string> category = std::nullopt);

    /// Every rated key with its rating, highest first (stable).
    [[nodiscard]] std::vector<std::pair<RatingKey, double>> getRankings() const;

    /// Every rated key, overall and per-category, in first-rated order.
    [[nodiscard]] std::vector<RatingKey> getAllModels() const;

    /// Models holding an overall rating, first-rated order.
    [[nodiscard]] std::vector<std::string> regularModels() const;

    /// Categories that have at least one rating, sorted.
    [[nodiscard]] std::vector<std::string> categories() const;

    [[nodiscard]] const std::vector<MatchRecord>& matchHistory() const noexcept {
        return matchHistory_;
    }

    /// Persist ratings, K-factor, starting value, promptset and history.
    /// Parent directories are created as needed.
    [[nodiscard]] foundation::RankResult<void> saveRatings(const std::filesystem::path& path) const;

    /// Load a store written by saveRatings().
    ///
    /// A missing file yields a fresh system for @p promptset. An unreadable
    /// or malformed file yields RatingStoreCorrupted; the caller decides
    /// whether to fall back to a default system.
    [[nodiscard]] static foundation::RankResult<EloRatingSystem> loadRatings(
        const std::filesystem::path& path,
        std::string_view promptset = kDefaultPromptset);

private:
    void setRating(const RatingKey& key, double rating);

    int kFactor_;
    double startingElo_;
    std::string promptset_;
    std::vector<std::pair<RatingKey, double>> ratings_;
    std::unordered_map<RatingKey, std::size_t> index_;
    std::vector<MatchRecord> matchHistory_;
};

}  // namespace mrk::rating
