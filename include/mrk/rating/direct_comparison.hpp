#pragma once

/// @file direct_comparison.hpp
/// @brief Round-robin ranking of a model subset from head-to-head results only.
///
/// Nothing is inferred: a ranking exists only when every pair in the subset
/// has a stored outcome. The score of a model is the unweighted mean of its
/// win probabilities against the other members of the subset.

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mrk/foundation/rank_result.hpp"
#include "mrk/store/outcome_store.hpp"

namespace mrk::rating {

/// A comparison that has to be run before the subset can be ranked.
struct MissingComparison {
    std::string modelA;
    std::string modelB;
    std::string promptset;

    bool operator==(const MissingComparison&) const = default;
};

/// Overall counts of one stored pairing inside the subset.
struct HeadToHead {
    std::string modelA;
    std::string modelB;
    uint64_t winsA = 0;
    uint64_t winsB = 0;
    uint64_t ties = 0;
    uint64_t total = 0;
};

/// Ranks a fixed subset of models from their direct results.
class DirectComparisonRanking {
public:
    using ProbabilityTable = std::vector<std::vector<std::optional<double>>>;

    explicit DirectComparisonRanking(const store::OutcomeStore& store);

    /// Load every pair of @p models and, if none is missing, build the
    /// probability table.
    ///
    /// Duplicate entries in @p models are ignored.
    /// @return false when at least one pair has no stored outcome; the
    ///         pairs are listed by missingComparisons().
    bool computeRankings(const std::vector<std::string>& models, const store::Scope& scope);

    [[nodiscard]] bool isComputed() const noexcept { return computed_; }
    [[nodiscard]] const std::vector<std::string>& models() const noexcept { return models_; }

    /// Unordered pairs without an outcome, each listed once in subset order.
    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& missingComparisons()
        const noexcept {
        return missing_;
    }

    /// P(models()[i] beats models()[j]) with ties as half a win, 0.5 on the
    /// diagonal and nullopt for pairs without judged comparisons.
    /// @return RankingsNotComputed before a successful computeRankings().
    [[nodiscard]] foundation::RankResult<ProbabilityTable> probabilityMatrix() const;

    /// Models with their mean win probability, highest first (stable).
    /// @return RankingsNotComputed before a successful computeRankings().
    [[nodiscard]] foundation::RankResult<std::vector<std::pair<std::string, double>>>
    getRankings() const;

    /// The comparisons to run, tagged with the promptset of the last compute.
    [[nodiscard]] std::vector<MissingComparison> getMissingComparisonCommands() const;

    /// Overall counts for every loaded pair, in subset order.
    [[nodiscard]] const std::vector<HeadToHead>& headToHead() const noexcept {
        return headToHead_;
    }

private:
    const store::OutcomeStore& store_;
    std::string promptset_;
    std::vector<std::string> models_;
    std::vector<std::pair<std::string, std::string>> missing_;
    std::vector<HeadToHead> headToHead_;
    ProbabilityTable probabilities_;
    bool computed_ = false;
};

}  // namespace mrk::rating
