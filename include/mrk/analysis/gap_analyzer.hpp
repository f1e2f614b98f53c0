#pragma once

/// @file gap_analyzer.hpp
/// @brief Finds the comparisons most worth running next.
///
/// Four sources feed the suggestion list, in priority order:
/// | Priority | Source                                         |
/// |----------|------------------------------------------------|
/// | 1        | pairs of known models never compared           |
/// | 2        | pairs with fewer comparisons than the minimum  |
/// | 3        | pairs whose overall ELO ratings are close      |
/// | 4        | pairs thin in one category                     |

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mrk/rating/elo_rating_system.hpp"
#include "mrk/store/outcome_store.hpp"

namespace mrk::analysis {

/// A model pair with a comparison count.
struct PairCount {
    std::string modelA;
    std::string modelB;
    uint64_t count = 0;
};

/// A model pair with the absolute difference of their overall ratings.
struct RatingGap {
    std::string modelA;
    std::string modelB;
    double difference = 0.0;
};

/// Suggestion priorities; lower values come first.
enum class SuggestionPriority : uint8_t {
    Missing       = 1,
    LowConfidence = 2,
    CloseRating   = 3,
    CategoryGap   = 4
};

/// One comparison worth running.
struct Suggestion {
    std::string modelA;
    std::string modelB;
    std::string reason;
    SuggestionPriority priority = SuggestionPriority::Missing;
    std::optional<std::string> category;  ///< Set for category gaps only.
    std::string promptset;
};

/// Coverage statistics of a scope.
struct ModelSummary {
    std::size_t totalModels = 0;
    uint64_t totalComparisons = 0;
    std::map<std::string, uint64_t> comparisonCounts;
    /// Share of each model's comparisons per category, in percent.
    std::map<std::string, std::map<std::string, double>> categoryDistribution;
    /// Overall ratings; empty without a rating store.
    std::map<std::string, double> ratings;
};

/// Analyzes comparison coverage for one scope.
///
/// All outcomes are read once at construction; the queries below are pure.
/// Without a rating store the close-rating source is skipped.
class GapAnalyzer {
public:
    static constexpr uint32_t kDefaultMinComparisons = 5;
    static constexpr uint32_t kDefaultMinPerCategory = 2;
    static constexpr double kDefaultMaxRatingDiff = 50.0;
    static constexpr std::size_t kDefaultMaxSuggestions = 10;

    /// @param categories  The promptset's categories, in display order.
    /// @param ratings     Optional rating store; must outlive the analyzer.
    GapAnalyzer(const store::OutcomeStore& store, store::Scope scope,
                std::vector<std::string> categories,
                const rating::EloRatingSystem* ratings = nullptr);

    /// Every model with at least one stored outcome, sorted.
    [[nodiscard]] const std::vector<std::string>& models() const noexcept { return models_; }

    /// Pairs of known models with no stored outcome, in sorted order.
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> missingComparisons() const;

    /// Compared pairs with 0 < count < @p minComparisons, fewest first.
    [[nodiscard]] std::vector<PairCount> lowConfidencePairs(
        uint32_t minComparisons = kDefaultMinComparisons) const;

    /// Pairs whose overall ratings differ by at most @p maxDiff, closest
    /// first. Empty without a rating store.
    [[nodiscard]] std::vector<RatingGap> closeRatingPairs(
        double maxDiff = kDefaultMaxRatingDiff) const;

    /// Per category, compared pairs with fewer than @p minPerCategory
    /// comparisons in that category, fewest first.
    [[nodiscard]] std::vector<std::pair<std::string, std::vector<PairCount>>> categoryGaps(
        uint32_t minPerCategory = kDefaultMinPerCategory) const;

    /// Merge the four sources into one list without repeating a pair.
    ///
    /// Each source contributes at most @p maxSuggestions entries (category
    /// gaps at most maxSuggestions / categoryCount per category); a pair
    /// keeps its highest-priority entry. The result is ordered by priority
    /// and capped at @p maxSuggestions.
    [[nodiscard]] std::vector<Suggestion> generateSuggestions(
        uint32_t minComparisons = kDefaultMinComparisons,
        uint32_t minPerCategory = kDefaultMinPerCategory,
        double maxRatingDiff = kDefaultMaxRatingDiff,
        std::size_t maxSuggestions = kDefaultMaxSuggestions) const;

    /// Models with their total comparison count, least compared first.
    [[nodiscard]] std::vector<std::pair<std::string, uint64_t>> underrepresentedModels() const;

    [[nodiscard]] ModelSummary modelSummary() const;

private:
    store::Scope scope_;
    std::vector<std::string> categories_;
    const rating::EloRatingSystem* ratings_;
    std::vector<std::string> models_;
    std::map<store::UnorderedPairKey, uint64_t> pairCounts_;
    std::map<std::string, std::map<store::UnorderedPairKey, uint64_t>> categoryCounts_;
    std::map<std::string, std::map<std::string, uint64_t>> modelCategoryCounts_;
};

}  // namespace mrk::analysis
