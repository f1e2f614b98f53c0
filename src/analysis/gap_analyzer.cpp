/// @file gap_analyzer.cpp
/// @brief GapAnalyzer implementation.

#include "mrk/analysis/gap_analyzer.hpp"

#include "mrk/foundation/rank_logger.hpp"
#include "mrk/store/outcome_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace mrk::analysis {

using foundation::LogCategory;

namespace {

template <typename T, typename Key>
void stableSortBy(std::vector<T>& items, Key key) {
    std::stable_sort(items.begin(), items.end(),
                     [&](const T& lhs, const T& rhs) { return key(lhs) < key(rhs); });
}

std::string closeRatingReason(double difference) {
    std::ostringstream out;
    out << "Close ELO ratings (diff: " << std::fixed << std::setprecision(1) << difference << ")";
    return out.str();
}

}  // namespace

GapAnalyzer::GapAnalyzer(const store::OutcomeStore& store, store::Scope scope,
                         std::vector<std::string> categories,
                         const rating::EloRatingSystem* ratings)
    : scope_(std::move(scope)), categories_(std::move(categories)), ratings_(ratings) {
    MRK_LOG_INFO(LogCategory::Analyzer,
                 "Loading comparison data for promptset '" + scope_.promptset + "'");

    store::OutcomeAggregator aggregator(store);
    models_ = aggregator.knownModels(scope_);

    for (const auto& outcome : aggregator.loadAll(scope_)) {
        const auto key = outcome.key();
        pairCounts_[key] = outcome.overallTotal();

        for (const auto& cat : outcome.categories()) {
            if (cat.total() == 0) {
                continue;
            }
            categoryCounts_[cat.category][key] += cat.total();
            modelCategoryCounts_[outcome.modelA()][cat.category] += cat.total();
            modelCategoryCounts_[outcome.modelB()][cat.category] += cat.total();
        }
    }

    MRK_LOG_INFO(LogCategory::Analyzer, "Loaded data for " + std::to_string(models_.size()) +
                                            " models and " + std::to_string(pairCounts_.size()) +
                                            " model pairs");
}

std::vector<std::pair<std::string, std::string>> GapAnalyzer::missingComparisons() const {
    std::vector<std::pair<std::string, std::string>> missing;
    for (std::size_t i = 0; i < models_.size(); ++i) {
        for (std::size_t j = i + 1; j < models_.size(); ++j) {
            if (pairCounts_.count(store::UnorderedPairKey(models_[i], models_[j])) == 0) {
                missing.emplace_back(models_[i], models_[j]);
            }
        }
    }
    return missing;
}

std::vector<PairCount> GapAnalyzer::lowConfidencePairs(uint32_t minComparisons) const {
    std::vector<PairCount> pairs;
    for (const auto& [key, count] : pairCounts_) {
        if (count > 0 && count < minComparisons) {
            pairs.push_back({key.first(), key.second(), count});
        }
    }
    stableSortBy(pairs, [](const PairCount& p) { return p.count; });
    return pairs;
}

std::vector<RatingGap> GapAnalyzer::closeRatingPairs(double maxDiff) const {
    std::vector<RatingGap> pairs;
    if (ratings_ == nullptr) {
        MRK_LOG_WARN(LogCategory::Analyzer, "No ELO ratings available for promptset '" +
                                                scope_.promptset + "'");
        return pairs;
    }

    for (std::size_t i = 0; i < models_.size(); ++i) {
        for (std::size_t j = i + 1; j < models_.size(); ++j) {
            const double diff =
                std::abs(ratings_->getRating(models_[i]) - ratings_->getRating(models_[j]));
            if (diff <= maxDiff) {
                pairs.push_back({models_[i], models_[j], diff});
            }
        }
    }
    stableSortBy(pairs, [](const RatingGap& g) { return g.difference; });
    return pairs;
}

std::vector<std::pair<std::string, std::vector<PairCount>>> GapAnalyzer::categoryGaps(
    uint32_t minPerCategory) const {
    std::vector<std::pair<std::string, std::vector<PairCount>>> gaps;
    gaps.reserve(categories_.size());

    for (const auto& category : categories_) {
        std::vector<PairCount> pairs;
        auto catIt = categoryCounts_.find(category);
        for (const auto& [key, total] : pairCounts_) {
            uint64_t count = 0;
            if (catIt != categoryCounts_.end()) {
                auto it = catIt->second.find(key);
                if (it != catIt->second.end()) {
                    count = it->second;
                }
            }
            if (count < minPerCategory) {
                pairs.push_back({key.first(), key.second(), count});
            }
        }
        stableSortBy(pairs, [](const PairCount& p) { return p.count; });
        gaps.emplace_back(category, std::move(pairs));
    }
    return gaps;
}

std::vector<Suggestion> GapAnalyzer::generateSuggestions(uint32_t minComparisons,
                                                         uint32_t minPerCategory,
                                                         double maxRatingDiff,
                                                         std::size_t maxSuggestions) const {
    std::vector<Suggestion> suggestions;
    std::set<store::UnorderedPairKey> seen;

    auto add = [&](const std::string& a, const std::string& b, std::string reason,
                   SuggestionPriority priority, std::optional<std::string> category) {
        if (!seen.insert(store::UnorderedPairKey(a, b)).second) {
            return;
        }
        suggestions.push_back(
            {a, b, std::move(reason), priority, std::move(category), scope_.promptset});
    };

    auto missing = missingComparisons();
    for (std::size_t i = 0; i < missing.size() && i < maxSuggestions; ++i) {
        add(missing[i].first, missing[i].second, "These models have never been compared",
            SuggestionPriority::Missing, std::nullopt);
    }

    auto lowConfidence = lowConfidencePairs(minComparisons);
    for (std::size_t i = 0; i < lowConfidence.size() && i < maxSuggestions; ++i) {
        const auto& p = lowConfidence[i];
        add(p.modelA, p.modelB,
            "Only " + std::to_string(p.count) + " comparisons (recommended: " +
                std::to_string(minComparisons) + ")",
            SuggestionPriority::LowConfidence, std::nullopt);
    }

    if (ratings_ != nullptr) {
        auto close = closeRatingPairs(maxRatingDiff);
        for (std::size_t i = 0; i < close.size() && i < maxSuggestions; ++i) {
            add(close[i].modelA, close[i].modelB, closeRatingReason(close[i].difference),
                SuggestionPriority::CloseRating, std::nullopt);
        }
    }

    if (!categories_.empty()) {
        const std::size_t perCategory = maxSuggestions / categories_.size();
        for (const auto& [category, pairs] : categoryGaps(minPerCategory)) {
            for (std::size_t i = 0; i < pairs.size() && i < perCategory; ++i) {
                add(pairs[i].modelA, pairs[i].modelB,
                    "Only " + std::to_string(pairs[i].count) + " comparisons in '" + category +
                        "' category",
                    SuggestionPriority::CategoryGap, category);
            }
        }
    }

    stableSortBy(suggestions, [](const Suggestion& s) { return static_cast<int>(s.priority); });
    if (suggestions.size() > maxSuggestions) {
        suggestions.resize(maxSuggestions);
    }

    MRK_LOG_DEBUG(LogCategory::Analyzer,
                  "Generated " + std::to_string(suggestions.size()) + " suggestions");
    return suggestions;
}

std::vector<std::pair<std::string, uint64_t>> GapAnalyzer::underrepresentedModels() const {
    std::map<std::string, uint64_t> counts;
    for (const auto& [key, count] : pairCounts_) {
        counts[key.first()] += count;
        counts[key.second()] += count;
    }
    std::vector<std::pair<std::string, uint64_t>> models(counts.begin(), counts.end());
    stableSortBy(models, [](const auto& entry) { return entry.second; });
    return models;
}

ModelSummary GapAnalyzer::modelSummary() const {
    ModelSummary summary;
    summary.totalModels = models_.size();

    for (const auto& [key, count] : pairCounts_) {
        summary.totalComparisons += count;
        summary.comparisonCounts[key.first()] += count;
        summary.comparisonCounts[key.second()] += count;
    }

    for (const auto& [model, perCategory] : modelCategoryCounts_) {
        uint64_t total = 0;
        for (const auto& [category, count] : perCategory) {
            total += count;
        }
        if (total == 0) {
            continue;
        }
        auto& distribution = summary.categoryDistribution[model];
        for (const auto& [category, count] : perCategory) {
            distribution[category] =
                static_cast<double>(count) / static_cast<double>(total) * 100.0;
        }
    }

    if (ratings_ != nullptr) {
        for (const auto& model : models_) {
            summary.ratings[model] = ratings_->getRating(model);
        }
    }
    return summary;
}

}  // namespace mrk::analysis
