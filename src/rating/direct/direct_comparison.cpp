/// @file direct_comparison.cpp
/// @brief DirectComparisonRanking implementation.

#include "mrk/rating/direct_comparison.hpp"

#include "mrk/foundation/rank_logger.hpp"
#include "mrk/store/outcome_aggregator.hpp"

#include <algorithm>

namespace mrk::rating {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RankError;
using foundation::RankResult;

DirectComparisonRanking::DirectComparisonRanking(const store::OutcomeStore& store)
    : store_(store) {}

bool DirectComparisonRanking::computeRankings(const std::vector<std::string>& models,
                                              const store::Scope& scope) {
    promptset_ = scope.promptset;
    models_.clear();
    missing_.clear();
    headToHead_.clear();
    probabilities_.clear();
    computed_ = false;

    for (const auto& model : models) {
        if (std::find(models_.begin(), models_.end(), model) == models_.end()) {
            models_.push_back(model);
        }
    }

    store::WinMatrix matrix(models_);
    const std::size_t n = models_.size();
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            auto outcome = store_.load(models_[i], models_[j], scope);
            if (!outcome) {
                missing_.emplace_back(models_[i], models_[j]);
                continue;
            }
            matrix.record(*outcome);
            headToHead_.push_back({models_[i], models_[j], outcome->overallWinsA(),
                                   outcome->overallWinsB(), outcome->overallTies(),
                                   outcome->overallTotal()});
        }
    }

    if (!missing_.empty()) {
        MRK_LOG_WARN(LogCategory::Direct,
                     std::to_string(missing_.size()) + " of " +
                         std::to_string(n * (n - 1) / 2) +
                         " comparisons are missing for promptset '" + promptset_ + "'");
        return false;
    }

    probabilities_.assign(n, std::vector<std::optional<double>>(n));
    for (std::size_t i = 0; i < n; ++i) {
        probabilities_[i][i] = 0.5;
        for (std::size_t j = 0; j < n; ++j) {
            const auto total = matrix.judged(i, j);
            if (i == j || total == 0) {
                continue;
            }
            const auto winsA = static_cast<double>(matrix.wins(i, j));
            const auto ties = static_cast<double>(matrix.ties(i, j));
            probabilities_[i][j] = (winsA + 0.5 * ties) / static_cast<double>(total);
        }
    }

    computed_ = true;
    MRK_LOG_INFO(LogCategory::Direct, "Computed direct rankings for " + std::to_string(n) +
                                          " models in promptset '" + promptset_ + "'");
    return true;
}

RankResult<DirectComparisonRanking::ProbabilityTable>
DirectComparisonRanking::probabilityMatrix() const {
    if (!computed_) {
        return RankResult<ProbabilityTable>::err(RankError(
            ErrorCode::RankingsNotComputed, "rankings have not been computed yet"));
    }
    return RankResult<ProbabilityTable>::ok(probabilities_);
}

RankResult<std::vector<std::pair<std::string, double>>>
DirectComparisonRanking::getRankings() const {
    using Rankings = std::vector<std::pair<std::string, double>>;
    if (!computed_) {
        return RankResult<Rankings>::err(RankError(
            ErrorCode::RankingsNotComputed, "rankings have not been computed yet"));
    }

    Rankings scores;
    scores.reserve(models_.size());
    for (std::size_t i = 0; i < models_.size(); ++i) {
        double sum = 0.0;
        std::size_t count = 0;
        for (std::size_t j = 0; j < models_.size(); ++j) {
            if (i != j && probabilities_[i][j]) {
                sum += *probabilities_[i][j];
                ++count;
            }
        }
        scores.emplace_back(models_[i], count > 0 ? sum / static_cast<double>(count) : 0.0);
    }
    std::stable_sort(scores.begin(), scores.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
    return RankResult<Rankings>::ok(std::move(scores));
}

std::vector<MissingComparison> DirectComparisonRanking::getMissingComparisonCommands() const {
    std::vector<MissingComparison> commands;
    commands.reserve(missing_.size());
    for (const auto& [a, b] : missing_) {
        commands.push_back({a, b, promptset_});
    }
    return commands;
}

}  // namespace mrk::rating
