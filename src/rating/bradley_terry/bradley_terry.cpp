/// @file bradley_terry.cpp
/// @brief BradleyTerryModel implementation.

#include "mrk/rating/bradley_terry.hpp"

#include "mrk/foundation/rank_logger.hpp"

#include <algorithm>
#include <cmath>

namespace mrk::rating {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RankError;
using foundation::RankResult;

BradleyTerryModel::BradleyTerryModel(int maxIterations, double convergenceThreshold)
    : maxIterations_(maxIterations), convergenceThreshold_(convergenceThreshold) {}

const Strengths& BradleyTerryModel::fit(const store::WinMatrix& matrix) {
    const std::size_t n = matrix.size();
    strengths_.clear();
    iterations_ = 0;
    converged_ = false;
    fitted_ = true;

    if (n == 0) {
        converged_ = true;
        return strengths_;
    }

    std::vector<double> current(n, 1.0 / static_cast<double>(n));
    std::vector<double> next(n);

    for (int iter = 0; iter < maxIterations_; ++iter) {
        for (std::size_t i = 0; i < n; ++i) {
            next[i] = current[i];
            if (matrix.totalMatches(i) == 0) {
                continue;
            }
            double denominator = 0.0;
            for (std::size_t j = 0; j < n; ++j) {
                const auto nij = matrix.matches(i, j);
                if (j == i || nij == 0) {
                    continue;
                }
                denominator += static_cast<double>(nij) * current[j] / (current[i] + current[j]);
            }
            if (denominator > 0.0) {
                next[i] = static_cast<double>(matrix.totalWins(i)) / denominator;
            }
        }

        double sum = 0.0;
        for (double s : next) {
            sum += s;
        }
        if (sum <= 0.0) {
            // No model has a single win; there is nothing to separate.
            MRK_LOG_WARN(LogCategory::BradleyTerry,
                         "Win matrix holds no wins, keeping equal strengths");
            converged_ = true;
            break;
        }
        for (double& s : next) {
            s /= sum;
        }

        double maxDelta = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            maxDelta = std::max(maxDelta, std::abs(next[i] - current[i]));
        }
        current.swap(next);
        iterations_ = iter + 1;

        if (maxDelta < convergenceThreshold_) {
            converged_ = true;
            break;
        }
    }

    if (converged_) {
        MRK_LOG_DEBUG(LogCategory::BradleyTerry,
                      "Converged after " + std::to_string(iterations_) + " iterations");
    } else {
        MRK_LOG_WARN(LogCategory::BradleyTerry,
                     "Did not converge within " + std::to_string(maxIterations_) + " iterations");
    }

    strengths_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        strengths_.emplace_back(matrix.models()[i], current[i]);
    }
    return strengths_;
}

std::optional<double> BradleyTerryModel::strength(std::string_view model) const {
    for (const auto& [name, value] : strengths_) {
        if (name == model) {
            return value;
        }
    }
    return std::nullopt;
}

RankResult<ProbabilityMatrix> BradleyTerryModel::probabilityMatrix() const {
    if (!fitted_) {
        return RankResult<ProbabilityMatrix>::err(
            RankError(ErrorCode::ModelNotFitted, "model must be fitted before computing probabilities"));
    }

    const std::size_t n = strengths_.size();
    ProbabilityMatrix result;
    result.models.reserve(n);
    result.values.assign(n, std::vector<double>(n, 0.5));
    for (std::size_t i = 0; i < n; ++i) {
        result.models.push_back(strengths_[i].first);
        for (std::size_t j = 0; j < n; ++j) {
            if (i == j) {
                continue;
            }
            const double si = strengths_[i].second;
            const double sj = strengths_[j].second;
            if (si + sj > 0.0) {
                result.values[i][j] = si / (si + sj);
            }
        }
    }
    return RankResult<ProbabilityMatrix>::ok(std::move(result));
}

RankResult<Strengths> BradleyTerryModel::getRankings() const {
    if (!fitted_) {
        return RankResult<Strengths>::err(
            RankError(ErrorCode::ModelNotFitted, "model must be fitted before getting rankings"));
    }
    auto rankings = strengths_;
    std::stable_sort(rankings.begin(), rankings.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
    return RankResult<Strengths>::ok(std::move(rankings));
}

}  // namespace mrk::rating
