#pragma once

/// @file bradley_terry.hpp
/// @brief Bradley-Terry strength estimation by Zermelo iteration.
///
/// Model: P(i beats j) = s_i / (s_i + s_j). Each sweep computes
///   s'_i = W_i / sum_j [ n_ij * s_j / (s_i + s_j) ]
/// over the opponents j with n_ij > 0, then renormalizes so that the
/// strengths sum to 1.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mrk/foundation/rank_result.hpp"
#include "mrk/store/outcome_aggregator.hpp"

namespace mrk::rating {

/// Model strengths in win-matrix order.
using Strengths = std::vector<std::pair<std::string, double>>;

/// Pairwise win probabilities over a fixed model order.
struct ProbabilityMatrix {
    std::vector<std::string> models;
    std::vector<std::vector<double>> values;

    /// P(models[i] beats models[j]).
    [[nodiscard]] double at(std::size_t i, std::size_t j) const { return values[i][j]; }
};

/// Batch estimator fitted from a WinMatrix.
class BradleyTerryModel {
public:
    static constexpr int kDefaultMaxIterations = 100;
    static constexpr double kDefaultConvergenceThreshold = 1e-6;

    explicit BradleyTerryModel(int maxIterations = kDefaultMaxIterations,
                               double convergenceThreshold = kDefaultConvergenceThreshold);

    /// Fit strengths to @p matrix, replacing any previous fit.
    ///
    /// Models without comparisons keep their initial strength 1/n.
    /// Reaching the iteration cap is not an error; the last estimate is
    /// kept and converged() reports false.
    const Strengths& fit(const store::WinMatrix& matrix);

    [[nodiscard]] bool isFitted() const noexcept { return fitted_; }
    [[nodiscard]] int iterations() const noexcept { return iterations_; }
    [[nodiscard]] bool converged() const noexcept { return converged_; }
    [[nodiscard]] const Strengths& strengths() const noexcept { return strengths_; }

    /// Fitted strength of @p model, or nullopt if it was not part of the fit.
    [[nodiscard]] std::optional<double> strength(std::string_view model) const;

    /// Win probabilities implied by the fit; the diagonal is 0.5.
    /// @return ModelNotFitted before fit().
    [[nodiscard]] foundation::RankResult<ProbabilityMatrix> probabilityMatrix() const;

    /// Strengths sorted highest first; equal strengths keep model order.
    /// @return ModelNotFitted before fit().
    [[nodiscard]] foundation::RankResult<Strengths> getRankings() const;

private:
    int maxIterations_;
    double convergenceThreshold_;
    Strengths strengths_;
    bool fitted_ = false;
    int iterations_ = 0;
    bool converged_ = false;
};

}  // namespace mrk::rating
