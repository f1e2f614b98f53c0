#pragma once

/// @file outcome_aggregator.hpp
/// @brief Turns stored outcomes into the aggregates the estimators consume.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mrk/store/outcome_store.hpp"

namespace mrk::store {

/// Square win / match-count matrices over a fixed, ordered model list.
///
/// wins(i, j) is the number of times model i beat model j in the loaded
/// outcomes; matches(i, j) == wins(i, j) + wins(j, i) counts the decided
/// comparisons and ties(i, j) the drawn ones. Both are symmetric.
class WinMatrix {
public:
    WinMatrix() = default;
    explicit WinMatrix(std::vector<std::string> models);

    [[nodiscard]] const std::vector<std::string>& models() const noexcept { return models_; }
    [[nodiscard]] std::size_t size() const noexcept { return models_.size(); }

    /// Position of @p model in models(), or nullopt if it is not part of
    /// the matrix.
    [[nodiscard]] std::optional<std::size_t> indexOf(std::string_view model) const;

    [[nodiscard]] uint64_t wins(std::size_t i, std::size_t j) const { return wins_[i * size() + j]; }
    [[nodiscard]] uint64_t matches(std::size_t i, std::size_t j) const {
        return matches_[i * size() + j];
    }
    [[nodiscard]] uint64_t ties(std::size_t i, std::size_t j) const { return ties_[i * size() + j]; }

    /// Every judged comparison between i and j, decided or drawn.
    [[nodiscard]] uint64_t judged(std::size_t i, std::size_t j) const {
        return matches(i, j) + ties(i, j);
    }

    /// Total wins of model i against everyone.
    [[nodiscard]] uint64_t totalWins(std::size_t i) const;

    /// Total decided comparisons involving model i.
    [[nodiscard]] uint64_t totalMatches(std::size_t i) const;

    /// Overwrite the wins of i over j. Does not touch match counts.
    void setWins(std::size_t i, std::size_t j, uint64_t wins);

    /// Overwrite the symmetric match count between i and j.
    void setMatches(std::size_t i, std::size_t j, uint64_t matches);

    /// Overwrite the symmetric tie count between i and j.
    void setTies(std::size_t i, std::size_t j, uint64_t ties);

    /// Record a whole outcome (superseding earlier values for the pair).
    /// Outcomes naming a model outside the matrix are ignored.
    void record(const PairOutcome& outcome);

    /// Build a matrix directly from wins; matches(i, j) becomes
    /// wins(i, j) + wins(j, i).
    [[nodiscard]] static WinMatrix fromWins(std::vector<std::string> models,
                                            const std::vector<std::vector<uint32_t>>& wins);

private:
    std::vector<std::string> models_;
    std::vector<uint64_t> wins_;
    std::vector<uint64_t> matches_;
    std::vector<uint64_t> ties_;
};

/// Reads an OutcomeStore for one scope and produces model lists,
/// oriented outcomes and win matrices.
class OutcomeAggregator {
public:
    explicit OutcomeAggregator(const OutcomeStore& store);

    /// Every model that appears in at least one stored outcome, sorted.
    [[nodiscard]] std::vector<std::string> knownModels(const Scope& scope) const;

    /// Every readable stored outcome, restricted to the scope's categories,
    /// in listAll() order. Each outcome is oriented with the
    /// lexicographically smaller model as side A.
    [[nodiscard]] std::vector<PairOutcome> loadAll(const Scope& scope) const;

    /// Win matrix over @p models filled from stored outcomes among them.
    [[nodiscard]] WinMatrix buildWinMatrix(const std::vector<std::string>& models,
                                           const Scope& scope) const;

private:
    const OutcomeStore& store_;
};

}  // namespace mrk::store
