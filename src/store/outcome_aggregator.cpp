/// @file outcome_aggregator.cpp
/// @brief WinMatrix and OutcomeAggregator implementation.

#include "mrk/store/outcome_aggregator.hpp"

#include "mrk/foundation/rank_logger.hpp"

#include <algorithm>
#include <set>

namespace mrk::store {

using foundation::LogCategory;

// -- WinMatrix ---------------------------------------------------------------

WinMatrix::WinMatrix(std::vector<std::string> models)
    : models_(std::move(models)),
      wins_(models_.size() * models_.size(), 0),
      matches_(models_.size() * models_.size(), 0),
      ties_(models_.size() * models_.size(), 0) {}

std::optional<std::size_t> WinMatrix::indexOf(std::string_view model) const {
    auto it = std::find(models_.begin(), models_.end(), model);
    if (it == models_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - models_.begin());
}

uint64_t WinMatrix::totalWins(std::size_t i) const {
    uint64_t sum = 0;
    for (std::size_t j = 0; j < size(); ++j) {
        sum += wins(i, j);
    }
    return sum;
}

uint64_t WinMatrix::totalMatches(std::size_t i) const {
    uint64_t sum = 0;
    for (std::size_t j = 0; j < size(); ++j) {
        if (j != i) {
            sum += matches(i, j);
        }
    }
    return sum;
}

void WinMatrix::setWins(std::size_t i, std::size_t j, uint64_t wins) {
    wins_[i * size() + j] = wins;
}

void WinMatrix::setMatches(std::size_t i, std::size_t j, uint64_t matches) {
    matches_[i * size() + j] = matches;
    matches_[j * size() + i] = matches;
}

void WinMatrix::setTies(std::size_t i, std::size_t j, uint64_t ties) {
    ties_[i * size() + j] = ties;
    ties_[j * size() + i] = ties;
}

void WinMatrix::record(const PairOutcome& outcome) {
    auto a = indexOf(outcome.modelA());
    auto b = indexOf(outcome.modelB());
    if (!a || !b || *a == *b) {
        return;
    }
    setWins(*a, *b, outcome.overallWinsA());
    setWins(*b, *a, outcome.overallWinsB());
    setMatches(*a, *b, outcome.overallWinsA() + outcome.overallWinsB());
    setTies(*a, *b, outcome.overallTies());
}

WinMatrix WinMatrix::fromWins(std::vector<std::string> models,
                              const std::vector<std::vector<uint32_t>>& wins) {
    WinMatrix matrix(std::move(models));
    const auto n = matrix.size();
    for (std::size_t i = 0; i < n && i < wins.size(); ++i) {
        for (std::size_t j = 0; j < n && j < wins[i].size(); ++j) {
            if (i != j) {
                matrix.setWins(i, j, wins[i][j]);
            }
        }
    }
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            matrix.setMatches(i, j, matrix.wins(i, j) + matrix.wins(j, i));
        }
    }
    return matrix;
}

// -- OutcomeAggregator -------------------------------------------------------

OutcomeAggregator::OutcomeAggregator(const OutcomeStore& store) : store_(store) {}

std::vector<std::string> OutcomeAggregator::knownModels(const Scope& scope) const {
    std::set<std::string> models;
    for (const auto& key : store_.listAll(scope)) {
        models.insert(key.first());
        models.insert(key.second());
    }
    return {models.begin(), models.end()};
}

std::vector<PairOutcome> OutcomeAggregator::loadAll(const Scope& scope) const {
    std::vector<PairOutcome> outcomes;
    for (const auto& key : store_.listAll(scope)) {
        auto outcome = store_.load(key.first(), key.second(), scope);
        if (outcome) {
            outcomes.push_back(std::move(*outcome));
        }
    }
    return outcomes;
}

WinMatrix OutcomeAggregator::buildWinMatrix(const std::vector<std::string>& models,
                                            const Scope& scope) const {
    WinMatrix matrix(models);
    std::size_t loaded = 0;
    for (std::size_t i = 0; i < models.size(); ++i) {
        for (std::size_t j = i + 1; j < models.size(); ++j) {
            auto outcome = store_.load(models[i], models[j], scope);
            if (outcome) {
                matrix.record(*outcome);
                ++loaded;
            }
        }
    }
    MRK_LOG_INFO(LogCategory::Store, "Built win matrix for " + std::to_string(models.size()) +
                                         " models from " + std::to_string(loaded) +
                                         " comparison results");
    return matrix;
}

}  // namespace mrk::store
