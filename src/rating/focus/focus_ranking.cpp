/// @file focus_ranking.cpp
/// @brief FocusRanking and WinRatioGraph implementation.

#include "mrk/rating/focus_ranking.hpp"

#include "mrk/foundation/rank_logger.hpp"
#include "mrk/store/outcome_aggregator.hpp"

#include <algorithm>
#include <deque>
#include <limits>

namespace mrk::rating {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RankLogger;

namespace {

FocusCounts orientCounts(uint64_t focusWins, uint64_t otherWins, uint64_t ties) {
    return FocusCounts{focusWins, otherWins, ties, focusWins + otherWins + ties};
}

}  // namespace

// -- WinRatioGraph -----------------------------------------------------------

void WinRatioGraph::addEdge(const std::string& from, const std::string& to, double weight) {
    auto& edges = adjacency_[from];
    for (auto& [neighbor, w] : edges) {
        if (neighbor == to) {
            w = weight;
            return;
        }
    }
    edges.emplace_back(to, weight);
    ++edgeCount_;
}

std::optional<double> WinRatioGraph::weight(std::string_view from, std::string_view to) const {
    auto it = adjacency_.find(std::string(from));
    if (it == adjacency_.end()) {
        return std::nullopt;
    }
    for (const auto& [neighbor, w] : it->second) {
        if (neighbor == to) {
            return w;
        }
    }
    return std::nullopt;
}

const WinRatioGraph::Neighbors& WinRatioGraph::neighbors(const std::string& model) const {
    static const Neighbors kEmpty;
    auto it = adjacency_.find(model);
    return it == adjacency_.end() ? kEmpty : it->second;
}

void WinRatioGraph::clear() {
    adjacency_.clear();
    edgeCount_ = 0;
}

std::string_view ratioKindName(RatioKind kind) noexcept {
    switch (kind) {
        case RatioKind::Direct:     return "direct";
        case RatioKind::Focus:      return "focus";
        case RatioKind::Transitive: return "transitive";
    }
    return "unknown";
}

// -- FocusRanking ------------------------------------------------------------

FocusRanking::FocusRanking(std::string focusModel, const store::OutcomeStore& store)
    : focusModel_(std::move(focusModel)), store_(store) {}

std::unordered_map<std::string, double> FocusRanking::computeRankings(const store::Scope& scope,
                                                                      int maxDepth) {
    load(scope);

    if (models_.count(focusModel_) == 0) {
        LogContext ctx;
        ctx.model = focusModel_;
        ctx.promptset = scope.promptset;
        RankLogger::instance().logWithContext(LogLevel::Error, LogCategory::Focus,
                                              "Focus model not found in any comparisons", ctx);
        return {};
    }

    computeDirectRatios();
    findPaths(maxDepth);

    std::unordered_map<std::string, double> ratios = directRatios_;
    if (maxDepth > 1) {
        for (const auto& [model, path] : paths_) {
            if (model == focusModel_ || ratios.count(model) > 0) {
                continue;
            }
            double ratio = 1.0;
            for (std::size_t i = 0; i + 1 < path.size(); ++i) {
                ratio *= graph_.weight(path[i], path[i + 1]).value_or(1.0);
            }
            ratios.emplace(model, ratio);
        }
    }
    ratios[focusModel_] = 1.0;

    MRK_LOG_INFO(LogCategory::Focus,
                 "Ranked " + std::to_string(ratios.size() - 1) + " models against '" +
                     focusModel_ + "' (" + std::to_string(directRatios_.size()) + " direct)");
    return ratios;
}

void FocusRanking::load(const store::Scope& scope) {
    models_.clear();
    comparisons_.clear();
    graph_.clear();
    directRatios_.clear();
    paths_.clear();

    store::OutcomeAggregator aggregator(store_);
    auto outcomes = aggregator.loadAll(scope);
    MRK_LOG_DEBUG(LogCategory::Focus, "Loaded " + std::to_string(outcomes.size()) +
                                          " comparisons for promptset '" + scope.promptset + "'");

    for (auto& outcome : outcomes) {
        const auto& a = outcome.modelA();
        const auto& b = outcome.modelB();
        models_.insert(a);
        models_.insert(b);

        const auto total = outcome.overallTotal();
        if (total > 0) {
            const double ties = 0.5 * outcome.overallTies();
            const double rateA = (outcome.overallWinsA() + ties) / total;
            const double rateB = (outcome.overallWinsB() + ties) / total;
            if (rateA > 0.0) {
                graph_.addEdge(a, b, rateB / rateA);
            }
            if (rateB > 0.0) {
                graph_.addEdge(b, a, rateA / rateB);
            }
        }
        auto key = outcome.key();
        comparisons_.insert_or_assign(std::move(key), std::move(outcome));
    }
}

void FocusRanking::computeDirectRatios() {
    for (const auto& model : models_) {
        if (model == focusModel_) {
            continue;
        }
        auto it = comparisons_.find(store::UnorderedPairKey(focusModel_, model));
        if (it == comparisons_.end()) {
            continue;
        }
        const auto oriented = it->second.orientedTo(focusModel_);
        const double ties = 0.5 * oriented.overallTies();
        const double focusWins = oriented.overallWinsA() + ties;
        const double otherWins = oriented.overallWinsB() + ties;
        directRatios_[model] = focusWins > 0.0 ? otherWins / focusWins
                                               : std::numeric_limits<double>::infinity();
    }
}

void FocusRanking::findPaths(int maxDepth) {
    paths_[focusModel_] = {focusModel_};
    std::deque<std::string> queue{focusModel_};

    // Level by level; the first path to reach a model is kept.
    for (int depth = 0; depth < maxDepth && !queue.empty(); ++depth) {
        const auto levelSize = queue.size();
        for (std::size_t n = 0; n < levelSize; ++n) {
            auto current = std::move(queue.front());
            queue.pop_front();
            for (const auto& [neighbor, weight] : graph_.neighbors(current)) {
                if (paths_.count(neighbor) > 0) {
                    continue;
                }
                auto path = paths_[current];
                path.push_back(neighbor);
                paths_.emplace(neighbor, std::move(path));
                queue.push_back(neighbor);
            }
        }
    }
}

std::vector<FocusEntry> FocusRanking::getRankingTable(
    const std::unordered_map<std::string, double>& ratios) const {
    std::vector<FocusEntry> table;
    table.reserve(ratios.size());
    for (const auto& [model, ratio] : ratios) {
        RatioKind kind = RatioKind::Transitive;
        if (directRatios_.count(model) > 0) {
            kind = RatioKind::Direct;
        } else if (model == focusModel_) {
            kind = RatioKind::Focus;
        }
        table.push_back({model, ratio, kind});
    }
    std::sort(table.begin(), table.end(), [](const FocusEntry& lhs, const FocusEntry& rhs) {
        if (lhs.ratio != rhs.ratio) {
            return lhs.ratio > rhs.ratio;
        }
        return lhs.model < rhs.model;
    });
    return table;
}

std::map<std::string, FocusComparison> FocusRanking::getRawComparisonData() const {
    std::map<std::string, FocusComparison> data;
    for (const auto& model : models_) {
        if (model == focusModel_) {
            continue;
        }
        auto it = comparisons_.find(store::UnorderedPairKey(focusModel_, model));
        if (it == comparisons_.end()) {
            continue;
        }
        const auto oriented = it->second.orientedTo(focusModel_);
        FocusComparison comparison;
        comparison.overall = orientCounts(oriented.overallWinsA(), oriented.overallWinsB(),
                                          oriented.overallTies());
        for (const auto& cat : oriented.categories()) {
            comparison.categories[cat.category] = orientCounts(cat.winsA, cat.winsB, cat.ties);
        }
        data.emplace(model, std::move(comparison));
    }
    return data;
}

std::optional<std::vector<std::string>> FocusRanking::pathTo(const std::string& model) const {
    auto it = paths_.find(model);
    if (it == paths_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace mrk::rating
