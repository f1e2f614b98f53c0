#pragma once

/// @file focus_ranking.hpp
/// @brief Ranking every known model relative to one focus model.
///
/// A model's ratio is its win rate against the focus model divided by the
/// focus model's win rate against it (ties count half a win to each side).
/// Models never compared with the focus model get a ratio composed along
/// the shortest chain of comparisons leading to them, up to a depth bound.

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mrk/store/outcome_store.hpp"

namespace mrk::rating {

/// Sparse directed graph of win-rate ratios.
///
/// weight(u, v) is the factor that turns u's ratio to the focus model into
/// v's: v's win rate over u's win rate in their pairing. A missing edge
/// means the pairing carries no usable signal, never a ratio of 1.
class WinRatioGraph {
public:
    using Neighbors = std::vector<std::pair<std::string, double>>;

    /// Insert or overwrite the edge u -> v. New neighbors are appended, so
    /// neighbors() reflects insertion order.
    void addEdge(const std::string& from, const std::string& to, double weight);

    [[nodiscard]] std::optional<double> weight(std::string_view from, std::string_view to) const;

    /// Outgoing edges of @p model in insertion order (empty if none).
    [[nodiscard]] const Neighbors& neighbors(const std::string& model) const;

    [[nodiscard]] std::size_t edgeCount() const noexcept { return edgeCount_; }

    void clear();

private:
    std::unordered_map<std::string, Neighbors> adjacency_;
    std::size_t edgeCount_ = 0;
};

/// How a ratio in the ranking table was obtained.
enum class RatioKind : uint8_t {
    Direct,
    Focus,
    Transitive
};

[[nodiscard]] std::string_view ratioKindName(RatioKind kind) noexcept;

/// One row of the focus ranking table.
struct FocusEntry {
    std::string model;
    double ratio = 0.0;
    RatioKind kind = RatioKind::Transitive;
};

/// Counts of one pairing seen from the focus model's side.
struct FocusCounts {
    uint64_t focusWins = 0;
    uint64_t otherWins = 0;
    uint64_t ties = 0;
    uint64_t total = 0;
};

/// Raw results of the focus model against one other model.
struct FocusComparison {
    FocusCounts overall;
    std::map<std::string, FocusCounts> categories;
};

/// Ranks all known models of a scope relative to a focus model.
class FocusRanking {
public:
    static constexpr int kDefaultMaxDepth = 3;

    FocusRanking(std::string focusModel, const store::OutcomeStore& store);

    [[nodiscard]] const std::string& focusModel() const noexcept { return focusModel_; }

    /// Compute ratios for @p scope.
    ///
    /// Direct ratios always win over composed ones. Ratios composed through
    /// intermediate models are only used when @p maxDepth > 1. The focus
    /// model itself is 1.0; a focus model that has no stored outcome
    /// yields an empty map.
    std::unordered_map<std::string, double> computeRankings(const store::Scope& scope,
                                                            int maxDepth = kDefaultMaxDepth);

    /// Tag and sort @p ratios, highest first with +infinity on top. Equal
    /// ratios are ordered by model name.
    [[nodiscard]] std::vector<FocusEntry> getRankingTable(
        const std::unordered_map<std::string, double>& ratios) const;

    /// Direct results of every model compared with the focus model.
    [[nodiscard]] std::map<std::string, FocusComparison> getRawComparisonData() const;

    /// Every model seen in the last computeRankings(), sorted.
    [[nodiscard]] const std::set<std::string>& models() const noexcept { return models_; }

    [[nodiscard]] const WinRatioGraph& graph() const noexcept { return graph_; }

    /// Shortest path found from the focus model to @p model, both ends
    /// included, or nullopt when @p model was not reached.
    [[nodiscard]] std::optional<std::vector<std::string>> pathTo(const std::string& model) const;

private:
    void load(const store::Scope& scope);
    void computeDirectRatios();
    void findPaths(int maxDepth);

    std::string focusModel_;
    const store::OutcomeStore& store_;
    std::set<std::string> models_;
    std::map<store::UnorderedPairKey, store::PairOutcome> comparisons_;
    WinRatioGraph graph_;
    std::unordered_map<std::string, double> directRatios_;
    std::unordered_map<std::string, std::vector<std::string>> paths_;
};

}  // namespace mrk::rating
