#pragma once

/// @file pair_outcome.hpp
/// @brief Judged pairwise outcomes and the keys used to look them up.
///
/// A PairOutcome is produced once per completed comparison run between two
/// models in a promptset and is never mutated afterwards. A re-run
/// supersedes the stored record; counts are never merged.

#include <compare>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mrk::store {

/// Win/loss/tie counts for one category of a pairwise comparison.
struct CategoryOutcome {
    std::string category;
    uint32_t winsA = 0;
    uint32_t winsB = 0;
    uint32_t ties = 0;

    [[nodiscard]] uint64_t total() const noexcept {
        return static_cast<uint64_t>(winsA) + winsB + ties;
    }

    /// Same counts seen from model B's side.
    [[nodiscard]] CategoryOutcome swapped() const {
        return CategoryOutcome{category, winsB, winsA, ties};
    }

    bool operator==(const CategoryOutcome&) const = default;
};

/// Canonical key for "have these two models been compared".
///
/// The two identifiers are stored in lexicographic order, so (a, b) and
/// (b, a) always produce the same key.
class UnorderedPairKey {
public:
    UnorderedPairKey(std::string a, std::string b);

    [[nodiscard]] const std::string& first() const noexcept { return first_; }
    [[nodiscard]] const std::string& second() const noexcept { return second_; }

    [[nodiscard]] bool contains(std::string_view model) const noexcept {
        return first_ == model || second_ == model;
    }

    /// The member of the pair that is not @p model.
    [[nodiscard]] const std::string& other(std::string_view model) const noexcept {
        return first_ == model ? second_ : first_;
    }

    auto operator<=>(const UnorderedPairKey&) const = default;

private:
    std::string first_;
    std::string second_;
};

/// Which outcomes belong to a ranking run: a promptset and an optional
/// category subset (empty = all categories).
struct Scope {
    std::string promptset = "basic1";
    std::vector<std::string> categories;

    [[nodiscard]] bool includesCategory(std::string_view category) const;
};

/// Immutable record of one comparison run between model A and model B.
class PairOutcome {
public:
    PairOutcome(std::string modelA, std::string modelB,
                std::vector<CategoryOutcome> categories);

    [[nodiscard]] const std::string& modelA() const noexcept { return modelA_; }
    [[nodiscard]] const std::string& modelB() const noexcept { return modelB_; }
    [[nodiscard]] const std::vector<CategoryOutcome>& categories() const noexcept {
        return categories_;
    }

    [[nodiscard]] uint64_t overallWinsA() const noexcept;
    [[nodiscard]] uint64_t overallWinsB() const noexcept;
    [[nodiscard]] uint64_t overallTies() const noexcept;
    [[nodiscard]] uint64_t overallTotal() const noexcept;

    /// Counts for @p category, or nullptr when the run did not cover it.
    [[nodiscard]] const CategoryOutcome* findCategory(std::string_view category) const;

    [[nodiscard]] UnorderedPairKey key() const { return UnorderedPairKey(modelA_, modelB_); }

    /// The same outcome with the two sides exchanged.
    [[nodiscard]] PairOutcome swapped() const;

    /// The outcome oriented so that modelA() == @p model.
    /// Returns *this unchanged when @p model is already side A.
    [[nodiscard]] PairOutcome orientedTo(std::string_view model) const;

    /// The outcome restricted to the categories included by @p scope.
    [[nodiscard]] PairOutcome restrictedTo(const Scope& scope) const;

private:
    std::string modelA_;
    std::string modelB_;
    std::vector<CategoryOutcome> categories_;
};

}  // namespace mrk::store

template <>
struct std::hash<mrk::store::UnorderedPairKey> {
    std::size_t operator()(const mrk::store::UnorderedPairKey& key) const noexcept {
        auto h1 = std::hash<std::string>{}(key.first());
        auto h2 = std::hash<std::string>{}(key.second());
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
