#pragma once

/// @file outcome_store.hpp
/// @brief Read interface over persisted pairwise outcomes.

#include <optional>
#include <string_view>
#include <vector>

#include "mrk/store/pair_outcome.hpp"

namespace mrk::store {

/// Abstract source of judged outcomes consumed by every estimator.
///
/// Implementations are keyed by the canonical unordered pair plus the
/// scope's promptset. Absence is not an error: load() returns an empty
/// optional and listAll() simply omits the pair.
class OutcomeStore {
public:
    virtual ~OutcomeStore() = default;

    /// Load the stored outcome between @p modelA and @p modelB.
    ///
    /// The returned outcome is oriented so that modelA() == @p modelA,
    /// regardless of the order the pair was stored in, and restricted to
    /// the categories included by @p scope.
    [[nodiscard]] virtual std::optional<PairOutcome> load(
        std::string_view modelA, std::string_view modelB, const Scope& scope) const = 0;

    /// Every pair with a stored outcome in the scope's promptset.
    [[nodiscard]] virtual std::vector<UnorderedPairKey> listAll(const Scope& scope) const = 0;
};

}  // namespace mrk::store
