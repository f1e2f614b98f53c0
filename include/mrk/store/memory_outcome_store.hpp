#pragma once

/// @file memory_outcome_store.hpp
/// @brief In-memory OutcomeStore for embedding callers and tests.

#include <map>
#include <string>

#include "mrk/store/outcome_store.hpp"

namespace mrk::store {

/// OutcomeStore holding outcomes in memory, grouped by promptset.
///
/// put() supersedes any previous outcome for the same unordered pair.
/// listAll() returns pairs in canonical key order.
class MemoryOutcomeStore : public OutcomeStore {
public:
    MemoryOutcomeStore() = default;

    /// Store @p outcome under @p promptset, replacing an earlier run.
    void put(const PairOutcome& outcome, const std::string& promptset = "basic1");

    /// Remove the outcome for the pair, if any. Returns true if one existed.
    bool erase(std::string_view modelA, std::string_view modelB,
               const std::string& promptset = "basic1");

    [[nodiscard]] std::size_t size(const std::string& promptset = "basic1") const;

    [[nodiscard]] std::optional<PairOutcome> load(
        std::string_view modelA, std::string_view modelB, const Scope& scope) const override;

    [[nodiscard]] std::vector<UnorderedPairKey> listAll(const Scope& scope) const override;

private:
    std::map<std::string, std::map<UnorderedPairKey, PairOutcome>> outcomes_;
};

}  // namespace mrk::store
