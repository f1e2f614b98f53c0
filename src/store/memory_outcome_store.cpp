/// @file memory_outcome_store.cpp
/// @brief MemoryOutcomeStore implementation.

#include "mrk/store/memory_outcome_store.hpp"

namespace mrk::store {

void MemoryOutcomeStore::put(const PairOutcome& outcome, const std::string& promptset) {
    auto& bucket = outcomes_[promptset];
    auto key = outcome.key();
    bucket.insert_or_assign(std::move(key), outcome);
}

bool MemoryOutcomeStore::erase(std::string_view modelA, std::string_view modelB,
                               const std::string& promptset) {
    auto it = outcomes_.find(promptset);
    if (it == outcomes_.end()) {
        return false;
    }
    return it->second.erase(UnorderedPairKey(std::string(modelA), std::string(modelB))) > 0;
}

std::size_t MemoryOutcomeStore::size(const std::string& promptset) const {
    auto it = outcomes_.find(promptset);
    return it == outcomes_.end() ? 0 : it->second.size();
}

std::optional<PairOutcome> MemoryOutcomeStore::load(
    std::string_view modelA, std::string_view modelB, const Scope& scope) const {
    auto bucket = outcomes_.find(scope.promptset);
    if (bucket == outcomes_.end()) {
        return std::nullopt;
    }
    auto it = bucket->second.find(UnorderedPairKey(std::string(modelA), std::string(modelB)));
    if (it == bucket->second.end()) {
        return std::nullopt;
    }
    return it->second.orientedTo(modelA).restrictedTo(scope);
}

std::vector<UnorderedPairKey> MemoryOutcomeStore::listAll(const Scope& scope) const {
    std::vector<UnorderedPairKey> keys;
    auto bucket = outcomes_.find(scope.promptset);
    if (bucket == outcomes_.end()) {
        return keys;
    }
    keys.reserve(bucket->second.size());
    for (const auto& [key, outcome] : bucket->second) {
        keys.push_back(key);
    }
    return keys;
}

}  // namespace mrk::store
