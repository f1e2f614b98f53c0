/// @file pair_outcome.cpp
/// @brief PairOutcome, UnorderedPairKey and Scope implementation.

#include "mrk/store/pair_outcome.hpp"

#include <algorithm>
#include <utility>

namespace mrk::store {

UnorderedPairKey::UnorderedPairKey(std::string a, std::string b) {
    if (b < a) {
        std::swap(a, b);
    }
    first_ = std::move(a);
    second_ = std::move(b);
}

bool Scope::includesCategory(std::string_view category) const {
    if (categories.empty()) {
        return true;
    }
    return std::find(categories.begin(), categories.end(), category) != categories.end();
}

PairOutcome::PairOutcome(std::string modelA, std::string modelB,
                         std::vector<CategoryOutcome> categories)
    : modelA_(std::move(modelA)),
      modelB_(std::move(modelB)),
      categories_(std::move(categories)) {}

uint64_t PairOutcome::overallWinsA() const noexcept {
    uint64_t sum = 0;
    for (const auto& c : categories_) {
        sum += c.winsA;
    }
    return sum;
}

uint64_t PairOutcome::overallWinsB() const noexcept {
    uint64_t sum = 0;
    for (const auto& c : categories_) {
        sum += c.winsB;
    }
    return sum;
}

uint64_t PairOutcome::overallTies() const noexcept {
    uint64_t sum = 0;
    for (const auto& c : categories_) {
        sum += c.ties;
    }
    return sum;
}

uint64_t PairOutcome::overallTotal() const noexcept {
    return overallWinsA() + overallWinsB() + overallTies();
}

const CategoryOutcome* PairOutcome::findCategory(std::string_view category) const {
    auto it = std::find_if(categories_.begin(), categories_.end(),
                           [&](const CategoryOutcome& c) { return c.category == category; });
    return it == categories_.end() ? nullptr : &*it;
}

PairOutcome PairOutcome::swapped() const {
    std::vector<CategoryOutcome> flipped;
    flipped.reserve(categories_.size());
    for (const auto& c : categories_) {
        flipped.push_back(c.swapped());
    }
    return PairOutcome(modelB_, modelA_, std::move(flipped));
}

PairOutcome PairOutcome::orientedTo(std::string_view model) const {
    if (modelA_ != model && modelB_ == model) {
        return swapped();
    }
    return *this;
}

PairOutcome PairOutcome::restrictedTo(const Scope& scope) const {
    if (scope.categories.empty()) {
        return *this;
    }
    std::vector<CategoryOutcome> kept;
    for (const auto& c : categories_) {
        if (scope.includesCategory(c.category)) {
            kept.push_back(c);
        }
    }
    return PairOutcome(modelA_, modelB_, std::move(kept));
}

}  // namespace mrk::store
