#pragma once

/// @file rating_key.hpp
/// @brief Key of one entry in the ELO rating store.
///
/// A rating belongs either to a model overall or to a model within one
/// category. The persisted form joins model and category with the reserved
/// separator "__", which may not appear inside either component.

#include <compare>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "mrk/foundation/rank_result.hpp"

namespace mrk::rating {

/// Overall(model) | PerCategory(model, category).
class RatingKey {
public:
    /// Reserved separator of the persisted "model__category" form.
    static constexpr std::string_view kSeparator = "__";

    [[nodiscard]] static RatingKey overall(std::string model);
    [[nodiscard]] static RatingKey perCategory(std::string model, std::string category);

    [[nodiscard]] bool isOverall() const noexcept;

    [[nodiscard]] const std::string& model() const noexcept;

    /// The category, or nullopt for an overall key.
    [[nodiscard]] std::optional<std::string> category() const;

    /// Persisted form: "model" or "model__category".
    [[nodiscard]] std::string toString() const;

    /// Parse the persisted form, splitting on the first separator.
    /// @return InvalidRatingKey for empty text or an empty component.
    [[nodiscard]] static foundation::RankResult<RatingKey> parse(std::string_view text);

    /// True if @p component can be used as a model id or category name.
    [[nodiscard]] static bool isValidComponent(std::string_view component) noexcept;

    auto operator<=>(const RatingKey&) const = default;

private:
    struct Overall {
        std::string model;
        auto operator<=>(const Overall&) const = default;
    };
    struct PerCategory {
        std::string model;
        std::string category;
        auto operator<=>(const PerCategory&) const = default;
    };

    explicit RatingKey(std::variant<Overall, PerCategory> value) : value_(std::move(value)) {}

    std::variant<Overall, PerCategory> value_;
};

}  // namespace mrk::rating

template <>
struct std::hash<mrk::rating::RatingKey> {
    std::size_t operator()(const mrk::rating::RatingKey& key) const noexcept {
        auto h = std::hash<std::string>{}(key.model());
        if (!key.isOverall()) {
            auto c = std::hash<std::string>{}(*key.category());
            h ^= c + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        }
        return h;
    }
};
