/// @file rating_key.cpp
/// @brief RatingKey implementation.

#include "mrk/rating/rating_key.hpp"

namespace mrk::rating {

using foundation::ErrorCode;
using foundation::RankError;
using foundation::RankResult;

RatingKey RatingKey::overall(std::string model) {
    return RatingKey(Overall{std::move(model)});
}

RatingKey RatingKey::perCategory(std::string model, std::string category) {
    return RatingKey(PerCategory{std::move(model), std::move(category)});
}

bool RatingKey::isOverall() const noexcept {
    return std::holds_alternative<Overall>(value_);
}

const std::string& RatingKey::model() const noexcept {
    return std::visit([](const auto& v) -> const std::string& { return v.model; }, value_);
}

std::optional<std::string> RatingKey::category() const {
    if (const auto* pc = std::get_if<PerCategory>(&value_)) {
        return pc->category;
    }
    return std::nullopt;
}

std::string RatingKey::toString() const {
    if (const auto* pc = std::get_if<PerCategory>(&value_)) {
        std::string text = pc->model;
        text += kSeparator;
        text += pc->category;
        return text;
    }
    return model();
}

RankResult<RatingKey> RatingKey::parse(std::string_view text) {
    if (text.empty()) {
        return RankResult<RatingKey>::err(
            RankError(ErrorCode::InvalidRatingKey, "empty rating key"));
    }
    auto sep = text.find(kSeparator);
    if (sep == std::string_view::npos) {
        return RankResult<RatingKey>::ok(overall(std::string(text)));
    }
    auto model = text.substr(0, sep);
    auto category = text.substr(sep + kSeparator.size());
    if (model.empty() || category.empty()) {
        return RankResult<RatingKey>::err(RankError(
            ErrorCode::InvalidRatingKey, "malformed rating key: " + std::string(text)));
    }
    return RankResult<RatingKey>::ok(perCategory(std::string(model), std::string(category)));
}

bool RatingKey::isValidComponent(std::string_view component) noexcept {
    return !component.empty() && component.find(kSeparator) == std::string_view::npos;
}

}  // namespace mrk::rating
