/// @file elo_rating_system.cpp
/// @brief EloRatingSystem implementation and its JSON persistence.

#include "mrk/rating/elo_rating_system.hpp"

#include "mrk/foundation/rank_logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>

namespace mrk::rating {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RankError;
using foundation::RankLogger;
using foundation::RankResult;

namespace {

void emitRecord(YAML::Emitter& out, const MatchRecord& record) {
    out << YAML::BeginMap;
    out << YAML::Key << "model_a" << YAML::Value << record.keyA.toString();
    out << YAML::Key << "model_b" << YAML::Value << record.keyB.toString();
    out << YAML::Key << "old_rating_a" << YAML::Value << record.oldRatingA;
    out << YAML::Key << "old_rating_b" << YAML::Value << record.oldRatingB;
    out << YAML::Key << "new_rating_a" << YAML::Value << record.newRatingA;
    out << YAML::Key << "new_rating_b" << YAML::Value << record.newRatingB;
    out << YAML::Key << "score_a" << YAML::Value << record.scoreA;
    if (record.category) {
        out << YAML::Key << "category" << YAML::Value << *record.category;
    }
    out << YAML::EndMap;
}

RankResult<MatchRecord> parseRecord(const YAML::Node& node) {
    if (!node.IsMap()) {
        return RankResult<MatchRecord>::err(
            RankError(ErrorCode::RatingStoreCorrupted, "match record is not a mapping"));
    }
    auto keyA = RatingKey::parse(node["model_a"].as<std::string>());
    auto keyB = RatingKey::parse(node["model_b"].as<std::string>());
    if (!keyA || !keyB) {
        return RankResult<MatchRecord>::err(
            RankError(ErrorCode::RatingStoreCorrupted, "match record has an invalid model key"));
    }

    MatchRecord record;
    record.keyA = std::move(keyA).value();
    record.keyB = std::move(keyB).value();
    record.oldRatingA = node["old_rating_a"].as<double>();
    record.oldRatingB = node["old_rating_b"].as<double>();
    record.newRatingA = node["new_rating_a"].as<double>();
    record.newRatingB = node["new_rating_b"].as<double>();
    record.scoreA = node["score_a"].as<double>();
    const auto category = node["category"];
    if (category && !category.IsNull()) {
        record.category = category.as<std::string>();
    }
    return RankResult<MatchRecord>::ok(std::move(record));
}

}  // namespace

EloRatingSystem::EloRatingSystem(int kFactor, double startingElo, std::string promptset)
    : kFactor_(kFactor), startingElo_(startingElo), promptset_(std::move(promptset)) {}

double EloRatingSystem::getRating(const RatingKey& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? startingElo_ : ratings_[it->second].second;
}

double EloRatingSystem::getRating(std::string_view model) const {
    return getRating(RatingKey::overall(std::string(model)));
}

bool EloRatingSystem::hasRating(const RatingKey& key) const {
    return index_.count(key) > 0;
}

double EloRatingSystem::expectedScore(double ratingA, double ratingB) {
    return 1.0 / (1.0 + std::pow(10.0, (ratingB - ratingA) / 400.0));
}

double EloRatingSystem::expectedScore(const RatingKey& a, const RatingKey& b) const {
    return expectedScore(getRating(a), getRating(b));
}

void EloRatingSystem::setRating(const RatingKey& key, double rating) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        ratings_[it->second].second = rating;
        return;
    }
    index_.emplace(key, ratings_.size());
    ratings_.emplace_back(key, rating);
}

std::pair<double, double> EloRatingSystem::updateRatings(const RatingKey& a, const RatingKey& b,
                                                         double scoreA,
                                                         std::optional<std::string> category) {
    const double ratingA = getRating(a);
    const double ratingB = getRating(b);
    const double expectedA = expectedScore(ratingA, ratingB);

    // One delta applied with opposite signs keeps the update zero-sum.
    const double delta = static_cast<double>(kFactor_) * (scoreA - expectedA);
    const double newRatingA = ratingA + delta;
    const double newRatingB = ratingB - delta;

    setRating(a, newRatingA);
    setRating(b, newRatingB);

    matchHistory_.push_back(MatchRecord{a, b, ratingA, ratingB, newRatingA, newRatingB,
                                        scoreA, std::move(category)});
    return {newRatingA, newRatingB};
}

void EloRatingSystem::registerMatchResult(std::string_view modelA, std::string_view modelB,
                                          uint64_t winsA, uint64_t winsB, uint64_t draws,
                                          std::optional<std::string> category) {
    LogContext ctx;
    ctx.model = std::string(modelA);
    ctx.opponent = std::string(modelB);
    ctx.promptset = promptset_;
    if (category) {
        ctx.category = *category;
    }

    if (!RatingKey::isValidComponent(modelA) || !RatingKey::isValidComponent(modelB) ||
        (category && !RatingKey::isValidComponent(*category))) {
        RankLogger::instance().logWithContext(
            LogLevel::Error, LogCategory::Elo,
            "Ignoring match with an empty identifier or one containing the reserved '__' separator",
            ctx);
        return;
    }
    if (modelA == modelB) {
        RankLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Elo,
                                              "Ignoring match of a model against itself", ctx);
        return;
    }

    const uint64_t total = winsA + winsB + draws;
    if (total == 0) {
        RankLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Elo,
            "Attempted to register match with zero comparisons", ctx);
        return;
    }

    const double scoreA =
        (static_cast<double>(winsA) + 0.5 * static_cast<double>(draws)) / static_cast<double>(total);

    auto keyA = category ? RatingKey::perCategory(std::string(modelA), *category)
                         : RatingKey::overall(std::string(modelA));
    auto keyB = category ? RatingKey::perCategory(std::string(modelB), *category)
                         : RatingKey::overall(std::string(modelB));
    updateRatings(keyA, keyB, scoreA, category);

    ctx.extra["result"] = std::to_string(winsA) + "-" + std::to_string(winsB) + "-" +
                          std::to_string(draws);
    RankLogger::instance().logWithContext(LogLevel::Info, LogCategory::Elo,
                                          "Registered match result", ctx);
}

std::vector<std::pair<RatingKey, double>> EloRatingSystem::getRankings() const {
    auto rankings = ratings_;
    std::stable_sort(rankings.begin(), rankings.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
    return rankings;
}

std::vector<RatingKey> EloRatingSystem::getAllModels() const {
    std::vector<RatingKey> keys;
    keys.reserve(ratings_.size());
    for (const auto& [key, rating] : ratings_) {
        keys.push_back(key);
    }
    return keys;
}

std::vector<std::string> EloRatingSystem::regularModels() const {
    std::vector<std::string> models;
    for (const auto& [key, rating] : ratings_) {
        if (key.isOverall()) {
            models.push_back(key.model());
        }
    }
    return models;
}

std::vector<std::string> EloRatingSystem::categories() const {
    std::set<std::string> names;
    for (const auto& [key, rating] : ratings_) {
        if (auto category = key.category()) {
            names.insert(std::move(*category));
        }
    }
    return {names.begin(), names.end()};
}

// -- Persistence -------------------------------------------------------------

RankResult<void> EloRatingSystem::saveRatings(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return RankResult<void>::err(RankError(
                ErrorCode::RatingStoreWriteFailed,
                "failed to create " + path.parent_path().string() + ": " + ec.message()));
        }
    }

    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetDoublePrecision(17);

    out << YAML::BeginMap;
    out << YAML::Key << "ratings" << YAML::Value << YAML::BeginMap;
    for (const auto& [key, rating] : ratings_) {
        out << YAML::Key << key.toString() << YAML::Value << rating;
    }
    out << YAML::EndMap;
    out << YAML::Key << "k_factor" << YAML::Value << kFactor_;
    out << YAML::Key << "starting_elo" << YAML::Value << startingElo_;
    out << YAML::Key << "promptset" << YAML::Value << promptset_;
    out << YAML::Key << "match_history" << YAML::Value << YAML::BeginSeq;
    for (const auto& record : matchHistory_) {
        emitRecord(out, record);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    if (!out.good()) {
        return RankResult<void>::err(
            RankError(ErrorCode::RatingStoreWriteFailed, "emitter error: " + out.GetLastError()));
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return RankResult<void>::err(RankError(ErrorCode::RatingStoreWriteFailed,
                                               "failed to open " + path.string() + " for writing"));
    }
    file << out.c_str() << '\n';
    if (!file) {
        return RankResult<void>::err(
            RankError(ErrorCode::RatingStoreWriteFailed, "failed to write " + path.string()));
    }

    MRK_LOG_INFO(LogCategory::Elo, "Saved ELO ratings to " + path.string());
    return RankResult<void>::ok();
}

RankResult<EloRatingSystem> EloRatingSystem::loadRatings(const std::filesystem::path& path,
                                                         std::string_view promptset) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        MRK_LOG_WARN(LogCategory::Elo, "Ratings file " + path.string() +
                                           " does not exist, creating new ELO system with promptset '" +
                                           std::string(promptset) + "'");
        return RankResult<EloRatingSystem>::ok(
            EloRatingSystem(kDefaultKFactor, kDefaultStartingElo, std::string(promptset)));
    }

    auto corrupted = [&](const std::string& why) {
        auto message = "error loading ratings from " + path.string() + ": " + why;
        MRK_LOG_ERROR(LogCategory::Elo, message);
        return RankResult<EloRatingSystem>::err(
            RankError(ErrorCode::RatingStoreCorrupted, std::move(message), path));
    };

    try {
        auto root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return corrupted("top level is not a mapping");
        }

        auto filePromptset = root["promptset"] ? root["promptset"].as<std::string>()
                                               : std::string(promptset);
        EloRatingSystem system(
            root["k_factor"] ? root["k_factor"].as<int>() : kDefaultKFactor,
            root["starting_elo"] ? root["starting_elo"].as<double>() : kDefaultStartingElo,
            std::move(filePromptset));

        if (const auto ratings = root["ratings"]) {
            if (!ratings.IsMap()) {
                return corrupted("'ratings' is not a mapping");
            }
            for (auto it = ratings.begin(); it != ratings.end(); ++it) {
                auto key = RatingKey::parse(it->first.as<std::string>());
                if (!key) {
                    return corrupted(std::string(key.error().message()));
                }
                system.setRating(key.value(), it->second.as<double>());
            }
        }

        if (const auto history = root["match_history"]) {
            if (!history.IsSequence()) {
                return corrupted("'match_history' is not a sequence");
            }
            for (const auto& node : history) {
                auto record = parseRecord(node);
                if (!record) {
                    return corrupted(std::string(record.error().message()));
                }
                system.matchHistory_.push_back(std::move(record).value());
            }
        }

        MRK_LOG_INFO(LogCategory::Elo, "Loaded ELO ratings from " + path.string() + " with " +
                                           std::to_string(system.ratings_.size()) +
                                           " models for promptset '" + system.promptset_ + "'");
        return RankResult<EloRatingSystem>::ok(std::move(system));
    } catch (const YAML::Exception& e) {
        return corrupted(e.what());
    }
}

}  // namespace mrk::rating
