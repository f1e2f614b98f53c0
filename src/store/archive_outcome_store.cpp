/// @file archive_outcome_store.cpp
/// @brief ArchiveOutcomeStore implementation (yaml-cpp reads the JSON files).

#include "mrk/store/archive_outcome_store.hpp"

#include "mrk/foundation/rank_logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <limits>

namespace mrk::store {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RankError;
using foundation::RankResult;

namespace {

constexpr std::string_view kPairSeparator = "__vs__";
constexpr std::string_view kExtension = ".json";

/// Read a count in [0, UINT32_MAX]; a missing field counts as zero.
uint32_t readCount(const YAML::Node& node, const char* field) {
    const auto value = node[field];
    if (!value) {
        return 0;
    }
    auto count = value.as<long long>();
    if (count < 0) {
        throw YAML::RepresentationException(value.Mark(), std::string("negative count in ") + field);
    }
    if (count > static_cast<long long>(std::numeric_limits<uint32_t>::max())) {
        throw YAML::RepresentationException(value.Mark(),
                                            std::string("count out of range in ") + field);
    }
    return static_cast<uint32_t>(count);
}

void emitOutcome(YAML::Emitter& out, const PairOutcome& outcome) {
    out << YAML::BeginMap;
    out << YAML::Key << "model_a" << YAML::Value << outcome.modelA();
    out << YAML::Key << "model_b" << YAML::Value << outcome.modelB();
    out << YAML::Key << "category_results" << YAML::Value << YAML::BeginMap;
    for (const auto& c : outcome.categories()) {
        out << YAML::Key << c.category << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "category" << YAML::Value << c.category;
        out << YAML::Key << "model_a" << YAML::Value << outcome.modelA();
        out << YAML::Key << "model_b" << YAML::Value << outcome.modelB();
        out << YAML::Key << "wins_a" << YAML::Value << c.winsA;
        out << YAML::Key << "wins_b" << YAML::Value << c.winsB;
        out << YAML::Key << "ties" << YAML::Value << c.ties;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
}

}  // namespace

ArchiveOutcomeStore::ArchiveOutcomeStore(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path ArchiveOutcomeStore::comparisonsDir(std::string_view promptset) const {
    return root_ / std::string(promptset) / "comparisons";
}

std::filesystem::path ArchiveOutcomeStore::comparisonPath(
    std::string_view modelA, std::string_view modelB, std::string_view promptset) const {
    return comparisonsDir(promptset) / comparisonFileName(modelA, modelB);
}

std::string ArchiveOutcomeStore::sanitizeModelName(std::string_view model) {
    std::string name(model);
    std::replace(name.begin(), name.end(), ':', '_');
    std::replace(name.begin(), name.end(), '/', '_');
    return name;
}

std::string ArchiveOutcomeStore::comparisonFileName(std::string_view modelA,
                                                    std::string_view modelB) {
    UnorderedPairKey key{std::string(modelA), std::string(modelB)};
    std::string name = sanitizeModelName(key.first());
    name += kPairSeparator;
    name += sanitizeModelName(key.second());
    name += kExtension;
    return name;
}

RankResult<std::pair<std::string, std::string>>
ArchiveOutcomeStore::parseComparisonFilename(std::string_view filename) {
    using Parsed = RankResult<std::pair<std::string, std::string>>;

    if (filename.size() <= kExtension.size() || !filename.ends_with(kExtension)) {
        return Parsed::err(RankError(ErrorCode::InvalidComparisonFilename,
                                     "not a comparison file: " + std::string(filename)));
    }
    auto stem = filename.substr(0, filename.size() - kExtension.size());

    auto sep = stem.find(kPairSeparator);
    if (sep == std::string_view::npos ||
        stem.find(kPairSeparator, sep + kPairSeparator.size()) != std::string_view::npos) {
        return Parsed::err(RankError(ErrorCode::InvalidComparisonFilename,
                                     "invalid comparison filename format: " + std::string(filename)));
    }

    std::string modelA(stem.substr(0, sep));
    std::string modelB(stem.substr(sep + kPairSeparator.size()));
    if (modelA.empty() || modelB.empty()) {
        return Parsed::err(RankError(ErrorCode::InvalidComparisonFilename,
                                     "empty model name in filename: " + std::string(filename)));
    }
    std::replace(modelA.begin(), modelA.end(), '_', ':');
    std::replace(modelB.begin(), modelB.end(), '_', ':');
    return Parsed::ok({std::move(modelA), std::move(modelB)});
}

RankResult<PairOutcome> ArchiveOutcomeStore::readOutcomeFile(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        if (!root.IsMap() || !root["model_a"] || !root["model_b"]) {
            return RankResult<PairOutcome>::err(RankError(
                ErrorCode::OutcomeCorrupted, "missing model fields in " + path.string(), path));
        }
        const auto results = root["category_results"];
        if (!results || !results.IsMap()) {
            return RankResult<PairOutcome>::err(RankError(
                ErrorCode::OutcomeCorrupted, "missing category_results in " + path.string(), path));
        }

        std::vector<CategoryOutcome> categories;
        for (auto it = results.begin(); it != results.end(); ++it) {
            CategoryOutcome c;
            c.category = it->first.as<std::string>();
            c.winsA = readCount(it->second, "wins_a");
            c.winsB = readCount(it->second, "wins_b");
            c.ties = readCount(it->second, "ties");
            categories.push_back(std::move(c));
        }

        return RankResult<PairOutcome>::ok(PairOutcome(root["model_a"].as<std::string>(),
                                                       root["model_b"].as<std::string>(),
                                                       std::move(categories)));
    } catch (const YAML::Exception& e) {
        return RankResult<PairOutcome>::err(RankError(
            ErrorCode::OutcomeCorrupted,
            "failed to read " + path.string() + ": " + e.what(), path));
    }
}

foundation::RankResult<void> ArchiveOutcomeStore::save(
    const PairOutcome& outcome, std::string_view promptset) const {
    auto dir = comparisonsDir(promptset);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return RankResult<void>::err(RankError(
            ErrorCode::OutcomeWriteFailed, "failed to create " + dir.string() + ": " + ec.message()));
    }

    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    emitOutcome(out, outcome);

    auto path = dir / comparisonFileName(outcome.modelA(), outcome.modelB());
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return RankResult<void>::err(RankError(
            ErrorCode::OutcomeWriteFailed, "failed to open " + path.string() + " for writing"));
    }
    file << out.c_str() << '\n';
    if (!file) {
        return RankResult<void>::err(RankError(
            ErrorCode::OutcomeWriteFailed, "failed to write " + path.string()));
    }

    MRK_LOG_INFO(LogCategory::Store, "Saved comparison result to " + path.string());
    return RankResult<void>::ok();
}

std::optional<PairOutcome> ArchiveOutcomeStore::load(
    std::string_view modelA, std::string_view modelB, const Scope& scope) const {
    auto path = comparisonPath(modelA, modelB, scope.promptset);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    auto parsed = readOutcomeFile(path);
    if (!parsed) {
        MRK_LOG_ERROR(LogCategory::Store, std::string(parsed.error().message()));
        return std::nullopt;
    }

    const auto& outcome = parsed.value();
    if (!outcome.key().contains(modelA) || !outcome.key().contains(modelB)) {
        MRK_LOG_ERROR(LogCategory::Store,
                      "Comparison file " + path.string() + " records " + outcome.modelA() +
                          " vs " + outcome.modelB() + ", expected " + std::string(modelA) +
                          " vs " + std::string(modelB));
        return std::nullopt;
    }

    MRK_LOG_DEBUG(LogCategory::Store, "Loaded comparison result from " + path.string());
    return outcome.orientedTo(modelA).restrictedTo(scope);
}

std::vector<UnorderedPairKey> ArchiveOutcomeStore::listAll(const Scope& scope) const {
    std::vector<UnorderedPairKey> keys;
    auto dir = comparisonsDir(scope.promptset);

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        MRK_LOG_WARN(LogCategory::Store, "No comparison archive at " + dir.string());
        return keys;
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == kExtension) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    MRK_LOG_INFO(LogCategory::Store, "Found " + std::to_string(files.size()) +
                                         " comparison files for promptset '" +
                                         scope.promptset + "'");

    for (const auto& path : files) {
        auto names = parseComparisonFilename(path.filename().string());
        if (!names) {
            MRK_LOG_WARN(LogCategory::Store, std::string(names.error().message()));
            continue;
        }
        auto parsed = readOutcomeFile(path);
        if (!parsed) {
            MRK_LOG_ERROR(LogCategory::Store, std::string(parsed.error().message()));
            continue;
        }
        keys.push_back(parsed.value().key());
    }
    return keys;
}

}  // namespace mrk::store
