/// @file ranker_runner.cpp
/// @brief RankerRunner and configuration helpers.

#include "mrk/app/ranker_runner.hpp"

#include "mrk/analysis/gap_analyzer.hpp"
#include "mrk/foundation/rank_logger.hpp"
#include "mrk/rating/bradley_terry.hpp"
#include "mrk/rating/direct_comparison.hpp"
#include "mrk/rating/elo_rating_system.hpp"
#include "mrk/rating/focus_ranking.hpp"
#include "mrk/rating/leaderboard.hpp"
#include "mrk/store/outcome_aggregator.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string_view>

namespace mrk::app {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RankError;
using foundation::RankResult;

namespace {

void printRanking(std::ostream& out, const std::vector<rating::LeaderboardEntry>& entries) {
    int rank = 1;
    for (const auto& entry : entries) {
        out << std::setw(4) << rank++ << "  " << std::left << std::setw(32) << entry.model
            << std::right << std::fixed << std::setprecision(0) << entry.rating << "\n";
    }
}

std::string formatRatio(double ratio) {
    if (std::isinf(ratio)) {
        return "inf";
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << ratio;
    return out.str();
}

}  // namespace

// -- Configuration -----------------------------------------------------------

std::vector<std::string> defaultCategories() {
    return {"General Knowledge", "Creative Writing", "Programming", "Reasoning",
            "Summarization"};
}

std::filesystem::path RankerConfig::ratingsPath() const {
    return leaderboardDir / (promptset + "_elo_ratings.json");
}

RankerConfig buildRankerConfig(const ConfigManager& config) {
    RankerConfig cfg;

    auto archiveDir = config.get<std::string>("ranker.archive_dir");
    if (archiveDir) {
        cfg.archiveDir = archiveDir.value();
    }

    auto leaderboardDir = config.get<std::string>("ranker.leaderboard_dir");
    if (leaderboardDir) {
        cfg.leaderboardDir = leaderboardDir.value();
    }

    cfg.promptset = config.getOr<std::string>("ranker.promptset", cfg.promptset);

    cfg.kFactor = config.getOr<int>("elo.k_factor", cfg.kFactor);
    cfg.startingElo = config.getOr<double>("elo.starting_elo", cfg.startingElo);

    cfg.btMaxIterations =
        config.getOr<int>("bradley_terry.max_iterations", cfg.btMaxIterations);
    cfg.btConvergenceThreshold = config.getOr<double>("bradley_terry.convergence_threshold",
                                                      cfg.btConvergenceThreshold);

    cfg.focusMaxDepth = config.getOr<int>("focus.max_depth", cfg.focusMaxDepth);

    cfg.minComparisons =
        config.getOr<unsigned int>("analyzer.min_comparisons", cfg.minComparisons);
    cfg.minPerCategory =
        config.getOr<unsigned int>("analyzer.min_per_category", cfg.minPerCategory);
    cfg.maxRatingDiff = config.getOr<double>("analyzer.max_rating_diff", cfg.maxRatingDiff);

    auto maxSuggestions = config.get<unsigned int>("analyzer.max_suggestions");
    if (maxSuggestions) {
        cfg.maxSuggestions = maxSuggestions.value();
    }

    auto categories =
        config.get<std::vector<std::string>>("promptsets." + cfg.promptset + ".categories");
    if (categories && !categories.value().empty()) {
        cfg.categories = std::move(categories).value();
    }

    return cfg;
}

RankResult<void> loadConfig(ConfigManager& config, const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("MRK_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    return config.load(configPath);
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

RankResult<Command> parseCommand(int argc, char* argv[]) {
    Command command;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (command.name.empty()) {
            command.name = std::string(arg);
        } else {
            command.args.emplace_back(arg);
        }
    }
    if (command.name.empty()) {
        return RankResult<Command>::err(RankError(
            ErrorCode::InvalidArgument,
            "usage: mrk_ranker [--config <file>] <elo [--refresh]|bt|direct|focus|suggest> [args...]"));
    }
    return RankResult<Command>::ok(std::move(command));
}

// -- RankerRunner ------------------------------------------------------------

RankerRunner::RankerRunner(RankerConfig config, const store::OutcomeStore& store,
                           std::ostream& out)
    : config_(std::move(config)), store_(store), out_(out) {}

store::Scope RankerRunner::scope() const {
    store::Scope scope;
    scope.promptset = config_.promptset;
    return scope;
}

RankResult<void> RankerRunner::run(const Command& command) {
    if (command.name == "elo") {
        bool refresh = false;
        for (const auto& arg : command.args) {
            if (arg != "--refresh") {
                return RankResult<void>::err(
                    RankError(ErrorCode::InvalidArgument, "unknown elo option: " + arg));
            }
            refresh = true;
        }
        return runElo(refresh);
    }
    if (command.name == "bt") {
        return runBradleyTerry(command.args);
    }
    if (command.name == "direct") {
        return runDirect(command.args);
    }
    if (command.name == "focus") {
        if (command.args.size() != 1) {
            return RankResult<void>::err(
                RankError(ErrorCode::InvalidArgument, "focus takes exactly one model"));
        }
        return runFocus(command.args.front());
    }
    if (command.name == "suggest") {
        return runSuggest();
    }
    return RankResult<void>::err(
        RankError(ErrorCode::InvalidArgument, "unknown command: " + command.name));
}

RankResult<void> RankerRunner::runElo(bool refresh) {
    auto system = rating::generateRatings(store_, scope(), config_.ratingsPath(), refresh,
                                          config_.kFactor, config_.startingElo);
    if (!system) {
        return RankResult<void>::err(system.error());
    }

    const auto board = rating::buildLeaderboard(system.value());
    out_ << "Overall Rankings (" << config_.promptset << ")\n";
    printRanking(out_, board.overall);
    for (const auto& [category, entries] : board.categories) {
        out_ << "\n" << category << " Rankings\n";
        printRanking(out_, entries);
    }
    return RankResult<void>::ok();
}

RankResult<void> RankerRunner::runBradleyTerry(const std::vector<std::string>& models) {
    store::OutcomeAggregator aggregator(store_);
    auto subset = models.empty() ? aggregator.knownModels(scope()) : models;
    if (subset.size() < 2) {
        return RankResult<void>::err(RankError(
            ErrorCode::InvalidArgument, "Bradley-Terry needs at least two models"));
    }

    rating::BradleyTerryModel model(config_.btMaxIterations, config_.btConvergenceThreshold);
    model.fit(aggregator.buildWinMatrix(subset, scope()));

    auto rankings = model.getRankings();
    if (!rankings) {
        return RankResult<void>::err(rankings.error());
    }

    out_ << "Bradley-Terry Rankings (" << config_.promptset << ", "
         << model.iterations() << " iterations"
         << (model.converged() ? "" : ", not converged") << ")\n";
    int rank = 1;
    for (const auto& [name, strength] : rankings.value()) {
        out_ << std::setw(4) << rank++ << "  " << std::left << std::setw(32) << name
             << std::right << std::fixed << std::setprecision(4) << strength << "\n";
    }
    return RankResult<void>::ok();
}

RankResult<void> RankerRunner::runDirect(const std::vector<std::string>& models) {
    if (models.size() < 2) {
        return RankResult<void>::err(RankError(
            ErrorCode::InvalidArgument, "direct ranking needs at least two models"));
    }

    rating::DirectComparisonRanking ranking(store_);
    if (!ranking.computeRankings(models, scope())) {
        out_ << "Missing comparisons:\n";
        for (const auto& missing : ranking.getMissingComparisonCommands()) {
            out_ << "  " << missing.modelA << " vs " << missing.modelB
                 << " (promptset " << missing.promptset << ")\n";
        }
        return RankResult<void>::err(RankError(
            ErrorCode::RankingsNotComputed,
            std::to_string(ranking.missingComparisons().size()) + " comparisons are missing"));
    }

    auto rankings = ranking.getRankings();
    if (!rankings) {
        return RankResult<void>::err(rankings.error());
    }

    out_ << "Direct Comparison Rankings (" << config_.promptset << ")\n";
    int rank = 1;
    for (const auto& [name, score] : rankings.value()) {
        out_ << std::setw(4) << rank++ << "  " << std::left << std::setw(32) << name
             << std::right << std::fixed << std::setprecision(1) << score * 100.0 << "%\n";
    }
    return RankResult<void>::ok();
}

RankResult<void> RankerRunner::runFocus(const std::string& focusModel) {
    rating::FocusRanking ranking(focusModel, store_);
    auto ratios = ranking.computeRankings(scope(), config_.focusMaxDepth);
    if (ratios.empty()) {
        return RankResult<void>::err(RankError(
            ErrorCode::NotFound, "focus model '" + focusModel + "' has no comparisons"));
    }

    out_ << "Focus Rankings against " << focusModel << " (" << config_.promptset
         << ", max depth " << config_.focusMaxDepth << ")\n";
    int rank = 1;
    for (const auto& entry : ranking.getRankingTable(ratios)) {
        out_ << std::setw(4) << rank++ << "  " << std::left << std::setw(32) << entry.model
             << std::right << std::setw(8) << formatRatio(entry.ratio) << "  "
             << rating::ratioKindName(entry.kind) << "\n";
    }
    return RankResult<void>::ok();
}

RankResult<void> RankerRunner::runSuggest() {
    std::unique_ptr<rating::EloRatingSystem> ratings;
    const auto path = config_.ratingsPath();
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto loaded = rating::EloRatingSystem::loadRatings(path, config_.promptset);
        if (loaded) {
            ratings = std::make_unique<rating::EloRatingSystem>(std::move(loaded).value());
        } else {
            MRK_LOG_WARN(LogCategory::Core, "Continuing without ELO ratings: " +
                                                std::string(loaded.error().message()));
        }
    }

    analysis::GapAnalyzer analyzer(store_, scope(), config_.categories, ratings.get());
    const auto suggestions =
        analyzer.generateSuggestions(config_.minComparisons, config_.minPerCategory,
                                     config_.maxRatingDiff, config_.maxSuggestions);

    if (suggestions.empty()) {
        out_ << "No additional comparisons suggested\n";
        return RankResult<void>::ok();
    }

    out_ << "Suggested comparisons (" << config_.promptset << ")\n";
    for (const auto& s : suggestions) {
        out_ << "  [" << static_cast<int>(s.priority) << "] " << s.modelA << " vs " << s.modelB
             << ": " << s.reason << "\n";
    }
    return RankResult<void>::ok();
}

}  // namespace mrk::app
