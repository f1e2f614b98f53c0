#pragma once

/// @file ranker_runner.hpp
/// @brief Configuration and command dispatch for the mrk_ranker executable.
///
/// The runner is a thin consumer of the engine: it reads outcomes from an
/// OutcomeStore, prints plain-text reports and owns the load -> mutate ->
/// save step of the ratings file.

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "mrk/foundation/config_manager.hpp"
#include "mrk/foundation/rank_result.hpp"
#include "mrk/store/outcome_store.hpp"

namespace mrk::app {

/// Categories of a promptset that declares none.
[[nodiscard]] std::vector<std::string> defaultCategories();

/// Settings of one ranker invocation.
struct RankerConfig {
    std::filesystem::path archiveDir = "test_archive";
    std::filesystem::path leaderboardDir = "leaderboard";
    std::string promptset = "basic1";

    int kFactor = 32;
    double startingElo = 1400.0;

    int btMaxIterations = 100;
    double btConvergenceThreshold = 1e-6;

    int focusMaxDepth = 3;

    uint32_t minComparisons = 5;
    uint32_t minPerCategory = 2;
    double maxRatingDiff = 50.0;
    std::size_t maxSuggestions = 10;

    std::vector<std::string> categories = defaultCategories();

    /// <leaderboardDir>/<promptset>_elo_ratings.json
    [[nodiscard]] std::filesystem::path ratingsPath() const;
};

/// Build a RankerConfig from @p config; absent keys keep their defaults.
[[nodiscard]] RankerConfig buildRankerConfig(const foundation::ConfigManager& config);

/// Load @p config from @p defaultPath, or from MRK_CONFIG_PATH when set.
foundation::RankResult<void> loadConfig(foundation::ConfigManager& config,
                                        const std::filesystem::path& defaultPath);

/// Value of "--config <path>" in argv, or an empty path.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// A command name with its positional arguments.
struct Command {
    std::string name;
    std::vector<std::string> args;
};

/// Extract the command from argv, skipping "--config <path>".
/// @return InvalidArgument when no command is given.
[[nodiscard]] foundation::RankResult<Command> parseCommand(int argc, char* argv[]);

/// Executes ranker commands against an outcome store.
class RankerRunner {
public:
    RankerRunner(RankerConfig config, const store::OutcomeStore& store, std::ostream& out);

    /// Dispatch @p command: elo [--refresh] | bt <models...> |
    /// direct <models...> | focus <model> | suggest.
    foundation::RankResult<void> run(const Command& command);

    /// Print the leaderboard from the saved ratings, building and saving
    /// them first when the file is missing or @p refresh is set.
    foundation::RankResult<void> runElo(bool refresh = false);

    /// Fit Bradley-Terry strengths over @p models (all known models if empty).
    foundation::RankResult<void> runBradleyTerry(const std::vector<std::string>& models);

    /// Rank @p models by direct results, or list the comparisons to run.
    foundation::RankResult<void> runDirect(const std::vector<std::string>& models);

    foundation::RankResult<void> runFocus(const std::string& focusModel);

    foundation::RankResult<void> runSuggest();

    [[nodiscard]] const RankerConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] store::Scope scope() const;

    RankerConfig config_;
    const store::OutcomeStore& store_;
    std::ostream& out_;
};

}  // namespace mrk::app
