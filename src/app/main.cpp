/// @file main.cpp
/// @brief mrk_ranker entry point.
///
/// Ranks models from the comparison archive:
///   mrk_ranker [--config <file>] elo [--refresh]
///   mrk_ranker [--config <file>] bt [models...]
///   mrk_ranker [--config <file>] direct <model> <model> [models...]
///   mrk_ranker [--config <file>] focus <model>
///   mrk_ranker [--config <file>] suggest

#include <cstdlib>
#include <iostream>

#include "mrk/app/ranker_runner.hpp"
#include "mrk/foundation/config_manager.hpp"
#include "mrk/store/archive_outcome_store.hpp"

int main(int argc, char* argv[]) {
    auto command = mrk::app::parseCommand(argc, argv);
    if (!command) {
        std::cerr << command.error().message() << "\n";
        return EXIT_FAILURE;
    }

    mrk::foundation::ConfigManager config;
    auto configPath = mrk::app::parseConfigArg(argc, argv);
    if (!configPath.empty() || std::getenv("MRK_CONFIG_PATH") != nullptr) {
        auto loadResult = mrk::app::loadConfig(config, configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto rankerCfg = mrk::app::buildRankerConfig(config);
    mrk::store::ArchiveOutcomeStore store(rankerCfg.archiveDir);
    mrk::app::RankerRunner runner(rankerCfg, store, std::cout);

    auto result = runner.run(command.value());
    if (!result) {
        std::cerr << result.error().message() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
