#pragma once

/// @file mrk.hpp
/// @brief Umbrella header for the model ranking engine.

#include "mrk/version.hpp"
#include "mrk/core/result.hpp"

#include "mrk/foundation/config_manager.hpp"
#include "mrk/foundation/error_code.hpp"
#include "mrk/foundation/rank_error.hpp"
#include "mrk/foundation/rank_logger.hpp"
#include "mrk/foundation/rank_result.hpp"

#include "mrk/store/archive_outcome_store.hpp"
#include "mrk/store/memory_outcome_store.hpp"
#include "mrk/store/outcome_aggregator.hpp"
#include "mrk/store/outcome_store.hpp"
#include "mrk/store/pair_outcome.hpp"

#include "mrk/rating/bradley_terry.hpp"
#include "mrk/rating/direct_comparison.hpp"
#include "mrk/rating/elo_rating_system.hpp"
#include "mrk/rating/focus_ranking.hpp"
#include "mrk/rating/leaderboard.hpp"
#include "mrk/rating/rating_key.hpp"

#include "mrk/analysis/gap_analyzer.hpp"
