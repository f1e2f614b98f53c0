#pragma once

/// @file rank_result.hpp
/// @brief RankResult<T> alias binding Result to RankError.

#include "mrk/core/result.hpp"
#include "mrk/foundation/rank_error.hpp"

namespace mrk::foundation {

/// Result type used by every store, estimator and analyzer operation
/// that can fail.
///
/// Example:
/// @code
///   RankResult<ProbabilityMatrix> probabilities() const {
///       if (!fitted_) {
///           return RankResult<ProbabilityMatrix>::err(
///               RankError(ErrorCode::ModelNotFitted, "call fit() first"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using RankResult = mrk::Result<T, RankError>;

}  // namespace mrk::foundation
