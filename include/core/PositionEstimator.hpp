#pragma once
/** @file  PositionEstimator.hpp
 *  @brief Time-based position estimate for a cover that reports no position.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>

// Elero headers
#include "core/CoverState.hpp"

namespace elero::core {

  /**
   * @brief Position reached after moving for \p elapsedSeconds from \p tmpPosition.
   *
   * A full 0..100 traversal takes \p travelTime seconds (> 0, checked at channel
   * construction). The result is clamped to [0,100]; Idle returns the start clamped.
   */
  double estimatePosition(double tmpPosition, double elapsedSeconds, double travelTime,
                          Movement movement);

  /// Estimate rounded to the integer slider scale.
  int toSliderPosition(double estimate);

  /// Where a moving cover is now, or std::nullopt if no base was recorded.
  std::optional<double> estimateInFlight(const CoverRuntimeState& state, TimePoint now);

} // namespace elero::core
