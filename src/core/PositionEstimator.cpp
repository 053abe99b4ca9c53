/* @file PositionEstimator.cpp
 * @brief elapsed-time interpolation of cover position
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// Elero headers
#include "core/PositionEstimator.hpp"

namespace elero::core {

  double estimatePosition(double tmpPosition, double elapsedSeconds, double travelTime,
                          Movement movement) {
    const double delta = std::max(elapsedSeconds, 0.0) / travelTime * 100.0;
    switch (movement) {
    case Movement::Opening:
      return std::min(tmpPosition + delta, 100.0);
    case Movement::Closing:
      return std::max(tmpPosition - delta, 0.0);
    case Movement::Idle:
    default:
      return std::clamp(tmpPosition, 0.0, 100.0);
    }
  }

  int toSliderPosition(double estimate) {
    return clampPosition(static_cast<int>(std::lround(estimate)));
  }

  std::optional<double> estimateInFlight(const CoverRuntimeState& state, TimePoint now) {
    if (!state.tmpPosition)
      return std::nullopt;
    const double elapsed = state.startTime ? Seconds(now - *state.startTime).count() : 0.0;
    return estimatePosition(*state.tmpPosition, elapsed, state.travelTime, state.movement);
  }

} // namespace elero::core
