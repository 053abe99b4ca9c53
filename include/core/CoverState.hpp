#pragma once
/** @file  CoverState.hpp
 *  @brief Per-channel runtime record and the small enums describing it.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

// Elero headers
#include "core/Clock.hpp"

namespace elero {
  namespace core {

    // Position slider values.
    constexpr int kPositionClosed = 0;
    constexpr int kPositionTiltVentilation = 25;
    constexpr int kPositionUndefined = 50;
    constexpr int kPositionIntermediate = 75;
    constexpr int kPositionOpen = 100;

    enum class Movement { Idle, Opening, Closing };
    enum class Operation { None, Open, Close, Stop, SetPosition, Tilt };
    enum class CoverState {
      Unknown,
      Open,
      Closed,
      Opening,
      Closing,
      Stopped,
      Intermediate,
      TiltVentilation,
      Undefined
    };

    /// Label surfaced to the host ("open", "ventilation/tilt", ...).
    inline const char* toString(CoverState s) {
      switch (s) {
      case CoverState::Open:
        return "open";
      case CoverState::Closed:
        return "closed";
      case CoverState::Opening:
        return "opening";
      case CoverState::Closing:
        return "closing";
      case CoverState::Stopped:
        return "stopped";
      case CoverState::Intermediate:
        return "intermediate";
      case CoverState::TiltVentilation:
        return "ventilation/tilt";
      case CoverState::Undefined:
        return "undefined";
      case CoverState::Unknown:
      default:
        return "unknown";
      }
    }

    inline int clampPosition(int value) { return std::clamp(value, kPositionClosed, kPositionOpen); }

    /// Settled state for a cover resting at \p position.
    inline CoverState stateAtRest(int position) {
      if (position == kPositionOpen)
        return CoverState::Open;
      if (position == kPositionClosed)
        return CoverState::Closed;
      return CoverState::Stopped;
    }

    /**
 * @struct CoverRuntimeState
 * @brief Mutable model of one channel. Written only by CommandDispatcher and
 *        StatusReconciler, owned by CoverChannelController.
 *
 *  * std::nullopt always means "unknown", never a sentinel number.
 *  * commandToken grows with every issued command; a scheduled completion armed
 *    under an older token is stale.
 */
    struct CoverRuntimeState {
      std::optional<int> position;
      std::optional<int> tiltPosition;
      Movement movement{ Movement::Idle };
      std::optional<bool> closed;
      std::optional<int> lastKnownPosition;
      std::optional<double> tmpPosition; ///< position when the current motion began
      Operation lastOperation{ Operation::None };
      std::optional<TimePoint> startTime;
      std::optional<std::string> lastStatus; ///< raw text of the latest status
      CoverState state{ CoverState::Unknown };
      double travelTime{ 0.0 };
      std::uint64_t commandToken{ 0 };
    };

  } // namespace core
} // namespace elero
