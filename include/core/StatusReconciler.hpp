#pragma once
/** @file  StatusReconciler.hpp
 *  @brief Authoritative state transitions driven by actuator status reports.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

// Elero headers
#include "core/Clock.hpp"
#include "core/CoverState.hpp"
#include "protocols/Response.hpp"

namespace elero::core {

  class ErrorMonitor;

  /**
 * @class StatusReconciler
 * @brief Overrides (or confirms) the optimistic model with what the hardware reports.
 *
 *  * Every status is applied synchronously and completely, in arrival order.
 *  * lastKnownPosition follows every known resulting position.
 *  * A report that leaves the cover at rest ends the current command: the token is
 *    bumped so a pending completion for that motion is recognised as stale.
 *  * Blocking/Overheated/Timeout and unknown texts reset to Unknown and are reported.
 */
  class StatusReconciler {
  public:
    StatusReconciler(CoverRuntimeState& state, ErrorMonitor& errors, std::string transmitterSerial,
                     int channel);

    void apply(const protocols::Response& response, TimePoint now);

  private:
    void settle(CoverState state, int position, int tilt, bool closed);
    void reset();
    void beginMotion(Movement direction, TimePoint now);
    void stoppedInUndefinedPosition(TimePoint now);
    void endCommand();

    CoverRuntimeState& state_;
    ErrorMonitor& errors_;
    std::string serial_;
    int channel_;
  };

} // namespace elero::core
