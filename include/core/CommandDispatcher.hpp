#pragma once
/** @file  CommandDispatcher.hpp
 *  @brief Turns a motion intent into a radio command plus the optimistic state change.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <optional>
#include <string>

// Elero headers
#include "core/Clock.hpp"
#include "core/CoverState.hpp"

namespace elero {
  namespace io {
    class Transmitter;
  }
  namespace core {

    class ErrorMonitor;

    /// Follow-up work a command wants scheduled after \p delay.
    struct Completion {
      enum class Kind { PollStatus, FinishSetPosition };

      Kind kind{ Kind::PollStatus };
      Seconds delay{ 0.0 };
      int target{ 0 }; ///< FinishSetPosition only
    };

    struct DispatchResult {
      bool issued{ false }; ///< a radio command went out and commandToken moved on
      std::optional<Completion> completion;
    };

    /**
 * @class CommandDispatcher
 * @brief Writes the optimistic model for every command of one channel.
 *
 *  * Every issued command bumps CoverRuntimeState::commandToken.
 *  * Rejected commands (InvalidCommand) leave the state untouched and transmit nothing.
 *  * Arming the returned Completion is the controller's job.
 */
    class CommandDispatcher {
    public:
      CommandDispatcher(CoverRuntimeState& state, io::Transmitter& transmitter,
                        ErrorMonitor& errors, std::string transmitterSerial, int channel);

      //---public API------------------------------------------------------
      DispatchResult open(TimePoint now);
      DispatchResult close(TimePoint now);
      DispatchResult stop(TimePoint now);
      DispatchResult setPosition(int target, TimePoint now);
      DispatchResult ventilationTilt();
      DispatchResult intermediate();
      DispatchResult setTiltPosition(int tilt);

      /// Timer side of setPosition(): stop, then pin the target.
      DispatchResult finishSetPosition(int target, TimePoint now);

    private:
      DispatchResult move(Movement direction, TimePoint now, std::optional<double> base,
                          bool writePosition);
      DispatchResult rest(CoverState state, int position);
      void beginCommand(Operation op);
      void reject(const std::string& detail);

      CoverRuntimeState& state_;
      io::Transmitter& transmitter_;
      ErrorMonitor& errors_;
      std::string serial_;
      int channel_;
    };

  } // namespace core
} // namespace elero
