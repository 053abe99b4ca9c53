#pragma once

/** @file  CoverChannelController.hpp
 *  @brief Public API for elero::core::CoverChannelController.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

// STL headers
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// third-party headers
#include <nlohmann/json_fwd.hpp>

// Elero headers
#include "core/Clock.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/CoverConfig.hpp"
#include "core/CoverState.hpp"
#include "core/Scheduler.hpp"
#include "core/StatusReconciler.hpp"
#include "protocols/Response.hpp"

namespace elero {
  namespace io {
    class Transmitter;
  }
  namespace core {

    class ErrorMonitor;
    class Logger;
    struct RestoredAttributes;

    /**
 * @class CoverChannelController
 * @brief State machine of one cover channel (transmitter serial + channel 1..15).
 *
 *  * Owns the runtime record, the dispatcher, the reconciler and the single
 *    scheduled-completion slot.
 *  * All methods must run on the scheduler's thread; Transmitter status callbacks
 *    are posted onto the scheduler and consumed in arrival order.
 *  * Nothing here throws after construction: faults are reported to ErrorMonitor.
 */
    class CoverChannelController {

    public:
      /// Throws ConfigurationError on an invalid \p config or a null collaborator.
      CoverChannelController(CoverConfig config, std::shared_ptr<io::Transmitter> transmitter,
                             std::shared_ptr<Scheduler> scheduler,
                             std::shared_ptr<const Clock> clock,
                             std::shared_ptr<ErrorMonitor> errorMonitor);
      ~CoverChannelController();

      CoverChannelController(const CoverChannelController&) = delete;
      CoverChannelController& operator=(const CoverChannelController&) = delete;

      // ---- identity -------------------------------------------------------
      std::string uniqueId() const; ///< "<serial>_<channel>"
      const std::string& name() const { return config_.name; }
      int channel() const { return config_.channel; }
      DeviceCategory deviceClass() const { return config_.category; }
      FeatureSet supportedFeatures() const { return config_.features; }
      bool available() const { return available_; }

      // ---- commands -------------------------------------------------------
      void open();
      void close();
      void stop();
      void setPosition(int position);
      void ventilationTilt();
      void intermediate();
      void openTilt();
      void closeTilt();
      void stopTilt();
      void setTiltPosition(int tilt);
      void update(); ///< ask the Transmitter for a fresh status

      // ---- status ---------------------------------------------------------
      void onStatus(const protocols::Response& response);

      // ---- observable attributes ------------------------------------------
      std::optional<int> position() const { return state_.position; }
      std::optional<int> tiltPosition() const { return state_.tiltPosition; }
      bool isOpening() const { return state_.movement == Movement::Opening; }
      bool isClosing() const { return state_.movement == Movement::Closing; }
      std::optional<bool> isClosed() const { return state_.closed; }
      CoverState state() const { return state_.state; }
      const char* stateLabel() const { return toString(state_.state); }
      const std::optional<std::string>& lastStatus() const { return state_.lastStatus; }
      double travelTime() const { return state_.travelTime; }
      std::optional<int> lastKnownPosition() const { return state_.lastKnownPosition; }
      const CoverRuntimeState& runtimeState() const { return state_; }
      bool hasPendingCompletion() const { return pendingTimer_.has_value(); }

      /// elero_state (when known), travel_time and last_known_position.
      nlohmann::json extraStateAttributes() const;

      // ---- persistence ----------------------------------------------------
      void restore(const RestoredAttributes& attrs);
      RestoredAttributes snapshot() const;

      void attachLogger(std::shared_ptr<Logger> logger);

    private:
      bool allowed(Feature feature, const char* command);
      void settleTimers(std::uint64_t tokenBefore, const std::optional<Completion>& completion);
      void arm(const Completion& completion);
      void cancelPending();
      void onTimer(std::uint64_t token, const Completion& completion);
      void record(const std::string& event);

      CoverConfig config_;
      std::shared_ptr<io::Transmitter> transmitter_;
      std::shared_ptr<Scheduler> scheduler_;
      std::shared_ptr<const Clock> clock_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;

      std::string serial_;
      CoverRuntimeState state_;
      CommandDispatcher dispatcher_;
      StatusReconciler reconciler_;
      std::optional<Scheduler::TimerId> pendingTimer_;
      std::shared_ptr<int> alive_; ///< deferred work holds a weak_ptr to this
      bool available_{ false };
    };

  } // namespace core
} // namespace elero
