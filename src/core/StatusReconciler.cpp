/* @file StatusReconciler.cpp
 * @brief status code -> cover state transition table
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <utility>

// Elero headers
#include "core/ErrorMonitor.hpp"
#include "core/PositionEstimator.hpp"
#include "core/StatusReconciler.hpp"

using namespace elero::core;
using elero::protocols::StatusCode;

StatusReconciler::StatusReconciler(CoverRuntimeState& state, ErrorMonitor& errors,
                                   std::string transmitterSerial, int channel)
    : state_(state), errors_(errors), serial_(std::move(transmitterSerial)), channel_(channel) {}

void StatusReconciler::apply(const protocols::Response& response, TimePoint now) {
  state_.lastStatus = response.status;

  const auto code = response.code();
  if (!code) {
    reset();
    errors_.notifyFailure(FaultReport{ FaultKind::UnhandledStatus, serial_, channel_,
                                       "unhandled response: '" + response.status + "'." });
  } else {
    switch (*code) {
    case StatusCode::NoInformation:
      reset(); // closed is unknown too, not false
      break;
    case StatusCode::TopPositionStop:
      settle(CoverState::Open, kPositionOpen, kPositionUndefined, false);
      break;
    case StatusCode::BottomPositionStop:
      settle(CoverState::Closed, kPositionClosed, kPositionUndefined, true);
      break;
    case StatusCode::IntermediatePositionStop:
      settle(CoverState::Intermediate, kPositionIntermediate, kPositionIntermediate, false);
      break;
    case StatusCode::TiltVentilationPosStop:
    case StatusCode::TopPosStopWithTiltPos:
      settle(CoverState::TiltVentilation, kPositionTiltVentilation, kPositionTiltVentilation,
             false);
      break;
    case StatusCode::BottomPosStopWithIntPos:
      settle(CoverState::Intermediate, kPositionIntermediate, kPositionIntermediate, true);
      break;
    case StatusCode::StartToMoveUp:
    case StatusCode::MovingUp:
      beginMotion(Movement::Opening, now);
      break;
    case StatusCode::StartToMoveDown:
    case StatusCode::MovingDown:
      beginMotion(Movement::Closing, now);
      break;
    case StatusCode::StoppedInUndefinedPosition:
      stoppedInUndefinedPosition(now);
      break;
    case StatusCode::Blocking:
    case StatusCode::Overheated:
    case StatusCode::Timeout:
      reset();
      errors_.notifyFailure(FaultReport{ FaultKind::DeviceFault, serial_, channel_,
                                         "error response: '" + response.status + "'." });
      break;
    case StatusCode::SwitchingDeviceOff:
    case StatusCode::SwitchingDeviceOn:
      reset();
      break;
    }
  }

  if (state_.position)
    state_.lastKnownPosition = state_.position;
}

void StatusReconciler::endCommand() {
  state_.movement = Movement::Idle;
  state_.startTime.reset();
  ++state_.commandToken;
}

void StatusReconciler::settle(CoverState state, int position, int tilt, bool closed) {
  endCommand();
  state_.state = state;
  state_.position = position;
  state_.tmpPosition = static_cast<double>(position);
  state_.tiltPosition = tilt;
  state_.closed = closed;
}

void StatusReconciler::reset() {
  endCommand();
  state_.state = CoverState::Unknown;
  state_.position.reset();
  state_.tiltPosition.reset();
  state_.closed.reset();
}

// -------------------------------------------------------------------
// StatusReconciler::beginMotion
// Motion we already track keeps its travel clock. Motion we did not start
// (another remote, or a reversal) gets a fresh base so that a later
// "stopped in undefined position" can still be estimated.
// -------------------------------------------------------------------
void StatusReconciler::beginMotion(Movement direction, TimePoint now) {
  const bool tracked = state_.movement == direction && state_.startTime.has_value();
  if (!tracked) {
    std::optional<double> base;
    if (state_.movement != Movement::Idle) {
      base = estimateInFlight(state_, now);
    } else {
      base = state_.position;
      if (!base && state_.lastKnownPosition)
        base = *state_.lastKnownPosition;
    }

    std::cerr << "[StatusReconciler] ch " << channel_ << " motion started outside this host\n";
    ++state_.commandToken;
    state_.tmpPosition = base;
    state_.startTime = now;
  }

  const bool opening = direction == Movement::Opening;
  state_.movement = direction;
  state_.state = opening ? CoverState::Opening : CoverState::Closing;
  state_.tiltPosition = kPositionUndefined;
  state_.closed = false;
  if (state_.lastOperation != Operation::SetPosition) // SetPosition pins it on completion
    state_.position = opening ? kPositionOpen : kPositionClosed;
}

void StatusReconciler::stoppedInUndefinedPosition(TimePoint now) {
  // while moving, lastKnownPosition holds the assumed end stop and is no base
  std::optional<double> estimate;
  if (state_.tmpPosition)
    estimate = estimateInFlight(state_, now);
  else if (state_.movement == Movement::Idle && state_.lastKnownPosition)
    estimate = static_cast<double>(*state_.lastKnownPosition);

  endCommand();
  state_.tiltPosition = kPositionUndefined;

  if (!estimate) {
    state_.state = CoverState::Undefined;
    state_.position.reset();
    state_.closed = false;
    return;
  }

  const int pos = toSliderPosition(*estimate);
  state_.position = pos;
  state_.tmpPosition = static_cast<double>(pos);
  state_.closed = pos == kPositionClosed;
  state_.state = stateAtRest(pos);
}
