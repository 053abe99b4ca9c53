/* @file CommandDispatcher.cpp
 * @brief radio command + optimistic model update for a single cover channel
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <iostream>
#include <utility>

// Elero headers
#include "core/CommandDispatcher.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/PositionEstimator.hpp"
#include "io/Transmitter.hpp"

using namespace elero::core;

CommandDispatcher::CommandDispatcher(CoverRuntimeState& state, io::Transmitter& transmitter,
                                     ErrorMonitor& errors, std::string transmitterSerial,
                                     int channel)
    : state_(state), transmitter_(transmitter), errors_(errors),
      serial_(std::move(transmitterSerial)), channel_(channel) {}

void CommandDispatcher::beginCommand(Operation op) {
  state_.lastOperation = op;
  ++state_.commandToken;
}

void CommandDispatcher::reject(const std::string& detail) {
  errors_.notifyFailure(FaultReport{ FaultKind::InvalidCommand, serial_, channel_, detail });
}

DispatchResult CommandDispatcher::open(TimePoint now) {
  transmitter_.up(channel_);
  return move(Movement::Opening, now, std::nullopt, true);
}

DispatchResult CommandDispatcher::close(TimePoint now) {
  transmitter_.down(channel_);
  return move(Movement::Closing, now, std::nullopt, true);
}

// -------------------------------------------------------------------
// CommandDispatcher::move
// Snapshot the base for interpolation, start the travel clock and, unless the
// caller pins the final position itself, assume the end stop is reached.
// -------------------------------------------------------------------
DispatchResult CommandDispatcher::move(Movement direction, TimePoint now,
                                       std::optional<double> base, bool writePosition) {
  if (!base && state_.movement != Movement::Idle) {
    base = estimateInFlight(state_, now); // reversing: optimistic position is not a base
  } else if (!base) {
    base = state_.position;
    if (!base && state_.lastKnownPosition)
      base = *state_.lastKnownPosition;
  }

  const bool opening = direction == Movement::Opening;
  beginCommand(opening ? Operation::Open : Operation::Close);

  state_.tmpPosition = base;
  state_.startTime = now;
  state_.movement = direction;
  state_.closed = false;
  state_.state = opening ? CoverState::Opening : CoverState::Closing;
  state_.tiltPosition = kPositionUndefined;
  if (writePosition)
    state_.position = opening ? kPositionOpen : kPositionClosed;

  return DispatchResult{ true,
                         Completion{ Completion::Kind::PollStatus, Seconds{ state_.travelTime } } };
}

DispatchResult CommandDispatcher::stop(TimePoint now) {
  transmitter_.stop(channel_);

  const Movement was = state_.movement;
  const auto estimate = was != Movement::Idle ? estimateInFlight(state_, now) : std::nullopt;
  beginCommand(Operation::Stop);

  state_.movement = Movement::Idle;
  state_.startTime.reset();

  if (was == Movement::Idle)
    return DispatchResult{ true, std::nullopt };

  state_.tiltPosition = kPositionUndefined;
  if (estimate) {
    const int pos = toSliderPosition(*estimate);
    state_.position = pos;
    state_.lastKnownPosition = pos;
    state_.tmpPosition = static_cast<double>(pos);
    state_.closed = pos == kPositionClosed;
    state_.state = stateAtRest(pos);
  } else {
    // the optimistic end stop was never reached and nothing tells us where we are
    state_.position.reset();
    state_.closed = false;
    state_.state = CoverState::Stopped;
  }
  return DispatchResult{ true, std::nullopt };
}

DispatchResult CommandDispatcher::setPosition(int target, TimePoint now) {
  if (target < kPositionClosed || target > kPositionOpen) {
    reject("invalid position " + std::to_string(target) + ": must be between 0 and 100");
    return {};
  }
  if (!state_.lastKnownPosition) {
    reject("cannot set position " + std::to_string(target) +
           ": last known position is unavailable");
    return {};
  }

  const int current = *state_.lastKnownPosition;
  if (target == current) {
    std::cerr << "[CommandDispatcher] ch " << channel_ << " already at " << target << "\n";
    return {};
  }

  const Seconds moveTime{ std::abs(target - current) / 100.0 * state_.travelTime };
  if (target > current)
    transmitter_.up(channel_);
  else
    transmitter_.down(channel_);

  auto result = move(target > current ? Movement::Opening : Movement::Closing, now,
                     static_cast<double>(current), false);
  state_.lastOperation = Operation::SetPosition;
  result.completion = Completion{ Completion::Kind::FinishSetPosition, moveTime, target };
  return result;
}

DispatchResult CommandDispatcher::finishSetPosition(int target, TimePoint now) {
  auto result = stop(now);

  state_.position = target;
  state_.lastKnownPosition = target;
  state_.tmpPosition = static_cast<double>(target);
  state_.closed = target == kPositionClosed;
  state_.state = stateAtRest(target);
  return result;
}

DispatchResult CommandDispatcher::rest(CoverState state, int position) {
  beginCommand(Operation::Tilt);
  state_.movement = Movement::Idle;
  state_.startTime.reset();
  state_.closed = false;
  state_.state = state;
  state_.position = position;
  state_.tiltPosition = position;
  return DispatchResult{ true, std::nullopt };
}

DispatchResult CommandDispatcher::ventilationTilt() {
  transmitter_.ventilationTilting(channel_);
  return rest(CoverState::TiltVentilation, kPositionTiltVentilation);
}

DispatchResult CommandDispatcher::intermediate() {
  transmitter_.intermediate(channel_);
  return rest(CoverState::Intermediate, kPositionIntermediate);
}

DispatchResult CommandDispatcher::setTiltPosition(int tilt) {
  if (tilt < kPositionClosed || tilt > kPositionOpen) {
    reject("invalid tilt position " + std::to_string(tilt) + ": must be between 0 and 100");
    return {};
  }
  if (tilt < kPositionUndefined)
    return ventilationTilt();
  if (tilt > kPositionUndefined)
    return intermediate();

  reject("wrong tilt position slider data: " + std::to_string(tilt));
  return {};
}
