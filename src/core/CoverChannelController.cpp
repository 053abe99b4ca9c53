/* @file CoverChannelController.cpp
 * @brief per-channel cover state machine: commands, status and scheduled completions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// Elero headers
#include "core/CoverChannelController.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/StateStore.hpp"
#include "io/Transmitter.hpp"

using namespace elero::core;

namespace {
  // Runs before any member that dereferences the collaborators is built.
  std::string checkedSerial(const CoverConfig& config,
                            const std::shared_ptr<elero::io::Transmitter>& transmitter,
                            const std::shared_ptr<Scheduler>& scheduler,
                            const std::shared_ptr<const Clock>& clock,
                            const std::shared_ptr<ErrorMonitor>& errorMonitor) {
    config.validate();
    if (!transmitter)
      throw ConfigurationError("[CoverChannel] '" + config.name + "': transmitter is nullptr");
    if (!scheduler || !clock || !errorMonitor)
      throw ConfigurationError("[CoverChannel] '" + config.name + "': missing collaborator");
    return transmitter->getSerialNumber();
  }
} // namespace

CoverChannelController::CoverChannelController(CoverConfig config,
                                               std::shared_ptr<io::Transmitter> transmitter,
                                               std::shared_ptr<Scheduler> scheduler,
                                               std::shared_ptr<const Clock> clock,
                                               std::shared_ptr<ErrorMonitor> errorMonitor)
    : config_(std::move(config)), transmitter_(std::move(transmitter)),
      scheduler_(std::move(scheduler)), clock_(std::move(clock)),
      errorMonitor_(std::move(errorMonitor)),
      serial_(checkedSerial(config_, transmitter_, scheduler_, clock_, errorMonitor_)),
      dispatcher_(state_, *transmitter_, *errorMonitor_, serial_, config_.channel),
      reconciler_(state_, *errorMonitor_, serial_, config_.channel),
      alive_(std::make_shared<int>(0)) {
  state_.travelTime = config_.travelTime;

  // Status may arrive on the transmitter's thread: hop onto the loop, keep order.
  std::weak_ptr<int> alive = alive_;
  available_ = transmitter_->setChannel(
      config_.channel, [this, alive, scheduler = scheduler_](const protocols::Response& r) {
        if (alive.expired())
          return;
        scheduler->post([this, alive, r] {
          if (!alive.expired())
            onStatus(r);
        });
      });

  if (!available_)
    std::cerr << "[CoverChannel] " << uniqueId() << " not available on its transmitter\n";
}

CoverChannelController::~CoverChannelController() { cancelPending(); }

std::string CoverChannelController::uniqueId() const {
  return serial_ + "_" + std::to_string(config_.channel);
}

bool CoverChannelController::allowed(Feature feature, const char* command) {
  if (config_.supports(feature))
    return true;
  errorMonitor_->notifyFailure(FaultReport{ FaultKind::InvalidCommand, serial_, config_.channel,
                                            std::string(command) + " is not a supported feature" });
  return false;
}

// -------------------------------------------------------------------
// CoverChannelController::settleTimers
// One completion slot per channel: whenever the command token moved on, the
// armed completion describes a motion that no longer exists.
// -------------------------------------------------------------------
void CoverChannelController::settleTimers(std::uint64_t tokenBefore,
                                          const std::optional<Completion>& completion) {
  if (state_.commandToken != tokenBefore)
    cancelPending();
  if (completion)
    arm(*completion);
}

void CoverChannelController::arm(const Completion& completion) {
  cancelPending();
  const std::uint64_t token = state_.commandToken;
  std::weak_ptr<int> alive = alive_;
  pendingTimer_ = scheduler_->callLater(completion.delay, [this, alive, token, completion] {
    if (!alive.expired())
      onTimer(token, completion);
  });
}

void CoverChannelController::cancelPending() {
  if (!pendingTimer_)
    return;
  scheduler_->cancel(*pendingTimer_);
  pendingTimer_.reset();
}

void CoverChannelController::onTimer(std::uint64_t token, const Completion& completion) {
  if (token != state_.commandToken) {
    std::cerr << "[CoverChannel] " << uniqueId() << " dropping stale completion\n";
    return;
  }
  pendingTimer_.reset();

  switch (completion.kind) {
  case Completion::Kind::PollStatus:
    transmitter_->info(config_.channel);
    break;
  case Completion::Kind::FinishSetPosition: {
    const auto before = state_.commandToken;
    const auto result = dispatcher_.finishSetPosition(completion.target, clock_->now());
    settleTimers(before, result.completion);
    record("set_position_done");
    break;
  }
  }
}

void CoverChannelController::record(const std::string& event) {
  if (!logger_)
    return;
  logger_->log(LogEvent{ uniqueId(), event, stateLabel(), state_.position });
}

//---commands-------------------------------------------------------------

void CoverChannelController::open() {
  if (!allowed(Feature::Open, "open"))
    return;
  const auto before = state_.commandToken;
  const auto result = dispatcher_.open(clock_->now());
  settleTimers(before, result.completion);
  record("open");
}

void CoverChannelController::close() {
  if (!allowed(Feature::Close, "close"))
    return;
  const auto before = state_.commandToken;
  const auto result = dispatcher_.close(clock_->now());
  settleTimers(before, result.completion);
  record("close");
}

void CoverChannelController::stop() {
  if (!allowed(Feature::Stop, "stop"))
    return;
  const auto before = state_.commandToken;
  const auto result = dispatcher_.stop(clock_->now());
  settleTimers(before, result.completion);
  record("stop");
}

void CoverChannelController::setPosition(int position) {
  if (!allowed(Feature::SetPosition, "set_position"))
    return;
  const auto before = state_.commandToken;
  const auto result = dispatcher_.setPosition(position, clock_->now());
  if (!result.issued)
    return;
  settleTimers(before, result.completion);
  record("set_position " + std::to_string(position));
}

void CoverChannelController::ventilationTilt() {
  const auto before = state_.commandToken;
  const auto result = dispatcher_.ventilationTilt();
  settleTimers(before, result.completion);
  record("ventilation_tilting");
}

void CoverChannelController::intermediate() {
  const auto before = state_.commandToken;
  const auto result = dispatcher_.intermediate();
  settleTimers(before, result.completion);
  record("intermediate");
}

void CoverChannelController::openTilt() {
  if (allowed(Feature::OpenTilt, "open_tilt"))
    intermediate();
}

void CoverChannelController::closeTilt() {
  if (allowed(Feature::CloseTilt, "close_tilt"))
    ventilationTilt();
}

void CoverChannelController::stopTilt() {
  if (!allowed(Feature::StopTilt, "stop_tilt"))
    return;
  const auto before = state_.commandToken;
  const auto result = dispatcher_.stop(clock_->now());
  settleTimers(before, result.completion);
  record("stop_tilt");
}

void CoverChannelController::setTiltPosition(int tilt) {
  if (!allowed(Feature::SetTiltPosition, "set_tilt_position"))
    return;
  const auto before = state_.commandToken;
  const auto result = dispatcher_.setTiltPosition(tilt);
  if (!result.issued)
    return;
  settleTimers(before, result.completion);
  record("set_tilt_position " + std::to_string(tilt));
}

void CoverChannelController::update() { transmitter_->info(config_.channel); }

//---status---------------------------------------------------------------

void CoverChannelController::onStatus(const protocols::Response& response) {
  const auto before = state_.commandToken;
  reconciler_.apply(response, clock_->now());
  settleTimers(before, std::nullopt);
  record(response.status);
}

//---attributes & persistence---------------------------------------------

nlohmann::json CoverChannelController::extraStateAttributes() const {
  nlohmann::json data = nlohmann::json::object();
  if (state_.lastStatus)
    data["elero_state"] = *state_.lastStatus;
  data["travel_time"] = state_.travelTime;
  data["last_known_position"] =
      state_.lastKnownPosition ? nlohmann::json(*state_.lastKnownPosition) : nlohmann::json(nullptr);
  return data;
}

void CoverChannelController::restore(const RestoredAttributes& attrs) {
  state_.position = attrs.position;
  state_.lastKnownPosition = attrs.lastKnownPosition;
  state_.tmpPosition = attrs.tmpPosition;
  state_.closed = attrs.closed;
  state_.tiltPosition = attrs.tiltPosition;
  state_.lastStatus = attrs.eleroState;

  // the travel clock did not survive the restart
  state_.startTime.reset();
  if (attrs.isOpening) {
    state_.movement = Movement::Opening;
    state_.state = CoverState::Opening;
  } else if (attrs.isClosing) {
    state_.movement = Movement::Closing;
    state_.state = CoverState::Closing;
  } else {
    state_.movement = Movement::Idle;
    if (!state_.position)
      state_.state = CoverState::Unknown;
    else if (state_.closed.value_or(false))
      state_.state = CoverState::Closed;
    else
      state_.state = stateAtRest(*state_.position);
  }
}

RestoredAttributes CoverChannelController::snapshot() const {
  RestoredAttributes attrs;
  attrs.position = state_.position;
  attrs.lastKnownPosition = state_.lastKnownPosition;
  attrs.tmpPosition = state_.tmpPosition;
  attrs.isOpening = isOpening();
  attrs.isClosing = isClosing();
  attrs.closed = state_.closed;
  attrs.tiltPosition = state_.tiltPosition;
  attrs.eleroState = state_.lastStatus;
  return attrs;
}

void CoverChannelController::attachLogger(std::shared_ptr<Logger> logger) {
  logger_ = std::move(logger);
}
