// Elero-Prod headers
#include "core/CoverChannelController.hpp"
#include "core/CoverConfig.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventLoop.hpp"
#include "core/StateStore.hpp"
#include "protocols/Command.hpp"

// Elero-Fake headers
#include "FakeClock.hpp"
#include "FakeScheduler.hpp"
#include "FakeTransmitter.hpp"
#include "MockErrorMonitor.hpp"

// STL headers
#include <memory>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

namespace elero::test {

  using elero::core::ConfigurationError;
  using elero::core::CoverChannelController;
  using elero::core::CoverConfig;
  using elero::core::CoverState;
  using elero::core::EventLoop;
  using elero::core::FaultKind;
  using elero::core::FaultReport;
  using elero::core::Feature;
  using elero::core::FeatureSet;
  using elero::core::RestoredAttributes;
  using elero::core::Seconds;
  using elero::protocols::Command;
  using elero::protocols::StatusCode;
  using ::testing::AllOf;
  using ::testing::Field;
  using ::testing::HasSubstr;

  constexpr int kChannel = 3;

  CoverConfig makeConfig(double travelTime = 50.0) {
    CoverConfig cfg;
    cfg.name = "Living room";
    cfg.channel = kChannel;
    cfg.deviceClass = "roller shutter";
    cfg.transmitterSerial = "AB12CD";
    cfg.travelTime = travelTime;
    for (auto f : { Feature::Open, Feature::Close, Feature::Stop, Feature::SetPosition,
                    Feature::OpenTilt, Feature::CloseTilt, Feature::StopTilt,
                    Feature::SetTiltPosition })
      cfg.features = cfg.features | f;
    return cfg;
  }

  RestoredAttributes restingAt(int position) {
    RestoredAttributes attrs;
    attrs.position = position;
    attrs.lastKnownPosition = position;
    attrs.tmpPosition = position;
    attrs.closed = position == 0;
    return attrs;
  }

  class CoverChannelControllerTest : public ::testing::Test {
  protected:
    void SetUp() override { build(50.0); }

    void build(double travelTime) {
      cover.reset();
      clock = std::make_shared<FakeClock>();
      loop = std::make_shared<EventLoop>(clock);
      transmitter = std::make_shared<FakeTransmitter>("AB12CD");
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
      cover = std::make_unique<CoverChannelController>(makeConfig(travelTime), transmitter, loop,
                                                       clock, errorMonitor);
    }

    void advance(double seconds) {
      clock->advance(Seconds{ seconds });
      loop->runPending();
    }

    void status(StatusCode code) {
      transmitter->emit(kChannel, toString(code));
      loop->runPending();
    }

    std::shared_ptr<FakeClock> clock;
    std::shared_ptr<EventLoop> loop;
    std::shared_ptr<FakeTransmitter> transmitter;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<CoverChannelController> cover;
  };

  TEST_F(CoverChannelControllerTest, StartsUnknownAndAvailable) {
    EXPECT_TRUE(cover->available());
    EXPECT_EQ(cover->uniqueId(), "AB12CD_3");
    EXPECT_EQ(cover->state(), CoverState::Unknown);
    EXPECT_FALSE(cover->position().has_value());
    EXPECT_FALSE(cover->isClosed().has_value());
    EXPECT_FALSE(cover->lastKnownPosition().has_value());
    EXPECT_DOUBLE_EQ(cover->travelTime(), 50.0);
  }

  TEST_F(CoverChannelControllerTest, RejectsNonPositiveTravelTime) {
    auto cfg = makeConfig(0.0);
    EXPECT_THROW(CoverChannelController(cfg, transmitter, loop, clock, errorMonitor),
                 ConfigurationError);
    cfg.travelTime = -5.0;
    EXPECT_THROW(CoverChannelController(cfg, transmitter, loop, clock, errorMonitor),
                 ConfigurationError);
  }

  TEST_F(CoverChannelControllerTest, RejectsMissingTransmitter) {
    EXPECT_THROW(CoverChannelController(makeConfig(), nullptr, loop, clock, errorMonitor),
                 ConfigurationError);
  }

  TEST_F(CoverChannelControllerTest, Open_IsOptimisticAndPollsAfterTravelTime) {
    cover->open();

    EXPECT_EQ(transmitter->count(Command::Up), 1u);
    EXPECT_EQ(cover->state(), CoverState::Opening);
    EXPECT_TRUE(cover->isOpening());
    EXPECT_FALSE(cover->isClosing());
    EXPECT_EQ(cover->position(), 100);
    EXPECT_EQ(cover->isClosed(), false);
    EXPECT_TRUE(cover->hasPendingCompletion());

    advance(49.0);
    EXPECT_EQ(transmitter->count(Command::Info), 0u);
    advance(1.0);
    EXPECT_EQ(transmitter->count(Command::Info), 1u);
    EXPECT_FALSE(cover->hasPendingCompletion());
  }

  TEST_F(CoverChannelControllerTest, Close_IsOptimistic) {
    cover->close();

    EXPECT_EQ(transmitter->count(Command::Down), 1u);
    EXPECT_EQ(cover->state(), CoverState::Closing);
    EXPECT_TRUE(cover->isClosing());
    EXPECT_EQ(cover->position(), 0);
    EXPECT_EQ(cover->isClosed(), false);
  }

  // Open, then "stopped in undefined position" 25 s into a 50 s travel.
  TEST_F(CoverChannelControllerTest, Scenario_OpenThenStoppedHalfway) {
    status(StatusCode::BottomPositionStop);
    cover->open();
    EXPECT_EQ(cover->position(), 100);

    advance(25.0);
    status(StatusCode::StoppedInUndefinedPosition);

    EXPECT_EQ(cover->state(), CoverState::Stopped);
    EXPECT_EQ(cover->position(), 50);
    EXPECT_EQ(cover->isClosed(), false);
    EXPECT_EQ(cover->lastKnownPosition(), 50);
    EXPECT_FALSE(cover->isOpening());
    EXPECT_STREQ(cover->stateLabel(), "stopped");
  }

  TEST_F(CoverChannelControllerTest, OpenFromUnknownThenStoppedHalfway_IsUndefined) {
    cover->open();
    status(StatusCode::MovingUp);
    advance(10.0);
    status(StatusCode::StoppedInUndefinedPosition);

    EXPECT_EQ(cover->state(), CoverState::Undefined);
    EXPECT_FALSE(cover->position().has_value());
    EXPECT_FALSE(cover->isOpening());
  }

  TEST_F(CoverChannelControllerTest, ImmediateStopReport_CreditsNoMovement) {
    for (double travel : { 0.5, 10.0, 50.0, 300.0 }) {
      build(travel);
      status(StatusCode::IntermediatePositionStop);
      cover->open();
      status(StatusCode::StoppedInUndefinedPosition);
      EXPECT_EQ(cover->position(), 75) << "travel " << travel;
    }
  }

  TEST_F(CoverChannelControllerTest, FullTravelReport_NeverExceedsOpen) {
    for (double travel : { 0.5, 10.0, 50.0, 300.0 }) {
      build(travel);
      status(StatusCode::BottomPositionStop);
      cover->open();
      advance(travel);
      status(StatusCode::StoppedInUndefinedPosition);
      EXPECT_EQ(cover->position(), 100) << "travel " << travel;
      EXPECT_EQ(cover->state(), CoverState::Open);

      cover->open();
      advance(3 * travel);
      status(StatusCode::StoppedInUndefinedPosition);
      EXPECT_EQ(cover->position(), 100) << "travel " << travel;
    }
  }

  // SetPosition(30) from 80 with a 50 s travel: close for 25 s, then stop and pin.
  TEST_F(CoverChannelControllerTest, Scenario_SetPositionClosesForComputedTime) {
    cover->restore(restingAt(80));

    cover->setPosition(30);
    EXPECT_EQ(transmitter->count(Command::Down), 1u);
    EXPECT_TRUE(cover->isClosing());
    EXPECT_EQ(cover->position(), 80); // left to the completion

    advance(24.0);
    EXPECT_EQ(transmitter->count(Command::Stop), 0u);

    advance(1.0);
    EXPECT_EQ(transmitter->count(Command::Stop), 1u);
    EXPECT_EQ(cover->position(), 30);
    EXPECT_EQ(cover->lastKnownPosition(), 30);
    EXPECT_FALSE(cover->isClosing());
    EXPECT_FALSE(cover->isOpening());
    EXPECT_EQ(cover->state(), CoverState::Stopped);
    EXPECT_EQ(transmitter->count(Command::Down), 1u); // one transmission only
  }

  TEST_F(CoverChannelControllerTest, SetPosition_MovingStatusDoesNotOverwritePosition) {
    cover->restore(restingAt(20));
    cover->setPosition(60);
    status(StatusCode::MovingUp);

    EXPECT_TRUE(cover->isOpening());
    EXPECT_EQ(cover->position(), 20);
    EXPECT_TRUE(cover->hasPendingCompletion());

    advance(20.0);
    EXPECT_EQ(cover->position(), 60);
    EXPECT_EQ(cover->state(), CoverState::Stopped);
  }

  TEST_F(CoverChannelControllerTest, SetPosition_ToCurrentIsNoOp) {
    cover->restore(restingAt(40));
    const auto before = cover->runtimeState().commandToken;

    cover->setPosition(40);

    EXPECT_TRUE(transmitter->sent.empty());
    EXPECT_EQ(cover->runtimeState().commandToken, before);
    EXPECT_EQ(cover->position(), 40);
    EXPECT_FALSE(cover->hasPendingCompletion());
  }

  TEST_F(CoverChannelControllerTest, SetPosition_OutOfRangeIsRejected) {
    cover->restore(restingAt(40));
    EXPECT_CALL(*errorMonitor,
                notifyFailure(Field(&FaultReport::kind, FaultKind::InvalidCommand))).Times(2);

    cover->setPosition(101);
    cover->setPosition(-1);

    EXPECT_TRUE(transmitter->sent.empty());
    EXPECT_EQ(cover->position(), 40);
  }

  TEST_F(CoverChannelControllerTest, SetPosition_WithoutLastKnownPositionIsRejected) {
    EXPECT_CALL(*errorMonitor,
                notifyFailure(AllOf(Field(&FaultReport::kind, FaultKind::InvalidCommand),
                                    Field(&FaultReport::detail, HasSubstr("last known")))));

    cover->setPosition(30);

    EXPECT_TRUE(transmitter->sent.empty());
    EXPECT_EQ(cover->state(), CoverState::Unknown);
  }

  TEST_F(CoverChannelControllerTest, SecondSetPosition_SupersedesFirstCompletion) {
    cover->restore(restingAt(80));
    cover->setPosition(30); // would finish at t=25
    advance(10.0);          // estimated 60 now
    cover->setPosition(70); // base is still last known (80): 5 s down

    advance(5.0);
    EXPECT_EQ(cover->position(), 70);
    EXPECT_EQ(transmitter->count(Command::Stop), 1u);

    advance(30.0); // the first completion's deadline passes without effect
    EXPECT_EQ(cover->position(), 70);
    EXPECT_EQ(transmitter->count(Command::Stop), 1u);
  }

  TEST_F(CoverChannelControllerTest, Stop_CreditsElapsedTravel) {
    status(StatusCode::BottomPositionStop);
    cover->open();
    advance(10.0);

    cover->stop();

    EXPECT_EQ(transmitter->count(Command::Stop), 1u);
    EXPECT_EQ(cover->position(), 20);
    EXPECT_EQ(cover->lastKnownPosition(), 20);
    EXPECT_EQ(cover->state(), CoverState::Stopped);
    EXPECT_FALSE(cover->isOpening());
    EXPECT_FALSE(cover->runtimeState().startTime.has_value());
    EXPECT_FALSE(cover->hasPendingCompletion());

    // the device confirms; no travel is credited twice
    advance(5.0);
    status(StatusCode::StoppedInUndefinedPosition);
    EXPECT_EQ(cover->position(), 20);
  }

  TEST_F(CoverChannelControllerTest, EndStopStatus_CancelsPendingPoll) {
    cover->open();
    status(StatusCode::TopPositionStop);

    EXPECT_FALSE(cover->hasPendingCompletion());
    advance(60.0);
    EXPECT_EQ(transmitter->count(Command::Info), 0u);
    EXPECT_EQ(cover->state(), CoverState::Open);
  }

  TEST_F(CoverChannelControllerTest, Blocking_ResetsAndReportsWithIdentity) {
    status(StatusCode::TopPositionStop);
    EXPECT_CALL(*errorMonitor,
                notifyFailure(AllOf(Field(&FaultReport::kind, FaultKind::DeviceFault),
                                    Field(&FaultReport::transmitter, "AB12CD"),
                                    Field(&FaultReport::channel, kChannel),
                                    Field(&FaultReport::detail, HasSubstr("blocking")))));

    status(StatusCode::Blocking);

    EXPECT_FALSE(cover->position().has_value());
    EXPECT_FALSE(cover->isClosed().has_value());
    EXPECT_EQ(cover->state(), CoverState::Unknown);
    EXPECT_EQ(cover->lastStatus(), "blocking");
  }

  TEST_F(CoverChannelControllerTest, UnknownStatus_ResetsAndReportsUnhandled) {
    status(StatusCode::BottomPositionStop);
    EXPECT_CALL(*errorMonitor,
                notifyFailure(AllOf(Field(&FaultReport::kind, FaultKind::UnhandledStatus),
                                    Field(&FaultReport::detail, HasSubstr("foo")))));

    transmitter->emit(kChannel, "foo");
    loop->runPending();

    EXPECT_FALSE(cover->position().has_value());
    EXPECT_FALSE(cover->isClosed().has_value());
    EXPECT_EQ(cover->state(), CoverState::Unknown);
  }

  TEST_F(CoverChannelControllerTest, StatusIsQueuedOnTheLoopInArrivalOrder) {
    transmitter->emit(kChannel, toString(StatusCode::MovingUp));
    transmitter->emit(kChannel, toString(StatusCode::TopPositionStop));
    EXPECT_EQ(cover->state(), CoverState::Unknown); // nothing applied before the loop runs

    loop->runPending();
    EXPECT_EQ(cover->state(), CoverState::Open);
    EXPECT_EQ(cover->lastStatus(), "top position stop");
  }

  TEST_F(CoverChannelControllerTest, TiltCommands_UseFixedPositions) {
    cover->closeTilt();
    EXPECT_EQ(transmitter->count(Command::VentilationTilting), 1u);
    EXPECT_EQ(cover->state(), CoverState::TiltVentilation);
    EXPECT_EQ(cover->position(), 25);
    EXPECT_EQ(cover->tiltPosition(), 25);

    cover->openTilt();
    EXPECT_EQ(transmitter->count(Command::Intermediate), 1u);
    EXPECT_EQ(cover->state(), CoverState::Intermediate);
    EXPECT_EQ(cover->position(), 75);
    EXPECT_EQ(cover->tiltPosition(), 75);
    EXPECT_EQ(cover->runtimeState().lastOperation, elero::core::Operation::Tilt);
  }

  TEST_F(CoverChannelControllerTest, SetTiltPosition_PicksSideOfMidpoint) {
    cover->setTiltPosition(10);
    EXPECT_EQ(cover->state(), CoverState::TiltVentilation);
    cover->setTiltPosition(90);
    EXPECT_EQ(cover->state(), CoverState::Intermediate);
  }

  TEST_F(CoverChannelControllerTest, SetTiltPosition_MidpointIsRejected) {
    EXPECT_CALL(*errorMonitor,
                notifyFailure(Field(&FaultReport::kind, FaultKind::InvalidCommand)));

    cover->setTiltPosition(50);

    EXPECT_TRUE(transmitter->sent.empty());
    EXPECT_EQ(cover->state(), CoverState::Unknown);
  }

  TEST_F(CoverChannelControllerTest, UnsupportedFeature_IsRejectedWithoutTransmission) {
    auto cfg = makeConfig();
    cfg.features = static_cast<FeatureSet>(Feature::Open);
    auto limited = std::make_unique<CoverChannelController>(cfg, transmitter, loop, clock,
                                                            errorMonitor);
    EXPECT_CALL(*errorMonitor,
                notifyFailure(Field(&FaultReport::kind, FaultKind::InvalidCommand)));

    limited->close();

    EXPECT_EQ(transmitter->count(Command::Down), 0u);
  }

  TEST_F(CoverChannelControllerTest, Update_OnlyRequestsStatus) {
    cover->update();
    EXPECT_EQ(transmitter->count(Command::Info), 1u);
    EXPECT_EQ(cover->state(), CoverState::Unknown);
  }

  TEST_F(CoverChannelControllerTest, ExtraAttributes_ExposeDiagnostics) {
    auto attrs = cover->extraStateAttributes();
    EXPECT_FALSE(attrs.contains("elero_state"));
    EXPECT_DOUBLE_EQ(attrs.at("travel_time").get<double>(), 50.0);
    EXPECT_TRUE(attrs.at("last_known_position").is_null());

    status(StatusCode::BottomPositionStop);
    attrs = cover->extraStateAttributes();
    EXPECT_EQ(attrs.at("elero_state"), "bottom position stop");
    EXPECT_EQ(attrs.at("last_known_position"), 0);
  }

  TEST_F(CoverChannelControllerTest, SnapshotRestoresIntoFreshController) {
    status(StatusCode::IntermediatePositionStop);
    const auto saved = cover->snapshot();

    build(50.0);
    cover->restore(saved);

    EXPECT_EQ(cover->position(), 75);
    EXPECT_EQ(cover->lastKnownPosition(), 75);
    EXPECT_EQ(cover->tiltPosition(), 75);
    EXPECT_EQ(cover->isClosed(), false);
    EXPECT_EQ(cover->lastStatus(), "intermediate position stop");
  }

  TEST_F(CoverChannelControllerTest, DestroyedController_DropsQueuedStatus) {
    transmitter->emit(kChannel, toString(StatusCode::TopPositionStop));
    cover.reset();
    EXPECT_NO_THROW(loop->runPending());
  }

  // Stale timers are driven by hand here: the fake scheduler lets a cancelled
  // completion fire anyway, which must then be a no-op.
  class StaleCompletionTest : public ::testing::Test {
  protected:
    void SetUp() override {
      clock = std::make_shared<FakeClock>();
      scheduler = std::make_shared<FakeScheduler>();
      transmitter = std::make_shared<FakeTransmitter>("AB12CD");
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
      cover = std::make_unique<CoverChannelController>(makeConfig(), transmitter, scheduler, clock,
                                                       errorMonitor);
    }

    std::shared_ptr<FakeClock> clock;
    std::shared_ptr<FakeScheduler> scheduler;
    std::shared_ptr<FakeTransmitter> transmitter;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<CoverChannelController> cover;
  };

  TEST_F(StaleCompletionTest, StopCancelsOpenTimerAndLateFiringIsIgnored) {
    cover->open();
    ASSERT_EQ(scheduler->timers.size(), 1u);

    cover->stop();
    EXPECT_TRUE(scheduler->timers[0].cancelled);
    EXPECT_EQ(scheduler->activeTimers(), 0u);

    const auto before = cover->runtimeState();
    const auto sentBefore = transmitter->sent.size();
    scheduler->timers[0].task();

    EXPECT_EQ(transmitter->sent.size(), sentBefore);
    EXPECT_EQ(cover->runtimeState().position, before.position);
    EXPECT_EQ(cover->runtimeState().state, before.state);
    EXPECT_EQ(cover->runtimeState().commandToken, before.commandToken);
  }

  TEST_F(StaleCompletionTest, OverlappingSetPositionCompletionIsIgnored) {
    cover->restore(restingAt(80));
    cover->setPosition(30);
    cover->setPosition(50);
    ASSERT_EQ(scheduler->timers.size(), 2u);
    EXPECT_TRUE(scheduler->timers[0].cancelled);

    scheduler->timers[0].task(); // the superseded one: must not pin 30
    EXPECT_EQ(cover->position(), 80);
    EXPECT_EQ(transmitter->count(Command::Stop), 0u);

    scheduler->timers[1].task();
    EXPECT_EQ(cover->position(), 50);
    EXPECT_EQ(cover->lastKnownPosition(), 50);
  }

  TEST_F(StaleCompletionTest, StatusIsPostedNotAppliedInline) {
    transmitter->emit(kChannel, toString(StatusCode::TopPositionStop));
    EXPECT_EQ(cover->state(), CoverState::Unknown);
    ASSERT_EQ(scheduler->posted.size(), 1u);

    scheduler->runPosted();
    EXPECT_EQ(cover->state(), CoverState::Open);
  }

} // namespace elero::test
