#include "common/TestUtils.h"
#include "events/InProcessNativeHub.h"
#include "events/NativeBridgeIntegrator.h"
#include "mocks/MockPlayerService.h"
#include "runtime/PlayerStateCoordinator.h"
#include <gtest/gtest.h>
#include <memory>

namespace PSC {

/**
 * @brief One execution context: bus, bridge and coordinator
 */
struct PlaybackContext {
    PlaybackContext(InProcessNativeHub &hub, const RuntimeContext &runtime)
        : service(std::make_shared<PSC::Test::MockPlayerService>()), bus(std::make_shared<PlayerEventBus>()),
          bridge(bus, hub.createEndpoint(), runtime),
          coordinator(PlayerStateCoordinator::Dependencies{service, nullptr, {}}, runtime) {
        bridge.initialize();
        coordinator.attachToEventBus(bus);
    }

    ~PlaybackContext() {
        coordinator.shutdown();
        bridge.cleanup();
    }

    std::shared_ptr<PSC::Test::MockPlayerService> service;
    std::shared_ptr<PlayerEventBus> bus;
    NativeBridgeIntegrator bridge;
    PlayerStateCoordinator coordinator;
};

class TwoContextPlaybackTest : public ::testing::Test {
protected:
    void SetUp() override {
        ui_ = std::make_unique<PlaybackContext>(hub_, RuntimeContext::foreground());
        headless_ = std::make_unique<PlaybackContext>(hub_, RuntimeContext::headless());
    }

    void TearDown() override {
        ui_.reset();
        headless_.reset();
    }

    // Each side may enqueue work on the other while draining, so settle twice
    void waitBoth() {
        for (int round = 0; round < 2; ++round) {
            ASSERT_TRUE(ui_->coordinator.waitUntilIdle(PSC::Test::Utils::STANDARD_WAIT_MS));
            ASSERT_TRUE(headless_->coordinator.waitUntilIdle(PSC::Test::Utils::STANDARD_WAIT_MS));
        }
    }

    InProcessNativeHub hub_;
    std::unique_ptr<PlaybackContext> ui_;
    std::unique_ptr<PlaybackContext> headless_;
};

TEST_F(TwoContextPlaybackTest, BothCoordinatorsSeeTheSameStream) {
    ui_->bus->dispatch(Evt::LoadTrack{"li-1", std::nullopt});
    headless_->bus->dispatch(Evt::NativeTrackChanged{PSC::Test::Utils::makeTrack("li-1")});
    ui_->bus->dispatch(Evt::Play{});
    waitBoth();

    EXPECT_EQ(ui_->coordinator.getState(), PlayerState::PLAYING);
    EXPECT_EQ(headless_->coordinator.getState(), PlayerState::PLAYING);

    EXPECT_EQ(ui_->bus->getEventHistory().size(), 3u);
    EXPECT_EQ(headless_->bus->getEventHistory().size(), 3u);
    EXPECT_EQ(ui_->coordinator.getMetrics().totalEventsProcessed, 3u);
    EXPECT_EQ(headless_->coordinator.getMetrics().totalEventsProcessed, 3u);
}

TEST_F(TwoContextPlaybackTest, ResumeAfterSeekDoesNotBounce) {
    ui_->bus->dispatch(Evt::LoadTrack{"li-1", std::nullopt});
    ui_->bus->dispatch(Evt::QueueReloaded{0.0});
    ui_->bus->dispatch(Evt::Play{});
    waitBoth();

    ui_->bus->dispatch(Evt::Seek{600.0});
    waitBoth();
    headless_->bus->dispatch(Evt::NativeProgressUpdated{600.0, 3600.0, std::nullopt});
    waitBoth();

    // Each coordinator resumes on its own and publishes PLAY; the copy arriving
    // from the other side finds the coordinator already PLAYING and is rejected
    EXPECT_EQ(ui_->coordinator.getState(), PlayerState::PLAYING);
    EXPECT_EQ(headless_->coordinator.getState(), PlayerState::PLAYING);
    EXPECT_EQ(ui_->service->callCount("executePlay"), 2);
    EXPECT_EQ(headless_->service->callCount("executePlay"), 2);

    EXPECT_EQ(ui_->bus->getEventHistory().size(), 7u);
    EXPECT_EQ(ui_->coordinator.getMetrics().rejectedTransitionCount, 1u);
    EXPECT_EQ(ui_->bridge.getStats().received + ui_->bridge.getStats().forwarded,
              ui_->bus->getEventHistory().size());
}

}  // namespace PSC
