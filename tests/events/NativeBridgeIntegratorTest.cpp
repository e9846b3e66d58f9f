#include "events/InProcessNativeHub.h"
#include "events/NativeBridgeIntegrator.h"
#include "events/NativeMessage.h"
#include "events/PlayerEventCodec.h"
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <thread>
#include <memory>
#include <string>
#include <vector>

namespace PSC {

/**
 * @brief Two isolated contexts (UI and headless) joined through one native hub
 */
class NativeBridgeIntegratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        hub_ = std::make_unique<InProcessNativeHub>();

        uiBus_ = std::make_shared<PlayerEventBus>();
        headlessBus_ = std::make_shared<PlayerEventBus>();

        uiBridge_ = std::make_unique<NativeBridgeIntegrator>(uiBus_, hub_->createEndpoint(),
                                                             RuntimeContext::foreground());
        headlessBridge_ = std::make_unique<NativeBridgeIntegrator>(headlessBus_, hub_->createEndpoint(),
                                                                   RuntimeContext::headless());
        uiBridge_->initialize();
        headlessBridge_->initialize();

        uiSubscription_ = uiBus_->subscribe([this](const PlayerEvent &event) { uiReceived_.push_back(event); });
        headlessSubscription_ =
            headlessBus_->subscribe([this](const PlayerEvent &event) { headlessReceived_.push_back(event); });
    }

    void TearDown() override {
        uiSubscription_();
        headlessSubscription_();
        uiBridge_->cleanup();
        headlessBridge_->cleanup();
    }

    std::unique_ptr<InProcessNativeHub> hub_;
    std::shared_ptr<PlayerEventBus> uiBus_;
    std::shared_ptr<PlayerEventBus> headlessBus_;
    std::unique_ptr<NativeBridgeIntegrator> uiBridge_;
    std::unique_ptr<NativeBridgeIntegrator> headlessBridge_;

    PlayerEventBus::Unsubscribe uiSubscription_;
    PlayerEventBus::Unsubscribe headlessSubscription_;
    std::vector<PlayerEvent> uiReceived_;
    std::vector<PlayerEvent> headlessReceived_;
};

TEST_F(NativeBridgeIntegratorTest, ContextIdsAreLabelledAndUnique) {
    EXPECT_EQ(uiBridge_->contextId().rfind("ctx-UI-", 0), 0u);
    EXPECT_EQ(headlessBridge_->contextId().rfind("ctx-HEADLESS-", 0), 0u);
    EXPECT_NE(uiBridge_->contextId(), headlessBridge_->contextId());

    NativeBridgeIntegrator another(uiBus_, hub_->createEndpoint(), RuntimeContext::foreground());
    EXPECT_NE(another.contextId(), uiBridge_->contextId());
}

TEST_F(NativeBridgeIntegratorTest, LocalEventCrossesExactlyOnce) {
    uiBus_->dispatch(Evt::Seek{90.0});

    ASSERT_EQ(headlessReceived_.size(), 1u);
    EXPECT_EQ(headlessReceived_[0], PlayerEvent(Evt::Seek{90.0}));
    ASSERT_EQ(uiReceived_.size(), 1u);

    auto uiStats = uiBridge_->getStats();
    auto headlessStats = headlessBridge_->getStats();
    EXPECT_EQ(uiStats.forwarded, 1u);
    EXPECT_EQ(uiStats.echoesDropped, 1u);
    EXPECT_EQ(headlessStats.received, 1u);
    // Received events must not go back out
    EXPECT_EQ(headlessStats.forwarded, 0u);
    EXPECT_EQ(hub_->deliveredCount(), 2u);
}

TEST_F(NativeBridgeIntegratorTest, BothDirectionsWork) {
    headlessBus_->dispatch(Evt::NativeStateChanged{NativePlaybackState::Paused});
    uiBus_->dispatch(Evt::Play{});

    ASSERT_EQ(uiReceived_.size(), 2u);
    EXPECT_TRUE(uiReceived_[0].is<Evt::NativeStateChanged>());
    EXPECT_TRUE(uiReceived_[1].is<Evt::Play>());

    ASSERT_EQ(headlessReceived_.size(), 2u);
    EXPECT_TRUE(headlessReceived_[0].is<Evt::NativeStateChanged>());
    EXPECT_TRUE(headlessReceived_[1].is<Evt::Play>());
}

TEST_F(NativeBridgeIntegratorTest, OwnEchoIsDropped) {
    auto outsider = hub_->createEndpoint();
    std::vector<std::string> seenByOutsider;
    outsider->setReceiver([&](const std::string &wire) { seenByOutsider.push_back(wire); });

    NativeMessage echo{"PAUSE", json(nullptr), uiBridge_->contextId()};
    outsider->send(echo.toWire());

    EXPECT_TRUE(uiReceived_.empty());
    EXPECT_EQ(uiBridge_->getStats().echoesDropped, 1u);
    ASSERT_EQ(headlessReceived_.size(), 1u);
    EXPECT_TRUE(headlessReceived_[0].is<Evt::Pause>());
    // Only the outsider's own message was on the wire
    EXPECT_EQ(seenByOutsider.size(), 1u);
}

TEST_F(NativeBridgeIntegratorTest, MalformedMessagesAreDropped) {
    auto outsider = hub_->createEndpoint();

    outsider->send("{not json");
    outsider->send(R"({"type":"SEEK","contextId":"ctx-native"})");
    outsider->send(R"({"type":"WARP","contextId":"ctx-native"})");

    EXPECT_TRUE(uiReceived_.empty());
    EXPECT_TRUE(headlessReceived_.empty());
    EXPECT_EQ(uiBridge_->getStats().malformedDropped, 3u);
}

TEST_F(NativeBridgeIntegratorTest, PayloadSurvivesTheWire) {
    PlayerEvent progress = Evt::NativeProgressUpdated{61.5, 3600.0, 90.0};

    headlessBus_->dispatch(progress);

    ASSERT_EQ(uiReceived_.size(), 1u);
    EXPECT_EQ(uiReceived_[0], progress);
}

TEST_F(NativeBridgeIntegratorTest, CleanupDetachesBothDirections) {
    uiBridge_->cleanup();
    EXPECT_FALSE(uiBridge_->isInitialized());

    uiBus_->dispatch(Evt::Play{});
    headlessBus_->dispatch(Evt::Pause{});

    ASSERT_EQ(headlessReceived_.size(), 1u);
    EXPECT_TRUE(headlessReceived_[0].is<Evt::Pause>());
    ASSERT_EQ(uiReceived_.size(), 1u);
    EXPECT_TRUE(uiReceived_[0].is<Evt::Play>());

    uiBridge_->initialize();
    uiBridge_->initialize();
    EXPECT_TRUE(uiBridge_->isInitialized());
    EXPECT_EQ(uiBus_->listenerCount(), 2u);
}

TEST_F(NativeBridgeIntegratorTest, DestroyingBridgeWaitsForInboundDelivery) {
    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();

    auto bus = std::make_shared<PlayerEventBus>();
    auto blocking = bus->subscribe([&](const PlayerEvent &) {
        entered.set_value();
        released.wait();
    });
    auto bridge = std::make_unique<NativeBridgeIntegrator>(bus, hub_->createEndpoint(), RuntimeContext::headless());
    bridge->initialize();

    std::thread producer([&] { uiBus_->dispatch(Evt::Pause{}); });
    entered.get_future().wait();

    auto destroyed = std::async(std::launch::async, [&] { bridge.reset(); });
    EXPECT_EQ(destroyed.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

    release.set_value();
    EXPECT_EQ(destroyed.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    producer.join();

    ASSERT_EQ(bus->getEventHistory().size(), 1u);
    EXPECT_TRUE(bus->getEventHistory()[0].event.is<Evt::Pause>());
    blocking();
}

TEST(InProcessNativeHubTest, ClearReceiverWaitsForDeliveryOnAnotherThread) {
    InProcessNativeHub hub;
    auto sender = hub.createEndpoint();
    auto receiver = hub.createEndpoint();
    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();

    receiver->setReceiver([&](const std::string &) {
        entered.set_value();
        released.wait();
    });

    std::thread producer([&] { sender->send(NativeMessage{"PLAY", nullptr, "ctx-test"}.toWire()); });
    entered.get_future().wait();

    auto cleared = std::async(std::launch::async, [&] { receiver->clearReceiver(); });
    EXPECT_EQ(cleared.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

    release.set_value();
    EXPECT_EQ(cleared.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    producer.join();
    EXPECT_EQ(hub.deliveredCount(), 1u);
}

}  // namespace PSC
