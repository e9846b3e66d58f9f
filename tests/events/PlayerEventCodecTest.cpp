#include "events/PlayerEventCodec.h"
#include "common/TestUtils.h"
#include <gtest/gtest.h>

using namespace PSC;

TEST(PlayerEventCodecTest, EncodesTypeAndPayload) {
    auto encoded = PlayerEventCodec::encode(Evt::Seek{42.5});

    EXPECT_EQ(encoded["type"], "SEEK");
    EXPECT_DOUBLE_EQ(encoded["payload"]["position"].get<double>(), 42.5);
}

TEST(PlayerEventCodecTest, EventsWithoutDataOmitPayload) {
    auto encoded = PlayerEventCodec::encode(Evt::Play{});

    EXPECT_EQ(encoded["type"], "PLAY");
    EXPECT_FALSE(encoded.contains("payload"));
    EXPECT_TRUE(PlayerEventCodec::encodePayload(Evt::Stop{}).is_null());
}

TEST(PlayerEventCodecTest, DecodesNativeProgress) {
    json payload = {{"position", 12.0}, {"duration", 300.0}, {"buffered", 40.0}};

    auto event = PlayerEventCodec::decode("NATIVE_PROGRESS_UPDATED", payload);

    ASSERT_TRUE(event.has_value());
    const auto *progress = event->get<Evt::NativeProgressUpdated>();
    ASSERT_NE(progress, nullptr);
    EXPECT_DOUBLE_EQ(progress->position, 12.0);
    EXPECT_DOUBLE_EQ(progress->duration, 300.0);
    EXPECT_EQ(progress->buffered, 40.0);
}

TEST(PlayerEventCodecTest, DecodesNativeStateByName) {
    auto event = PlayerEventCodec::decode("NATIVE_STATE_CHANGED", json{{"state", "buffering"}});

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->get<Evt::NativeStateChanged>()->state, NativePlaybackState::Buffering);
}

TEST(PlayerEventCodecTest, PreservesStructuredPayloads) {
    PersistedPlayerState state;
    state.currentTrack = PSC::Test::Utils::makeTrack("li-9", 1200.0);
    state.position = 321.0;
    state.playbackRate = 1.25;
    state.currentPlaySessionId = "session-9";
    PlayerEvent original = Evt::RestoreState{state};

    auto decoded = PlayerEventCodec::decode(PlayerEventCodec::encode(original));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, original);
}

TEST(PlayerEventCodecTest, RejectsUnknownType) {
    std::string error;
    auto event = PlayerEventCodec::decode("REWIND", json(nullptr), &error);

    EXPECT_FALSE(event.has_value());
    EXPECT_NE(error.find("REWIND"), std::string::npos);
}

TEST(PlayerEventCodecTest, RejectsMissingRequiredField) {
    std::string error;
    auto event = PlayerEventCodec::decode("SEEK", json{{"offset", 3}}, &error);

    EXPECT_FALSE(event.has_value());
    EXPECT_NE(error.find("position"), std::string::npos);

    EXPECT_FALSE(PlayerEventCodec::decode("LOAD_TRACK", json(nullptr)).has_value());
    EXPECT_FALSE(PlayerEventCodec::decode(json{{"payload", json::object()}}).has_value());
}

TEST(PlayerEventCodecTest, EventTypeNamesRoundTrip) {
    for (size_t i = 0; i < PLAYER_EVENT_TYPE_COUNT; ++i) {
        auto type = static_cast<PlayerEventType>(i);
        EXPECT_EQ(eventTypeFromString(toString(type)), type);
    }
    EXPECT_FALSE(eventTypeFromString("play").has_value());
}
