#include "common/TestUtils.h"
#include "model/BoundedHistory.h"
#include "model/ModelJson.h"
#include "model/PlayerState.h"
#include "model/ResumePosition.h"
#include "runtime/RuntimeContext.h"
#include <gtest/gtest.h>
#include <vector>

namespace PSC {

TEST(PlayerStateNamesTest, EveryStateRoundTripsThroughItsName) {
    for (size_t i = 0; i < PLAYER_STATE_COUNT; ++i) {
        auto state = static_cast<PlayerState>(i);
        auto parsed = playerStateFromString(toString(state));
        ASSERT_TRUE(parsed.has_value()) << toString(state);
        EXPECT_EQ(*parsed, state);
    }
    EXPECT_STREQ(toString(PlayerState::BUFFERING), "buffering");
    EXPECT_FALSE(playerStateFromString("PLAYING").has_value());
}

TEST(PlayerStateNamesTest, ParsesNativeStates) {
    EXPECT_EQ(nativePlaybackStateFromString("playing"), NativePlaybackState::Playing);
    EXPECT_EQ(nativePlaybackStateFromString("ended"), NativePlaybackState::Ended);
    EXPECT_EQ(nativePlaybackStateFromString("none"), NativePlaybackState::None);
    EXPECT_FALSE(nativePlaybackStateFromString("rewinding").has_value());
}

TEST(BoundedHistoryTest, DropsOldestOnceFull) {
    BoundedHistory<int> history(3);
    for (int i = 1; i <= 5; ++i) {
        history.push(i);
    }
    EXPECT_EQ(history.snapshot(), (std::vector<int>{3, 4, 5}));
}

TEST(BoundedHistoryTest, ZeroCapacityKeepsLatestEntry) {
    BoundedHistory<int> history(0);
    EXPECT_TRUE(history.snapshot().empty());
    history.push(1);
    history.push(2);
    EXPECT_EQ(history.snapshot(), std::vector<int>{2});
}

TEST(RuntimeContextTest, ParsesNamesAndAliases) {
    EXPECT_EQ(RuntimeContext::fromString("foreground"), RuntimeContext::foreground());
    EXPECT_EQ(RuntimeContext::fromString("ui"), RuntimeContext::foreground());
    EXPECT_EQ(RuntimeContext::fromString("headless"), RuntimeContext::headless());
    EXPECT_EQ(RuntimeContext::fromString("background"), RuntimeContext::headless());
    EXPECT_FALSE(RuntimeContext::fromString("Headless").has_value());
}

TEST(RuntimeContextTest, Labels) {
    EXPECT_STREQ(RuntimeContext::foreground().label(), "UI");
    EXPECT_STREQ(RuntimeContext::headless().label(), "HEADLESS");
    EXPECT_TRUE(RuntimeContext::headless().isHeadless());
    EXPECT_FALSE(RuntimeContext::foreground().isHeadless());
}

TEST(ResumeSourceTest, Names) {
    EXPECT_STREQ(toString(ResumeSource::ActiveSession), "activeSession");
    EXPECT_STREQ(toString(ResumeSource::SavedProgress), "savedProgress");
    EXPECT_STREQ(toString(ResumeSource::AsyncStorage), "asyncStorage");
    EXPECT_STREQ(toString(ResumeSource::Store), "store");
}

TEST(ModelJsonTest, ContextUsesStateNamesAndNulls) {
    StateContext context;
    context.currentState = PlayerState::SEEKING;
    context.preSeekState = PlayerState::PLAYING;
    context.position = 120.0;

    auto value = ModelJson::toJson(context);

    EXPECT_EQ(value["currentState"], "seeking");
    EXPECT_EQ(value["preSeekState"], "playing");
    EXPECT_TRUE(value["previousState"].is_null());
    EXPECT_TRUE(value["currentTrack"].is_null());
    EXPECT_DOUBLE_EQ(value["position"].get<double>(), 120.0);
    EXPECT_DOUBLE_EQ(value["playbackRate"].get<double>(), 1.0);
}

TEST(ModelJsonTest, ResumeInfo) {
    ResumePositionInfo info{1800.0, ResumeSource::ActiveSession, 1800.0, std::nullopt};

    auto value = ModelJson::toJson(info);

    EXPECT_EQ(value["source"], "activeSession");
    EXPECT_DOUBLE_EQ(value["authoritativePosition"].get<double>(), 1800.0);
    EXPECT_TRUE(value["asyncStoragePosition"].is_null());
}

TEST(ModelJsonTest, TrackDecodesWhatItEncodes) {
    auto track = PSC::Test::Utils::makeTrack("li-9", 1200.0);
    track.coverUri = "file:///covers/li-9.jpg";

    EXPECT_EQ(ModelJson::trackFromJson(ModelJson::toJson(track)), track);
}

TEST(ModelJsonTest, PersistedStateDecodingIsLenient) {
    auto state = ModelJson::persistedStateFromJson(json{{"position", "oops"}, {"isPlaying", true}});

    EXPECT_DOUBLE_EQ(state.position, 0.0);
    EXPECT_DOUBLE_EQ(state.playbackRate, 1.0);
    EXPECT_DOUBLE_EQ(state.volume, 1.0);
    EXPECT_TRUE(state.isPlaying);
    EXPECT_FALSE(state.currentTrack.has_value());
}

}  // namespace PSC
