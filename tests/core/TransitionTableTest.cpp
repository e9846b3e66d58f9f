#include "core/TransitionTable.h"
#include <gtest/gtest.h>
#include <vector>

using namespace PSC;

namespace {

// One representative event per type, payloads irrelevant to the matrix
std::vector<PlayerEvent> sampleEvents() {
    return {
        Evt::LoadTrack{"li-1", std::nullopt},
        Evt::Play{},
        Evt::Pause{},
        Evt::Stop{},
        Evt::Seek{10.0},
        Evt::SeekComplete{},
        Evt::SetRate{1.5},
        Evt::SetVolume{0.5},
        Evt::RestoreState{},
        Evt::ReloadQueue{"li-1"},
        Evt::QueueReloaded{5.0},
        Evt::ChapterChanged{},
        Evt::BufferingStarted{},
        Evt::BufferingCompleted{},
        Evt::SessionCreated{"s-1"},
        Evt::SessionUpdated{5.0},
        Evt::SessionEnded{"s-1"},
        Evt::SessionSyncStarted{},
        Evt::SessionSyncCompleted{},
        Evt::SessionSyncFailed{},
        Evt::PositionReconciled{5.0},
        Evt::AppForegrounded{},
        Evt::AppBackgrounded{},
        Evt::NativeStateChanged{NativePlaybackState::Playing},
        Evt::NativeProgressUpdated{5.0, 100.0, std::nullopt},
        Evt::NativeTrackChanged{},
        Evt::NativeError{},
        Evt::NativePlaybackError{"E1", "boom"},
    };
}

const std::vector<PlayerState> ALL_STATES = {PlayerState::IDLE,      PlayerState::LOADING,  PlayerState::READY,
                                             PlayerState::PLAYING,   PlayerState::PAUSED,   PlayerState::SEEKING,
                                             PlayerState::BUFFERING, PlayerState::STOPPING, PlayerState::ERROR};

}  // namespace

TEST(TransitionTableTest, SampleCoversEveryEventType) {
    auto events = sampleEvents();
    ASSERT_EQ(events.size(), PLAYER_EVENT_TYPE_COUNT);
    for (size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(static_cast<size_t>(events[i].type()), i);
    }
}

TEST(TransitionTableTest, ValidateIsTotalAndDeterministic) {
    for (auto state : ALL_STATES) {
        for (const auto &event : sampleEvents()) {
            auto first = TransitionTable::validate(state, event);
            auto second = TransitionTable::validate(state, event);
            EXPECT_EQ(first, second) << toString(state) << " / " << event.name();

            if (first.allowed) {
                EXPECT_TRUE(first.nextState.has_value()) << toString(state) << " / " << event.name();
            } else {
                EXPECT_FALSE(first.nextState.has_value());
                ASSERT_TRUE(first.reason.has_value()) << toString(state) << " / " << event.name();
                EXPECT_FALSE(first.reason->empty());
            }
        }
    }
}

TEST(TransitionTableTest, StructuralTransitions) {
    EXPECT_EQ(TransitionTable::validate(PlayerState::IDLE, Evt::LoadTrack{"li-1", std::nullopt}).nextState,
              PlayerState::LOADING);
    EXPECT_EQ(TransitionTable::validate(PlayerState::LOADING, Evt::QueueReloaded{12.0}).nextState,
              PlayerState::READY);
    EXPECT_EQ(TransitionTable::validate(PlayerState::READY, Evt::Play{}).nextState, PlayerState::PLAYING);
    EXPECT_EQ(TransitionTable::validate(PlayerState::PLAYING, Evt::Pause{}).nextState, PlayerState::PAUSED);
    EXPECT_EQ(TransitionTable::validate(PlayerState::PLAYING, Evt::Seek{30.0}).nextState, PlayerState::SEEKING);
    EXPECT_EQ(TransitionTable::validate(PlayerState::SEEKING, Evt::NativeProgressUpdated{30.0, 100.0, std::nullopt})
                  .nextState,
              PlayerState::READY);
    EXPECT_EQ(TransitionTable::validate(PlayerState::PLAYING, Evt::BufferingStarted{}).nextState,
              PlayerState::BUFFERING);
    EXPECT_EQ(TransitionTable::validate(PlayerState::PLAYING, Evt::Stop{}).nextState, PlayerState::STOPPING);
    EXPECT_EQ(TransitionTable::validate(PlayerState::READY, Evt::Stop{}).nextState, PlayerState::IDLE);
}

TEST(TransitionTableTest, BufferingFollowsReportedNativeState) {
    EXPECT_EQ(TransitionTable::validate(PlayerState::BUFFERING, Evt::NativeStateChanged{NativePlaybackState::Playing})
                  .nextState,
              PlayerState::PLAYING);
    EXPECT_EQ(TransitionTable::validate(PlayerState::BUFFERING, Evt::NativeStateChanged{NativePlaybackState::Paused})
                  .nextState,
              PlayerState::PAUSED);
    EXPECT_EQ(
        TransitionTable::validate(PlayerState::BUFFERING, Evt::NativeStateChanged{NativePlaybackState::Buffering})
            .nextState,
        PlayerState::BUFFERING);

    for (auto native : {NativePlaybackState::None, NativePlaybackState::Ready, NativePlaybackState::Stopped,
                        NativePlaybackState::Loading, NativePlaybackState::Error, NativePlaybackState::Ended}) {
        EXPECT_EQ(TransitionTable::validate(PlayerState::BUFFERING, Evt::NativeStateChanged{native}).nextState,
                  PlayerState::BUFFERING)
            << toString(native);
    }
}

TEST(TransitionTableTest, DuplicateLoadTrackIsRejectedWithReason) {
    auto validation = TransitionTable::validate(PlayerState::LOADING, Evt::LoadTrack{"li-2", std::nullopt});

    EXPECT_FALSE(validation.allowed);
    EXPECT_FALSE(validation.nextState.has_value());
    ASSERT_TRUE(validation.reason.has_value());
    EXPECT_NE(validation.reason->find("duplicate LOAD_TRACK"), std::string::npos);
}

TEST(TransitionTableTest, OtherGuardedDuplicatesAreRejected) {
    EXPECT_FALSE(TransitionTable::validate(PlayerState::SEEKING, Evt::Seek{5.0}).allowed);
    EXPECT_FALSE(TransitionTable::validate(PlayerState::STOPPING, Evt::Stop{}).allowed);
    EXPECT_FALSE(TransitionTable::validate(PlayerState::LOADING, Evt::ReloadQueue{"li-1"}).allowed);
}

TEST(TransitionTableTest, SameStateAcceptanceKeepsState) {
    auto validation =
        TransitionTable::validate(PlayerState::PLAYING, Evt::NativeStateChanged{NativePlaybackState::Playing});
    EXPECT_TRUE(validation.allowed);
    EXPECT_EQ(validation.nextState, PlayerState::PLAYING);

    validation = TransitionTable::validate(PlayerState::PAUSED, Evt::SetRate{2.0});
    EXPECT_TRUE(validation.allowed);
    EXPECT_EQ(validation.nextState, PlayerState::PAUSED);
}

TEST(TransitionTableTest, NoOpEventsAcceptedEverywhere) {
    const std::vector<PlayerEvent> noOps = {Evt::SessionCreated{"s"}, Evt::SessionSyncCompleted{},
                                            Evt::ChapterChanged{}, Evt::PositionReconciled{42.0}};
    for (auto state : ALL_STATES) {
        for (const auto &event : noOps) {
            auto validation = TransitionTable::validate(state, event);
            EXPECT_TRUE(validation.allowed) << toString(state) << " / " << event.name();
            EXPECT_EQ(validation.nextState, state);
        }
    }
    EXPECT_TRUE(TransitionTable::isNoOpEvent(PlayerEventType::NATIVE_PROGRESS_UPDATED));
    EXPECT_FALSE(TransitionTable::isNoOpEvent(PlayerEventType::PLAY));
}

TEST(TransitionTableTest, NativeEventsPermissiveWhileActive) {
    for (auto state : {PlayerState::LOADING, PlayerState::PLAYING, PlayerState::PAUSED, PlayerState::SEEKING,
                       PlayerState::BUFFERING}) {
        EXPECT_TRUE(
            TransitionTable::validate(state, Evt::NativeStateChanged{NativePlaybackState::Ready}).allowed)
            << toString(state);
        EXPECT_TRUE(TransitionTable::validate(state, Evt::NativeProgressUpdated{1.0, 2.0, std::nullopt}).allowed)
            << toString(state);
        EXPECT_TRUE(TransitionTable::validate(state, Evt::NativeError{PlayerError{"E", "x"}}).allowed)
            << toString(state);
    }
}

TEST(TransitionTableTest, UnlistedPairsFailClosed) {
    auto validation = TransitionTable::validate(PlayerState::IDLE, Evt::Pause{});
    EXPECT_FALSE(validation.allowed);
    EXPECT_EQ(validation.reason, "Event PAUSE not allowed in state idle");

    EXPECT_FALSE(TransitionTable::validate(PlayerState::STOPPING, Evt::Play{}).allowed);
    EXPECT_FALSE(TransitionTable::validate(PlayerState::SEEKING, Evt::SetRate{1.2}).allowed);
}

TEST(TransitionTableTest, AllowedEventsMatchMatrix) {
    auto allowed = TransitionTable::getAllowedEvents(PlayerState::STOPPING);
    ASSERT_EQ(allowed.size(), 1u);
    EXPECT_EQ(allowed.front(), PlayerEventType::NATIVE_STATE_CHANGED);

    for (auto state : ALL_STATES) {
        for (auto type : TransitionTable::getAllowedEvents(state)) {
            EXPECT_TRUE(TransitionTable::getNextState(state, type).has_value());
        }
    }
}
