// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "model/PlayerState.h"
#include "model/PlayerTypes.h"
#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace PSC {

/**
 * @brief Payload structs, one per player event
 *
 * Each struct carries exactly what the coordinator needs to update its
 * context for that event.
 */
namespace Evt {

// Commands (UI, lock screen, services)
struct LoadTrack {
    std::string libraryItemId;
    std::optional<std::string> episodeId;
    bool operator==(const LoadTrack &) const = default;
};
struct Play {
    bool operator==(const Play &) const = default;
};
struct Pause {
    bool operator==(const Pause &) const = default;
};
struct Stop {
    bool operator==(const Stop &) const = default;
};
struct Seek {
    double position = 0.0;
    bool operator==(const Seek &) const = default;
};
struct SeekComplete {
    bool operator==(const SeekComplete &) const = default;
};
struct SetRate {
    double rate = 1.0;
    bool operator==(const SetRate &) const = default;
};
struct SetVolume {
    double volume = 1.0;
    bool operator==(const SetVolume &) const = default;
};

// Restoration and queue management
struct RestoreState {
    PersistedPlayerState state;
    bool operator==(const RestoreState &) const = default;
};
struct ReloadQueue {
    std::string libraryItemId;
    bool operator==(const ReloadQueue &) const = default;
};
struct QueueReloaded {
    double position = 0.0;
    bool operator==(const QueueReloaded &) const = default;
};
struct ChapterChanged {
    CurrentChapter chapter;
    bool operator==(const ChapterChanged &) const = default;
};
struct BufferingStarted {
    bool operator==(const BufferingStarted &) const = default;
};
struct BufferingCompleted {
    bool operator==(const BufferingCompleted &) const = default;
};

// Listening sessions
struct SessionCreated {
    std::string sessionId;
    bool operator==(const SessionCreated &) const = default;
};
struct SessionUpdated {
    double position = 0.0;
    bool operator==(const SessionUpdated &) const = default;
};
struct SessionEnded {
    std::string sessionId;
    bool operator==(const SessionEnded &) const = default;
};
struct SessionSyncStarted {
    bool operator==(const SessionSyncStarted &) const = default;
};
struct SessionSyncCompleted {
    bool operator==(const SessionSyncCompleted &) const = default;
};
struct SessionSyncFailed {
    PlayerError error;
    bool operator==(const SessionSyncFailed &) const = default;
};
struct PositionReconciled {
    double position = 0.0;
    bool operator==(const PositionReconciled &) const = default;
};

// App lifecycle
struct AppForegrounded {
    bool operator==(const AppForegrounded &) const = default;
};
struct AppBackgrounded {
    bool operator==(const AppBackgrounded &) const = default;
};

// Native player callbacks
struct NativeStateChanged {
    NativePlaybackState state = NativePlaybackState::None;
    bool operator==(const NativeStateChanged &) const = default;
};
struct NativeProgressUpdated {
    double position = 0.0;
    double duration = 0.0;
    std::optional<double> buffered;
    bool operator==(const NativeProgressUpdated &) const = default;
};
struct NativeTrackChanged {
    std::optional<PlayerTrack> track;
    bool operator==(const NativeTrackChanged &) const = default;
};
struct NativeError {
    PlayerError error;
    bool operator==(const NativeError &) const = default;
};
struct NativePlaybackError {
    std::string code;
    std::string message;
    bool operator==(const NativePlaybackError &) const = default;
};

}  // namespace Evt

/**
 * @brief Discriminator of PlayerEvent, declared in variant alternative order
 */
enum class PlayerEventType {
    LOAD_TRACK,
    PLAY,
    PAUSE,
    STOP,
    SEEK,
    SEEK_COMPLETE,
    SET_RATE,
    SET_VOLUME,
    RESTORE_STATE,
    RELOAD_QUEUE,
    QUEUE_RELOADED,
    CHAPTER_CHANGED,
    BUFFERING_STARTED,
    BUFFERING_COMPLETED,
    SESSION_CREATED,
    SESSION_UPDATED,
    SESSION_ENDED,
    SESSION_SYNC_STARTED,
    SESSION_SYNC_COMPLETED,
    SESSION_SYNC_FAILED,
    POSITION_RECONCILED,
    APP_FOREGROUNDED,
    APP_BACKGROUNDED,
    NATIVE_STATE_CHANGED,
    NATIVE_PROGRESS_UPDATED,
    NATIVE_TRACK_CHANGED,
    NATIVE_ERROR,
    NATIVE_PLAYBACK_ERROR,
};

using PlayerEventPayload =
    std::variant<Evt::LoadTrack, Evt::Play, Evt::Pause, Evt::Stop, Evt::Seek, Evt::SeekComplete, Evt::SetRate,
                 Evt::SetVolume, Evt::RestoreState, Evt::ReloadQueue, Evt::QueueReloaded, Evt::ChapterChanged,
                 Evt::BufferingStarted, Evt::BufferingCompleted, Evt::SessionCreated, Evt::SessionUpdated,
                 Evt::SessionEnded, Evt::SessionSyncStarted, Evt::SessionSyncCompleted, Evt::SessionSyncFailed,
                 Evt::PositionReconciled, Evt::AppForegrounded, Evt::AppBackgrounded, Evt::NativeStateChanged,
                 Evt::NativeProgressUpdated, Evt::NativeTrackChanged, Evt::NativeError, Evt::NativePlaybackError>;

constexpr size_t PLAYER_EVENT_TYPE_COUNT = std::variant_size_v<PlayerEventPayload>;
static_assert(static_cast<size_t>(PlayerEventType::NATIVE_PLAYBACK_ERROR) + 1 == PLAYER_EVENT_TYPE_COUNT,
              "PlayerEventType must list every PlayerEventPayload alternative in order");

const char *toString(PlayerEventType type);
std::optional<PlayerEventType> eventTypeFromString(const std::string &name);

/**
 * @brief A single event flowing through the bus, the bridge and the coordinator
 *
 * @code
 * coordinator.dispatch(Evt::Seek{120.0});
 * if (auto *seek = event.get<Evt::Seek>()) { ... }
 * @endcode
 */
class PlayerEvent {
public:
    template <typename T, typename = std::enable_if_t<std::is_constructible_v<PlayerEventPayload, T &&> &&
                                                      !std::is_same_v<std::decay_t<T>, PlayerEvent>>>
    PlayerEvent(T &&payload) : payload_(std::forward<T>(payload)) {}

    PlayerEventType type() const {
        return static_cast<PlayerEventType>(payload_.index());
    }

    const char *name() const {
        return toString(type());
    }

    template <typename T> bool is() const {
        return std::holds_alternative<T>(payload_);
    }

    template <typename T> const T *get() const {
        return std::get_if<T>(&payload_);
    }

    const PlayerEventPayload &payload() const {
        return payload_;
    }

    bool operator==(const PlayerEvent &) const = default;

private:
    PlayerEventPayload payload_;
};

}  // namespace PSC
