// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "model/PlayerEvent.h"
#include <array>

namespace PSC {

namespace {

// Indexed by PlayerEventType
constexpr std::array<const char *, PLAYER_EVENT_TYPE_COUNT> EVENT_TYPE_NAMES = {
    "LOAD_TRACK",
    "PLAY",
    "PAUSE",
    "STOP",
    "SEEK",
    "SEEK_COMPLETE",
    "SET_RATE",
    "SET_VOLUME",
    "RESTORE_STATE",
    "RELOAD_QUEUE",
    "QUEUE_RELOADED",
    "CHAPTER_CHANGED",
    "BUFFERING_STARTED",
    "BUFFERING_COMPLETED",
    "SESSION_CREATED",
    "SESSION_UPDATED",
    "SESSION_ENDED",
    "SESSION_SYNC_STARTED",
    "SESSION_SYNC_COMPLETED",
    "SESSION_SYNC_FAILED",
    "POSITION_RECONCILED",
    "APP_FOREGROUNDED",
    "APP_BACKGROUNDED",
    "NATIVE_STATE_CHANGED",
    "NATIVE_PROGRESS_UPDATED",
    "NATIVE_TRACK_CHANGED",
    "NATIVE_ERROR",
    "NATIVE_PLAYBACK_ERROR",
};

}  // namespace

const char *toString(PlayerEventType type) {
    auto index = static_cast<size_t>(type);
    return index < EVENT_TYPE_NAMES.size() ? EVENT_TYPE_NAMES[index] : "UNKNOWN";
}

std::optional<PlayerEventType> eventTypeFromString(const std::string &name) {
    for (size_t i = 0; i < EVENT_TYPE_NAMES.size(); ++i) {
        if (name == EVENT_TYPE_NAMES[i]) {
            return static_cast<PlayerEventType>(i);
        }
    }
    return std::nullopt;
}

}  // namespace PSC
