// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "model/PlayerState.h"
#include "model/PlayerTypes.h"
#include <optional>
#include <string>

namespace PSC {

/**
 * @brief Canonical playback context owned by PlayerStateCoordinator
 *
 * Only the coordinator's event loop mutates this record. Everything handed
 * out to callers is a value copy.
 */
struct StateContext {
    PlayerState currentState = PlayerState::IDLE;
    std::optional<PlayerState> previousState;

    std::optional<PlayerTrack> currentTrack;
    double position = 0.0;  // media time, seconds
    double duration = 0.0;

    double playbackRate = 1.0;
    double volume = 1.0;

    std::optional<std::string> sessionId;
    std::optional<TimestampMs> sessionStartTime;
    TimestampMs lastPositionUpdate = 0;

    std::optional<CurrentChapter> currentChapter;

    bool isPlaying = false;
    bool isBuffering = false;
    bool isSeeking = false;
    std::optional<PlayerState> preSeekState;  // state interrupted by the pending seek
    bool isLoadingTrack = false;

    std::optional<TimestampMs> lastServerSync;
    std::optional<double> pendingSyncPosition;

    std::optional<PlayerError> lastError;

    bool operator==(const StateContext &) const = default;
};

}  // namespace PSC
