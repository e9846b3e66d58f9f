// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "model/PlayerTypes.h"
#include <optional>
#include <stdexcept>
#include <string>

namespace PSC {

/**
 * @brief Thrown by a store bridge whose UI store is not reachable
 *
 * Typical in the headless context, where no UI store exists.
 */
class StoreUnavailableError : public std::runtime_error {
public:
    explicit StoreUnavailableError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Setters of the externally observable player store
 *
 * The coordinator projects its context here after accepted events. Every
 * call may throw; the coordinator treats any failure as non-fatal.
 */
class IStoreBridge {
public:
    virtual ~IStoreBridge() = default;

    virtual void updatePosition(double position) = 0;
    virtual void updatePlayingState(bool isPlaying) = 0;
    virtual void setCurrentTrack(const std::optional<PlayerTrack> &track) = 0;
    virtual void setTrackLoading(bool isLoading) = 0;
    virtual void setSeeking(bool isSeeking) = 0;
    virtual void setPlaybackRate(double rate) = 0;
    virtual void setVolume(double volume) = 0;
    virtual void setPlaySessionId(const std::optional<std::string> &sessionId) = 0;

    /**
     * @brief Refresh lock-screen / now-playing metadata (debounced by the store)
     */
    virtual void updateNowPlayingMetadata() = 0;

    /**
     * @brief In-memory position currently held by the store
     */
    virtual double getPosition() const = 0;
};

}  // namespace PSC
