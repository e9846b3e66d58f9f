// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace PSC {

/**
 * @brief Coordinator-level playback state
 *
 * IDLE is the initial state. There is no terminal state: STOPPING always
 * returns to IDLE once the native player confirms.
 */
enum class PlayerState { IDLE, LOADING, READY, PLAYING, PAUSED, SEEKING, BUFFERING, STOPPING, ERROR };

constexpr size_t PLAYER_STATE_COUNT = 9;

/**
 * @brief Playback state as reported by the native audio player
 */
enum class NativePlaybackState { None, Ready, Playing, Paused, Stopped, Buffering, Loading, Error, Ended };

const char *toString(PlayerState state);
const char *toString(NativePlaybackState state);

std::optional<PlayerState> playerStateFromString(const std::string &name);
std::optional<NativePlaybackState> nativePlaybackStateFromString(const std::string &name);

}  // namespace PSC
