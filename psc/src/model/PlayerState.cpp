// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "model/PlayerState.h"
#include <array>
#include <utility>

namespace PSC {

namespace {

constexpr std::array<std::pair<PlayerState, const char *>, PLAYER_STATE_COUNT> STATE_NAMES = {{
    {PlayerState::IDLE, "idle"},
    {PlayerState::LOADING, "loading"},
    {PlayerState::READY, "ready"},
    {PlayerState::PLAYING, "playing"},
    {PlayerState::PAUSED, "paused"},
    {PlayerState::SEEKING, "seeking"},
    {PlayerState::BUFFERING, "buffering"},
    {PlayerState::STOPPING, "stopping"},
    {PlayerState::ERROR, "error"},
}};

constexpr std::array<std::pair<NativePlaybackState, const char *>, 9> NATIVE_STATE_NAMES = {{
    {NativePlaybackState::None, "none"},
    {NativePlaybackState::Ready, "ready"},
    {NativePlaybackState::Playing, "playing"},
    {NativePlaybackState::Paused, "paused"},
    {NativePlaybackState::Stopped, "stopped"},
    {NativePlaybackState::Buffering, "buffering"},
    {NativePlaybackState::Loading, "loading"},
    {NativePlaybackState::Error, "error"},
    {NativePlaybackState::Ended, "ended"},
}};

}  // namespace

const char *toString(PlayerState state) {
    for (const auto &[value, name] : STATE_NAMES) {
        if (value == state) {
            return name;
        }
    }
    return "unknown";
}

const char *toString(NativePlaybackState state) {
    for (const auto &[value, name] : NATIVE_STATE_NAMES) {
        if (value == state) {
            return name;
        }
    }
    return "unknown";
}

std::optional<PlayerState> playerStateFromString(const std::string &name) {
    for (const auto &[value, stateName] : STATE_NAMES) {
        if (name == stateName) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<NativePlaybackState> nativePlaybackStateFromString(const std::string &name) {
    for (const auto &[value, stateName] : NATIVE_STATE_NAMES) {
        if (name == stateName) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace PSC
