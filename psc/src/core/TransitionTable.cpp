// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "core/TransitionTable.h"
#include <algorithm>
#include <array>
#include <format>
#include <map>

namespace PSC {

namespace {

using Row = std::map<PlayerEventType, PlayerState>;
using E = PlayerEventType;
using S = PlayerState;

const std::map<PlayerState, Row> &matrix() {
    static const std::map<PlayerState, Row> table = {
        {S::IDLE,
         {
             {E::LOAD_TRACK, S::LOADING},
             {E::RELOAD_QUEUE, S::LOADING},
             {E::RESTORE_STATE, S::IDLE},  // context only; RELOAD_QUEUE follows
             {E::NATIVE_STATE_CHANGED, S::IDLE},
             {E::STOP, S::IDLE},
             {E::APP_FOREGROUNDED, S::IDLE},
         }},
        {S::LOADING,
         {
             {E::NATIVE_TRACK_CHANGED, S::READY},
             {E::QUEUE_RELOADED, S::READY},
             {E::PLAY, S::PLAYING},
             {E::NATIVE_ERROR, S::ERROR},
             {E::NATIVE_PLAYBACK_ERROR, S::ERROR},
             {E::NATIVE_STATE_CHANGED, S::LOADING},
             {E::NATIVE_PROGRESS_UPDATED, S::LOADING},
             {E::STOP, S::STOPPING},
         }},
        {S::READY,
         {
             {E::PLAY, S::PLAYING},
             {E::LOAD_TRACK, S::LOADING},
             {E::STOP, S::IDLE},
             {E::SEEK, S::SEEKING},
             {E::NATIVE_STATE_CHANGED, S::READY},
             {E::NATIVE_ERROR, S::ERROR},
             {E::NATIVE_PLAYBACK_ERROR, S::ERROR},
         }},
        {S::PLAYING,
         {
             {E::PAUSE, S::PAUSED},
             {E::STOP, S::STOPPING},
             {E::SEEK, S::SEEKING},
             {E::LOAD_TRACK, S::LOADING},
             {E::BUFFERING_STARTED, S::BUFFERING},
             {E::SET_RATE, S::PLAYING},
             {E::SET_VOLUME, S::PLAYING},
             {E::NATIVE_STATE_CHANGED, S::PLAYING},
             {E::NATIVE_TRACK_CHANGED, S::PLAYING},
             {E::NATIVE_ERROR, S::ERROR},
             {E::NATIVE_PLAYBACK_ERROR, S::ERROR},
             {E::APP_BACKGROUNDED, S::PLAYING},
         }},
        {S::PAUSED,
         {
             {E::PLAY, S::PLAYING},
             {E::STOP, S::STOPPING},
             {E::SEEK, S::SEEKING},
             {E::LOAD_TRACK, S::LOADING},
             {E::SET_RATE, S::PAUSED},
             {E::SET_VOLUME, S::PAUSED},
             {E::NATIVE_STATE_CHANGED, S::PAUSED},
             {E::NATIVE_TRACK_CHANGED, S::PAUSED},
             {E::NATIVE_ERROR, S::ERROR},
             {E::NATIVE_PLAYBACK_ERROR, S::ERROR},
         }},
        {S::SEEKING,
         {
             {E::SEEK_COMPLETE, S::READY},
             {E::NATIVE_PROGRESS_UPDATED, S::READY},  // first progress after a seek means it landed
             {E::NATIVE_STATE_CHANGED, S::SEEKING},
             {E::STOP, S::STOPPING},
             {E::NATIVE_ERROR, S::ERROR},
             {E::NATIVE_PLAYBACK_ERROR, S::ERROR},
         }},
        {S::BUFFERING,
         {
             {E::BUFFERING_COMPLETED, S::PLAYING},
             {E::NATIVE_STATE_CHANGED, S::BUFFERING},  // refined by the reported state in validate()
             {E::NATIVE_TRACK_CHANGED, S::BUFFERING},
             {E::PAUSE, S::PAUSED},
             {E::STOP, S::STOPPING},
             {E::NATIVE_ERROR, S::ERROR},
             {E::NATIVE_PLAYBACK_ERROR, S::ERROR},
         }},
        {S::STOPPING,
         {
             {E::NATIVE_STATE_CHANGED, S::IDLE},
         }},
        {S::ERROR,
         {
             {E::PLAY, S::PLAYING},
             {E::LOAD_TRACK, S::LOADING},
             {E::STOP, S::IDLE},
         }},
    };
    return table;
}

// Accepted in every state without changing it. POSITION_RECONCILED carries the
// resolver's answer into whatever state the player is in.
constexpr std::array<PlayerEventType, 9> NO_OP_EVENTS = {
    E::NATIVE_PROGRESS_UPDATED, E::SESSION_CREATED,        E::SESSION_UPDATED,
    E::SESSION_ENDED,           E::SESSION_SYNC_STARTED,   E::SESSION_SYNC_COMPLETED,
    E::SESSION_SYNC_FAILED,     E::CHAPTER_CHANGED,        E::POSITION_RECONCILED,
};

std::optional<std::string> duplicateReason(PlayerState current, PlayerEventType type) {
    if (current == S::LOADING && type == E::LOAD_TRACK) {
        return "Track load already in progress; duplicate LOAD_TRACK would create a second session";
    }
    if (current == S::LOADING && type == E::RELOAD_QUEUE) {
        return "Queue reload already in progress";
    }
    if (current == S::STOPPING && type == E::STOP) {
        return "Stop already in progress";
    }
    if (current == S::SEEKING && type == E::SEEK) {
        return "Seek already in progress";
    }
    return std::nullopt;
}

}  // namespace

std::optional<PlayerState> TransitionTable::getNextState(PlayerState current, PlayerEventType type) {
    const auto &table = matrix();
    auto row = table.find(current);
    if (row == table.end()) {
        return std::nullopt;
    }
    auto cell = row->second.find(type);
    if (cell == row->second.end()) {
        return std::nullopt;
    }
    return cell->second;
}

bool TransitionTable::isNoOpEvent(PlayerEventType type) {
    return std::find(NO_OP_EVENTS.begin(), NO_OP_EVENTS.end(), type) != NO_OP_EVENTS.end();
}

std::vector<PlayerEventType> TransitionTable::getAllowedEvents(PlayerState state) {
    std::vector<PlayerEventType> allowed;
    const auto &table = matrix();
    auto row = table.find(state);
    if (row != table.end()) {
        for (const auto &[type, next] : row->second) {
            allowed.push_back(type);
        }
    }
    return allowed;
}

TransitionValidation TransitionTable::validate(PlayerState current, const PlayerEvent &event) {
    const PlayerEventType type = event.type();

    if (current == S::BUFFERING && type == E::NATIVE_STATE_CHANGED) {
        switch (event.get<Evt::NativeStateChanged>()->state) {
        case NativePlaybackState::Playing:
            return TransitionValidation::accept(S::PLAYING);
        case NativePlaybackState::Paused:
            return TransitionValidation::accept(S::PAUSED);
        case NativePlaybackState::None:
        case NativePlaybackState::Ready:
        case NativePlaybackState::Stopped:
        case NativePlaybackState::Buffering:
        case NativePlaybackState::Loading:
        case NativePlaybackState::Error:
        case NativePlaybackState::Ended:
            return TransitionValidation::accept(S::BUFFERING);
        }
    }

    if (auto next = getNextState(current, type)) {
        return TransitionValidation::accept(*next);
    }

    if (auto reason = duplicateReason(current, type)) {
        return TransitionValidation::reject(*reason);
    }

    if (isNoOpEvent(type)) {
        return TransitionValidation::acceptNoOp(current, "No-op event");
    }

    return TransitionValidation::reject(
        std::format("Event {} not allowed in state {}", toString(type), toString(current)));
}

}  // namespace PSC
