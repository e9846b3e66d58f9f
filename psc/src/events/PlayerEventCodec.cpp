// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "events/PlayerEventCodec.h"
#include "common/Logger.h"
#include "model/ModelJson.h"

namespace PSC {

namespace {

struct PayloadEncoder {
    json operator()(const Evt::LoadTrack &e) const {
        json payload = {{"libraryItemId", e.libraryItemId}};
        if (e.episodeId) {
            payload["episodeId"] = *e.episodeId;
        }
        return payload;
    }
    json operator()(const Evt::Seek &e) const {
        return {{"position", e.position}};
    }
    json operator()(const Evt::SetRate &e) const {
        return {{"rate", e.rate}};
    }
    json operator()(const Evt::SetVolume &e) const {
        return {{"volume", e.volume}};
    }
    json operator()(const Evt::RestoreState &e) const {
        return {{"state", ModelJson::toJson(e.state)}};
    }
    json operator()(const Evt::ReloadQueue &e) const {
        return {{"libraryItemId", e.libraryItemId}};
    }
    json operator()(const Evt::QueueReloaded &e) const {
        return {{"position", e.position}};
    }
    json operator()(const Evt::ChapterChanged &e) const {
        return {{"chapter", ModelJson::toJson(e.chapter)}};
    }
    json operator()(const Evt::SessionCreated &e) const {
        return {{"sessionId", e.sessionId}};
    }
    json operator()(const Evt::SessionUpdated &e) const {
        return {{"position", e.position}};
    }
    json operator()(const Evt::SessionEnded &e) const {
        return {{"sessionId", e.sessionId}};
    }
    json operator()(const Evt::SessionSyncFailed &e) const {
        return {{"error", ModelJson::toJson(e.error)}};
    }
    json operator()(const Evt::PositionReconciled &e) const {
        return {{"position", e.position}};
    }
    json operator()(const Evt::NativeStateChanged &e) const {
        return {{"state", toString(e.state)}};
    }
    json operator()(const Evt::NativeProgressUpdated &e) const {
        json payload = {{"position", e.position}, {"duration", e.duration}};
        if (e.buffered) {
            payload["buffered"] = *e.buffered;
        }
        return payload;
    }
    json operator()(const Evt::NativeTrackChanged &e) const {
        return {{"track", e.track ? ModelJson::toJson(*e.track) : json(nullptr)}};
    }
    json operator()(const Evt::NativeError &e) const {
        return {{"error", ModelJson::toJson(e.error)}};
    }
    json operator()(const Evt::NativePlaybackError &e) const {
        return {{"code", e.code}, {"message", e.message}};
    }

    // Events without data
    template <typename T> json operator()(const T &) const {
        return nullptr;
    }
};

bool requireNumber(const json &payload, const char *key, std::string *errorOut) {
    if (payload.is_object() && payload.contains(key) && payload[key].is_number()) {
        return true;
    }
    if (errorOut) {
        *errorOut = std::format("payload field '{}' must be a number", key);
    }
    return false;
}

bool requireString(const json &payload, const char *key, std::string *errorOut) {
    if (payload.is_object() && payload.contains(key) && payload[key].is_string()) {
        return true;
    }
    if (errorOut) {
        *errorOut = std::format("payload field '{}' must be a string", key);
    }
    return false;
}

}  // namespace

json PlayerEventCodec::encodePayload(const PlayerEvent &event) {
    return std::visit(PayloadEncoder{}, event.payload());
}

json PlayerEventCodec::encode(const PlayerEvent &event) {
    json encoded = {{"type", event.name()}};
    json payload = encodePayload(event);
    if (!payload.is_null()) {
        encoded["payload"] = std::move(payload);
    }
    return encoded;
}

std::optional<PlayerEvent> PlayerEventCodec::decode(const json &encoded, std::string *errorOut) {
    if (!encoded.is_object() || !encoded.contains("type") || !encoded["type"].is_string()) {
        if (errorOut) {
            *errorOut = "encoded event must be an object with a string 'type'";
        }
        return std::nullopt;
    }
    json payload = encoded.contains("payload") ? encoded["payload"] : json(nullptr);
    return decode(encoded["type"].get<std::string>(), payload, errorOut);
}

std::optional<PlayerEvent> PlayerEventCodec::decode(const std::string &type, const json &payload,
                                                    std::string *errorOut) {
    auto eventType = eventTypeFromString(type);
    if (!eventType) {
        if (errorOut) {
            *errorOut = std::format("unknown event type '{}'", type);
        }
        return std::nullopt;
    }

    switch (*eventType) {
    case PlayerEventType::LOAD_TRACK:
        if (!requireString(payload, "libraryItemId", errorOut)) {
            return std::nullopt;
        }
        return Evt::LoadTrack{payload["libraryItemId"].get<std::string>(),
                              JsonUtils::getOptionalString(payload, "episodeId")};
    case PlayerEventType::PLAY:
        return Evt::Play{};
    case PlayerEventType::PAUSE:
        return Evt::Pause{};
    case PlayerEventType::STOP:
        return Evt::Stop{};
    case PlayerEventType::SEEK:
        if (!requireNumber(payload, "position", errorOut)) {
            return std::nullopt;
        }
        return Evt::Seek{payload["position"].get<double>()};
    case PlayerEventType::SEEK_COMPLETE:
        return Evt::SeekComplete{};
    case PlayerEventType::SET_RATE:
        if (!requireNumber(payload, "rate", errorOut)) {
            return std::nullopt;
        }
        return Evt::SetRate{payload["rate"].get<double>()};
    case PlayerEventType::SET_VOLUME:
        if (!requireNumber(payload, "volume", errorOut)) {
            return std::nullopt;
        }
        return Evt::SetVolume{payload["volume"].get<double>()};
    case PlayerEventType::RESTORE_STATE:
        if (!JsonUtils::hasKey(payload, "state")) {
            if (errorOut) {
                *errorOut = "payload field 'state' is required";
            }
            return std::nullopt;
        }
        return Evt::RestoreState{ModelJson::persistedStateFromJson(payload["state"])};
    case PlayerEventType::RELOAD_QUEUE:
        if (!requireString(payload, "libraryItemId", errorOut)) {
            return std::nullopt;
        }
        return Evt::ReloadQueue{payload["libraryItemId"].get<std::string>()};
    case PlayerEventType::QUEUE_RELOADED:
        if (!requireNumber(payload, "position", errorOut)) {
            return std::nullopt;
        }
        return Evt::QueueReloaded{payload["position"].get<double>()};
    case PlayerEventType::CHAPTER_CHANGED:
        if (!JsonUtils::hasKey(payload, "chapter")) {
            if (errorOut) {
                *errorOut = "payload field 'chapter' is required";
            }
            return std::nullopt;
        }
        return Evt::ChapterChanged{ModelJson::currentChapterFromJson(payload["chapter"])};
    case PlayerEventType::BUFFERING_STARTED:
        return Evt::BufferingStarted{};
    case PlayerEventType::BUFFERING_COMPLETED:
        return Evt::BufferingCompleted{};
    case PlayerEventType::SESSION_CREATED:
        if (!requireString(payload, "sessionId", errorOut)) {
            return std::nullopt;
        }
        return Evt::SessionCreated{payload["sessionId"].get<std::string>()};
    case PlayerEventType::SESSION_UPDATED:
        return Evt::SessionUpdated{JsonUtils::getDouble(payload, "position")};
    case PlayerEventType::SESSION_ENDED:
        return Evt::SessionEnded{JsonUtils::getString(payload, "sessionId")};
    case PlayerEventType::SESSION_SYNC_STARTED:
        return Evt::SessionSyncStarted{};
    case PlayerEventType::SESSION_SYNC_COMPLETED:
        return Evt::SessionSyncCompleted{};
    case PlayerEventType::SESSION_SYNC_FAILED:
        return Evt::SessionSyncFailed{
            ModelJson::errorFromJson(JsonUtils::hasKey(payload, "error") ? payload["error"] : json::object())};
    case PlayerEventType::POSITION_RECONCILED:
        if (!requireNumber(payload, "position", errorOut)) {
            return std::nullopt;
        }
        return Evt::PositionReconciled{payload["position"].get<double>()};
    case PlayerEventType::APP_FOREGROUNDED:
        return Evt::AppForegrounded{};
    case PlayerEventType::APP_BACKGROUNDED:
        return Evt::AppBackgrounded{};
    case PlayerEventType::NATIVE_STATE_CHANGED: {
        auto state = nativePlaybackStateFromString(JsonUtils::getString(payload, "state"));
        if (!state) {
            if (errorOut) {
                *errorOut = "payload field 'state' must name a native playback state";
            }
            return std::nullopt;
        }
        return Evt::NativeStateChanged{*state};
    }
    case PlayerEventType::NATIVE_PROGRESS_UPDATED:
        if (!requireNumber(payload, "position", errorOut) || !requireNumber(payload, "duration", errorOut)) {
            return std::nullopt;
        }
        return Evt::NativeProgressUpdated{payload["position"].get<double>(), payload["duration"].get<double>(),
                                          JsonUtils::getOptionalDouble(payload, "buffered")};
    case PlayerEventType::NATIVE_TRACK_CHANGED: {
        Evt::NativeTrackChanged changed;
        if (JsonUtils::hasKey(payload, "track")) {
            changed.track = ModelJson::trackFromJson(payload["track"]);
        }
        return changed;
    }
    case PlayerEventType::NATIVE_ERROR:
        return Evt::NativeError{
            ModelJson::errorFromJson(JsonUtils::hasKey(payload, "error") ? payload["error"] : json::object())};
    case PlayerEventType::NATIVE_PLAYBACK_ERROR:
        return Evt::NativePlaybackError{JsonUtils::getString(payload, "code"),
                                        JsonUtils::getString(payload, "message")};
    }

    LOG_WARN("Unhandled event type '{}'", type);
    return std::nullopt;
}

}  // namespace PSC
