// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "model/ModelJson.h"
#include "events/PlayerEventCodec.h"

namespace PSC::ModelJson {

namespace {

template <typename T> json optionalToJson(const std::optional<T> &value) {
    return value ? json(*value) : json(nullptr);
}

json optionalStateToJson(const std::optional<PlayerState> &state) {
    return state ? json(toString(*state)) : json(nullptr);
}

}  // namespace

json toJson(const ChapterInfo &chapter) {
    return {{"id", chapter.id}, {"start", chapter.start}, {"end", chapter.end}, {"title", chapter.title}};
}

json toJson(const PlayerTrack &track) {
    json chapters = json::array();
    for (const auto &chapter : track.chapters) {
        chapters.push_back(toJson(chapter));
    }
    return {{"libraryItemId", track.libraryItemId},
            {"mediaId", track.mediaId},
            {"title", track.title},
            {"author", track.author},
            {"coverUri", optionalToJson(track.coverUri)},
            {"chapters", chapters},
            {"duration", track.duration},
            {"isDownloaded", track.isDownloaded}};
}

json toJson(const CurrentChapter &chapter) {
    return {{"chapter", toJson(chapter.chapter)},
            {"positionInChapter", chapter.positionInChapter},
            {"chapterDuration", chapter.chapterDuration}};
}

json toJson(const PersistedPlayerState &state) {
    return {{"currentTrack", state.currentTrack ? toJson(*state.currentTrack) : json(nullptr)},
            {"position", state.position},
            {"playbackRate", state.playbackRate},
            {"volume", state.volume},
            {"isPlaying", state.isPlaying},
            {"currentPlaySessionId", optionalToJson(state.currentPlaySessionId)}};
}

json toJson(const PlayerError &error) {
    return {{"code", error.code}, {"message", error.message}};
}

json toJson(const StateContext &context) {
    return {{"currentState", toString(context.currentState)},
            {"previousState", optionalStateToJson(context.previousState)},
            {"currentTrack", context.currentTrack ? toJson(*context.currentTrack) : json(nullptr)},
            {"position", context.position},
            {"duration", context.duration},
            {"playbackRate", context.playbackRate},
            {"volume", context.volume},
            {"sessionId", optionalToJson(context.sessionId)},
            {"sessionStartTime", optionalToJson(context.sessionStartTime)},
            {"lastPositionUpdate", context.lastPositionUpdate},
            {"currentChapter", context.currentChapter ? toJson(*context.currentChapter) : json(nullptr)},
            {"isPlaying", context.isPlaying},
            {"isBuffering", context.isBuffering},
            {"isSeeking", context.isSeeking},
            {"preSeekState", optionalStateToJson(context.preSeekState)},
            {"isLoadingTrack", context.isLoadingTrack},
            {"lastServerSync", optionalToJson(context.lastServerSync)},
            {"pendingSyncPosition", optionalToJson(context.pendingSyncPosition)},
            {"lastError", context.lastError ? toJson(*context.lastError) : json(nullptr)}};
}

json toJson(const CoordinatorMetrics &metrics) {
    return {{"eventQueueLength", metrics.eventQueueLength},
            {"avgEventProcessingTime", metrics.avgEventProcessingTime},
            {"totalEventsProcessed", metrics.totalEventsProcessed},
            {"stateTransitionCount", metrics.stateTransitionCount},
            {"rejectedTransitionCount", metrics.rejectedTransitionCount},
            {"positionReconciliationCount", metrics.positionReconciliationCount},
            {"sideEffectFailureCount", metrics.sideEffectFailureCount},
            {"processingErrorCount", metrics.processingErrorCount},
            {"reentrantDispatchCount", metrics.reentrantDispatchCount},
            {"lastEventTimestamp", optionalToJson(metrics.lastEventTimestamp)}};
}

json toJson(const TransitionHistoryEntry &entry) {
    return {{"timestamp", entry.timestamp},
            {"event", PlayerEventCodec::encode(entry.event)},
            {"fromState", toString(entry.fromState)},
            {"toState", optionalStateToJson(entry.toState)},
            {"allowed", entry.allowed},
            {"reason", optionalToJson(entry.reason)},
            {"processingTime", entry.processingTimeMs}};
}

json toJson(const CoordinatorDiagnostics &diagnostics) {
    json queue = json::array();
    for (const auto &event : diagnostics.eventQueue) {
        queue.push_back(PlayerEventCodec::encode(event));
    }
    json history = json::array();
    for (const auto &entry : diagnostics.transitionHistory) {
        history.push_back(toJson(entry));
    }
    return {{"context", toJson(diagnostics.context)},
            {"metrics", toJson(diagnostics.metrics)},
            {"eventQueue", queue},
            {"processingTimes", diagnostics.processingTimes},
            {"transitionHistory", history},
            {"observerMode", diagnostics.observerMode},
            {"runtimeContext", diagnostics.runtimeContext}};
}

json toJson(const ResumePositionInfo &info) {
    return {{"position", info.position},
            {"source", toString(info.source)},
            {"authoritativePosition", optionalToJson(info.authoritativePosition)},
            {"asyncStoragePosition", optionalToJson(info.asyncStoragePosition)}};
}

ChapterInfo chapterFromJson(const json &value) {
    ChapterInfo chapter;
    if (value.is_object() && value.contains("id") && value["id"].is_number_integer()) {
        chapter.id = value["id"].get<int>();
    }
    chapter.start = JsonUtils::getDouble(value, "start");
    chapter.end = JsonUtils::getDouble(value, "end");
    chapter.title = JsonUtils::getString(value, "title");
    return chapter;
}

PlayerTrack trackFromJson(const json &value) {
    PlayerTrack track;
    track.libraryItemId = JsonUtils::getString(value, "libraryItemId");
    track.mediaId = JsonUtils::getString(value, "mediaId");
    track.title = JsonUtils::getString(value, "title");
    track.author = JsonUtils::getString(value, "author");
    track.coverUri = JsonUtils::getOptionalString(value, "coverUri");
    if (JsonUtils::hasKey(value, "chapters") && value["chapters"].is_array()) {
        for (const auto &chapter : value["chapters"]) {
            track.chapters.push_back(chapterFromJson(chapter));
        }
    }
    track.duration = JsonUtils::getDouble(value, "duration");
    track.isDownloaded = JsonUtils::getBool(value, "isDownloaded");
    return track;
}

CurrentChapter currentChapterFromJson(const json &value) {
    CurrentChapter chapter;
    if (JsonUtils::hasKey(value, "chapter")) {
        chapter.chapter = chapterFromJson(value["chapter"]);
    }
    chapter.positionInChapter = JsonUtils::getDouble(value, "positionInChapter");
    chapter.chapterDuration = JsonUtils::getDouble(value, "chapterDuration");
    return chapter;
}

PersistedPlayerState persistedStateFromJson(const json &value) {
    PersistedPlayerState state;
    if (JsonUtils::hasKey(value, "currentTrack")) {
        state.currentTrack = trackFromJson(value["currentTrack"]);
    }
    state.position = JsonUtils::getDouble(value, "position");
    state.playbackRate = JsonUtils::getDouble(value, "playbackRate", 1.0);
    state.volume = JsonUtils::getDouble(value, "volume", 1.0);
    state.isPlaying = JsonUtils::getBool(value, "isPlaying");
    state.currentPlaySessionId = JsonUtils::getOptionalString(value, "currentPlaySessionId");
    return state;
}

PlayerError errorFromJson(const json &value) {
    return PlayerError{JsonUtils::getString(value, "code"), JsonUtils::getString(value, "message")};
}

}  // namespace PSC::ModelJson
