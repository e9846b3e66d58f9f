// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace PSC {

// Wall-clock milliseconds since the Unix epoch
using TimestampMs = int64_t;

TimestampMs currentTimestampMs();

struct ChapterInfo {
    int id = 0;
    double start = 0.0;  // seconds
    double end = 0.0;    // seconds
    std::string title;

    bool operator==(const ChapterInfo &) const = default;
};

struct PlayerTrack {
    std::string libraryItemId;
    std::string mediaId;
    std::string title;
    std::string author;
    std::optional<std::string> coverUri;
    std::vector<ChapterInfo> chapters;
    double duration = 0.0;  // seconds
    bool isDownloaded = false;

    bool operator==(const PlayerTrack &) const = default;
};

struct CurrentChapter {
    ChapterInfo chapter;
    double positionInChapter = 0.0;
    double chapterDuration = 0.0;

    bool operator==(const CurrentChapter &) const = default;
};

/**
 * @brief Player state persisted by the host between launches
 */
struct PersistedPlayerState {
    std::optional<PlayerTrack> currentTrack;
    double position = 0.0;
    double playbackRate = 1.0;
    double volume = 1.0;
    bool isPlaying = false;
    std::optional<std::string> currentPlaySessionId;

    bool operator==(const PersistedPlayerState &) const = default;
};

struct PlayerError {
    std::string code;
    std::string message;

    std::string describe() const {
        return code.empty() ? message : code + ": " + message;
    }

    bool operator==(const PlayerError &) const = default;
};

}  // namespace PSC
