// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "model/PlayerTypes.h"
#include <optional>
#include <string>

namespace PSC {

/**
 * @brief Where a resolved resume position came from
 */
enum class ResumeSource { ActiveSession, SavedProgress, AsyncStorage, Store };

const char *toString(ResumeSource source);

/**
 * @brief Result of canonical position resolution. Computed on demand, never persisted.
 */
struct ResumePositionInfo {
    double position = 0.0;
    ResumeSource source = ResumeSource::Store;
    std::optional<double> authoritativePosition;
    std::optional<double> asyncStoragePosition;  // locally persisted value as read, whatever won

    bool operator==(const ResumePositionInfo &) const = default;
};

/**
 * @brief Open local listening session for (user, item)
 */
struct ActiveSessionRecord {
    std::string sessionId;
    std::string libraryItemId;
    double currentTime = 0.0;
    TimestampMs updatedAt = 0;
};

/**
 * @brief Saved media progress for (user, item)
 */
struct SavedProgressRecord {
    std::string libraryItemId;
    double currentTime = 0.0;
    std::optional<TimestampMs> lastUpdate;
    bool isFinished = false;
};

}  // namespace PSC
