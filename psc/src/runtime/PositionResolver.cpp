// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "runtime/PositionResolver.h"
#include "common/Logger.h"
#include <cmath>

namespace PSC {

namespace {

void choose(ResumePositionInfo &info, double position, ResumeSource source) {
    info.position = position;
    info.source = source;
    info.authoritativePosition = position;
}

}  // namespace

PositionResolver::PositionResolver(PositionSources sources, const CoordinatorConfig &config)
    : sources_(std::move(sources)), minPlausiblePosition_(config.minPlausiblePosition),
      largeDiscrepancyThreshold_(config.largeDiscrepancyThreshold),
      persistedPositionKey_(config.persistedPositionKey) {}

ResumePositionInfo PositionResolver::resolve(const std::string &libraryItemId, double inMemoryPosition) {
    ResumePositionInfo info;
    info.position = inMemoryPosition;
    info.source = ResumeSource::Store;

    const auto persisted = readPersistedPosition();
    info.asyncStoragePosition = persisted;
    if (persisted) {
        choose(info, *persisted, ResumeSource::AsyncStorage);
    }

    bool finished = false;
    if (auto userId = lookupUserId()) {
        auto session = lookupActiveSession(*userId, libraryItemId);
        auto saved = lookupSavedProgress(*userId, libraryItemId);

        if (saved && saved->isFinished) {
            LOG_INFO("Item {} is finished, resuming from the beginning", libraryItemId);
            choose(info, 0.0, ResumeSource::SavedProgress);
            clearPersistedPosition();
            finished = true;
        } else if (session) {
            chooseFromSession(info, *session, saved, persisted);
        } else if (saved && saved->currentTime > 0.0) {
            LOG_INFO("Resume position from saved progress: {:.1f}s", saved->currentTime);
            choose(info, saved->currentTime, ResumeSource::SavedProgress);
        }
    }

    if (info.source == ResumeSource::Store) {
        info.authoritativePosition.reset();
        if (info.position > 0.0) {
            LOG_INFO("Using in-memory position for resume: {:.1f}s", info.position);
        }
    }

    if (!finished && info.authoritativePosition && info.authoritativePosition != persisted) {
        writePersistedPosition(*info.authoritativePosition);
    }

    LOG_INFO("Resolved {}: position={:.1f}s source={}", libraryItemId, info.position, toString(info.source));
    return info;
}

void PositionResolver::chooseFromSession(ResumePositionInfo &info, const ActiveSessionRecord &session,
                                         const std::optional<SavedProgressRecord> &saved,
                                         const std::optional<double> &persisted) const {
    const double sessionPosition = session.currentTime;

    if (sessionPosition < minPlausiblePosition_) {
        if (saved && saved->currentTime >= minPlausiblePosition_) {
            LOG_WARN("Rejecting implausible session position {:.1f}s, using saved progress {:.1f}s", sessionPosition,
                     saved->currentTime);
            choose(info, saved->currentTime, ResumeSource::SavedProgress);
        } else if (persisted && *persisted >= minPlausiblePosition_) {
            LOG_WARN("Rejecting implausible session position {:.1f}s, using persisted position {:.1f}s",
                     sessionPosition, *persisted);
            choose(info, *persisted, ResumeSource::AsyncStorage);
        } else {
            LOG_INFO("Resume position from active session (small, no alternative): {:.1f}s", sessionPosition);
            choose(info, sessionPosition, ResumeSource::ActiveSession);
        }
        return;
    }

    if (saved && saved->currentTime > 0.0 && saved->lastUpdate) {
        const double difference = std::fabs(sessionPosition - saved->currentTime);
        if (difference > largeDiscrepancyThreshold_) {
            const bool sessionIsNewer = session.updatedAt > *saved->lastUpdate;
            LOG_WARN("Large position discrepancy: session={:.1f}s ({}) vs saved={:.1f}s ({}), using {}",
                     sessionPosition, session.updatedAt, saved->currentTime, *saved->lastUpdate,
                     sessionIsNewer ? "activeSession" : "savedProgress");
            if (sessionIsNewer) {
                choose(info, sessionPosition, ResumeSource::ActiveSession);
            } else {
                choose(info, saved->currentTime, ResumeSource::SavedProgress);
            }
            return;
        }
    }

    LOG_INFO("Resume position from active session: {:.1f}s", sessionPosition);
    choose(info, sessionPosition, ResumeSource::ActiveSession);
}

std::optional<double> PositionResolver::readPersistedPosition() {
    if (!sources_.persisted) {
        return std::nullopt;
    }
    try {
        return sources_.persisted->get(persistedPositionKey_);
    } catch (const std::exception &e) {
        LOG_ERROR("Failed to read persisted position: {}", e.what());
        return std::nullopt;
    }
}

void PositionResolver::writePersistedPosition(double position) {
    if (!sources_.persisted) {
        return;
    }
    try {
        sources_.persisted->set(persistedPositionKey_, position);
    } catch (const std::exception &e) {
        LOG_ERROR("Failed to persist position {:.1f}s: {}", position, e.what());
    }
}

void PositionResolver::clearPersistedPosition() {
    if (!sources_.persisted) {
        return;
    }
    try {
        sources_.persisted->remove(persistedPositionKey_);
    } catch (const std::exception &e) {
        LOG_ERROR("Failed to clear persisted position: {}", e.what());
    }
}

std::optional<std::string> PositionResolver::lookupUserId() {
    if (!sources_.identity) {
        return std::nullopt;
    }
    try {
        return sources_.identity->currentUserId();
    } catch (const std::exception &e) {
        LOG_ERROR("Failed to look up current user: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ActiveSessionRecord> PositionResolver::lookupActiveSession(const std::string &userId,
                                                                         const std::string &libraryItemId) {
    if (!sources_.sessions) {
        return std::nullopt;
    }
    try {
        return sources_.sessions->getActiveSession(userId, libraryItemId);
    } catch (const std::exception &e) {
        LOG_ERROR("Active session lookup failed for {}: {}", libraryItemId, e.what());
        return std::nullopt;
    }
}

std::optional<SavedProgressRecord> PositionResolver::lookupSavedProgress(const std::string &userId,
                                                                         const std::string &libraryItemId) {
    if (!sources_.progress) {
        return std::nullopt;
    }
    try {
        return sources_.progress->getMediaProgress(libraryItemId, userId);
    } catch (const std::exception &e) {
        LOG_ERROR("Saved progress lookup failed for {}: {}", libraryItemId, e.what());
        return std::nullopt;
    }
}

}  // namespace PSC
