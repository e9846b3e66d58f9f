// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "model/ResumePosition.h"
#include "runtime/CoordinatorConfig.h"
#include "runtime/IPositionSources.h"
#include <memory>
#include <optional>
#include <string>

namespace PSC {

/**
 * @brief Durable stores consulted during resolution; any of them may be null
 */
struct PositionSources {
    std::shared_ptr<IUserIdentityProvider> identity;
    std::shared_ptr<IListeningSessionStore> sessions;
    std::shared_ptr<IMediaProgressStore> progress;
    std::shared_ptr<IPersistedPositionStore> persisted;
};

/**
 * @brief Picks the position playback should resume from
 *
 * Authority, lowest first: the caller's in-memory value, the locally
 * persisted scalar, then the user's active listening session and saved media
 * progress. Rules applied on top:
 * - a finished item always resumes from 0 and the persisted scalar is cleared;
 * - a session position below minPlausiblePosition is the native
 *   0-before-seek artifact and loses to any plausible alternative;
 * - when session and saved progress disagree by more than
 *   largeDiscrepancyThreshold, the more recently updated record wins.
 *
 * Every store read is isolated: a throwing lookup is logged and resolution
 * continues with what is left. The winning authoritative value is written
 * back to the persisted scalar when it differs from what was stored.
 */
class PositionResolver {
public:
    PositionResolver(PositionSources sources, const CoordinatorConfig &config);

    ResumePositionInfo resolve(const std::string &libraryItemId, double inMemoryPosition);

private:
    std::optional<double> readPersistedPosition();
    void writePersistedPosition(double position);
    void clearPersistedPosition();

    std::optional<std::string> lookupUserId();
    std::optional<ActiveSessionRecord> lookupActiveSession(const std::string &userId, const std::string &libraryItemId);
    std::optional<SavedProgressRecord> lookupSavedProgress(const std::string &userId, const std::string &libraryItemId);

    void chooseFromSession(ResumePositionInfo &info, const ActiveSessionRecord &session,
                           const std::optional<SavedProgressRecord> &saved,
                           const std::optional<double> &persisted) const;

    PositionSources sources_;
    double minPlausiblePosition_;
    double largeDiscrepancyThreshold_;
    std::string persistedPositionKey_;
};

}  // namespace PSC
