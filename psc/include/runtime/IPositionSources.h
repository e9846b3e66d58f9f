// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "model/ResumePosition.h"
#include <optional>
#include <string>

namespace PSC {

// Read-only durable stores consulted when resolving a resume position.
// Any call may throw std::exception; callers degrade to the next source.

class IListeningSessionStore {
public:
    virtual ~IListeningSessionStore() = default;

    virtual std::optional<ActiveSessionRecord> getActiveSession(const std::string &userId,
                                                                const std::string &libraryItemId) = 0;
};

class IMediaProgressStore {
public:
    virtual ~IMediaProgressStore() = default;

    virtual std::optional<SavedProgressRecord> getMediaProgress(const std::string &libraryItemId,
                                                                const std::string &userId) = 0;
};

/**
 * @brief Small key/value store holding the last known position scalar
 */
class IPersistedPositionStore {
public:
    virtual ~IPersistedPositionStore() = default;

    virtual std::optional<double> get(const std::string &key) = 0;
    virtual void set(const std::string &key, double value) = 0;
    virtual void remove(const std::string &key) = 0;
};

class IUserIdentityProvider {
public:
    virtual ~IUserIdentityProvider() = default;

    /**
     * @brief Id of the signed-in user, nullopt when signed out
     */
    virtual std::optional<std::string> currentUserId() = 0;
};

}  // namespace PSC
