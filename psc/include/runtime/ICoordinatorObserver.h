// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "model/Diagnostics.h"
#include "model/PlayerEvent.h"
#include <string>

namespace PSC {

/**
 * @brief Interface for observing a PlayerStateCoordinator
 *
 * Callbacks run on the coordinator's event loop thread while the transition
 * lock is held. Implementations must return quickly and must not call
 * waitUntilIdle() or shutdown() on the coordinator.
 */
class ICoordinatorObserver {
public:
    virtual ~ICoordinatorObserver() = default;

    /**
     * @brief Called after validation and context update of every event
     */
    virtual void onDiagnostic(const DiagnosticEvent &diagnostic) = 0;

    /**
     * @brief Called when an event has been fully processed
     */
    virtual void onEventProcessed(const PlayerEvent &event, const EventProcessingResult &result) = 0;

    /**
     * @brief Called when processing an event threw
     * @param event Event being processed
     * @param message Exception text
     */
    virtual void onProcessingError(const PlayerEvent &event, const std::string &message) = 0;
};

}  // namespace PSC
