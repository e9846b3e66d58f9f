// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "model/PlayerEvent.h"
#include "model/PlayerState.h"
#include "model/StateContext.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace PSC {

/**
 * @brief One validated event as recorded in the transition history
 */
struct TransitionHistoryEntry {
    TimestampMs timestamp = 0;
    PlayerEvent event;
    PlayerState fromState = PlayerState::IDLE;
    std::optional<PlayerState> toState;  // empty when rejected
    bool allowed = false;
    std::optional<std::string> reason;
    double processingTimeMs = 0.0;
};

/**
 * @brief Snapshot published to observers for every processed event
 */
struct DiagnosticEvent {
    TimestampMs timestamp = 0;
    PlayerEvent event;
    PlayerState currentState = PlayerState::IDLE;
    std::optional<PlayerState> nextState;
    bool allowed = false;
    StateContext context;
};

struct CoordinatorMetrics {
    size_t eventQueueLength = 0;
    double avgEventProcessingTime = 0.0;  // milliseconds, moving window
    uint64_t totalEventsProcessed = 0;
    uint64_t stateTransitionCount = 0;
    uint64_t rejectedTransitionCount = 0;
    uint64_t positionReconciliationCount = 0;
    uint64_t sideEffectFailureCount = 0;
    uint64_t processingErrorCount = 0;
    uint64_t reentrantDispatchCount = 0;
    std::optional<TimestampMs> lastEventTimestamp;
};

struct EventProcessingResult {
    bool success = true;
    bool stateChanged = false;
    PlayerState previousState = PlayerState::IDLE;
    PlayerState newState = PlayerState::IDLE;
    std::optional<std::string> error;
    double processingTimeMs = 0.0;
};

/**
 * @brief Everything exportDiagnostics() hands out in one consistent copy
 */
struct CoordinatorDiagnostics {
    StateContext context;
    CoordinatorMetrics metrics;
    std::vector<PlayerEvent> eventQueue;
    std::vector<double> processingTimes;
    std::vector<TransitionHistoryEntry> transitionHistory;
    bool observerMode = false;
    std::string runtimeContext;
};

}  // namespace PSC
