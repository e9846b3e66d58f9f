// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "common/JsonUtils.h"
#include "events/PlayerEventBus.h"
#include "model/BoundedHistory.h"
#include "model/Diagnostics.h"
#include "model/PlayerEvent.h"
#include "model/ResumePosition.h"
#include "model/StateContext.h"
#include "runtime/CoordinatorConfig.h"
#include "runtime/ICoordinatorObserver.h"
#include "runtime/IPlayerService.h"
#include "runtime/IStoreBridge.h"
#include "runtime/PositionResolver.h"
#include "runtime/RuntimeContext.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace PSC {

/**
 * @brief Single owner of the playback state of one execution context
 *
 * Events from any producer are queued by dispatch() and processed one at a
 * time on a dedicated worker thread. Each event runs under the transition
 * lock from validation through its side effect and store projection, so the
 * effects of two events never interleave.
 *
 * Per event the worker:
 * 1. validates (currentState, event) against TransitionTable;
 * 2. updates the context from the payload, accepted or not;
 * 3. records diagnostics and commits the next state;
 * 4. in execution mode, issues the Player Service command for the
 *    transition and projects the context to the store bridge;
 * 5. updates metrics and notifies observers.
 *
 * Construct one instance per execution context; instances share nothing.
 */
class PlayerStateCoordinator {
public:
    struct Dependencies {
        std::shared_ptr<IPlayerService> playerService;
        std::shared_ptr<IStoreBridge> storeBridge;  // null when the context has no UI store
        PositionSources positionSources;
    };

    PlayerStateCoordinator(Dependencies dependencies, const RuntimeContext &runtime,
                           const CoordinatorConfig &config = CoordinatorConfig{});

    /**
     * @brief Stops the worker; queued events are discarded
     */
    ~PlayerStateCoordinator();

    PlayerStateCoordinator(const PlayerStateCoordinator &) = delete;
    PlayerStateCoordinator &operator=(const PlayerStateCoordinator &) = delete;

    /**
     * @brief Queue an event for processing and return immediately
     *
     * Never blocks on event processing and never takes the transition lock.
     */
    void dispatch(const PlayerEvent &event);

    PlayerState getState() const;

    /**
     * @brief Copy of the context as of the last committed event
     */
    StateContext getContext() const;

    CoordinatorMetrics getMetrics() const;
    std::vector<TransitionHistoryEntry> getTransitionHistory() const;

    /**
     * @brief Events queued but not yet picked up by the worker
     */
    std::vector<PlayerEvent> getEventQueue() const;

    /**
     * @brief Recent per-event processing times in milliseconds, oldest first
     */
    std::vector<double> getProcessingTimes() const;

    CoordinatorDiagnostics exportDiagnostics() const;
    json exportDiagnosticsJson() const;

    /**
     * @brief Observer mode validates and records transitions without side effects
     */
    void setObserverMode(bool enabled);
    bool isObserverMode() const;

    /**
     * @brief Subscribe to a bus; self-dispatched events are published on it from then on
     *
     * Replaces a previous attachment.
     */
    void attachToEventBus(const std::shared_ptr<PlayerEventBus> &eventBus);
    void detachFromEventBus();

    void addObserver(std::shared_ptr<ICoordinatorObserver> observer);
    void removeObserver(const std::shared_ptr<ICoordinatorObserver> &observer);

    /**
     * @brief Resolve the canonical resume position of an item on a background task
     *
     * Publishes POSITION_RECONCILED with the result. The coordinator must
     * outlive the returned future.
     */
    std::future<ResumePositionInfo> resolveCanonicalPosition(const std::string &libraryItemId);

    /**
     * @brief Block until the queue is empty and no event is in flight
     * @return false on timeout
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) const;

    /**
     * @brief Stop the worker thread. Idempotent; later dispatches are dropped.
     */
    void shutdown();

    const RuntimeContext &runtimeContext() const {
        return runtime_;
    }

private:
    void eventProcessingWorker();
    void processEvent(const PlayerEvent &event);

    void updateContextFromEvent(StateContext &context, const PlayerEvent &event) const;
    void executeTransition(const PlayerEvent &event, PlayerState fromState, PlayerState nextState);
    void runCommand(const char *command, const std::function<std::future<CommandResult>()> &issue);
    void selfDispatch(const PlayerEvent &event);

    void syncPositionToStore(const StateContext &context);
    void syncStateToStore(const StateContext &context);
    void refreshNowPlayingIfChapterChanged(const StateContext &context);

    void notifyDiagnostic(const DiagnosticEvent &diagnostic);
    void notifyEventProcessed(const PlayerEvent &event, const EventProcessingResult &result);
    void notifyProcessingError(const PlayerEvent &event, const std::string &message);
    std::vector<std::shared_ptr<ICoordinatorObserver>> observersSnapshot() const;

    const RuntimeContext runtime_;
    std::shared_ptr<IPlayerService> playerService_;
    std::shared_ptr<IStoreBridge> storeBridge_;
    PositionResolver positionResolver_;

    std::atomic<bool> observerMode_;

    // Queue; dispatch() only ever touches this part
    mutable std::mutex queueMutex_;
    std::condition_variable queueCondition_;
    mutable std::condition_variable idleCondition_;
    std::deque<PlayerEvent> eventQueue_;
    bool processing_ = false;
    bool shutdownRequested_ = false;

    // "state-transition" lock, held by the worker for the whole of one event
    std::mutex transitionMutex_;

    // Snapshot state read by getters; written only by the worker
    mutable std::mutex stateMutex_;
    StateContext context_;
    CoordinatorMetrics metrics_;
    BoundedHistory<TransitionHistoryEntry> transitionHistory_;
    BoundedHistory<double> processingTimes_;

    // Worker-only
    std::optional<int> lastSyncedChapterId_;

    mutable std::mutex busMutex_;
    std::shared_ptr<PlayerEventBus> eventBus_;
    PlayerEventBus::Unsubscribe unsubscribeBus_;

    mutable std::mutex observersMutex_;
    std::vector<std::shared_ptr<ICoordinatorObserver>> observers_;

    std::atomic<uint64_t> reentrantDispatchCount_{0};

    std::thread workerThread_;

    // Coordinator whose Player Service command is running on this thread
    static thread_local const PlayerStateCoordinator *executingCommandFor_;
};

}  // namespace PSC
