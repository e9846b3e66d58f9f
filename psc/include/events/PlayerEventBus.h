// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "common/CallGate.h"
#include "model/BoundedHistory.h"
#include "model/PlayerEvent.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace PSC {

/**
 * @brief In-process publish/subscribe channel for player events
 *
 * Producers (services, native callbacks, the native bridge) dispatch here;
 * the coordinator and the bridge subscribe. Keeps producers free of any
 * dependency on the coordinator.
 *
 * Listener fan-out is synchronous and happens outside the internal lock, so
 * a listener may dispatch or (un)subscribe re-entrantly. An exception thrown
 * by one listener is logged and does not reach its siblings or the caller.
 *
 * Once an Unsubscribe callable (or clearListeners()) returns, the listener is
 * not running on any other thread and will not be called again, so its
 * owner may be destroyed.
 */
class PlayerEventBus {
public:
    using Listener = std::function<void(const PlayerEvent &)>;
    using Unsubscribe = std::function<void()>;

    struct HistoryEntry {
        PlayerEvent event;
        TimestampMs timestamp = 0;
    };

    explicit PlayerEventBus(size_t historyCapacity = 100);

    PlayerEventBus(const PlayerEventBus &) = delete;
    PlayerEventBus &operator=(const PlayerEventBus &) = delete;

    /**
     * @brief Deliver an event to every listener subscribed at call time
     */
    void dispatch(const PlayerEvent &event);

    /**
     * @brief Register a listener
     * @return Callable removing the listener; safe to call more than once
     *         and after the bus is gone. Waits for calls of the listener that
     *         are running on other threads.
     */
    Unsubscribe subscribe(Listener listener);

    /**
     * @brief Recent dispatches, oldest first
     */
    std::vector<HistoryEntry> getEventHistory() const;

    size_t listenerCount() const;

    void clearListeners();

private:
    struct Subscription {
        explicit Subscription(Listener callback) : listener(std::move(callback)) {}

        Listener listener;
        CallGate gate;
    };

    struct Registry {
        std::mutex mutex;
        uint64_t nextId = 1;
        std::vector<std::pair<uint64_t, std::shared_ptr<Subscription>>> listeners;
    };

    std::shared_ptr<Registry> registry_;

    mutable std::mutex historyMutex_;
    BoundedHistory<HistoryEntry> history_;
};

}  // namespace PSC
