// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "events/PlayerEventBus.h"
#include "common/Logger.h"
#include <algorithm>

namespace PSC {

PlayerEventBus::PlayerEventBus(size_t historyCapacity)
    : registry_(std::make_shared<Registry>()), history_(historyCapacity) {}

void PlayerEventBus::dispatch(const PlayerEvent &event) {
    LOG_DEBUG("Event dispatched: {}", event.name());

    {
        std::lock_guard<std::mutex> lock(historyMutex_);
        history_.push(HistoryEntry{event, currentTimestampMs()});
    }

    // Copy listeners so they run without the registry lock held
    std::vector<std::pair<uint64_t, std::shared_ptr<Subscription>>> listeners;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        listeners = registry_->listeners;
    }

    for (const auto &[id, subscription] : listeners) {
        CallGate::Pass pass(subscription->gate);
        if (!pass) {
            continue;  // unsubscribed after the copy was taken
        }
        try {
            subscription->listener(event);
        } catch (const std::exception &e) {
            LOG_ERROR("Listener {} failed on {}: {}", id, event.name(), e.what());
        }
    }
}

PlayerEventBus::Unsubscribe PlayerEventBus::subscribe(Listener listener) {
    auto subscription = std::make_shared<Subscription>(std::move(listener));
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        id = registry_->nextId++;
        registry_->listeners.emplace_back(id, subscription);
    }

    std::weak_ptr<Registry> weakRegistry = registry_;
    return [weakRegistry, subscription, id]() {
        if (auto registry = weakRegistry.lock()) {
            std::lock_guard<std::mutex> lock(registry->mutex);
            auto &listeners = registry->listeners;
            listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                                           [id](const auto &entry) { return entry.first == id; }),
                            listeners.end());
        }
        // Outside the registry lock: an in-flight call may itself subscribe or dispatch
        subscription->gate.close();
    };
}

std::vector<PlayerEventBus::HistoryEntry> PlayerEventBus::getEventHistory() const {
    std::lock_guard<std::mutex> lock(historyMutex_);
    return history_.snapshot();
}

size_t PlayerEventBus::listenerCount() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->listeners.size();
}

void PlayerEventBus::clearListeners() {
    std::vector<std::pair<uint64_t, std::shared_ptr<Subscription>>> removed;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        removed.swap(registry_->listeners);
    }
    for (const auto &[id, subscription] : removed) {
        subscription->gate.close();
    }
}

}  // namespace PSC
