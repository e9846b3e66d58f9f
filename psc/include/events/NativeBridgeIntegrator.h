// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "events/INativeTransport.h"
#include "events/PlayerEventBus.h"
#include "runtime/RuntimeContext.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace PSC {

/**
 * @brief Joins the local PlayerEventBus to the native event channel
 *
 * Local bus traffic is forwarded to native tagged with this instance's
 * context id; messages arriving from native are rebuilt into PlayerEvents and
 * dispatched on the local bus. Two rules keep every event crossing at most
 * once per direction:
 * - a message carrying our own context id is our echo and is dropped;
 * - bus dispatches made while handling a native message are not forwarded back.
 */
class NativeBridgeIntegrator {
public:
    struct Stats {
        uint64_t forwarded = 0;          // local events sent to native
        uint64_t received = 0;           // foreign events dispatched locally
        uint64_t echoesDropped = 0;      // own messages coming back
        uint64_t malformedDropped = 0;   // undecodable messages
    };

    NativeBridgeIntegrator(std::shared_ptr<PlayerEventBus> eventBus, std::shared_ptr<INativeTransport> transport,
                           const RuntimeContext &runtime);

    ~NativeBridgeIntegrator();

    NativeBridgeIntegrator(const NativeBridgeIntegrator &) = delete;
    NativeBridgeIntegrator &operator=(const NativeBridgeIntegrator &) = delete;

    /**
     * @brief Subscribe to the bus and the transport. Idempotent.
     */
    void initialize();

    /**
     * @brief Detach from the bus and the transport. Idempotent.
     */
    void cleanup();

    bool isInitialized() const {
        return initialized_.load();
    }

    /**
     * @brief Process-unique id generated at construction, e.g. "ctx-UI-1718000000000-9f3a..."
     */
    const std::string &contextId() const {
        return contextId_;
    }

    Stats getStats() const;

private:
    void onLocalEvent(const PlayerEvent &event);
    void onNativeMessage(const std::string &wireMessage);

    static std::string generateContextId(const RuntimeContext &runtime);

    std::shared_ptr<PlayerEventBus> eventBus_;
    std::shared_ptr<INativeTransport> transport_;
    RuntimeContext runtime_;
    const std::string contextId_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> initialized_{false};
    PlayerEventBus::Unsubscribe unsubscribeBus_;

    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> echoesDropped_{0};
    std::atomic<uint64_t> malformedDropped_{0};

    // Integrator currently re-dispatching a native message on this thread
    static thread_local const NativeBridgeIntegrator *handlingNativeFor_;
};

}  // namespace PSC
