// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "events/NativeBridgeIntegrator.h"
#include "common/Logger.h"
#include "events/NativeMessage.h"
#include "events/PlayerEventCodec.h"
#include <random>

namespace PSC {

thread_local const NativeBridgeIntegrator *NativeBridgeIntegrator::handlingNativeFor_ = nullptr;

namespace {

/**
 * @brief Marks the current thread as handling a native message for one integrator
 */
class NativeDispatchScope {
public:
    NativeDispatchScope(const NativeBridgeIntegrator *&slot, const NativeBridgeIntegrator *owner)
        : slot_(slot), previous_(slot) {
        slot_ = owner;
    }

    ~NativeDispatchScope() {
        slot_ = previous_;
    }

private:
    const NativeBridgeIntegrator *&slot_;
    const NativeBridgeIntegrator *previous_;
};

}  // namespace

NativeBridgeIntegrator::NativeBridgeIntegrator(std::shared_ptr<PlayerEventBus> eventBus,
                                               std::shared_ptr<INativeTransport> transport,
                                               const RuntimeContext &runtime)
    : eventBus_(std::move(eventBus)), transport_(std::move(transport)), runtime_(runtime),
      contextId_(generateContextId(runtime)) {}

NativeBridgeIntegrator::~NativeBridgeIntegrator() {
    cleanup();
}

void NativeBridgeIntegrator::initialize() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (initialized_.load()) {
        return;
    }

    LOG_INFO("Initializing native bridge for {} context, id {}", runtime_.label(), contextId_);

    unsubscribeBus_ = eventBus_->subscribe([this](const PlayerEvent &event) { onLocalEvent(event); });
    transport_->setReceiver([this](const std::string &wireMessage) { onNativeMessage(wireMessage); });

    initialized_.store(true);
}

void NativeBridgeIntegrator::cleanup() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!initialized_.load()) {
        return;
    }

    if (unsubscribeBus_) {
        unsubscribeBus_();
        unsubscribeBus_ = nullptr;
    }
    transport_->clearReceiver();
    initialized_.store(false);

    LOG_DEBUG("Native bridge {} detached", contextId_);
}

NativeBridgeIntegrator::Stats NativeBridgeIntegrator::getStats() const {
    return Stats{forwarded_.load(), received_.load(), echoesDropped_.load(), malformedDropped_.load()};
}

void NativeBridgeIntegrator::onLocalEvent(const PlayerEvent &event) {
    if (handlingNativeFor_ == this) {
        return;  // came from native, must not bounce back
    }

    NativeMessage message{event.name(), PlayerEventCodec::encodePayload(event), contextId_};

    LOG_DEBUG("Broadcasting {} to native", event.name());
    if (transport_->send(message.toWire())) {
        ++forwarded_;
    } else {
        LOG_WARN("Native transport unavailable, {} not broadcast", event.name());
    }
}

void NativeBridgeIntegrator::onNativeMessage(const std::string &wireMessage) {
    std::string error;
    auto message = NativeMessage::fromWire(wireMessage, &error);
    if (!message) {
        ++malformedDropped_;
        LOG_WARN("Dropping malformed native message: {}", error);
        return;
    }

    if (message->contextId == contextId_) {
        ++echoesDropped_;
        return;
    }

    auto event = PlayerEventCodec::decode(message->type, message->payload, &error);
    if (!event) {
        ++malformedDropped_;
        LOG_WARN("Dropping native message {} from {}: {}", message->type, message->contextId, error);
        return;
    }

    LOG_DEBUG("Received cross-context event {} from {}", message->type, message->contextId);

    NativeDispatchScope scope(handlingNativeFor_, this);
    ++received_;
    eventBus_->dispatch(*event);
}

std::string NativeBridgeIntegrator::generateContextId(const RuntimeContext &runtime) {
    static std::atomic<uint64_t> instanceCounter{0};

    std::random_device device;
    std::mt19937_64 generator(device());
    std::uniform_int_distribution<uint64_t> distribution;

    return std::format("ctx-{}-{}-{:x}-{}", runtime.label(), currentTimestampMs(), distribution(generator),
                       ++instanceCounter);
}

}  // namespace PSC
