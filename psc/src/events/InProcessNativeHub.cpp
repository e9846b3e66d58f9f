// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "events/InProcessNativeHub.h"
#include "common/CallGate.h"
#include "common/Logger.h"
#include <algorithm>
#include <atomic>
#include <utility>

namespace PSC {

struct InProcessNativeHub::Shared {
    std::mutex mutex;
    std::vector<std::weak_ptr<Endpoint>> endpoints;
    std::atomic<uint64_t> delivered{0};

    void broadcast(const std::string &wireMessage);
};

class InProcessNativeHub::Endpoint : public INativeTransport {
public:
    explicit Endpoint(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}

    bool send(const std::string &wireMessage) override {
        shared_->broadcast(wireMessage);
        return true;
    }

    void setReceiver(Receiver receiver) override {
        auto slot = std::make_shared<ReceiverSlot>(std::move(receiver));
        std::shared_ptr<ReceiverSlot> previous;
        {
            std::lock_guard<std::mutex> lock(receiverMutex_);
            previous = std::exchange(receiver_, std::move(slot));
        }
        if (previous) {
            previous->gate.close();
        }
    }

    void clearReceiver() override {
        std::shared_ptr<ReceiverSlot> previous;
        {
            std::lock_guard<std::mutex> lock(receiverMutex_);
            previous = std::move(receiver_);
            receiver_.reset();
        }
        // A delivery that already copied the slot finishes before the owner may go away
        if (previous) {
            previous->gate.close();
        }
    }

    bool deliver(const std::string &wireMessage) {
        std::shared_ptr<ReceiverSlot> slot;
        {
            std::lock_guard<std::mutex> lock(receiverMutex_);
            slot = receiver_;
        }
        if (!slot) {
            return false;
        }
        CallGate::Pass pass(slot->gate);
        if (!pass) {
            return false;
        }
        slot->receiver(wireMessage);
        return true;
    }

private:
    std::shared_ptr<Shared> shared_;

    struct ReceiverSlot {
        explicit ReceiverSlot(Receiver callback) : receiver(std::move(callback)) {}

        Receiver receiver;
        CallGate gate;
    };

    std::mutex receiverMutex_;
    std::shared_ptr<ReceiverSlot> receiver_;
};

void InProcessNativeHub::Shared::broadcast(const std::string &wireMessage) {
    std::vector<std::shared_ptr<Endpoint>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex);
        endpoints.erase(std::remove_if(endpoints.begin(), endpoints.end(),
                                       [](const auto &endpoint) { return endpoint.expired(); }),
                        endpoints.end());
        for (const auto &weak : endpoints) {
            if (auto endpoint = weak.lock()) {
                targets.push_back(std::move(endpoint));
            }
        }
    }

    for (const auto &endpoint : targets) {
        try {
            if (endpoint->deliver(wireMessage)) {
                ++delivered;
            }
        } catch (const std::exception &e) {
            LOG_ERROR("Receiver threw while handling native message: {}", e.what());
        }
    }
}

InProcessNativeHub::InProcessNativeHub() : shared_(std::make_shared<Shared>()) {}

std::shared_ptr<INativeTransport> InProcessNativeHub::createEndpoint() {
    auto endpoint = std::make_shared<Endpoint>(shared_);
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->endpoints.push_back(endpoint);
    return endpoint;
}

uint64_t InProcessNativeHub::deliveredCount() const {
    return shared_->delivered.load();
}

size_t InProcessNativeHub::endpointCount() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return std::count_if(shared_->endpoints.begin(), shared_->endpoints.end(),
                         [](const auto &endpoint) { return !endpoint.expired(); });
}

}  // namespace PSC
