// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "common/CallGate.h"
#include <algorithm>

namespace PSC {

bool CallGate::enter() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    inFlight_.push_back(std::this_thread::get_id());
    return true;
}

void CallGate::leave() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = std::find(inFlight_.begin(), inFlight_.end(), std::this_thread::get_id());
        if (found != inFlight_.end()) {
            inFlight_.erase(found);
        }
    }
    idleCondition_.notify_all();
}

void CallGate::close() {
    const auto self = std::this_thread::get_id();

    std::unique_lock<std::mutex> lock(mutex_);
    closed_ = true;
    idleCondition_.wait(lock, [this, self] {
        return std::all_of(inFlight_.begin(), inFlight_.end(), [self](const auto &id) { return id == self; });
    });
}

bool CallGate::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace PSC
