// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace PSC {

/**
 * @brief Tracks calls into a callback so its owner can detach safely
 *
 * Callers copy the callback out of a lock and invoke it later, so removing it
 * from a registry does not stop a call already on its way. close() blocks until
 * calls running on other threads have left, and refuses every later enter().
 * Calls made by the closing thread itself are not waited for, so a callback may
 * detach itself.
 *
 * @code
 * CallGate::Pass pass(gate);
 * if (pass) {
 *     callback(event);
 * }
 * @endcode
 */
class CallGate {
public:
    /**
     * @brief Scoped entry; evaluates to false when the gate is closed
     */
    class Pass {
    public:
        explicit Pass(CallGate &gate) : gate_(gate), entered_(gate.enter()) {}

        ~Pass() {
            if (entered_) {
                gate_.leave();
            }
        }

        Pass(const Pass &) = delete;
        Pass &operator=(const Pass &) = delete;

        explicit operator bool() const {
            return entered_;
        }

    private:
        CallGate &gate_;
        bool entered_;
    };

    /**
     * @return false once the gate is closed
     */
    bool enter();
    void leave();

    /**
     * @brief Refuse new calls and wait for calls on other threads to finish. Idempotent.
     */
    void close();

    bool isClosed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable idleCondition_;
    std::vector<std::thread::id> inFlight_;
    bool closed_ = false;
};

}  // namespace PSC
