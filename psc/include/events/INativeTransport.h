// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include <functional>
#include <string>

namespace PSC {

/**
 * @brief Native messaging channel shared by the UI and headless contexts
 *
 * The native side rebroadcasts every message to every attached execution
 * context, the sender included. Messages travel in NativeMessage wire form.
 */
class INativeTransport {
public:
    using Receiver = std::function<void(const std::string &wireMessage)>;

    virtual ~INativeTransport() = default;

    /**
     * @brief Hand a message to the native side
     * @return false if the channel is not available
     */
    virtual bool send(const std::string &wireMessage) = 0;

    /**
     * @brief Install the callback for messages coming from native (replaces any previous one)
     */
    virtual void setReceiver(Receiver receiver) = 0;

    /**
     * @brief Remove the callback; on return it is no longer running on another thread
     */
    virtual void clearReceiver() = 0;
};

}  // namespace PSC
