// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "events/INativeTransport.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace PSC {

/**
 * @brief In-process stand-in for the native event module
 *
 * Each endpoint is an INativeTransport. A message sent on any endpoint is
 * delivered synchronously to the receiver of every live endpoint, including
 * the sending one, which is what the platform module does and why the bridge
 * needs echo suppression.
 */
class InProcessNativeHub {
public:
    InProcessNativeHub();

    /**
     * @brief Attach a new endpoint; it detaches when the last reference is dropped
     */
    std::shared_ptr<INativeTransport> createEndpoint();

    uint64_t deliveredCount() const;

    size_t endpointCount() const;

private:
    class Endpoint;
    struct Shared;

    std::shared_ptr<Shared> shared_;
};

}  // namespace PSC
