// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "common/JsonUtils.h"
#include <optional>
#include <string>

namespace PSC {

/**
 * @brief Message exchanged with the native event channel
 *
 * Wire form: {"type": "...", "payload": {...}, "contextId": "ctx-..."}.
 * The payload member is omitted for events without data.
 */
struct NativeMessage {
    std::string type;
    json payload;  // null when absent
    std::string contextId;

    std::string toWire() const;

    /**
     * @brief Parse a wire message
     * @return Message, or nullopt when the text is not JSON or has no type
     */
    static std::optional<NativeMessage> fromWire(const std::string &wire, std::string *errorOut = nullptr);
};

}  // namespace PSC
