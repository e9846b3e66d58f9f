// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "common/JsonUtils.h"
#include "model/PlayerEvent.h"
#include <optional>
#include <string>

namespace PSC {

/**
 * @brief JSON form of PlayerEvent used on the native transport and in diagnostics
 *
 * Wire shape: {"type": "SEEK", "payload": {"position": 42.0}}. Events without
 * data carry no payload member.
 */
class PlayerEventCodec {
public:
    /**
     * @brief Full {type, payload} object
     */
    static json encode(const PlayerEvent &event);

    /**
     * @brief Payload object only, null for events without data
     */
    static json encodePayload(const PlayerEvent &event);

    /**
     * @brief Rebuild an event from its type name and payload
     * @param type Event type name, e.g. "NATIVE_PROGRESS_UPDATED"
     * @param payload Payload object (null allowed for events without data)
     * @param errorOut Receives the reason on failure (optional)
     * @return Event, or nullopt for unknown types and payloads missing required fields
     */
    static std::optional<PlayerEvent> decode(const std::string &type, const json &payload,
                                             std::string *errorOut = nullptr);

    /**
     * @brief Rebuild an event from a {type, payload} object
     */
    static std::optional<PlayerEvent> decode(const json &encoded, std::string *errorOut = nullptr);
};

}  // namespace PSC
