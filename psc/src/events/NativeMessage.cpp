// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "events/NativeMessage.h"

namespace PSC {

std::string NativeMessage::toWire() const {
    json message = {{"type", type}, {"contextId", contextId}};
    if (!payload.is_null()) {
        message["payload"] = payload;
    }
    return JsonUtils::toCompactString(message);
}

std::optional<NativeMessage> NativeMessage::fromWire(const std::string &wire, std::string *errorOut) {
    auto parsed = JsonUtils::parseJson(wire, errorOut);
    if (!parsed) {
        return std::nullopt;
    }

    std::string type = JsonUtils::getString(*parsed, "type");
    if (type.empty()) {
        if (errorOut) {
            *errorOut = "native message has no type";
        }
        return std::nullopt;
    }

    NativeMessage message;
    message.type = std::move(type);
    message.contextId = JsonUtils::getString(*parsed, "contextId");
    if (JsonUtils::hasKey(*parsed, "payload")) {
        message.payload = (*parsed)["payload"];
    }
    return message;
}

}  // namespace PSC
