// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "common/JsonUtils.h"
#include "common/Logger.h"

namespace PSC {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump();
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object() || !object.contains(key) || !object[key].is_string()) {
        return defaultValue;
    }
    return object[key].get<std::string>();
}

double JsonUtils::getDouble(const json &object, const std::string &key, double defaultValue) {
    if (!object.is_object() || !object.contains(key) || !object[key].is_number()) {
        return defaultValue;
    }
    return object[key].get<double>();
}

bool JsonUtils::getBool(const json &object, const std::string &key, bool defaultValue) {
    if (!object.is_object() || !object.contains(key) || !object[key].is_boolean()) {
        return defaultValue;
    }
    return object[key].get<bool>();
}

std::optional<std::string> JsonUtils::getOptionalString(const json &object, const std::string &key) {
    if (!hasKey(object, key) || !object[key].is_string()) {
        return std::nullopt;
    }
    return object[key].get<std::string>();
}

std::optional<double> JsonUtils::getOptionalDouble(const json &object, const std::string &key) {
    if (!hasKey(object, key) || !object[key].is_number()) {
        return std::nullopt;
    }
    return object[key].get<double>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object[key].is_null();
}

}  // namespace PSC
