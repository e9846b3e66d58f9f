// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace PSC {

using json = nlohmann::json;

/**
 * @brief Shared nlohmann/json helpers
 *
 * Lenient accessors used when decoding payloads that crossed a process or
 * context boundary: missing or mistyped fields fall back to a default instead
 * of throwing.
 */
class JsonUtils {
public:
    /**
     * @brief Parse a JSON document
     * @param jsonString Input text
     * @param errorOut Receives the parser message on failure (optional)
     * @return Parsed value or nullopt
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);

    static std::string toPrettyString(const json &value);

    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    static double getDouble(const json &object, const std::string &key, double defaultValue = 0.0);

    static bool getBool(const json &object, const std::string &key, bool defaultValue = false);

    /**
     * @brief String field if present and non-null
     */
    static std::optional<std::string> getOptionalString(const json &object, const std::string &key);

    static std::optional<double> getOptionalDouble(const json &object, const std::string &key);

    /**
     * @brief True if key exists and is not null
     */
    static bool hasKey(const json &object, const std::string &key);
};

}  // namespace PSC
