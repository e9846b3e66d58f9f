// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "common/JsonUtils.h"
#include <cstddef>
#include <string>
#include <vector>

namespace PSC {

/**
 * @brief Tunables of one PlayerStateCoordinator instance
 *
 * Loadable from JSON; unknown keys are ignored so hosts can keep the
 * coordinator section inside a larger document. The execution context is not
 * part of the config: it is passed to the coordinator as a RuntimeContext.
 *
 * @code
 * {
 *   "minPlausiblePosition": 5,
 *   "largeDiscrepancyThreshold": 30,
 *   "historyCapacity": 100,
 *   "processingTimeWindow": 100,
 *   "persistedPositionKey": "abs.position",
 *   "observerMode": false
 * }
 * @endcode
 */
struct CoordinatorConfig {
    double minPlausiblePosition = 5.0;        // seconds; session positions below this are suspect
    double largeDiscrepancyThreshold = 30.0;  // seconds; above this the newer record wins
    size_t historyCapacity = 100;             // transition history and bus history
    size_t processingTimeWindow = 100;        // samples in the processing-time average
    std::string persistedPositionKey = "abs.position";
    bool observerMode = false;

    /**
     * @brief Build from a JSON object, defaults for absent keys
     * @throws std::invalid_argument on a non-object document, a mistyped key or failed validation
     */
    static CoordinatorConfig fromJson(const json &document);

    /**
     * @brief Read and parse a JSON file
     * @throws std::runtime_error when the file cannot be read
     * @throws std::invalid_argument when the content is invalid
     */
    static CoordinatorConfig fromFile(const std::string &path);

    /**
     * @brief Human-readable problems, empty when the config is usable
     */
    std::vector<std::string> validate() const;

    json toJson() const;
};

}  // namespace PSC
