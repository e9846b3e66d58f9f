// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "runtime/CoordinatorConfig.h"
#include "common/Logger.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace PSC {

namespace {

double readNumber(const json &document, const std::string &key, double fallback) {
    if (!JsonUtils::hasKey(document, key)) {
        return fallback;
    }
    if (!document[key].is_number()) {
        throw std::invalid_argument(std::format("'{}' must be a number", key));
    }
    return document[key].get<double>();
}

size_t readCount(const json &document, const std::string &key, size_t fallback) {
    if (!JsonUtils::hasKey(document, key)) {
        return fallback;
    }
    if (!document[key].is_number_integer() || document[key].get<int64_t>() < 0) {
        throw std::invalid_argument(std::format("'{}' must be a non-negative integer", key));
    }
    return document[key].get<size_t>();
}

std::string readString(const json &document, const std::string &key, const std::string &fallback) {
    if (!JsonUtils::hasKey(document, key)) {
        return fallback;
    }
    if (!document[key].is_string()) {
        throw std::invalid_argument(std::format("'{}' must be a string", key));
    }
    return document[key].get<std::string>();
}

bool readFlag(const json &document, const std::string &key, bool fallback) {
    if (!JsonUtils::hasKey(document, key)) {
        return fallback;
    }
    if (!document[key].is_boolean()) {
        throw std::invalid_argument(std::format("'{}' must be a boolean", key));
    }
    return document[key].get<bool>();
}

}  // namespace

CoordinatorConfig CoordinatorConfig::fromJson(const json &document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Coordinator config must be a JSON object");
    }

    CoordinatorConfig config;
    config.minPlausiblePosition = readNumber(document, "minPlausiblePosition", config.minPlausiblePosition);
    config.largeDiscrepancyThreshold =
        readNumber(document, "largeDiscrepancyThreshold", config.largeDiscrepancyThreshold);
    config.historyCapacity = readCount(document, "historyCapacity", config.historyCapacity);
    config.processingTimeWindow = readCount(document, "processingTimeWindow", config.processingTimeWindow);
    config.persistedPositionKey = readString(document, "persistedPositionKey", config.persistedPositionKey);
    config.observerMode = readFlag(document, "observerMode", config.observerMode);

    auto problems = config.validate();
    if (!problems.empty()) {
        throw std::invalid_argument(std::format("Invalid coordinator config: {}", problems.front()));
    }
    return config;
}

CoordinatorConfig CoordinatorConfig::fromFile(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Cannot open coordinator config '{}'", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string error;
    auto document = JsonUtils::parseJson(buffer.str(), &error);
    if (!document) {
        throw std::invalid_argument(std::format("Coordinator config '{}' is not valid JSON: {}", path, error));
    }

    LOG_DEBUG("Loaded coordinator config from {}", path);
    return fromJson(*document);
}

std::vector<std::string> CoordinatorConfig::validate() const {
    std::vector<std::string> problems;

    if (minPlausiblePosition < 0.0) {
        problems.push_back("minPlausiblePosition must not be negative");
    }
    if (largeDiscrepancyThreshold < 0.0) {
        problems.push_back("largeDiscrepancyThreshold must not be negative");
    }
    if (historyCapacity == 0) {
        problems.push_back("historyCapacity must be greater than zero");
    }
    if (processingTimeWindow == 0) {
        problems.push_back("processingTimeWindow must be greater than zero");
    }
    if (persistedPositionKey.empty()) {
        problems.push_back("persistedPositionKey must not be empty");
    }

    return problems;
}

json CoordinatorConfig::toJson() const {
    return json{{"minPlausiblePosition", minPlausiblePosition},
                {"largeDiscrepancyThreshold", largeDiscrepancyThreshold},
                {"historyCapacity", historyCapacity},
                {"processingTimeWindow", processingTimeWindow},
                {"persistedPositionKey", persistedPositionKey},
                {"observerMode", observerMode}};
}

}  // namespace PSC
