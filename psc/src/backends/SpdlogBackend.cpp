// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "backends/SpdlogBackend.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace PSC {

namespace {

constexpr const char *LOGGER_NAME = "PSC";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    // A second backend in the same process (tests re-initializing) reuses the registered logger
    logger_ = spdlog::get(LOGGER_NAME);

    if (!logger_) {
        std::vector<spdlog::sink_ptr> sinks;

        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern(CONSOLE_PATTERN);
        sinks.push_back(consoleSink);

        if (logToFile && !logDir.empty()) {
            std::filesystem::create_directories(logDir);
            std::filesystem::path logPath = std::filesystem::path(logDir) / "psc.log";

            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
            fileSink->set_pattern(FILE_PATTERN);
            sinks.push_back(fileSink);
        }

        logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        spdlog::register_logger(logger_);
    }

    logger_->set_level(spdlog::level::debug);

    if (const char *envLevel = std::getenv("SPDLOG_LEVEL")) {
        std::string levelStr(envLevel);
        std::transform(levelStr.begin(), levelStr.end(), levelStr.begin(), ::tolower);

        if (levelStr == "trace") {
            logger_->set_level(spdlog::level::trace);
        } else if (levelStr == "debug") {
            logger_->set_level(spdlog::level::debug);
        } else if (levelStr == "info") {
            logger_->set_level(spdlog::level::info);
        } else if (levelStr == "warn" || levelStr == "warning") {
            logger_->set_level(spdlog::level::warn);
        } else if (levelStr == "err" || levelStr == "error") {
            logger_->set_level(spdlog::level::err);
        } else if (levelStr == "off") {
            logger_->set_level(spdlog::level::off);
        }
    }
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    logger_->log(convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::debug;
}

}  // namespace PSC
