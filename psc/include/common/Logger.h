// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace PSC {

/**
 * @brief Process-wide logging facade
 *
 * Every coordinator component logs through this class. By default records go
 * to an spdlog backend (console, optionally a file); hosts can inject their
 * own ILoggerBackend before the first record is written.
 *
 * @code
 * PSC::Logger::initialize("/data/logs", true);
 * LOG_INFO("Coordinator started in {} context", runtime.label());
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Replace the active backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Create the console-only spdlog backend unless one is already set
     */
    static void initialize();

    /**
     * @brief Create the spdlog backend with an additional file sink
     * @param logDir Directory receiving psc.log
     * @param logToFile Enable the file sink
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void log(LogLevel level, const std::string &message,
                    const std::source_location &loc = std::source_location::current());

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace PSC

#define LOG_TRACE(...) PSC::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) PSC::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) PSC::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) PSC::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) PSC::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
