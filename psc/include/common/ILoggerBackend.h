// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include <source_location>
#include <string>

namespace PSC {

/**
 * @brief Log severity, ordered from most to least verbose
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Pluggable sink for PSC::Logger
 *
 * The host application may route coordinator logging into its own logging
 * system (for example the platform log of a mobile app) by implementing this
 * interface and handing it to Logger::setBackend().
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Write one record
     * @param level Severity
     * @param message Fully formatted message, calling function already prefixed
     * @param loc Call site
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace PSC
