// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace PSC {

/**
 * @brief Default logger backend built on spdlog
 *
 * Console sink always; a file sink (psc.log) when a log directory is given.
 * The initial level honours the SPDLOG_LEVEL environment variable.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace PSC
