// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace PSC {

std::unique_ptr<ILoggerBackend> Logger::backend_;

static std::mutex backend_mutex;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(level, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    log(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    log(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    log(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    log(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    log(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

// Reduces a pretty function signature such as
// "void PSC::PlayerStateCoordinator::handleEvent(const PSC::PlayerEvent&)"
// to "PlayerStateCoordinator::handleEvent".
std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    // Last top-level space before the argument list separates the return type
    size_t nameStart = 0;
    int templateDepth = 0;
    for (size_t i = 0; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') {
            ++templateDepth;
        } else if (c == '>') {
            --templateDepth;
        } else if (c == ' ' && templateDepth == 0) {
            nameStart = i + 1;
        }
    }

    std::string qualified;
    templateDepth = 0;
    for (size_t i = nameStart; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') {
            ++templateDepth;
        } else if (c == '>') {
            --templateDepth;
        } else if (templateDepth == 0 && c != '*' && c != '&' && !std::isspace(static_cast<unsigned char>(c))) {
            qualified += c;
        }
    }

    static const std::string projectPrefix = "PSC::";
    if (qualified.rfind(projectPrefix, 0) == 0) {
        qualified.erase(0, projectPrefix.size());
    }

    return qualified.empty() ? "UnknownFunction" : qualified;
}

}  // namespace PSC
