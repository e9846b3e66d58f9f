// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include <future>
#include <optional>
#include <string>

namespace PSC {

/**
 * @brief Outcome of one Player Service command
 */
struct CommandResult {
    bool success = true;
    std::string errorMessage;

    static CommandResult ok() {
        return CommandResult{};
    }

    static CommandResult failure(std::string message) {
        return CommandResult{false, std::move(message)};
    }
};

/**
 * @brief Commands the coordinator issues against the native player
 *
 * Called from the coordinator's event loop while it holds the transition
 * lock; the loop waits on each returned future before the next event.
 * Implementations must be idempotent and must never dispatch player events
 * themselves: anything they learn is reported back through native events.
 */
class IPlayerService {
public:
    virtual ~IPlayerService() = default;

    virtual std::future<CommandResult> executeLoadTrack(const std::string &libraryItemId,
                                                        const std::optional<std::string> &episodeId) = 0;
    virtual std::future<CommandResult> executePlay() = 0;
    virtual std::future<CommandResult> executePause() = 0;
    virtual std::future<CommandResult> executeStop() = 0;
    virtual std::future<CommandResult> executeSeek(double position) = 0;
    virtual std::future<CommandResult> executeSetRate(double rate) = 0;
    virtual std::future<CommandResult> executeSetVolume(double volume) = 0;
};

}  // namespace PSC
