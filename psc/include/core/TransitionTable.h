// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "model/PlayerEvent.h"
#include "model/PlayerState.h"
#include <optional>
#include <string>
#include <vector>

namespace PSC {

/**
 * @brief Outcome of checking one event against the current state
 */
struct TransitionValidation {
    bool allowed = false;
    std::optional<PlayerState> nextState;  // equals the current state for no-op acceptances
    std::optional<std::string> reason;     // set for rejections and no-op events

    static TransitionValidation accept(PlayerState next) {
        TransitionValidation validation;
        validation.allowed = true;
        validation.nextState = next;
        return validation;
    }

    static TransitionValidation acceptNoOp(PlayerState current, std::string why) {
        TransitionValidation validation = accept(current);
        validation.reason = std::move(why);
        return validation;
    }

    static TransitionValidation reject(std::string why) {
        TransitionValidation validation;
        validation.reason = std::move(why);
        return validation;
    }

    bool operator==(const TransitionValidation &) const = default;
};

/**
 * @brief Player state transition matrix
 *
 * Pure and total over (state, event). Pairs absent from the matrix are
 * rejected unless the event belongs to the no-op set (progress, session and
 * chapter bookkeeping, position reconciliation), which is accepted in every
 * state without changing it.
 *
 * A few duplicates are rejected with a dedicated reason because accepting
 * them would repeat an expensive side effect, e.g. a second LOAD_TRACK while
 * LOADING would open a second listening session.
 */
class TransitionTable {
public:
    static TransitionValidation validate(PlayerState current, const PlayerEvent &event);

    /**
     * @brief Matrix lookup ignoring payload-dependent rules and the no-op set
     */
    static std::optional<PlayerState> getNextState(PlayerState current, PlayerEventType type);

    static bool isNoOpEvent(PlayerEventType type);

    /**
     * @brief Event types with an explicit matrix entry for the state
     */
    static std::vector<PlayerEventType> getAllowedEvents(PlayerState state);
};

}  // namespace PSC
