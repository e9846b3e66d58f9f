// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include <optional>
#include <string>

namespace PSC {

/**
 * @brief Which isolated execution context a coordinator instance lives in
 *
 * The foreground UI context has an observable store; the headless background
 * playback service usually does not. Passed explicitly to the coordinator and
 * the native bridge at construction.
 */
class RuntimeContext {
public:
    enum class Kind { Foreground, Headless };

    static RuntimeContext foreground() {
        return RuntimeContext(Kind::Foreground);
    }

    static RuntimeContext headless() {
        return RuntimeContext(Kind::Headless);
    }

    /**
     * @brief Parse "foreground"/"ui" or "headless"/"background" (case-sensitive)
     */
    static std::optional<RuntimeContext> fromString(const std::string &name);

    Kind kind() const {
        return kind_;
    }

    bool isHeadless() const {
        return kind_ == Kind::Headless;
    }

    /**
     * @brief "UI" or "HEADLESS"
     */
    const char *label() const;

    bool operator==(const RuntimeContext &) const = default;

private:
    explicit RuntimeContext(Kind kind) : kind_(kind) {}

    Kind kind_;
};

}  // namespace PSC
