// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "runtime/RuntimeContext.h"

namespace PSC {

std::optional<RuntimeContext> RuntimeContext::fromString(const std::string &name) {
    if (name == "foreground" || name == "ui") {
        return foreground();
    }
    if (name == "headless" || name == "background") {
        return headless();
    }
    return std::nullopt;
}

const char *RuntimeContext::label() const {
    return kind_ == Kind::Headless ? "HEADLESS" : "UI";
}

}  // namespace PSC
