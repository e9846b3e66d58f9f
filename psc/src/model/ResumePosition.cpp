// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#include "model/ResumePosition.h"

namespace PSC {

const char *toString(ResumeSource source) {
    switch (source) {
    case ResumeSource::ActiveSession:
        return "activeSession";
    case ResumeSource::SavedProgress:
        return "savedProgress";
    case ResumeSource::AsyncStorage:
        return "asyncStorage";
    case ResumeSource::Store:
        return "store";
    }
    return "unknown";
}

}  // namespace PSC
