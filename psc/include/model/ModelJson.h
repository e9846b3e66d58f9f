// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include "common/JsonUtils.h"
#include "model/Diagnostics.h"
#include "model/PlayerTypes.h"
#include "model/ResumePosition.h"
#include "model/StateContext.h"

namespace PSC::ModelJson {

json toJson(const ChapterInfo &chapter);
json toJson(const PlayerTrack &track);
json toJson(const CurrentChapter &chapter);
json toJson(const PersistedPlayerState &state);
json toJson(const PlayerError &error);
json toJson(const StateContext &context);
json toJson(const CoordinatorMetrics &metrics);
json toJson(const TransitionHistoryEntry &entry);
json toJson(const CoordinatorDiagnostics &diagnostics);
json toJson(const ResumePositionInfo &info);

// Decoders are lenient: absent or mistyped fields keep their defaults
ChapterInfo chapterFromJson(const json &value);
PlayerTrack trackFromJson(const json &value);
CurrentChapter currentChapterFromJson(const json &value);
PersistedPlayerState persistedStateFromJson(const json &value);
PlayerError errorFromJson(const json &value);

}  // namespace PSC::ModelJson
