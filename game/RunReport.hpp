#pragma once

#include <string>

#include "game/Playfield.hpp"

// Figures gathered by a headless run that the playfield itself doesn't keep.
struct RunSummary {
  int lightChanges = 0;
  int maxLitInMarquee = 0;
  float steadyOnAt = -1.0f;
  bool entered = false;
  int ticksRun = 0;
  float wallMs = 0.0f;
};

// Machine-readable end-of-run report. Strings from the preset are escaped.
std::string BuildRunReportJson(const Playfield &pf, const RunSummary &summary);
