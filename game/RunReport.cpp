#include "game/RunReport.hpp"

#include <cmath>
#include <cstdio>

#include <nlohmann/json.hpp>

namespace {
double RoundTo(const float value, const double scale) {
  return std::round(static_cast<double>(value) * scale) / scale;
}
} // namespace

std::string BuildRunReportJson(const Playfield &pf, const RunSummary &summary) {
  const auto &obstacles = pf.obstacles;
  const auto &catalog = pf.config.obstacles.catalog;

  char seedHex[16];
  std::snprintf(seedHex, sizeof(seedHex), "0x%08X", pf.config.obstacles.seed);

  nlohmann::ordered_json kinds = nlohmann::ordered_json::object();
  for (size_t i = 0; i < catalog.size() && i < obstacles.kindCounts.size(); ++i) {
    kinds[catalog[i].id] = obstacles.kindCounts[i];
  }

  nlohmann::ordered_json scoring = nlohmann::ordered_json::array();
  for (const auto &zone : pf.sequencer.Zones()) {
    if (zone.isScoring) {
      scoring.push_back(zone.index + 1);
    }
  }

  nlohmann::ordered_json j;
  j["preset"] = pf.config.name;
  j["seed"] = seedHex;
  j["obstacles"] = static_cast<int>(obstacles.points.size());
  j["target"] = obstacles.targetCount;
  j["sampled"] = obstacles.sampledCount;
  j["dropped"] = obstacles.droppedCount;
  j["hit_cap"] = obstacles.hitPointCap;
  j["min_pair_distance"] = RoundTo(MinPairDistance(obstacles.points), 1e4);
  j["kinds"] = kinds;
  j["zones"] = static_cast<int>(pf.sequencer.Zones().size());
  j["scoring_zones"] = scoring;
  j["generation"] = pf.sequencer.Generation();
  j["light_changes"] = summary.lightChanges;
  j["max_lit_in_marquee"] = summary.maxLitInMarquee;
  j["steady_on_at"] = RoundTo(summary.steadyOnAt, 1e4);
  j["final_phase"] = GetSequencerPhaseLabel(pf.sequencer.Phase());
  j["lit_at_end"] = pf.sequencer.LitCount();
  j["entry"] = summary.entered ? GetEntryOutcomeLabel(pf.lastEntryOutcome) : "NONE";
  j["claimed_zone"] = pf.sequencer.ClaimedZone() + 1;
  j["score"] = pf.score;
  j["ticks_run"] = summary.ticksRun;
  j["wall_ms"] = RoundTo(summary.wallMs, 1e2);
  return j.dump(2);
}
