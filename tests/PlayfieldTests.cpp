#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "game/Playfield.hpp"
#include "game/RunReport.hpp"
#include "sim/BallSpawner.hpp"
#include "sim/ObstacleField.hpp"
#include "sim/PlayfieldConfig.hpp"
#include "sim/Plunger.hpp"
#include "sim/Scheduler.hpp"
#include "sim/ZoneSequencer.hpp"

#include <climits>

#include <nlohmann/json.hpp>

namespace {
bool NearlyEqual(const float a, const float b, const float eps = 1e-5f) {
  return std::fabs(a - b) <= eps;
}

ObstacleFieldParams MakeFieldParams() {
  return MakeDefaultPlayfieldConfig().obstacles.params;
}

ZoneConfig MakeZoneConfig() { return MakeDefaultPlayfieldConfig().zones; }

void RunFor(Scheduler &scheduler, const float seconds) {
  const int ticks = static_cast<int>(std::lround(seconds / cfg::kFixedDt));
  for (int i = 0; i < ticks; ++i) {
    scheduler.Advance(cfg::kFixedDt);
  }
}

// Mirrors the light state as seen through the sink.
struct LightRecorder {
  std::vector<bool> lit;
  std::vector<int> changes;  // per zone
  std::vector<std::pair<int, bool>> events;

  ZoneSequencer::LightSink Sink() {
    return [this](int zone, bool on) {
      if (zone >= static_cast<int>(lit.size())) {
        lit.resize(zone + 1, false);
        changes.resize(zone + 1, 0);
      }
      lit[zone] = on;
      ++changes[zone];
      events.emplace_back(zone, on);
    };
  }

  int LitCount() const {
    int n = 0;
    for (const bool on : lit) {
      n += on ? 1 : 0;
    }
    return n;
  }
};

// --- Obstacle field ---

bool TestObstacleSpacingAndBounds() {
  const ObstacleFieldParams params = MakeFieldParams();
  const std::vector<ObstacleKind> catalog = {ObstacleKind{"post"}};
  const ObstacleFieldResult result =
      GenerateObstacleField(params, catalog, 42u);
  if (!result.Ok() || result.points.size() < 10) {
    return false;
  }

  const Region area = params.region.Shrunk(params.margin);
  for (const auto &p : result.points) {
    if (!area.Contains(p.x, p.z) || !NearlyEqual(p.y, params.region.y) ||
        p.kindIndex != 0) {
      return false;
    }
  }
  return MinPairDistance(result.points) >= params.minDistance - 1e-4f;
}

bool TestObstacleFieldDeterministic() {
  const ObstacleFieldParams params = MakeFieldParams();
  const std::vector<ObstacleKind> catalog = {
      ObstacleKind{"a", 2.0f}, ObstacleKind{"b", 1.0f, 5}};

  const ObstacleFieldResult a = GenerateObstacleField(params, catalog, 99u);
  const ObstacleFieldResult b = GenerateObstacleField(params, catalog, 99u);
  const ObstacleFieldResult c = GenerateObstacleField(params, catalog, 100u);

  if (a.points.size() != b.points.size() || a.points.empty()) {
    return false;
  }
  for (size_t i = 0; i < a.points.size(); ++i) {
    if (a.points[i].x != b.points[i].x || a.points[i].z != b.points[i].z ||
        a.points[i].kindIndex != b.points[i].kindIndex) {
      return false;
    }
  }
  return c.points.empty() || c.points[0].x != a.points[0].x ||
         c.points[0].z != a.points[0].z;
}

bool TestObstacleCapsDropSurplus() {
  const ObstacleFieldParams params = MakeFieldParams();
  const std::vector<ObstacleKind> catalog = {ObstacleKind{"a", 1.0f, 3},
                                             ObstacleKind{"b", 1.0f, 2}};
  const ObstacleFieldResult result = GenerateObstacleField(params, catalog, 5u);
  if (!result.Ok() || result.sampledCount <= 5) {
    return false;
  }
  return result.kindCounts[0] == 3 && result.kindCounts[1] == 2 &&
         result.points.size() == 5u &&
         result.droppedCount == result.sampledCount - 5;
}

bool TestZeroWeightKindOnlyAfterOthersCapped() {
  const ObstacleFieldParams params = MakeFieldParams();

  const std::vector<ObstacleKind> uncapped = {ObstacleKind{"a", 1.0f},
                                              ObstacleKind{"b", 0.0f}};
  const ObstacleFieldResult unbounded =
      GenerateObstacleField(params, uncapped, 3u);
  if (!unbounded.Ok() || unbounded.kindCounts[1] != 0) {
    return false;
  }

  const std::vector<ObstacleKind> capped = {ObstacleKind{"a", 1.0f, 2},
                                            ObstacleKind{"b", 0.0f}};
  const ObstacleFieldResult filler = GenerateObstacleField(params, capped, 3u);
  return filler.Ok() && filler.kindCounts[0] == 2 &&
         filler.kindCounts[1] == filler.sampledCount - 2 &&
         filler.droppedCount == 0;
}

bool TestWeightedKindDistribution() {
  const std::vector<ObstacleKind> catalog = {ObstacleKind{"heavy", 3.0f},
                                             ObstacleKind{"light", 1.0f}};
  const std::vector<int> counts = {0, 0};
  uint32_t rng = core::NormalizeSeed(2024u);

  int heavy = 0;
  const int draws = 4000;
  for (int i = 0; i < draws; ++i) {
    const int pick = PickObstacleKind(catalog, counts, rng);
    if (pick < 0) {
      return false;
    }
    heavy += (pick == 0) ? 1 : 0;
  }
  const float ratio = static_cast<float>(heavy) / static_cast<float>(draws);
  return ratio > 0.70f && ratio < 0.80f;
}

bool TestPickKindAllCapped() {
  const std::vector<ObstacleKind> catalog = {ObstacleKind{"a", 1.0f, 1}};
  const std::vector<int> counts = {1};
  uint32_t rng = 1u;
  return PickObstacleKind(catalog, counts, rng) == -1;
}

bool TestObstaclePointCap() {
  ObstacleFieldParams params = MakeFieldParams();
  params.maxPoints = 10;
  const std::vector<ObstacleKind> catalog = {ObstacleKind{"post"}};
  const ObstacleFieldResult result = GenerateObstacleField(params, catalog, 8u);
  return result.Ok() && result.hitPointCap && result.points.size() == 10u;
}

bool TestObstacleFieldErrors() {
  const ObstacleFieldParams params = MakeFieldParams();
  const std::vector<ObstacleKind> good = {ObstacleKind{"post"}};

  const ObstacleFieldResult empty = GenerateObstacleField(params, {}, 1u);
  if (empty.error != FieldError::EmptyCatalog || !empty.points.empty()) {
    return false;
  }
  if (ValidateObstacleField(params, {ObstacleKind{"z", 0.0f}}) !=
      FieldError::NoPositiveWeight) {
    return false;
  }
  if (ValidateObstacleField(params, {ObstacleKind{"a", 1.0f},
                                     ObstacleKind{"n", -1.0f}}) !=
      FieldError::NegativeWeight) {
    return false;
  }

  ObstacleFieldParams narrow = params;
  narrow.margin = params.region.Width();
  const ObstacleFieldResult degenerate =
      GenerateObstacleField(narrow, good, 1u);
  if (degenerate.error != FieldError::DegenerateRegion ||
      !degenerate.points.empty()) {
    return false;
  }

  ObstacleFieldParams zeroSpacing = params;
  zeroSpacing.minDistance = 0.0f;
  return ValidateObstacleField(zeroSpacing, good) == FieldError::InvalidSpacing;
}

bool TestObstacleFieldLimits() {
  const std::vector<ObstacleKind> catalog = {ObstacleKind{"post"}};

  ObstacleFieldParams none = MakeFieldParams();
  none.maxPoints = 0;
  const ObstacleFieldResult empty = GenerateObstacleField(none, catalog, 3u);
  if (empty.error != FieldError::InvalidLimits || !empty.points.empty() ||
      empty.hitPointCap) {
    return false;
  }

  ObstacleFieldParams raised = MakeFieldParams();
  raised.minDistance = 0.1f;
  raised.maxPoints = kMaxObstaclePoints + 1;
  const ObstacleFieldResult over = GenerateObstacleField(raised, catalog, 3u);
  if (over.error != FieldError::InvalidLimits || !over.points.empty()) {
    return false;
  }

  ObstacleFieldParams noAttempts = MakeFieldParams();
  noAttempts.maxAttempts = 0;
  if (ValidateObstacleField(noAttempts, catalog) != FieldError::InvalidLimits) {
    return false;
  }

  ObstacleFieldParams edges = MakeFieldParams();
  edges.maxPoints = 1;
  edges.maxAttempts = 1;
  if (ValidateObstacleField(edges, catalog) != FieldError::None) {
    return false;
  }
  edges.maxPoints = kMaxObstaclePoints;
  return ValidateObstacleField(edges, catalog) == FieldError::None;
}

bool TestTargetCountSaturates() {
  ObstacleFieldParams params = MakeFieldParams();
  params.region = Region{-1.0e4f, 1.0e4f, -1.0e4f, 1.0e4f, 0.0f};
  params.margin = 0.0f;
  params.minDistance = 0.05f;
  params.density = 1.0f;
  const std::vector<ObstacleKind> catalog = {ObstacleKind{"post"}};
  const ObstacleFieldResult result = GenerateObstacleField(params, catalog, 5u);
  return result.Ok() && result.targetCount == INT_MAX &&
         result.hitPointCap &&
         static_cast<int>(result.points.size()) == kMaxObstaclePoints;
}

// --- Zone layout ---

bool TestZonePartitionContiguous() {
  const ZoneConfig config = MakeZoneConfig();
  uint32_t rng = 1u;
  const ZoneLayout layout = BuildZoneLayout(config, rng);
  if (!layout.Ok() || layout.zones.size() != 5u || layout.scoringCount != 2) {
    return false;
  }

  const auto &zones = layout.zones;
  if (zones.front().spanStart != config.track.minZ ||
      zones.back().spanEnd != config.track.maxZ) {
    return false;
  }
  const float width = config.track.Depth() / 5.0f;
  for (size_t i = 0; i < zones.size(); ++i) {
    if (!NearlyEqual(zones[i].spanEnd - zones[i].spanStart, width, 1e-4f)) {
      return false;
    }
    if (i + 1 < zones.size() && zones[i].spanEnd != zones[i + 1].spanStart) {
      return false;
    }
    if (!NearlyEqual(zones[i].volume.sizeZ,
                     width - 2.0f * config.zoneThickness, 1e-4f)) {
      return false;
    }
  }
  // FirstN by default.
  return zones[0].isScoring && zones[1].isScoring && !zones[2].isScoring &&
         !zones[3].isScoring && !zones[4].isScoring;
}

bool TestRandomScoringSelection() {
  ZoneConfig config = MakeZoneConfig();
  config.selection = ScoringSelection::Random;
  config.zoneCount = 9;
  config.scoringZoneCount = 3;

  uint32_t rngA = core::NormalizeSeed(77u);
  uint32_t rngB = core::NormalizeSeed(77u);
  const ZoneLayout a = BuildZoneLayout(config, rngA);
  const ZoneLayout b = BuildZoneLayout(config, rngB);
  if (!a.Ok() || a.scoringCount != 3) {
    return false;
  }
  for (size_t i = 0; i < a.zones.size(); ++i) {
    if (a.zones[i].isScoring != b.zones[i].isScoring) {
      return false;
    }
  }

  // Asking for more scoring zones than exist clamps to all of them.
  config.scoringZoneCount = 20;
  const ZoneLayout all = BuildZoneLayout(config, rngA);
  return all.Ok() && all.scoringCount == 9;
}

bool TestExplicitScoringSelection() {
  ZoneConfig config = MakeZoneConfig();
  config.selection = ScoringSelection::Explicit;
  config.scoringIndices = {4, 1};
  uint32_t rng = 1u;
  const ZoneLayout layout = BuildZoneLayout(config, rng);
  if (!layout.Ok() || layout.scoringCount != 2 ||
      !layout.zones[1].isScoring || !layout.zones[4].isScoring ||
      layout.zones[0].isScoring) {
    return false;
  }

  config.scoringIndices = {5};
  return ValidateZoneConfig(config) == SequencerError::InvalidScoringIndex;
}

bool TestZoneConfigErrors() {
  ZoneConfig zero = MakeZoneConfig();
  zero.zoneCount = 0;
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  if (seq.Configure(zero) != SequencerError::ZeroZones || !seq.Zones().empty()) {
    return false;
  }
  seq.StartLighting();
  if (seq.Phase() != SequencerPhase::Idle || scheduler.PendingCount() != 0) {
    return false;
  }

  ZoneConfig flat = MakeZoneConfig();
  flat.track.maxZ = flat.track.minZ;
  ZoneConfig negative = MakeZoneConfig();
  negative.scoringZoneCount = -1;
  return ValidateZoneConfig(flat) == SequencerError::DegenerateTrack &&
         ValidateZoneConfig(negative) == SequencerError::NegativeScoringCount;
}

bool TestOutOfRangeSelectionRejected() {
  ZoneConfig config = MakeZoneConfig();
  config.zoneCount = 5;
  config.scoringZoneCount = 2;
  config.selection = static_cast<ScoringSelection>(3);
  uint32_t rng = core::NormalizeSeed(11u);
  const ZoneLayout layout = BuildZoneLayout(config, rng);
  if (layout.error != SequencerError::InvalidSelection || !layout.zones.empty()) {
    return false;
  }

  // Same thing arriving as a number in a preset.
  PlayfieldConfig preset = MakeDefaultPlayfieldConfig();
  if (ParsePlayfieldConfig(preset, R"({"zones": {"selection": 7}})") !=
      LoadError::None) {
    return false;
  }
  Playfield pf{};
  return !InitPlayfield(pf, preset) &&
         pf.sequencer.LastError() == SequencerError::InvalidSelection &&
         pf.sequencer.Zones().empty();
}

// --- Lighting protocol ---

bool TestMarqueeLightsOneAtATime() {
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  LightRecorder rec;
  seq.SetLightSink(rec.Sink());
  seq.Configure(MakeZoneConfig());
  seq.StartLighting();

  int maxSinkLit = 0;
  std::vector<bool> visited(5, false);
  while (seq.Phase() == SequencerPhase::Marquee) {
    if (seq.LitCount() != 1 || rec.LitCount() != 1) {
      return false;
    }
    for (int i = 0; i < 5; ++i) {
      if (seq.IsLightOn(i)) {
        visited[i] = true;
      }
    }
    scheduler.Advance(cfg::kFixedDt);
    if (seq.Phase() == SequencerPhase::Marquee && rec.LitCount() > maxSinkLit) {
      maxSinkLit = rec.LitCount();
    }
    if (scheduler.Now() > 5.0f) {
      return false;
    }
  }
  for (const bool v : visited) {
    if (!v) {
      return false;
    }
  }
  return maxSinkLit == 1;
}

bool TestProtocolTimeline() {
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  seq.Configure(MakeZoneConfig());
  if (seq.Phase() != SequencerPhase::Idle || seq.LitCount() != 0) {
    return false;
  }
  seq.StartLighting();

  RunFor(scheduler, 1.9f);
  if (seq.Phase() != SequencerPhase::Marquee) {
    return false;
  }
  RunFor(scheduler, 0.6f); // t = 2.5
  if (seq.Phase() != SequencerPhase::ScoringFlash) {
    return false;
  }
  RunFor(scheduler, 0.6f); // t = 3.1
  return seq.Phase() == SequencerPhase::SteadyOn && seq.LitCount() == 5 &&
         seq.IsIdle() && scheduler.PendingCount() == 0;
}

bool TestScoringFlashOnlyScoringZones() {
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  ZoneConfig config = MakeZoneConfig();
  config.selection = ScoringSelection::Explicit;
  config.scoringIndices = {1, 3};
  seq.Configure(config);
  seq.StartLighting();

  bool sawFlash = false;
  for (int i = 0; i < 600; ++i) {
    scheduler.Advance(cfg::kFixedDt);
    if (seq.Phase() != SequencerPhase::ScoringFlash) {
      continue;
    }
    for (const auto &zone : seq.Zones()) {
      if (seq.IsLightOn(zone.index) && !zone.isScoring) {
        return false;
      }
    }
    if (seq.LitCount() == 2) {
      sawFlash = true;
    }
  }
  return sawFlash && seq.Phase() == SequencerPhase::SteadyOn;
}

bool TestSkipStartupSequence() {
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  ZoneConfig config = MakeZoneConfig();
  config.runStartupSequence = false;
  seq.Configure(config);
  seq.StartLighting();
  return seq.Phase() == SequencerPhase::SteadyOn && seq.LitCount() == 5 &&
         scheduler.PendingCount() == 0;
}

bool TestZeroFlashCountSkipsFlash() {
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  ZoneConfig config = MakeZoneConfig();
  config.timings.flashCount = 0;
  seq.Configure(config);
  seq.StartLighting();
  RunFor(scheduler, 2.1f);
  return seq.Phase() == SequencerPhase::SteadyOn && seq.LitCount() == 5;
}

// --- Arbitration ---

bool TestFirstEntryLocksOthers() {
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  seq.Configure(MakeZoneConfig());
  seq.StartLighting();
  RunFor(scheduler, 3.5f);

  const Zone zone0 = seq.Zones()[0];
  const Zone zone2 = seq.Zones()[2];
  if (FindZoneAt(seq.Zones(), zone0.volume.centerX, zone0.volume.centerY,
                 zone0.volume.centerZ) != 0) {
    return false;
  }

  // Zone 2 isn't scoring under FirstN: claimed, but no confirmation flash.
  if (seq.OnZoneEntered(2) != EntryOutcome::Claimed || seq.IsConfirmFlashing()) {
    return false;
  }
  if (seq.OnZoneEntered(0) != EntryOutcome::AlreadyClaimed ||
      seq.OnZoneEntered(2) != EntryOutcome::AlreadyClaimed ||
      seq.OnZoneEntered(17) != EntryOutcome::UnknownZone) {
    return false;
  }
  for (const auto &zone : seq.Zones()) {
    if (zone.locked != (zone.index != 2)) {
      return false;
    }
  }
  return seq.ClaimedZone() == 2 &&
         FindZoneAt(seq.Zones(), zone0.volume.centerX, zone0.volume.centerY,
                    zone0.volume.centerZ) == -1 &&
         FindZoneAt(seq.Zones(), zone2.volume.centerX, zone2.volume.centerY,
                    zone2.volume.centerZ) == 2;
}

bool TestConfirmationFlashEndsLit() {
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  LightRecorder rec;
  seq.SetLightSink(rec.Sink());
  seq.Configure(MakeZoneConfig());
  seq.StartLighting();
  RunFor(scheduler, 3.5f);

  const int before = rec.changes[0];
  if (seq.OnZoneEntered(0) != EntryOutcome::Claimed || !seq.IsConfirmFlashing()) {
    return false;
  }
  RunFor(scheduler, 1.2f);

  // Three off/on pairs; the light was already on when the flash started.
  return !seq.IsConfirmFlashing() && seq.IsLightOn(0) &&
         rec.changes[0] - before == 6 && seq.LitCount() == 5;
}

bool TestConfirmationFlashOwnsLightDuringMarquee() {
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  LightRecorder rec;
  seq.SetLightSink(rec.Sink());
  seq.Configure(MakeZoneConfig());
  seq.StartLighting();
  RunFor(scheduler, 0.5f);

  if (seq.Phase() != SequencerPhase::Marquee ||
      seq.OnZoneEntered(0) != EntryOutcome::Claimed) {
    return false;
  }
  const size_t mark = rec.events.size();
  RunFor(scheduler, 3.5f);

  // Zone 0 events after the claim come only from the flash: strictly
  // alternating and ending on.
  int last = -1;
  for (size_t i = mark; i < rec.events.size(); ++i) {
    if (rec.events[i].first != 0) {
      continue;
    }
    const int on = rec.events[i].second ? 1 : 0;
    if (on == last) {
      return false;
    }
    last = on;
  }
  return last == 1 && seq.IsLightOn(0) &&
         seq.Phase() == SequencerPhase::SteadyOn && seq.LitCount() == 5;
}

bool TestConfirmationWithoutFlashes() {
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  ZoneConfig config = MakeZoneConfig();
  config.runStartupSequence = false;
  config.timings.confirmFlashCount = 0;
  seq.Configure(config);
  seq.StartLighting();
  return seq.OnZoneEntered(1) == EntryOutcome::Claimed &&
         !seq.IsConfirmFlashing() && seq.IsLightOn(1) &&
         scheduler.PendingCount() == 0;
}

// --- Regeneration ---

bool TestRegenerateMidMarqueeLeavesNoStaleState() {
  Scheduler scheduler;
  ZoneSequencer seq(scheduler);
  LightRecorder rec;
  seq.SetLightSink(rec.Sink());
  seq.Configure(MakeZoneConfig());
  seq.StartLighting();
  RunFor(scheduler, 0.7f);
  seq.OnZoneEntered(0); // confirmation flash in flight too

  const uint32_t generation = seq.Generation();
  if (seq.Regenerate() != SequencerError::None) {
    return false;
  }
  if (seq.Generation() != generation + 1 || seq.IsClaimed() ||
      scheduler.PendingCount() != 1 || seq.LitCount() != 1 ||
      !seq.IsLightOn(0) || rec.LitCount() != 1) {
    return false;
  }
  for (const auto &zone : seq.Zones()) {
    if (zone.locked) {
      return false;
    }
  }

  for (int i = 0; i < 480; ++i) {
    scheduler.Advance(cfg::kFixedDt);
    if (rec.LitCount() != seq.LitCount()) {
      return false;
    }
    if (seq.Phase() == SequencerPhase::Marquee && seq.LitCount() != 1) {
      return false;
    }
  }
  return seq.Phase() == SequencerPhase::SteadyOn && seq.LitCount() == 5 &&
         scheduler.PendingCount() == 0;
}

bool TestRegenerateContinuesRandomStream() {
  ZoneConfig config = MakeZoneConfig();
  config.selection = ScoringSelection::Random;
  config.zoneCount = 8;
  config.scoringZoneCount = 3;

  Scheduler sa;
  Scheduler sb;
  ZoneSequencer a(sa);
  ZoneSequencer b(sb);
  a.Configure(config);
  b.Configure(config);
  for (int round = 0; round < 4; ++round) {
    for (size_t i = 0; i < a.Zones().size(); ++i) {
      if (a.Zones()[i].isScoring != b.Zones()[i].isScoring) {
        return false;
      }
    }
    if (a.ScoringZoneCount() != 3) {
      return false;
    }
    a.Regenerate();
    b.Regenerate();
  }
  return a.Generation() == b.Generation();
}

// --- Scheduler ---

bool TestSchedulerOrderingAndCancel() {
  Scheduler scheduler;
  std::string order;
  scheduler.ScheduleAfter(0.3f, [&]() { order += "A"; });
  const Scheduler::TaskId b = scheduler.ScheduleAfter(0.1f, [&]() { order += "B"; });
  scheduler.ScheduleAfter(0.1f, [&]() { order += "C"; });
  const Scheduler::TaskId d = scheduler.ScheduleAfter(0.2f, [&]() { order += "D"; });

  if (!scheduler.Cancel(d) || scheduler.Cancel(d) || scheduler.IsPending(d) ||
      !scheduler.IsPending(b)) {
    return false;
  }
  const int ran = scheduler.Advance(0.5f);
  return ran == 3 && order == "BCA" && scheduler.PendingCount() == 0 &&
         NearlyEqual(scheduler.Now(), 0.5f);
}

bool TestSchedulerChainedCallbacks() {
  Scheduler scheduler;
  float seenAt = -1.0f;
  float chainedAt = -1.0f;
  scheduler.ScheduleAfter(0.25f, [&]() {
    seenAt = scheduler.Now();
    scheduler.ScheduleAfter(0.25f, [&]() { chainedAt = scheduler.Now(); });
  });
  const int ran = scheduler.Advance(1.0f);
  return ran == 2 && NearlyEqual(seenAt, 0.25f) &&
         NearlyEqual(chainedAt, 0.5f) && NearlyEqual(scheduler.Now(), 1.0f);
}

// --- Plunger ---

bool TestPlungerCompressionCurve() {
  Plunger plunger{};
  plunger.Configure(PlungerConfig{});
  plunger.Press();
  plunger.Update(2.5f); // half of maxCompressionTime

  const float expected = 0.6f * (1.0f - 0.125f);
  if (plunger.state != PlungerState::Compressing ||
      !NearlyEqual(plunger.compression, expected, 1e-4f) ||
      !NearlyEqual(plunger.ScaleZ(), 1.0f - expected, 1e-4f) ||
      !NearlyEqual(plunger.ScaleX(), 1.0f) ||
      plunger.ContactImpulse().magnitude != 0.0f) {
    return false;
  }

  plunger.Update(10.0f); // saturates
  return NearlyEqual(plunger.compression, 0.6f) &&
         NearlyEqual(plunger.Progress(), 1.0f);
}

bool TestPlungerBounceBack() {
  Plunger plunger{};
  plunger.Configure(PlungerConfig{});
  plunger.Press();
  plunger.Update(2.5f);
  const float released = plunger.compression;
  plunger.Release();

  const PlungerImpulse impulse = plunger.ContactImpulse();
  if (plunger.state != PlungerState::BouncingBack ||
      !NearlyEqual(impulse.magnitude, released * 100.0f, 1e-3f) ||
      !NearlyEqual(impulse.z, impulse.magnitude) || impulse.x != 0.0f) {
    return false;
  }

  plunger.Update(0.15f);
  if (!NearlyEqual(plunger.compression, released * 0.125f, 1e-4f)) {
    return false;
  }
  plunger.Update(0.2f);
  return plunger.state == PlungerState::Rest && plunger.compression == 0.0f &&
         plunger.ContactImpulse().magnitude == 0.0f;
}

bool TestPlungerReleaseWithoutPressIgnored() {
  Plunger plunger{};
  PlungerConfig config{};
  config.maxCompression = 1.5f;
  config.axis = PlungerAxis::Y;
  plunger.Configure(config);
  plunger.Release();
  plunger.Update(0.1f);
  return plunger.state == PlungerState::Rest &&
         NearlyEqual(plunger.config.maxCompression, 1.0f) &&
         NearlyEqual(plunger.ScaleY(), 1.0f);
}

// --- Ball spawner ---

bool TestBallSpawnAndDespawn() {
  BallSpawner spawner{};
  spawner.config = MakeDefaultPlayfieldConfig().spawner;
  spawner.config.type = BallType::Pokeball;

  const Ball &first = spawner.Spawn();
  if (!spawner.HasBall() || first.id != 1u || first.type != BallType::Pokeball ||
      !NearlyEqual(first.z, cfg::kBallSpawnZ)) {
    return false;
  }
  if (spawner.CheckOutOfBounds(cfg::kBallKillY + 0.5f) || !spawner.HasBall()) {
    return false;
  }
  if (!spawner.CheckOutOfBounds(cfg::kBallKillY - 0.5f) || spawner.HasBall()) {
    return false;
  }
  // Nothing to despawn twice.
  if (spawner.CheckOutOfBounds(-100.0f)) {
    return false;
  }
  spawner.Spawn();
  const Ball &replaced = spawner.Spawn();
  return replaced.id == 3u && spawner.spawnCount == 3;
}

// --- Presets ---

bool TestParsePresetOverridesSubset() {
  const std::string text = R"({
    "name": "test",
    "region": { "minX": -4.0, "maxX": 4.0 },
    "obstacles": {
      "seed": 11,
      "catalog": [ { "id": "block", "shape": "Cube", "maxInstances": 3 },
                   { "id": "orb", "shape": 2, "weight": 0.5 } ]
    },
    "zones": { "zoneCount": 7, "selection": "random",
               "timings": { "flashCount": 4 } },
    "plunger": { "axis": "X" },
    "spawner": { "type": "Pokeball" }
  })";

  PlayfieldConfig config{};
  if (ParsePlayfieldConfig(config, text) != LoadError::None) {
    return false;
  }
  const auto &catalog = config.obstacles.catalog;
  return config.name == "test" && NearlyEqual(config.table.minX, -4.0f) &&
         NearlyEqual(config.table.minZ, cfg::kTableMinZ) &&
         NearlyEqual(config.zones.track.minX, -4.0f) &&
         NearlyEqual(config.obstacles.params.region.maxX, 4.0f) &&
         config.obstacles.seed == 11u && catalog.size() == 2u &&
         catalog[0].shape == ObstacleShape::Cube &&
         catalog[0].maxInstances == 3 &&
         catalog[1].shape == ObstacleShape::Sphere &&
         NearlyEqual(catalog[1].weight, 0.5f) &&
         config.zones.zoneCount == 7 &&
         config.zones.scoringZoneCount == cfg::kScoringZoneCount &&
         config.zones.selection == ScoringSelection::Random &&
         config.zones.timings.flashCount == 4 &&
         config.zones.timings.marqueeLoops == cfg::kMarqueeLoops &&
         config.plunger.axis == PlungerAxis::X &&
         config.spawner.type == BallType::Pokeball;
}

bool TestParsePresetErrors() {
  PlayfieldConfig config{};
  config.name = "dirty";
  if (ParsePlayfieldConfig(config, "{ not json") != LoadError::ParseError ||
      config.name != "default") {
    return false;
  }
  if (ParsePlayfieldConfig(config, R"({"zones": {"zoneCount": "five"}})") !=
          LoadError::InvalidValue ||
      config.zones.zoneCount != cfg::kZoneCount) {
    return false;
  }
  if (ParsePlayfieldConfig(config, "[1, 2]") != LoadError::InvalidValue) {
    return false;
  }
  return LoadPlayfieldConfig(config, "does/not/exist.json") ==
         LoadError::FileNotFound;
}

// --- Playfield ---

bool TestPlayfieldSerialisesSameTickEntries() {
  Playfield pf{};
  if (!InitPlayfield(pf, MakeDefaultPlayfieldConfig())) {
    return false;
  }
  for (int i = 0; i < 420; ++i) {
    StepPlayfield(pf, cfg::kFixedDt);
  }
  PushInput(pf, InputEvent{InputAction::ZoneEntered, 1, 0.0f});
  PushInput(pf, InputEvent{InputAction::ZoneEntered, 3, 0.0f});
  StepPlayfield(pf, cfg::kFixedDt);

  return pf.sequencer.ClaimedZone() == 1 && pf.score == 1 &&
         pf.lastEntryOutcome == EntryOutcome::AlreadyClaimed &&
         pf.pendingInput.empty();
}

bool TestPlayfieldObstacleReseed() {
  PlayfieldConfig config = MakeDefaultPlayfieldConfig();
  config.obstacles.seed = 7u;

  Playfield sameSeed{};
  InitPlayfield(sameSeed, config);
  const std::vector<PlacementPoint> first = sameSeed.obstacles.points;
  PushInput(sameSeed, InputEvent{InputAction::RegenerateObstacles, -1, 0.0f});
  StepPlayfield(sameSeed, cfg::kFixedDt);
  if (sameSeed.obstacles.points.size() != first.size() ||
      sameSeed.obstacles.points[0].x != first[0].x ||
      sameSeed.obstacleRegenerations != 2) {
    return false;
  }

  config.obstacles.reseedOnRegenerate = true;
  Playfield reseeded{};
  InitPlayfield(reseeded, config);
  if (NextObstacleSeed(reseeded) != 8u) {
    return false;
  }
  PushInput(reseeded, InputEvent{InputAction::RegenerateObstacles, -1, 0.0f});
  StepPlayfield(reseeded, cfg::kFixedDt);
  return reseeded.obstacles.Ok() &&
         (reseeded.obstacles.points.size() != first.size() ||
          reseeded.obstacles.points[0].x != first[0].x ||
          reseeded.obstacles.points[0].z != first[0].z);
}

bool TestPlayfieldBallAndPlungerEvents() {
  Playfield pf{};
  InitPlayfield(pf, MakeDefaultPlayfieldConfig());

  PushInput(pf, InputEvent{InputAction::SpawnBall, -1, 0.0f});
  PushInput(pf, InputEvent{InputAction::PlungerPress, -1, 0.0f});
  StepPlayfield(pf, cfg::kFixedDt);
  if (!pf.spawner.HasBall() || pf.plunger.state != PlungerState::Compressing ||
      !(pf.plunger.compression > 0.0f)) {
    return false;
  }

  PushInput(pf, InputEvent{InputAction::PlungerRelease, -1, 0.0f});
  PushInput(pf, InputEvent{InputAction::BallHeight, -1, cfg::kBallKillY - 1.0f});
  StepPlayfield(pf, cfg::kFixedDt);
  return !pf.spawner.HasBall() &&
         pf.plunger.state == PlungerState::BouncingBack;
}

bool TestPlayfieldRegenerateZonesEvent() {
  Playfield pf{};
  InitPlayfield(pf, MakeDefaultPlayfieldConfig());
  for (int i = 0; i < 420; ++i) {
    StepPlayfield(pf, cfg::kFixedDt);
  }
  PushInput(pf, InputEvent{InputAction::ZoneEntered, 0, 0.0f});
  StepPlayfield(pf, cfg::kFixedDt);
  const uint32_t generation = pf.sequencer.Generation();

  PushInput(pf, InputEvent{InputAction::RegenerateZones, -1, 0.0f});
  StepPlayfield(pf, cfg::kFixedDt);
  return pf.sequencer.Generation() == generation + 1 &&
         !pf.sequencer.IsClaimed() && pf.zoneRegenerations == 1 &&
         pf.sequencer.Phase() == SequencerPhase::Marquee &&
         pf.sequencer.LitCount() == 1;
}

bool TestPlayfieldInitReportsBadConfig() {
  PlayfieldConfig config = MakeDefaultPlayfieldConfig();
  config.obstacles.catalog.clear();
  Playfield pf{};
  if (InitPlayfield(pf, config) || pf.obstacles.error != FieldError::EmptyCatalog) {
    return false;
  }
  // Zones still come up.
  return pf.sequencer.Zones().size() == 5u &&
         pf.sequencer.Phase() == SequencerPhase::Marquee;
}

bool TestRunReportEscapesPresetStrings() {
  PlayfieldConfig config = MakeDefaultPlayfieldConfig();
  config.name = "say \"hi\" \\ bye";
  config.obstacles.catalog = {ObstacleKind{"post\"1"}, ObstacleKind{"back\\slash"}};
  Playfield pf{};
  if (!InitPlayfield(pf, config)) {
    return false;
  }
  RunSummary summary{};
  summary.entered = true;
  summary.ticksRun = 3;

  const std::string text = BuildRunReportJson(pf, summary);
  if (!nlohmann::json::accept(text)) {
    return false;
  }
  const nlohmann::json report = nlohmann::json::parse(text);
  const auto &kinds = report.at("kinds");
  return report.at("preset").get<std::string>() == config.name &&
         kinds.contains("post\"1") && kinds.contains("back\\slash") &&
         report.at("zones").get<int>() == 5 &&
         report.at("ticks_run").get<int>() == 3;
}

} // namespace

int main() {
  Log::Init(true, spdlog::level::warn);
  int failed = 0;

  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("obstacle_spacing_and_bounds", TestObstacleSpacingAndBounds());
  run("obstacle_field_deterministic", TestObstacleFieldDeterministic());
  run("obstacle_caps_drop_surplus", TestObstacleCapsDropSurplus());
  run("zero_weight_kind_only_after_others_capped",
      TestZeroWeightKindOnlyAfterOthersCapped());
  run("weighted_kind_distribution", TestWeightedKindDistribution());
  run("pick_kind_all_capped", TestPickKindAllCapped());
  run("obstacle_point_cap", TestObstaclePointCap());
  run("obstacle_field_errors", TestObstacleFieldErrors());
  run("obstacle_field_limits", TestObstacleFieldLimits());
  run("target_count_saturates", TestTargetCountSaturates());
  run("zone_partition_contiguous", TestZonePartitionContiguous());
  run("random_scoring_selection", TestRandomScoringSelection());
  run("explicit_scoring_selection", TestExplicitScoringSelection());
  run("zone_config_errors", TestZoneConfigErrors());
  run("out_of_range_selection_rejected", TestOutOfRangeSelectionRejected());
  run("marquee_lights_one_at_a_time", TestMarqueeLightsOneAtATime());
  run("protocol_timeline", TestProtocolTimeline());
  run("scoring_flash_only_scoring_zones", TestScoringFlashOnlyScoringZones());
  run("skip_startup_sequence", TestSkipStartupSequence());
  run("zero_flash_count_skips_flash", TestZeroFlashCountSkipsFlash());
  run("first_entry_locks_others", TestFirstEntryLocksOthers());
  run("confirmation_flash_ends_lit", TestConfirmationFlashEndsLit());
  run("confirmation_flash_owns_light_during_marquee",
      TestConfirmationFlashOwnsLightDuringMarquee());
  run("confirmation_without_flashes", TestConfirmationWithoutFlashes());
  run("regenerate_mid_marquee_leaves_no_stale_state",
      TestRegenerateMidMarqueeLeavesNoStaleState());
  run("regenerate_continues_random_stream",
      TestRegenerateContinuesRandomStream());
  run("scheduler_ordering_and_cancel", TestSchedulerOrderingAndCancel());
  run("scheduler_chained_callbacks", TestSchedulerChainedCallbacks());
  run("plunger_compression_curve", TestPlungerCompressionCurve());
  run("plunger_bounce_back", TestPlungerBounceBack());
  run("plunger_release_without_press_ignored",
      TestPlungerReleaseWithoutPressIgnored());
  run("ball_spawn_and_despawn", TestBallSpawnAndDespawn());
  run("parse_preset_overrides_subset", TestParsePresetOverridesSubset());
  run("parse_preset_errors", TestParsePresetErrors());
  run("playfield_serialises_same_tick_entries",
      TestPlayfieldSerialisesSameTickEntries());
  run("playfield_obstacle_reseed", TestPlayfieldObstacleReseed());
  run("playfield_ball_and_plunger_events",
      TestPlayfieldBallAndPlungerEvents());
  run("playfield_regenerate_zones_event", TestPlayfieldRegenerateZonesEvent());
  run("playfield_init_reports_bad_config", TestPlayfieldInitReportsBadConfig());
  run("run_report_escapes_preset_strings",
      TestRunReportEscapesPresetStrings());

  if (failed > 0) {
    std::cerr << failed << " test(s) failed\n";
    return 1;
  }
  std::cout << "All tests passed\n";
  return 0;
}
