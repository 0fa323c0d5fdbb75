#include "sim/ZoneSequencer.hpp"

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"

#include <algorithm>
#include <cmath>

namespace {

bool TimingsValid(const LightingTimings &t) {
  return t.marqueeDuration >= 0.0f && t.flashDuration >= 0.0f &&
         t.confirmFlashDuration >= 0.0f && t.marqueeLoops >= 0 &&
         t.flashCount >= 0 && t.confirmFlashCount >= 0;
}

// Partial Fisher-Yates: the first `count` slots end up a uniform subset.
std::vector<int> PickRandomSubset(const int zoneCount, const int count,
                                  uint32_t &rngState) {
  std::vector<int> pool(zoneCount);
  for (int i = 0; i < zoneCount; ++i) {
    pool[i] = i;
  }
  for (int i = 0; i < count; ++i) {
    const int j = i + core::NextIndex(rngState, zoneCount - i);
    std::swap(pool[i], pool[j]);
  }
  pool.resize(count);
  return pool;
}

} // namespace

bool ZoneVolume::Contains(const float x, const float y, const float z) const {
  return std::fabs(x - centerX) <= sizeX * 0.5f &&
         std::fabs(y - centerY) <= sizeY * 0.5f &&
         std::fabs(z - centerZ) <= sizeZ * 0.5f;
}

SequencerError ValidateZoneConfig(const ZoneConfig &config) {
  if (config.zoneCount <= 0) {
    return SequencerError::ZeroZones;
  }
  if (config.track.IsDegenerate()) {
    return SequencerError::DegenerateTrack;
  }
  if (config.selection != ScoringSelection::FirstN &&
      config.selection != ScoringSelection::Random &&
      config.selection != ScoringSelection::Explicit) {
    return SequencerError::InvalidSelection;
  }
  if (config.selection == ScoringSelection::Explicit) {
    std::vector<bool> seen(config.zoneCount, false);
    for (const int index : config.scoringIndices) {
      if (index < 0 || index >= config.zoneCount || seen[index]) {
        return SequencerError::InvalidScoringIndex;
      }
      seen[index] = true;
    }
  } else if (config.scoringZoneCount < 0) {
    return SequencerError::NegativeScoringCount;
  }
  if (!TimingsValid(config.timings)) {
    return SequencerError::InvalidTimings;
  }
  return SequencerError::None;
}

ZoneLayout BuildZoneLayout(const ZoneConfig &config, uint32_t &rngState) {
  ZoneLayout layout{};
  layout.error = ValidateZoneConfig(config);
  if (!layout.Ok()) {
    return layout;
  }

  const Region &track = config.track;
  const int n = config.zoneCount;
  const float zoneDepth = track.Depth() / static_cast<float>(n);

  // Shared edges keep neighbours exactly contiguous; the last edge is pinned
  // to the track end instead of accumulating rounding.
  std::vector<float> edges(n + 1);
  for (int i = 0; i < n; ++i) {
    edges[i] = track.minZ + static_cast<float>(i) * zoneDepth;
  }
  edges[n] = track.maxZ;

  layout.zones.resize(n);
  for (int i = 0; i < n; ++i) {
    auto &zone = layout.zones[i];
    zone.index = i;
    zone.spanStart = edges[i];
    zone.spanEnd = edges[i + 1];

    auto &vol = zone.volume;
    vol.centerX = track.CenterX();
    vol.centerY = track.y;
    vol.centerZ = (zone.spanStart + zone.spanEnd) * 0.5f;
    vol.sizeX = track.Width();
    vol.sizeY = config.zoneHeight;
    vol.sizeZ = std::max(0.0f, (zone.spanEnd - zone.spanStart) -
                                   config.zoneThickness * 2.0f);

    zone.lightX = vol.centerX;
    zone.lightY = vol.centerY + config.zoneHeight * 0.5f + cfg::kZoneLightLift;
    zone.lightZ = vol.centerZ;
  }

  switch (config.selection) {
  case ScoringSelection::FirstN: {
    const int k = std::min(config.scoringZoneCount, n);
    for (int i = 0; i < k; ++i) {
      layout.zones[i].isScoring = true;
    }
    break;
  }
  case ScoringSelection::Random: {
    const int k = std::min(config.scoringZoneCount, n);
    for (const int index : PickRandomSubset(n, k, rngState)) {
      layout.zones[index].isScoring = true;
    }
    break;
  }
  case ScoringSelection::Explicit:
    for (const int index : config.scoringIndices) {
      layout.zones[index].isScoring = true;
    }
    break;
  }

  for (const auto &zone : layout.zones) {
    if (zone.isScoring) {
      ++layout.scoringCount;
    }
  }
  return layout;
}

int FindZoneAt(const std::vector<Zone> &zones, const float x, const float y,
               const float z) {
  for (const auto &zone : zones) {
    if (!zone.locked && zone.volume.Contains(x, y, z)) {
      return zone.index;
    }
  }
  return -1;
}

// --- ZoneSequencer ---

ZoneSequencer::ZoneSequencer(Scheduler &scheduler) : scheduler_(scheduler) {}

ZoneSequencer::~ZoneSequencer() { CancelPending(); }

SequencerError ZoneSequencer::Configure(const ZoneConfig &config) {
  config_ = config;
  rngState_ = core::NormalizeSeed(config.seed);
  Rebuild();
  return lastError_;
}

SequencerError ZoneSequencer::Regenerate() {
  LOG_INFO("Regenerating scoring zones (generation {})", generation_ + 1);
  Rebuild();
  if (lastError_ == SequencerError::None) {
    StartLighting();
  }
  return lastError_;
}

void ZoneSequencer::Rebuild() {
  CancelPending();
  ++generation_;
  Teardown();
  EnterPhase(SequencerPhase::Idle);

  ZoneLayout layout = BuildZoneLayout(config_, rngState_);
  lastError_ = layout.error;
  if (!layout.Ok()) {
    LOG_ERROR("Zone layout rejected: {}", GetSequencerErrorLabel(lastError_));
    return;
  }

  zones_ = std::move(layout.zones);
  lights_.assign(zones_.size(), false);
  scoringCount_ = layout.scoringCount;

  LOG_INFO("Built {} zones over Z=[{:.2f}, {:.2f}], {} scoring ({})",
           zones_.size(), config_.track.minZ, config_.track.maxZ,
           scoringCount_, GetScoringSelectionLabel(config_.selection));
  for (const auto &zone : zones_) {
    LOG_DEBUG("  zone {}: Z=[{:.2f}, {:.2f}] scoring={}", zone.index + 1,
              zone.spanStart, zone.spanEnd, zone.isScoring);
  }
}

void ZoneSequencer::Teardown() {
  // The render side must see the old lights go dark before the set is gone.
  for (size_t i = 0; i < lights_.size(); ++i) {
    SetLight(static_cast<int>(i), false);
  }
  zones_.clear();
  lights_.clear();
  scoringCount_ = 0;
  claimedZone_ = -1;
  confirmOwnedZone_ = -1;
  confirmStep_ = 0;
  protocolStep_ = 0;
}

void ZoneSequencer::CancelPending() {
  if (protocolTask_ != Scheduler::kInvalidTask) {
    scheduler_.Cancel(protocolTask_);
    protocolTask_ = Scheduler::kInvalidTask;
  }
  if (confirmTask_ != Scheduler::kInvalidTask) {
    scheduler_.Cancel(confirmTask_);
    confirmTask_ = Scheduler::kInvalidTask;
  }
}

void ZoneSequencer::EnterPhase(const SequencerPhase phase) {
  if (phase != phase_) {
    LOG_DEBUG("Lighting phase {} -> {}", GetSequencerPhaseLabel(phase_),
              GetSequencerPhaseLabel(phase));
  }
  phase_ = phase;
  phaseStart_ = scheduler_.Now();
  protocolStep_ = 0;
}

float ZoneSequencer::PhaseElapsed() const {
  return scheduler_.Now() - phaseStart_;
}

Scheduler::TaskId ZoneSequencer::Schedule(const float delay,
                                          void (ZoneSequencer::*step)()) {
  const uint32_t generation = generation_;
  return scheduler_.ScheduleAfter(delay, [this, generation, step]() {
    if (generation != generation_) {
      return; // zones were rebuilt after this step was queued
    }
    (this->*step)();
  });
}

void ZoneSequencer::StartLighting() {
  if (zones_.empty()) {
    return;
  }
  if (protocolTask_ != Scheduler::kInvalidTask) {
    scheduler_.Cancel(protocolTask_);
    protocolTask_ = Scheduler::kInvalidTask;
  }

  if (!config_.runStartupSequence) {
    SteadyOn();
    return;
  }
  EnterPhase(SequencerPhase::Marquee);
  MarqueeStep();
}

void ZoneSequencer::MarqueeStep() {
  protocolTask_ = Scheduler::kInvalidTask;

  const int n = static_cast<int>(zones_.size());
  const int loops = std::max(1, config_.timings.marqueeLoops);
  const int totalSteps = n * loops;
  const float stepTime =
      config_.timings.marqueeDuration / static_cast<float>(totalSteps);

  // Offs go out before the on so a sink never sees two marquee lights lit.
  const int lit = protocolStep_ % n;
  for (int i = 0; i < n; ++i) {
    if (i != lit) {
      SetProtocolLight(i, false);
    }
  }
  SetProtocolLight(lit, true);
  ++protocolStep_;

  if (protocolStep_ < totalSteps) {
    protocolTask_ = Schedule(stepTime, &ZoneSequencer::MarqueeStep);
  } else {
    protocolTask_ = Schedule(stepTime, &ZoneSequencer::Blackout);
  }
}

void ZoneSequencer::Blackout() {
  protocolTask_ = Scheduler::kInvalidTask;
  EnterPhase(SequencerPhase::Blackout);
  for (size_t i = 0; i < zones_.size(); ++i) {
    SetProtocolLight(static_cast<int>(i), false);
  }

  if (config_.timings.flashCount > 0) {
    EnterPhase(SequencerPhase::ScoringFlash);
    ScoringFlashStep();
  } else {
    SteadyOn();
  }
}

void ZoneSequencer::ScoringFlashStep() {
  protocolTask_ = Scheduler::kInvalidTask;

  const int flashes = config_.timings.flashCount;
  const float halfFlash =
      config_.timings.flashDuration / static_cast<float>(flashes) * 0.5f;

  // Even steps open a flash, odd steps close it.
  const bool flashOn = (protocolStep_ % 2) == 0;
  for (size_t i = 0; i < zones_.size(); ++i) {
    SetProtocolLight(static_cast<int>(i), flashOn && zones_[i].isScoring);
  }
  ++protocolStep_;

  if (protocolStep_ < flashes * 2) {
    protocolTask_ = Schedule(halfFlash, &ZoneSequencer::ScoringFlashStep);
  } else {
    protocolTask_ = Schedule(halfFlash, &ZoneSequencer::SteadyOn);
  }
}

void ZoneSequencer::SteadyOn() {
  protocolTask_ = Scheduler::kInvalidTask;
  EnterPhase(SequencerPhase::SteadyOn);
  for (size_t i = 0; i < zones_.size(); ++i) {
    SetProtocolLight(static_cast<int>(i), true);
  }
}

EntryOutcome ZoneSequencer::OnZoneEntered(const int zoneIndex) {
  if (zoneIndex < 0 || zoneIndex >= static_cast<int>(zones_.size())) {
    LOG_WARN("Entry into unknown zone {} ignored", zoneIndex);
    return EntryOutcome::UnknownZone;
  }
  if (claimedZone_ >= 0) {
    LOG_TRACE("Entry into zone {} ignored, zone {} already claimed",
              zoneIndex + 1, claimedZone_ + 1);
    return EntryOutcome::AlreadyClaimed;
  }

  claimedZone_ = zoneIndex;
  for (auto &zone : zones_) {
    zone.locked = (zone.index != zoneIndex);
  }

  const Zone &zone = zones_[zoneIndex];
  LOG_INFO("Player entered zone {} first, scoring={}", zoneIndex + 1,
           zone.isScoring);

  if (zone.isScoring) {
    // From here on only the confirmation flash drives this light.
    confirmOwnedZone_ = zoneIndex;
    confirmStep_ = 0;
    ConfirmFlashStep();
  }
  return EntryOutcome::Claimed;
}

void ZoneSequencer::ConfirmFlashStep() {
  confirmTask_ = Scheduler::kInvalidTask;

  const int zone = confirmOwnedZone_;
  const int flashes = config_.timings.confirmFlashCount;
  if (flashes <= 0 || confirmStep_ >= flashes * 2) {
    SetLight(zone, true); // ends lit
    return;
  }

  const float halfFlash =
      config_.timings.confirmFlashDuration / static_cast<float>(flashes) * 0.5f;
  SetLight(zone, (confirmStep_ % 2) == 0);
  ++confirmStep_;
  confirmTask_ = Schedule(halfFlash, &ZoneSequencer::ConfirmFlashStep);
}

void ZoneSequencer::SetProtocolLight(const int zoneIndex, const bool on) {
  if (zoneIndex == confirmOwnedZone_) {
    return;
  }
  SetLight(zoneIndex, on);
}

void ZoneSequencer::SetLight(const int zoneIndex, const bool on) {
  if (lights_[zoneIndex] == on) {
    return;
  }
  lights_[zoneIndex] = on;
  LOG_TRACE("light {} {}", zoneIndex + 1, on ? "on" : "off");
  if (sink_) {
    sink_(zoneIndex, on);
  }
}

bool ZoneSequencer::IsLightOn(const int zoneIndex) const {
  if (zoneIndex < 0 || zoneIndex >= static_cast<int>(lights_.size())) {
    return false;
  }
  return lights_[zoneIndex];
}

int ZoneSequencer::LitCount() const {
  return static_cast<int>(std::count(lights_.begin(), lights_.end(), true));
}

const char *GetSequencerPhaseLabel(const SequencerPhase phase) {
  switch (phase) {
  case SequencerPhase::Idle:
    return "IDLE";
  case SequencerPhase::Marquee:
    return "MARQUEE";
  case SequencerPhase::Blackout:
    return "BLACKOUT";
  case SequencerPhase::ScoringFlash:
    return "SCORING_FLASH";
  case SequencerPhase::SteadyOn:
    return "STEADY_ON";
  }
  return "";
}

const char *GetSequencerErrorLabel(const SequencerError error) {
  switch (error) {
  case SequencerError::None:
    return "OK";
  case SequencerError::ZeroZones:
    return "ZERO_ZONES";
  case SequencerError::DegenerateTrack:
    return "DEGENERATE_TRACK";
  case SequencerError::NegativeScoringCount:
    return "NEGATIVE_SCORING_COUNT";
  case SequencerError::InvalidScoringIndex:
    return "INVALID_SCORING_INDEX";
  case SequencerError::InvalidTimings:
    return "INVALID_TIMINGS";
  case SequencerError::InvalidSelection:
    return "INVALID_SELECTION";
  }
  return "UNKNOWN";
}

const char *GetEntryOutcomeLabel(const EntryOutcome outcome) {
  switch (outcome) {
  case EntryOutcome::Claimed:
    return "CLAIMED";
  case EntryOutcome::AlreadyClaimed:
    return "ALREADY_CLAIMED";
  case EntryOutcome::UnknownZone:
    return "UNKNOWN_ZONE";
  }
  return "";
}

const char *GetScoringSelectionLabel(const ScoringSelection selection) {
  switch (selection) {
  case ScoringSelection::FirstN:
    return "first";
  case ScoringSelection::Random:
    return "random";
  case ScoringSelection::Explicit:
    return "explicit";
  }
  return "";
}
