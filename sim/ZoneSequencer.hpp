#pragma once

#include "sim/Region.hpp"
#include "sim/Scheduler.hpp"

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

enum class SequencerPhase : int {
  Idle = 0,      // no zones, or zones built but lighting not started
  Marquee,       // chase light, one zone lit at a time
  Blackout,      // everything off, instantaneous
  ScoringFlash,  // scoring zones blink together
  SteadyOn,      // all lights on, resting state
};

// How scoring zones are picked out of the partition.
enum class ScoringSelection : int {
  FirstN = 0,    // zones 0..k-1
  Random = 1,    // uniform distinct subset from the sequencer's seeded stream
  Explicit = 2,  // ZoneConfig::scoringIndices as given
};

enum class SequencerError : int {
  None = 0,
  ZeroZones,
  DegenerateTrack,
  NegativeScoringCount,
  InvalidScoringIndex,
  InvalidTimings,
  InvalidSelection,
};

enum class EntryOutcome : int {
  Claimed = 0,     // first entry since the last regeneration
  AlreadyClaimed,  // a zone already won; no effect
  UnknownZone,     // index out of range or no zones built
};

// Trigger box of a zone. Thinner than the zone span by the wall thickness on
// each side so neighbouring volumes never touch.
struct ZoneVolume {
  float centerX = 0.0f;
  float centerY = 0.0f;
  float centerZ = 0.0f;
  float sizeX = 0.0f;
  float sizeY = 0.0f;
  float sizeZ = 0.0f;

  bool Contains(float x, float y, float z) const;
};

struct Zone {
  int index = 0;
  float spanStart = 0.0f;  // along Z
  float spanEnd = 0.0f;
  bool isScoring = false;
  bool locked = false;     // entry detection disabled after another zone won
  ZoneVolume volume{};
  float lightX = 0.0f;     // light anchor above the volume
  float lightY = 0.0f;
  float lightZ = 0.0f;
};

struct LightingTimings {
  float marqueeDuration = 2.0f;
  int marqueeLoops = 3;
  float flashDuration = 1.0f;
  int flashCount = 3;
  float confirmFlashDuration = 1.0f;
  int confirmFlashCount = 3;
};

struct ZoneConfig {
  Region track{};               // zones split the Z extent
  int zoneCount = 5;
  int scoringZoneCount = 2;     // clamped to zoneCount
  ScoringSelection selection = ScoringSelection::FirstN;
  std::vector<int> scoringIndices;  // used by ScoringSelection::Explicit
  uint32_t seed = 1u;           // stream for ScoringSelection::Random
  float zoneHeight = 2.0f;
  float zoneThickness = 0.1f;
  bool runStartupSequence = true;
  LightingTimings timings{};
};

struct ZoneLayout {
  SequencerError error = SequencerError::None;
  std::vector<Zone> zones;
  int scoringCount = 0;

  bool Ok() const { return error == SequencerError::None; }
};

SequencerError ValidateZoneConfig(const ZoneConfig &config);

// Equal-width contiguous partition of the track with scoring zones marked.
// Draws from rngState only for ScoringSelection::Random.
ZoneLayout BuildZoneLayout(const ZoneConfig &config, uint32_t &rngState);

// Index of the first unlocked zone whose trigger volume holds the point, or -1.
int FindZoneAt(const std::vector<Zone> &zones, float x, float y, float z);

const char *GetSequencerPhaseLabel(SequencerPhase phase);
const char *GetSequencerErrorLabel(SequencerError error);
const char *GetEntryOutcomeLabel(EntryOutcome outcome);
const char *GetScoringSelectionLabel(ScoringSelection selection);

// Owns the zone set, the per-zone light state and the entry claim. Lighting
// runs as an explicit state machine advanced by Scheduler callbacks; every
// callback carries the generation it was scheduled under and does nothing
// once a regeneration has replaced the zones.
class ZoneSequencer {
public:
  using LightSink = std::function<void(int zoneIndex, bool on)>;

  explicit ZoneSequencer(Scheduler &scheduler);
  ~ZoneSequencer();

  ZoneSequencer(const ZoneSequencer &) = delete;
  ZoneSequencer &operator=(const ZoneSequencer &) = delete;

  // Replaces the stored config and rebuilds the zones with every light off.
  // Lighting stays Idle until StartLighting(). Reseeds the selection stream.
  SequencerError Configure(const ZoneConfig &config);

  // Runs the startup protocol from Marquee, or jumps to SteadyOn when the
  // config disables it. No-op without zones.
  void StartLighting();

  // Cancels everything in flight, rebuilds from the stored config (continuing
  // the selection stream) and restarts the lighting.
  SequencerError Regenerate();

  EntryOutcome OnZoneEntered(int zoneIndex);

  // Receives every light change, including the turn-offs of a torn-down set.
  void SetLightSink(LightSink sink) { sink_ = std::move(sink); }

  const std::vector<Zone> &Zones() const { return zones_; }
  const ZoneConfig &Config() const { return config_; }
  SequencerPhase Phase() const { return phase_; }
  float PhaseElapsed() const;
  bool IsLightOn(int zoneIndex) const;
  int LitCount() const;
  bool IsClaimed() const { return claimedZone_ >= 0; }
  int ClaimedZone() const { return claimedZone_; }
  bool IsConfirmFlashing() const { return confirmTask_ != Scheduler::kInvalidTask; }
  bool IsIdle() const { return protocolTask_ == Scheduler::kInvalidTask; }
  uint32_t Generation() const { return generation_; }
  int ScoringZoneCount() const { return scoringCount_; }
  SequencerError LastError() const { return lastError_; }

private:
  void Rebuild();
  void Teardown();
  void CancelPending();
  void EnterPhase(SequencerPhase phase);
  Scheduler::TaskId Schedule(float delay, void (ZoneSequencer::*step)());

  // Startup protocol steps
  void MarqueeStep();
  void Blackout();
  void ScoringFlashStep();
  void SteadyOn();

  // Confirmation flash steps
  void ConfirmFlashStep();

  void SetProtocolLight(int zoneIndex, bool on);
  void SetLight(int zoneIndex, bool on);

  Scheduler &scheduler_;
  LightSink sink_;
  ZoneConfig config_{};
  uint32_t rngState_ = 1u;
  uint32_t generation_ = 0;

  std::vector<Zone> zones_;
  std::vector<bool> lights_;
  int scoringCount_ = 0;
  SequencerError lastError_ = SequencerError::None;

  SequencerPhase phase_ = SequencerPhase::Idle;
  float phaseStart_ = 0.0f;
  int protocolStep_ = 0;
  Scheduler::TaskId protocolTask_ = Scheduler::kInvalidTask;

  int claimedZone_ = -1;
  int confirmOwnedZone_ = -1;  // light handed over to the confirmation flash
  int confirmStep_ = 0;
  Scheduler::TaskId confirmTask_ = Scheduler::kInvalidTask;
};
