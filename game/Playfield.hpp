#pragma once

#include <cstdint>
#include <vector>

#include "sim/BallSpawner.hpp"
#include "sim/ObstacleField.hpp"
#include "sim/PlayfieldConfig.hpp"
#include "sim/Plunger.hpp"
#include "sim/Scheduler.hpp"
#include "sim/ZoneSequencer.hpp"

enum class InputAction : int {
  RegenerateZones,
  RegenerateObstacles,
  SpawnBall,
  PlungerPress,
  PlungerRelease,
  ZoneEntered,  // zoneIndex
  BallHeight,   // value = current ball Y from the physics side
};

struct InputEvent {
  InputAction action = InputAction::SpawnBall;
  int zoneIndex = -1;
  float value = 0.0f;
};

struct Playfield {
  PlayfieldConfig config{};

  Scheduler scheduler{};
  ZoneSequencer sequencer{scheduler};  // must follow scheduler
  ObstacleFieldResult obstacles{};
  Plunger plunger{};
  BallSpawner spawner{};

  // Events are applied in arrival order at the start of the next step, which
  // serialises zone entries that land in the same tick.
  std::vector<InputEvent> pendingInput;

  int obstacleRegenerations = 0;
  int zoneRegenerations = 0;
  int score = 0;  // scoring zones claimed since start
  EntryOutcome lastEntryOutcome = EntryOutcome::UnknownZone;
  uint64_t ticks = 0;
};

// Builds obstacles and zones and starts the lighting. Returns false if either
// part was rejected; the other part is still built.
bool InitPlayfield(Playfield &pf, const PlayfieldConfig &config);

bool RegenerateObstacles(Playfield &pf);
SequencerError RegenerateZones(Playfield &pf);

void PushInput(Playfield &pf, const InputEvent &event);
void StepPlayfield(Playfield &pf, float dt);

// Seed the next obstacle generation will use.
uint32_t NextObstacleSeed(const Playfield &pf);

const char *GetInputActionLabel(InputAction action);
