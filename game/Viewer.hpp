#pragma once

#include <cstdint>
#include <string>

#include <raylib.h>

#include "game/Playfield.hpp"

// Stand-in for the physics engine: enough ball motion to launch off the
// plunger, roll back down through the zone strip and drain off the table.
struct BallBody {
  Vector3 position{};
  Vector3 velocity{};
  bool launched = false;  // left the plunger since it spawned
  bool onTable = true;    // false once it drained and is falling
  int lastZone = -1;      // zone volume it was in on the previous step
};

struct Viewer {
  Playfield field{};
  Camera3D camera{};

  BallBody ball{};
  BallBody previousBall{};
  uint32_t trackedBallId = 0;

  float accumulator = 0.0f;
  uint64_t simTicks = 0;
  int lightChanges = 0;
  bool showVolumes = true;
  bool wantsExit = false;
  std::string presetName;
};

void InitViewer(Viewer &viewer, const PlayfieldConfig &config);
void ReadInput(Viewer &viewer);

// One fixed step: ball motion, collision events, then StepPlayfield().
void StepViewer(Viewer &viewer, float dt);

// Front face of the plunger along Z for the current compression.
float GetPlungerFaceZ(const Viewer &viewer);
