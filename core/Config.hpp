#pragma once

#include <cstdint>

namespace cfg {
constexpr int kScreenWidth = 1280;
constexpr int kScreenHeight = 720;

constexpr float kFixedDt = 1.0f / 120.0f;
constexpr float kMaxFrameTime = 0.25f;

// --- Table ---
constexpr float kTableMinX = -5.0f;
constexpr float kTableMaxX = 5.0f;
constexpr float kTableMinZ = -10.0f;
constexpr float kTableMaxZ = 10.0f;
constexpr float kTableTopY = 1.5f; // table stands above the kill height

// --- Obstacle field ---
constexpr float kObstacleMinDistance = 1.0f;
constexpr float kObstacleDensity = 0.3f;
constexpr float kObstacleMargin = 1.0f;
constexpr uint32_t kObstacleSeed = 0u;
constexpr int kObstacleMaxAttempts = 30; // candidates per active point
constexpr int kObstacleMaxPoints = 1000; // safety cap on accepted points

// --- Scoring zones ---
// The zone track is the lower strip of the table by default.
constexpr float kZoneTrackMinZ = 6.0f;
constexpr float kZoneTrackMaxZ = 10.0f;
constexpr int kZoneCount = 5;
constexpr int kScoringZoneCount = 2;
constexpr float kZoneHeight = 2.0f;
constexpr float kZoneThickness = 0.1f;
constexpr float kZoneLightLift = 0.5f; // light sits this far above the volume
constexpr uint32_t kZoneSeed = 0x5EEDu;

// Startup lighting protocol
constexpr float kMarqueeDuration = 2.0f;
constexpr int kMarqueeLoops = 3;
constexpr float kScoringFlashDuration = 1.0f;
constexpr int kScoringFlashCount = 3;
constexpr float kConfirmFlashDuration = 1.0f;
constexpr int kConfirmFlashCount = 3;

// --- Plunger ---
constexpr float kPlungerMaxCompression = 0.6f;
constexpr float kPlungerBounceBackTime = 0.3f;
constexpr float kPlungerForceMultiplier = 100.0f;
constexpr float kPlungerMaxCompressionTime = 5.0f;

// --- Ball ---
constexpr float kBallSpawnX = 4.5f;
constexpr float kBallSpawnY = kTableTopY + 0.25f;
constexpr float kBallSpawnZ = 8.0f;
constexpr float kBallKillY = 1.0f; // despawn below this height
constexpr float kBallRadius = 0.25f;

// Viewer-side ball motion. The table tilts toward +Z.
constexpr float kGravity = 9.81f;
constexpr float kTableSlope = 3.0f;       // acceleration toward +Z on the table
constexpr float kBallRollDamping = 0.35f; // per second
constexpr float kBallLaunchScale = 0.25f; // speed per unit of plunger impulse
constexpr float kWallRestitution = 0.6f;
constexpr float kLaneHalfWidth = 0.5f;    // plunger lane around kBallSpawnX
constexpr float kPlungerLength = 1.5f;

// --- Viewer ---
constexpr float kCameraFov = 55.0f;
constexpr float kLightMarkerRadius = 0.18f;
constexpr int kMaxSimStepsPerFrame = 8;

// --- Controls ---
struct KeyConfig {
  int regenerateZones = 84;     // KEY_T
  int regenerateObstacles = 71; // KEY_G
  int spawnBall = 82;           // KEY_R
  int plunger = 32;             // KEY_SPACE
  int firstZoneKey = 49;        // KEY_ONE, zones 1-9 map to KEY_ONE..KEY_NINE
  int toggleVolumes = 292;      // KEY_F3, trigger volume overlay
  int back = 256;               // KEY_ESCAPE
};

extern KeyConfig keys;

} // namespace cfg
