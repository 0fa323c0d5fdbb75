#include "game/Viewer.hpp"

#include "core/Config.hpp"
#include "core/Log.hpp"

#include <cmath>
#include <raylib.h>

cfg::KeyConfig cfg::keys{};

namespace {

void ResetBallBody(Viewer &viewer) {
  const Ball &ball = viewer.field.spawner.current;
  viewer.ball = BallBody{};
  viewer.ball.position = Vector3{ball.x, ball.y, ball.z};
  viewer.previousBall = viewer.ball;
  viewer.trackedBallId = ball.id;
}

void ApplyPlungerContact(Viewer &viewer) {
  BallBody &ball = viewer.ball;
  const float faceZ = GetPlungerFaceZ(viewer);
  if (ball.position.z + cfg::kBallRadius < faceZ - 0.05f) {
    return; // not touching
  }

  const PlungerImpulse impulse = viewer.field.plunger.ContactImpulse();
  if (impulse.magnitude > 0.0f) {
    // The plunger pushes up the table, against its compression axis.
    ball.velocity.x -= impulse.x * cfg::kBallLaunchScale;
    ball.velocity.z = -impulse.z * cfg::kBallLaunchScale;
    ball.launched = true;
    LOG_DEBUG("Ball #{} launched at {:.2f} u/s", viewer.trackedBallId,
              -ball.velocity.z);
    return;
  }

  // Resting against the face, following it back while it compresses.
  ball.position.z = faceZ - cfg::kBallRadius;
  if (ball.velocity.z > 0.0f) {
    ball.velocity.z = 0.0f;
  }
}

void UpdateBallOnTable(Viewer &viewer, const float dt) {
  BallBody &ball = viewer.ball;
  const Region &table = viewer.field.config.table;
  const float laneX = viewer.field.config.spawner.spawnX;

  ball.velocity.z += cfg::kTableSlope * dt;
  const float damping = std::exp(-cfg::kBallRollDamping * dt);
  ball.velocity.x *= damping;
  ball.velocity.z *= damping;
  ball.position.x += ball.velocity.x * dt;
  ball.position.z += ball.velocity.z * dt;

  // Top wall sends the ball back down, deflected out of the lane.
  if (ball.position.z - cfg::kBallRadius < table.minZ) {
    ball.position.z = table.minZ + cfg::kBallRadius;
    ball.velocity.z = -ball.velocity.z * cfg::kWallRestitution;
    const float toCenter = (table.CenterX() < laneX) ? -1.0f : 1.0f;
    ball.velocity.x = toCenter * std::fabs(ball.velocity.z) * 0.5f;
  }
  if (ball.position.x - cfg::kBallRadius < table.minX) {
    ball.position.x = table.minX + cfg::kBallRadius;
    ball.velocity.x = -ball.velocity.x * cfg::kWallRestitution;
  } else if (ball.position.x + cfg::kBallRadius > table.maxX) {
    ball.position.x = table.maxX - cfg::kBallRadius;
    ball.velocity.x = -ball.velocity.x * cfg::kWallRestitution;
  }

  const bool inLane = std::fabs(ball.position.x - laneX) <= cfg::kLaneHalfWidth;
  if (inLane) {
    ApplyPlungerContact(viewer);
  } else if (ball.position.z > table.maxZ) {
    ball.onTable = false;
    LOG_DEBUG("Ball #{} drained at x={:.2f}", viewer.trackedBallId,
              ball.position.x);
  }
}

void ReportZoneEntry(Viewer &viewer) {
  BallBody &ball = viewer.ball;
  if (!ball.launched || !ball.onTable || ball.velocity.z <= 0.0f) {
    ball.lastZone = -1;
    return;
  }
  const Playfield &pf = viewer.field;
  const int zone = FindZoneAt(pf.sequencer.Zones(), ball.position.x,
                              pf.config.zones.track.y, ball.position.z);
  if (zone >= 0 && zone != ball.lastZone) {
    PushInput(viewer.field, InputEvent{InputAction::ZoneEntered, zone, 0.0f});
  }
  ball.lastZone = zone;
}

} // namespace

void InitViewer(Viewer &viewer, const PlayfieldConfig &config) {
  viewer.presetName = config.name;
  viewer.field.sequencer.SetLightSink(
      [&viewer](int /*zone*/, bool /*on*/) { ++viewer.lightChanges; });
  if (!InitPlayfield(viewer.field, config)) {
    LOG_WARN("Playfield '{}' started with errors (obstacles={}, zones={})",
             config.name, GetFieldErrorLabel(viewer.field.obstacles.error),
             GetSequencerErrorLabel(viewer.field.sequencer.LastError()));
  }

  const Region &table = viewer.field.config.table;
  viewer.camera.position =
      Vector3{table.CenterX(), table.y + table.Depth() * 0.8f,
              table.maxZ + table.Depth() * 0.45f};
  viewer.camera.target = Vector3{table.CenterX(), table.y, table.CenterZ()};
  viewer.camera.up = Vector3{0.0f, 1.0f, 0.0f};
  viewer.camera.fovy = cfg::kCameraFov;
  viewer.camera.projection = CAMERA_PERSPECTIVE;
}

void ReadInput(Viewer &viewer) {
  const auto &k = cfg::keys;
  Playfield &pf = viewer.field;

  if (IsKeyPressed(k.back)) {
    viewer.wantsExit = true;
    return;
  }
  if (IsKeyPressed(k.regenerateZones))
    PushInput(pf, InputEvent{InputAction::RegenerateZones, -1, 0.0f});
  if (IsKeyPressed(k.regenerateObstacles))
    PushInput(pf, InputEvent{InputAction::RegenerateObstacles, -1, 0.0f});
  if (IsKeyPressed(k.spawnBall))
    PushInput(pf, InputEvent{InputAction::SpawnBall, -1, 0.0f});
  if (IsKeyPressed(k.plunger))
    PushInput(pf, InputEvent{InputAction::PlungerPress, -1, 0.0f});
  if (IsKeyReleased(k.plunger))
    PushInput(pf, InputEvent{InputAction::PlungerRelease, -1, 0.0f});
  if (IsKeyPressed(k.toggleVolumes))
    viewer.showVolumes = !viewer.showVolumes;

  // Digit keys simulate an entry into zones 1-9.
  for (int i = 0; i < 9; ++i) {
    if (IsKeyPressed(k.firstZoneKey + i))
      PushInput(pf, InputEvent{InputAction::ZoneEntered, i, 0.0f});
  }
}

void StepViewer(Viewer &viewer, const float dt) {
  Playfield &pf = viewer.field;

  if (pf.spawner.hasBall) {
    if (pf.spawner.current.id != viewer.trackedBallId) {
      ResetBallBody(viewer);
    }
    viewer.previousBall = viewer.ball;

    if (viewer.ball.onTable) {
      UpdateBallOnTable(viewer, dt);
      ReportZoneEntry(viewer);
    } else {
      viewer.ball.velocity.y -= cfg::kGravity * dt;
      viewer.ball.position.y += viewer.ball.velocity.y * dt;
      viewer.ball.position.z += viewer.ball.velocity.z * dt;
    }
    PushInput(pf, InputEvent{InputAction::BallHeight, -1,
                             viewer.ball.position.y});
  }

  StepPlayfield(pf, dt);
  ++viewer.simTicks;
}

float GetPlungerFaceZ(const Viewer &viewer) {
  const auto &spawner = viewer.field.config.spawner;
  const float backZ = spawner.spawnZ + cfg::kBallRadius + cfg::kPlungerLength;
  return backZ - cfg::kPlungerLength * viewer.field.plunger.ScaleZ();
}
