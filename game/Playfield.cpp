#include "game/Playfield.hpp"

#include "core/Log.hpp"

namespace {

void ApplyInput(Playfield &pf, const InputEvent &event) {
  switch (event.action) {
  case InputAction::RegenerateZones:
    RegenerateZones(pf);
    break;
  case InputAction::RegenerateObstacles:
    RegenerateObstacles(pf);
    break;
  case InputAction::SpawnBall:
    pf.spawner.Spawn();
    break;
  case InputAction::PlungerPress:
    pf.plunger.Press();
    break;
  case InputAction::PlungerRelease:
    pf.plunger.Release();
    break;
  case InputAction::ZoneEntered: {
    const EntryOutcome outcome = pf.sequencer.OnZoneEntered(event.zoneIndex);
    pf.lastEntryOutcome = outcome;
    if (outcome == EntryOutcome::Claimed &&
        pf.sequencer.Zones()[event.zoneIndex].isScoring) {
      ++pf.score;
      LOG_INFO("Scored in zone {} (score {})", event.zoneIndex + 1, pf.score);
    }
    break;
  }
  case InputAction::BallHeight:
    pf.spawner.CheckOutOfBounds(event.value);
    break;
  }
}

} // namespace

uint32_t NextObstacleSeed(const Playfield &pf) {
  const auto &obs = pf.config.obstacles;
  if (!obs.reseedOnRegenerate) {
    return obs.seed;
  }
  return obs.seed + static_cast<uint32_t>(pf.obstacleRegenerations);
}

bool InitPlayfield(Playfield &pf, const PlayfieldConfig &config) {
  pf.config = config;
  pf.config.obstacles.params.region = config.table;
  pf.obstacleRegenerations = 0;
  pf.zoneRegenerations = 0;
  pf.score = 0;
  pf.ticks = 0;
  pf.pendingInput.clear();

  pf.plunger.Configure(pf.config.plunger);
  pf.spawner.config = pf.config.spawner;
  pf.spawner.Despawn();

  LOG_INFO("Initializing playfield '{}'", pf.config.name);
  const bool obstaclesOk = RegenerateObstacles(pf);

  const SequencerError zoneErr = pf.sequencer.Configure(pf.config.zones);
  if (zoneErr == SequencerError::None) {
    pf.sequencer.StartLighting();
  }
  return obstaclesOk && zoneErr == SequencerError::None;
}

bool RegenerateObstacles(Playfield &pf) {
  const uint32_t seed = NextObstacleSeed(pf);
  pf.obstacles = GenerateObstacleField(pf.config.obstacles.params,
                                       pf.config.obstacles.catalog, seed);
  ++pf.obstacleRegenerations;
  if (!pf.obstacles.Ok()) {
    LOG_WARN("Obstacle regeneration failed ({}), table left empty",
             GetFieldErrorLabel(pf.obstacles.error));
    return false;
  }
  return true;
}

SequencerError RegenerateZones(Playfield &pf) {
  ++pf.zoneRegenerations;
  pf.lastEntryOutcome = EntryOutcome::UnknownZone;
  return pf.sequencer.Regenerate();
}

void PushInput(Playfield &pf, const InputEvent &event) {
  pf.pendingInput.push_back(event);
}

void StepPlayfield(Playfield &pf, const float dt) {
  // Swap out first: handlers may queue follow-up events for the next step.
  std::vector<InputEvent> events;
  events.swap(pf.pendingInput);
  for (const auto &event : events) {
    LOG_TRACE("input {}", GetInputActionLabel(event.action));
    ApplyInput(pf, event);
  }

  pf.plunger.Update(dt);
  pf.scheduler.Advance(dt);
  ++pf.ticks;
}

const char *GetInputActionLabel(const InputAction action) {
  switch (action) {
  case InputAction::RegenerateZones:
    return "REGENERATE_ZONES";
  case InputAction::RegenerateObstacles:
    return "REGENERATE_OBSTACLES";
  case InputAction::SpawnBall:
    return "SPAWN_BALL";
  case InputAction::PlungerPress:
    return "PLUNGER_PRESS";
  case InputAction::PlungerRelease:
    return "PLUNGER_RELEASE";
  case InputAction::ZoneEntered:
    return "ZONE_ENTERED";
  case InputAction::BallHeight:
    return "BALL_HEIGHT";
  }
  return "";
}
