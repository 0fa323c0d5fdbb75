#include "sim/BallSpawner.hpp"

#include "core/Log.hpp"

const Ball &BallSpawner::Spawn() {
  if (hasBall) {
    LOG_DEBUG("Replacing ball #{}", current.id);
  }
  current = Ball{};
  current.id = nextId++;
  current.type = config.type;
  current.x = config.spawnX;
  current.y = config.spawnY;
  current.z = config.spawnZ;
  hasBall = true;
  ++spawnCount;

  LOG_INFO("Spawned {} #{} at ({:.2f}, {:.2f}, {:.2f})",
           GetBallTypeLabel(current.type), current.id, current.x, current.y,
           current.z);
  return current;
}

void BallSpawner::Despawn() {
  if (!hasBall) {
    return;
  }
  hasBall = false;
  current = Ball{};
}

bool BallSpawner::CheckOutOfBounds(const float ballY) {
  if (!hasBall) {
    return false;
  }
  current.y = ballY;
  if (ballY >= config.killY) {
    return false;
  }
  LOG_INFO("Ball #{} fell off the table (y={:.2f}), despawned", current.id,
           ballY);
  Despawn();
  return true;
}

const char *GetBallTypeLabel(const BallType type) {
  switch (type) {
  case BallType::SteelBall:
    return "SteelBall";
  case BallType::Pokeball:
    return "Pokeball";
  }
  return "";
}
