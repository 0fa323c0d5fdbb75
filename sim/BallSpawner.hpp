#pragma once

#include <cstdint>

enum class BallType : int {
  SteelBall = 0,
  Pokeball = 1,
};

struct Ball {
  uint32_t id = 0;
  BallType type = BallType::SteelBall;
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
};

struct BallSpawnerConfig {
  BallType type = BallType::SteelBall;
  float spawnX = 0.0f;
  float spawnY = 0.0f;
  float spawnZ = 0.0f;
  float killY = 1.0f; // balls below this height are removed
};

// Tracks the single player ball. The physics side owns the live body and
// reports its height back through CheckOutOfBounds().
struct BallSpawner {
  BallSpawnerConfig config{};
  Ball current{};
  bool hasBall = false;
  uint32_t nextId = 1u;
  int spawnCount = 0;

  // Replaces any current ball with a fresh one at the spawn point.
  const Ball &Spawn();
  void Despawn();

  bool HasBall() const { return hasBall; }
  const Ball &Current() const { return current; }

  // Despawns when the ball has fallen below killY. Returns true if it did.
  bool CheckOutOfBounds(float ballY);
};

const char *GetBallTypeLabel(BallType type);
