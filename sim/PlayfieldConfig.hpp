#pragma once

#include "sim/BallSpawner.hpp"
#include "sim/ObstacleField.hpp"
#include "sim/Plunger.hpp"
#include "sim/Region.hpp"
#include "sim/ZoneSequencer.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct ObstacleSettings {
  ObstacleFieldParams params{};       // params.region follows the table
  uint32_t seed = 0u;
  bool reseedOnRegenerate = false;    // seed + regeneration count when set
  std::vector<ObstacleKind> catalog;
};

// Everything needed to build a playfield. Defaults come from core/Config.hpp;
// presets override any subset through LoadPlayfieldConfig().
struct PlayfieldConfig {
  std::string name = "default";
  Region table{};
  ObstacleSettings obstacles{};
  ZoneConfig zones{};
  PlungerConfig plunger{};
  BallSpawnerConfig spawner{};
};

enum class LoadError : int {
  None = 0,
  FileNotFound,
  ParseError,
  InvalidValue,
};

PlayfieldConfig MakeDefaultPlayfieldConfig();

// Both reset `config` to the defaults before applying the preset. On failure
// `config` holds the defaults.
LoadError LoadPlayfieldConfig(PlayfieldConfig &config, const std::string &path);
LoadError ParsePlayfieldConfig(PlayfieldConfig &config, const std::string &text);

const char *GetLoadErrorLabel(LoadError error);
