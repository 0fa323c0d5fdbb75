#include "sim/PlayfieldConfig.hpp"

#include "core/Config.hpp"
#include "core/Log.hpp"
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Helpers to load enums from JSON (supporting both numbers and strings)
ObstacleShape GetObstacleShape(const json &j, const char *key,
                               ObstacleShape defaultVal) {
  if (!j.contains(key))
    return defaultVal;
  const auto &val = j[key];
  if (val.is_number())
    return static_cast<ObstacleShape>(val.get<int>());
  if (val.is_string()) {
    std::string s = val.get<std::string>();
    if (s == "Cube")
      return ObstacleShape::Cube;
    if (s == "Cylinder")
      return ObstacleShape::Cylinder;
    if (s == "Sphere")
      return ObstacleShape::Sphere;
    if (s == "Pyramid")
      return ObstacleShape::Pyramid;
  }
  return defaultVal;
}

ScoringSelection GetScoringSelection(const json &j, const char *key,
                                     ScoringSelection defaultVal) {
  if (!j.contains(key))
    return defaultVal;
  const auto &val = j[key];
  if (val.is_number())
    return static_cast<ScoringSelection>(val.get<int>());
  if (val.is_string()) {
    std::string s = val.get<std::string>();
    if (s == "first" || s == "FirstN")
      return ScoringSelection::FirstN;
    if (s == "random" || s == "Random")
      return ScoringSelection::Random;
    if (s == "explicit" || s == "Explicit")
      return ScoringSelection::Explicit;
  }
  return defaultVal;
}

PlungerAxis GetPlungerAxis(const json &j, const char *key,
                           PlungerAxis defaultVal) {
  if (!j.contains(key))
    return defaultVal;
  const auto &val = j[key];
  if (val.is_number())
    return static_cast<PlungerAxis>(val.get<int>());
  if (val.is_string()) {
    std::string s = val.get<std::string>();
    if (s == "X")
      return PlungerAxis::X;
    if (s == "Y")
      return PlungerAxis::Y;
    if (s == "Z")
      return PlungerAxis::Z;
  }
  return defaultVal;
}

BallType GetBallType(const json &j, const char *key, BallType defaultVal) {
  if (!j.contains(key))
    return defaultVal;
  const auto &val = j[key];
  if (val.is_number())
    return static_cast<BallType>(val.get<int>());
  if (val.is_string()) {
    std::string s = val.get<std::string>();
    if (s == "SteelBall")
      return BallType::SteelBall;
    if (s == "Pokeball")
      return BallType::Pokeball;
  }
  return defaultVal;
}

void ReadRegion(const json &j, Region &r) {
  r.minX = j.value("minX", r.minX);
  r.maxX = j.value("maxX", r.maxX);
  r.minZ = j.value("minZ", r.minZ);
  r.maxZ = j.value("maxZ", r.maxZ);
  r.y = j.value("y", r.y);
}

void ReadObstacles(const json &o, ObstacleSettings &s) {
  auto &p = s.params;
  p.minDistance = o.value("minDistance", p.minDistance);
  p.density = o.value("density", p.density);
  p.margin = o.value("margin", p.margin);
  p.maxAttempts = o.value("maxAttempts", p.maxAttempts);
  p.maxPoints = o.value("maxPoints", p.maxPoints);
  s.seed = o.value("seed", s.seed);
  s.reseedOnRegenerate = o.value("reseedOnRegenerate", s.reseedOnRegenerate);

  if (o.contains("catalog") && o["catalog"].is_array()) {
    s.catalog.clear();
    for (const auto &k_json : o["catalog"]) {
      ObstacleKind kind{};
      kind.id = k_json.value("id", std::string("kind") +
                                       std::to_string(s.catalog.size()));
      kind.weight = k_json.value("weight", 1.0f);
      kind.maxInstances = k_json.value("maxInstances", 0);
      kind.shape = GetObstacleShape(k_json, "shape", ObstacleShape::Cylinder);
      kind.size = k_json.value("size", 0.5f);
      s.catalog.push_back(kind);
    }
  }
}

void ReadZones(const json &z, ZoneConfig &zc) {
  if (z.contains("track")) {
    ReadRegion(z["track"], zc.track);
  }
  zc.zoneCount = z.value("zoneCount", zc.zoneCount);
  zc.scoringZoneCount = z.value("scoringZoneCount", zc.scoringZoneCount);
  zc.selection = GetScoringSelection(z, "selection", zc.selection);
  if (z.contains("scoringIndices") && z["scoringIndices"].is_array()) {
    zc.scoringIndices = z["scoringIndices"].get<std::vector<int>>();
  }
  zc.seed = z.value("seed", zc.seed);
  zc.zoneHeight = z.value("zoneHeight", zc.zoneHeight);
  zc.zoneThickness = z.value("zoneThickness", zc.zoneThickness);
  zc.runStartupSequence = z.value("runStartupSequence", zc.runStartupSequence);

  if (z.contains("timings")) {
    const auto &t_json = z["timings"];
    auto &t = zc.timings;
    t.marqueeDuration = t_json.value("marqueeDuration", t.marqueeDuration);
    t.marqueeLoops = t_json.value("marqueeLoops", t.marqueeLoops);
    t.flashDuration = t_json.value("flashDuration", t.flashDuration);
    t.flashCount = t_json.value("flashCount", t.flashCount);
    t.confirmFlashDuration =
        t_json.value("confirmFlashDuration", t.confirmFlashDuration);
    t.confirmFlashCount = t_json.value("confirmFlashCount", t.confirmFlashCount);
  }
}

LoadError ApplyPreset(PlayfieldConfig &config, const json &data) {
  config.name = data.value("name", config.name);

  if (data.contains("region")) {
    ReadRegion(data["region"], config.table);
    // The zone strip keeps its Z span but follows the table sideways.
    config.zones.track.minX = config.table.minX;
    config.zones.track.maxX = config.table.maxX;
    config.zones.track.y = config.table.y;
  }
  config.obstacles.params.region = config.table;

  if (data.contains("obstacles")) {
    ReadObstacles(data["obstacles"], config.obstacles);
  }
  if (data.contains("zones")) {
    ReadZones(data["zones"], config.zones);
  }

  if (data.contains("plunger")) {
    const auto &p_json = data["plunger"];
    auto &p = config.plunger;
    p.axis = GetPlungerAxis(p_json, "axis", p.axis);
    p.maxCompression = p_json.value("maxCompression", p.maxCompression);
    p.bounceBackTime = p_json.value("bounceBackTime", p.bounceBackTime);
    p.forceMultiplier = p_json.value("forceMultiplier", p.forceMultiplier);
    p.maxCompressionTime =
        p_json.value("maxCompressionTime", p.maxCompressionTime);
  }

  if (data.contains("spawner")) {
    const auto &s_json = data["spawner"];
    auto &s = config.spawner;
    s.type = GetBallType(s_json, "type", s.type);
    s.spawnX = s_json.value("spawnX", s.spawnX);
    s.spawnY = s_json.value("spawnY", s.spawnY);
    s.spawnZ = s_json.value("spawnZ", s.spawnZ);
    s.killY = s_json.value("killY", s.killY);
  }
  return LoadError::None;
}

} // namespace

PlayfieldConfig MakeDefaultPlayfieldConfig() {
  PlayfieldConfig config{};
  config.table = Region{cfg::kTableMinX, cfg::kTableMaxX, cfg::kTableMinZ,
                        cfg::kTableMaxZ, cfg::kTableTopY};

  auto &obs = config.obstacles;
  obs.params.region = config.table;
  obs.params.minDistance = cfg::kObstacleMinDistance;
  obs.params.density = cfg::kObstacleDensity;
  obs.params.margin = cfg::kObstacleMargin;
  obs.params.maxAttempts = cfg::kObstacleMaxAttempts;
  obs.params.maxPoints = cfg::kObstacleMaxPoints;
  obs.seed = cfg::kObstacleSeed;
  // A single unbounded kind reproduces the one-prefab table.
  obs.catalog.push_back(ObstacleKind{"post", 1.0f, 0, ObstacleShape::Cylinder,
                                     0.5f});

  auto &zones = config.zones;
  zones.track = Region{cfg::kTableMinX, cfg::kTableMaxX, cfg::kZoneTrackMinZ,
                       cfg::kZoneTrackMaxZ, cfg::kTableTopY};
  zones.zoneCount = cfg::kZoneCount;
  zones.scoringZoneCount = cfg::kScoringZoneCount;
  zones.selection = ScoringSelection::FirstN;
  zones.seed = cfg::kZoneSeed;
  zones.zoneHeight = cfg::kZoneHeight;
  zones.zoneThickness = cfg::kZoneThickness;
  zones.timings.marqueeDuration = cfg::kMarqueeDuration;
  zones.timings.marqueeLoops = cfg::kMarqueeLoops;
  zones.timings.flashDuration = cfg::kScoringFlashDuration;
  zones.timings.flashCount = cfg::kScoringFlashCount;
  zones.timings.confirmFlashDuration = cfg::kConfirmFlashDuration;
  zones.timings.confirmFlashCount = cfg::kConfirmFlashCount;

  auto &plunger = config.plunger;
  plunger.axis = PlungerAxis::Z;
  plunger.maxCompression = cfg::kPlungerMaxCompression;
  plunger.bounceBackTime = cfg::kPlungerBounceBackTime;
  plunger.forceMultiplier = cfg::kPlungerForceMultiplier;
  plunger.maxCompressionTime = cfg::kPlungerMaxCompressionTime;

  auto &spawner = config.spawner;
  spawner.type = BallType::SteelBall;
  spawner.spawnX = cfg::kBallSpawnX;
  spawner.spawnY = cfg::kBallSpawnY;
  spawner.spawnZ = cfg::kBallSpawnZ;
  spawner.killY = cfg::kBallKillY;
  return config;
}

LoadError ParsePlayfieldConfig(PlayfieldConfig &config,
                               const std::string &text) {
  config = MakeDefaultPlayfieldConfig();

  try {
    const json data = json::parse(text);
    if (!data.is_object()) {
      LOG_ERROR("Playfield preset must be a JSON object");
      return LoadError::InvalidValue;
    }
    PlayfieldConfig parsed = config;
    const LoadError err = ApplyPreset(parsed, data);
    if (err == LoadError::None) {
      config = parsed;
    }
    return err;
  } catch (const json::parse_error &e) {
    LOG_ERROR("JSON parse error in playfield preset: {}", e.what());
    return LoadError::ParseError;
  } catch (const json::exception &e) {
    LOG_ERROR("Invalid value in playfield preset: {}", e.what());
    return LoadError::InvalidValue;
  }
}

LoadError LoadPlayfieldConfig(PlayfieldConfig &config,
                              const std::string &path) {
  config = MakeDefaultPlayfieldConfig();

  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open playfield preset: {}", path);
    return LoadError::FileNotFound;
  }

  const std::string text((std::istreambuf_iterator<char>(f)),
                         std::istreambuf_iterator<char>());
  const LoadError err = ParsePlayfieldConfig(config, text);
  if (err == LoadError::None) {
    LOG_INFO("Loaded playfield preset '{}' from {}", config.name, path);
  }
  return err;
}

const char *GetLoadErrorLabel(const LoadError error) {
  switch (error) {
  case LoadError::None:
    return "OK";
  case LoadError::FileNotFound:
    return "FILE_NOT_FOUND";
  case LoadError::ParseError:
    return "PARSE_ERROR";
  case LoadError::InvalidValue:
    return "INVALID_VALUE";
  }
  return "UNKNOWN";
}
