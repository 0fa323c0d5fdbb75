#include "sim/ObstacleField.hpp"

#include "core/Log.hpp"
#include "core/Rng.hpp"

#include <climits>
#include <cmath>

namespace {
constexpr float kTwoPi = 6.28318530718f;
constexpr float kPi = 3.14159265359f;

bool TooClose(const std::vector<PlacementPoint> &accepted, const float x,
              const float z, const float minDistSq) {
  for (const auto &p : accepted) {
    const float dx = p.x - x;
    const float dz = p.z - z;
    if (dx * dx + dz * dz < minDistSq) {
      return true;
    }
  }
  return false;
}

int EstimateTargetCount(const Region &area, const float minDistance,
                        const float density) {
  const double radius = static_cast<double>(minDistance) * 0.5;
  const double footprint = kPi * radius * radius;
  const double estimate = static_cast<double>(area.Width()) *
                          static_cast<double>(area.Depth()) / footprint *
                          static_cast<double>(density);
  if (!(estimate < static_cast<double>(INT_MAX))) {
    return INT_MAX;
  }
  return static_cast<int>(std::lround(estimate));
}

// Active-set dart throwing. Every accepted point stays in `accepted` for the
// distance checks; `active` only holds points that may still grow neighbours.
std::vector<PlacementPoint> SamplePoints(const Region &area,
                                         const ObstacleFieldParams &params,
                                         uint32_t &rng, bool &hitCap) {
  std::vector<PlacementPoint> accepted;
  std::vector<PlacementPoint> active;
  const float minDist = params.minDistance;
  const float minDistSq = minDist * minDist;

  PlacementPoint first{};
  first.x = core::NextRange(rng, area.minX, area.maxX);
  first.y = area.y;
  first.z = core::NextRange(rng, area.minZ, area.maxZ);
  accepted.push_back(first);
  active.push_back(first);

  hitCap = false;
  while (!active.empty()) {
    if (static_cast<int>(accepted.size()) >= params.maxPoints) {
      hitCap = true;
      break;
    }

    const int activeIndex =
        core::NextIndex(rng, static_cast<int>(active.size()));
    const PlacementPoint origin = active[activeIndex];
    bool found = false;

    for (int attempt = 0; attempt < params.maxAttempts; ++attempt) {
      const float angle = core::NextRange(rng, 0.0f, kTwoPi);
      const float radius = core::NextRange(rng, minDist, 2.0f * minDist);

      PlacementPoint candidate{};
      candidate.x = origin.x + std::cos(angle) * radius;
      candidate.y = area.y;
      candidate.z = origin.z + std::sin(angle) * radius;

      if (!area.Contains(candidate.x, candidate.z)) {
        continue;
      }
      if (TooClose(accepted, candidate.x, candidate.z, minDistSq)) {
        continue;
      }

      accepted.push_back(candidate);
      active.push_back(candidate);
      found = true;
      break;
    }

    if (!found) {
      // Retired for good; it still blocks its neighbourhood through `accepted`.
      active.erase(active.begin() + activeIndex);
    }
  }

  return accepted;
}
} // namespace

FieldError ValidateObstacleField(const ObstacleFieldParams &params,
                                 const std::vector<ObstacleKind> &catalog) {
  if (catalog.empty()) {
    return FieldError::EmptyCatalog;
  }
  bool anyPositive = false;
  for (const auto &kind : catalog) {
    if (kind.weight < 0.0f) {
      return FieldError::NegativeWeight;
    }
    if (kind.weight > 0.0f) {
      anyPositive = true;
    }
  }
  if (!anyPositive) {
    return FieldError::NoPositiveWeight;
  }
  if (!(params.minDistance > 0.0f)) {
    return FieldError::InvalidSpacing;
  }
  if (!(params.density >= 0.0f)) {
    return FieldError::InvalidDensity;
  }
  if (params.maxPoints < 1 || params.maxPoints > kMaxObstaclePoints ||
      params.maxAttempts < 1) {
    return FieldError::InvalidLimits;
  }
  if (params.region.Shrunk(params.margin).IsDegenerate()) {
    return FieldError::DegenerateRegion;
  }
  return FieldError::None;
}

int PickObstacleKind(const std::vector<ObstacleKind> &catalog,
                     const std::vector<int> &counts, uint32_t &rngState) {
  auto eligible = [&](const size_t i) {
    const int cap = catalog[i].maxInstances;
    return cap <= 0 || counts[i] < cap;
  };

  float totalWeight = 0.0f;
  int firstEligible = -1;
  for (size_t i = 0; i < catalog.size(); ++i) {
    if (!eligible(i)) {
      continue;
    }
    if (firstEligible < 0) {
      firstEligible = static_cast<int>(i);
    }
    totalWeight += catalog[i].weight;
  }

  if (firstEligible < 0) {
    return -1;
  }
  if (totalWeight <= 0.0f) {
    return firstEligible;
  }

  const float draw = core::NextUnit(rngState) * totalWeight;
  float cumulative = 0.0f;
  int lastPositive = firstEligible;
  for (size_t i = 0; i < catalog.size(); ++i) {
    if (!eligible(i) || catalog[i].weight <= 0.0f) {
      continue;
    }
    cumulative += catalog[i].weight;
    lastPositive = static_cast<int>(i);
    if (draw < cumulative) {
      return lastPositive;
    }
  }
  // Float rounding can leave draw == totalWeight; the last candidate takes it.
  return lastPositive;
}

ObstacleFieldResult
GenerateObstacleField(const ObstacleFieldParams &params,
                      const std::vector<ObstacleKind> &catalog,
                      const uint32_t seed) {
  ObstacleFieldResult result{};
  result.error = ValidateObstacleField(params, catalog);
  if (!result.Ok()) {
    LOG_ERROR("Obstacle field rejected: {}", GetFieldErrorLabel(result.error));
    return result;
  }

  const Region area = params.region.Shrunk(params.margin);
  result.targetCount =
      EstimateTargetCount(area, params.minDistance, params.density);

  uint32_t rng = core::NormalizeSeed(seed);
  const std::vector<PlacementPoint> sampled =
      SamplePoints(area, params, rng, result.hitPointCap);
  result.sampledCount = static_cast<int>(sampled.size());
  if (result.hitPointCap) {
    LOG_DEBUG("Obstacle sampler stopped at the {}-point cap", params.maxPoints);
  }

  result.kindCounts.assign(catalog.size(), 0);
  result.points.reserve(sampled.size());
  for (const auto &p : sampled) {
    const int kind = PickObstacleKind(catalog, result.kindCounts, rng);
    if (kind < 0) {
      ++result.droppedCount;
      continue;
    }
    ++result.kindCounts[kind];
    PlacementPoint placed = p;
    placed.kindIndex = kind;
    result.points.push_back(placed);
  }

  LOG_INFO("Generated {} obstacles (sampled {}, dropped {}, target {}) seed={}",
           result.points.size(), result.sampledCount, result.droppedCount,
           result.targetCount, seed);
  return result;
}

float MinPairDistance(const std::vector<PlacementPoint> &points) {
  if (points.size() < 2) {
    return 0.0f;
  }
  float best = -1.0f;
  for (size_t i = 0; i < points.size(); ++i) {
    for (size_t j = i + 1; j < points.size(); ++j) {
      const float dx = points[i].x - points[j].x;
      const float dz = points[i].z - points[j].z;
      const float d = std::sqrt(dx * dx + dz * dz);
      if (best < 0.0f || d < best) {
        best = d;
      }
    }
  }
  return best;
}

const char *GetFieldErrorLabel(const FieldError error) {
  switch (error) {
  case FieldError::None:
    return "OK";
  case FieldError::EmptyCatalog:
    return "EMPTY_CATALOG";
  case FieldError::NoPositiveWeight:
    return "NO_POSITIVE_WEIGHT";
  case FieldError::NegativeWeight:
    return "NEGATIVE_WEIGHT";
  case FieldError::DegenerateRegion:
    return "DEGENERATE_REGION";
  case FieldError::InvalidSpacing:
    return "INVALID_SPACING";
  case FieldError::InvalidDensity:
    return "INVALID_DENSITY";
  case FieldError::InvalidLimits:
    return "INVALID_LIMITS";
  }
  return "UNKNOWN";
}

const char *GetObstacleShapeLabel(const ObstacleShape shape) {
  switch (shape) {
  case ObstacleShape::Cube:
    return "Cube";
  case ObstacleShape::Cylinder:
    return "Cylinder";
  case ObstacleShape::Sphere:
    return "Sphere";
  case ObstacleShape::Pyramid:
    return "Pyramid";
  }
  return "";
}
