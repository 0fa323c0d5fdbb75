#pragma once

#include "sim/Region.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Ceiling for ObstacleFieldParams::maxPoints. Presets may lower it, never raise it.
constexpr int kMaxObstaclePoints = 1000;

// Presentation hint for the instantiation layer. The sampler never looks at it.
enum class ObstacleShape : int {
  Cube = 0,
  Cylinder = 1,
  Sphere = 2,
  Pyramid = 3,
};

struct ObstacleKind {
  std::string id;
  float weight = 1.0f;     // relative selection weight, >= 0
  int maxInstances = 0;    // 0 = unbounded
  ObstacleShape shape = ObstacleShape::Cylinder;
  float size = 0.5f;       // footprint diameter in world units
};

struct ObstacleFieldParams {
  Region region{};
  float minDistance = 1.0f;
  float density = 0.3f;    // fraction of the packing estimate to aim for
  float margin = 1.0f;     // kept clear along every edge of the region
  int maxAttempts = 30;    // candidates tried around an active point
  int maxPoints = kMaxObstaclePoints;  // cap on accepted points, 1..1000
};

struct PlacementPoint {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
  int kindIndex = -1;      // index into the catalog used for generation
};

enum class FieldError : int {
  None = 0,
  EmptyCatalog,
  NoPositiveWeight,
  NegativeWeight,
  DegenerateRegion,
  InvalidSpacing,
  InvalidDensity,
  InvalidLimits,
};

struct ObstacleFieldResult {
  FieldError error = FieldError::None;
  std::vector<PlacementPoint> points;
  std::vector<int> kindCounts;  // per catalog entry, parallel to the catalog
  int targetCount = 0;          // packing estimate scaled by density
  int sampledCount = 0;         // points accepted by the sampler
  int droppedCount = 0;         // sampled points no kind could take
  bool hitPointCap = false;

  bool Ok() const { return error == FieldError::None; }
};

// Checks the catalog and parameters without generating anything.
FieldError ValidateObstacleField(const ObstacleFieldParams &params,
                                 const std::vector<ObstacleKind> &catalog);

// Dart-throwing Poisson-disk scatter over the margin-reduced region followed
// by weighted kind assignment. Deterministic for identical inputs.
ObstacleFieldResult
GenerateObstacleField(const ObstacleFieldParams &params,
                      const std::vector<ObstacleKind> &catalog, uint32_t seed);

// Weighted pick over the kinds whose quota isn't used up yet. Returns -1 when
// every kind is at its cap. Exposed for tests.
int PickObstacleKind(const std::vector<ObstacleKind> &catalog,
                     const std::vector<int> &counts, uint32_t &rngState);

// Smallest pairwise X/Z distance, or 0 with fewer than two points.
float MinPairDistance(const std::vector<PlacementPoint> &points);

const char *GetFieldErrorLabel(FieldError error);
const char *GetObstacleShapeLabel(ObstacleShape shape);
