#pragma once

// Axis-aligned rectangle on the horizontal X/Z plane. Everything generated
// inside it sits at height y.
struct Region {
  float minX = 0.0f;
  float maxX = 0.0f;
  float minZ = 0.0f;
  float maxZ = 0.0f;
  float y = 0.0f;

  float Width() const { return maxX - minX; }  // X extent
  float Depth() const { return maxZ - minZ; }  // Z extent
  float CenterX() const { return (minX + maxX) * 0.5f; }
  float CenterZ() const { return (minZ + maxZ) * 0.5f; }
  bool IsDegenerate() const { return Width() <= 0.0f || Depth() <= 0.0f; }

  // Inclusive containment test on X/Z.
  bool Contains(const float x, const float z) const {
    return x >= minX && x <= maxX && z >= minZ && z <= maxZ;
  }

  // Shrinks by margin on both horizontal axes. The result may be degenerate.
  Region Shrunk(const float margin) const {
    return Region{minX + margin, maxX - margin, minZ + margin, maxZ - margin,
                  y};
  }
};
