#pragma once

// Compressible launcher. Holding the plunger squashes it along one axis with
// an ease-out cubic; releasing it springs back to rest over bounceBackTime.
// A ball touching it while it springs back receives an impulse proportional
// to the remaining compression.

enum class PlungerAxis : int { X = 0, Y = 1, Z = 2 };

enum class PlungerState : int {
  Rest = 0,
  Compressing,
  BouncingBack,
};

struct PlungerConfig {
  PlungerAxis axis = PlungerAxis::Z;
  float maxCompression = 0.6f;      // fraction of the rest length, [0, 1]
  float bounceBackTime = 0.3f;      // seconds
  float forceMultiplier = 100.0f;   // impulse per unit of compression
  float maxCompressionTime = 5.0f;  // hold time to reach maxCompression
};

struct PlungerImpulse {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
  float magnitude = 0.0f;
};

struct Plunger {
  PlungerConfig config{};
  PlungerState state = PlungerState::Rest;
  float compression = 0.0f;    // current squash, 0..maxCompression
  float heldTime = 0.0f;       // time since Press()
  float bounceElapsed = 0.0f;  // time since Release()
  float bounceStart = 0.0f;    // compression when released

  void Configure(const PlungerConfig &newConfig);

  // Input edges. Press restarts compression even mid bounce-back; Release
  // only acts while compressing.
  void Press();
  void Release();

  void Update(float dt);
  void Reset();

  // Scale factors to apply to the plunger's rest scale.
  float ScaleX() const;
  float ScaleY() const;
  float ScaleZ() const;

  // Compression as a fraction of maxCompression.
  float Progress() const;

  // Impulse for a ball in contact this frame. Zero unless bouncing back.
  PlungerImpulse ContactImpulse() const;
};

// 1 - (1 - t)^3 with t clamped to [0, 1].
float EaseOutCubic(float t);

const char *GetPlungerStateLabel(PlungerState state);
