#include "sim/Plunger.hpp"

#include "core/Log.hpp"

namespace {
float Clamp01(const float value) {
  if (value < 0.0f) {
    return 0.0f;
  }
  if (value > 1.0f) {
    return 1.0f;
  }
  return value;
}

float Lerp(const float a, const float b, const float t) {
  return a + (b - a) * t;
}
} // namespace

float EaseOutCubic(const float t) {
  const float k = 1.0f - Clamp01(t);
  return 1.0f - k * k * k;
}

void Plunger::Configure(const PlungerConfig &newConfig) {
  config = newConfig;
  config.maxCompression = Clamp01(newConfig.maxCompression);
  Reset();
}

void Plunger::Press() {
  if (state == PlungerState::BouncingBack) {
    LOG_DEBUG("Plunger pressed mid bounce-back at compression {:.3f}",
              compression);
  }
  state = PlungerState::Compressing;
  heldTime = 0.0f;
}

void Plunger::Release() {
  if (state != PlungerState::Compressing) {
    return;
  }
  state = PlungerState::BouncingBack;
  bounceElapsed = 0.0f;
  bounceStart = compression;
  LOG_DEBUG("Plunger released at compression {:.3f}", compression);
}

void Plunger::Update(const float dt) {
  switch (state) {
  case PlungerState::Rest:
    break;
  case PlungerState::Compressing: {
    heldTime += dt;
    const float t = (config.maxCompressionTime > 0.0f)
                        ? heldTime / config.maxCompressionTime
                        : 1.0f;
    compression = Lerp(0.0f, config.maxCompression, EaseOutCubic(t));
    break;
  }
  case PlungerState::BouncingBack: {
    bounceElapsed += dt;
    if (bounceElapsed >= config.bounceBackTime) {
      compression = 0.0f;
      state = PlungerState::Rest;
      break;
    }
    const float t = bounceElapsed / config.bounceBackTime;
    compression = Lerp(bounceStart, 0.0f, EaseOutCubic(t));
    break;
  }
  }
}

void Plunger::Reset() {
  state = PlungerState::Rest;
  compression = 0.0f;
  heldTime = 0.0f;
  bounceElapsed = 0.0f;
  bounceStart = 0.0f;
}

float Plunger::ScaleX() const {
  return (config.axis == PlungerAxis::X) ? 1.0f - compression : 1.0f;
}

float Plunger::ScaleY() const {
  return (config.axis == PlungerAxis::Y) ? 1.0f - compression : 1.0f;
}

float Plunger::ScaleZ() const {
  return (config.axis == PlungerAxis::Z) ? 1.0f - compression : 1.0f;
}

float Plunger::Progress() const {
  if (config.maxCompression <= 0.0f) {
    return 0.0f;
  }
  return compression / config.maxCompression;
}

PlungerImpulse Plunger::ContactImpulse() const {
  PlungerImpulse impulse{};
  if (state != PlungerState::BouncingBack) {
    return impulse;
  }
  impulse.magnitude = compression * config.forceMultiplier;
  switch (config.axis) {
  case PlungerAxis::X:
    impulse.x = impulse.magnitude;
    break;
  case PlungerAxis::Y:
    impulse.y = impulse.magnitude;
    break;
  case PlungerAxis::Z:
    impulse.z = impulse.magnitude;
    break;
  }
  return impulse;
}

const char *GetPlungerStateLabel(const PlungerState state) {
  switch (state) {
  case PlungerState::Rest:
    return "REST";
  case PlungerState::Compressing:
    return "COMPRESSING";
  case PlungerState::BouncingBack:
    return "BOUNCING_BACK";
  }
  return "";
}
