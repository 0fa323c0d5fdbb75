#include <cstdio>
#include <string>

#include <raylib.h>

#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "game/Viewer.hpp"
#include "render/FieldRender.hpp"
#include "sim/PlayfieldConfig.hpp"

namespace {
constexpr const char *kDefaultPresetPath = "assets/playfields/default.json";
} // namespace

int main(int argc, char *argv[]) {
  Log::Init();
  CrashHandler::Init();
  LOG_INFO("Pinfield starting...");

  // An explicit preset must load; the bundled one is optional.
  PlayfieldConfig config = MakeDefaultPlayfieldConfig();
  if (argc > 1) {
    const LoadError err = LoadPlayfieldConfig(config, argv[1]);
    if (err != LoadError::None) {
      LOG_ERROR("Cannot start with preset {}: {}", argv[1],
                GetLoadErrorLabel(err));
      Log::Shutdown();
      return 1;
    }
  } else if (FileExists(kDefaultPresetPath)) {
    const LoadError err = LoadPlayfieldConfig(config, kDefaultPresetPath);
    if (err != LoadError::None) {
      LOG_WARN("Bundled preset unusable ({}), using built-in defaults",
               GetLoadErrorLabel(err));
      config = MakeDefaultPlayfieldConfig();
    }
  }

  SetConfigFlags(FLAG_MSAA_4X_HINT);
  InitWindow(cfg::kScreenWidth, cfg::kScreenHeight, "Pinfield");
  SetExitKey(
      0); // Disable raylib's default ESC=quit so we handle ESC ourselves.
  SetTargetFPS(0);

  Viewer viewer{};
  InitViewer(viewer, config);

  while (!WindowShouldClose() && !viewer.wantsExit) {
    ReadInput(viewer);

    float frameTime = GetFrameTime();
    if (frameTime > cfg::kMaxFrameTime) {
      frameTime = cfg::kMaxFrameTime;
    }

    viewer.accumulator += frameTime;
    int simSteps = 0;
    while (viewer.accumulator >= cfg::kFixedDt &&
           simSteps < cfg::kMaxSimStepsPerFrame) {
      StepViewer(viewer, cfg::kFixedDt);
      viewer.accumulator -= cfg::kFixedDt;
      ++simSteps;
    }
    if (simSteps == cfg::kMaxSimStepsPerFrame) {
      viewer.accumulator = 0.0f;
    }

    const float alpha = viewer.accumulator / cfg::kFixedDt;
    RenderFrame(viewer, alpha);
  }

  LOG_INFO("Pinfield shutting down...");
  CloseWindow();
  Log::Shutdown();
  return 0;
}
