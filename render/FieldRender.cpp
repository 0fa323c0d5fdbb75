#include "render/FieldRender.hpp"

#include <cstdio>

#include <raylib.h>

#include "core/Config.hpp"
#include "game/Viewer.hpp"

namespace {

// --- Colours ---

constexpr Color kBackground{10, 12, 24, 255};
constexpr Color kTableTop{22, 32, 72, 255};
constexpr Color kTableWire{60, 130, 255, 255};
constexpr Color kZoneWire{80, 200, 255, 255};
constexpr Color kScoringWire{255, 200, 40, 255};
constexpr Color kLockedWire{70, 70, 90, 255};
constexpr Color kLightOff{40, 40, 56, 255};
constexpr Color kLightOn{150, 230, 255, 255};
constexpr Color kScoringOn{255, 220, 80, 255};
constexpr Color kPlungerRest{200, 200, 210, 255};
constexpr Color kPlungerLoaded{255, 96, 64, 255};
constexpr Color kHudText{240, 248, 255, 255};
constexpr Color kHudAccent{252, 96, 255, 255};
constexpr Color kHudPanel{10, 12, 24, 170};

constexpr Color kKindColors[] = {
    Color{255, 140, 40, 255},
    Color{40, 230, 255, 255},
    Color{255, 80, 220, 255},
    Color{120, 255, 120, 255},
};
constexpr int kKindColorCount = sizeof(kKindColors) / sizeof(kKindColors[0]);

// --- Utility ---

float Clamp01(const float value) {
    if (value < 0.0f) return 0.0f;
    if (value > 1.0f) return 1.0f;
    return value;
}

Vector3 LerpVec3(const Vector3& a, const Vector3& b, const float t) {
    const float k = Clamp01(t);
    return Vector3{a.x + (b.x - a.x) * k, a.y + (b.y - a.y) * k, a.z + (b.z - a.z) * k};
}

Color LerpColor(const Color& a, const Color& b, const float t) {
    const float k = Clamp01(t);
    return Color{
        static_cast<unsigned char>(a.r + (b.r - a.r) * k),
        static_cast<unsigned char>(a.g + (b.g - a.g) * k),
        static_cast<unsigned char>(a.b + (b.b - a.b) * k),
        255};
}

// --- Scene ---

void DrawTable(const Region& table) {
    const Vector3 center{table.CenterX(), table.y - 0.05f, table.CenterZ()};
    const Vector3 size{table.Width(), 0.1f, table.Depth()};
    DrawCubeV(center, size, kTableTop);
    DrawCubeWiresV(center, size, kTableWire);

    // Rails along the long sides and the top end.
    const float railH = 0.3f;
    const float railY = table.y + railH * 0.5f;
    DrawCubeV(Vector3{table.minX, railY, table.CenterZ()}, Vector3{0.1f, railH, table.Depth()}, kTableWire);
    DrawCubeV(Vector3{table.maxX, railY, table.CenterZ()}, Vector3{0.1f, railH, table.Depth()}, kTableWire);
    DrawCubeV(Vector3{table.CenterX(), railY, table.minZ}, Vector3{table.Width(), railH, 0.1f}, kTableWire);
}

void DrawObstacles(const Playfield& pf) {
    const auto& catalog = pf.config.obstacles.catalog;
    for (const auto& p : pf.obstacles.points) {
        if (p.kindIndex < 0 || p.kindIndex >= static_cast<int>(catalog.size())) continue;
        const ObstacleKind& kind = catalog[p.kindIndex];
        const Color col = kKindColors[p.kindIndex % kKindColorCount];
        const float s = kind.size;
        const float r = s * 0.5f;

        switch (kind.shape) {
            case ObstacleShape::Cube: {
                const Vector3 c{p.x, p.y + r, p.z};
                DrawCubeV(c, Vector3{s, s, s}, Fade(col, 0.6f));
                DrawCubeWiresV(c, Vector3{s, s, s}, col);
                break;
            }
            case ObstacleShape::Cylinder:
                DrawCylinder(Vector3{p.x, p.y, p.z}, r, r, s, 12, Fade(col, 0.6f));
                DrawCylinderWires(Vector3{p.x, p.y, p.z}, r, r, s, 12, col);
                break;
            case ObstacleShape::Sphere:
                DrawSphere(Vector3{p.x, p.y + r, p.z}, r, col);
                break;
            case ObstacleShape::Pyramid:
                // Four-sided cone.
                DrawCylinder(Vector3{p.x, p.y, p.z}, 0.0f, r, s, 4, Fade(col, 0.6f));
                DrawCylinderWires(Vector3{p.x, p.y, p.z}, 0.0f, r, s, 4, col);
                break;
        }
    }
}

void DrawZones(const Viewer& viewer) {
    const Playfield& pf = viewer.field;
    const ZoneSequencer& seq = pf.sequencer;
    const auto& zones = seq.Zones();
    const ZoneConfig& zc = seq.Config();

    for (const auto& zone : zones) {
        const ZoneVolume& v = zone.volume;
        const Vector3 center{v.centerX, v.centerY, v.centerZ};
        const Vector3 size{v.sizeX, v.sizeY, v.sizeZ};

        // Divider wall at the near edge of every zone.
        DrawCubeV(Vector3{v.centerX, zc.track.y + zc.zoneHeight * 0.25f, zone.spanStart},
                  Vector3{v.sizeX, zc.zoneHeight * 0.5f, zc.zoneThickness}, Fade(kTableWire, 0.5f));

        if (viewer.showVolumes) {
            Color wire = zone.isScoring ? kScoringWire : kZoneWire;
            if (zone.locked) wire = kLockedWire;
            DrawCubeWiresV(center, size, wire);
            if (zone.index == seq.ClaimedZone()) {
                DrawCubeV(center, size, Fade(wire, 0.15f));
            }
        }

        const bool on = seq.IsLightOn(zone.index);
        const Color lit = zone.isScoring ? kScoringOn : kLightOn;
        const Vector3 light{zone.lightX, zone.lightY, zone.lightZ};
        DrawSphere(light, cfg::kLightMarkerRadius, on ? lit : kLightOff);
        if (on) {
            DrawSphereWires(light, cfg::kLightMarkerRadius * 1.8f, 6, 8, Fade(lit, 0.35f));
        }
    }
}

void DrawPlunger(const Viewer& viewer) {
    const Playfield& pf = viewer.field;
    const auto& spawner = pf.config.spawner;
    const float faceZ = GetPlungerFaceZ(viewer);
    const float length = cfg::kPlungerLength * pf.plunger.ScaleZ();
    const Vector3 center{spawner.spawnX, pf.config.table.y + cfg::kBallRadius, faceZ + length * 0.5f};
    const Vector3 size{0.4f, 0.4f, length};
    const Color col = LerpColor(kPlungerRest, kPlungerLoaded, pf.plunger.Progress());
    DrawCubeV(center, size, col);
    DrawCubeWiresV(center, size, kTableWire);
}

void DrawBall(const Viewer& viewer, const float alpha) {
    const BallSpawner& spawner = viewer.field.spawner;
    if (!spawner.HasBall() || spawner.Current().id != viewer.trackedBallId) return;
    const Vector3 pos = LerpVec3(viewer.previousBall.position, viewer.ball.position, alpha);
    switch (spawner.Current().type) {
        case BallType::SteelBall:
            DrawSphere(pos, cfg::kBallRadius, LIGHTGRAY);
            break;
        case BallType::Pokeball:
            DrawSphere(pos, cfg::kBallRadius, RED);
            DrawSphereWires(pos, cfg::kBallRadius * 1.01f, 4, 8, RAYWHITE);
            break;
    }
}

// --- HUD ---

void DrawHud(const Viewer& viewer) {
    const Playfield& pf = viewer.field;
    const ZoneSequencer& seq = pf.sequencer;
    char line[160];
    int y = 12;
    const int x = 16;
    const int lineH = 22;

    DrawRectangle(8, 6, 360, 10 * lineH + 8, kHudPanel);

    std::snprintf(line, sizeof(line), "PRESET  %s", viewer.presetName.c_str());
    DrawText(line, x, y, 20, kHudAccent);
    y += lineH;

    std::snprintf(line, sizeof(line), "OBSTACLES  %d  (dropped %d)",
                  static_cast<int>(pf.obstacles.points.size()), pf.obstacles.droppedCount);
    DrawText(line, x, y, 18, kHudText);
    y += lineH;

    std::snprintf(line, sizeof(line), "ZONES  %d  scoring %d  gen %u",
                  static_cast<int>(seq.Zones().size()), seq.ScoringZoneCount(), seq.Generation());
    DrawText(line, x, y, 18, kHudText);
    y += lineH;

    std::snprintf(line, sizeof(line), "LIGHTS  %s  %.1fs  lit %d",
                  GetSequencerPhaseLabel(seq.Phase()), seq.PhaseElapsed(), seq.LitCount());
    DrawText(line, x, y, 18, kHudText);
    y += lineH;

    if (seq.IsClaimed()) {
        std::snprintf(line, sizeof(line), "CLAIMED  zone %d%s", seq.ClaimedZone() + 1,
                      seq.IsConfirmFlashing() ? "  (flashing)" : "");
    } else {
        std::snprintf(line, sizeof(line), "CLAIMED  -");
    }
    DrawText(line, x, y, 18, kHudText);
    y += lineH;

    std::snprintf(line, sizeof(line), "SCORE  %d", pf.score);
    DrawText(line, x, y, 20, kScoringOn);
    y += lineH;

    std::snprintf(line, sizeof(line), "PLUNGER  %s", GetPlungerStateLabel(pf.plunger.state));
    DrawText(line, x, y, 18, kHudText);
    DrawRectangle(x + 220, y + 4, 120, 10, kLightOff);
    DrawRectangle(x + 220, y + 4, static_cast<int>(120.0f * pf.plunger.Progress()), 10, kPlungerLoaded);
    y += lineH;

    if (pf.spawner.HasBall()) {
        std::snprintf(line, sizeof(line), "BALL  %s #%u", GetBallTypeLabel(pf.spawner.Current().type),
                      pf.spawner.Current().id);
    } else {
        std::snprintf(line, sizeof(line), "BALL  -  (%d spawned)", pf.spawner.spawnCount);
    }
    DrawText(line, x, y, 18, kHudText);
    y += lineH;

    DrawText("T zones  G obstacles  R ball  SPACE plunger", x, y, 16, Fade(kHudText, 0.7f));
    y += lineH;
    DrawText("1-9 enter zone  F3 volumes  ESC quit", x, y, 16, Fade(kHudText, 0.7f));

    DrawFPS(cfg::kScreenWidth - 96, 10);
}

}  // namespace

void RenderFrame(const Viewer& viewer, const float alpha) {
    BeginDrawing();
    ClearBackground(kBackground);

    BeginMode3D(viewer.camera);
    DrawTable(viewer.field.config.table);
    DrawObstacles(viewer.field);
    DrawZones(viewer);
    DrawPlunger(viewer);
    DrawBall(viewer, alpha);
    EndMode3D();

    DrawHud(viewer);
    EndDrawing();
}
