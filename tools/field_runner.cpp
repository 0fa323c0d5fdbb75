// field_runner: headless playfield driver
//
// Builds a playfield from the defaults or a JSON preset, runs the lighting
// protocol on a fixed tick, optionally feeds zone entries and regenerations,
// then prints obstacle metrics and a light timeline summary.
//
// Usage:
//   field_runner [options]
//     --config <file>               JSON playfield preset
//     --seed <hex|dec>              Obstacle seed (overrides preset)
//     --zones <n>                   Zone count (overrides preset)
//     --scoring <n>                 Scoring zone count (overrides preset)
//     --selection first|random      Scoring zone selection (overrides preset)
//     --enter <k>                   Enter zone k (1-based)
//     --enter-at <s>                Time of the entry (default: 4.0)
//     --regen-at <s>                Regenerate zones at this time
//     --duration <s>                Simulated seconds (default: 8.0)
//     --trace                       Print every light change
//     --json                        Output as JSON instead of plain text
//     --quiet                       Only output final summary line
//     -h, --help                    Print usage

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "game/Playfield.hpp"
#include "game/RunReport.hpp"
#include "sim/PlayfieldConfig.hpp"

namespace {

struct RunnerArgs {
    std::string configPath;
    bool overrideSeed = false;
    uint32_t seed = 0u;
    int zoneCount = -1;             // -1 = keep preset
    int scoringCount = -1;
    int selection = -1;             // -1 = keep preset
    int enterZone = 0;              // 1-based, 0 = no entry
    float enterAt = 4.0f;
    float regenAt = -1.0f;          // < 0 = never
    float duration = 8.0f;
    bool trace = false;
    bool json = false;
    bool quiet = false;
    bool help = false;
    bool badArgs = false;
};

struct LightChange {
    float time = 0.0f;
    int zone = 0;
    bool on = false;
};

struct Timeline {
    std::vector<LightChange> changes;
    int maxLitInMarquee = 0;        // must never exceed 1
    float steadyOnAt = -1.0f;       // first time SteadyOn was reached
};

uint32_t ParseSeed(const char* str) {
    // Accept 0x prefix for hex, otherwise decimal.
    return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            args.configPath = argv[++i];
        } else if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            args.seed = ParseSeed(argv[++i]);
            args.overrideSeed = true;
        } else if ((std::strcmp(argv[i], "--zones") == 0) && i + 1 < argc) {
            args.zoneCount = std::atoi(argv[++i]);
        } else if ((std::strcmp(argv[i], "--scoring") == 0) && i + 1 < argc) {
            args.scoringCount = std::atoi(argv[++i]);
        } else if ((std::strcmp(argv[i], "--selection") == 0) && i + 1 < argc) {
            const char* value = argv[++i];
            if (std::strcmp(value, "first") == 0) {
                args.selection = static_cast<int>(ScoringSelection::FirstN);
            } else if (std::strcmp(value, "random") == 0) {
                args.selection = static_cast<int>(ScoringSelection::Random);
            } else {
                std::fprintf(stderr, "unknown selection '%s'\n", value);
                args.badArgs = true;
            }
        } else if ((std::strcmp(argv[i], "--enter") == 0) && i + 1 < argc) {
            args.enterZone = std::atoi(argv[++i]);
        } else if ((std::strcmp(argv[i], "--enter-at") == 0) && i + 1 < argc) {
            args.enterAt = static_cast<float>(std::atof(argv[++i]));
        } else if ((std::strcmp(argv[i], "--regen-at") == 0) && i + 1 < argc) {
            args.regenAt = static_cast<float>(std::atof(argv[++i]));
        } else if ((std::strcmp(argv[i], "--duration") == 0) && i + 1 < argc) {
            args.duration = static_cast<float>(std::atof(argv[++i]));
        } else if (std::strcmp(argv[i], "--trace") == 0) {
            args.trace = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        } else {
            std::fprintf(stderr, "unknown argument '%s'\n", argv[i]);
            args.badArgs = true;
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "field_runner: headless playfield driver\n"
        "\n"
        "Usage: field_runner [options]\n"
        "  --config <file>               JSON playfield preset\n"
        "  --seed <hex|dec>              Obstacle seed\n"
        "  --zones <n>                   Zone count\n"
        "  --scoring <n>                 Scoring zone count\n"
        "  --selection first|random      Scoring zone selection\n"
        "  --enter <k>                   Enter zone k (1-based)\n"
        "  --enter-at <s>                Time of the entry (default: 4.0)\n"
        "  --regen-at <s>                Regenerate zones at this time\n"
        "  --duration <s>                Simulated seconds (default: 8.0)\n"
        "  --trace                       Print every light change\n"
        "  --json                        Output as JSON\n"
        "  --quiet                       Only final summary line\n"
        "  -h, --help                    This message\n"
    );
}

void ApplyOverrides(const RunnerArgs& args, PlayfieldConfig& config) {
    if (args.overrideSeed) {
        config.obstacles.seed = args.seed;
    }
    if (args.zoneCount >= 0) {
        config.zones.zoneCount = args.zoneCount;
    }
    if (args.scoringCount >= 0) {
        config.zones.scoringZoneCount = args.scoringCount;
    }
    if (args.selection >= 0) {
        config.zones.selection = static_cast<ScoringSelection>(args.selection);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        return 0;
    }
    if (args.badArgs) {
        PrintUsage();
        return 1;
    }

    // The console sink shares stdout with the report.
    spdlog::level::level_enum level = spdlog::level::info;
    if (args.json) {
        level = spdlog::level::off;
    } else if (args.quiet) {
        level = spdlog::level::warn;
    }
    Log::Init(true, level);

    // --- Config ---
    PlayfieldConfig config = MakeDefaultPlayfieldConfig();
    if (!args.configPath.empty()) {
        const LoadError err = LoadPlayfieldConfig(config, args.configPath);
        if (err != LoadError::None) {
            std::fprintf(stderr, "config error: %s (%s)\n", GetLoadErrorLabel(err),
                         args.configPath.c_str());
            return 1;
        }
    }
    ApplyOverrides(args, config);

    // --- Init playfield ---
    Playfield pf{};
    Timeline timeline{};
    pf.sequencer.SetLightSink([&](int zone, bool on) {
        timeline.changes.push_back(LightChange{pf.scheduler.Now(), zone, on});
        if (args.trace && !args.json) {
            std::printf("[%8.4f] light %d %s\n", pf.scheduler.Now(), zone + 1,
                        on ? "ON" : "off");
        }
    });

    if (!InitPlayfield(pf, config)) {
        std::fprintf(stderr, "config error: obstacles=%s zones=%s\n",
                     GetFieldErrorLabel(pf.obstacles.error),
                     GetSequencerErrorLabel(pf.sequencer.LastError()));
        return 1;
    }

    // --- Run ---
    using Clock = std::chrono::steady_clock;
    const auto wallStart = Clock::now();

    const int maxTicks = static_cast<int>(args.duration / cfg::kFixedDt + 0.5f);
    bool entered = false;
    bool regenerated = false;
    int ticksRun = 0;

    for (int t = 0; t < maxTicks; ++t) {
        const float now = pf.scheduler.Now();
        if (args.regenAt >= 0.0f && !regenerated && now >= args.regenAt) {
            PushInput(pf, InputEvent{InputAction::RegenerateZones, -1, 0.0f});
            regenerated = true;
        }
        if (args.enterZone > 0 && !entered && now >= args.enterAt) {
            PushInput(pf, InputEvent{InputAction::ZoneEntered, args.enterZone - 1, 0.0f});
            entered = true;
        }

        StepPlayfield(pf, cfg::kFixedDt);
        ++ticksRun;

        if (pf.sequencer.Phase() == SequencerPhase::Marquee &&
            pf.sequencer.LitCount() > timeline.maxLitInMarquee) {
            timeline.maxLitInMarquee = pf.sequencer.LitCount();
        }
        if (timeline.steadyOnAt < 0.0f && pf.sequencer.Phase() == SequencerPhase::SteadyOn) {
            timeline.steadyOnAt = pf.scheduler.Now();
        }
    }

    const auto wallEnd = Clock::now();
    const float wallMs = std::chrono::duration<float, std::milli>(wallEnd - wallStart).count();

    // --- Metrics ---
    const auto& obstacles = pf.obstacles;
    const float minPair = MinPairDistance(obstacles.points);
    const auto& catalog = pf.config.obstacles.catalog;
    const auto& zones = pf.sequencer.Zones();
    const char* entry = entered ? GetEntryOutcomeLabel(pf.lastEntryOutcome) : "NONE";

    std::string scoring;
    for (const auto& zone : zones) {
        if (zone.isScoring) {
            if (!scoring.empty()) scoring += ",";
            scoring += std::to_string(zone.index + 1);
        }
    }

    // --- Output ---
    if (args.json) {
        RunSummary summary{};
        summary.lightChanges = static_cast<int>(timeline.changes.size());
        summary.maxLitInMarquee = timeline.maxLitInMarquee;
        summary.steadyOnAt = timeline.steadyOnAt;
        summary.entered = entered;
        summary.ticksRun = ticksRun;
        summary.wallMs = wallMs;
        std::printf("%s\n", BuildRunReportJson(pf, summary).c_str());
    } else if (args.quiet) {
        std::printf("seed=0x%08X  obstacles=%-4d  dropped=%-3d  minpair=%.3f  zones=%d  scoring=[%s]  phase=%s  entry=%s\n",
                    pf.config.obstacles.seed,
                    static_cast<int>(obstacles.points.size()),
                    obstacles.droppedCount, minPair,
                    static_cast<int>(zones.size()), scoring.c_str(),
                    GetSequencerPhaseLabel(pf.sequencer.Phase()), entry);
    } else {
        std::printf("=== Playfield Headless Runner ===\n");
        std::printf("preset:      %s\n", pf.config.name.c_str());
        std::printf("seed:        0x%08X\n", pf.config.obstacles.seed);
        std::printf("obstacles:   %d (target %d, sampled %d, dropped %d%s)\n",
                    static_cast<int>(obstacles.points.size()), obstacles.targetCount,
                    obstacles.sampledCount, obstacles.droppedCount,
                    obstacles.hitPointCap ? ", hit cap" : "");
        for (size_t i = 0; i < catalog.size(); ++i) {
            std::printf("  %-12s %d\n", catalog[i].id.c_str(), obstacles.kindCounts[i]);
        }
        std::printf("min_pair:    %.4f (min distance %.4f)\n", minPair,
                    pf.config.obstacles.params.minDistance);
        std::printf("zones:       %d, scoring [%s]\n", static_cast<int>(zones.size()),
                    scoring.c_str());
        std::printf("generation:  %u\n", pf.sequencer.Generation());
        std::printf("lights:      %d changes, max %d lit during marquee\n",
                    static_cast<int>(timeline.changes.size()), timeline.maxLitInMarquee);
        if (timeline.steadyOnAt >= 0.0f) {
            std::printf("steady_on:   at %.4f s\n", timeline.steadyOnAt);
        }
        std::printf("phase:       %s, %d lit\n", GetSequencerPhaseLabel(pf.sequencer.Phase()),
                    pf.sequencer.LitCount());
        std::printf("entry:       %s", entry);
        if (pf.sequencer.IsClaimed()) {
            std::printf(" (zone %d)", pf.sequencer.ClaimedZone() + 1);
        }
        std::printf("\n");
        std::printf("score:       %d\n", pf.score);
        std::printf("wall_time:   %.2f ms\n", wallMs);
    }

    Log::Shutdown();
    return 0;
}
