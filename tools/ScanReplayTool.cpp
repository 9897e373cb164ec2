#include "ScanSession.h"

#include "Filesystem.h"
#include "Log.h"
#include "WorldMapStore.h"

#include "../world/simulated_rig.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace {
constexpr double kDt = 0.05;

struct ScriptStep {
    double at_s = 0.0;
    scanorch::Command command;
};

struct Scenario {
    std::vector<ScriptStep> steps;
    double duration_s = 0.0;
};

std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "ScanReplay usage:\n"
              << "  ScanReplay [--scenario <basic|queued-export|pause-resume|photos|audio|timeout>]\n"
              << "             [--config session.json] [--out dir] [--log-level <trace|debug|info|warn|error|off>]\n";
}

bool buildScenario(const std::string& name, Scenario& out, scanorch::world::SimulatedRig& rig,
                   scanorch::SessionConfigV1& cfg) {
    using namespace scanorch;
    if (name == "basic") {
        out.steps = {{0.0, cmd::Start{}}, {2.0, cmd::Finish{}}};
        out.duration_s = 5.0;
    } else if (name == "queued-export") {
        out.steps = {{0.0, cmd::Start{}}, {0.1, cmd::Export{}}, {1.5, cmd::Finish{}}};
        out.duration_s = 5.0;
    } else if (name == "pause-resume") {
        out.steps = {{0.0, cmd::Start{}},   {1.0, cmd::Finish{}}, {4.0, cmd::Resume{}},
                     {6.5, cmd::AddRoom{}}, {7.5, cmd::Finish{}}};
        out.duration_s = 11.0;
    } else if (name == "photos") {
        out.steps = {{0.0, cmd::Start{}},
                     {0.2, cmd::CapturePhoto{}},
                     {0.5, cmd::SetAutoPhotoInterval{0.5}},
                     {2.2, cmd::Finish{}}};
        out.duration_s = 5.0;
    } else if (name == "audio") {
        cfg.audio_enabled = true;
        out.steps = {{0.0, cmd::Start{}}, {3.0, cmd::Finish{}}};
        out.duration_s = 6.0;
    } else if (name == "timeout") {
        rig.tracking.setRelocalizeScript(world::SimTrackingSession::RelocalizeScript::Never);
        out.steps = {{0.0, cmd::Start{}}, {1.0, cmd::Pause{}}, {3.0, cmd::Resume{}}, {12.0, cmd::Finish{}}};
        out.duration_s = 15.0;
    } else {
        return false;
    }
    return true;
}
} // namespace

int main(int argc, char** argv) {
    std::string scenario_name = "basic";
    std::string config_path;
    std::string out_dir;
    std::string log_level = "warn";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--scenario" && i + 1 < argc) {
            scenario_name = toLower(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = toLower(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    auto log = scanorch::makeLogger();
    scanorch::setLogLevel(*log, log_level);

    scanorch::SessionConfigV1 cfg;
    if (!config_path.empty()) {
        std::string error;
        if (!scanorch::loadSessionConfig(config_path, cfg, error, log.get())) {
            std::cout << "Cannot load config: " << error << "\n";
            return 1;
        }
    }
    if (!out_dir.empty()) {
        cfg.export_dir = scanorch::joinPath(out_dir, "Export");
        cfg.world_map_file = scanorch::joinPath(out_dir, "worldmap.bin");
    }

    scanorch::EventLoop loop;
    scanorch::BackgroundTask background;
    scanorch::LocalFilesystem fs;
    scanorch::world::SimulatedRig rig(loop);

    Scenario scenario;
    if (!buildScenario(scenario_name, scenario, rig, cfg)) {
        std::cout << "Unsupported scenario: " << scenario_name << "\n";
        printUsage();
        return 1;
    }
    scanorch::sanitizeConfig(cfg, log.get());

    scanorch::WorldMapStore maps(std::make_unique<scanorch::MemoryWorldMapTier>(),
                                 std::make_unique<scanorch::FileWorldMapTier>(
                                     fs, scanorch::resolvedWorldMapFile(cfg), log));
    // Start from a clean slate so earlier runs do not leak a saved map in.
    maps.clear(true);

    scanorch::SessionDeps deps{loop, background, rig.capture, rig.rooms, rig.structures, rig.tracking,
                               rig.audio, rig.permissions, fs, maps};
    scanorch::ScanSession session(deps, cfg, log);

    int audio_chunks = 0;
    session.setListener([&](const scanorch::SessionEvent& e) {
        // Chunks arrive several times a second; summarize them instead.
        if (std::holds_alternative<scanorch::AudioDataEvent>(e)) {
            ++audio_chunks;
            return;
        }
        std::cout << "[" << std::fixed << std::setprecision(2) << std::setw(6) << loop.now_s() << "s] "
                  << scanorch::describeEvent(e) << "\n";
    });
    session.photoController().setClock([&loop] { return loop.nowMs(); });

    auto pump = [&] {
        for (;;) {
            background.waitForCompletion();
            if (loop.drain() == 0) return;
        }
    };

    std::cout << "Scenario '" << scenario_name << "', config hash 0x" << std::hex << std::uppercase
              << session.config().fnv_hash_u32 << std::dec << "\n";

    std::size_t next = 0;
    const long total_steps = std::lround(scenario.duration_s / kDt);
    for (long s = 0; s <= total_steps; ++s) {
        while (next < scenario.steps.size() && scenario.steps[next].at_s <= loop.now_s() + 1e-9) {
            std::cout << "[" << std::fixed << std::setprecision(2) << std::setw(6) << loop.now_s() << "s] > "
                      << scanorch::commandName(scenario.steps[next].command) << "\n";
            session.submit(scenario.steps[next].command);
            ++next;
        }
        pump();
        if (s < total_steps) loop.step(kDt);
    }
    pump();

    std::cout << "Final state: " << session.stateName() << ", rooms: " << session.roomCount()
              << ", photos: " << session.photos().size() << ", audio chunks: " << audio_chunks << "\n";
    return 0;
}
