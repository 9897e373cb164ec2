#pragma once

#include <cstdint>
#include <string>

#include "SessionTypes.h"

namespace spdlog { class logger; }

namespace scanorch {

// What a completed Finish leaves behind when no export follows it.
enum class FinishPolicy : int {
    Pause = 0,    // -> Paused (tracking kept alive, resumable)
    Complete = 1, // -> Terminal{OK}
};

// ============================================================
// Versioned, hashable session configuration.
// fnv_hash_u32 covers every effective parameter; refreshed by computeConfigHash().
// ============================================================
struct SessionConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(SessionConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    // Identity / export
    std::string scan_name = "Room";
    std::string export_type = "PARAMETRIC"; // PARAMETRIC | MESH | MODEL
    std::string export_dir;                 // empty -> <tmp>/Export
    std::string model_extension = "usdz";
    bool export_on_finish = true;
    bool send_file_loc = true;
    FinishPolicy finish_policy = FinishPolicy::Pause;

    // Audio
    bool audio_enabled = false;
    bool stop_audio_on_finish = true;
    int audio_sample_rate_hz = 16000;
    int audio_chunk_frames = 4096;
    double audio_autostart_delay_s = 1.0;

    // Photo (0 disables the interval timer)
    double auto_photo_interval_s = 0.0;

    // World map / relocalization
    std::string world_map_file; // empty -> <tmp>/roomplan_worldmap.bin
    double relocalization_timeout_s = 6.0;
};

ExportMode exportModeOf(const SessionConfigV1& cfg);

// Resolved output locations (defaults applied).
std::string resolvedExportDir(const SessionConfigV1& cfg);
std::string resolvedWorldMapFile(const SessionConfigV1& cfg);

std::uint32_t computeConfigHash(const SessionConfigV1& cfg);

// Clamps out-of-range numeric fields back to defaults; returns the number of
// fields that were corrected.
int sanitizeConfig(SessionConfigV1& cfg, spdlog::logger* log = nullptr);

// Reads a JSON object; unknown keys are ignored, wrongly typed keys are skipped
// with a warning. Returns false (cfg untouched) if the file is unreadable or
// not a JSON object.
bool loadSessionConfig(const std::string& path, SessionConfigV1& cfg, std::string& error,
                       spdlog::logger* log = nullptr);

// "key=value" lines, NUL-terminated. Returns the number of bytes the full text
// needs (excluding NUL), snprintf-style.
int exportConfigText(const SessionConfigV1& cfg, char* buf, int cap);

} // namespace scanorch
