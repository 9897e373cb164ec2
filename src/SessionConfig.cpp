#include "SessionConfig.h"

#include "Checksum.h"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace scanorch {

namespace {

constexpr double kMaxIntervalS = 3600.0;
constexpr double kMinRelocTimeoutS = 0.5;
constexpr double kMaxRelocTimeoutS = 120.0;

template <typename T>
bool readKey(const nlohmann::json& j, const char* key, T& out, spdlog::logger* log) {
    auto it = j.find(key);
    if (it == j.end()) return false;
    try {
        out = it->get<T>();
        return true;
    } catch (const nlohmann::json::exception& e) {
        if (log) log->warn("config: ignoring '{}': {}", key, e.what());
        return false;
    }
}

} // namespace

ExportMode exportModeOf(const SessionConfigV1& cfg) {
    return exportModeFromString(cfg.export_type);
}

std::string resolvedExportDir(const SessionConfigV1& cfg) {
    if (!cfg.export_dir.empty()) return cfg.export_dir;
    return (std::filesystem::temp_directory_path() / "Export").string();
}

std::string resolvedWorldMapFile(const SessionConfigV1& cfg) {
    if (!cfg.world_map_file.empty()) return cfg.world_map_file;
    return (std::filesystem::temp_directory_path() / "roomplan_worldmap.bin").string();
}

std::uint32_t computeConfigHash(const SessionConfigV1& cfg) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, cfg.version_u32);
    h = fnv1a32_add_str(h, cfg.scan_name);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(exportModeOf(cfg)));
    h = fnv1a32_add_str(h, cfg.export_dir);
    h = fnv1a32_add_str(h, cfg.model_extension);
    h = fnv1a32_add_u32(h, cfg.export_on_finish ? 1u : 0u);
    h = fnv1a32_add_u32(h, cfg.send_file_loc ? 1u : 0u);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(cfg.finish_policy));
    h = fnv1a32_add_u32(h, cfg.audio_enabled ? 1u : 0u);
    h = fnv1a32_add_u32(h, cfg.stop_audio_on_finish ? 1u : 0u);
    h = fnv1a32_add_i32(h, cfg.audio_sample_rate_hz);
    h = fnv1a32_add_i32(h, cfg.audio_chunk_frames);
    h = fnv1a32_add_f64(h, cfg.audio_autostart_delay_s);
    h = fnv1a32_add_f64(h, cfg.auto_photo_interval_s);
    h = fnv1a32_add_str(h, cfg.world_map_file);
    h = fnv1a32_add_f64(h, cfg.relocalization_timeout_s);
    return h;
}

int sanitizeConfig(SessionConfigV1& cfg, spdlog::logger* log) {
    const SessionConfigV1 defaults{};
    int fixed = 0;

    auto reset = [&](const char* name, auto& field, const auto& def) {
        if (log) log->warn("config: '{}' out of range, using default", name);
        field = def;
        ++fixed;
    };

    if (cfg.scan_name.empty()) reset("scan_name", cfg.scan_name, defaults.scan_name);
    if (cfg.model_extension.empty()) reset("model_extension", cfg.model_extension, defaults.model_extension);
    if (cfg.audio_sample_rate_hz < 8000 || cfg.audio_sample_rate_hz > 192000) {
        reset("audio_sample_rate_hz", cfg.audio_sample_rate_hz, defaults.audio_sample_rate_hz);
    }
    if (cfg.audio_chunk_frames < 64 || cfg.audio_chunk_frames > 65536) {
        reset("audio_chunk_frames", cfg.audio_chunk_frames, defaults.audio_chunk_frames);
    }
    if (!std::isfinite(cfg.audio_autostart_delay_s) || cfg.audio_autostart_delay_s < 0.0) {
        reset("audio_autostart_delay_s", cfg.audio_autostart_delay_s, defaults.audio_autostart_delay_s);
    }
    if (!std::isfinite(cfg.auto_photo_interval_s) || cfg.auto_photo_interval_s < 0.0 ||
        cfg.auto_photo_interval_s > kMaxIntervalS) {
        reset("auto_photo_interval_s", cfg.auto_photo_interval_s, defaults.auto_photo_interval_s);
    }
    if (!std::isfinite(cfg.relocalization_timeout_s) || cfg.relocalization_timeout_s < kMinRelocTimeoutS ||
        cfg.relocalization_timeout_s > kMaxRelocTimeoutS) {
        reset("relocalization_timeout_s", cfg.relocalization_timeout_s, defaults.relocalization_timeout_s);
    }

    cfg.fnv_hash_u32 = computeConfigHash(cfg);
    return fixed;
}

bool loadSessionConfig(const std::string& path, SessionConfigV1& cfg, std::string& error,
                       spdlog::logger* log) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        error = std::string("parse error: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        error = "config root must be a JSON object";
        return false;
    }

    SessionConfigV1 next = cfg;
    readKey(j, "scan_name", next.scan_name, log);
    readKey(j, "export_type", next.export_type, log);
    readKey(j, "export_dir", next.export_dir, log);
    readKey(j, "model_extension", next.model_extension, log);
    readKey(j, "export_on_finish", next.export_on_finish, log);
    readKey(j, "send_file_loc", next.send_file_loc, log);
    readKey(j, "audio_enabled", next.audio_enabled, log);
    readKey(j, "stop_audio_on_finish", next.stop_audio_on_finish, log);
    readKey(j, "audio_sample_rate_hz", next.audio_sample_rate_hz, log);
    readKey(j, "audio_chunk_frames", next.audio_chunk_frames, log);
    readKey(j, "audio_autostart_delay_s", next.audio_autostart_delay_s, log);
    readKey(j, "auto_photo_interval_s", next.auto_photo_interval_s, log);
    readKey(j, "world_map_file", next.world_map_file, log);
    readKey(j, "relocalization_timeout_s", next.relocalization_timeout_s, log);

    std::string policy;
    if (readKey(j, "finish_policy", policy, log)) {
        if (policy == "pause") {
            next.finish_policy = FinishPolicy::Pause;
        } else if (policy == "complete") {
            next.finish_policy = FinishPolicy::Complete;
        } else if (log) {
            log->warn("config: unknown finish_policy '{}', keeping current", policy);
        }
    }

    sanitizeConfig(next, log);
    cfg = next;
    return true;
}

int exportConfigText(const SessionConfigV1& cfg, char* buf, int cap) {
    return std::snprintf(buf, buf ? static_cast<std::size_t>(cap) : 0,
        "version=%u\n"
        "hash=0x%08X\n"
        "scan_name=%s\n"
        "export_type=%s\n"
        "export_dir=%s\n"
        "model_extension=%s\n"
        "export_on_finish=%d\n"
        "send_file_loc=%d\n"
        "finish_policy=%s\n"
        "audio_enabled=%d\n"
        "stop_audio_on_finish=%d\n"
        "audio_sample_rate_hz=%d\n"
        "audio_chunk_frames=%d\n"
        "audio_autostart_delay_s=%.3f\n"
        "auto_photo_interval_s=%.3f\n"
        "world_map_file=%s\n"
        "relocalization_timeout_s=%.3f\n",
        cfg.version_u32,
        computeConfigHash(cfg),
        cfg.scan_name.c_str(),
        exportModeName(exportModeOf(cfg)),
        resolvedExportDir(cfg).c_str(),
        cfg.model_extension.c_str(),
        cfg.export_on_finish ? 1 : 0,
        cfg.send_file_loc ? 1 : 0,
        cfg.finish_policy == FinishPolicy::Pause ? "pause" : "complete",
        cfg.audio_enabled ? 1 : 0,
        cfg.stop_audio_on_finish ? 1 : 0,
        cfg.audio_sample_rate_hz,
        cfg.audio_chunk_frames,
        cfg.audio_autostart_delay_s,
        cfg.auto_photo_interval_s,
        resolvedWorldMapFile(cfg).c_str(),
        cfg.relocalization_timeout_s);
}

} // namespace scanorch
