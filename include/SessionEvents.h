#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "SessionTypes.h"

namespace scanorch {

// ============================================================
// Outward event contract
// ============================================================

enum class StatusKind : int {
    OK = 0,
    Error,
    Canceled,
    NoWorldMap,
    Relocalizing,
    Relocated,
    RelocalizationFailed,
    RelocalizationTimeout,
};

// Wire names: "OK", "Error", "Canceled", "no_worldmap", "relocalizing", ...
const char* statusKindName(StatusKind kind);

struct StatusEvent {
    StatusKind kind = StatusKind::OK;
    std::optional<std::string> message;
    std::optional<std::int32_t> anchor_count; // relocalizing only
    ErrorKind error = ErrorKind::None;        // Error only
};

struct PreviewEvent {};

// error set (and url empty) when the capture failed.
struct PhotoEvent {
    std::string url;
    std::int64_t timestamp_ms = 0;
    std::optional<std::string> error;
};

struct AudioEvent {
    AudioStatus status = AudioStatus::Started;
    std::optional<std::string> url;
    std::optional<std::string> error;
};

struct AudioDataEvent {
    std::vector<std::int16_t> chunk;
    int sample_rate_hz = 0;
    std::int64_t timestamp_ms = 0;
};

struct ExportedEvent {
    ExportResult result;
    std::size_t room_count = 0;
};

struct PausedEvent {
    bool world_map_saved = false;
};

struct ResumedEvent {
    bool relocalized = false;
};

enum class RelocalizationPhase : int { Starting = 0, Relocalizing, Success, Unavailable };

const char* relocalizationPhaseName(RelocalizationPhase p);

struct RelocalizationStatusEvent {
    RelocalizationPhase phase = RelocalizationPhase::Starting;
    std::optional<std::int32_t> anchor_count;
    std::string message;
};

using SessionEvent = std::variant<StatusEvent,
                                  PreviewEvent,
                                  PhotoEvent,
                                  AudioEvent,
                                  AudioDataEvent,
                                  ExportedEvent,
                                  PausedEvent,
                                  ResumedEvent,
                                  RelocalizationStatusEvent>;

using EventListener = std::function<void(const SessionEvent&)>;

// One-line human readable rendering (CLI and console event logs).
std::string describeEvent(const SessionEvent& e);

} // namespace scanorch
