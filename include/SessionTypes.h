#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace scanorch {

// ============================================================
// Error taxonomy
// Every kind is recovered into an event; none terminates the process.
// ============================================================
enum class ErrorKind : int {
    None = 0,
    DeviceUnsupported,
    PermissionDenied,
    EngineFailure,
    RoomBuildFailure,
    ExportFailure,
    RelocalizationTimeout,
    RelocalizationFailed,
    AudioEngineFailure,
    PhotoCaptureFailure,
};

enum class PermissionKind : int { None = 0, Camera, Microphone };

struct ScanError {
    ErrorKind kind = ErrorKind::None;
    PermissionKind permission = PermissionKind::None; // only for PermissionDenied
    std::string message;

    bool isError() const { return kind != ErrorKind::None; }
};

const char* errorKindName(ErrorKind kind);

// Result of a fallible async collaborator call.
template <typename T>
struct Outcome {
    std::optional<T> value;
    ScanError error{};

    bool ok() const { return value.has_value(); }

    static Outcome success(T v) {
        Outcome o;
        o.value = std::move(v);
        return o;
    }
    static Outcome failure(ErrorKind kind, std::string message) {
        Outcome o;
        o.error.kind = kind;
        o.error.message = std::move(message);
        return o;
    }
};

// ============================================================
// Capture data
// ============================================================

// Per-room output of the capture engine. frame_count == 0 means the capture
// ended before anything was observed.
struct RawRoomData {
    std::uint64_t capture_id = 0;
    std::uint32_t frame_count = 0;
    std::vector<std::uint8_t> payload;

    bool empty() const { return frame_count == 0; }
};

// Synthesized geometry for one room. Summary metrics are filled by the
// synthesizer; the payload is opaque to the orchestrator.
struct ProcessedRoom {
    std::string identifier;
    std::uint32_t sequence = 0;
    double floor_area_m2 = 0.0;
    std::uint32_t wall_count = 0;
    std::uint32_t object_count = 0;
    std::vector<std::uint8_t> payload;
};

// Live camera frame in biplanar YCbCr 4:2:0 (full-range, BT.601).
// luma: width*height bytes; chroma: interleaved Cb,Cr at half resolution,
// (width/2)*(height/2)*2 bytes.
struct Frame {
    std::int64_t timestamp_ms = 0;
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> luma;
    std::vector<std::uint8_t> chroma;
};

struct WorldMapRecord {
    std::vector<std::uint8_t> snapshot;
    std::int32_t anchor_count = 0;
    std::int64_t saved_at_ms = 0;
};

enum class TrackingStateKind : int { Normal = 0, Limited, Unavailable };

enum class LimitedReason : int {
    None = 0,
    Initializing,
    Relocalizing,
    ExcessiveMotion,
    InsufficientFeatures,
};

struct TrackingState {
    TrackingStateKind kind = TrackingStateKind::Unavailable;
    LimitedReason reason = LimitedReason::None;
};

const char* trackingStateName(const TrackingState& s);

// ============================================================
// Artifacts
// ============================================================

struct PhotoArtifact {
    std::string file_url;
    std::int64_t timestamp_ms = 0;
};

enum class AudioStatus : int { Started = 0, Stopped, Error };

struct AudioArtifact {
    std::string file_url;
    AudioStatus status = AudioStatus::Stopped;
};

struct ExportResult {
    std::optional<std::string> scan_url;
    std::optional<std::string> json_url;
    std::optional<std::string> audio_url;
    std::vector<std::string> photo_urls;
};

enum class ExportMode : int { Parametric = 0, Mesh, Model };

// "MESH" -> Mesh, "MODEL" -> Model, anything else -> Parametric.
ExportMode exportModeFromString(const std::string& s);
const char* exportModeName(ExportMode m);

} // namespace scanorch
