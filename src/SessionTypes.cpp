#include "SessionEvents.h"
#include "SessionTypes.h"

#include <sstream>
#include <type_traits>

namespace scanorch {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                  return "None";
        case ErrorKind::DeviceUnsupported:     return "DeviceUnsupported";
        case ErrorKind::PermissionDenied:      return "PermissionDenied";
        case ErrorKind::EngineFailure:         return "EngineFailure";
        case ErrorKind::RoomBuildFailure:      return "RoomBuildFailure";
        case ErrorKind::ExportFailure:         return "ExportFailure";
        case ErrorKind::RelocalizationTimeout: return "RelocalizationTimeout";
        case ErrorKind::RelocalizationFailed:  return "RelocalizationFailed";
        case ErrorKind::AudioEngineFailure:    return "AudioEngineFailure";
        case ErrorKind::PhotoCaptureFailure:   return "PhotoCaptureFailure";
    }
    return "Unknown";
}

const char* trackingStateName(const TrackingState& s) {
    switch (s.kind) {
        case TrackingStateKind::Normal:      return "normal";
        case TrackingStateKind::Unavailable: return "unavailable";
        case TrackingStateKind::Limited:
            switch (s.reason) {
                case LimitedReason::Initializing:         return "limited(initializing)";
                case LimitedReason::Relocalizing:         return "limited(relocalizing)";
                case LimitedReason::ExcessiveMotion:      return "limited(excessiveMotion)";
                case LimitedReason::InsufficientFeatures: return "limited(insufficientFeatures)";
                case LimitedReason::None:                 break;
            }
            return "limited(unknown)";
    }
    return "unknown";
}

ExportMode exportModeFromString(const std::string& s) {
    if (s == "MESH") return ExportMode::Mesh;
    if (s == "MODEL") return ExportMode::Model;
    return ExportMode::Parametric;
}

const char* exportModeName(ExportMode m) {
    switch (m) {
        case ExportMode::Parametric: return "PARAMETRIC";
        case ExportMode::Mesh:       return "MESH";
        case ExportMode::Model:      return "MODEL";
    }
    return "PARAMETRIC";
}

const char* statusKindName(StatusKind kind) {
    switch (kind) {
        case StatusKind::OK:                    return "OK";
        case StatusKind::Error:                 return "Error";
        case StatusKind::Canceled:              return "Canceled";
        case StatusKind::NoWorldMap:            return "no_worldmap";
        case StatusKind::Relocalizing:          return "relocalizing";
        case StatusKind::Relocated:             return "relocated";
        case StatusKind::RelocalizationFailed:  return "relocalization_failed";
        case StatusKind::RelocalizationTimeout: return "relocalization_timeout";
    }
    return "unknown";
}

const char* relocalizationPhaseName(RelocalizationPhase p) {
    switch (p) {
        case RelocalizationPhase::Starting:     return "starting";
        case RelocalizationPhase::Relocalizing: return "relocalizing";
        case RelocalizationPhase::Success:      return "success";
        case RelocalizationPhase::Unavailable:  return "unavailable";
    }
    return "unknown";
}

namespace {

const char* audioStatusName(AudioStatus s) {
    switch (s) {
        case AudioStatus::Started: return "started";
        case AudioStatus::Stopped: return "stopped";
        case AudioStatus::Error:   return "error";
    }
    return "unknown";
}

} // namespace

std::string describeEvent(const SessionEvent& e) {
    std::ostringstream os;
    std::visit([&os](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, StatusEvent>) {
            os << "Status{" << statusKindName(ev.kind);
            if (ev.error != ErrorKind::None) os << ", " << errorKindName(ev.error);
            if (ev.anchor_count) os << ", anchors=" << *ev.anchor_count;
            if (ev.message) os << ", \"" << *ev.message << "\"";
            os << "}";
        } else if constexpr (std::is_same_v<T, PreviewEvent>) {
            os << "Preview";
        } else if constexpr (std::is_same_v<T, PhotoEvent>) {
            if (ev.error) {
                os << "Photo{error=\"" << *ev.error << "\"}";
            } else {
                os << "Photo{" << ev.url << ", ts=" << ev.timestamp_ms << "}";
            }
        } else if constexpr (std::is_same_v<T, AudioEvent>) {
            os << "Audio{" << audioStatusName(ev.status);
            if (ev.url) os << ", " << *ev.url;
            if (ev.error) os << ", error=\"" << *ev.error << "\"";
            os << "}";
        } else if constexpr (std::is_same_v<T, AudioDataEvent>) {
            os << "AudioData{" << ev.chunk.size() << " samples @ " << ev.sample_rate_hz << " Hz}";
        } else if constexpr (std::is_same_v<T, ExportedEvent>) {
            os << "Exported{rooms=" << ev.room_count;
            if (ev.result.scan_url) os << ", scan=" << *ev.result.scan_url;
            if (ev.result.json_url) os << ", json=" << *ev.result.json_url;
            if (ev.result.audio_url) os << ", audio=" << *ev.result.audio_url;
            os << ", photos=" << ev.result.photo_urls.size() << "}";
        } else if constexpr (std::is_same_v<T, PausedEvent>) {
            os << "Paused{map=" << (ev.world_map_saved ? "saved" : "none") << "}";
        } else if constexpr (std::is_same_v<T, ResumedEvent>) {
            os << "Resumed{" << (ev.relocalized ? "relocalized" : "fresh") << "}";
        } else if constexpr (std::is_same_v<T, RelocalizationStatusEvent>) {
            os << "RelocalizationStatus{" << relocalizationPhaseName(ev.phase);
            if (ev.anchor_count) os << ", anchors=" << *ev.anchor_count;
            os << ", \"" << ev.message << "\"}";
        }
    }, e);
    return os.str();
}

} // namespace scanorch
