#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "SessionTypes.h"

namespace scanorch {

// ============================================================
// External subsystems consumed by the orchestrator.
//
// Every callback may arrive on any thread; the orchestrator re-posts them
// onto its EventLoop before touching session state.
// ============================================================

struct CaptureConfig {
    std::uint64_t capture_id = 0;
};

// Per-room capture. Contract: every stop() of a running capture is followed
// by exactly one on_raw_room_ready (possibly empty) or one on_failed.
class SpatialCaptureEngine {
public:
    struct Callbacks {
        std::function<void(RawRoomData)> on_raw_room_ready;
        std::function<void(ScanError)> on_failed;
    };

    virtual ~SpatialCaptureEngine() = default;

    virtual bool isSupported() const = 0;
    virtual void setCallbacks(Callbacks callbacks) = 0;
    virtual void run(const CaptureConfig& config) = 0;
    virtual void stop(bool keep_tracking_alive) = 0;
    virtual bool isRunning() const = 0;
};

class RoomSynthesizer {
public:
    virtual ~RoomSynthesizer() = default;
    virtual void buildRoom(RawRoomData raw, std::function<void(Outcome<ProcessedRoom>)> done) = 0;
};

// Merged multi-room result.
class Structure {
public:
    virtual ~Structure() = default;

    virtual std::size_t roomCount() const = 0;

    // Writes the binary model artifact. false + error on failure.
    virtual bool exportModel(std::ostream& out, ExportMode mode, std::string& error) const = 0;

    // JSON description of the structure.
    virtual std::string serialize() const = 0;
};

using StructurePtr = std::shared_ptr<const Structure>;

class StructureSynthesizer {
public:
    virtual ~StructureSynthesizer() = default;
    virtual void merge(std::vector<ProcessedRoom> rooms, std::function<void(Outcome<StructurePtr>)> done) = 0;
};

struct TrackingRunConfig {
    std::optional<WorldMapRecord> initial_world_map;
    bool reset_tracking = false;
    bool remove_existing_anchors = false;
};

class SpatialTrackingSession {
public:
    struct Callbacks {
        std::function<void(TrackingState)> on_tracking_state;
        std::function<void(ScanError)> on_failed;
    };

    virtual ~SpatialTrackingSession() = default;

    virtual void setCallbacks(Callbacks callbacks) = 0;

    // Latest sensor frame, if tracking is producing any.
    virtual std::optional<Frame> currentFrame() const = 0;

    virtual void snapshotWorldMap(std::function<void(Outcome<WorldMapRecord>)> done) = 0;
    virtual void run(const TrackingRunConfig& config) = 0;
    virtual void pause() = 0;
};

struct AudioFormat {
    int sample_rate_hz = 16000;
    int channels = 1;
    int chunk_frames = 4096;
};

// Called on the audio thread; must not block.
using PcmChunkCallback = std::function<void(std::vector<std::int16_t>)>;

class AudioCaptureEngine {
public:
    virtual ~AudioCaptureEngine() = default;

    virtual void requestPermission(std::function<void(bool granted)> done) = 0;

    // Shared route: play-and-record, measurement mode, mixing with others.
    virtual bool configureRoute(std::string& error) = 0;

    virtual bool start(const AudioFormat& format,
                       PcmChunkCallback on_chunk,
                       std::function<void(ScanError)> on_failed,
                       std::string& error) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;
};

enum class CameraAuthorization : int { Authorized = 0, NotDetermined, Denied, Restricted };

class PermissionBroker {
public:
    virtual ~PermissionBroker() = default;
    virtual CameraAuthorization cameraAuthorization() const = 0;
    virtual void requestCameraAccess(std::function<void(bool granted)> done) = 0;
};

} // namespace scanorch
