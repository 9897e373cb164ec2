#pragma once

// world/simulated_rig.h
//
// Deterministic stand-ins for every sensor-side collaborator of ScanSession.
//
// Design goals:
//   - No ImGui / ImPlot / OpenGL dependencies.
//   - All latency is expressed as EventLoop timers, so a test that steps the
//     loop by a fixed dt sees exactly the same interleaving every run.
//   - Each collaborator exposes knobs to inject the failures the session must
//     recover from (unsupported device, denied permission, build failure,
//     relocalization that never converges, ...).
//
// Timeline of one capture (defaults):
//   run()            frames accumulate every frame_period_s while running
//   stop()           raw room delivered stop_latency_s later
//   buildRoom()      processed room delivered build_latency_s later
//   merge()          structure delivered merge_latency_s later

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Collaborators.h"
#include "EventLoop.h"

namespace scanorch {
namespace world {

// ------------------------------------------------------------
// Capture engine
// ------------------------------------------------------------
class SimCaptureEngine final : public SpatialCaptureEngine {
public:
    explicit SimCaptureEngine(EventLoop& loop) : loop_(loop) {}

    bool isSupported() const override { return supported_; }
    void setCallbacks(Callbacks callbacks) override { callbacks_ = std::move(callbacks); }
    void run(const CaptureConfig& config) override;
    void stop(bool keep_tracking_alive) override;
    bool isRunning() const override { return running_; }

    // Knobs
    void setSupported(bool v) { supported_ = v; }
    void setFramePeriod(double s) { frame_period_s_ = s; }
    void setStopLatency(double s) { stop_latency_s_ = s; }
    void failNextStop(std::string message) { fail_next_stop_ = std::move(message); }

    // Reports a failure for the running capture right now.
    void injectFailure(const std::string& message);

    std::uint64_t runs() const { return runs_; }
    std::uint32_t currentFrames() const { return frames_; }
    bool lastStopKeptTracking() const { return last_keep_tracking_; }

private:
    EventLoop& loop_;
    Callbacks callbacks_;
    bool supported_ = true;
    bool running_ = false;
    std::uint64_t capture_id_ = 0;
    std::uint32_t frames_ = 0;
    std::uint64_t runs_ = 0;
    bool last_keep_tracking_ = false;
    double frame_period_s_ = 0.1;
    double stop_latency_s_ = 0.2;
    std::optional<std::string> fail_next_stop_;
    TimerHandle frame_timer_;
    std::vector<TimerHandle> pending_;
};

// ------------------------------------------------------------
// Room / structure synthesis
// ------------------------------------------------------------
class SimRoomSynthesizer final : public RoomSynthesizer {
public:
    explicit SimRoomSynthesizer(EventLoop& loop) : loop_(loop) {}

    void buildRoom(RawRoomData raw, std::function<void(Outcome<ProcessedRoom>)> done) override;

    void setLatency(double s) { latency_s_ = s; }
    void failNext(std::string message) { fail_next_ = std::move(message); }
    int builds() const { return builds_; }

private:
    EventLoop& loop_;
    double latency_s_ = 0.5;
    int builds_ = 0;
    std::optional<std::string> fail_next_;
    std::vector<TimerHandle> pending_;
};

// Merged rooms. serialize() is a JSON document; exportModel() writes a small
// tagged binary blob whose layout depends on the export mode.
class SimStructure final : public Structure {
public:
    explicit SimStructure(std::vector<ProcessedRoom> rooms) : rooms_(std::move(rooms)) {}

    std::size_t roomCount() const override { return rooms_.size(); }
    bool exportModel(std::ostream& out, ExportMode mode, std::string& error) const override;
    std::string serialize() const override;

    const std::vector<ProcessedRoom>& rooms() const { return rooms_; }

private:
    std::vector<ProcessedRoom> rooms_;
};

class SimStructureSynthesizer final : public StructureSynthesizer {
public:
    explicit SimStructureSynthesizer(EventLoop& loop) : loop_(loop) {}

    void merge(std::vector<ProcessedRoom> rooms, std::function<void(Outcome<StructurePtr>)> done) override;

    void setLatency(double s) { latency_s_ = s; }
    void failNext(std::string message) { fail_next_ = std::move(message); }
    int merges() const { return merges_; }
    std::size_t lastMergedRooms() const { return last_merged_rooms_; }

private:
    EventLoop& loop_;
    double latency_s_ = 0.3;
    int merges_ = 0;
    std::size_t last_merged_rooms_ = 0;
    std::optional<std::string> fail_next_;
    std::vector<TimerHandle> pending_;
};

// ------------------------------------------------------------
// Tracking session
// ------------------------------------------------------------
class SimTrackingSession final : public SpatialTrackingSession {
public:
    // How a run() with a saved world map plays out.
    enum class RelocalizeScript : int {
        Converge = 0, // limited(relocalizing) then normal
        Unavailable,  // limited(relocalizing) then unavailable
        Never,        // limited(relocalizing) forever
    };

    explicit SimTrackingSession(EventLoop& loop) : loop_(loop) {}

    void setCallbacks(Callbacks callbacks) override { callbacks_ = std::move(callbacks); }
    std::optional<Frame> currentFrame() const override;
    void snapshotWorldMap(std::function<void(Outcome<WorldMapRecord>)> done) override;
    void run(const TrackingRunConfig& config) override;
    void pause() override;

    // Knobs
    void setRelocalizeScript(RelocalizeScript s) { script_ = s; }
    void setRelocalizeDelay(double s) { relocalize_delay_s_ = s; }
    void setFramesAvailable(bool v) { frames_available_ = v; }
    void setFrameSize(int w, int h) {
        frame_w_ = w;
        frame_h_ = h;
    }
    void setAnchorCount(std::int32_t n) { anchor_count_ = n; }
    void failNextSnapshot(std::string message) { fail_next_snapshot_ = std::move(message); }
    void injectFailure(const std::string& message);

    bool running() const { return running_; }
    int runs() const { return runs_; }
    const TrackingRunConfig& lastRunConfig() const { return last_config_; }

private:
    void emitState(TrackingStateKind kind, LimitedReason reason);

    EventLoop& loop_;
    Callbacks callbacks_;
    bool running_ = false;
    int runs_ = 0;
    TrackingRunConfig last_config_{};
    RelocalizeScript script_ = RelocalizeScript::Converge;
    double relocalize_delay_s_ = 1.0;
    bool frames_available_ = true;
    int frame_w_ = 64;
    int frame_h_ = 48;
    std::int32_t anchor_count_ = 12;
    std::optional<std::string> fail_next_snapshot_;
    std::vector<TimerHandle> state_timers_; // dropped by every run()/pause()
    std::vector<TimerHandle> pending_;      // snapshots in flight
};

// ------------------------------------------------------------
// Audio engine: a 440 Hz tone delivered one chunk per chunk period.
// ------------------------------------------------------------
class SimAudioEngine final : public AudioCaptureEngine {
public:
    explicit SimAudioEngine(EventLoop& loop) : loop_(loop) {}

    void requestPermission(std::function<void(bool)> done) override;
    bool configureRoute(std::string& error) override;
    bool start(const AudioFormat& format,
               PcmChunkCallback on_chunk,
               std::function<void(ScanError)> on_failed,
               std::string& error) override;
    void stop() override;
    bool isRunning() const override { return running_; }

    void setPermissionGranted(bool v) { permission_granted_ = v; }
    void setRouteFails(bool v) { route_fails_ = v; }
    void setToneHz(double hz) { tone_hz_ = hz; }
    void injectFailure(const std::string& message);

    std::uint64_t chunksDelivered() const { return chunks_; }

private:
    void deliverChunk();

    EventLoop& loop_;
    bool permission_granted_ = true;
    bool route_fails_ = false;
    bool running_ = false;
    double tone_hz_ = 440.0;
    double phase_ = 0.0;
    std::uint64_t chunks_ = 0;
    AudioFormat format_{};
    PcmChunkCallback on_chunk_;
    std::function<void(ScanError)> on_failed_;
    TimerHandle chunk_timer_;
    std::vector<TimerHandle> pending_;
};

// ------------------------------------------------------------
// Permissions
// ------------------------------------------------------------
class SimPermissionBroker final : public PermissionBroker {
public:
    explicit SimPermissionBroker(EventLoop& loop) : loop_(loop) {}

    CameraAuthorization cameraAuthorization() const override { return status_; }
    void requestCameraAccess(std::function<void(bool)> done) override;

    void setStatus(CameraAuthorization s) { status_ = s; }
    void setGrantOnRequest(bool v) { grant_on_request_ = v; }
    int requests() const { return requests_; }

private:
    EventLoop& loop_;
    CameraAuthorization status_ = CameraAuthorization::Authorized;
    bool grant_on_request_ = true;
    int requests_ = 0;
    std::vector<TimerHandle> pending_;
};

// All of the above, wired to one loop.
struct SimulatedRig {
    explicit SimulatedRig(EventLoop& loop)
        : capture(loop), rooms(loop), structures(loop), tracking(loop), audio(loop), permissions(loop) {}

    SimCaptureEngine capture;
    SimRoomSynthesizer rooms;
    SimStructureSynthesizer structures;
    SimTrackingSession tracking;
    SimAudioEngine audio;
    SimPermissionBroker permissions;
};

// Solid-color biplanar 4:2:0 frame (width and height rounded up to even).
Frame makeSolidFrame(int width, int height, std::uint8_t y, std::uint8_t cb, std::uint8_t cr,
                     std::int64_t timestamp_ms = 0);

} // namespace world
} // namespace scanorch
