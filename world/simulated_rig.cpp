// world/simulated_rig.cpp
//
// Implementation notes:
//   - Every delayed delivery is a TimerHandle held by the collaborator, so
//     destroying the rig cancels whatever is still scheduled.
//   - Callbacks are invoked on the loop thread; ScanSession re-posts them
//     anyway, exactly as it would for a real engine's own threads.
//   - Derived room metrics are simple functions of the frame count so tests
//     can predict them.

#include "simulated_rig.h"

#include <algorithm>
#include <cmath>
#include <cstring>

#include <nlohmann/json.hpp>

namespace scanorch {
namespace world {

static constexpr double kTwoPi = 6.283185307179586;
static constexpr double kToneAmplitude = 8000.0;

static void prune(std::vector<TimerHandle>& timers) {
    timers.erase(std::remove_if(timers.begin(), timers.end(),
                                [](const TimerHandle& t) { return !t.armed(); }),
                 timers.end());
}

template <typename T>
static void writeRaw(std::ostream& out, T v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(T));
}

Frame makeSolidFrame(int width, int height, std::uint8_t y, std::uint8_t cb, std::uint8_t cr,
                     std::int64_t timestamp_ms) {
    Frame f;
    f.width = std::max(2, width + (width & 1));
    f.height = std::max(2, height + (height & 1));
    f.timestamp_ms = timestamp_ms;
    f.luma.assign(static_cast<std::size_t>(f.width) * f.height, y);
    f.chroma.resize(static_cast<std::size_t>(f.width / 2) * (f.height / 2) * 2);
    for (std::size_t i = 0; i < f.chroma.size(); i += 2) {
        f.chroma[i] = cb;
        f.chroma[i + 1] = cr;
    }
    return f;
}

// ============================================================
// SimCaptureEngine
// ============================================================

void SimCaptureEngine::run(const CaptureConfig& config) {
    running_ = true;
    capture_id_ = config.capture_id;
    frames_ = 0;
    ++runs_;
    frame_timer_ = loop_.scheduleRepeating(frame_period_s_, [this] { ++frames_; });
}

void SimCaptureEngine::stop(bool keep_tracking_alive) {
    if (!running_) return;
    running_ = false;
    last_keep_tracking_ = keep_tracking_alive;
    frame_timer_.cancel();

    RawRoomData raw;
    raw.capture_id = capture_id_;
    raw.frame_count = frames_;
    raw.payload.resize(16);
    for (std::size_t i = 0; i < raw.payload.size(); ++i) {
        raw.payload[i] = static_cast<std::uint8_t>((capture_id_ * 31u + frames_ + i) & 0xFFu);
    }

    std::optional<std::string> fail = std::move(fail_next_stop_);
    fail_next_stop_.reset();

    prune(pending_);
    pending_.push_back(loop_.schedule(stop_latency_s_, [this, raw, fail] {
        if (fail) {
            if (callbacks_.on_failed) {
                ScanError err;
                err.kind = ErrorKind::EngineFailure;
                err.message = *fail;
                callbacks_.on_failed(err);
            }
            return;
        }
        if (callbacks_.on_raw_room_ready) callbacks_.on_raw_room_ready(raw);
    }));
}

void SimCaptureEngine::injectFailure(const std::string& message) {
    if (!running_) return;
    running_ = false;
    frame_timer_.cancel();
    if (callbacks_.on_failed) {
        ScanError err;
        err.kind = ErrorKind::EngineFailure;
        err.message = message;
        callbacks_.on_failed(err);
    }
}

// ============================================================
// SimRoomSynthesizer
// ============================================================

void SimRoomSynthesizer::buildRoom(RawRoomData raw, std::function<void(Outcome<ProcessedRoom>)> done) {
    ++builds_;
    std::optional<std::string> fail = std::move(fail_next_);
    fail_next_.reset();

    prune(pending_);
    pending_.push_back(loop_.schedule(latency_s_, [raw = std::move(raw), done, fail] {
        if (fail) {
            done(Outcome<ProcessedRoom>::failure(ErrorKind::RoomBuildFailure, *fail));
            return;
        }
        ProcessedRoom room;
        room.identifier = "room-" + std::to_string(raw.capture_id);
        room.floor_area_m2 = 8.0 + 0.05 * raw.frame_count;
        room.wall_count = 4u + raw.frame_count % 3u;
        room.object_count = raw.frame_count / 10u;
        room.payload = raw.payload;
        done(Outcome<ProcessedRoom>::success(std::move(room)));
    }));
}

// ============================================================
// SimStructure / SimStructureSynthesizer
// ============================================================

std::string SimStructure::serialize() const {
    nlohmann::json doc;
    doc["version"] = 1;
    doc["room_count"] = rooms_.size();

    double total_area = 0.0;
    nlohmann::json rooms = nlohmann::json::array();
    for (const auto& r : rooms_) {
        rooms.push_back({
            {"identifier", r.identifier},
            {"sequence", r.sequence},
            {"floor_area_m2", r.floor_area_m2},
            {"walls", r.wall_count},
            {"objects", r.object_count},
        });
        total_area += r.floor_area_m2;
    }
    doc["rooms"] = std::move(rooms);
    doc["total_floor_area_m2"] = total_area;
    return doc.dump(2);
}

bool SimStructure::exportModel(std::ostream& out, ExportMode mode, std::string& error) const {
    out.write("SIMMODEL", 8);
    writeRaw<std::uint32_t>(out, static_cast<std::uint32_t>(mode));
    writeRaw<std::uint32_t>(out, static_cast<std::uint32_t>(rooms_.size()));
    for (const auto& r : rooms_) {
        writeRaw<double>(out, r.floor_area_m2);
        writeRaw<std::uint32_t>(out, r.wall_count);
        // Parametric models carry objects; mesh carries a triangle count instead.
        if (mode == ExportMode::Mesh) {
            writeRaw<std::uint32_t>(out, r.wall_count * 2u);
        } else {
            writeRaw<std::uint32_t>(out, r.object_count);
        }
    }
    if (!out) {
        error = "stream error while writing model";
        return false;
    }
    return true;
}

void SimStructureSynthesizer::merge(std::vector<ProcessedRoom> rooms,
                                    std::function<void(Outcome<StructurePtr>)> done) {
    ++merges_;
    last_merged_rooms_ = rooms.size();
    std::optional<std::string> fail = std::move(fail_next_);
    fail_next_.reset();
    if (!fail && rooms.empty()) fail = std::string("Nothing to merge");

    prune(pending_);
    pending_.push_back(loop_.schedule(latency_s_, [rooms = std::move(rooms), done, fail] {
        if (fail) {
            done(Outcome<StructurePtr>::failure(ErrorKind::ExportFailure, *fail));
            return;
        }
        StructurePtr merged = std::make_shared<SimStructure>(rooms);
        done(Outcome<StructurePtr>::success(std::move(merged)));
    }));
}

// ============================================================
// SimTrackingSession
// ============================================================

void SimTrackingSession::emitState(TrackingStateKind kind, LimitedReason reason) {
    if (!callbacks_.on_tracking_state) return;
    TrackingState s;
    s.kind = kind;
    s.reason = reason;
    callbacks_.on_tracking_state(s);
}

void SimTrackingSession::run(const TrackingRunConfig& config) {
    state_timers_.clear();
    running_ = true;
    ++runs_;
    last_config_ = config;

    if (config.initial_world_map) {
        state_timers_.push_back(loop_.schedule(0.1, [this] {
            emitState(TrackingStateKind::Limited, LimitedReason::Relocalizing);
        }));
        switch (script_) {
            case RelocalizeScript::Converge:
                state_timers_.push_back(loop_.schedule(relocalize_delay_s_, [this] {
                    emitState(TrackingStateKind::Normal, LimitedReason::None);
                }));
                break;
            case RelocalizeScript::Unavailable:
                state_timers_.push_back(loop_.schedule(relocalize_delay_s_, [this] {
                    emitState(TrackingStateKind::Unavailable, LimitedReason::None);
                }));
                break;
            case RelocalizeScript::Never:
                break;
        }
        return;
    }

    state_timers_.push_back(loop_.schedule(0.1, [this] {
        emitState(TrackingStateKind::Limited, LimitedReason::Initializing);
    }));
    state_timers_.push_back(loop_.schedule(0.3, [this] {
        emitState(TrackingStateKind::Normal, LimitedReason::None);
    }));
}

void SimTrackingSession::pause() {
    running_ = false;
    state_timers_.clear();
}

std::optional<Frame> SimTrackingSession::currentFrame() const {
    if (!running_ || !frames_available_) return std::nullopt;
    return makeSolidFrame(frame_w_, frame_h_, 120, 110, 140, loop_.nowMs());
}

void SimTrackingSession::snapshotWorldMap(std::function<void(Outcome<WorldMapRecord>)> done) {
    std::optional<std::string> fail = std::move(fail_next_snapshot_);
    fail_next_snapshot_.reset();

    prune(pending_);
    pending_.push_back(loop_.schedule(0.2, [this, done, fail] {
        if (fail) {
            done(Outcome<WorldMapRecord>::failure(ErrorKind::EngineFailure, *fail));
            return;
        }
        WorldMapRecord rec;
        rec.anchor_count = anchor_count_;
        rec.saved_at_ms = loop_.nowMs();
        rec.snapshot.resize(256);
        for (std::size_t i = 0; i < rec.snapshot.size(); ++i) {
            rec.snapshot[i] = static_cast<std::uint8_t>((i * 7u + static_cast<std::size_t>(runs_)) & 0xFFu);
        }
        done(Outcome<WorldMapRecord>::success(std::move(rec)));
    }));
}

void SimTrackingSession::injectFailure(const std::string& message) {
    if (!callbacks_.on_failed) return;
    ScanError err;
    err.kind = ErrorKind::EngineFailure;
    err.message = message;
    callbacks_.on_failed(err);
}

// ============================================================
// SimAudioEngine
// ============================================================

void SimAudioEngine::requestPermission(std::function<void(bool)> done) {
    const bool granted = permission_granted_;
    prune(pending_);
    pending_.push_back(loop_.schedule(0.05, [done, granted] { done(granted); }));
}

bool SimAudioEngine::configureRoute(std::string& error) {
    if (route_fails_) {
        error = "audio route unavailable";
        return false;
    }
    return true;
}

bool SimAudioEngine::start(const AudioFormat& format,
                           PcmChunkCallback on_chunk,
                           std::function<void(ScanError)> on_failed,
                           std::string& error) {
    if (running_) {
        error = "engine already running";
        return false;
    }
    if (format.sample_rate_hz <= 0 || format.chunk_frames <= 0) {
        error = "invalid format";
        return false;
    }
    format_ = format;
    on_chunk_ = std::move(on_chunk);
    on_failed_ = std::move(on_failed);
    running_ = true;
    phase_ = 0.0;

    const double period_s = static_cast<double>(format_.chunk_frames) / format_.sample_rate_hz;
    chunk_timer_ = loop_.scheduleRepeating(period_s, [this] { deliverChunk(); });
    return true;
}

void SimAudioEngine::deliverChunk() {
    if (!running_ || !on_chunk_) return;
    const std::size_t n = static_cast<std::size_t>(format_.chunk_frames) * std::max(1, format_.channels);
    std::vector<std::int16_t> samples(n);
    const double step = kTwoPi * tone_hz_ / format_.sample_rate_hz;
    for (std::size_t i = 0; i < n; ++i) {
        samples[i] = static_cast<std::int16_t>(std::lround(kToneAmplitude * std::sin(phase_)));
        phase_ += step;
        if (phase_ >= kTwoPi) phase_ -= kTwoPi;
    }
    ++chunks_;
    on_chunk_(std::move(samples));
}

void SimAudioEngine::stop() {
    running_ = false;
    chunk_timer_.cancel();
}

void SimAudioEngine::injectFailure(const std::string& message) {
    if (!running_) return;
    stop();
    if (on_failed_) {
        ScanError err;
        err.kind = ErrorKind::AudioEngineFailure;
        err.message = message;
        on_failed_(err);
    }
}

// ============================================================
// SimPermissionBroker
// ============================================================

void SimPermissionBroker::requestCameraAccess(std::function<void(bool)> done) {
    ++requests_;
    prune(pending_);
    pending_.push_back(loop_.schedule(0.05, [this, done] {
        status_ = grant_on_request_ ? CameraAuthorization::Authorized : CameraAuthorization::Denied;
        done(grant_on_request_);
    }));
}

} // namespace world
} // namespace scanorch
