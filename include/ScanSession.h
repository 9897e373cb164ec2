#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "AudioCaptureController.h"
#include "Collaborators.h"
#include "EventLoop.h"
#include "PhotoCaptureController.h"
#include "RelocalizationProtocol.h"
#include "RoomAggregator.h"
#include "SessionCommands.h"
#include "SessionConfig.h"
#include "SessionEvents.h"
#include "TriggerDedup.h"

namespace spdlog { class logger; }

namespace scanorch {

class Filesystem;
class WorldMapStore;

// Where an export returns to when it completes.
enum class ExportReturn : int { Idle = 0, Running, Paused, Complete };

// ============================================================
// Session states. Exactly one is active; each carries only what is valid in
// it, so e.g. a pending finish during relocalization cannot be expressed.
// ============================================================
namespace state {
struct Idle {};
struct Running {};
struct FinishPending {
    bool pause_after = false; // Pause arrived while finishing
};
struct Paused {
    bool world_map_saved = false;
};
struct Relocalizing {
    std::uint64_t attempt = 0;
    std::int32_t anchor_count = 0;
};
struct Exporting {
    ExportReturn after = ExportReturn::Idle;
    bool announce_pause = false; // emit Paused when returning to Paused
    std::size_t room_count = 0;  // rooms handed to the merge
};
struct Terminal {
    StatusKind kind = StatusKind::OK;
};
} // namespace state

using SessionState = std::variant<state::Idle,
                                  state::Running,
                                  state::FinishPending,
                                  state::Paused,
                                  state::Relocalizing,
                                  state::Exporting,
                                  state::Terminal>;

const char* stateName(const SessionState& s);

// Everything the session consumes. All references must outlive the session.
struct SessionDeps {
    EventLoop& loop;
    BackgroundTask& background;
    SpatialCaptureEngine& capture;
    RoomSynthesizer& room_synth;
    StructureSynthesizer& structure_synth;
    SpatialTrackingSession& tracking;
    AudioCaptureEngine& audio;
    PermissionBroker& permissions;
    Filesystem& fs;
    WorldMapStore& world_maps;
};

// ============================================================
// Top-level orchestrator. Commands and collaborator callbacks are
// serialized on the EventLoop; events go out through one listener.
// ============================================================
class ScanSession {
public:
    ScanSession(const SessionDeps& deps, const SessionConfigV1& cfg, std::shared_ptr<spdlog::logger> log);
    ~ScanSession();

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    void setListener(EventListener listener) { listener_ = std::move(listener); }

    // Thread-safe: both post onto the loop.
    void submit(Command command);
    void applyTriggers(const TriggerSnapshot& snapshot);

    // Applies immediately; loop thread only. Export naming and policies take
    // effect on the next command that uses them.
    void configure(const SessionConfigV1& cfg);

    // ------------------------------------------------------------
    // Inspection (loop thread)
    // ------------------------------------------------------------
    const SessionState& state() const { return state_; }
    const char* stateName() const { return scanorch::stateName(state_); }
    const SessionConfigV1& config() const { return cfg_; }

    const std::vector<ProcessedRoom>& rooms() const { return aggregator_.rooms(); }
    std::size_t roomCount() const { return aggregator_.roomCount(); }
    bool pendingExport() const { return aggregator_.pendingExport(); }
    int buildsInFlight() const { return aggregator_.buildsInFlight(); }
    bool captureOpen() const { return capture_open_id_ != 0; }
    std::size_t deferredCommands() const { return deferred_.size(); }

    const std::vector<PhotoArtifact>& photos() const { return photos_.photos(); }
    const PhotoCaptureController& photoController() const { return photos_; }
    PhotoCaptureController& photoController() { return photos_; }
    const AudioCaptureController& audioController() const { return audio_; }
    const RelocalizationProtocol& relocalization() const { return reloc_; }
    const TriggerInputs& triggers() const { return triggers_; }

    std::uint64_t epoch() const { return epoch_; }

private:
    template <typename S>
    bool in() const { return std::holds_alternative<S>(state_); }

    void handle(const Command& command);
    bool deferIfExporting(const Command& command);

    void onStart();
    void onCancel();
    void onFinish();
    void onAddRoom();
    void onExport();
    void onPause();
    void onResume();
    void onReset(bool clear_durable);

    // Capture lifecycle
    void beginCapture();
    void runCapture();
    void stopCapture(bool keep_tracking_alive);
    void onCameraPermission(std::uint64_t epoch, bool granted);
    void onRawRoomReady(RawRoomData raw);
    void onCaptureFailed(const ScanError& err);
    void onRoomBuilt(std::uint64_t epoch, const Outcome<ProcessedRoom>& outcome);

    // Tracking
    void onTrackingState(const TrackingState& s);
    void onTrackingFailed(const ScanError& err);

    // World map
    void requestSnapshot();
    void onSnapshot(std::uint64_t epoch, Outcome<WorldMapRecord> outcome);
    void onSnapshotStored(std::uint64_t epoch, bool stored);
    void snapshotSettled();

    // Finish / export / resume
    void checkFinish();
    ExportReturn returnTarget() const;
    void startExport(ExportReturn after, bool announce_pause);
    void onExportDone(std::uint64_t epoch, const Outcome<ExportResult>& outcome);
    void enterAfterExport(ExportReturn after, bool announce_pause);
    void replayDeferred();
    void resumeNow();
    void onRelocalizationFinished(RelocalizationResult result);
    void restartAfterResume(bool relocalized, bool fresh_tracking);

    // Shared teardown for Cancel / Reset / failures.
    void stopEverything(bool stop_audio);
    void failToIdle(ErrorKind kind, const std::string& message);

    void emit(SessionEvent ev);
    void emitStatus(StatusKind kind, std::optional<std::string> message = std::nullopt);
    void emitError(ErrorKind kind, const std::string& message);
    void transition(SessionState next);

    EventLoop& loop_;
    BackgroundTask& background_;
    SpatialCaptureEngine& capture_;
    SpatialTrackingSession& tracking_;
    PermissionBroker& permissions_;
    WorldMapStore& world_maps_;
    std::shared_ptr<spdlog::logger> log_;

    SessionConfigV1 cfg_;
    EventListener listener_;

    std::shared_ptr<int> life_ = std::make_shared<int>(0);
    SessionState state_ = state::Idle{};
    std::uint64_t epoch_ = 0;

    // Capture bookkeeping: the open capture and the stopped ones still owed a
    // raw-room (or failure) callback in this epoch.
    std::uint64_t next_capture_id_ = 0;
    std::uint64_t capture_open_id_ = 0;
    std::set<std::uint64_t> captures_ending_;

    bool camera_permission_pending_ = false;
    int snapshots_pending_ = 0;
    bool world_map_saved_ = false;
    bool pause_announce_pending_ = false;
    bool resume_after_snapshot_ = false;

    std::deque<Command> deferred_;

    RoomAggregator aggregator_;
    AudioCaptureController audio_;
    PhotoCaptureController photos_;
    RelocalizationProtocol reloc_;
    TriggerInputs triggers_;
};

} // namespace scanorch
