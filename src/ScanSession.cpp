#include "ScanSession.h"

#include "Filesystem.h"
#include "Log.h"
#include "WorldMapStore.h"

#include <type_traits>

#include <spdlog/spdlog.h>

namespace scanorch {

const char* stateName(const SessionState& s) {
    return std::visit([](const auto& v) -> const char* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, state::Idle>) return "Idle";
        else if constexpr (std::is_same_v<T, state::Running>) return "Running";
        else if constexpr (std::is_same_v<T, state::FinishPending>) return "FinishPending";
        else if constexpr (std::is_same_v<T, state::Paused>) return "Paused";
        else if constexpr (std::is_same_v<T, state::Relocalizing>) return "Relocalizing";
        else if constexpr (std::is_same_v<T, state::Exporting>) return "Exporting";
        else return "Terminal";
    }, s);
}

// ============================================================
// Construction
// ============================================================

ScanSession::ScanSession(const SessionDeps& deps, const SessionConfigV1& cfg, std::shared_ptr<spdlog::logger> log)
    : loop_(deps.loop),
      background_(deps.background),
      capture_(deps.capture),
      tracking_(deps.tracking),
      permissions_(deps.permissions),
      world_maps_(deps.world_maps),
      log_(log ? std::move(log) : makeLogger()),
      cfg_(cfg),
      aggregator_(deps.loop, deps.background, deps.room_synth, deps.structure_synth, deps.fs, log_),
      audio_(deps.loop, deps.audio, deps.fs, log_, [this](SessionEvent ev) { emit(std::move(ev)); }),
      photos_(deps.loop, deps.background, deps.tracking, deps.fs, log_,
              [this](SessionEvent ev) { emit(std::move(ev)); }),
      reloc_(deps.loop, deps.tracking, deps.world_maps, log_,
             [this](SessionEvent ev) { emit(std::move(ev)); },
             [this](RelocalizationResult r) { onRelocalizationFinished(r); }),
      triggers_([this](const Command& c) { handle(c); }) {
    configure(cfg);

    std::weak_ptr<int> guard = life_;
    EventLoop& loop = loop_;

    SpatialCaptureEngine::Callbacks cc;
    cc.on_raw_room_ready = [this, guard, &loop](RawRoomData raw) {
        loop.post(guardTask(guard, [this, raw = std::move(raw)]() mutable { onRawRoomReady(std::move(raw)); }));
    };
    cc.on_failed = [this, guard, &loop](ScanError err) {
        loop.post(guardTask(guard, [this, err] { onCaptureFailed(err); }));
    };
    capture_.setCallbacks(std::move(cc));

    SpatialTrackingSession::Callbacks tc;
    tc.on_tracking_state = [this, guard, &loop](TrackingState s) {
        loop.post(guardTask(guard, [this, s] { onTrackingState(s); }));
    };
    tc.on_failed = [this, guard, &loop](ScanError err) {
        loop.post(guardTask(guard, [this, err] { onTrackingFailed(err); }));
    };
    tracking_.setCallbacks(std::move(tc));
}

ScanSession::~ScanSession() {
    capture_.setCallbacks({});
    tracking_.setCallbacks({});
    if (capture_open_id_ != 0) capture_.stop(false);
}

void ScanSession::configure(const SessionConfigV1& cfg) {
    cfg_ = cfg;
    sanitizeConfig(cfg_, log_.get());
    audio_.configure(cfg_);
    photos_.configure(cfg_);
    reloc_.setTimeout(cfg_.relocalization_timeout_s);
    log_->debug("session configured (hash 0x{:08X})", cfg_.fnv_hash_u32);
}

void ScanSession::submit(Command command) {
    loop_.post(guardTask(life_, [this, command] { handle(command); }));
}

void ScanSession::applyTriggers(const TriggerSnapshot& snapshot) {
    loop_.post(guardTask(life_, [this, snapshot] { triggers_.apply(snapshot); }));
}

// ============================================================
// Command dispatch
// ============================================================

void ScanSession::handle(const Command& command) {
    log_->debug("command {} in {}", commandName(command), stateName());
    if (deferIfExporting(command)) return;

    std::visit([this](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, cmd::Start>) {
            onStart();
        } else if constexpr (std::is_same_v<T, cmd::Cancel>) {
            onCancel();
        } else if constexpr (std::is_same_v<T, cmd::Finish>) {
            onFinish();
        } else if constexpr (std::is_same_v<T, cmd::AddRoom>) {
            onAddRoom();
        } else if constexpr (std::is_same_v<T, cmd::Export>) {
            onExport();
        } else if constexpr (std::is_same_v<T, cmd::Pause>) {
            onPause();
        } else if constexpr (std::is_same_v<T, cmd::Resume>) {
            onResume();
        } else if constexpr (std::is_same_v<T, cmd::CapturePhoto>) {
            photos_.capture();
        } else if constexpr (std::is_same_v<T, cmd::SetAutoPhotoInterval>) {
            photos_.setInterval(c.interval_s);
            cfg_.auto_photo_interval_s = photos_.interval();
            cfg_.fnv_hash_u32 = computeConfigHash(cfg_);
        } else if constexpr (std::is_same_v<T, cmd::StartAudio>) {
            audio_.start();
        } else if constexpr (std::is_same_v<T, cmd::StopAudio>) {
            audio_.stop();
        } else if constexpr (std::is_same_v<T, cmd::Reset>) {
            onReset(c.clear_durable_world_map);
        }
    }, command);
}

bool ScanSession::deferIfExporting(const Command& command) {
    if (!in<state::Exporting>()) return false;

    const bool capture_changing = std::holds_alternative<cmd::Finish>(command) ||
                                  std::holds_alternative<cmd::AddRoom>(command) ||
                                  std::holds_alternative<cmd::Pause>(command) ||
                                  std::holds_alternative<cmd::Resume>(command) ||
                                  std::holds_alternative<cmd::Export>(command);
    if (!capture_changing) return false;

    if (std::holds_alternative<cmd::Export>(command)) {
        for (const auto& queued : deferred_) {
            if (std::holds_alternative<cmd::Export>(queued)) {
                log_->debug("export re-run already queued");
                return true;
            }
        }
    }
    deferred_.push_back(command);
    log_->info("{} deferred until export completes ({} queued)", commandName(command), deferred_.size());
    return true;
}

void ScanSession::replayDeferred() {
    while (!deferred_.empty() && !in<state::Exporting>()) {
        Command next = deferred_.front();
        deferred_.pop_front();
        log_->debug("replaying deferred {}", commandName(next));
        handle(next);
    }
}

// ============================================================
// Start / Cancel / Reset
// ============================================================

void ScanSession::onStart() {
    if (!in<state::Idle>() && !in<state::Terminal>()) {
        log_->debug("start ignored in {}", stateName());
        return;
    }
    if (camera_permission_pending_) {
        log_->debug("start ignored: camera permission request in flight");
        return;
    }
    if (!capture_.isSupported()) {
        emitError(ErrorKind::DeviceUnsupported, "Room capture is not supported on this device");
        return;
    }

    switch (permissions_.cameraAuthorization()) {
        case CameraAuthorization::Authorized:
            beginCapture();
            return;
        case CameraAuthorization::NotDetermined: {
            camera_permission_pending_ = true;
            const std::uint64_t ep = epoch_;
            std::weak_ptr<int> guard = life_;
            EventLoop& loop = loop_;
            log_->info("requesting camera access");
            permissions_.requestCameraAccess([this, guard, &loop, ep](bool granted) {
                loop.post(guardTask(guard, [this, ep, granted] { onCameraPermission(ep, granted); }));
            });
            return;
        }
        case CameraAuthorization::Denied:
        case CameraAuthorization::Restricted:
            emitError(ErrorKind::PermissionDenied, "Camera permission denied");
            return;
    }
}

void ScanSession::onCameraPermission(std::uint64_t ep, bool granted) {
    if (ep != epoch_) return;
    camera_permission_pending_ = false;
    if (!in<state::Idle>() && !in<state::Terminal>()) return;
    if (!granted) {
        emitError(ErrorKind::PermissionDenied, "Camera permission denied");
        return;
    }
    beginCapture();
}

void ScanSession::beginCapture() {
    TrackingRunConfig tc;
    tc.reset_tracking = true;
    tc.remove_existing_anchors = true;
    tracking_.run(tc);

    runCapture();
    transition(state::Running{});
    photos_.setActive(true);
    if (cfg_.audio_enabled && !audio_.isRecording()) {
        audio_.scheduleAutoStart(cfg_.audio_autostart_delay_s);
    }
    log_->info("scan '{}' started, {} room(s) carried over", cfg_.scan_name, aggregator_.roomCount());
}

void ScanSession::onCancel() {
    if ((in<state::Idle>() && !camera_permission_pending_) || in<state::Terminal>()) {
        log_->debug("cancel ignored in {}", stateName());
        return;
    }
    stopEverything(true);
    transition(state::Idle{});
    emitStatus(StatusKind::Canceled);
}

void ScanSession::onReset(bool clear_durable) {
    stopEverything(true);
    aggregator_.clear();
    photos_.reset();
    audio_.reset();
    triggers_.forgetBooleans();
    world_maps_.clear(clear_durable);
    world_map_saved_ = false;
    transition(state::Idle{});
    log_->info("session reset{}", clear_durable ? " (durable world map cleared)" : "");
}

void ScanSession::stopEverything(bool stop_audio) {
    ++epoch_;
    camera_permission_pending_ = false;
    snapshots_pending_ = 0;
    pause_announce_pending_ = false;
    resume_after_snapshot_ = false;

    reloc_.cancel();
    photos_.setActive(false);
    audio_.cancelAutoStart();
    if (stop_audio) audio_.stop();

    if (capture_open_id_ != 0) {
        capture_.stop(false);
        capture_open_id_ = 0;
    }
    captures_ending_.clear();
    aggregator_.invalidate();
    deferred_.clear();
    tracking_.pause();
}

void ScanSession::failToIdle(ErrorKind kind, const std::string& message) {
    stopEverything(false);
    transition(state::Idle{});
    emitError(kind, message);
}

// ============================================================
// Capture lifecycle
// ============================================================

void ScanSession::runCapture() {
    capture_open_id_ = ++next_capture_id_;
    CaptureConfig cc;
    cc.capture_id = capture_open_id_;
    capture_.run(cc);
    log_->debug("capture {} running", capture_open_id_);
}

void ScanSession::stopCapture(bool keep_tracking_alive) {
    if (capture_open_id_ == 0) return;
    captures_ending_.insert(capture_open_id_);
    log_->debug("capture {} stopping", capture_open_id_);
    capture_open_id_ = 0;
    capture_.stop(keep_tracking_alive);
}

void ScanSession::onRawRoomReady(RawRoomData raw) {
    if (captures_ending_.erase(raw.capture_id) == 0) {
        log_->debug("raw room for capture {} dropped (not awaited)", raw.capture_id);
        return;
    }
    if (raw.empty()) {
        log_->info("capture {} ended without data", raw.capture_id);
        checkFinish();
        return;
    }
    const std::uint64_t ep = epoch_;
    aggregator_.build(std::move(raw), [this, ep](const Outcome<ProcessedRoom>& o) { onRoomBuilt(ep, o); });
}

void ScanSession::onCaptureFailed(const ScanError& err) {
    if (capture_open_id_ != 0) {
        capture_open_id_ = 0;
    } else if (!captures_ending_.empty()) {
        captures_ending_.erase(captures_ending_.begin());
    } else {
        log_->debug("capture failure ignored: no capture in flight ({})", err.message);
        return;
    }
    failToIdle(ErrorKind::EngineFailure, err.message.empty() ? "Capture engine failed" : err.message);
}

void ScanSession::onRoomBuilt(std::uint64_t ep, const Outcome<ProcessedRoom>& outcome) {
    if (ep != epoch_) return;
    if (!outcome.ok()) {
        failToIdle(ErrorKind::RoomBuildFailure, "Failed to build captured room: " + outcome.error.message);
        return;
    }

    if (in<state::FinishPending>()) {
        checkFinish();
        return;
    }

    const bool can_export = in<state::Running>() || in<state::Paused>() || in<state::Idle>() ||
                            in<state::Terminal>();
    if (aggregator_.pendingExport() && can_export) {
        aggregator_.setPendingExport(false);
        startExport(returnTarget(), false);
        return;
    }
    emitStatus(StatusKind::OK);
}

// ============================================================
// Tracking feedback
// ============================================================

void ScanSession::onTrackingState(const TrackingState& s) {
    if (reloc_.active()) {
        reloc_.onTrackingState(s);
        return;
    }
    log_->debug("tracking {}", trackingStateName(s));
}

void ScanSession::onTrackingFailed(const ScanError& err) {
    if (reloc_.active()) {
        reloc_.onTrackingFailure(err);
        return;
    }
    if (in<state::Running>() || in<state::FinishPending>()) {
        failToIdle(ErrorKind::EngineFailure, "Tracking failed: " + err.message);
        return;
    }
    log_->warn("tracking failure in {} ignored: {}", stateName(), err.message);
}

// ============================================================
// Finish / Pause / AddRoom
// ============================================================

void ScanSession::onFinish() {
    if (!in<state::Running>()) {
        log_->debug("finish ignored in {}", stateName());
        return;
    }
    transition(state::FinishPending{});
    photos_.setActive(false);
    requestSnapshot();
    stopCapture(true);
    log_->info("finishing room {} ({} built so far)", aggregator_.roomCount() + 1, aggregator_.roomCount());
}

void ScanSession::onPause() {
    if (auto* fp = std::get_if<state::FinishPending>(&state_)) {
        fp->pause_after = true;
        log_->info("pause will follow the pending finish");
        return;
    }
    if (!in<state::Running>()) {
        log_->debug("pause ignored in {}", stateName());
        return;
    }
    photos_.setActive(false);
    requestSnapshot();
    stopCapture(true);
    transition(state::Paused{false});
    pause_announce_pending_ = true;
}

void ScanSession::onAddRoom() {
    if (in<state::Running>()) {
        aggregator_.setPendingExport(false);
        stopCapture(true);
        runCapture();
        log_->info("add room: capture restarted, {} room(s) kept", aggregator_.roomCount());
        return;
    }
    if (in<state::FinishPending>()) {
        aggregator_.setPendingExport(false);
        transition(state::Running{});
        runCapture();
        photos_.setActive(true);
        log_->info("add room: pending finish dropped, capture restarted");
        return;
    }
    log_->debug("add room ignored in {}", stateName());
}

void ScanSession::checkFinish() {
    auto* fp = std::get_if<state::FinishPending>(&state_);
    if (!fp) return;
    if (!captures_ending_.empty() || aggregator_.buildsInFlight() > 0 || snapshots_pending_ > 0) return;

    const bool pause_after = fp->pause_after;
    if (aggregator_.roomCount() == 0) {
        failToIdle(ErrorKind::RoomBuildFailure, "No room was captured");
        return;
    }

    if (cfg_.stop_audio_on_finish) audio_.stop();
    emit(PreviewEvent{});

    const ExportReturn after = (pause_after || cfg_.finish_policy == FinishPolicy::Pause)
                                   ? ExportReturn::Paused
                                   : ExportReturn::Complete;
    if (cfg_.export_on_finish || aggregator_.pendingExport()) {
        aggregator_.setPendingExport(false);
        startExport(after, true);
        return;
    }
    emitStatus(StatusKind::OK);
    enterAfterExport(after, true);
}

// ============================================================
// World map snapshot
// ============================================================

void ScanSession::requestSnapshot() {
    world_map_saved_ = false;
    ++snapshots_pending_;
    const std::uint64_t ep = epoch_;
    std::weak_ptr<int> guard = life_;
    EventLoop& loop = loop_;
    tracking_.snapshotWorldMap([this, guard, &loop, ep](Outcome<WorldMapRecord> o) {
        loop.post(guardTask(guard, [this, ep, o = std::move(o)]() mutable { onSnapshot(ep, std::move(o)); }));
    });
}

void ScanSession::onSnapshot(std::uint64_t ep, Outcome<WorldMapRecord> outcome) {
    if (ep != epoch_) return;
    if (!outcome.ok()) {
        log_->warn("world map snapshot failed ({}), continuing without a map", outcome.error.message);
        --snapshots_pending_;
        snapshotSettled();
        return;
    }

    WorldMapRecord record = std::move(*outcome.value);
    log_->info("world map captured: {} anchors, {} bytes", record.anchor_count, record.snapshot.size());

    WorldMapStore& store = world_maps_;
    EventLoop& loop = loop_;
    std::weak_ptr<int> guard = life_;
    background_.schedule([this, &store, &loop, guard, ep, record] {
        const bool stored = store.put(record);
        loop.post(guardTask(guard, [this, ep, stored] { onSnapshotStored(ep, stored); }));
    });
}

void ScanSession::onSnapshotStored(std::uint64_t ep, bool stored) {
    if (ep != epoch_) return;
    --snapshots_pending_;
    world_map_saved_ = world_map_saved_ || stored;
    if (!stored) log_->warn("world map could not be stored");
    snapshotSettled();
}

void ScanSession::snapshotSettled() {
    if (snapshots_pending_ > 0) return;

    if (pause_announce_pending_) {
        pause_announce_pending_ = false;
        if (auto* p = std::get_if<state::Paused>(&state_)) {
            p->world_map_saved = world_map_saved_;
            PausedEvent ev;
            ev.world_map_saved = world_map_saved_;
            emit(ev);
        }
    }

    checkFinish();

    if (resume_after_snapshot_) {
        resume_after_snapshot_ = false;
        onResume();
    }
}

// ============================================================
// Export
// ============================================================

void ScanSession::onExport() {
    if (in<state::FinishPending>()) {
        aggregator_.setPendingExport(true);
        log_->info("export will follow the pending finish");
        return;
    }
    if (aggregator_.roomCount() == 0 || in<state::Relocalizing>()) {
        aggregator_.setPendingExport(true);
        log_->info("export queued until a room is available");
        return;
    }
    startExport(returnTarget(), false);
}

ExportReturn ScanSession::returnTarget() const {
    if (in<state::Running>()) return ExportReturn::Running;
    if (in<state::Paused>()) return ExportReturn::Paused;
    if (in<state::Terminal>()) return ExportReturn::Complete;
    return ExportReturn::Idle;
}

void ScanSession::startExport(ExportReturn after, bool announce_pause) {
    state::Exporting ex;
    ex.after = after;
    ex.announce_pause = announce_pause;
    transition(ex);

    const std::uint64_t ep = epoch_;
    photos_.whenIdle([this, ep] {
        auto* exporting = std::get_if<state::Exporting>(&state_);
        if (ep != epoch_ || !exporting) return;
        exporting->room_count = aggregator_.roomCount();

        ExportRequest req;
        req.export_dir = resolvedExportDir(cfg_);
        req.scan_name = cfg_.scan_name;
        req.model_extension = cfg_.model_extension;
        req.mode = exportModeOf(cfg_);
        req.send_file_loc = cfg_.send_file_loc;
        req.audio_url = audio_.recordingUrl();
        req.photo_urls = photos_.photoUrls();
        aggregator_.exportRooms(std::move(req),
                                [this, ep](const Outcome<ExportResult>& o) { onExportDone(ep, o); });
    });
}

void ScanSession::onExportDone(std::uint64_t ep, const Outcome<ExportResult>& outcome) {
    if (ep != epoch_) return;
    auto* ex = std::get_if<state::Exporting>(&state_);
    if (!ex) return;
    const ExportReturn after = ex->after;
    const bool announce = ex->announce_pause;

    if (outcome.ok()) {
        ExportedEvent ev;
        ev.result = *outcome.value;
        ev.room_count = ex->room_count;
        log_->info("exported {} room(s), {} photo(s){}", ev.room_count, ev.result.photo_urls.size(),
                   ev.result.audio_url ? ", with audio" : "");
        emit(ev);
        emitStatus(StatusKind::OK);
    } else {
        emitError(ErrorKind::ExportFailure, outcome.error.message);
    }

    enterAfterExport(after, announce);
    replayDeferred();
}

void ScanSession::enterAfterExport(ExportReturn after, bool announce_pause) {
    switch (after) {
        case ExportReturn::Running:
            transition(state::Running{});
            photos_.setActive(true);
            break;
        case ExportReturn::Paused: {
            photos_.setActive(false);
            transition(state::Paused{world_map_saved_});
            if (announce_pause) {
                PausedEvent ev;
                ev.world_map_saved = world_map_saved_;
                emit(ev);
            }
            break;
        }
        case ExportReturn::Complete:
            photos_.setActive(false);
            tracking_.pause();
            transition(state::Terminal{StatusKind::OK});
            break;
        case ExportReturn::Idle:
            transition(state::Idle{});
            break;
    }
}

// ============================================================
// Resume / relocalization
// ============================================================

void ScanSession::onResume() {
    if (in<state::Relocalizing>()) {
        log_->debug("resume ignored: relocalization #{} in flight", reloc_.attempt());
        return;
    }
    if (in<state::FinishPending>()) {
        log_->debug("resume ignored while a finish is pending");
        return;
    }
    if (in<state::Idle>() || in<state::Terminal>()) {
        log_->debug("resume ignored in {}: no scan to resume", stateName());
        return;
    }
    if (snapshots_pending_ > 0) {
        resume_after_snapshot_ = true;
        log_->info("resume waits for the world map snapshot");
        return;
    }
    resumeNow();
}

void ScanSession::resumeNow() {
    aggregator_.setPendingExport(false);
    stopCapture(true);
    photos_.setActive(false);

    auto map = world_maps_.get();
    if (!map) {
        log_->info("resume: no saved world map, starting fresh");
        emitStatus(StatusKind::NoWorldMap, std::string("No saved world map; starting a new scan"));
        restartAfterResume(false, true);
        return;
    }

    state::Relocalizing r;
    r.anchor_count = map->anchor_count;
    transition(r);
    const std::uint64_t attempt = reloc_.begin(*map);
    if (auto* cur = std::get_if<state::Relocalizing>(&state_)) cur->attempt = attempt;
}

void ScanSession::onRelocalizationFinished(RelocalizationResult result) {
    if (!in<state::Relocalizing>()) return;
    const bool relocated = result == RelocalizationResult::Relocated;
    restartAfterResume(relocated, !relocated);
}

void ScanSession::restartAfterResume(bool relocalized, bool fresh_tracking) {
    if (fresh_tracking) {
        TrackingRunConfig tc;
        tc.reset_tracking = true;
        tc.remove_existing_anchors = true;
        tracking_.run(tc);
    }
    runCapture();
    transition(state::Running{});
    photos_.setActive(true);

    ResumedEvent ev;
    ev.relocalized = relocalized;
    emit(ev);

    if (aggregator_.pendingExport() && aggregator_.roomCount() > 0) {
        aggregator_.setPendingExport(false);
        startExport(ExportReturn::Running, false);
    }
}

// ============================================================
// Events
// ============================================================

void ScanSession::transition(SessionState next) {
    const char* from = stateName();
    state_ = std::move(next);
    log_->info("state {} -> {}", from, stateName());
}

void ScanSession::emit(SessionEvent ev) {
    if (log_->should_log(spdlog::level::debug)) {
        log_->debug("event {}", describeEvent(ev));
    }
    if (listener_) listener_(ev);
}

void ScanSession::emitStatus(StatusKind kind, std::optional<std::string> message) {
    StatusEvent ev;
    ev.kind = kind;
    ev.message = std::move(message);
    emit(ev);
}

void ScanSession::emitError(ErrorKind kind, const std::string& message) {
    log_->error("{}: {}", errorKindName(kind), message);
    StatusEvent ev;
    ev.kind = StatusKind::Error;
    ev.error = kind;
    ev.message = message;
    emit(ev);
}

} // namespace scanorch
