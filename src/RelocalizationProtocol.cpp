#include "RelocalizationProtocol.h"

#include "WorldMapStore.h"

#include <cmath>

#include <spdlog/spdlog.h>

namespace scanorch {

const char* relocalizationResultName(RelocalizationResult r) {
    switch (r) {
        case RelocalizationResult::Relocated: return "relocated";
        case RelocalizationResult::Failed:    return "failed";
        case RelocalizationResult::TimedOut:  return "timed_out";
    }
    return "unknown";
}

RelocalizationProtocol::RelocalizationProtocol(EventLoop& loop,
                                               SpatialTrackingSession& tracking,
                                               WorldMapStore& store,
                                               std::shared_ptr<spdlog::logger> log,
                                               Emit emit,
                                               Finished on_finished)
    : loop_(loop),
      tracking_(tracking),
      store_(store),
      log_(std::move(log)),
      emit_(std::move(emit)),
      on_finished_(std::move(on_finished)) {}

void RelocalizationProtocol::setTimeout(double timeout_s) {
    if (!std::isfinite(timeout_s) || timeout_s <= 0.0) return;
    timeout_s_ = timeout_s;
}

std::uint64_t RelocalizationProtocol::begin(const WorldMapRecord& map) {
    const std::uint64_t id = ++attempt_;
    active_ = true;
    anchor_count_ = map.anchor_count;

    TrackingRunConfig cfg;
    cfg.initial_world_map = map;
    cfg.reset_tracking = true;
    cfg.remove_existing_anchors = true;
    tracking_.run(cfg);

    log_->info("relocalization #{}: {} anchors, timeout {:.1f} s", id, anchor_count_, timeout_s_);

    RelocalizationStatusEvent starting;
    starting.phase = RelocalizationPhase::Starting;
    starting.anchor_count = anchor_count_;
    starting.message = "Loading saved world map";
    emit_(starting);

    StatusEvent status;
    status.kind = StatusKind::Relocalizing;
    status.anchor_count = anchor_count_;
    emit_(status);

    timeout_ = loop_.schedule(timeout_s_, [this, id] { onTimeout(id); });
    return id;
}

void RelocalizationProtocol::onTrackingState(const TrackingState& state) {
    if (!active_) return;

    switch (state.kind) {
        case TrackingStateKind::Normal:
            finish(RelocalizationResult::Relocated, "Relocalized to saved world map");
            return;
        case TrackingStateKind::Unavailable:
            finish(RelocalizationResult::Failed, "Tracking unavailable");
            return;
        case TrackingStateKind::Limited:
            if (state.reason == LimitedReason::Relocalizing) {
                RelocalizationStatusEvent ev;
                ev.phase = RelocalizationPhase::Relocalizing;
                ev.anchor_count = anchor_count_;
                ev.message = "Move the device slowly over previously scanned areas";
                emit_(ev);

                StatusEvent status;
                status.kind = StatusKind::Relocalizing;
                status.anchor_count = anchor_count_;
                emit_(status);
            } else {
                log_->debug("relocalization #{}: tracking {}", attempt_, trackingStateName(state));
            }
            return;
    }
}

void RelocalizationProtocol::onTrackingFailure(const ScanError& err) {
    if (!active_) return;
    finish(RelocalizationResult::Failed, err.message.empty() ? "Tracking failed" : err.message);
}

void RelocalizationProtocol::onTimeout(std::uint64_t attempt) {
    if (!active_ || attempt != attempt_) {
        log_->debug("relocalization: stale timeout for #{} ignored", attempt);
        return;
    }
    finish(RelocalizationResult::TimedOut, "Relocalization timed out");
}

void RelocalizationProtocol::finish(RelocalizationResult result, const std::string& message) {
    active_ = false;
    timeout_.cancel();
    store_.clear(true);

    StatusEvent status;
    status.message = message;
    RelocalizationStatusEvent phase;
    phase.message = message;
    phase.anchor_count = anchor_count_;
    switch (result) {
        case RelocalizationResult::Relocated:
            status.kind = StatusKind::Relocated;
            phase.phase = RelocalizationPhase::Success;
            log_->info("relocalization #{}: relocated", attempt_);
            break;
        case RelocalizationResult::Failed:
            status.kind = StatusKind::RelocalizationFailed;
            status.error = ErrorKind::RelocalizationFailed;
            phase.phase = RelocalizationPhase::Unavailable;
            log_->warn("relocalization #{}: failed ({})", attempt_, message);
            break;
        case RelocalizationResult::TimedOut:
            status.kind = StatusKind::RelocalizationTimeout;
            status.error = ErrorKind::RelocalizationTimeout;
            phase.phase = RelocalizationPhase::Unavailable;
            log_->warn("relocalization #{}: timed out after {:.1f} s", attempt_, timeout_s_);
            break;
    }
    emit_(phase);
    emit_(status);

    if (on_finished_) on_finished_(result);
}

void RelocalizationProtocol::cancel() {
    if (!active_) return;
    active_ = false;
    timeout_.cancel();
    log_->debug("relocalization #{}: cancelled", attempt_);
}

} // namespace scanorch
