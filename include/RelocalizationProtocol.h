#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "Collaborators.h"
#include "EventLoop.h"
#include "SessionEvents.h"

namespace spdlog { class logger; }

namespace scanorch {

class WorldMapStore;

enum class RelocalizationResult : int { Relocated = 0, Failed, TimedOut };

const char* relocalizationResultName(RelocalizationResult r);

// ============================================================
// One relocalization attempt at a time against a saved world map.
//
// begin() runs tracking with the map (reset tracking, remove anchors), emits
// `relocalizing` and arms the timeout. Tracking feedback then decides:
//   normal                 -> relocated
//   limited(relocalizing)  -> `relocalizing` re-emitted
//   unavailable / failure  -> relocalization_failed
//   timeout                -> relocalization_timeout
// Every outcome consumes the stored map and calls on_finished exactly once.
// The timeout re-checks the attempt id, so a late firing after an earlier
// outcome does nothing.
// ============================================================
class RelocalizationProtocol {
public:
    using Emit = std::function<void(SessionEvent)>;
    using Finished = std::function<void(RelocalizationResult)>;

    static constexpr double kDefaultTimeoutS = 6.0;

    RelocalizationProtocol(EventLoop& loop,
                           SpatialTrackingSession& tracking,
                           WorldMapStore& store,
                           std::shared_ptr<spdlog::logger> log,
                           Emit emit,
                           Finished on_finished);

    void setTimeout(double timeout_s);
    double timeout() const { return timeout_s_; }

    std::uint64_t begin(const WorldMapRecord& map);

    void onTrackingState(const TrackingState& state);
    void onTrackingFailure(const ScanError& err);

    // Abandons the current attempt without emitting anything.
    void cancel();

    bool active() const { return active_; }
    std::uint64_t attempt() const { return attempt_; }

private:
    void onTimeout(std::uint64_t attempt);
    void finish(RelocalizationResult result, const std::string& message);

    EventLoop& loop_;
    SpatialTrackingSession& tracking_;
    WorldMapStore& store_;
    std::shared_ptr<spdlog::logger> log_;
    Emit emit_;
    Finished on_finished_;

    double timeout_s_ = kDefaultTimeoutS;
    std::uint64_t attempt_ = 0;
    bool active_ = false;
    std::int32_t anchor_count_ = 0;
    TimerHandle timeout_;
};

} // namespace scanorch
