#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "Collaborators.h"
#include "EventLoop.h"
#include "SessionConfig.h"
#include "SessionEvents.h"

namespace spdlog { class logger; }

namespace scanorch {

class Filesystem;

// Still capture from the live tracking frame: manual, plus an optional
// interval timer that only runs while capture is active. Conversion and
// encoding happen on the background worker; the artifact is recorded and
// emitted back on the loop.
class PhotoCaptureController {
public:
    using Emit = std::function<void(SessionEvent)>;
    using WallClockMs = std::function<std::int64_t()>;

    PhotoCaptureController(EventLoop& loop,
                           BackgroundTask& background,
                           SpatialTrackingSession& tracking,
                           Filesystem& fs,
                           std::shared_ptr<spdlog::logger> log,
                           Emit emit);

    PhotoCaptureController(const PhotoCaptureController&) = delete;
    PhotoCaptureController& operator=(const PhotoCaptureController&) = delete;

    void configure(const SessionConfigV1& cfg);

    // Timestamp source for file names and events. Defaults to the system clock.
    void setClock(WallClockMs clock) { clock_ = std::move(clock); }

    void capture();

    // 0 (or negative) disables. Takes effect immediately if active.
    void setInterval(double interval_s);
    double interval() const { return interval_s_; }

    // Arms or disarms the interval timer.
    void setActive(bool active);
    bool intervalArmed() const { return interval_timer_.armed(); }

    // Runs task once no capture is being encoded (immediately if none is).
    void whenIdle(Task task);

    // Drops in-flight captures and the artifact list.
    void reset();

    const std::vector<PhotoArtifact>& photos() const { return photos_; }
    std::vector<std::string> photoUrls() const;
    int inFlight() const { return in_flight_; }

private:
    void rearm();
    void onEncoded(std::uint64_t gen, std::string path, std::int64_t ts_ms, bool ok, std::string error);
    void runIdleWaiters();

    EventLoop& loop_;
    BackgroundTask& background_;
    SpatialTrackingSession& tracking_;
    Filesystem& fs_;
    std::shared_ptr<spdlog::logger> log_;
    Emit emit_;
    WallClockMs clock_;

    std::string export_dir_;
    std::string scan_name_ = "Room";

    std::shared_ptr<int> life_ = std::make_shared<int>(0);
    std::uint64_t generation_ = 0;
    std::uint32_t sequence_ = 0;
    int in_flight_ = 0;
    std::vector<Task> idle_waiters_;

    double interval_s_ = 0.0;
    bool active_ = false;
    TimerHandle interval_timer_;

    std::vector<PhotoArtifact> photos_;
};

} // namespace scanorch
