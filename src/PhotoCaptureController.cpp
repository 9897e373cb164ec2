#include "PhotoCaptureController.h"

#include "Filesystem.h"
#include "MediaEncoding.h"

#include <chrono>
#include <cmath>

#include <spdlog/spdlog.h>

namespace scanorch {

namespace {

std::int64_t systemClockMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

PhotoCaptureController::PhotoCaptureController(EventLoop& loop,
                                               BackgroundTask& background,
                                               SpatialTrackingSession& tracking,
                                               Filesystem& fs,
                                               std::shared_ptr<spdlog::logger> log,
                                               Emit emit)
    : loop_(loop),
      background_(background),
      tracking_(tracking),
      fs_(fs),
      log_(std::move(log)),
      emit_(std::move(emit)),
      clock_(systemClockMs) {}

void PhotoCaptureController::configure(const SessionConfigV1& cfg) {
    export_dir_ = resolvedExportDir(cfg);
    scan_name_ = cfg.scan_name;
    setInterval(cfg.auto_photo_interval_s);
}

void PhotoCaptureController::capture() {
    auto frame = tracking_.currentFrame();
    if (!frame) {
        log_->warn("photo: no current frame");
        PhotoEvent ev;
        ev.error = "No current frame available";
        emit_(ev);
        return;
    }

    const std::int64_t ts = clock_();
    const std::uint32_t seq = ++sequence_;
    const std::string path =
        joinPath(export_dir_, scan_name_ + "_" + std::to_string(ts) + "_" + std::to_string(seq) + ".ppm");
    const std::string dir = export_dir_;
    const std::uint64_t gen = generation_;
    ++in_flight_;

    Filesystem& fs = fs_;
    EventLoop& loop = loop_;
    std::weak_ptr<int> guard = life_;
    background_.schedule([this, &fs, &loop, guard, gen, dir, path, ts, shot = std::move(*frame)] {
        bool ok = false;
        std::string error;
        RgbImage image;
        if (!convertYCbCr420ToRgb(shot, image)) {
            error = "Frame planes do not match " + std::to_string(shot.width) + "x" +
                    std::to_string(shot.height);
        } else if (fs.createDirectories(dir, error) && fs.writeFile(path, encodePpm(image), error)) {
            ok = true;
        }
        loop.post(guardTask(guard, [this, gen, path, ts, ok, error] { onEncoded(gen, path, ts, ok, error); }));
    });
}

void PhotoCaptureController::onEncoded(std::uint64_t gen, std::string path, std::int64_t ts_ms, bool ok,
                                       std::string error) {
    if (gen != generation_) return;
    --in_flight_;

    PhotoEvent ev;
    ev.timestamp_ms = ts_ms;
    if (!ok) {
        log_->warn("photo: capture failed: {}", error);
        ev.error = error;
    } else {
        const std::string url = toFileUrl(path);
        photos_.push_back(PhotoArtifact{url, ts_ms});
        log_->debug("photo: {} ({} total)", path, photos_.size());
        ev.url = url;
    }
    emit_(ev);

    if (in_flight_ == 0) runIdleWaiters();
}

void PhotoCaptureController::runIdleWaiters() {
    std::vector<Task> waiters;
    waiters.swap(idle_waiters_);
    for (auto& w : waiters) w();
}

void PhotoCaptureController::whenIdle(Task task) {
    if (!task) return;
    if (in_flight_ == 0) {
        task();
        return;
    }
    idle_waiters_.push_back(std::move(task));
}

void PhotoCaptureController::setInterval(double interval_s) {
    interval_s_ = (std::isfinite(interval_s) && interval_s > 0.0) ? interval_s : 0.0;
    rearm();
}

void PhotoCaptureController::setActive(bool active) {
    if (active_ == active) return;
    active_ = active;
    rearm();
}

void PhotoCaptureController::rearm() {
    interval_timer_.cancel();
    if (!active_ || interval_s_ <= 0.0) return;
    interval_timer_ = loop_.scheduleRepeating(interval_s_, [this] { capture(); });
    log_->debug("photo: interval timer every {:.2f} s", interval_s_);
}

void PhotoCaptureController::reset() {
    ++generation_;
    in_flight_ = 0;
    idle_waiters_.clear();
    photos_.clear();
    sequence_ = 0;
    active_ = false;
    interval_timer_.cancel();
}

std::vector<std::string> PhotoCaptureController::photoUrls() const {
    std::vector<std::string> urls;
    urls.reserve(photos_.size());
    for (const auto& p : photos_) urls.push_back(p.file_url);
    return urls;
}

} // namespace scanorch
