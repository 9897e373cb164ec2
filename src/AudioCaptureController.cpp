#include "AudioCaptureController.h"

#include "Filesystem.h"

#include <spdlog/spdlog.h>

namespace scanorch {

AudioCaptureController::AudioCaptureController(EventLoop& loop,
                                               AudioCaptureEngine& engine,
                                               Filesystem& fs,
                                               std::shared_ptr<spdlog::logger> log,
                                               Emit emit)
    : loop_(loop), engine_(engine), fs_(fs), log_(std::move(log)), emit_(std::move(emit)) {}

AudioCaptureController::~AudioCaptureController() {
    if (recording_) engine_.stop();
    if (writer_) writer_->finalize();
}

void AudioCaptureController::configure(const SessionConfigV1& cfg) {
    export_dir_ = resolvedExportDir(cfg);
    scan_name_ = cfg.scan_name;
    format_.sample_rate_hz = cfg.audio_sample_rate_hz;
    format_.channels = 1;
    format_.chunk_frames = cfg.audio_chunk_frames;
}

void AudioCaptureController::start() {
    if (recording_ || starting_) {
        log_->debug("audio: start ignored, already {}", recording_ ? "recording" : "starting");
        return;
    }
    cancelAutoStart();
    if (finishing_) {
        // The previous file is still being finalized; start once it is.
        restart_after_finish_ = true;
        return;
    }
    starting_ = true;
    const std::uint64_t gen = ++generation_;
    std::weak_ptr<int> guard = life_;
    EventLoop& loop = loop_;
    engine_.requestPermission([this, gen, guard, &loop](bool granted) {
        loop.post(guardTask(guard, [this, gen, granted] { onPermission(gen, granted); }));
    });
}

void AudioCaptureController::onPermission(std::uint64_t gen, bool granted) {
    if (gen != generation_ || !starting_) return;
    starting_ = false;

    if (!granted) {
        fail(ErrorKind::PermissionDenied, "Microphone permission denied");
        return;
    }

    std::string error;
    if (!engine_.configureRoute(error)) {
        fail(ErrorKind::AudioEngineFailure, "Audio route: " + error);
        return;
    }
    if (!fs_.createDirectories(export_dir_, error)) {
        fail(ErrorKind::AudioEngineFailure, error);
        return;
    }

    path_ = joinPath(export_dir_, scan_name_ + ".wav");
    auto out = fs_.openOutput(path_, error);
    if (!out) {
        fail(ErrorKind::AudioEngineFailure, error);
        return;
    }
    writer_ = std::make_unique<WavWriter>(std::move(out), format_.sample_rate_hz, format_.channels);
    write_warned_ = false;

    std::weak_ptr<int> guard = life_;
    EventLoop& loop = loop_;
    auto on_chunk = [this, gen, guard, &loop](std::vector<std::int16_t> samples) {
        loop.post(guardTask(guard, [this, gen, samples = std::move(samples)]() mutable {
            onChunk(gen, std::move(samples));
        }));
    };
    auto on_failed = [this, gen, guard, &loop](ScanError err) {
        loop.post(guardTask(guard, [this, gen, err] { onEngineFailure(gen, err); }));
    };

    if (!engine_.start(format_, std::move(on_chunk), std::move(on_failed), error)) {
        writer_.reset();
        fs_.remove(path_);
        fail(ErrorKind::AudioEngineFailure, "Audio engine start: " + error);
        return;
    }

    recording_ = true;
    const std::string url = toFileUrl(path_);
    artifact_ = AudioArtifact{url, AudioStatus::Started};
    log_->info("audio: recording to {} ({} Hz, {} frames/chunk)", path_, format_.sample_rate_hz,
               format_.chunk_frames);

    AudioEvent ev;
    ev.status = AudioStatus::Started;
    ev.url = url;
    emit_(ev);
}

void AudioCaptureController::onChunk(std::uint64_t gen, std::vector<std::int16_t> samples) {
    if (gen != generation_ || !writer_) return;

    if (!writer_->append(samples) && !write_warned_) {
        write_warned_ = true;
        log_->warn("audio: write to {} failed, continuing to stream", path_);
    }

    AudioDataEvent ev;
    ev.sample_rate_hz = format_.sample_rate_hz;
    ev.timestamp_ms = loop_.nowMs();
    ev.chunk = std::move(samples);
    emit_(ev);
}

void AudioCaptureController::stop() {
    cancelAutoStart();
    if (restart_after_finish_) {
        restart_after_finish_ = false;
        return;
    }
    if (starting_) {
        // Permission still pending: drop it.
        starting_ = false;
        ++generation_;
        return;
    }
    if (!recording_) return;

    recording_ = false;
    finishing_ = true;
    engine_.stop();

    // Chunks the audio thread posted before stop() are ahead of this task.
    const std::uint64_t gen = generation_;
    loop_.post(guardTask(life_, [this, gen] { finishRecording(gen); }));
}

void AudioCaptureController::finishRecording(std::uint64_t gen) {
    if (gen != generation_ || !finishing_) return;
    finishing_ = false;
    if (!writer_) return;

    const std::uint32_t bytes = writer_->dataBytes();
    if (!writer_->finalize()) {
        log_->warn("audio: finalizing {} failed", path_);
    }
    writer_.reset();

    const std::string url = toFileUrl(path_);
    artifact_ = AudioArtifact{url, AudioStatus::Stopped};
    log_->info("audio: stopped, {} bytes of PCM in {}", bytes, path_);

    AudioEvent ev;
    ev.status = AudioStatus::Stopped;
    ev.url = url;
    emit_(ev);

    if (restart_after_finish_) {
        restart_after_finish_ = false;
        start();
    }
}

void AudioCaptureController::onEngineFailure(std::uint64_t gen, const ScanError& err) {
    if (gen != generation_ || (!recording_ && !writer_)) return;

    recording_ = false;
    finishing_ = false;
    restart_after_finish_ = false;
    engine_.stop();
    if (writer_) {
        writer_->finalize();
        writer_.reset();
    }
    if (artifact_) artifact_->status = AudioStatus::Error;
    fail(ErrorKind::AudioEngineFailure, err.message.empty() ? "Audio engine failure" : err.message);
}

void AudioCaptureController::fail(ErrorKind kind, const std::string& message) {
    log_->error("audio: {} ({})", message, errorKindName(kind));
    AudioEvent ev;
    ev.status = AudioStatus::Error;
    ev.error = message;
    emit_(ev);
}

void AudioCaptureController::scheduleAutoStart(double delay_s) {
    auto_start_ = loop_.schedule(delay_s, [this] { start(); });
}

void AudioCaptureController::cancelAutoStart() {
    auto_start_.cancel();
}

void AudioCaptureController::reset() {
    cancelAutoStart();
    if (recording_) engine_.stop();
    if (writer_) {
        writer_->finalize();
        writer_.reset();
    }
    ++generation_;
    starting_ = false;
    recording_ = false;
    finishing_ = false;
    restart_after_finish_ = false;
    artifact_.reset();
}

std::optional<std::string> AudioCaptureController::recordingUrl() const {
    if (!artifact_) return std::nullopt;
    return artifact_->file_url;
}

} // namespace scanorch
