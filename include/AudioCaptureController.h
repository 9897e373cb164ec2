#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "Collaborators.h"
#include "EventLoop.h"
#include "MediaEncoding.h"
#include "SessionConfig.h"
#include "SessionEvents.h"

namespace spdlog { class logger; }

namespace scanorch {

class Filesystem;

// ============================================================
// Microphone recording, independent of the scan state.
//
// start(): permission -> route -> <exportDir>/<scanName>.wav -> engine.
// Chunks are posted from the audio thread to the loop, appended to the
// file there and emitted as AudioData. stop() finalizes the file after every
// chunk posted before it; a start() issued meanwhile waits for that. Failures emit Audio{error} and never touch the
// scan session.
// ============================================================
class AudioCaptureController {
public:
    using Emit = std::function<void(SessionEvent)>;

    AudioCaptureController(EventLoop& loop,
                           AudioCaptureEngine& engine,
                           Filesystem& fs,
                           std::shared_ptr<spdlog::logger> log,
                           Emit emit);
    ~AudioCaptureController();

    AudioCaptureController(const AudioCaptureController&) = delete;
    AudioCaptureController& operator=(const AudioCaptureController&) = delete;

    void configure(const SessionConfigV1& cfg);

    void start();
    void stop();

    void scheduleAutoStart(double delay_s);
    void cancelAutoStart();

    // Stops without emitting and forgets the artifact.
    void reset();

    bool isRecording() const { return recording_; }
    bool isStarting() const { return starting_; }
    bool autoStartArmed() const { return auto_start_.armed(); }

    const std::optional<AudioArtifact>& artifact() const { return artifact_; }
    std::optional<std::string> recordingUrl() const;

private:
    void onPermission(std::uint64_t gen, bool granted);
    void onChunk(std::uint64_t gen, std::vector<std::int16_t> samples);
    void onEngineFailure(std::uint64_t gen, const ScanError& err);
    void finishRecording(std::uint64_t gen);
    void fail(ErrorKind kind, const std::string& message);

    EventLoop& loop_;
    AudioCaptureEngine& engine_;
    Filesystem& fs_;
    std::shared_ptr<spdlog::logger> log_;
    Emit emit_;

    std::string export_dir_;
    std::string scan_name_ = "Room";
    AudioFormat format_{};

    std::shared_ptr<int> life_ = std::make_shared<int>(0);
    std::uint64_t generation_ = 0;
    bool starting_ = false;
    bool recording_ = false;
    bool finishing_ = false;
    bool restart_after_finish_ = false;
    std::unique_ptr<WavWriter> writer_;
    std::string path_;
    bool write_warned_ = false;
    std::optional<AudioArtifact> artifact_;
    TimerHandle auto_start_;
};

} // namespace scanorch
