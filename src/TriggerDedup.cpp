#include "TriggerDedup.h"

#include <type_traits>

namespace scanorch {

const char* commandName(const Command& c) {
    return std::visit([](const auto& v) -> const char* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, cmd::Start>) return "Start";
        else if constexpr (std::is_same_v<T, cmd::Cancel>) return "Cancel";
        else if constexpr (std::is_same_v<T, cmd::Finish>) return "Finish";
        else if constexpr (std::is_same_v<T, cmd::AddRoom>) return "AddRoom";
        else if constexpr (std::is_same_v<T, cmd::Export>) return "Export";
        else if constexpr (std::is_same_v<T, cmd::Pause>) return "Pause";
        else if constexpr (std::is_same_v<T, cmd::Resume>) return "Resume";
        else if constexpr (std::is_same_v<T, cmd::CapturePhoto>) return "CapturePhoto";
        else if constexpr (std::is_same_v<T, cmd::SetAutoPhotoInterval>) return "SetAutoPhotoInterval";
        else if constexpr (std::is_same_v<T, cmd::StartAudio>) return "StartAudio";
        else if constexpr (std::is_same_v<T, cmd::StopAudio>) return "StopAudio";
        else return "Reset";
    }, c);
}

void TriggerInputs::apply(const TriggerSnapshot& s) {
    if (s.running && s.running != running_) {
        const bool was_known = running_.has_value();
        running_ = s.running;
        if (*s.running) {
            emit(cmd::Start{});
        } else if (was_known) {
            emit(cmd::Cancel{});
        }
    }

    if (s.audio_running && s.audio_running != audio_running_) {
        const bool was_known = audio_running_.has_value();
        audio_running_ = s.audio_running;
        if (*s.audio_running) {
            emit(cmd::StartAudio{});
        } else if (was_known) {
            emit(cmd::StopAudio{});
        }
    }

    if (dedup_.accept(TriggerChannel::Finish, s.finish)) emit(cmd::Finish{});
    if (dedup_.accept(TriggerChannel::AddRoom, s.add_room)) emit(cmd::AddRoom{});
    if (dedup_.accept(TriggerChannel::Export, s.export_scan)) emit(cmd::Export{});
    if (dedup_.accept(TriggerChannel::CapturePhoto, s.capture_photo)) emit(cmd::CapturePhoto{});
    if (dedup_.accept(TriggerChannel::Pause, s.pause)) emit(cmd::Pause{});
    if (dedup_.accept(TriggerChannel::Resume, s.resume)) emit(cmd::Resume{});
}

void TriggerInputs::forgetBooleans() {
    running_.reset();
    audio_running_.reset();
}

} // namespace scanorch
