#pragma once

#include <variant>

namespace scanorch {

// Discrete commands accepted by ScanSession.
namespace cmd {
struct Start {};
struct Cancel {};
struct Finish {};
struct AddRoom {};
struct Export {};
struct Pause {};
struct Resume {};
struct CapturePhoto {};
struct SetAutoPhotoInterval {
    double interval_s = 0.0; // 0 disables
};
struct StartAudio {};
struct StopAudio {};
struct Reset {
    bool clear_durable_world_map = false;
};
} // namespace cmd

using Command = std::variant<cmd::Start,
                             cmd::Cancel,
                             cmd::Finish,
                             cmd::AddRoom,
                             cmd::Export,
                             cmd::Pause,
                             cmd::Resume,
                             cmd::CapturePhoto,
                             cmd::SetAutoPhotoInterval,
                             cmd::StartAudio,
                             cmd::StopAudio,
                             cmd::Reset>;

const char* commandName(const Command& c);

} // namespace scanorch
