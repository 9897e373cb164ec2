#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <optional>

#include "SessionCommands.h"

namespace scanorch {

// Monotonic "bump to fire" value; absent means the channel was never bumped.
using TriggerToken = std::optional<double>;

enum class TriggerChannel : int {
    Finish = 0,
    AddRoom,
    Export,
    CapturePhoto,
    Resume,
    Pause,
    Count
};

// True iff next is present and differs from last.
inline bool shouldFire(const TriggerToken& last, const TriggerToken& next) {
    return next.has_value() && (!last.has_value() || *last != *next);
}

// Last-seen token per channel.
class TriggerDedup {
public:
    // Records next before returning true, so a re-entrant delivery of the
    // same token inside the bound action is rejected.
    bool accept(TriggerChannel ch, const TriggerToken& next) {
        TriggerToken& last = last_[index(ch)];
        if (!shouldFire(last, next)) return false;
        last = next;
        return true;
    }

    const TriggerToken& last(TriggerChannel ch) const { return last_[index(ch)]; }

private:
    static std::size_t index(TriggerChannel ch) { return static_cast<std::size_t>(ch); }

    std::array<TriggerToken, static_cast<std::size_t>(TriggerChannel::Count)> last_{};
};

// One observation of the externally driven inputs.
struct TriggerSnapshot {
    std::optional<bool> running;
    std::optional<bool> audio_running;
    TriggerToken finish;
    TriggerToken add_room;
    TriggerToken export_scan;
    TriggerToken capture_photo;
    TriggerToken resume;
    TriggerToken pause;
};

// Turns snapshots into commands: booleans fire on change, tokens through
// TriggerDedup. Dispatch order within one snapshot: running, audio, finish,
// add_room, export, capture_photo, pause, resume.
class TriggerInputs {
public:
    explicit TriggerInputs(std::function<void(const Command&)> sink) : sink_(std::move(sink)) {}

    void apply(const TriggerSnapshot& s);

    // Forget the remembered booleans. Tokens are kept, so a token consumed
    // before a Reset never fires again.
    void forgetBooleans();

    const TriggerDedup& dedup() const { return dedup_; }

private:
    void emit(const Command& c) {
        if (sink_) sink_(c);
    }

    std::function<void(const Command&)> sink_;
    TriggerDedup dedup_;
    std::optional<bool> running_;
    std::optional<bool> audio_running_;
};

} // namespace scanorch
