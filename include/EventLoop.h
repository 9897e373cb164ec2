#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace scanorch {

using Task = std::function<void()>;

// Wraps task so that it does nothing once owner has been destroyed.
inline Task guardTask(std::weak_ptr<void> owner, Task task) {
    return [owner = std::move(owner), task = std::move(task)] {
        if (!owner.expired()) task();
    };
}

// Cancellable handle to a scheduled task. Cancels on destruction.
class TimerHandle {
public:
    TimerHandle() = default;
    explicit TimerHandle(std::shared_ptr<bool> cancelled) : cancelled_(std::move(cancelled)) {}
    ~TimerHandle() { cancel(); }

    TimerHandle(const TimerHandle&) = delete;
    TimerHandle& operator=(const TimerHandle&) = delete;
    TimerHandle(TimerHandle&& other) noexcept : cancelled_(std::move(other.cancelled_)) {}
    TimerHandle& operator=(TimerHandle&& other) noexcept {
        if (this != &other) {
            cancel();
            cancelled_ = std::move(other.cancelled_);
        }
        return *this;
    }

    void cancel() {
        if (cancelled_) {
            *cancelled_ = true;
            cancelled_.reset();
        }
    }

    bool armed() const { return cancelled_ && !*cancelled_; }

private:
    std::shared_ptr<bool> cancelled_;
};

// ============================================================
// Single-threaded loop that owns all session state transitions.
//
// post() may be called from any thread. Everything else (schedule, step,
// drain) belongs to the loop thread. Time is virtual: it advances only
// through step(dt), so a test drives it exactly and a UI drives it from
// its frame clock.
// ============================================================
class EventLoop {
public:
    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);

    TimerHandle schedule(double delay_s, Task task);
    TimerHandle scheduleRepeating(double period_s, Task task);

    // Advances the clock by dt_s (ignored if not finite or negative), fires
    // due timers in deadline order, then drains posted tasks.
    void step(double dt_s);

    // Runs posted tasks (including ones posted while draining) without
    // advancing time. Returns the number of tasks run.
    int drain();

    double now_s() const { return now_s_; }
    std::int64_t nowMs() const { return static_cast<std::int64_t>(now_s_ * 1000.0 + 0.5); }

    std::size_t pendingTimers() const;

private:
    struct Timer {
        double due_s = 0.0;
        double period_s = 0.0; // 0 = one-shot
        std::uint64_t seq = 0;
        std::shared_ptr<bool> cancelled;
        Task task;
    };

    TimerHandle addTimer(double delay_s, double period_s, Task task);
    void fireDueTimers();

    std::mutex mutex_;
    std::list<Task> inbox_;

    std::vector<Timer> timers_;
    std::uint64_t next_seq_ = 0;
    double now_s_ = 0.0;
};

// ============================================================
// One worker thread running tasks in FIFO order off the loop thread.
// ============================================================
class BackgroundTask {
public:
    BackgroundTask();
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    void schedule(Task task);

    // Blocks until every task scheduled so far has run.
    void waitForCompletion();

private:
    void workerLoop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::size_t active_ = 0;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace scanorch
