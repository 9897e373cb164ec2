#include "EventLoop.h"

#include <algorithm>
#include <cmath>

namespace scanorch {

// ============================================================
// EventLoop
// ============================================================

void EventLoop::post(Task task) {
    if (!task) return;
    std::lock_guard<std::mutex> lock(mutex_);
    inbox_.push_back(std::move(task));
}

TimerHandle EventLoop::schedule(double delay_s, Task task) {
    return addTimer(delay_s, 0.0, std::move(task));
}

TimerHandle EventLoop::scheduleRepeating(double period_s, Task task) {
    if (!std::isfinite(period_s) || period_s <= 0.0) return TimerHandle{};
    return addTimer(period_s, period_s, std::move(task));
}

TimerHandle EventLoop::addTimer(double delay_s, double period_s, Task task) {
    if (!task || !std::isfinite(delay_s)) return TimerHandle{};
    auto cancelled = std::make_shared<bool>(false);
    Timer t;
    t.due_s = now_s_ + std::max(0.0, delay_s);
    t.period_s = period_s;
    t.seq = next_seq_++;
    t.cancelled = cancelled;
    t.task = std::move(task);
    timers_.push_back(std::move(t));
    return TimerHandle(std::move(cancelled));
}

void EventLoop::step(double dt_s) {
    if (std::isfinite(dt_s) && dt_s > 0.0) {
        now_s_ += dt_s;
    }
    fireDueTimers();
    drain();
}

void EventLoop::fireDueTimers() {
    for (;;) {
        timers_.erase(std::remove_if(timers_.begin(), timers_.end(),
                                     [](const Timer& t) { return *t.cancelled; }),
                      timers_.end());

        auto due = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->due_s > now_s_) continue;
            if (due == timers_.end() || it->due_s < due->due_s ||
                (it->due_s == due->due_s && it->seq < due->seq)) {
                due = it;
            }
        }
        if (due == timers_.end()) return;

        // Copy out before running: the task may add timers and invalidate iterators.
        Task task = due->task;
        if (due->period_s > 0.0) {
            due->due_s += due->period_s;
            due->seq = next_seq_++;
        } else {
            *due->cancelled = true;
        }

        task();
        drain();
    }
}

int EventLoop::drain() {
    int ran = 0;
    for (;;) {
        std::list<Task> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            batch.swap(inbox_);
        }
        if (batch.empty()) return ran;
        for (auto& task : batch) {
            task();
            ++ran;
        }
    }
}

std::size_t EventLoop::pendingTimers() const {
    std::size_t n = 0;
    for (const auto& t : timers_) {
        if (!*t.cancelled) ++n;
    }
    return n;
}

// ============================================================
// BackgroundTask
// ============================================================

BackgroundTask::BackgroundTask() : worker_([this] { workerLoop(); }) {}

BackgroundTask::~BackgroundTask() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void BackgroundTask::schedule(Task task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_all();
}

void BackgroundTask::waitForCompletion() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

void BackgroundTask::workerLoop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return; // stopping and nothing left
            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_;
        }
        task();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        cv_.notify_all();
    }
}

} // namespace scanorch
