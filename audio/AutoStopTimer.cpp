#include "AutoStopTimer.hpp"

namespace vtuner::audio {

AutoStopTimer::~AutoStopTimer() {
    cancel();
    if (thread_.joinable()) thread_.join();
}

void AutoStopTimer::arm(std::chrono::milliseconds delay, std::function<void()> on_expire) {
    cancel();
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
    armed_ = true;
    const auto deadline = std::chrono::steady_clock::now() + delay;
    thread_ = std::thread(&AutoStopTimer::run, this, deadline, std::move(on_expire));
}

void AutoStopTimer::cancel() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        armed_ = false;
        // The expiry callback may cancel its own timer; that thread is joined later
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            finished = std::move(thread_);
        }
    }
    cv_.notify_all();
    if (finished.joinable()) finished.join();
}

bool AutoStopTimer::is_armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

void AutoStopTimer::run(std::chrono::steady_clock::time_point deadline, std::function<void()> on_expire) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_until(lock, deadline, [this] { return cancelled_; })) return;
        armed_ = false;
    }
    if (on_expire) on_expire();
}

} // namespace vtuner::audio
