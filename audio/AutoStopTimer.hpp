#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace vtuner::audio {

// One-shot timer running its expiry callback on its own thread.
// cancel() may be called from the callback itself.
class AutoStopTimer {
public:
    AutoStopTimer() = default;
    ~AutoStopTimer();

    AutoStopTimer(const AutoStopTimer&) = delete;
    AutoStopTimer& operator=(const AutoStopTimer&) = delete;

    // Cancels a pending expiry, then schedules on_expire after delay
    void arm(std::chrono::milliseconds delay, std::function<void()> on_expire);
    void cancel();
    bool is_armed() const;

private:
    void run(std::chrono::steady_clock::time_point deadline, std::function<void()> on_expire);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool armed_ = false;
    bool cancelled_ = false;
};

} // namespace vtuner::audio
