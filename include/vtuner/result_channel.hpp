#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace vtuner {

// FIFO for handing results from the audio thread to any consumer thread.
// Unbounded: every pushed item is delivered once, in push order.
template<typename T>
class OrderedChannel {
public:
    // Returns false once the channel is closed
    bool push(const T& item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            items_.push_back(item);
        }
        cv_.notify_one();
        return true;
    }

    bool try_pop(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) return false;
        item = items_.front();
        items_.pop_front();
        return true;
    }

    // Waits until an item arrives, the channel closes or the timeout expires.
    // Items queued before close() are still returned.
    template<typename Rep, typename Period>
    bool wait_pop(T& item, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) return false;
        item = items_.front();
        items_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace vtuner
