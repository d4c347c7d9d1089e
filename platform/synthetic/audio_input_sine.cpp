#include "vtuner/audio_input.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>
#include <vector>

namespace vtuner {

// Generates a sine in the same block shape the ALSA backend delivers.
// Used for tests and for running the tuner without a microphone.
class SineAudioInput : public IAudioInput {
public:
    SineAudioInput(const AudioConfig& cfg, const SineSourceConfig& sine)
        : config_(cfg), sine_(sine) {
        if (config_.block_size < 2) config_.block_size = 2;
        sine_.amplitude = std::clamp(sine_.amplitude, 0.0, 1.0);
    }

    ~SineAudioInput() override { stop(); }

    bool start() override {
        if (running_.load()) return true;
        if (worker_.joinable()) worker_.join();
        if (config_.sample_rate == 0) {
            error_ = "Sample rate must be positive";
            return false;
        }
        error_.clear();
        running_ = true;
        worker_ = std::thread(&SineAudioInput::worker_proc, this);
        return true;
    }

    void stop() override {
        running_ = false;
        if (worker_.joinable()) worker_.join();
    }

    bool is_running() const override { return running_.load(); }

    void set_process_callback(ProcessCallback callback) override { callback_ = callback; }

    const AudioConfig& get_config() const override { return config_; }

    std::string last_error() const override { return error_; }

    LatencyStats get_latency_stats() const override {
        LatencyStats stats{};
        stats.xruns = 0;
        return stats;
    }

private:
    void worker_proc() {
        const double two_pi = 6.28318530717958647692;
        const double step = two_pi * sine_.frequency_hz / config_.sample_rate;
        const double scale = sine_.amplitude * 32767.0;
        const auto block_period = std::chrono::microseconds(
            static_cast<long long>(1e6 * config_.block_size / config_.sample_rate));

        std::vector<int16_t> block(config_.block_size);
        auto next_due = std::chrono::steady_clock::now();
        int produced = 0;
        while (running_.load()) {
            if (sine_.max_blocks > 0 && produced >= sine_.max_blocks) break;
            for (auto& s : block) {
                s = static_cast<int16_t>(std::lrint(std::sin(phase_) * scale));
                phase_ += step;
                if (phase_ >= two_pi) phase_ -= two_pi;
            }
            if (callback_) callback_(block.data(), static_cast<int>(block.size()));
            ++produced;
            if (sine_.realtime) {
                next_due += block_period;
                std::this_thread::sleep_until(next_due);
            }
        }
        running_ = false;
    }

    AudioConfig config_;
    SineSourceConfig sine_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    ProcessCallback callback_;
    std::string error_;
    double phase_ = 0.0;
};

std::unique_ptr<IAudioInput> createSineAudioInput(const AudioConfig& config, const SineSourceConfig& sine) {
    return std::make_unique<SineAudioInput>(config, sine);
}

} // namespace vtuner
