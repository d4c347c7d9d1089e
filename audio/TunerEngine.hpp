#pragma once

#include "AutoStopTimer.hpp"
#include "vtuner/audio_input.hpp"
#include "vtuner/pitch_estimator.hpp"
#include "vtuner/reference_strings.hpp"
#include "vtuner/result_channel.hpp"
#include "vtuner/tuning.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace vtuner::audio {

struct TunerEngineConfig {
    AudioConfig audio{};
    dsp::PitchEstimatorConfig pitch{};
    StringName initial_string = StringName::A;
    // Listening ends on its own after this long; zero disables
    std::chrono::milliseconds auto_stop{std::chrono::seconds(30)};
};

// Owns the capture backend and runs estimation inline on its thread.
// Results reach the consumer through an ordered channel, drained from
// whichever thread the consumer runs on.
class TunerEngine {
public:
    using BackendFactory = std::function<std::unique_ptr<IAudioInput>(const AudioConfig&)>;

    explicit TunerEngine(const TunerEngineConfig& config);
    // Uses the given factory instead of the ALSA backend (synthetic input, tests)
    TunerEngine(const TunerEngineConfig& config, BackendFactory factory);
    ~TunerEngine();

    bool start_listening();
    // Idempotent; also cancels the pending auto-stop
    void stop_listening();
    bool is_listening() const;
    // Set when the last session ended through the auto-stop timer
    bool auto_stopped() const { return auto_stopped_.load(); }

    void select_string(StringName name) { selected_.store(static_cast<int>(name)); }
    StringName selected_string() const { return static_cast<StringName>(selected_.load()); }

    // Next result in block order; false when none is pending
    bool poll_result(TuningResult& out);
    bool wait_result(TuningResult& out, std::chrono::milliseconds timeout);
    // Most recent result drained by poll/wait; false before the first one
    bool latest_result(TuningResult& out) const;

    const AudioConfig& get_config() const { return config_.audio; }
    std::string last_error() const;
    IAudioInput::LatencyStats get_latency_stats() const;

    uint64_t blocks_processed() const { return blocks_processed_.load(); }
    uint64_t blocks_undetected() const { return blocks_undetected_.load(); }

private:
    void recreate_backend();
    void process_block(const int16_t* input, int num_samples);
    void remember(const TuningResult& r);

    TunerEngineConfig config_;
    BackendFactory factory_;
    dsp::PitchEstimator estimator_;
    std::unique_ptr<IAudioInput> backend_;
    OrderedChannel<TuningResult> results_;
    AutoStopTimer auto_stop_timer_;

    std::mutex lifecycle_mutex_;
    std::atomic<int> selected_;
    std::atomic<uint64_t> session_{0};
    std::atomic<bool> auto_stopped_{false};
    std::atomic<uint64_t> blocks_processed_{0};
    std::atomic<uint64_t> blocks_undetected_{0};

    mutable std::mutex latest_mutex_;
    TuningResult latest_{};
    bool has_latest_ = false;
};

} // namespace vtuner::audio
