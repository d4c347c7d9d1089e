#include "TunerEngine.hpp"

#include <iostream>

namespace vtuner::audio {

TunerEngine::TunerEngine(const TunerEngineConfig& config)
    : TunerEngine(config, [](const AudioConfig& c) { return createAudioInput(c); }) {}

TunerEngine::TunerEngine(const TunerEngineConfig& config, BackendFactory factory)
    : config_(config), factory_(std::move(factory)), estimator_(config.pitch),
      selected_(static_cast<int>(config.initial_string)) {
    recreate_backend();
}

TunerEngine::~TunerEngine() {
    stop_listening();
}

void TunerEngine::recreate_backend() {
    backend_ = factory_ ? factory_(config_.audio) : nullptr;
    if (backend_) {
        backend_->set_process_callback([this](const int16_t* input, int num_samples) {
            process_block(input, num_samples);
        });
    }
}

bool TunerEngine::start_listening() {
    if (is_listening()) return true;
    auto_stop_timer_.cancel();

    uint64_t session = 0;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!backend_) recreate_backend();
        if (!backend_) {
            std::cerr << "No audio input backend available" << std::endl;
            return false;
        }
        if (backend_->is_running()) return true;

        results_.reopen();
        auto_stopped_ = false;
        if (!backend_->start()) {
            std::cerr << "Audio input failed to start: " << backend_->last_error() << std::endl;
            return false;
        }
        session = ++session_;
        const auto& ref = reference_string(selected_string());
        std::cout << "Listening on " << backend_->get_config().device_name
                  << " (target " << ref.label << " " << ref.frequency_hz << " Hz)" << std::endl;
    }

    if (config_.auto_stop.count() > 0) {
        auto_stop_timer_.arm(config_.auto_stop, [this, session] {
            if (session_.load() != session) return;
            std::cout << "Auto-stop after " << config_.auto_stop.count() << " ms of listening" << std::endl;
            auto_stopped_ = true;
            stop_listening();
        });
    }
    return true;
}

void TunerEngine::stop_listening() {
    auto_stop_timer_.cancel();
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    ++session_;
    if (!backend_) return;
    const bool was_running = backend_->is_running();
    backend_->stop();
    // The capture thread has been joined, so every processed block is queued
    results_.close();
    if (was_running) {
        std::cout << "Listening stopped (" << blocks_processed_.load() << " blocks, "
                  << blocks_undetected_.load() << " without pitch)" << std::endl;
    }
}

bool TunerEngine::is_listening() const {
    return backend_ && backend_->is_running();
}

void TunerEngine::process_block(const int16_t* input, int num_samples) {
    const int sample_rate = static_cast<int>(backend_->get_config().sample_rate);
    const dsp::PitchEstimate estimate = estimator_.estimate(input, num_samples, sample_rate);
    ++blocks_processed_;
    if (!estimate.detected()) {
        ++blocks_undetected_;
        return;
    }

    // Reference is sampled per block so a string change applies from the next block
    const ReferenceString& ref = reference_string(selected_string());
    TuningResult result;
    if (evaluate_tuning(estimate.frequency_hz, ref.frequency_hz, result)) {
        results_.push(result);
    }
}

void TunerEngine::remember(const TuningResult& r) {
    std::lock_guard<std::mutex> lock(latest_mutex_);
    latest_ = r;
    has_latest_ = true;
}

bool TunerEngine::poll_result(TuningResult& out) {
    if (!results_.try_pop(out)) return false;
    remember(out);
    return true;
}

bool TunerEngine::wait_result(TuningResult& out, std::chrono::milliseconds timeout) {
    if (!results_.wait_pop(out, timeout)) return false;
    remember(out);
    return true;
}

bool TunerEngine::latest_result(TuningResult& out) const {
    std::lock_guard<std::mutex> lock(latest_mutex_);
    if (!has_latest_) return false;
    out = latest_;
    return true;
}

std::string TunerEngine::last_error() const {
    return backend_ ? backend_->last_error() : std::string("No audio input backend");
}

IAudioInput::LatencyStats TunerEngine::get_latency_stats() const {
    return backend_ ? backend_->get_latency_stats() : IAudioInput::LatencyStats{};
}

} // namespace vtuner::audio
