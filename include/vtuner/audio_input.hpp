#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace vtuner {

struct AudioConfig {
    std::string device_name = "default";
    unsigned int sample_rate = 44100;
    unsigned int block_size = 4096;    // Samples per delivered block
    unsigned int period_size = 1024;   // ALSA period in frames
    unsigned int num_periods = 4;
    bool use_realtime_priority = false;
};

// Source of fixed-size mono 16-bit blocks. Blocks are handed to the process
// callback on the backend's own thread, in capture order.
class IAudioInput {
public:
    using ProcessCallback = std::function<void(const int16_t* input, int num_samples)>;

    virtual ~IAudioInput() = default;

    // No-op returning true if already running. May be called again after stop().
    virtual bool start() = 0;
    // Safe to call repeatedly or before start()
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    virtual void set_process_callback(ProcessCallback callback) = 0;
    virtual const AudioConfig& get_config() const = 0;

    // Why the last start() failed or the stream ended; empty if it did not
    virtual std::string last_error() const = 0;

    struct LatencyStats {
        float min_ms;
        float max_ms;
        float avg_ms;
        int xruns;
    };
    virtual LatencyStats get_latency_stats() const = 0;
};

// ALSA capture backend
std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config);

struct SineSourceConfig {
    double frequency_hz = 440.0;
    double amplitude = 0.5;     // Fraction of full scale
    bool realtime = true;       // Pace blocks at the sample rate
    int max_blocks = 0;         // Stop producing after this many; 0 = unlimited
};

// Synthetic continuous-phase sine source
std::unique_ptr<IAudioInput> createSineAudioInput(const AudioConfig& config, const SineSourceConfig& sine);

} // namespace vtuner
