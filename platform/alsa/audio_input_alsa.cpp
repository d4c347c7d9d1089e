#include "vtuner/audio_input.hpp"

#include <alsa/asoundlib.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sched.h>
#include <sys/mman.h>
#include <thread>
#include <vector>

namespace vtuner {

class AlsaAudioInput : public IAudioInput {
public:
    explicit AlsaAudioInput(const AudioConfig& cfg)
        : config(cfg), pcm_handle(nullptr), running(false),
          min_latency_ms(1000.0f), max_latency_ms(0.0f), total_latency_ms(0.0f),
          latency_count(0), xrun_count(0), sample_format(SND_PCM_FORMAT_S16_LE) {
        if (config.block_size < 2) config.block_size = 2;
    }

    ~AlsaAudioInput() override { stop(); }

    bool start() override {
        if (running.load()) {
            return true;
        }
        // A capture loop that ended on a read error still needs joining
        if (audio_thread.joinable()) {
            audio_thread.join();
        }
        cleanup_alsa();
        set_error(std::string());
        if (!setup_alsa()) {
            return false;
        }
        running = true;
        audio_thread = std::thread(&AlsaAudioInput::audio_thread_func, this);
        if (config.use_realtime_priority) {
            set_realtime_priority();
        }
        return true;
    }

    void stop() override {
        running = false;
        if (audio_thread.joinable()) {
            audio_thread.join();
        }
        cleanup_alsa();
    }

    bool is_running() const override { return running.load(); }

    void set_process_callback(ProcessCallback callback) override { process_callback = callback; }

    const AudioConfig& get_config() const override { return config; }

    std::string last_error() const override {
        std::lock_guard<std::mutex> lock(error_mutex);
        return error_text;
    }

    LatencyStats get_latency_stats() const override {
        LatencyStats stats{};
        stats.min_ms = min_latency_ms.load();
        stats.max_ms = max_latency_ms.load();
        int count = latency_count.load();
        stats.avg_ms = count > 0 ? total_latency_ms.load() / count : 0.0f;
        stats.xruns = xrun_count.load();
        return stats;
    }

private:
    AudioConfig config;
    snd_pcm_t* pcm_handle;
    std::atomic<bool> running;
    std::thread audio_thread;
    ProcessCallback process_callback;

    mutable std::mutex error_mutex;
    std::string error_text;

    // Callback timing per delivered block
    mutable std::atomic<float> min_latency_ms;
    mutable std::atomic<float> max_latency_ms;
    mutable std::atomic<float> total_latency_ms;
    mutable std::atomic<int> latency_count;
    mutable std::atomic<int> xrun_count;

    snd_pcm_format_t sample_format;

    void set_error(const std::string& text) {
        std::lock_guard<std::mutex> lock(error_mutex);
        error_text = text;
    }

    bool fail(const char* what, int err) {
        std::string msg = std::string(what) + ": " + snd_strerror(err);
        std::cerr << msg << std::endl;
        set_error(msg);
        cleanup_alsa();
        return false;
    }

    bool setup_alsa() {
        int err = 0;
        std::vector<std::string> candidates;
        if (!config.device_name.empty()) candidates.push_back(config.device_name);
        if (config.device_name != "default") candidates.push_back("default");

        // Enumerate ALSA PCM hints to find capture-capable devices
        void** hints = nullptr;
        if (snd_device_name_hint(-1, "pcm", &hints) == 0 && hints) {
            std::vector<std::string> plughw;
            std::vector<std::string> hw;
            for (void** n = hints; *n != nullptr; ++n) {
                char* name = snd_device_name_get_hint(*n, "NAME");
                char* ioid = snd_device_name_get_hint(*n, "IOID");
                // IOID is absent for devices that do both directions
                bool capture = !ioid || std::strcmp(ioid, "Input") == 0;
                if (name && capture) {
                    std::string s(name);
                    if (s.rfind("plughw:", 0) == 0) plughw.push_back(s);
                    else if (s.rfind("hw:", 0) == 0) hw.push_back(s);
                }
                std::free(name);
                std::free(ioid);
            }
            for (auto& s : plughw) candidates.push_back(s);
            for (auto& s : hw) candidates.push_back(s);
            snd_device_name_free_hint(hints);
        }

        std::string opened_device;
        for (const auto& dev : candidates) {
            err = snd_pcm_open(&pcm_handle, dev.c_str(), SND_PCM_STREAM_CAPTURE, 0);
            if (err == 0) { opened_device = dev; break; }
        }
        if (opened_device.empty()) {
            std::string msg = "Cannot open any audio capture device. Last tried: "
                              + (candidates.empty() ? std::string("<none>") : candidates.back());
            if (err < 0) msg += std::string(" (") + snd_strerror(err) + ")";
            std::cerr << msg << std::endl;
            set_error(msg);
            pcm_handle = nullptr;
            return false;
        }
        if (opened_device != config.device_name) {
            std::cout << "Using capture device: " << opened_device << std::endl;
            config.device_name = opened_device;
        }

        snd_pcm_hw_params_t* hw_params;
        snd_pcm_hw_params_alloca(&hw_params);

        err = snd_pcm_hw_params_any(pcm_handle, hw_params);
        if (err < 0) return fail("Cannot initialize hardware parameters", err);

        err = snd_pcm_hw_params_set_access(pcm_handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
        if (err < 0) return fail("Cannot set access type", err);

        sample_format = SND_PCM_FORMAT_S16_LE;
        err = snd_pcm_hw_params_set_format(pcm_handle, hw_params, sample_format);
        if (err < 0) {
            sample_format = SND_PCM_FORMAT_FLOAT_LE;
            err = snd_pcm_hw_params_set_format(pcm_handle, hw_params, sample_format);
            if (err < 0) return fail("Cannot set format", err);
        }

        err = snd_pcm_hw_params_set_channels(pcm_handle, hw_params, 1);
        if (err < 0) return fail("Cannot set channels", err);

        unsigned int rate = config.sample_rate;
        err = snd_pcm_hw_params_set_rate_near(pcm_handle, hw_params, &rate, 0);
        if (err < 0) return fail("Cannot set sample rate", err);

        if (rate != config.sample_rate) {
            std::cout << "Sample rate adjusted to " << rate << " Hz" << std::endl;
        }

        snd_pcm_uframes_t period_size = config.period_size;
        err = snd_pcm_hw_params_set_period_size_near(pcm_handle, hw_params, &period_size, 0);
        if (err < 0) return fail("Cannot set period size", err);

        if (period_size != config.period_size) {
            std::cout << "Period size adjusted to " << period_size << " frames" << std::endl;
        }

        unsigned int periods = config.num_periods;
        err = snd_pcm_hw_params_set_periods_near(pcm_handle, hw_params, &periods, 0);
        if (err < 0) return fail("Cannot set periods", err);

        err = snd_pcm_hw_params(pcm_handle, hw_params);
        if (err < 0) return fail("Cannot set hardware parameters", err);

        err = snd_pcm_prepare(pcm_handle);
        if (err < 0) return fail("Cannot prepare audio interface", err);

        snd_pcm_hw_params_get_period_size(hw_params, &period_size, 0);
        snd_pcm_hw_params_get_rate(hw_params, &rate, 0);

        config.sample_rate = rate;
        config.period_size = static_cast<unsigned int>(period_size);

        std::cout << "ALSA configured: " << rate << " Hz, "
                  << period_size << " frames/period, "
                  << config.block_size << " samples/block ("
                  << (1000.0f * config.block_size / rate) << " ms)" << std::endl;
        return true;
    }

    void cleanup_alsa() {
        if (pcm_handle) {
            snd_pcm_close(pcm_handle);
            pcm_handle = nullptr;
        }
    }

    void deliver(const int16_t* block, int count) {
        auto start_time = std::chrono::high_resolution_clock::now();
        if (process_callback) process_callback(block, count);
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
        float latency_ms = duration.count() / 1000.0f;

        float current_min = min_latency_ms.load();
        while (latency_ms < current_min && !min_latency_ms.compare_exchange_weak(current_min, latency_ms));

        float current_max = max_latency_ms.load();
        while (latency_ms > current_max && !max_latency_ms.compare_exchange_weak(current_max, latency_ms));

        total_latency_ms.store(total_latency_ms.load() + latency_ms);
        latency_count.store(latency_count.load() + 1);
    }

    void audio_thread_func() {
        if (config.use_realtime_priority) {
            mlockall(MCL_CURRENT | MCL_FUTURE);
        }

        const snd_pcm_uframes_t period_size = config.period_size;
        std::vector<float> buffer_f;
        std::vector<int16_t> buffer_s16(period_size);
        if (sample_format == SND_PCM_FORMAT_FLOAT_LE) {
            buffer_f.resize(period_size);
        }

        // Periods are accumulated until a full analysis block is available
        std::vector<int16_t> block(config.block_size);
        size_t filled = 0;

        while (running.load()) {
            snd_pcm_sframes_t frames_read = 0;
            if (sample_format == SND_PCM_FORMAT_FLOAT_LE) {
                frames_read = snd_pcm_readi(pcm_handle, buffer_f.data(), period_size);
            } else {
                frames_read = snd_pcm_readi(pcm_handle, buffer_s16.data(), period_size);
            }

            if (frames_read < 0) {
                if (frames_read == -EPIPE) {
                    xrun_count++;
                    snd_pcm_prepare(pcm_handle);
                } else if (frames_read == -EAGAIN) {
                    continue;
                } else {
                    std::string msg = std::string("Read error: ") + snd_strerror(static_cast<int>(frames_read));
                    std::cerr << msg << std::endl;
                    set_error(msg);
                    break;
                }
                continue;
            }

            if (sample_format == SND_PCM_FORMAT_FLOAT_LE) {
                for (snd_pcm_sframes_t i = 0; i < frames_read; ++i) {
                    float v = std::clamp(buffer_f[i] * 32768.0f, -32768.0f, 32767.0f);
                    buffer_s16[i] = static_cast<int16_t>(std::lrint(v));
                }
            }

            size_t offset = 0;
            while (offset < static_cast<size_t>(frames_read) && running.load()) {
                size_t take = std::min(block.size() - filled, static_cast<size_t>(frames_read) - offset);
                std::memcpy(block.data() + filled, buffer_s16.data() + offset, take * sizeof(int16_t));
                filled += take;
                offset += take;
                if (filled == block.size()) {
                    deliver(block.data(), static_cast<int>(block.size()));
                    filled = 0;
                }
            }
        }

        running = false;
        if (config.use_realtime_priority) {
            munlockall();
        }
    }

    void set_realtime_priority() {
        struct sched_param param;
        param.sched_priority = sched_get_priority_max(SCHED_FIFO) - 1;
        if (pthread_setschedparam(audio_thread.native_handle(), SCHED_FIFO, &param) != 0) {
            std::cerr << "Warning: Could not set realtime priority. Run with sudo or configure limits.conf" << std::endl;
        }
    }
};

std::unique_ptr<IAudioInput> createAudioInput(const AudioConfig& config) {
    return std::make_unique<AlsaAudioInput>(config);
}

} // namespace vtuner
