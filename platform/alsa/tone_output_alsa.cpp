#include "vtuner/tone_player.hpp"

#include <alsa/asoundlib.h>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>

namespace vtuner {

namespace {

// Owns an open playback PCM for the lifetime of one tone
class PlaybackDevice {
public:
    PlaybackDevice() = default;
    ~PlaybackDevice() { close(); }
    PlaybackDevice(const PlaybackDevice&) = delete;
    PlaybackDevice& operator=(const PlaybackDevice&) = delete;

    int open(const std::string& device, unsigned int sample_rate) {
        int err = snd_pcm_open(&pcm_, device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
        if (err < 0) {
            pcm_ = nullptr;
            return err;
        }
        // 100 ms of device latency, resampling allowed
        return snd_pcm_set_params(pcm_, SND_PCM_FORMAT_S16_LE, SND_PCM_ACCESS_RW_INTERLEAVED,
                                  1, sample_rate, 1, 100000);
    }

    snd_pcm_t* handle() const { return pcm_; }

    void close() {
        if (pcm_) {
            snd_pcm_close(pcm_);
            pcm_ = nullptr;
        }
    }

private:
    snd_pcm_t* pcm_ = nullptr;
};

} // namespace

class AlsaTonePlayer : public ITonePlayer {
public:
    explicit AlsaTonePlayer(const ToneConfig& cfg) : config_(cfg) {
        if (config_.default_duration_ms <= 0) config_.default_duration_ms = 2000;
    }

    ~AlsaTonePlayer() override { stop(); }

    bool play(double frequency_hz, int duration_ms) override {
        stop();
        std::vector<int16_t> samples;
        const int ms = duration_ms > 0 ? duration_ms : config_.default_duration_ms;
        if (!synthesize_tone(frequency_hz, ms, config_.sample_rate, samples)) {
            set_error("Invalid tone parameters");
            return false;
        }
        set_error(std::string());
        cancel_ = false;
        playing_ = true;
        worker_ = std::thread(&AlsaTonePlayer::playback_proc, this, std::move(samples));
        return true;
    }

    void stop() override {
        cancel_ = true;
        if (worker_.joinable()) worker_.join();
        playing_ = false;
    }

    bool is_playing() const override { return playing_.load(); }

    std::string last_error() const override {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return error_;
    }

private:
    void set_error(const std::string& text) {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_ = text;
    }

    void playback_proc(std::vector<int16_t> samples) {
        PlaybackDevice device;
        int err = device.open(config_.device_name, config_.sample_rate);
        if (err < 0) {
            std::string msg = "Cannot open playback device " + config_.device_name + ": " + snd_strerror(err);
            std::cerr << msg << std::endl;
            set_error(msg);
            playing_ = false;
            return;
        }

        // Written in small chunks so stop() takes effect quickly
        const size_t chunk = std::max<size_t>(1, config_.sample_rate / 20);
        size_t offset = 0;
        while (offset < samples.size() && !cancel_.load()) {
            const size_t count = std::min(chunk, samples.size() - offset);
            snd_pcm_sframes_t written = snd_pcm_writei(device.handle(), samples.data() + offset, count);
            if (written < 0) {
                written = snd_pcm_recover(device.handle(), static_cast<int>(written), 1);
                if (written < 0) {
                    std::string msg = std::string("Playback error: ") + snd_strerror(static_cast<int>(written));
                    std::cerr << msg << std::endl;
                    set_error(msg);
                    break;
                }
                continue;
            }
            offset += static_cast<size_t>(written);
        }

        if (cancel_.load()) {
            snd_pcm_drop(device.handle());
        } else {
            snd_pcm_drain(device.handle());
        }
        playing_ = false;
    }

    ToneConfig config_;
    std::thread worker_;
    std::atomic<bool> cancel_{false};
    std::atomic<bool> playing_{false};
    mutable std::mutex error_mutex_;
    std::string error_;
};

std::unique_ptr<ITonePlayer> createTonePlayer(const ToneConfig& config) {
    return std::make_unique<AlsaTonePlayer>(config);
}

} // namespace vtuner
