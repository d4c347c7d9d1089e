#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vtuner {

struct ToneConfig {
    std::string device_name = "default";
    unsigned int sample_rate = 44100;
    int default_duration_ms = 2000;
};

// Full-scale sine: duration_ms * sample_rate / 1000 samples.
// Returns false (out untouched) for non-positive or non-finite arguments.
bool synthesize_tone(double frequency_hz, int duration_ms, unsigned int sample_rate,
                     std::vector<int16_t>& out);

// Fire-and-forget reference tone output. The output device is held only
// while a tone is sounding.
class ITonePlayer {
public:
    virtual ~ITonePlayer() = default;

    // Replaces any tone already playing. duration_ms <= 0 uses the default.
    virtual bool play(double frequency_hz, int duration_ms = 0) = 0;
    virtual void stop() = 0;
    virtual bool is_playing() const = 0;
    virtual std::string last_error() const = 0;
};

// ALSA playback backend
std::unique_ptr<ITonePlayer> createTonePlayer(const ToneConfig& config);

} // namespace vtuner
