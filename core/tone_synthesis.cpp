#include "vtuner/tone_player.hpp"

#include <cmath>

namespace vtuner {

bool synthesize_tone(double frequency_hz, int duration_ms, unsigned int sample_rate,
                     std::vector<int16_t>& out) {
    if (!std::isfinite(frequency_hz) || frequency_hz <= 0.0) return false;
    if (duration_ms <= 0 || sample_rate == 0) return false;

    const double two_pi = 6.28318530717958647692;
    const size_t num_samples = static_cast<size_t>(
        static_cast<long long>(duration_ms) * sample_rate / 1000);
    out.resize(num_samples);
    for (size_t i = 0; i < num_samples; ++i) {
        out[i] = static_cast<int16_t>(std::sin(two_pi * frequency_hz * i / sample_rate) * 32767.0);
    }
    return true;
}

} // namespace vtuner
