#include "test_signals.hpp"
#include "vtuner/pitch_estimator.hpp"
#include "vtuner/reference_strings.hpp"
#include "vtuner/tone_player.hpp"
#include "vtuner/tuning.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

using namespace vtuner;
using namespace vtuner::test;

static void test_length_and_level() {
    std::cout << "Tone length and level" << std::endl;
    std::vector<int16_t> tone;
    check(synthesize_tone(440.0, 2000, 44100, tone) && tone.size() == 88200, "2 s at 44100 Hz is 88200 samples");
    check(tone[0] == 0, "starts at zero phase");
    auto peak = *std::max_element(tone.begin(), tone.end());
    auto trough = *std::min_element(tone.begin(), tone.end());
    check(peak >= 32700 && trough <= -32700, "full-scale amplitude");

    check(synthesize_tone(196.0, 10, 48000, tone) && tone.size() == 480, "10 ms at 48000 Hz is 480 samples");
}

static void test_rejects() {
    std::cout << "Invalid tone parameters" << std::endl;
    std::vector<int16_t> tone(3, 7);
    check(!synthesize_tone(0.0, 1000, 44100, tone) && tone.size() == 3, "zero frequency rejected");
    check(!synthesize_tone(-440.0, 1000, 44100, tone), "negative frequency rejected");
    check(!synthesize_tone(440.0, 0, 44100, tone), "zero duration rejected");
    check(!synthesize_tone(440.0, 1000, 0, tone), "zero sample rate rejected");
    check(!synthesize_tone(NAN, 1000, 44100, tone), "NaN frequency rejected");
}

static void test_reference_tones_tune_in() {
    std::cout << "Reference tones read as in tune" << std::endl;
    dsp::PitchEstimator estimator;
    for (const auto& ref : reference_strings()) {
        std::vector<int16_t> tone;
        synthesize_tone(ref.frequency_hz, 100, 44100, tone);
        auto est = estimator.estimate(tone, 44100);
        TuningResult r;
        check(est.detected() && evaluate_tuning(est.frequency_hz, ref.frequency_hz, r)
              && std::abs(r.cents_deviation) < 15.0,
              std::string(ref.label) + " tone estimated within period quantization");
    }
}

int main() {
    test_length_and_level();
    test_rejects();
    test_reference_tones_tune_in();
    return finish("tone_synthesis_test");
}
