#include "test_signals.hpp"
#include "vtuner/pitch_estimator.hpp"
#include "vtuner/tuning.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace vtuner;
using namespace vtuner::test;

static std::string hz(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << v << " Hz";
    return os.str();
}

// Estimate must land on the period nearest the true one, or its neighbour
static bool within_one_period(double estimate_hz, double true_hz, int sample_rate) {
    const int nearest = static_cast<int>(std::lround(sample_rate / true_hz));
    for (int p = nearest - 1; p <= nearest + 1; ++p) {
        if (p > 0 && std::abs(estimate_hz - static_cast<double>(sample_rate) / p) < 1e-9) return true;
    }
    return false;
}

static void test_sine_tracking() {
    std::cout << "Sine tracking (44100 Hz, 4096 samples)" << std::endl;
    dsp::PitchEstimator estimator;
    const int sr = 44100;
    const double freqs[] = {110.0, 196.0, 293.66, 440.0, 523.25, 659.25, 750.0};
    for (double f : freqs) {
        auto block = make_sine_block(f, sr, 4096);
        auto est = estimator.estimate(block, sr);
        check(est.detected(), "detects " + hz(f));
        check(within_one_period(est.frequency_hz, f, sr),
              hz(f) + " -> " + hz(est.frequency_hz) + " within one period step");
        check(est.period_samples > 0 && std::abs(est.frequency_hz - double(sr) / est.period_samples) < 1e-9,
              "frequency equals sample_rate / period");
    }
}

static void test_a440_scenario() {
    std::cout << "A4 at 44100 Hz, 1102 samples" << std::endl;
    dsp::PitchEstimator estimator;
    auto block = make_sine_block(440.0, 44100, 1102);
    auto est = estimator.estimate(block, 44100);
    check(est.frequency_hz >= 438.0 && est.frequency_hz <= 442.0, "estimate " + hz(est.frequency_hz) + " in [438, 442]");

    TuningResult r;
    check(evaluate_tuning(est.frequency_hz, 440.0, r), "estimate evaluates against A");
    check(std::abs(r.cents_deviation) <= 8.0, "deviation within 8 cents");
    check(r.status == TuningStatus::InTune, "reported in tune");
}

static void test_silence_and_invalid() {
    std::cout << "Silence and invalid input" << std::endl;
    dsp::PitchEstimator estimator;

    std::vector<int16_t> silence(2048, 0);
    auto est = estimator.estimate(silence, 44100);
    check(est.status == dsp::PitchStatus::Undetected, "silence is undetected");
    check(est.frequency_hz == 0.0, "silence returns 0 Hz");

    std::vector<int16_t> dc(2048, 1000);
    est = estimator.estimate(dc, 44100);
    check(est.detected() && est.period_samples == 55, "constant block picks the first scanned period");

    est = estimator.estimate(make_sine_block(440.0, 44100, 2048), 0);
    check(est.status == dsp::PitchStatus::InvalidInput && est.frequency_hz == 0.0, "zero sample rate rejected");
    est = estimator.estimate(make_sine_block(440.0, 44100, 2048), -44100);
    check(est.status == dsp::PitchStatus::InvalidInput, "negative sample rate rejected");

    std::vector<int16_t> empty;
    est = estimator.estimate(empty, 44100);
    check(est.status == dsp::PitchStatus::InvalidInput, "empty block rejected");
    est = estimator.estimate(nullptr, 1024, 44100);
    check(est.status == dsp::PitchStatus::InvalidInput, "null block rejected");
    std::vector<int16_t> one(1, 100);
    est = estimator.estimate(one, 44100);
    check(est.status == dsp::PitchStatus::InvalidInput, "single sample rejected");
}

static void test_search_window() {
    std::cout << "Search window" << std::endl;
    dsp::PitchEstimator estimator;

    auto r = estimator.search_range(44100, 4096);
    check(r.min_period == 55 && r.max_period == 551, "44100 Hz / 4096 samples scans 55..551");
    r = estimator.search_range(44100, 600);
    check(r.min_period == 55 && r.max_period == 300, "short block caps at half its length");
    r = estimator.search_range(44100, 100);
    check(r.empty(), "block shorter than two minimum periods has no candidates");

    // Short block: nothing scanned, undetected without dividing by zero
    auto est = estimator.estimate(make_sine_block(800.0, 44100, 100), 44100);
    check(est.status == dsp::PitchStatus::Undetected && est.frequency_hz == 0.0, "empty window is undetected");

    // Very low sample rate keeps at least a one-sample lag
    r = estimator.search_range(400, 64);
    check(r.min_period == 1 && r.max_period == 5, "400 Hz rate scans 1..5");

    int lowest = 1 << 30, highest = -1, count = 0, previous = 0;
    bool increasing = true;
    dsp::PitchEstimator observed;
    observed.set_scan_observer([&](int period, double) {
        lowest = std::min(lowest, period);
        highest = std::max(highest, period);
        if (count > 0 && period != previous + 1) increasing = false;
        previous = period;
        ++count;
    });
    const int n = 3000;
    observed.estimate(make_sine_block(330.0, 48000, n), 48000);
    check(lowest == 48000 / 800 && highest == std::min(48000 / 80, n / 2), "observer sees exactly [60, 600]");
    check(count == highest - lowest + 1 && increasing, "periods scanned once each in increasing order");
}

static void test_correlation_modes() {
    std::cout << "Correlation modes" << std::endl;
    dsp::PitchEstimatorConfig cfg;
    cfg.mode = dsp::CorrelationMode::PerOverlap;
    dsp::PitchEstimator normalized(cfg);
    dsp::PitchEstimator raw;

    auto block = make_sine_block(440.0, 44100, 4096);
    auto a = raw.estimate(block, 44100);
    auto b = normalized.estimate(block, 44100);
    check(b.detected(), "normalized mode detects a clean tone");
    check(b.correlation < a.correlation, "normalized peak is smaller than the raw sum");
    // Per-overlap sum of a 0.5 amplitude sine peaks near 0.5^2 / 2
    check(std::abs(b.correlation - 0.125) < 0.01, "normalized peak near signal power");
}

static void test_config_fallback() {
    std::cout << "Config fallback" << std::endl;
    dsp::PitchEstimatorConfig bad;
    bad.min_frequency_hz = 900.0;
    bad.max_frequency_hz = 100.0;
    dsp::PitchEstimator estimator(bad);
    check(estimator.get_config().min_frequency_hz == 80.0 && estimator.get_config().max_frequency_hz == 800.0,
          "inverted bounds fall back to 80..800 Hz");

    dsp::PitchEstimatorConfig tiny;
    tiny.min_frequency_hz = 1e-6;
    dsp::PitchEstimator guarded(tiny);
    check(guarded.get_config().min_frequency_hz == 80.0, "floor below 1 Hz falls back to 80 Hz");
    auto r = guarded.search_range(44100, 4096);
    check(r.min_period == 55 && r.max_period == 551, "fallback floor scans 55..551");
    auto est = guarded.estimate(make_sine_block(440.0, 44100, 4096), 44100);
    check(est.detected(), "fallback floor still detects A4");

    dsp::PitchEstimatorConfig lowest;
    lowest.min_frequency_hz = 1.0;
    dsp::PitchEstimator wide(lowest);
    r = wide.search_range(192000, 4096);
    check(r.min_period == 240 && r.max_period == 2048, "1 Hz floor is capped at half the block");

    dsp::PitchEstimatorConfig narrow;
    narrow.min_frequency_hz = 400.0;
    narrow.max_frequency_hz = 500.0;
    dsp::PitchEstimator limited(narrow);
    r = limited.search_range(44100, 4096);
    check(r.min_period == 88 && r.max_period == 110, "custom bounds change the window");
}

int main() {
    test_sine_tracking();
    test_a440_scenario();
    test_silence_and_invalid();
    test_search_window();
    test_correlation_modes();
    test_config_fallback();
    return finish("pitch_estimator_test");
}
