#include "vtuner/pitch_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace vtuner::dsp {

PitchEstimator::PitchEstimator(const PitchEstimatorConfig& config) : config_(config) {
    const PitchEstimatorConfig defaults{};
    const bool bounds_ok = std::isfinite(config_.min_frequency_hz) && std::isfinite(config_.max_frequency_hz)
                           && config_.min_frequency_hz >= kMinSupportedFrequencyHz
                           && config_.max_frequency_hz > config_.min_frequency_hz;
    if (!bounds_ok) {
        config_.min_frequency_hz = defaults.min_frequency_hz;
        config_.max_frequency_hz = defaults.max_frequency_hz;
    }
}

PeriodRange PitchEstimator::search_range(int sample_rate, int num_samples) const {
    PeriodRange range;
    if (sample_rate <= 0 || num_samples < 2) return range;
    // Bounded in double before narrowing so extreme bounds cannot overflow int
    const double half_block = static_cast<double>(num_samples / 2);
    const double shortest = std::min(sample_rate / config_.max_frequency_hz, half_block + 1.0);
    const double longest = std::min(sample_rate / config_.min_frequency_hz, half_block);
    range.min_period = std::max(1, static_cast<int>(shortest));
    range.max_period = static_cast<int>(longest);
    return range;
}

PitchEstimate PitchEstimator::estimate(const int16_t* samples, int num_samples, int sample_rate) const {
    PitchEstimate result;
    if (!samples || num_samples < 2 || sample_rate <= 0) {
        result.status = PitchStatus::InvalidInput;
        return result;
    }

    std::vector<double> normalized(static_cast<size_t>(num_samples));
    for (int i = 0; i < num_samples; ++i) normalized[i] = samples[i] / kFullScale;

    const PeriodRange range = search_range(sample_rate, num_samples);

    // Only strictly greater sums replace the best, so the lowest period wins ties
    // and a block with no positive correlation stays undetected.
    double best_correlation = 0.0;
    int best_period = 0;
    for (int period = range.min_period; period <= range.max_period; ++period) {
        const int overlap = num_samples - period;
        double correlation = 0.0;
        for (int i = 0; i < overlap; ++i) correlation += normalized[i] * normalized[i + period];
        if (config_.mode == CorrelationMode::PerOverlap) correlation /= overlap;

        if (observer_) observer_(period, correlation);

        if (correlation > best_correlation) {
            best_correlation = correlation;
            best_period = period;
        }
    }

    if (best_period > 0) {
        result.frequency_hz = static_cast<double>(sample_rate) / best_period;
        result.period_samples = best_period;
        result.correlation = best_correlation;
        result.status = PitchStatus::Detected;
    }
    return result;
}

} // namespace vtuner::dsp
