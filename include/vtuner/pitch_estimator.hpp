#pragma once

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace vtuner::dsp {

// Full-scale magnitude of a signed 16-bit sample
constexpr double kFullScale = 32768.0;

// Lowest accepted min_frequency_hz; keeps sample_rate / min_hz within int
constexpr double kMinSupportedFrequencyHz = 1.0;

enum class CorrelationMode {
    Raw,         // Plain lagged product sum
    PerOverlap   // Sum divided by the number of overlapping products
};

struct PitchEstimatorConfig {
    double min_frequency_hz = 80.0;    // Longest period scanned
    double max_frequency_hz = 800.0;   // Shortest period scanned
    CorrelationMode mode = CorrelationMode::Raw;
};

enum class PitchStatus { Detected, Undetected, InvalidInput };

struct PitchEstimate {
    double frequency_hz = 0.0;   // 0 unless detected
    int period_samples = 0;
    double correlation = 0.0;
    PitchStatus status = PitchStatus::Undetected;

    bool detected() const { return status == PitchStatus::Detected; }
};

// Inclusive range of candidate periods in samples. Empty when min > max.
struct PeriodRange {
    int min_period = 0;
    int max_period = -1;

    bool empty() const { return min_period > max_period; }
};

// Time-domain autocorrelation pitch estimator for one block of 16-bit mono
// samples. Holds only configuration; estimate() is safe to call concurrently
// as long as no scan observer is installed.
class PitchEstimator {
public:
    using ScanObserver = std::function<void(int period, double correlation)>;

    explicit PitchEstimator(const PitchEstimatorConfig& config = PitchEstimatorConfig{});

    PitchEstimate estimate(const int16_t* samples, int num_samples, int sample_rate) const;
    PitchEstimate estimate(const std::vector<int16_t>& block, int sample_rate) const {
        return estimate(block.data(), static_cast<int>(block.size()), sample_rate);
    }

    // [sample_rate / max_hz, min(sample_rate / min_hz, num_samples / 2)],
    // never starting below one sample
    PeriodRange search_range(int sample_rate, int num_samples) const;

    // Called for every candidate period, in scan order. Test and diagnostics hook.
    void set_scan_observer(ScanObserver observer) { observer_ = std::move(observer); }

    const PitchEstimatorConfig& get_config() const { return config_; }

private:
    PitchEstimatorConfig config_;
    ScanObserver observer_;
};

} // namespace vtuner::dsp
