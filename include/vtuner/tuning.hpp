#pragma once

#include <string>

namespace vtuner {

// |cents| strictly below this is in tune; exactly 5.0 is not
constexpr double kInTuneToleranceCents = 5.0;
constexpr double kDisplayRangeCents = 50.0;

enum class TuningStatus { Flat, InTune, Sharp };

struct TuningResult {
    double frequency_hz = 0.0;
    double cents_deviation = 0.0;
    TuningStatus status = TuningStatus::InTune;
};

// 1200 * log2(estimated / target). Returns false (out untouched) when either
// frequency is non-positive or not finite.
bool cents_deviation(double estimated_hz, double target_hz, double& out_cents);

TuningStatus classify_cents(double cents);

// Returns false for an undetected estimate (<= 0) or an invalid target;
// callers keep their previous reading in that case.
bool evaluate_tuning(double estimated_hz, double target_hz, TuningResult& out);

const char* to_string(TuningStatus status);

// "IN TUNE", "SHARP (+12 cents)", "FLAT (-7 cents)"
std::string describe(const TuningResult& result);

// Clamped to +/-50 cents for dial style displays
double display_cents(double cents);

} // namespace vtuner
