#include "vtuner/tuning.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace vtuner {

bool cents_deviation(double estimated_hz, double target_hz, double& out_cents) {
    if (!std::isfinite(estimated_hz) || !std::isfinite(target_hz)) return false;
    if (estimated_hz <= 0.0 || target_hz <= 0.0) return false;
    out_cents = 1200.0 * std::log2(estimated_hz / target_hz);
    return true;
}

TuningStatus classify_cents(double cents) {
    if (std::abs(cents) < kInTuneToleranceCents) return TuningStatus::InTune;
    return cents > 0.0 ? TuningStatus::Sharp : TuningStatus::Flat;
}

bool evaluate_tuning(double estimated_hz, double target_hz, TuningResult& out) {
    double cents = 0.0;
    if (!cents_deviation(estimated_hz, target_hz, cents)) return false;
    out.frequency_hz = estimated_hz;
    out.cents_deviation = cents;
    out.status = classify_cents(cents);
    return true;
}

const char* to_string(TuningStatus status) {
    switch (status) {
        case TuningStatus::Flat: return "FLAT";
        case TuningStatus::InTune: return "IN_TUNE";
        case TuningStatus::Sharp: return "SHARP";
    }
    return "UNKNOWN";
}

std::string describe(const TuningResult& result) {
    const int whole_cents = static_cast<int>(result.cents_deviation);
    char buf[48];
    switch (result.status) {
        case TuningStatus::InTune:
            return "IN TUNE";
        case TuningStatus::Sharp:
            std::snprintf(buf, sizeof(buf), "SHARP (+%d cents)", whole_cents);
            return buf;
        case TuningStatus::Flat:
            std::snprintf(buf, sizeof(buf), "FLAT (%d cents)", whole_cents);
            return buf;
    }
    return std::string();
}

double display_cents(double cents) {
    return std::clamp(cents, -kDisplayRangeCents, kDisplayRangeCents);
}

} // namespace vtuner
