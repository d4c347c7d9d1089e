#pragma once

#include <string>

namespace vtuner {

struct AppSettings {
    // Capture
    std::string device_name = "default";
    int sample_rate = 44100;
    int block_size = 4096;
    int period_size = 1024;
    bool use_realtime_priority = false;

    // Tuning
    int auto_stop_seconds = 30;          // 0 disables
    bool normalize_correlation = false;  // Divide lag sums by overlap length

    // Reference tone
    std::string tone_device = "default";
    int tone_duration_ms = 2000;
};

} // namespace vtuner
