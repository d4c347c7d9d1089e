#pragma once

#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace vtuner::test {

inline int& failure_count() {
    static int failures = 0;
    return failures;
}

inline void check(bool condition, const std::string& what) {
    if (condition) {
        std::cout << "  ok   " << what << std::endl;
    } else {
        std::cout << "  FAIL " << what << std::endl;
        ++failure_count();
    }
}

inline int finish(const char* name) {
    const int failures = failure_count();
    if (failures == 0) std::cout << name << ": all checks passed" << std::endl;
    else std::cout << name << ": " << failures << " check(s) failed" << std::endl;
    return failures == 0 ? 0 : 1;
}

inline std::vector<int16_t> make_sine_block(double frequency_hz, int sample_rate, int length,
                                            double amplitude = 0.5) {
    const double two_pi = 6.28318530717958647692;
    std::vector<int16_t> block(static_cast<size_t>(length));
    for (int i = 0; i < length; ++i) {
        block[i] = static_cast<int16_t>(std::lrint(amplitude * 32767.0 *
                                                    std::sin(two_pi * frequency_hz * i / sample_rate)));
    }
    return block;
}

} // namespace vtuner::test
