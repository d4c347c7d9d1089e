#pragma once

#include <array>
#include <string>

namespace vtuner {

enum class StringName { G, D, A, E };

struct ReferenceString {
    StringName name;
    const char* label;
    double frequency_hz;
};

// Open strings, lowest to highest
const std::array<ReferenceString, 4>& reference_strings();
const ReferenceString& reference_string(StringName name);

const char* to_string(StringName name);

// Accepts "G", "D", "A", "E" in either case
bool parse_string_name(const std::string& text, StringName& out);

} // namespace vtuner
