#include "vtuner/reference_strings.hpp"

#include <cctype>

namespace vtuner {

namespace {

const std::array<ReferenceString, 4> kStrings = {{
    {StringName::G, "G", 196.0},
    {StringName::D, "D", 293.66},
    {StringName::A, "A", 440.0},
    {StringName::E, "E", 659.25},
}};

} // namespace

const std::array<ReferenceString, 4>& reference_strings() {
    return kStrings;
}

const ReferenceString& reference_string(StringName name) {
    return kStrings[static_cast<size_t>(name)];
}

const char* to_string(StringName name) {
    return reference_string(name).label;
}

bool parse_string_name(const std::string& text, StringName& out) {
    if (text.size() != 1) return false;
    const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    for (const auto& s : kStrings) {
        if (s.label[0] == c) { out = s.name; return true; }
    }
    return false;
}

} // namespace vtuner
