#include "vtuner/app_settings.hpp"
#include "vtuner/app_settings_io.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace vtuner {

// Minimal JSON (hand-rolled) to avoid deps. Expects well-formed file we wrote.
static bool parse_key_value(const char* s, const char* key, int& out) {
    const char* p = std::strstr(s, key);
    if (!p) return false;
    p = std::strchr(p, ':'); if (!p) return false; ++p;
    char* end = nullptr;
    long v = std::strtol(p, &end, 10);
    if (end == p) return false;
    out = static_cast<int>(v);
    return true;
}
static bool parse_key_value(const char* s, const char* key, bool& out) {
    const char* p = std::strstr(s, key);
    if (!p) return false;
    p = std::strchr(p, ':'); if (!p) return false; ++p;
    while (*p == ' ' || *p == '\t') ++p;
    if (std::strncmp(p, "true", 4) == 0) { out = true; return true; }
    if (std::strncmp(p, "false", 5) == 0) { out = false; return true; }
    return false;
}
static bool parse_key_value(const char* s, const char* key, std::string& out) {
    const char* p = std::strstr(s, key);
    if (!p) return false;
    p = std::strchr(p, ':'); if (!p) return false; ++p;
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '"') return false;
    ++p;
    const char* start = p;
    while (*p && *p != '"' && *p != '\n' && *p != '\r') ++p;
    out.assign(start, p - start);
    return true;
}

bool sanitize_settings(AppSettings& st) {
    const AppSettings defaults;
    bool ok = true;
    auto reset = [&](auto& field, const auto& value, const char* name) {
        std::cerr << "Settings: invalid " << name << ", using default" << std::endl;
        field = value;
        ok = false;
    };
    if (st.device_name.empty()) reset(st.device_name, defaults.device_name, "device_name");
    if (st.sample_rate < 8000 || st.sample_rate > 192000) reset(st.sample_rate, defaults.sample_rate, "sample_rate");
    if (st.block_size < 2 || st.block_size > (1 << 16)) reset(st.block_size, defaults.block_size, "block_size");
    if (st.period_size < 16 || st.period_size > (1 << 16)) reset(st.period_size, defaults.period_size, "period_size");
    if (st.auto_stop_seconds < 0) reset(st.auto_stop_seconds, defaults.auto_stop_seconds, "auto_stop_seconds");
    if (st.tone_device.empty()) reset(st.tone_device, defaults.tone_device, "tone_device");
    if (st.tone_duration_ms <= 0 || st.tone_duration_ms > 60000) reset(st.tone_duration_ms, defaults.tone_duration_ms, "tone_duration_ms");
    return ok;
}

bool load_settings(const char* path, AppSettings& st) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1<<20) { std::fclose(f); return false; }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(buf.data(), 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) return false;

    AppSettings loaded = st;
    parse_key_value(buf.c_str(), "\"device_name\"", loaded.device_name);
    parse_key_value(buf.c_str(), "\"sample_rate\"", loaded.sample_rate);
    parse_key_value(buf.c_str(), "\"block_size\"", loaded.block_size);
    parse_key_value(buf.c_str(), "\"period_size\"", loaded.period_size);
    parse_key_value(buf.c_str(), "\"use_realtime_priority\"", loaded.use_realtime_priority);
    parse_key_value(buf.c_str(), "\"auto_stop_seconds\"", loaded.auto_stop_seconds);
    parse_key_value(buf.c_str(), "\"normalize_correlation\"", loaded.normalize_correlation);
    parse_key_value(buf.c_str(), "\"tone_device\"", loaded.tone_device);
    parse_key_value(buf.c_str(), "\"tone_duration_ms\"", loaded.tone_duration_ms);
    sanitize_settings(loaded);
    st = loaded;
    return true;
}

bool save_settings(const char* path, const AppSettings& st) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;
    int written = std::fprintf(f,
        "{\n"
        "  \"device_name\": \"%s\",\n"
        "  \"sample_rate\": %d,\n"
        "  \"block_size\": %d,\n"
        "  \"period_size\": %d,\n"
        "  \"use_realtime_priority\": %s,\n"
        "  \"auto_stop_seconds\": %d,\n"
        "  \"normalize_correlation\": %s,\n"
        "  \"tone_device\": \"%s\",\n"
        "  \"tone_duration_ms\": %d\n"
        "}\n",
        st.device_name.c_str(),
        st.sample_rate,
        st.block_size,
        st.period_size,
        st.use_realtime_priority ? "true" : "false",
        st.auto_stop_seconds,
        st.normalize_correlation ? "true" : "false",
        st.tone_device.c_str(),
        st.tone_duration_ms);
    return std::fclose(f) == 0 && written > 0;
}

} // namespace vtuner
