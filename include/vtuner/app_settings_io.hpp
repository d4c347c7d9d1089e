#pragma once

#include "app_settings.hpp"

namespace vtuner {

bool load_settings(const char* path, AppSettings& st);
bool save_settings(const char* path, const AppSettings& st);

// Resets out-of-range values to defaults; returns false if anything changed
bool sanitize_settings(AppSettings& st);

}
