#pragma once

#include <string>

#define SMRITI_VERSION "0.4.0"
#define SMRITI_ENV_FORMAT_VERSION_MAJOR 1
#define SMRITI_ENV_FORMAT_VERSION_MINOR 0
#define SMRITI_ENV_FORMAT_VERSION_PATCH 0

namespace smriti {
namespace version {

inline std::string env_format() {
    return std::to_string(SMRITI_ENV_FORMAT_VERSION_MAJOR) + "." +
           std::to_string(SMRITI_ENV_FORMAT_VERSION_MINOR) + "." +
           std::to_string(SMRITI_ENV_FORMAT_VERSION_PATCH);
}

constexpr size_t MAX_VERSION_DIGITS = 6;

// Parse "MAJOR.MINOR.PATCH", each part at most MAX_VERSION_DIGITS digits.
// Returns false on malformed input.
inline bool parse_env_format(const std::string& s, int& major, int& minor, int& patch) {
    int parts[3] = {0, 0, 0};
    size_t idx = 0;
    size_t digits = 0;
    for (char c : s) {
        if (c == '.') {
            if (digits == 0 || ++idx > 2) return false;
            digits = 0;
        } else if (c >= '0' && c <= '9') {
            if (++digits > MAX_VERSION_DIGITS) return false;
            parts[idx] = parts[idx] * 10 + (c - '0');
        } else {
            return false;
        }
    }
    if (idx != 2 || digits == 0) return false;
    major = parts[0];
    minor = parts[1];
    patch = parts[2];
    return true;
}

inline bool env_format_compatible(int major, int minor) {
    // Major version must match exactly (breaking layout changes)
    // Minor version: reader must be >= writer
    return major == SMRITI_ENV_FORMAT_VERSION_MAJOR &&
           minor <= SMRITI_ENV_FORMAT_VERSION_MINOR;
}

} // namespace version
} // namespace smriti
