#pragma once
// Stderr logging: "[HH:MM:SS.mmm][component] message"
//
// Debug output is gated by a process-wide verbose flag, set once at the
// executable entry. Info and warnings always print.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace smriti {

namespace detail {
inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void log_prefix(const char* level, const char* component) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << std::setfill(' ') << "]";
    if (level) std::cerr << "[" << level << "]";
    std::cerr << "[" << component << "] ";
}

inline void log_vprint(const char* level, const char* component, const char* fmt, va_list args) {
    log_prefix(level, component);
    std::cerr.flush();
    vfprintf(stderr, fmt, args);
    std::cerr << "\n";
}
} // namespace detail

inline void set_verbose(bool on) { detail::verbose_flag() = on; }
inline bool verbose() { return detail::verbose_flag(); }

#if defined(__GNUC__)
#define SMRITI_PRINTF_FORMAT(fmt_idx, arg_idx) __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define SMRITI_PRINTF_FORMAT(fmt_idx, arg_idx)
#endif

inline void log_debug(const char* component, const char* fmt, ...) SMRITI_PRINTF_FORMAT(2, 3);
inline void log_info(const char* component, const char* fmt, ...) SMRITI_PRINTF_FORMAT(2, 3);
inline void log_warn(const char* component, const char* fmt, ...) SMRITI_PRINTF_FORMAT(2, 3);

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!detail::verbose_flag()) return;
    va_list args;
    va_start(args, fmt);
    detail::log_vprint("debug", component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::log_vprint(nullptr, component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::log_vprint("warn", component, fmt, args);
    va_end(args);
}

} // namespace smriti
