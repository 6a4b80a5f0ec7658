#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace codonbias {
namespace log_utils {

namespace detail {

inline bool verbose_from_env() {
    const char* env = std::getenv("CODONBIAS_VERBOSE");
    return env && env[0] != '\0' && std::strcmp(env, "0") != 0;
}

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{verbose_from_env()};
    return flag;
}

}  // namespace detail

inline bool verbose() {
    return detail::verbose_flag().load(std::memory_order_relaxed);
}

inline void set_verbose(bool on) {
    detail::verbose_flag().store(on, std::memory_order_relaxed);
}

// Diagnostics to stderr, only when verbose
inline void log_info(const std::string& component, const std::string& msg) {
    if (!verbose()) return;
    std::cerr << "[" << component << "] " << msg << "\n";
}

inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t minutes = total_seconds / 60;
    return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

}  // namespace log_utils
}  // namespace codonbias
