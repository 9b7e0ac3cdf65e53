#pragma once
// Debug logging: timestamped, component-tagged lines on stderr
//
// Silent unless verbose mode is on (--verbose or COLLAB_VERBOSE=1).

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace collab {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{[] {
        const char* env = std::getenv("COLLAB_VERBOSE");
        return env && *env && std::strcmp(env, "0") != 0;
    }()};
    return flag;
}

inline void set_verbose(bool on) { verbose_flag().store(on); }
inline bool verbose() { return verbose_flag().load(); }

#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << component << "] ";
    std::cerr.flush();

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

} // namespace collab
