#pragma once
// Logging: timestamped stderr lines tagged by component
//
//   [14:03:07.412][index] published version 12 (3 entities)
//
// Debug lines are dropped unless verbose mode is on (--verbose or
// RESONANCE_VERBOSE=1).

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace resonance {
namespace log {

enum class Level { Debug, Info, Warn, Error };

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{[] {
        const char* env = std::getenv("RESONANCE_VERBOSE");
        return env != nullptr && env[0] == '1';
    }()};
    return flag;
}

inline void set_verbose(bool on) { verbose_flag().store(on); }
inline bool verbose() { return verbose_flag().load(); }

inline std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

inline const char* level_prefix(Level level) {
    switch (level) {
        case Level::Warn:  return "warning: ";
        case Level::Error: return "error: ";
        default:           return "";
    }
}

inline void vwrite(Level level, const char* component, const char* fmt, va_list args) {
    if (level == Level::Debug && !verbose()) return;

    // Timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    std::lock_guard<std::mutex> lock(sink_mutex());
    std::fprintf(stderr, "[%s.%03d][%s] %s", time_buf,
                 static_cast<int>(now_ms.count()), component, level_prefix(level));
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

#if defined(__GNUC__)
#define RESONANCE_PRINTF_FORMAT __attribute__((format(printf, 2, 3)))
#else
#define RESONANCE_PRINTF_FORMAT
#endif

inline void debug(const char* component, const char* fmt, ...) RESONANCE_PRINTF_FORMAT;
inline void info(const char* component, const char* fmt, ...) RESONANCE_PRINTF_FORMAT;
inline void warn(const char* component, const char* fmt, ...) RESONANCE_PRINTF_FORMAT;
inline void error(const char* component, const char* fmt, ...) RESONANCE_PRINTF_FORMAT;

inline void debug(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Debug, component, fmt, args);
    va_end(args);
}

inline void info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Info, component, fmt, args);
    va_end(args);
}

inline void warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Warn, component, fmt, args);
    va_end(args);
}

inline void error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Error, component, fmt, args);
    va_end(args);
}

} // namespace log
} // namespace resonance
