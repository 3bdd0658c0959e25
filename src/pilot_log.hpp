#pragma once
// =============================================================================
// scrcpy-pilot - Logging
// =============================================================================
// Process-wide, level-filtered logger with a stderr console and an optional
// file. Lines look like:
//
//   14:02:07.431 [INFO ] [supervisor] (T18822) R58M123: Starting -> Running
//
// The console is switched off while the terminal UI owns the screen; the
// file keeps receiving everything at or above the level.
//
// Usage: PLOG_INFO("tag", "message %s", arg);
// =============================================================================

#include <sys/syscall.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace pilot::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// Config spelling: "trace" ... "fatal", "warning" accepted; unknown -> Info
inline Level parseLevel(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

namespace detail {

struct State {
    std::atomic<Level> min_level{Level::Info};
    std::atomic<bool> console{true};
    std::mutex mutex;           // guards file and serializes output
    FILE* file = nullptr;
};

inline State& state() {
    static State s;
    return s;
}

} // namespace detail

inline void setLogLevel(Level l) { detail::state().min_level = l; }
inline Level logLevel() { return detail::state().min_level.load(); }
inline bool enabled(Level l) { return l >= detail::state().min_level.load(std::memory_order_relaxed); }

inline void setConsoleOutput(bool on) { detail::state().console = on; }

// Truncates: every run starts a fresh file
inline bool openLogFile(const char* path) {
    auto& st = detail::state();
    std::lock_guard<std::mutex> lock(st.mutex);
    if (st.file) fclose(st.file);
    st.file = fopen(path, "w");
    return st.file != nullptr;
}

inline void closeLogFile() {
    auto& st = detail::state();
    std::lock_guard<std::mutex> lock(st.mutex);
    if (st.file) {
        fclose(st.file);
        st.file = nullptr;
    }
}

// One complete line without the trailing newline
inline std::string formatLine(std::chrono::system_clock::time_point when, Level level,
                              const char* tag, long tid, const char* msg) {
    const time_t secs = std::chrono::system_clock::to_time_t(when);
    const int ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        when.time_since_epoch()).count() % 1000);
    struct tm tm_buf;
    localtime_r(&secs, &tm_buf);

    char prefix[96];
    snprintf(prefix, sizeof(prefix), "%02d:%02d:%02d.%03d [%s] [%s] (T%ld) ", tm_buf.tm_hour,
             tm_buf.tm_min, tm_buf.tm_sec, ms, levelStr(level), tag, tid);
    return std::string(prefix) + msg;
}

inline void write(Level level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (!enabled(level)) return;

    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    const std::string line = formatLine(std::chrono::system_clock::now(), level, tag,
                                        static_cast<long>(::syscall(SYS_gettid)), msg);

    auto& st = detail::state();
    std::lock_guard<std::mutex> lock(st.mutex);
    if (st.console.load(std::memory_order_relaxed)) {
        fprintf(stderr, "%s\n", line.c_str());
    }
    if (st.file) {
        fprintf(st.file, "%s\n", line.c_str());
        fflush(st.file);
    }
}

} // namespace pilot::log

#define PLOG_TRACE(tag, fmt, ...) pilot::log::write(pilot::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define PLOG_DEBUG(tag, fmt, ...) pilot::log::write(pilot::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define PLOG_INFO(tag, fmt, ...)  pilot::log::write(pilot::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define PLOG_WARN(tag, fmt, ...)  pilot::log::write(pilot::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define PLOG_ERROR(tag, fmt, ...) pilot::log::write(pilot::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define PLOG_FATAL(tag, fmt, ...) pilot::log::write(pilot::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
