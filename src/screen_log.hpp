// =============================================================================
// SmartScreen - Logging
// =============================================================================
// One line per event on stderr, mirrored to a log file when one is open:
//   HH:MM:SS.mmm [LEVEL] [tag] (Tnnnnn) message
//
// Tags name the module: codec, session, enum, transfer, orch, usb, png,
// asset, config, cli. Panel serials go in the message as "[serial]".
//
//   SLOG_INFO("transfer", "[%s] Chunk %zu/%zu sent", serial, n, total);
//
// Safe to call from the per-panel threads a caller may run.
// =============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace smartscreen::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Warn};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;

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

inline void setLogLevel(Level l) { g_min_level = l; }
inline Level logLevel() { return g_min_level.load(std::memory_order_relaxed); }

// Config "log.level" values; unknown names give Info
inline Level levelFromName(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

// Appends, so several runs against the same panels share one file
inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "a");
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

namespace detail {

inline void timestamp(char* out, size_t len) {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    struct tm local;
    localtime_r(&secs, &local);
    snprintf(out, len, "%02d:%02d:%02d.%03d",
             local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(ms));
}

// Short, stable per-thread id for telling panel threads apart
inline unsigned long threadTag() {
    return static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
}

} // namespace detail

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < logLevel()) return;

    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    char line[2200];
    char when[32];
    detail::timestamp(when, sizeof(when));
    snprintf(line, sizeof(line), "%s [%s] [%s] (T%lu) %s\n",
             when, levelStr(level), tag, detail::threadTag(), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    fputs(line, stderr);
    if (g_log_file) {
        fputs(line, g_log_file);
        fflush(g_log_file);
    }
}

} // namespace smartscreen::log

#define SLOG_TRACE(tag, fmt, ...) smartscreen::log::write(smartscreen::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define SLOG_DEBUG(tag, fmt, ...) smartscreen::log::write(smartscreen::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define SLOG_INFO(tag, fmt, ...)  smartscreen::log::write(smartscreen::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define SLOG_WARN(tag, fmt, ...)  smartscreen::log::write(smartscreen::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define SLOG_ERROR(tag, fmt, ...) smartscreen::log::write(smartscreen::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define SLOG_FATAL(tag, fmt, ...) smartscreen::log::write(smartscreen::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
