/**
 * @file cpp_logger.h
 * @brief In-process log queue shared by every voice worker.
 * @details Workers log through the `LOG_VL_*` macros; entries are buffered (bounded,
 *          oldest dropped first) until the host collects them with
 *          `retrieve_log_entries`. Hosts without a log pump can turn on stderr echo.
 *          Messages carry a bracketed component tag by convention, e.g.
 *          `[VoiceMixer]` or `[UdpReceiver:0x0000ABCD]`.
 */
#ifndef VOICELINK_CPP_LOGGER_H
#define VOICELINK_CPP_LOGGER_H

#include <atomic>
#include <string>
#include <vector>

namespace voicelink {
namespace voice {
namespace logging {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERR
};

/** @brief Entries below this level are discarded at the call site. */
extern std::atomic<LogLevel> current_log_level;

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string filename;   ///< Base name only.
    int line_number;
};

/**
 * @brief Takes up to 100 buffered entries, waiting at most `timeout_ms` for the first.
 * @return An empty batch on timeout or after shutdown.
 */
std::vector<LogEntry> retrieve_log_entries(int timeout_ms = 100);

/** @brief Wakes any `retrieve_log_entries` waiter; later messages are dropped. */
void shutdown_cpp_logger();

void set_cpp_log_level(LogLevel level);

/** @brief Mirrors accepted entries to stderr in addition to queueing them. */
void set_cpp_log_stderr_echo(bool enabled);

/**
 * @brief printf-style entry point behind the macros.
 */
void log_message(LogLevel level, const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

/** @brief Strips directories from `__FILE__`, for either separator. */
const char* get_base_filename(const char* path);

const char* level_name(LogLevel level);

} // namespace logging
} // namespace voice
} // namespace voicelink

#define LOG_VL_BASE(level, fmt, ...) \
    voicelink::voice::logging::log_message( \
        level, \
        voicelink::voice::logging::get_base_filename(__FILE__), \
        __LINE__, \
        fmt, \
        ##__VA_ARGS__)

#define LOG_VL_DEBUG(fmt, ...)   LOG_VL_BASE(voicelink::voice::logging::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_VL_INFO(fmt, ...)    LOG_VL_BASE(voicelink::voice::logging::LogLevel::INFO, fmt, ##__VA_ARGS__)
#define LOG_VL_WARNING(fmt, ...) LOG_VL_BASE(voicelink::voice::logging::LogLevel::WARNING, fmt, ##__VA_ARGS__)
#define LOG_VL_ERROR(fmt, ...)   LOG_VL_BASE(voicelink::voice::logging::LogLevel::ERR, fmt, ##__VA_ARGS__)

#endif // VOICELINK_CPP_LOGGER_H
