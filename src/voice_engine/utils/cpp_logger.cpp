#include "cpp_logger.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <deque>
#include <iostream>
#include <mutex>

namespace voicelink {
namespace voice {
namespace logging {

std::atomic<LogLevel> current_log_level{LogLevel::INFO};

namespace {

constexpr std::size_t kMaxQueued = 2048;
constexpr std::size_t kMaxBatch = 100;

/**
 * Bounded entry buffer. On overflow the oldest entry goes and a single warning is
 * queued; the warning re-arms once a drain brings the backlog under half capacity.
 */
class LogQueue {
public:
    void append(LogEntry entry) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_) {
                return;
            }
            if (entries_.size() >= kMaxQueued) {
                entries_.pop_front();
                if (!overflow_reported_) {
                    entries_.pop_front();
                    entries_.push_back(LogEntry{LogLevel::WARNING,
                                                "Voice log queue overflow, oldest entries dropped",
                                                "cpp_logger.cpp", __LINE__});
                    overflow_reported_ = true;
                }
            }
            entries_.push_back(std::move(entry));
        }
        cv_.notify_one();
    }

    std::vector<LogEntry> drain(std::chrono::milliseconds timeout) {
        std::vector<LogEntry> batch;
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return shut_down_ || !entries_.empty(); });
        const std::size_t count = std::min(entries_.size(), kMaxBatch);
        batch.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            batch.push_back(std::move(entries_.front()));
            entries_.pop_front();
        }
        if (overflow_reported_ && entries_.size() < kMaxQueued / 2) {
            overflow_reported_ = false;
        }
        return batch;
    }

    void shut_down() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shut_down_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<LogEntry> entries_;
    bool shut_down_ = false;
    bool overflow_reported_ = false;
};

LogQueue& log_queue() {
    static LogQueue queue;
    return queue;
}

std::atomic<bool> stderr_echo{false};

std::string format_message(const char* format, va_list args) {
    char stack_buffer[512];
    va_list copy;
    va_copy(copy, args);
    const int needed = std::vsnprintf(stack_buffer, sizeof(stack_buffer), format, copy);
    va_end(copy);
    if (needed < 0) {
        return std::string("<log format error: ") + format + ">";
    }
    if (static_cast<std::size_t>(needed) < sizeof(stack_buffer)) {
        return std::string(stack_buffer, static_cast<std::size_t>(needed));
    }
    std::string out(static_cast<std::size_t>(needed) + 1, '\0');
    std::vsnprintf(&out[0], out.size(), format, args);
    out.resize(static_cast<std::size_t>(needed));
    return out;
}

} // namespace

const char* get_base_filename(const char* path) {
    if (!path) {
        return "";
    }
    const char* base = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            base = p + 1;
        }
    }
    return base;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERR: return "ERROR";
    }
    return "UNKNOWN";
}

void set_cpp_log_level(LogLevel level) {
    current_log_level.store(level);
}

void set_cpp_log_stderr_echo(bool enabled) {
    stderr_echo.store(enabled);
}

void log_message(LogLevel level, const char* file, int line, const char* format, ...) {
    if (static_cast<int>(level) < static_cast<int>(current_log_level.load(std::memory_order_relaxed))) {
        return;
    }

    va_list args;
    va_start(args, format);
    LogEntry entry{level, format_message(format, args), file ? file : "unknown_file", line};
    va_end(args);

    if (stderr_echo.load(std::memory_order_relaxed)) {
        std::cerr << "[" << level_name(level) << "][" << entry.filename << ":" << line << "] "
                  << entry.message << std::endl;
    }
    log_queue().append(std::move(entry));
}

std::vector<LogEntry> retrieve_log_entries(int timeout_ms) {
    return log_queue().drain(std::chrono::milliseconds(timeout_ms));
}

void shutdown_cpp_logger() {
    log_queue().shut_down();
}

} // namespace logging
} // namespace voice
} // namespace voicelink
