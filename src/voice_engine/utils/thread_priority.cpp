#include "thread_priority.h"
#include "cpp_logger.h"

#include <thread>

#if defined(__linux__)
#include <pthread.h>
#include <sched.h>
#include <cstring>
#endif

namespace voicelink {
namespace voice {
namespace utils {
namespace {

// The last stretch before a deadline is spun instead of slept.
constexpr auto kSpinWindow = std::chrono::microseconds(1500);

} // namespace

bool set_current_thread_realtime_priority(const char* thread_name) {
    const char* name = (thread_name && *thread_name) ? thread_name : "voice";
#if defined(__linux__)
    const int top = sched_get_priority_max(SCHED_FIFO);
    const int bottom = sched_get_priority_min(SCHED_FIFO);
    if (top < 0 || bottom < 0) {
        LOG_VL_WARNING("[ThreadPriority] %s: SCHED_FIFO priority range unavailable", name);
        return false;
    }

    // Leave headroom for kernel and sound server threads.
    sched_param params{};
    params.sched_priority = top - 5 > bottom ? top - 5 : bottom;

    const int err = pthread_setschedparam(pthread_self(), SCHED_FIFO, &params);
    if (err != 0) {
        LOG_VL_WARNING("[ThreadPriority] %s: staying at normal priority (%s)", name, strerror(err));
        return false;
    }
    LOG_VL_INFO("[ThreadPriority] %s running at SCHED_FIFO %d", name, params.sched_priority);
    return true;
#else
    LOG_VL_WARNING("[ThreadPriority] %s: real-time priority unsupported on this platform", name);
    return false;
#endif
}

std::chrono::microseconds sleep_until_deadline(std::chrono::steady_clock::time_point deadline) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
        return std::chrono::duration_cast<std::chrono::microseconds>(now - deadline);
    }
    if (deadline - now > kSpinWindow) {
        std::this_thread::sleep_until(deadline - kSpinWindow);
    }
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::yield();
    }
    return std::chrono::microseconds(0);
}

} // namespace utils
} // namespace voice
} // namespace voicelink
