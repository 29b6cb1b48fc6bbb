/**
 * @file thread_priority.h
 * @brief Timing helpers for the 20 ms mixer tick.
 */
#ifndef VOICELINK_THREAD_PRIORITY_H
#define VOICELINK_THREAD_PRIORITY_H

#include <chrono>

namespace voicelink {
namespace voice {
namespace utils {

/**
 * @brief Moves the calling thread to SCHED_FIFO, a few steps under the maximum.
 * @return false if the platform or the process privileges do not allow it.
 */
bool set_current_thread_realtime_priority(const char* thread_name);

/**
 * @brief Waits for an absolute tick deadline.
 * @details Sleeps until just before the deadline and spins for the rest, since a plain
 *          sleep can overshoot by a millisecond or more.
 * @return How far past the deadline the call was made; zero when on time.
 */
std::chrono::microseconds sleep_until_deadline(std::chrono::steady_clock::time_point deadline);

} // namespace utils
} // namespace voice
} // namespace voicelink

#endif // VOICELINK_THREAD_PRIORITY_H
