#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace LSE {

/**
 * @brief Time source returning milliseconds since the Unix epoch
 *
 * Machines read time only through their Clock, so tests can substitute a
 * manual clock and replay identical histories.
 */
using Clock = std::function<int64_t()>;

inline int64_t systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

inline Clock systemClock() {
    return [] { return systemNowMs(); };
}

}  // namespace LSE
