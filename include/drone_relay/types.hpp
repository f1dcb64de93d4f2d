// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// relay: clock primitives and the tactical event payload.

#pragma once

#include <chrono>
#include <string>

namespace drone_relay {

/**
 * @brief Alias for the monotonic clock that drives rate limiting and inactivity.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for the wall clock used to stamp outbound tactical events.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Alias for UTC instants rendered into tactical events.
 */
using SystemTimePoint = std::chrono::time_point<SystemClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Serialized tactical event (XML document bytes).
 */
using CotPayload = std::string;

/**
 * @brief Convert a steady-clock delta into fractional seconds.
 */
inline Duration elapsed_between(TimePoint earlier, TimePoint later) {
    return std::chrono::duration_cast<Duration>(later - earlier);
}

}  // namespace drone_relay
