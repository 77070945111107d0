#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format seconds since the epoch as a UTC ISO-8601 string
 *        (YYYY-MM-DDTHH:MM:SSZ).
 */
std::string format_epoch_utc(std::int64_t seconds);

/**
 * @brief Format an elapsed duration as milliseconds, e.g. "125ms" or "3.4s".
 */
std::string format_elapsed(std::chrono::steady_clock::duration dur);

#endif // TIME_UTILS_HPP
