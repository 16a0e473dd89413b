/**
 * @file logging.hpp
 * @brief Logging macros and per-request stage timing
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - StageTimings, a per-request collector of stage durations
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately to ensure visibility in Docker container logs.
 *
 */

#ifndef IMG2REEL_LOGGING_HPP
#define IMG2REEL_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace img2reel {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(img2reel::log_mutex);                     \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(img2reel::log_mutex);                     \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(img2reel::log_mutex);                     \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(img2reel::log_mutex);                     \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(img2reel::log_mutex);                     \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- STAGE TIMING -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the stage name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Stage name
  long microseconds; //< Duration in microseconds
};

/**
 * @class StageTimings
 * @brief Collects stage durations for one request.
 * @note Thread-safe: intro and main clips may finish on different encode
 *       workers and record into the same collector.
 */
class StageTimings {
public:
  /**
   * @brief Record a timing measurement.
   * @param name Stage name
   * @param us Duration in microseconds
   */
  void record(const std::string &name, long us);

  /**
   * @brief Render all entries as "name=1.23s name=0.04s".
   */
  std::string summary() const;

  /**
   * @brief Total of all recorded durations in microseconds.
   */
  long total_us() const;

  /**
   * @brief Copy of the recorded entries, in recording order.
   */
  std::vector<TimingEntry> entries() const;

private:
  mutable std::mutex mutex_;
  std::vector<TimingEntry> entries_;
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(timings, name)                                               \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    (timings).record(#name, static_cast<long>(timer_duration_##name));         \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(timings, name) ((void)0)
#endif

} // namespace img2reel

#endif // IMG2REEL_LOGGING_HPP
