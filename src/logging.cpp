/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides:
 *          - Global log mutex
 *
 *          - StageTimings methods
 */

#include "img2reel/logging.hpp"

#include <fmt/core.h>

namespace img2reel {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- STAGE TIMINGS -----**

void StageTimings::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({name, us});
}

std::string StageTimings::summary() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string out;
  for (const auto &e : entries_) {
    if (!out.empty())
      out += ' ';
    out += fmt::format("{}={:.2f}s", e.name, e.microseconds / 1000000.0);
  }
  return out;
}

long StageTimings::total_us() const {
  std::lock_guard<std::mutex> lock(mutex_);
  long total = 0;
  for (const auto &e : entries_) {
    total += e.microseconds;
  }
  return total;
}

std::vector<TimingEntry> StageTimings::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

} // namespace img2reel
