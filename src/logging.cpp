/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "video_tagger/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace video_tagger {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  std::lock_guard<std::mutex> out(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<40} {:>20}\n", "File", "Time (us) [sec]");
  fmt::print("{:-<40} {:-<20}\n", "", "");

  long total_us = 0;
  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<40} {:>10} [{:.2f}s]\n", e.name, e.microseconds, seconds);
    total_us += e.microseconds;
  }
  fmt::print("{:<40} {:>10} [{:.2f}s]\n", "(sum)", total_us,
             total_us / 1000000.0);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

size_t TimingCollector::size() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries.size();
}

} // namespace video_tagger
