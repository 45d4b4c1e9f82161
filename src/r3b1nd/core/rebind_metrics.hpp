#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>

namespace r3b1nd::core {

struct metrics_snapshot {
  uint64_t total_rebinds = 0;
  uint64_t successful_rebinds = 0;
  uint64_t total_ns = 0;
  uint64_t fastest_ns = 0;
  uint64_t slowest_ns = 0;

  double average_ns() const {
    return total_rebinds > 0 ? static_cast<double>(total_ns) / static_cast<double>(total_rebinds) : 0.0;
  }
};

class rebind_metrics {
public:
  void record(std::chrono::nanoseconds duration, bool success);
  metrics_snapshot snapshot() const;
  void reset();

private:
  std::atomic<uint64_t> total_rebinds_{0};
  std::atomic<uint64_t> successful_rebinds_{0};
  std::atomic<uint64_t> total_ns_{0};
  std::atomic<uint64_t> fastest_ns_{std::numeric_limits<uint64_t>::max()};
  std::atomic<uint64_t> slowest_ns_{0};
};

} // namespace r3b1nd::core
