#include "r3b1nd/core/rebind_metrics.hpp"

namespace r3b1nd::core {

void rebind_metrics::record(std::chrono::nanoseconds duration, bool success) {
  const uint64_t ns = duration.count() > 0 ? static_cast<uint64_t>(duration.count()) : 0;

  total_rebinds_.fetch_add(1, std::memory_order_relaxed);
  if (success) {
    successful_rebinds_.fetch_add(1, std::memory_order_relaxed);
  }
  total_ns_.fetch_add(ns, std::memory_order_relaxed);

  uint64_t fastest = fastest_ns_.load(std::memory_order_relaxed);
  while (ns < fastest && !fastest_ns_.compare_exchange_weak(fastest, ns, std::memory_order_relaxed)) {
  }
  uint64_t slowest = slowest_ns_.load(std::memory_order_relaxed);
  while (ns > slowest && !slowest_ns_.compare_exchange_weak(slowest, ns, std::memory_order_relaxed)) {
  }
}

metrics_snapshot rebind_metrics::snapshot() const {
  metrics_snapshot out{};
  out.total_rebinds = total_rebinds_.load(std::memory_order_relaxed);
  out.successful_rebinds = successful_rebinds_.load(std::memory_order_relaxed);
  out.total_ns = total_ns_.load(std::memory_order_relaxed);
  out.slowest_ns = slowest_ns_.load(std::memory_order_relaxed);
  out.fastest_ns = out.total_rebinds > 0 ? fastest_ns_.load(std::memory_order_relaxed) : 0;
  return out;
}

void rebind_metrics::reset() {
  total_rebinds_.store(0, std::memory_order_relaxed);
  successful_rebinds_.store(0, std::memory_order_relaxed);
  total_ns_.store(0, std::memory_order_relaxed);
  fastest_ns_.store(std::numeric_limits<uint64_t>::max(), std::memory_order_relaxed);
  slowest_ns_.store(0, std::memory_order_relaxed);
}

} // namespace r3b1nd::core
