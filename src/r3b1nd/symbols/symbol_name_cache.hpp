#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace r3b1nd::symbols {

// runtime address -> symbol name. entries are only added or dropped wholesale by clear(); a pair goes stale if its
// image unloads and another image maps at the same address, which is not tracked.
class symbol_name_cache {
public:
  std::optional<std::string> lookup(uintptr_t address) const;

  // never waits for the exclusive lock: when readers or a writer hold it the entry is parked and still visible to
  // lookup until the next writer folds it in
  void publish(uintptr_t address, std::string name);

  void clear();
  size_t size() const;

  // entries parked by publish and not yet folded into the map
  size_t pending() const;

  // copy of every entry, parked ones last
  std::vector<std::pair<uintptr_t, std::string>> entries() const;

private:
  void drain_pending_locked();

  mutable std::shared_mutex mutex_{};
  std::unordered_map<uintptr_t, std::string> entries_{};
  // readers that miss the map only take pending_mutex_ shared, and skip it while nothing is parked
  mutable std::shared_mutex pending_mutex_{};
  std::vector<std::pair<uintptr_t, std::string>> pending_{};
  std::atomic<size_t> pending_count_{0};
};

} // namespace r3b1nd::symbols
