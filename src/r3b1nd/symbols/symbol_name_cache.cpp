#include "r3b1nd/symbols/symbol_name_cache.hpp"

namespace r3b1nd::symbols {

// lock order: mutex_ before pending_mutex_

std::optional<std::string> symbol_name_cache::lookup(uintptr_t address) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(address);
  if (it != entries_.end()) {
    return it->second;
  }

  if (pending_count_.load(std::memory_order_acquire) == 0) {
    return std::nullopt;
  }
  std::shared_lock pending_lock(pending_mutex_);
  for (const auto& [key, name] : pending_) {
    if (key == address) {
      return name;
    }
  }
  return std::nullopt;
}

void symbol_name_cache::publish(uintptr_t address, std::string name) {
  std::unique_lock lock(mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    std::unique_lock pending_lock(pending_mutex_);
    pending_.emplace_back(address, std::move(name));
    pending_count_.store(pending_.size(), std::memory_order_release);
    return;
  }

  drain_pending_locked();
  entries_.emplace(address, std::move(name));
}

void symbol_name_cache::clear() {
  std::unique_lock lock(mutex_);
  std::unique_lock pending_lock(pending_mutex_);
  entries_.clear();
  pending_.clear();
  pending_count_.store(0, std::memory_order_release);
}

size_t symbol_name_cache::size() const {
  std::shared_lock lock(mutex_);
  std::shared_lock pending_lock(pending_mutex_);
  return entries_.size() + pending_.size();
}

size_t symbol_name_cache::pending() const { return pending_count_.load(std::memory_order_acquire); }

std::vector<std::pair<uintptr_t, std::string>> symbol_name_cache::entries() const {
  std::shared_lock lock(mutex_);
  std::shared_lock pending_lock(pending_mutex_);
  std::vector<std::pair<uintptr_t, std::string>> out(entries_.begin(), entries_.end());
  out.insert(out.end(), pending_.begin(), pending_.end());
  return out;
}

void symbol_name_cache::drain_pending_locked() {
  std::unique_lock pending_lock(pending_mutex_);
  for (auto& [key, name] : pending_) {
    entries_.emplace(key, std::move(name));
  }
  pending_.clear();
  pending_count_.store(0, std::memory_order_release);
}

} // namespace r3b1nd::symbols
