#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>
#include <type_traits>

namespace r3b1nd::macho {

// read-only, bounds-checked window over [begin, end) of process memory
class image_view {
public:
  image_view() = default;
  image_view(uintptr_t begin, uintptr_t end) : begin_(begin), end_(end < begin ? begin : end) {}

  uintptr_t begin() const { return begin_; }
  uintptr_t end() const { return end_; }
  size_t size() const { return static_cast<size_t>(end_ - begin_); }
  bool empty() const { return begin_ == end_; }

  bool contains(uintptr_t address, size_t length) const {
    if (address < begin_ || address > end_) {
      return false;
    }
    return length <= end_ - address;
  }

  template <typename T> std::optional<T> read(uintptr_t address) const {
    static_assert(std::is_trivially_copyable_v<T>, "image_view reads trivially copyable records only");
    if (!contains(address, sizeof(T))) {
      return std::nullopt;
    }
    T value{};
    std::memcpy(&value, reinterpret_cast<const void*>(address), sizeof(T));
    return value;
  }

  // nul-terminated string starting at address, not running past min(limit, end)
  std::optional<std::string_view> read_string(uintptr_t address, uintptr_t limit) const {
    if (limit > end_) {
      limit = end_;
    }
    if (address < begin_ || address >= limit) {
      return std::nullopt;
    }
    const auto* start = reinterpret_cast<const char*>(address);
    const size_t max_len = static_cast<size_t>(limit - address);
    const void* terminator = std::memchr(start, '\0', max_len);
    if (!terminator) {
      return std::nullopt;
    }
    return std::string_view(start, static_cast<size_t>(static_cast<const char*>(terminator) - start));
  }

private:
  uintptr_t begin_ = 0;
  uintptr_t end_ = 0;
};

} // namespace r3b1nd::macho
