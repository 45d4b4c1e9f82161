#pragma once

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace r3b1nd::util {

inline std::string format_hex(uint64_t value, size_t width = 0, bool prefix = true) {
  std::ostringstream out;
  if (prefix) {
    out << "0x";
  }
  out << std::hex;
  if (width > 0) {
    out << std::setw(static_cast<int>(width)) << std::setfill('0');
  }
  out << value;
  return out.str();
}

inline std::string format_address(const void* address) {
  return format_hex(static_cast<uint64_t>(reinterpret_cast<uintptr_t>(address)));
}

inline std::string format_slide(intptr_t slide) {
  if (slide < 0) {
    return "-" + format_hex(static_cast<uint64_t>(-static_cast<int64_t>(slide)));
  }
  return format_hex(static_cast<uint64_t>(slide));
}

} // namespace r3b1nd::util
