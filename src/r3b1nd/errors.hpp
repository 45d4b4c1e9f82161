#pragma once

#include "r3b1nd/rebind.hpp"

namespace r3b1nd {

const char* to_string(rebind_error error);

inline rebind_error_info make_error(rebind_error code, const char* detail = nullptr) {
  rebind_error_info info{};
  info.code = code;
  info.detail = detail;
  return info;
}

} // namespace r3b1nd
