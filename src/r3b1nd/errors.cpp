#include "r3b1nd/errors.hpp"

namespace r3b1nd {

const char* to_string(rebind_error error) {
  switch (error) {
    case rebind_error::ok:
      return "ok";
    case rebind_error::symbol_not_found:
      return "symbol_not_found";
    case rebind_error::image_layout_unsupported:
      return "image_layout_unsupported";
    case rebind_error::concurrent_modification:
      return "concurrent_modification";
    case rebind_error::unsupported_architecture:
      return "unsupported_architecture";
    case rebind_error::invalid_symbol_format:
      return "invalid_symbol_format";
    case rebind_error::access_denied:
      return "access_denied";
  }
  return "unknown";
}

} // namespace r3b1nd
