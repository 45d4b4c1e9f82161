#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace r3b1nd {

enum class rebind_error {
  ok,
  symbol_not_found,
  image_layout_unsupported,
  concurrent_modification,
  unsupported_architecture,
  invalid_symbol_format,
  access_denied
};

struct rebind_error_info {
  rebind_error code = rebind_error::ok;
  const char* detail = nullptr;

  constexpr bool ok() const { return code == rebind_error::ok; }
};

struct rebind_request {
  std::string symbol{};
  void* replacement = nullptr;
  void** original = nullptr;
};

struct rebind_result {
  bool success = false;
  std::string symbol{};
  std::string image{};
  void* original = nullptr;
  void** slot = nullptr;
  std::chrono::nanoseconds duration{0};
  rebind_error_info error{};
};

struct symbol_lookup {
  void* address = nullptr;
  std::string image{};
  rebind_error_info error{};
};

// process-wide engine over the host image catalog, configured from the environment
rebind_result rebind(std::string_view symbol, void* replacement, void** original = nullptr);
rebind_result rebind(const rebind_request& request);
std::vector<rebind_result> batch_rebind(const std::vector<rebind_request>& requests);
void* find_address(std::string_view symbol);
symbol_lookup lookup_symbol(std::string_view symbol);
void clear_symbol_cache();
void with_exclusive_access(const std::function<void()>& block);
void log_images();
void log_symbol_cache();

} // namespace r3b1nd
