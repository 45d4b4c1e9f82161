#include "r3b1nd/rebind.hpp"

#include "r3b1nd/catalog/catalog_factory.hpp"
#include "r3b1nd/config/rebind_config.hpp"
#include "r3b1nd/core/rebind_engine.hpp"

namespace r3b1nd {
namespace {

config::rebind_config load_config() {
  auto config = config::rebind_config::from_environment();
  config::apply_logging(config);
  return config;
}

core::rebind_engine& global_engine() {
  static core::rebind_engine engine(catalog::make_process_image_catalog(), load_config());
  return engine;
}

} // namespace

rebind_result rebind(std::string_view symbol, void* replacement, void** original) {
  return global_engine().rebind(symbol, replacement, original);
}

rebind_result rebind(const rebind_request& request) { return global_engine().rebind(request); }

std::vector<rebind_result> batch_rebind(const std::vector<rebind_request>& requests) {
  return global_engine().batch_rebind(requests);
}

void* find_address(std::string_view symbol) { return global_engine().find_address(symbol); }

symbol_lookup lookup_symbol(std::string_view symbol) { return global_engine().lookup_symbol(symbol); }

void clear_symbol_cache() { global_engine().clear_symbol_cache(); }

void with_exclusive_access(const std::function<void()>& block) {
  if (!block) {
    return;
  }
  global_engine().with_exclusive_access(block);
}

void log_images() { global_engine().log_images(); }

void log_symbol_cache() { global_engine().log_symbol_cache(); }

} // namespace r3b1nd
