#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <redlog.hpp>

#include "r3b1nd/catalog/image_catalog.hpp"
#include "r3b1nd/symbols/symbol_name_cache.hpp"

namespace r3b1nd::symbols {

// names code addresses through the symbol table of one reference image, memoizing hits in the cache
class symbol_resolver {
public:
  symbol_resolver(const catalog::image_catalog& catalog, symbol_name_cache& cache, std::string reference_image = {});

  std::optional<std::string> resolve(const void* address);

  // number of full symbol table scans performed so far
  uint64_t scan_count() const { return scans_.load(std::memory_order_relaxed); }

  const std::string& reference_image_name() const { return reference_image_; }

private:
  std::optional<catalog::loaded_image> select_reference_image() const;
  std::optional<std::string> scan_image(const catalog::loaded_image& image, uintptr_t address);

  const catalog::image_catalog& catalog_;
  symbol_name_cache& cache_;
  std::string reference_image_{};
  std::atomic<uint64_t> scans_{0};
  mutable redlog::logger log_ = redlog::get_logger("r3b1nd.symbols.resolver");
};

} // namespace r3b1nd::symbols
