#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <redlog.hpp>

#include "r3b1nd/catalog/image_catalog.hpp"
#include "r3b1nd/config/rebind_config.hpp"
#include "r3b1nd/core/rebind_metrics.hpp"
#include "r3b1nd/macho/layout_reader.hpp"
#include "r3b1nd/patcher/slot_patcher.hpp"
#include "r3b1nd/rebind.hpp"
#include "r3b1nd/symbols/symbol_name_cache.hpp"
#include "r3b1nd/symbols/symbol_resolver.hpp"

namespace r3b1nd::core {

enum class rebind_state {
  idle,
  scanning_images,
  scanning_table,
  matched,
  exhausted
};

const char* to_string(rebind_state state);

struct symbol_match {
  void** slot = nullptr;
  void* current = nullptr;
  std::string name{};
  size_t index = 0;
};

struct image_description {
  std::string name{};
  const void* header = nullptr;
  intptr_t slide = 0;
  bool has_pointer_table = false;
  macho::pointer_table table{};
  rebind_error_info error{};
};

// serializes every rebind behind one engine-wide gate; the symbol cache and metrics live and die with the engine
class rebind_engine {
public:
  explicit rebind_engine(std::unique_ptr<catalog::image_catalog> catalog, config::rebind_config config = {});

  rebind_engine(const rebind_engine&) = delete;
  rebind_engine& operator=(const rebind_engine&) = delete;

  rebind_result rebind(const rebind_request& request);
  rebind_result rebind(std::string_view symbol, void* replacement, void** original = nullptr);

  // sequential, in input order; a failed request does not stop the ones after it
  std::vector<rebind_result> batch_rebind(const std::vector<rebind_request>& requests);

  void* find_address(std::string_view symbol) const;
  symbol_lookup lookup_symbol(std::string_view symbol) const;

  void clear_symbol_cache();

  // runs fn while holding the rebind gate; engine calls made by fn re-enter it
  template <typename Fn> decltype(auto) with_exclusive_access(Fn&& fn) {
    std::lock_guard lock(gate_);
    return std::forward<Fn>(fn)();
  }

  std::vector<image_description> list_images() const;
  void log_images() const;
  void log_symbol_cache() const;

  metrics_snapshot metrics() const { return metrics_.snapshot(); }
  void reset_metrics() { metrics_.reset(); }

  const config::rebind_config& config() const { return config_; }
  catalog::image_catalog& catalog() { return *catalog_; }
  symbols::symbol_name_cache& symbol_cache() { return cache_; }
  const symbols::symbol_resolver& resolver() const { return resolver_; }

private:
  enum class image_outcome {
    skipped,
    no_match,
    matched,
    failed
  };

  rebind_result rebind_locked(const rebind_request& request);
  image_outcome rebind_in_image(const catalog::loaded_image& image, const rebind_request& request,
                                rebind_result& result);
  std::optional<symbol_match> find_match(const macho::image_layout& layout, const macho::pointer_table& table,
                                         std::string_view target);
  bool skipped(const catalog::loaded_image& image) const;
  void transition(rebind_state next, std::string_view symbol);

  std::unique_ptr<catalog::image_catalog> catalog_;
  config::rebind_config config_;
  symbols::symbol_name_cache cache_{};
  symbols::symbol_resolver resolver_;
  patcher::slot_patcher patcher_{};
  rebind_metrics metrics_{};
  rebind_state state_ = rebind_state::idle;
  mutable std::recursive_mutex gate_{};
  mutable redlog::logger log_ = redlog::get_logger("r3b1nd.engine");
};

} // namespace r3b1nd::core
