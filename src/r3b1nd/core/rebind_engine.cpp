#include "r3b1nd/core/rebind_engine.hpp"

#include <chrono>

#include "r3b1nd/catalog/mapped_image_catalog.hpp"
#include "r3b1nd/catalog/module_match.hpp"
#include "r3b1nd/errors.hpp"
#include "r3b1nd/macho/symbol_table.hpp"
#include "r3b1nd/patcher/pointer_auth.hpp"
#include "r3b1nd/util/format_utils.hpp"

namespace r3b1nd::core {
namespace {

std::unique_ptr<catalog::image_catalog> catalog_or_empty(std::unique_ptr<catalog::image_catalog> catalog) {
  if (catalog) {
    return catalog;
  }
  return std::make_unique<catalog::mapped_image_catalog>();
}

rebind_error_info validate(const rebind_request& request) {
  if (request.symbol.empty()) {
    return make_error(rebind_error::invalid_symbol_format, "empty_symbol");
  }
  if (!request.replacement) {
    return make_error(rebind_error::invalid_symbol_format, "null_replacement");
  }
  return make_error(rebind_error::ok);
}

} // namespace

const char* to_string(rebind_state state) {
  switch (state) {
    case rebind_state::idle:
      return "idle";
    case rebind_state::scanning_images:
      return "scanning_images";
    case rebind_state::scanning_table:
      return "scanning_table";
    case rebind_state::matched:
      return "matched";
    case rebind_state::exhausted:
      return "exhausted";
  }
  return "unknown";
}

rebind_engine::rebind_engine(std::unique_ptr<catalog::image_catalog> catalog, config::rebind_config config)
    : catalog_(catalog_or_empty(std::move(catalog))),
      config_(std::move(config)),
      resolver_(*catalog_, cache_, config_.reference_image) {}

rebind_result rebind_engine::rebind(const rebind_request& request) {
  const auto start = std::chrono::steady_clock::now();

  rebind_result result{};
  result.symbol = request.symbol;
  result.error = validate(request);
  if (!result.error.ok()) {
    log_.dbg("rejected rebind request", redlog::field("symbol", request.symbol),
             redlog::field("reason", result.error.detail));
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
    return result;
  }

  {
    std::lock_guard lock(gate_);
    result = rebind_locked(request);
    state_ = rebind_state::idle;
  }

  result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
  if (config_.record_metrics) {
    metrics_.record(result.duration, result.success);
  }

  if (result.success) {
    log_.vrb("rebound symbol", redlog::field("symbol", result.symbol), redlog::field("image", result.image),
             redlog::field("slot", util::format_address(result.slot)),
             redlog::field("original", util::format_address(result.original)),
             redlog::field("duration_ns", static_cast<uint64_t>(result.duration.count())));
  } else {
    log_.vrb("rebind failed", redlog::field("symbol", result.symbol), redlog::field("error", to_string(result.error.code)),
             redlog::field("detail", result.error.detail ? result.error.detail : "-"),
             redlog::field("duration_ns", static_cast<uint64_t>(result.duration.count())));
  }
  return result;
}

rebind_result rebind_engine::rebind(std::string_view symbol, void* replacement, void** original) {
  rebind_request request{};
  request.symbol = std::string(symbol);
  request.replacement = replacement;
  request.original = original;
  return rebind(request);
}

std::vector<rebind_result> rebind_engine::batch_rebind(const std::vector<rebind_request>& requests) {
  std::vector<rebind_result> results;
  results.reserve(requests.size());
  for (const auto& request : requests) {
    results.push_back(rebind(request));
  }
  return results;
}

void rebind_engine::transition(rebind_state next, std::string_view symbol) {
  log_.ped("rebind state", redlog::field("symbol", std::string(symbol)), redlog::field("from", to_string(state_)),
           redlog::field("to", to_string(next)));
  state_ = next;
}

rebind_result rebind_engine::rebind_locked(const rebind_request& request) {
  rebind_result result{};
  result.symbol = request.symbol;

  transition(rebind_state::scanning_images, request.symbol);
  const auto images = catalog_->enumerate();
  log_.trc("scanning images", redlog::field("symbol", request.symbol), redlog::field("images", images.size()));

  for (const auto& image : images) {
    if (skipped(image)) {
      log_.ped("image skipped by configuration", redlog::field("image", image.name));
      continue;
    }

    const auto outcome = rebind_in_image(image, request, result);
    if (outcome == image_outcome::matched || outcome == image_outcome::failed) {
      transition(rebind_state::matched, request.symbol);
      return result;
    }
  }

  transition(rebind_state::exhausted, request.symbol);
  result.success = false;
  result.error = make_error(rebind_error::symbol_not_found, "scan_exhausted");
  return result;
}

rebind_engine::image_outcome rebind_engine::rebind_in_image(const catalog::loaded_image& image,
                                                            const rebind_request& request, rebind_result& result) {
  const auto parsed = macho::parse_image(image);
  if (!parsed.error.ok()) {
    log_.ped("skipping image", redlog::field("image", image.name), redlog::field("error", to_string(parsed.error.code)),
             redlog::field("reason", parsed.error.detail));
    return image_outcome::skipped;
  }

  const auto lookup = macho::locate_pointer_table(parsed.layout);
  if (!lookup.error.ok()) {
    log_.ped("no usable lazy pointer table", redlog::field("image", image.name),
             redlog::field("reason", lookup.error.detail));
    return image_outcome::skipped;
  }
  if (lookup.table.stride != sizeof(void*)) {
    log_.dbg("pointer width differs from host", redlog::field("image", image.name),
             redlog::field("error", to_string(rebind_error::unsupported_architecture)),
             redlog::field("stride", lookup.table.stride));
    return image_outcome::skipped;
  }

  transition(rebind_state::scanning_table, request.symbol);
  const auto match = find_match(parsed.layout, lookup.table, request.symbol);
  if (!match) {
    return image_outcome::no_match;
  }

  result.image = image.name;
  result.slot = match->slot;
  result.original = patcher::callable_pointer(match->current);

  void* replacement = patcher::slot_pointer(request.replacement, match->slot);
  const auto status = patcher_.patch(match->slot, match->current, replacement);
  switch (status) {
    case patcher::patch_status::patched:
      result.success = true;
      result.error = make_error(rebind_error::ok);
      if (request.original) {
        *request.original = result.original;
      }
      return image_outcome::matched;
    case patcher::patch_status::lost_race:
      result.error = make_error(rebind_error::concurrent_modification, "slot_changed");
      break;
    case patcher::patch_status::invalid_slot:
      result.error = make_error(rebind_error::image_layout_unsupported, "misaligned_slot");
      break;
    case patcher::patch_status::protection_failed:
      result.error = make_error(rebind_error::access_denied, "protection_change_failed");
      break;
  }

  log_.wrn("matched slot could not be patched", redlog::field("symbol", request.symbol),
           redlog::field("image", image.name), redlog::field("slot", util::format_address(match->slot)),
           redlog::field("status", patcher::to_string(status)));
  return image_outcome::failed;
}

std::optional<symbol_match> rebind_engine::find_match(const macho::image_layout& layout,
                                                      const macho::pointer_table& table, std::string_view target) {
  std::optional<macho::symbol_table> indirect_symbols;
  if (config_.indirect_fallback) {
    auto symtab = macho::read_symbol_table(layout);
    if (symtab.error.ok()) {
      indirect_symbols = symtab.table;
    }
  }

  for (size_t i = 0; i < table.count(); ++i) {
    void** slot = table.slot(i);
    void* current = patcher::slot_patcher::load(slot);

    std::optional<std::string> name = resolver_.resolve(current);
    if (!name || !macho::symbol_name_matches(*name, target)) {
      if (!indirect_symbols) {
        continue;
      }
      const auto imported = macho::indirect_symbol_name(layout, *indirect_symbols, table, i);
      if (!imported || !macho::symbol_name_matches(*imported, target)) {
        continue;
      }
      name = std::string(*imported);
    }

    log_.dbg("matched pointer slot", redlog::field("symbol", *name), redlog::field("index", i),
             redlog::field("slot", util::format_address(slot)), redlog::field("current", util::format_address(current)));
    symbol_match match{};
    match.slot = slot;
    match.current = current;
    match.name = std::move(*name);
    match.index = i;
    return match;
  }
  return std::nullopt;
}

bool rebind_engine::skipped(const catalog::loaded_image& image) const {
  return catalog::image_in_list(config_.skip_images, image.name);
}

void* rebind_engine::find_address(std::string_view symbol) const { return lookup_symbol(symbol).address; }

symbol_lookup rebind_engine::lookup_symbol(std::string_view symbol) const {
  symbol_lookup result{};
  if (symbol.empty()) {
    result.error = make_error(rebind_error::invalid_symbol_format, "empty_symbol");
    return result;
  }

  for (const auto& image : catalog_->enumerate()) {
    if (skipped(image)) {
      continue;
    }
    const auto parsed = macho::parse_image(image);
    if (!parsed.error.ok()) {
      continue;
    }
    const auto symtab = macho::read_symbol_table(parsed.layout);
    if (!symtab.error.ok()) {
      log_.ped("symbol table unusable", redlog::field("image", image.name),
               redlog::field("reason", symtab.error.detail));
      continue;
    }

    bool found = false;
    macho::for_each_symbol(parsed.layout, symtab.table, [&](uint32_t, const macho::symbol_entry& entry) {
      if (!macho::is_defined(entry) || !macho::symbol_name_matches(entry.name, symbol)) {
        return true;
      }
      result.address = reinterpret_cast<void*>(macho::symbol_runtime_address(parsed.layout, entry));
      found = true;
      return false;
    });

    if (found) {
      result.image = image.name;
      result.error = make_error(rebind_error::ok);
      log_.trc("found symbol address", redlog::field("symbol", std::string(symbol)), redlog::field("image", image.name),
               redlog::field("address", util::format_address(result.address)));
      return result;
    }
  }

  result.error = make_error(rebind_error::symbol_not_found, "scan_exhausted");
  return result;
}

void rebind_engine::clear_symbol_cache() {
  cache_.clear();
  log_.dbg("cleared symbol cache");
}

std::vector<image_description> rebind_engine::list_images() const {
  std::vector<image_description> out;
  for (const auto& image : catalog_->enumerate()) {
    image_description description{};
    description.name = image.name;
    description.header = image.header;
    description.slide = image.slide;

    auto lookup = macho::locate_pointer_table(image);
    description.error = lookup.error;
    if (lookup.error.ok()) {
      description.has_pointer_table = true;
      description.table = std::move(lookup.table);
    }
    out.push_back(std::move(description));
  }
  return out;
}

void rebind_engine::log_images() const {
  const auto images = list_images();
  log_.inf("loaded images", redlog::field("count", images.size()));
  for (const auto& image : images) {
    if (image.has_pointer_table) {
      log_.inf("image", redlog::field("name", image.name), redlog::field("header", util::format_address(image.header)),
               redlog::field("slide", util::format_slide(image.slide)),
               redlog::field("table", image.table.segment + "," + image.table.section),
               redlog::field("slots", image.table.count()));
    } else {
      log_.inf("image", redlog::field("name", image.name), redlog::field("header", util::format_address(image.header)),
               redlog::field("slide", util::format_slide(image.slide)),
               redlog::field("table", to_string(image.error.code)));
    }
  }
}

void rebind_engine::log_symbol_cache() const {
  const auto entries = cache_.entries();
  log_.inf("symbol cache", redlog::field("entries", entries.size()), redlog::field("pending", cache_.pending()));
  for (const auto& [address, name] : entries) {
    log_.inf("cached symbol", redlog::field("address", util::format_hex(address)), redlog::field("name", name));
  }
}

} // namespace r3b1nd::core
