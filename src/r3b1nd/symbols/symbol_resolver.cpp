#include "r3b1nd/symbols/symbol_resolver.hpp"

#include <utility>

#include "r3b1nd/catalog/module_match.hpp"
#include "r3b1nd/macho/layout_reader.hpp"
#include "r3b1nd/macho/symbol_table.hpp"
#include "r3b1nd/patcher/pointer_auth.hpp"
#include "r3b1nd/util/format_utils.hpp"

namespace r3b1nd::symbols {

symbol_resolver::symbol_resolver(const catalog::image_catalog& catalog, symbol_name_cache& cache,
                                 std::string reference_image)
    : catalog_(catalog), cache_(cache), reference_image_(std::move(reference_image)) {}

std::optional<std::string> symbol_resolver::resolve(const void* address) {
  const uintptr_t key = patcher::strip_pointer(address);
  if (key == 0) {
    return std::nullopt;
  }

  if (auto cached = cache_.lookup(key)) {
    return cached;
  }

  const auto reference = select_reference_image();
  if (!reference) {
    log_.dbg("no reference image available", redlog::field("reference", reference_image_));
    return std::nullopt;
  }
  return scan_image(*reference, key);
}

std::optional<catalog::loaded_image> symbol_resolver::select_reference_image() const {
  auto images = catalog_.enumerate();
  if (images.empty()) {
    return std::nullopt;
  }
  if (reference_image_.empty()) {
    return std::move(images.front());
  }
  for (auto& image : images) {
    if (catalog::image_matches(reference_image_, image.name)) {
      return std::move(image);
    }
  }
  return std::nullopt;
}

std::optional<std::string> symbol_resolver::scan_image(const catalog::loaded_image& image, uintptr_t address) {
  const auto parsed = macho::parse_image(image);
  if (!parsed.error.ok()) {
    log_.dbg("reference image layout unsupported", redlog::field("image", image.name),
             redlog::field("reason", parsed.error.detail));
    return std::nullopt;
  }
  const auto symtab = macho::read_symbol_table(parsed.layout);
  if (!symtab.error.ok()) {
    log_.dbg("reference image symbol table unusable", redlog::field("image", image.name),
             redlog::field("reason", symtab.error.detail));
    return std::nullopt;
  }

  scans_.fetch_add(1, std::memory_order_relaxed);

  std::optional<std::string> name;
  macho::for_each_symbol(parsed.layout, symtab.table, [&](uint32_t, const macho::symbol_entry& entry) {
    if (!macho::is_defined(entry) || entry.name.empty()) {
      return true;
    }
    if (macho::symbol_runtime_address(parsed.layout, entry) != address) {
      return true;
    }
    name = std::string(entry.name);
    return false;
  });

  if (!name) {
    log_.ped("address not in reference symbol table", redlog::field("address", util::format_hex(address)),
             redlog::field("image", image.name));
    return std::nullopt;
  }

  log_.trc("resolved address", redlog::field("address", util::format_hex(address)), redlog::field("name", *name));
  cache_.publish(address, *name);
  return name;
}

} // namespace r3b1nd::symbols
