#include "r3b1nd/macho/symbol_table.hpp"

#include "r3b1nd/errors.hpp"
#include "r3b1nd/macho/macho_format.hpp"

namespace r3b1nd::macho {

symbol_table_lookup read_symbol_table(const image_layout& layout) {
  symbol_table_lookup result{};
  if (!layout.symtab) {
    result.error = make_error(rebind_error::image_layout_unsupported, "missing_symtab");
    return result;
  }

  const auto symbols = layout.linkedit_address(layout.symtab->symoff);
  const auto strings = layout.linkedit_address(layout.symtab->stroff);
  if (!symbols || !strings) {
    result.error = make_error(rebind_error::image_layout_unsupported, "missing_linkedit");
    return result;
  }

  const size_t entry_size = layout.is_64 ? sizeof(nlist_64) : sizeof(nlist);
  const uint64_t symbols_size = static_cast<uint64_t>(layout.symtab->nsyms) * entry_size;
  if (symbols_size > layout.view.size() || !layout.view.contains(*symbols, static_cast<size_t>(symbols_size)) ||
      !layout.view.contains(*strings, layout.symtab->strsize)) {
    result.error = make_error(rebind_error::image_layout_unsupported, "symtab_out_of_bounds");
    return result;
  }

  result.table.symbols = *symbols;
  result.table.count = layout.symtab->nsyms;
  result.table.entry_size = entry_size;
  result.table.strings = *strings;
  result.table.strings_size = layout.symtab->strsize;
  result.error = make_error(rebind_error::ok);
  return result;
}

std::optional<symbol_entry> read_symbol(const image_layout& layout, const symbol_table& table, uint32_t index) {
  if (index >= table.count) {
    return std::nullopt;
  }
  const uintptr_t address = table.symbols + static_cast<uintptr_t>(index) * table.entry_size;

  symbol_entry entry{};
  uint32_t strx = 0;
  if (layout.is_64) {
    const auto raw = layout.view.read<nlist_64>(address);
    if (!raw) {
      return std::nullopt;
    }
    strx = raw->n_strx;
    entry.value = raw->n_value;
    entry.type = raw->n_type;
    entry.section = raw->n_sect;
  } else {
    const auto raw = layout.view.read<nlist>(address);
    if (!raw) {
      return std::nullopt;
    }
    strx = raw->n_strx;
    entry.value = raw->n_value;
    entry.type = raw->n_type;
    entry.section = raw->n_sect;
  }

  if (strx < table.strings_size) {
    const uintptr_t strings_end = table.strings + table.strings_size;
    if (auto name = layout.view.read_string(table.strings + strx, strings_end)) {
      entry.name = *name;
    }
  }
  return entry;
}

std::optional<std::string_view> indirect_symbol_name(const image_layout& layout, const symbol_table& symbols,
                                                     const pointer_table& table, size_t slot_index) {
  if (!layout.dysymtab || slot_index >= table.count()) {
    return std::nullopt;
  }
  const uint64_t index = static_cast<uint64_t>(table.indirect_index) + slot_index;
  if (index >= layout.dysymtab->nindirectsyms) {
    return std::nullopt;
  }
  const auto indirect = layout.linkedit_address(layout.dysymtab->indirectsymoff);
  if (!indirect) {
    return std::nullopt;
  }

  const auto symbol_index = layout.view.read<uint32_t>(*indirect + static_cast<uintptr_t>(index) * sizeof(uint32_t));
  if (!symbol_index || (*symbol_index & (indirect_symbol_local | indirect_symbol_abs)) != 0) {
    return std::nullopt;
  }

  const auto entry = read_symbol(layout, symbols, *symbol_index);
  if (!entry || entry->name.empty()) {
    return std::nullopt;
  }
  return entry->name;
}

bool is_defined(const symbol_entry& entry) {
  if ((entry.type & n_stab) != 0) {
    return false;
  }
  return (entry.type & n_type) != n_undf;
}

uintptr_t symbol_runtime_address(const image_layout& layout, const symbol_entry& entry) {
  if ((entry.type & n_type) == n_abs) {
    return static_cast<uintptr_t>(entry.value);
  }
  return layout.runtime_address(entry.value);
}

bool symbol_name_matches(std::string_view candidate, std::string_view target) {
  if (candidate.empty() || target.empty()) {
    return false;
  }
  if (candidate == target) {
    return true;
  }
  return candidate.front() == '_' && candidate.substr(1) == target;
}

} // namespace r3b1nd::macho
