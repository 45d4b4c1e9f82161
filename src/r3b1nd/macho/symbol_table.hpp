#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "r3b1nd/macho/layout_reader.hpp"
#include "r3b1nd/rebind.hpp"

namespace r3b1nd::macho {

struct symbol_entry {
  std::string_view name{};
  uint64_t value = 0;
  uint8_t type = 0;
  uint8_t section = 0;
};

struct symbol_table {
  uintptr_t symbols = 0;
  uint32_t count = 0;
  size_t entry_size = 0;
  uintptr_t strings = 0;
  uint32_t strings_size = 0;
};

struct symbol_table_lookup {
  symbol_table table{};
  rebind_error_info error{};
};

symbol_table_lookup read_symbol_table(const image_layout& layout);
std::optional<symbol_entry> read_symbol(const image_layout& layout, const symbol_table& table, uint32_t index);

// name of the import behind a pointer table slot, through the indirect symbol table
std::optional<std::string_view> indirect_symbol_name(const image_layout& layout, const symbol_table& symbols,
                                                     const pointer_table& table, size_t slot_index);

// stab entries and undefined imports carry no address
bool is_defined(const symbol_entry& entry);

// n_value moved by the image slide; absolute (N_ABS) symbols are not slid
uintptr_t symbol_runtime_address(const image_layout& layout, const symbol_entry& entry);

// exact, or the target behind the leading underscore of a c symbol
bool symbol_name_matches(std::string_view candidate, std::string_view target);

// calls visitor(index, entry) for every readable entry until it returns false
template <typename Visitor>
void for_each_symbol(const image_layout& layout, const symbol_table& table, Visitor&& visitor) {
  for (uint32_t i = 0; i < table.count; ++i) {
    const auto entry = read_symbol(layout, table, i);
    if (!entry) {
      continue;
    }
    if (!visitor(i, *entry)) {
      return;
    }
  }
}

} // namespace r3b1nd::macho
