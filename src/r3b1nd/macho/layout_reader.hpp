#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "r3b1nd/catalog/image_catalog.hpp"
#include "r3b1nd/macho/image_view.hpp"
#include "r3b1nd/rebind.hpp"

namespace r3b1nd::macho {

struct segment_info {
  std::string name{};
  uint64_t vmaddr = 0;
  uint64_t vmsize = 0;
  uint64_t fileoff = 0;
  uint64_t filesize = 0;
  int32_t initprot = 0;
};

struct section_info {
  std::string segment{};
  std::string name{};
  uint64_t addr = 0;
  uint64_t size = 0;
  uint32_t flags = 0;
  uint32_t reserved1 = 0;
};

struct symtab_info {
  uint32_t symoff = 0;
  uint32_t nsyms = 0;
  uint32_t stroff = 0;
  uint32_t strsize = 0;
};

struct dysymtab_info {
  uint32_t indirectsymoff = 0;
  uint32_t nindirectsyms = 0;
};

// load commands of one image, decoded through a bounds-checked view of its extent
struct image_layout {
  uintptr_t header = 0;
  intptr_t slide = 0;
  bool is_64 = false;
  size_t word_size = 0;
  image_view view{};
  std::vector<segment_info> segments{};
  std::vector<section_info> sections{};
  std::optional<symtab_info> symtab{};
  std::optional<dysymtab_info> dysymtab{};

  const segment_info* find_segment(std::string_view name) const;
  const section_info* find_section(std::string_view segment, std::string_view section) const;

  uintptr_t runtime_address(uint64_t vmaddr) const {
    return static_cast<uintptr_t>(vmaddr) + static_cast<uintptr_t>(slide);
  }

  // runtime address of a __LINKEDIT file offset (symtab, strtab, indirect table)
  std::optional<uintptr_t> linkedit_address(uint64_t file_offset) const;
};

struct layout_result {
  image_layout layout{};
  rebind_error_info error{};
};

struct pointer_table {
  uintptr_t start = 0;
  size_t size = 0;
  size_t stride = 0;
  // first entry of this table inside the indirect symbol table (section reserved1), an index and not an offset
  uint32_t indirect_index = 0;
  std::string segment{};
  std::string section{};

  size_t count() const { return stride == 0 ? 0 : size / stride; }
  void** slot(size_t index) const { return reinterpret_cast<void**>(start + index * stride); }
};

struct pointer_table_lookup {
  pointer_table table{};
  rebind_error_info error{};
};

layout_result parse_image(const catalog::loaded_image& image);

// __DATA,__la_symbol_ptr, falling back to __DATA_CONST,__la_symbol_ptr
pointer_table_lookup locate_pointer_table(const image_layout& layout);
pointer_table_lookup locate_pointer_table(const catalog::loaded_image& image);

} // namespace r3b1nd::macho
