#include "r3b1nd/macho/layout_reader.hpp"

#include <algorithm>
#include <cstring>

#include <redlog.hpp>

#include "r3b1nd/errors.hpp"
#include "r3b1nd/macho/macho_format.hpp"
#include "r3b1nd/util/format_utils.hpp"

namespace r3b1nd::macho {
namespace {

auto log_reader = redlog::get_logger("r3b1nd.macho.layout");

std::string fixed_name(const char (&field)[16]) {
  const void* terminator = std::memchr(field, '\0', sizeof(field));
  const size_t len = terminator ? static_cast<size_t>(static_cast<const char*>(terminator) - field) : sizeof(field);
  return std::string(field, len);
}

template <typename Layout>
rebind_error_info parse_commands(const image_view& view, image_layout& out) {
  using header_type = typename Layout::header_type;
  using segment_type = typename Layout::segment_type;
  using section_type = typename Layout::section_type;

  const auto header = view.read<header_type>(out.header);
  if (!header) {
    return make_error(rebind_error::image_layout_unsupported, "header_out_of_bounds");
  }

  out.is_64 = Layout::word_size == 8;
  out.word_size = Layout::word_size;

  uintptr_t cursor = out.header + sizeof(header_type);
  if (!view.contains(cursor, header->sizeofcmds)) {
    return make_error(rebind_error::image_layout_unsupported, "load_commands_out_of_bounds");
  }
  const uintptr_t commands_end = cursor + header->sizeofcmds;

  for (uint32_t i = 0; i < header->ncmds; ++i) {
    const auto command = view.read<load_command>(cursor);
    if (!command || command->cmdsize < sizeof(load_command) || command->cmdsize % Layout::word_size != 0 ||
        command->cmdsize > commands_end - cursor) {
      return make_error(rebind_error::image_layout_unsupported, "malformed_load_command");
    }

    if (command->cmd == Layout::segment_command_id) {
      const auto segment = view.read<segment_type>(cursor);
      if (!segment || command->cmdsize < sizeof(segment_type) ||
          (command->cmdsize - sizeof(segment_type)) / sizeof(section_type) < segment->nsects) {
        return make_error(rebind_error::image_layout_unsupported, "malformed_segment_command");
      }

      segment_info seg{};
      seg.name = fixed_name(segment->segname);
      seg.vmaddr = segment->vmaddr;
      seg.vmsize = segment->vmsize;
      seg.fileoff = segment->fileoff;
      seg.filesize = segment->filesize;
      seg.initprot = segment->initprot;

      uintptr_t section_cursor = cursor + sizeof(segment_type);
      for (uint32_t j = 0; j < segment->nsects; ++j) {
        const auto sect = view.read<section_type>(section_cursor);
        if (!sect) {
          return make_error(rebind_error::image_layout_unsupported, "malformed_section");
        }
        section_info info{};
        info.segment = fixed_name(sect->segname);
        info.name = fixed_name(sect->sectname);
        info.addr = sect->addr;
        info.size = sect->size;
        info.flags = sect->flags;
        info.reserved1 = sect->reserved1;
        out.sections.push_back(std::move(info));
        section_cursor += sizeof(section_type);
      }
      out.segments.push_back(std::move(seg));
    } else if (command->cmd == lc_symtab) {
      const auto symtab = view.read<symtab_command>(cursor);
      if (!symtab || command->cmdsize < sizeof(symtab_command)) {
        return make_error(rebind_error::image_layout_unsupported, "malformed_symtab_command");
      }
      out.symtab = symtab_info{symtab->symoff, symtab->nsyms, symtab->stroff, symtab->strsize};
    } else if (command->cmd == lc_dysymtab) {
      const auto dysymtab = view.read<dysymtab_command>(cursor);
      if (!dysymtab || command->cmdsize < sizeof(dysymtab_command)) {
        return make_error(rebind_error::image_layout_unsupported, "malformed_dysymtab_command");
      }
      out.dysymtab = dysymtab_info{dysymtab->indirectsymoff, dysymtab->nindirectsyms};
    }

    cursor += command->cmdsize;
  }

  return make_error(rebind_error::ok);
}

// union of the mapped segments, used when the catalog cannot tell how large the image is
image_view segment_extent(const image_layout& layout, uintptr_t commands_end) {
  uintptr_t low = layout.header;
  uintptr_t high = commands_end;
  for (const auto& segment : layout.segments) {
    if (segment.vmsize == 0 || segment.name == seg_pagezero) {
      continue;
    }
    const uintptr_t start = layout.runtime_address(segment.vmaddr);
    const uintptr_t end = start + static_cast<uintptr_t>(segment.vmsize);
    if (end < start) {
      continue;
    }
    low = std::min(low, start);
    high = std::max(high, end);
  }
  return image_view(low, high);
}

} // namespace

const segment_info* image_layout::find_segment(std::string_view name) const {
  for (const auto& segment : segments) {
    if (segment.name == name) {
      return &segment;
    }
  }
  return nullptr;
}

const section_info* image_layout::find_section(std::string_view segment, std::string_view section) const {
  for (const auto& entry : sections) {
    if (entry.segment == segment && entry.name == section) {
      return &entry;
    }
  }
  return nullptr;
}

std::optional<uintptr_t> image_layout::linkedit_address(uint64_t file_offset) const {
  const segment_info* linkedit = find_segment(seg_linkedit);
  if (!linkedit || file_offset < linkedit->fileoff) {
    return std::nullopt;
  }
  return runtime_address(linkedit->vmaddr) + static_cast<uintptr_t>(file_offset - linkedit->fileoff);
}

layout_result parse_image(const catalog::loaded_image& image) {
  layout_result result{};
  if (!image.header) {
    result.error = make_error(rebind_error::image_layout_unsupported, "null_header");
    return result;
  }

  auto& layout = result.layout;
  layout.header = reinterpret_cast<uintptr_t>(image.header);
  layout.slide = image.slide;

  // without a known size only the header and its load commands are trusted until the segments are known
  image_view view = image.size > 0 ? image_view(layout.header, layout.header + image.size)
                                   : image_view(layout.header, layout.header + sizeof(mach_header_64));
  const auto magic = view.read<uint32_t>(layout.header);
  if (!magic) {
    result.error = make_error(rebind_error::image_layout_unsupported, "header_out_of_bounds");
    return result;
  }

  if (*magic == mh_cigam || *magic == mh_cigam_64) {
    result.error = make_error(rebind_error::unsupported_architecture, "byte_swapped_image");
    return result;
  }
  if (*magic != mh_magic && *magic != mh_magic_64) {
    result.error = make_error(rebind_error::image_layout_unsupported, "not_macho");
    return result;
  }

  const bool is_64 = *magic == mh_magic_64;
  if (image.size == 0) {
    const auto sizeofcmds = is_64 ? view.read<mach_header_64>(layout.header)->sizeofcmds
                                  : view.read<mach_header>(layout.header)->sizeofcmds;
    const size_t header_size = is_64 ? sizeof(mach_header_64) : sizeof(mach_header);
    view = image_view(layout.header, layout.header + header_size + sizeofcmds);
  }

  result.error = is_64 ? parse_commands<layout_64>(view, layout) : parse_commands<layout_32>(view, layout);
  if (!result.error.ok()) {
    log_reader.dbg("rejected image layout", redlog::field("image", image.name),
                   redlog::field("reason", result.error.detail));
    return result;
  }

  layout.view = image.size > 0 ? view : segment_extent(layout, view.end());
  log_reader.ped("parsed image layout", redlog::field("image", image.name),
                 redlog::field("header", util::format_address(image.header)),
                 redlog::field("segments", layout.segments.size()), redlog::field("sections", layout.sections.size()),
                 redlog::field("extent", layout.view.size()));
  return result;
}

pointer_table_lookup locate_pointer_table(const image_layout& layout) {
  pointer_table_lookup result{};

  const section_info* section = layout.find_section(seg_data, sect_la_symbol_ptr);
  if (!section) {
    section = layout.find_section(seg_data_const, sect_la_symbol_ptr);
  }
  if (!section) {
    result.error = make_error(rebind_error::image_layout_unsupported, "no_lazy_pointer_section");
    return result;
  }
  if ((section->flags & section_type_mask) != s_lazy_symbol_pointers) {
    result.error = make_error(rebind_error::image_layout_unsupported, "unexpected_section_type");
    return result;
  }

  pointer_table table{};
  table.stride = layout.word_size;
  table.start = layout.runtime_address(section->addr);
  table.size = static_cast<size_t>(section->size);
  table.indirect_index = section->reserved1;
  table.segment = section->segment;
  table.section = section->name;

  if (table.stride == 0 || table.size % table.stride != 0 || table.start % table.stride != 0) {
    result.error = make_error(rebind_error::image_layout_unsupported, "misaligned_pointer_table");
    return result;
  }
  if (!layout.view.contains(table.start, table.size)) {
    log_reader.wrn("lazy pointer section outside image extent", redlog::field("start", util::format_hex(table.start)),
                   redlog::field("size", table.size), redlog::field("extent_begin", util::format_hex(layout.view.begin())),
                   redlog::field("extent_end", util::format_hex(layout.view.end())));
    result.error = make_error(rebind_error::image_layout_unsupported, "pointer_table_out_of_bounds");
    return result;
  }
  if (layout.dysymtab) {
    const uint64_t last = static_cast<uint64_t>(table.indirect_index) + table.count();
    if (last > layout.dysymtab->nindirectsyms) {
      result.error = make_error(rebind_error::image_layout_unsupported, "indirect_index_out_of_bounds");
      return result;
    }
  }

  result.table = std::move(table);
  result.error = make_error(rebind_error::ok);
  return result;
}

pointer_table_lookup locate_pointer_table(const catalog::loaded_image& image) {
  auto parsed = parse_image(image);
  if (!parsed.error.ok()) {
    pointer_table_lookup result{};
    result.error = parsed.error;
    return result;
  }
  return locate_pointer_table(parsed.layout);
}

} // namespace r3b1nd::macho
