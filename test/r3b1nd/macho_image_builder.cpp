#include "macho_image_builder.hpp"

#include <cstring>
#include <stdexcept>

#include "r3b1nd/macho/macho_format.hpp"

namespace r3b1nd::test_helpers {

using namespace r3b1nd::macho;

namespace {

constexpr size_t text_offset = 0x200;
constexpr size_t data_offset = 0x300;
constexpr uint8_t n_fun = 0x24;

size_t align_up(size_t value, size_t alignment) { return (value + alignment - 1) & ~(alignment - 1); }

void copy_name(char (&field)[16], const std::string& name) {
  std::memset(field, 0, sizeof(field));
  std::memcpy(field, name.data(), name.size() < sizeof(field) ? name.size() : sizeof(field));
}

template <typename T> void put(uint8_t* base, size_t offset, const T& value) {
  std::memcpy(base + offset, &value, sizeof(T));
}

template <typename Layout>
typename Layout::segment_type make_segment(uint64_t base, const std::string& name, uint64_t offset, uint64_t size,
                                           uint32_t nsects, int32_t prot) {
  using segment_type = typename Layout::segment_type;
  using address_type = decltype(segment_type::vmaddr);
  segment_type segment{};
  segment.cmd = Layout::segment_command_id;
  segment.cmdsize = static_cast<uint32_t>(sizeof(segment_type) + nsects * sizeof(typename Layout::section_type));
  copy_name(segment.segname, name);
  segment.vmaddr = static_cast<address_type>(base + offset);
  segment.vmsize = static_cast<address_type>(size);
  segment.fileoff = static_cast<address_type>(offset);
  segment.filesize = static_cast<address_type>(size);
  segment.maxprot = static_cast<int32_t>(vm_prot_read | vm_prot_write | vm_prot_execute);
  segment.initprot = prot;
  segment.nsects = nsects;
  return segment;
}

template <typename Layout>
typename Layout::section_type make_section(uint64_t base, const std::string& segment, const std::string& name,
                                           uint64_t offset, uint64_t size, uint32_t flags, uint32_t reserved1) {
  using section_type = typename Layout::section_type;
  using address_type = decltype(section_type::addr);
  section_type sect{};
  copy_name(sect.sectname, name);
  copy_name(sect.segname, segment);
  sect.addr = static_cast<address_type>(base + offset);
  sect.size = static_cast<address_type>(size);
  sect.offset = static_cast<uint32_t>(offset);
  sect.align = Layout::word_size == 8 ? 3 : 2;
  sect.flags = flags;
  sect.reserved1 = reserved1;
  return sect;
}

} // namespace

catalog::loaded_image synthetic_image::image() const {
  catalog::loaded_image entry{};
  entry.header = header();
  entry.slide = slide_;
  entry.name = name_;
  entry.size = report_size_ ? size() : 0;
  return entry;
}

void** synthetic_image::slot(size_t index) {
  if (index >= slot_count_) {
    throw std::out_of_range("synthetic_image slot index");
  }
  return reinterpret_cast<void**>(bytes() + slots_offset_ + index * slot_stride_);
}

void* synthetic_image::slot_value(size_t index) const {
  if (index >= slot_count_) {
    throw std::out_of_range("synthetic_image slot index");
  }
  const uint8_t* at = bytes() + slots_offset_ + index * slot_stride_;
  if (slot_stride_ == sizeof(void*)) {
    void* value = nullptr;
    std::memcpy(&value, at, sizeof(void*));
    return value;
  }
  uint32_t narrow = 0;
  std::memcpy(&narrow, at, sizeof(narrow));
  return reinterpret_cast<void*>(static_cast<uintptr_t>(narrow));
}

void synthetic_image::set_slot(size_t index, void* value) {
  if (slot_stride_ == sizeof(void*)) {
    *slot(index) = value;
    return;
  }
  const auto narrow = static_cast<uint32_t>(reinterpret_cast<uintptr_t>(value));
  std::memcpy(slot(index), &narrow, sizeof(narrow));
}

void* synthetic_image::text_address(uint32_t offset) const {
  return const_cast<uint8_t*>(bytes() + text_offset + offset);
}

uint64_t synthetic_image::symbol_value(const std::string& name) const {
  for (const auto& symbol : defined_) {
    if (symbol.name == name) {
      return symbol.value;
    }
  }
  return 0;
}

void* synthetic_image::symbol_address(const std::string& name) const {
  for (const auto& symbol : defined_) {
    if (symbol.name != name) {
      continue;
    }
    if (symbol.absolute) {
      return reinterpret_cast<void*>(static_cast<uintptr_t>(symbol.value));
    }
    return reinterpret_cast<void*>(static_cast<uintptr_t>(symbol.value) + static_cast<uintptr_t>(slide_));
  }
  return nullptr;
}

void synthetic_image::bind_slots_to_text() {
  for (size_t i = 0; i < slot_count_; ++i) {
    set_slot(i, text_address(synthetic_unnamed_text + static_cast<uint32_t>(i) * 4));
  }
}

std::vector<uint8_t> synthetic_image::snapshot_slots() const {
  const uint8_t* begin = bytes() + slots_offset_;
  return std::vector<uint8_t>(begin, begin + slot_count_ * slot_stride_);
}

macho_image_builder::macho_image_builder(std::string name)
    : name_(std::move(name)), section_flags_(s_lazy_symbol_pointers), magic_(mh_magic_64) {}

macho_image_builder& macho_image_builder::define(std::string name, uint32_t text_offset_value) {
  symbol_entry entry{};
  entry.name = std::move(name);
  entry.type = n_sect | n_ext;
  entry.section = 1;
  entry.value = text_offset_value;
  defined_.push_back(std::move(entry));
  return *this;
}

macho_image_builder& macho_image_builder::define_absolute(std::string name, uint64_t value) {
  symbol_entry entry{};
  entry.name = std::move(name);
  entry.type = n_abs | n_ext;
  entry.value = value;
  entry.text_relative = false;
  defined_.push_back(std::move(entry));
  return *this;
}

macho_image_builder& macho_image_builder::define_stab(std::string name, uint32_t text_offset_value) {
  symbol_entry entry{};
  entry.name = std::move(name);
  entry.type = n_fun;
  entry.section = 1;
  entry.value = text_offset_value;
  defined_.push_back(std::move(entry));
  return *this;
}

macho_image_builder& macho_image_builder::import(std::string name) {
  imports_.push_back(std::move(name));
  return *this;
}

macho_image_builder& macho_image_builder::pointer_segment(std::string segment) {
  pointer_segment_ = std::move(segment);
  return *this;
}

macho_image_builder& macho_image_builder::omit_pointer_section() {
  pointer_section_ = false;
  return *this;
}

macho_image_builder& macho_image_builder::indirect_padding(uint32_t entries) {
  indirect_padding_ = entries;
  return *this;
}

macho_image_builder& macho_image_builder::section_flags(uint32_t flags) {
  section_flags_ = flags;
  return *this;
}

macho_image_builder& macho_image_builder::magic(uint32_t value) {
  magic_ = value;
  return *this;
}

macho_image_builder& macho_image_builder::report_size(bool value) {
  report_size_ = value;
  return *this;
}

macho_image_builder& macho_image_builder::thirty_two_bit() {
  thirty_two_bit_ = true;
  return *this;
}

macho_image_builder& macho_image_builder::indirect_start(uint32_t index) {
  indirect_start_ = index;
  return *this;
}

macho_image_builder& macho_image_builder::pointer_section_size(uint64_t size) {
  pointer_section_size_ = size;
  return *this;
}

macho_image_builder& macho_image_builder::first_command_size(uint32_t size) {
  first_command_size_ = size;
  return *this;
}

macho_image_builder& macho_image_builder::pointer_segment_sections(uint32_t count) {
  pointer_segment_sections_ = count;
  return *this;
}

macho_image_builder& macho_image_builder::symbol_count(uint32_t count) {
  symbol_count_ = count;
  return *this;
}

std::unique_ptr<synthetic_image> macho_image_builder::build() const {
  return thirty_two_bit_ ? build_layout<layout_32>() : build_layout<layout_64>();
}

template <typename Layout> std::unique_ptr<synthetic_image> macho_image_builder::build_layout() const {
  using header_type = typename Layout::header_type;
  using segment_type = typename Layout::segment_type;
  using section_type = typename Layout::section_type;
  using nlist_type = typename Layout::nlist_type;
  constexpr size_t pointer_size = Layout::word_size;
  const uint64_t base = Layout::word_size == 8 ? synthetic_vmaddr : synthetic_vmaddr_32;

  const size_t slot_count = pointer_section_ ? imports_.size() : 0;
  size_t data_size = align_up(slot_count * pointer_size, 16);
  if (data_size == 0) {
    data_size = 16;
  }
  const size_t linkedit_offset = data_offset + data_size;

  const size_t nsyms = defined_.size() + imports_.size();
  const size_t symoff = linkedit_offset;
  const size_t indirect_count = indirect_padding_ + imports_.size();
  const size_t indirectoff = align_up(symoff + nsyms * sizeof(nlist_type), 4);
  const size_t stroff = align_up(indirectoff + indirect_count * sizeof(uint32_t), 8);

  std::string strings(1, '\0');
  std::vector<uint32_t> string_index;
  for (const auto& symbol : defined_) {
    string_index.push_back(static_cast<uint32_t>(strings.size()));
    strings += symbol.name;
    strings.push_back('\0');
  }
  for (const auto& name : imports_) {
    string_index.push_back(static_cast<uint32_t>(strings.size()));
    strings += name;
    strings.push_back('\0');
  }
  const size_t strsize = align_up(strings.size(), 8);
  const size_t total = stroff + strsize;

  auto image = std::make_unique<synthetic_image>();
  image->storage_.assign(total / sizeof(uint64_t), 0);
  image->name_ = name_;
  image->report_size_ = report_size_;
  image->slots_offset_ = data_offset;
  image->slot_count_ = slot_count;
  image->slot_stride_ = pointer_size;
  image->slide_ =
      static_cast<intptr_t>(reinterpret_cast<uintptr_t>(image->storage_.data()) - static_cast<uintptr_t>(base));
  uint8_t* base_bytes = image->bytes();

  // load commands
  size_t cursor = sizeof(header_type);
  uint32_t ncmds = 0;

  auto text = make_segment<Layout>(base, seg_text, 0, data_offset, 1,
                                   static_cast<int32_t>(vm_prot_read | vm_prot_execute));
  const uint32_t text_cmdsize = text.cmdsize;
  if (first_command_size_) {
    text.cmdsize = *first_command_size_;
  }
  put(base_bytes, cursor, text);
  put(base_bytes, cursor + sizeof(segment_type),
      make_section<Layout>(base, seg_text, "__text", text_offset, synthetic_text_size, 0x80000400, 0));
  cursor += text_cmdsize;
  ++ncmds;

  auto data = make_segment<Layout>(base, pointer_segment_, data_offset, data_size, pointer_section_ ? 1 : 0,
                                   static_cast<int32_t>(vm_prot_read | vm_prot_write));
  const uint32_t data_cmdsize = data.cmdsize;
  if (pointer_segment_sections_) {
    data.nsects = *pointer_segment_sections_;
  }
  put(base_bytes, cursor, data);
  if (pointer_section_) {
    const uint64_t section_size = pointer_section_size_ ? *pointer_section_size_ : slot_count * pointer_size;
    const uint32_t reserved1 = indirect_start_ ? *indirect_start_ : indirect_padding_;
    put(base_bytes, cursor + sizeof(segment_type),
        make_section<Layout>(base, pointer_segment_, sect_la_symbol_ptr, data_offset, section_size, section_flags_,
                             reserved1));
  }
  cursor += data_cmdsize;
  ++ncmds;

  auto linkedit = make_segment<Layout>(base, seg_linkedit, linkedit_offset, total - linkedit_offset, 0,
                                       static_cast<int32_t>(vm_prot_read));
  put(base_bytes, cursor, linkedit);
  cursor += linkedit.cmdsize;
  ++ncmds;

  symtab_command symtab{};
  symtab.cmd = lc_symtab;
  symtab.cmdsize = sizeof(symtab_command);
  symtab.symoff = static_cast<uint32_t>(symoff);
  symtab.nsyms = symbol_count_ ? *symbol_count_ : static_cast<uint32_t>(nsyms);
  symtab.stroff = static_cast<uint32_t>(stroff);
  symtab.strsize = static_cast<uint32_t>(strsize);
  put(base_bytes, cursor, symtab);
  cursor += symtab.cmdsize;
  ++ncmds;

  dysymtab_command dysymtab{};
  dysymtab.cmd = lc_dysymtab;
  dysymtab.cmdsize = sizeof(dysymtab_command);
  dysymtab.iextdefsym = 0;
  dysymtab.nextdefsym = static_cast<uint32_t>(defined_.size());
  dysymtab.iundefsym = static_cast<uint32_t>(defined_.size());
  dysymtab.nundefsym = static_cast<uint32_t>(imports_.size());
  dysymtab.indirectsymoff = static_cast<uint32_t>(indirectoff);
  dysymtab.nindirectsyms = static_cast<uint32_t>(indirect_count);
  put(base_bytes, cursor, dysymtab);
  cursor += dysymtab.cmdsize;
  ++ncmds;

  header_type header{};
  header.magic = Layout::word_size == 8 ? magic_ : (magic_ == mh_magic_64 ? mh_magic : magic_);
  header.cputype = Layout::word_size == 8 ? 0x01000007 : 7;
  header.cpusubtype = 3;
  header.filetype = 0x2;
  header.ncmds = ncmds;
  header.sizeofcmds = static_cast<uint32_t>(cursor - sizeof(header_type));
  put(base_bytes, 0, header);

  // __LINKEDIT contents
  size_t index = 0;
  for (const auto& symbol : defined_) {
    const uint64_t value = symbol.text_relative ? base + text_offset + symbol.value : symbol.value;

    nlist_type entry{};
    entry.n_strx = string_index[index];
    entry.n_type = symbol.type;
    entry.n_sect = symbol.section;
    entry.n_value = static_cast<decltype(entry.n_value)>(value);
    put(base_bytes, symoff + index * sizeof(nlist_type), entry);

    synthetic_image::defined_symbol defined{};
    defined.name = symbol.name;
    defined.value = value;
    defined.absolute = (symbol.type & n_type) == n_abs;
    if ((symbol.type & n_stab) == 0) {
      image->defined_.push_back(std::move(defined));
    }
    ++index;
  }
  for (size_t i = 0; i < imports_.size(); ++i) {
    nlist_type entry{};
    entry.n_strx = string_index[index];
    entry.n_type = n_undf | n_ext;
    put(base_bytes, symoff + index * sizeof(nlist_type), entry);
    ++index;
  }

  for (uint32_t i = 0; i < indirect_padding_; ++i) {
    put(base_bytes, indirectoff + i * sizeof(uint32_t), indirect_symbol_local);
  }
  for (size_t i = 0; i < imports_.size(); ++i) {
    const auto symbol_index = static_cast<uint32_t>(defined_.size() + i);
    put(base_bytes, indirectoff + (indirect_padding_ + i) * sizeof(uint32_t), symbol_index);
  }

  std::memcpy(base_bytes + stroff, strings.data(), strings.size());
  return image;
}

} // namespace r3b1nd::test_helpers
