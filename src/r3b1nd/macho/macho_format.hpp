#pragma once

#include <cstddef>
#include <cstdint>

// on-image mach-o structures, declared here so the reader builds on hosts without <mach-o/loader.h>

namespace r3b1nd::macho {

constexpr uint32_t mh_magic = 0xFEEDFACE;
constexpr uint32_t mh_cigam = 0xCEFAEDFE;
constexpr uint32_t mh_magic_64 = 0xFEEDFACF;
constexpr uint32_t mh_cigam_64 = 0xCFFAEDFE;

constexpr uint32_t lc_segment = 0x1;
constexpr uint32_t lc_symtab = 0x2;
constexpr uint32_t lc_dysymtab = 0xb;
constexpr uint32_t lc_segment_64 = 0x19;

constexpr uint32_t section_type_mask = 0x000000ff;
constexpr uint32_t s_non_lazy_symbol_pointers = 0x6;
constexpr uint32_t s_lazy_symbol_pointers = 0x7;

constexpr uint32_t indirect_symbol_local = 0x80000000;
constexpr uint32_t indirect_symbol_abs = 0x40000000;

constexpr uint8_t n_stab = 0xe0;
constexpr uint8_t n_type = 0x0e;
constexpr uint8_t n_ext = 0x01;
constexpr uint8_t n_undf = 0x0;
constexpr uint8_t n_abs = 0x2;
constexpr uint8_t n_sect = 0xe;

constexpr uint32_t vm_prot_read = 0x1;
constexpr uint32_t vm_prot_write = 0x2;
constexpr uint32_t vm_prot_execute = 0x4;

constexpr const char* seg_text = "__TEXT";
constexpr const char* seg_data = "__DATA";
constexpr const char* seg_data_const = "__DATA_CONST";
constexpr const char* seg_linkedit = "__LINKEDIT";
constexpr const char* seg_pagezero = "__PAGEZERO";
constexpr const char* sect_la_symbol_ptr = "__la_symbol_ptr";

struct mach_header {
  uint32_t magic;
  int32_t cputype;
  int32_t cpusubtype;
  uint32_t filetype;
  uint32_t ncmds;
  uint32_t sizeofcmds;
  uint32_t flags;
};

struct mach_header_64 {
  uint32_t magic;
  int32_t cputype;
  int32_t cpusubtype;
  uint32_t filetype;
  uint32_t ncmds;
  uint32_t sizeofcmds;
  uint32_t flags;
  uint32_t reserved;
};

struct load_command {
  uint32_t cmd;
  uint32_t cmdsize;
};

struct segment_command {
  uint32_t cmd;
  uint32_t cmdsize;
  char segname[16];
  uint32_t vmaddr;
  uint32_t vmsize;
  uint32_t fileoff;
  uint32_t filesize;
  int32_t maxprot;
  int32_t initprot;
  uint32_t nsects;
  uint32_t flags;
};

struct segment_command_64 {
  uint32_t cmd;
  uint32_t cmdsize;
  char segname[16];
  uint64_t vmaddr;
  uint64_t vmsize;
  uint64_t fileoff;
  uint64_t filesize;
  int32_t maxprot;
  int32_t initprot;
  uint32_t nsects;
  uint32_t flags;
};

struct section {
  char sectname[16];
  char segname[16];
  uint32_t addr;
  uint32_t size;
  uint32_t offset;
  uint32_t align;
  uint32_t reloff;
  uint32_t nreloc;
  uint32_t flags;
  uint32_t reserved1; // index into the indirect symbol table for symbol pointer sections
  uint32_t reserved2;
};

struct section_64 {
  char sectname[16];
  char segname[16];
  uint64_t addr;
  uint64_t size;
  uint32_t offset;
  uint32_t align;
  uint32_t reloff;
  uint32_t nreloc;
  uint32_t flags;
  uint32_t reserved1; // index into the indirect symbol table for symbol pointer sections
  uint32_t reserved2;
  uint32_t reserved3;
};

struct symtab_command {
  uint32_t cmd;
  uint32_t cmdsize;
  uint32_t symoff;
  uint32_t nsyms;
  uint32_t stroff;
  uint32_t strsize;
};

struct dysymtab_command {
  uint32_t cmd;
  uint32_t cmdsize;
  uint32_t ilocalsym;
  uint32_t nlocalsym;
  uint32_t iextdefsym;
  uint32_t nextdefsym;
  uint32_t iundefsym;
  uint32_t nundefsym;
  uint32_t tocoff;
  uint32_t ntoc;
  uint32_t modtaboff;
  uint32_t nmodtab;
  uint32_t extrefsymoff;
  uint32_t nextrefsyms;
  uint32_t indirectsymoff;
  uint32_t nindirectsyms;
  uint32_t extreloff;
  uint32_t nextrel;
  uint32_t locreloff;
  uint32_t nlocrel;
};

struct nlist {
  uint32_t n_strx;
  uint8_t n_type;
  uint8_t n_sect;
  int16_t n_desc;
  uint32_t n_value;
};

struct nlist_64 {
  uint32_t n_strx;
  uint8_t n_type;
  uint8_t n_sect;
  uint16_t n_desc;
  uint64_t n_value;
};

static_assert(sizeof(mach_header) == 28);
static_assert(sizeof(mach_header_64) == 32);
static_assert(sizeof(segment_command) == 56);
static_assert(sizeof(segment_command_64) == 72);
static_assert(sizeof(section) == 68);
static_assert(sizeof(section_64) == 80);
static_assert(sizeof(symtab_command) == 24);
static_assert(sizeof(dysymtab_command) == 80);
static_assert(sizeof(nlist) == 12);
static_assert(sizeof(nlist_64) == 16);

struct layout_32 {
  using header_type = mach_header;
  using segment_type = segment_command;
  using section_type = section;
  using nlist_type = nlist;
  static constexpr uint32_t segment_command_id = lc_segment;
  static constexpr size_t word_size = 4;
};

struct layout_64 {
  using header_type = mach_header_64;
  using segment_type = segment_command_64;
  using section_type = section_64;
  using nlist_type = nlist_64;
  static constexpr uint32_t segment_command_id = lc_segment_64;
  static constexpr size_t word_size = 8;
};

} // namespace r3b1nd::macho
