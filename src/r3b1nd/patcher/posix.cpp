#include "r3b1nd/patcher/slot_patcher.hpp"

#include <atomic>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <optional>

#include <sys/mman.h>
#include <unistd.h>

#if defined(__APPLE__)
#include <mach/mach.h>
#include <mach/mach_vm.h>
#include <mach/vm_region.h>
#endif

#include "r3b1nd/util/format_utils.hpp"

namespace r3b1nd::patcher {
namespace {

#if defined(__APPLE__)
using protection_t = vm_prot_t;
constexpr protection_t protection_write = VM_PROT_WRITE;
#else
using protection_t = int;
constexpr protection_t protection_write = PROT_WRITE;
#endif

size_t page_size() {
  long size = sysconf(_SC_PAGESIZE);
  if (size <= 0) {
    return 4096;
  }
  return static_cast<size_t>(size);
}

bool apply_region_protection(void* address, size_t size, protection_t prot) {
  const size_t page = page_size();
  const uintptr_t start = reinterpret_cast<uintptr_t>(address);
  const uintptr_t page_start = start & ~(static_cast<uintptr_t>(page) - 1);
  const uintptr_t page_end = (start + size + page - 1) & ~(static_cast<uintptr_t>(page) - 1);
  const size_t total = page_end - page_start;

#if defined(__APPLE__)
  return vm_protect(mach_task_self(), page_start, total, false, prot) == KERN_SUCCESS;
#else
  return mprotect(reinterpret_cast<void*>(page_start), total, prot) == 0;
#endif
}

#if defined(__APPLE__)
std::optional<protection_t> query_region_protection(const void* slot) {
  const auto wanted = reinterpret_cast<mach_vm_address_t>(slot);
  mach_vm_address_t region = wanted;
  mach_vm_size_t region_size = 0;
  vm_region_basic_info_data_64_t basic{};
  mach_msg_type_number_t info_count = VM_REGION_BASIC_INFO_COUNT_64;
  memory_object_name_t unused_object = MACH_PORT_NULL;

  if (mach_vm_region(mach_task_self(), &region, &region_size, VM_REGION_BASIC_INFO_64,
                     reinterpret_cast<vm_region_info_t>(&basic), &info_count, &unused_object) != KERN_SUCCESS) {
    return std::nullopt;
  }
  // mach_vm_region returns the next region when the address itself is unmapped
  if (region > wanted || wanted - region >= region_size) {
    return std::nullopt;
  }
  return basic.protection;
}
#else
std::optional<protection_t> query_region_protection(const void* slot) {
  std::FILE* maps = std::fopen("/proc/self/maps", "r");
  if (!maps) {
    return std::nullopt;
  }

  const auto wanted = reinterpret_cast<uintptr_t>(slot);
  std::optional<protection_t> found;
  char entry[512];
  while (!found && std::fgets(entry, sizeof(entry), maps)) {
    uintptr_t low = 0;
    uintptr_t high = 0;
    char mode[5] = {};
    if (std::sscanf(entry, "%" SCNxPTR "-%" SCNxPTR " %4s", &low, &high, mode) != 3) {
      continue;
    }
    if (wanted >= low && wanted < high) {
      found = (mode[0] == 'r' ? PROT_READ : 0) | (mode[1] == 'w' ? PROT_WRITE : 0) | (mode[2] == 'x' ? PROT_EXEC : 0);
    }
  }
  std::fclose(maps);
  return found;
}
#endif

bool compare_and_swap(void** slot, void* expected, void* replacement) {
  std::atomic_ref<void*> ref(*slot);
  return ref.compare_exchange_strong(expected, replacement, std::memory_order_seq_cst);
}

} // namespace

const char* to_string(patch_status status) {
  switch (status) {
    case patch_status::patched:
      return "patched";
    case patch_status::lost_race:
      return "lost_race";
    case patch_status::invalid_slot:
      return "invalid_slot";
    case patch_status::protection_failed:
      return "protection_failed";
  }
  return "unknown";
}

bool slot_patcher::is_aligned(const void* slot) {
  return reinterpret_cast<uintptr_t>(slot) % std::atomic_ref<void*>::required_alignment == 0;
}

void* slot_patcher::load(void** slot) {
  if (!slot || !is_aligned(slot)) {
    return nullptr;
  }
  return std::atomic_ref<void*>(*slot).load(std::memory_order_acquire);
}

patch_status slot_patcher::patch(void** slot, void* expected, void* replacement) const {
  if (!slot || !is_aligned(slot)) {
    log_.dbg("refusing to patch invalid slot", redlog::field("slot", util::format_address(slot)));
    return patch_status::invalid_slot;
  }

  const auto queried = query_region_protection(slot);
  if (!queried) {
    log_.err("failed to query slot protection", redlog::field("slot", util::format_address(slot)));
    return patch_status::protection_failed;
  }
  const protection_t original = *queried;

  if ((original & protection_write) != 0) {
    return compare_and_swap(slot, expected, replacement) ? patch_status::patched : patch_status::lost_race;
  }

  // read-only after fixups (__DATA_CONST): open the page for the swap and put the protection back
#if defined(__APPLE__)
  const protection_t writable = original | VM_PROT_WRITE | VM_PROT_COPY;
#else
  const protection_t writable = original | PROT_WRITE;
#endif
  if (!apply_region_protection(slot, sizeof(void*), writable)) {
    log_.err("failed to make slot writable", redlog::field("slot", util::format_address(slot)));
    return patch_status::protection_failed;
  }

  const bool swapped = compare_and_swap(slot, expected, replacement);

  if (!apply_region_protection(slot, sizeof(void*), original)) {
    log_.wrn("failed to restore slot protection", redlog::field("slot", util::format_address(slot)));
  }
  return swapped ? patch_status::patched : patch_status::lost_race;
}

} // namespace r3b1nd::patcher
