#pragma once

#include <cstdint>

#include <redlog.hpp>

namespace r3b1nd::patcher {

enum class patch_status {
  patched,
  lost_race,
  invalid_slot,
  protection_failed
};

const char* to_string(patch_status status);

// single pointer-width compare-and-swap on a live function pointer slot. the swap is sequentially consistent, so a
// thread calling through the slot observes either the old or the new pointer, never a torn value.
class slot_patcher {
public:
  // replaces *slot with replacement only while it still holds expected; a lost race leaves the slot untouched
  patch_status patch(void** slot, void* expected, void* replacement) const;

  bool patch_slot(void** slot, void* expected, void* replacement) const {
    return patch(slot, expected, replacement) == patch_status::patched;
  }

  // acquire load of the current slot value; null for null or misaligned slots
  static void* load(void** slot);

  static bool is_aligned(const void* slot);

private:
  mutable redlog::logger log_ = redlog::get_logger("r3b1nd.patcher");
};

} // namespace r3b1nd::patcher
