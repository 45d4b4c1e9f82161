#pragma once

#include <cstdint>

#if defined(__APPLE__) && defined(__has_feature)
#if __has_feature(ptrauth_calls)
#define R3B1ND_PTRAUTH 1
#include <ptrauth.h>
#endif
#endif

namespace r3b1nd::patcher {

// code address without its pointer authentication bits, for comparing against symbol table values
inline uintptr_t strip_pointer(const void* value) {
#if defined(R3B1ND_PTRAUTH)
  return reinterpret_cast<uintptr_t>(ptrauth_strip(const_cast<void*>(value), ptrauth_key_asia));
#else
  return reinterpret_cast<uintptr_t>(value);
#endif
}

// a slot value the caller can invoke directly
inline void* callable_pointer(void* value) {
#if defined(R3B1ND_PTRAUTH)
  value = ptrauth_strip(value, ptrauth_key_asia);
  return ptrauth_sign_unauthenticated(value, ptrauth_key_asia, 0);
#else
  return value;
#endif
}

// replacement as the loader would have stored it into this slot
inline void* slot_pointer(void* value, void** slot) {
#if defined(R3B1ND_PTRAUTH)
  value = ptrauth_strip(value, ptrauth_key_asia);
  return ptrauth_sign_unauthenticated(value, ptrauth_key_asia, slot);
#else
  (void)slot;
  return value;
#endif
}

} // namespace r3b1nd::patcher
