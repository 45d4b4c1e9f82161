#include "r3b1nd/catalog/catalog_factory.hpp"

#if defined(__APPLE__)
#include "r3b1nd/catalog/backend/darwin/dyld_image_catalog.hpp"
#elif defined(__linux__)
#include "r3b1nd/catalog/backend/linux/elf_image_catalog.hpp"
#else
#include "r3b1nd/catalog/mapped_image_catalog.hpp"
#endif

namespace r3b1nd::catalog {

std::unique_ptr<image_catalog> make_process_image_catalog() {
#if defined(__APPLE__)
  return backend::darwin::make_image_catalog();
#elif defined(__linux__)
  return backend::linux_backend::make_image_catalog();
#else
  return std::make_unique<mapped_image_catalog>();
#endif
}

} // namespace r3b1nd::catalog
