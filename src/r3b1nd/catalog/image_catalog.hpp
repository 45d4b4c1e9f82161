#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace r3b1nd::catalog {

// borrowed view of one mapped image, valid only while the image stays mapped
struct loaded_image {
  const void* header = nullptr;
  intptr_t slide = 0;
  std::string name{};
  // readable bytes starting at header, 0 when unknown
  size_t size = 0;
};

class image_catalog {
public:
  virtual ~image_catalog() = default;

  // fresh best-effort snapshot; images loading or unloading concurrently may or may not appear
  virtual std::vector<loaded_image> enumerate() const = 0;
};

} // namespace r3b1nd::catalog
