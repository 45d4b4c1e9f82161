#pragma once

#include <shared_mutex>
#include <vector>

#include "r3b1nd/catalog/image_catalog.hpp"

namespace r3b1nd::catalog {

// images registered by the caller, enumerated in registration order
class mapped_image_catalog final : public image_catalog {
public:
  std::vector<loaded_image> enumerate() const override;

  // returns false for a null header or a header that is already registered
  bool add(loaded_image image);
  bool remove(const void* header);
  void clear();
  size_t size() const;

private:
  mutable std::shared_mutex mutex_{};
  std::vector<loaded_image> images_{};
};

} // namespace r3b1nd::catalog
