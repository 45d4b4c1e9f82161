#include "r3b1nd/catalog/mapped_image_catalog.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace r3b1nd::catalog {

std::vector<loaded_image> mapped_image_catalog::enumerate() const {
  std::shared_lock lock(mutex_);
  return images_;
}

bool mapped_image_catalog::add(loaded_image image) {
  if (!image.header) {
    return false;
  }
  std::unique_lock lock(mutex_);
  const auto existing = std::find_if(images_.begin(), images_.end(),
                                     [&](const loaded_image& entry) { return entry.header == image.header; });
  if (existing != images_.end()) {
    return false;
  }
  images_.push_back(std::move(image));
  return true;
}

bool mapped_image_catalog::remove(const void* header) {
  std::unique_lock lock(mutex_);
  const auto it =
      std::find_if(images_.begin(), images_.end(), [&](const loaded_image& entry) { return entry.header == header; });
  if (it == images_.end()) {
    return false;
  }
  images_.erase(it);
  return true;
}

void mapped_image_catalog::clear() {
  std::unique_lock lock(mutex_);
  images_.clear();
}

size_t mapped_image_catalog::size() const {
  std::shared_lock lock(mutex_);
  return images_.size();
}

} // namespace r3b1nd::catalog
