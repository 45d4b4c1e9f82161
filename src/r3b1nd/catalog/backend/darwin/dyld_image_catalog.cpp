#include "r3b1nd/catalog/backend/darwin/dyld_image_catalog.hpp"

#include <mach-o/dyld.h>

#include <redlog.hpp>

namespace r3b1nd::catalog::backend::darwin {
namespace {

class dyld_image_catalog final : public image_catalog {
public:
  std::vector<loaded_image> enumerate() const override {
    std::vector<loaded_image> images;
    const uint32_t count = _dyld_image_count();
    images.reserve(count);

    for (uint32_t i = 0; i < count; ++i) {
      // the image may unload between the count and these calls; dyld returns null for a vanished index
      const struct mach_header* header = _dyld_get_image_header(i);
      if (!header) {
        log_.dbg("image vanished during enumeration", redlog::field("index", i));
        continue;
      }
      loaded_image image{};
      image.header = header;
      image.slide = _dyld_get_image_vmaddr_slide(i);
      const char* name = _dyld_get_image_name(i);
      if (name) {
        image.name = name;
      }
      images.push_back(std::move(image));
    }

    log_.ped("enumerated dyld images", redlog::field("count", images.size()));
    return images;
  }

private:
  mutable redlog::logger log_ = redlog::get_logger("r3b1nd.catalog.dyld");
};

} // namespace

std::unique_ptr<image_catalog> make_image_catalog() { return std::make_unique<dyld_image_catalog>(); }

} // namespace r3b1nd::catalog::backend::darwin
