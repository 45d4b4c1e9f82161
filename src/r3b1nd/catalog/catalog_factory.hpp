#pragma once

#include <memory>

#include "r3b1nd/catalog/image_catalog.hpp"

namespace r3b1nd::catalog {

// dyld on darwin, dl_iterate_phdr on linux, an empty mapped catalog elsewhere
std::unique_ptr<image_catalog> make_process_image_catalog();

} // namespace r3b1nd::catalog
