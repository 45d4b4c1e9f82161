#pragma once

#include <memory>

#include "r3b1nd/catalog/image_catalog.hpp"

namespace r3b1nd::catalog::backend::darwin {

std::unique_ptr<image_catalog> make_image_catalog();

} // namespace r3b1nd::catalog::backend::darwin
