#include <doctest/doctest.h>

#include <string>
#include <string_view>

#include "macho_image_builder.hpp"
#include "r3b1nd/catalog/catalog_factory.hpp"
#include "r3b1nd/catalog/mapped_image_catalog.hpp"
#include "r3b1nd/catalog/module_match.hpp"

using r3b1nd::catalog::basename_view;
using r3b1nd::catalog::image_in_list;
using r3b1nd::catalog::image_matches;
using r3b1nd::catalog::loaded_image;
using r3b1nd::catalog::mapped_image_catalog;
using r3b1nd::test_helpers::macho_image_builder;

namespace {

int catalog_marker = 0;

} // namespace

TEST_CASE("r3b1nd mapped_image_catalog keeps registration order") {
  auto first = macho_image_builder("/opt/app/main").build();
  auto second = macho_image_builder("/usr/lib/libsecond.dylib").build();

  mapped_image_catalog catalog;
  CHECK(catalog.enumerate().empty());
  REQUIRE(catalog.add(first->image()));
  REQUIRE(catalog.add(second->image()));
  CHECK(catalog.size() == 2);

  const auto images = catalog.enumerate();
  REQUIRE(images.size() == 2);
  CHECK(images[0].header == first->header());
  CHECK(images[0].name == "/opt/app/main");
  CHECK(images[0].slide == first->slide());
  CHECK(images[1].header == second->header());
}

TEST_CASE("r3b1nd mapped_image_catalog rejects null and duplicate headers") {
  auto image = macho_image_builder("/opt/app/main").build();
  mapped_image_catalog catalog;

  loaded_image empty{};
  CHECK_FALSE(catalog.add(empty));
  CHECK(catalog.add(image->image()));
  CHECK_FALSE(catalog.add(image->image()));
  CHECK(catalog.size() == 1);
}

TEST_CASE("r3b1nd mapped_image_catalog removes and clears") {
  auto first = macho_image_builder("/opt/app/main").build();
  auto second = macho_image_builder("/usr/lib/libsecond.dylib").build();
  mapped_image_catalog catalog;
  REQUIRE(catalog.add(first->image()));
  REQUIRE(catalog.add(second->image()));

  CHECK(catalog.remove(first->header()));
  CHECK_FALSE(catalog.remove(first->header()));
  REQUIRE(catalog.size() == 1);
  CHECK(catalog.enumerate()[0].header == second->header());

  catalog.clear();
  CHECK(catalog.size() == 0);
}

TEST_CASE("r3b1nd module_match compares basenames or full paths") {
  CHECK(basename_view("/usr/lib/libSystem.B.dylib") == std::string_view("libSystem.B.dylib"));
  CHECK(basename_view("main") == std::string_view("main"));

  CHECK(image_matches("libSystem.B.dylib", "/usr/lib/libSystem.B.dylib"));
  CHECK(image_matches("/usr/lib/libSystem.B.dylib", "/usr/lib/libSystem.B.dylib"));
  CHECK_FALSE(image_matches("/lib/libSystem.B.dylib", "/usr/lib/libSystem.B.dylib"));
  CHECK_FALSE(image_matches("libSystem", "/usr/lib/libSystem.B.dylib"));
  CHECK(image_matches("", "/usr/lib/libSystem.B.dylib"));
  CHECK_FALSE(image_matches("main", ""));

  CHECK(image_in_list({"libfoo.dylib", "main"}, "/opt/app/main"));
  CHECK_FALSE(image_in_list({"libfoo.dylib", ""}, "/opt/app/main"));
  CHECK_FALSE(image_in_list({}, "/opt/app/main"));
}

TEST_CASE("r3b1nd process image catalog lists the running executable") {
  auto catalog = r3b1nd::catalog::make_process_image_catalog();
  REQUIRE(catalog != nullptr);

  const auto images = catalog->enumerate();
  if (images.empty()) {
    WARN("process image catalog returned no images; image enumeration may be unsupported on this host");
    return;
  }

  for (const auto& image : images) {
    CHECK(image.header != nullptr);
  }
  CHECK_FALSE(images.front().name.empty());

  // some image has to cover this test's own data
  const auto marker = reinterpret_cast<uintptr_t>(&catalog_marker);
  bool covered = false;
  for (const auto& image : images) {
    const auto begin = reinterpret_cast<uintptr_t>(image.header);
    if (image.size > 0 && marker >= begin && marker < begin + image.size) {
      covered = true;
      break;
    }
  }
  if (!covered) {
    WARN("process image catalog does not report image sizes on this host");
  }
}
