#include "r3b1nd/catalog/backend/linux/elf_image_catalog.hpp"

#include <algorithm>
#include <cstdint>

#include <link.h>
#include <unistd.h>

#include <redlog.hpp>

namespace r3b1nd::catalog::backend::linux_backend {
namespace {

std::string main_executable_path() {
  char buffer[4096] = {};
  const ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len <= 0) {
    return {};
  }
  buffer[len] = '\0';
  return std::string(buffer);
}

// elf objects are reported so callers see the whole process; the mach-o reader rejects them per image
class elf_image_catalog final : public image_catalog {
public:
  std::vector<loaded_image> enumerate() const override {
    struct context {
      std::vector<loaded_image> images{};
      std::string main_path{};
    } ctx;
    ctx.main_path = main_executable_path();

    dl_iterate_phdr(
        [](struct dl_phdr_info* info, size_t, void* data) -> int {
          auto* ctx = static_cast<context*>(data);

          uintptr_t low = UINTPTR_MAX;
          uintptr_t high = 0;
          for (size_t i = 0; i < info->dlpi_phnum; ++i) {
            const ElfW(Phdr)& phdr = info->dlpi_phdr[i];
            if (phdr.p_type != PT_LOAD) {
              continue;
            }
            low = std::min(low, static_cast<uintptr_t>(phdr.p_vaddr));
            high = std::max(high, static_cast<uintptr_t>(phdr.p_vaddr + phdr.p_memsz));
          }
          if (low == UINTPTR_MAX) {
            return 0;
          }

          loaded_image image{};
          image.header = reinterpret_cast<const void*>(static_cast<uintptr_t>(info->dlpi_addr) + low);
          image.slide = static_cast<intptr_t>(info->dlpi_addr);
          image.size = high - low;
          if (info->dlpi_name && info->dlpi_name[0] != '\0') {
            image.name = info->dlpi_name;
          } else if (ctx->images.empty()) {
            image.name = ctx->main_path;
          }
          ctx->images.push_back(std::move(image));
          return 0;
        },
        &ctx);

    log_.ped("enumerated elf images", redlog::field("count", ctx.images.size()));
    return std::move(ctx.images);
  }

private:
  mutable redlog::logger log_ = redlog::get_logger("r3b1nd.catalog.elf");
};

} // namespace

std::unique_ptr<image_catalog> make_image_catalog() { return std::make_unique<elf_image_catalog>(); }

} // namespace r3b1nd::catalog::backend::linux_backend
