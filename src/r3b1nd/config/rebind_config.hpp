#pragma once

#include <string>
#include <vector>

#include <redlog.hpp>

namespace r3b1nd::config {

struct rebind_config {
  int verbose = 0;
  // image whose symbol table names slot values; empty selects the first catalog entry (main executable)
  std::string reference_image{};
  // name slots through the indirect symbol table when the reference image has no symbol at the slot value
  bool indirect_fallback = true;
  std::vector<std::string> skip_images{};
  bool record_metrics = true;

  static rebind_config from_environment();
};

redlog::level log_level_for(int verbose);

// sets the global redlog level from config.verbose
void apply_logging(const rebind_config& config);

} // namespace r3b1nd::config
