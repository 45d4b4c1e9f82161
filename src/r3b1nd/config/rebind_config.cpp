#include "r3b1nd/config/rebind_config.hpp"

#include "r3b1nd/util/env_config.hpp"

namespace r3b1nd::config {

rebind_config rebind_config::from_environment() {
  util::env_config env("R3B1ND");

  rebind_config config{};
  config.verbose = env.get<int>("VERBOSE", config.verbose);
  config.reference_image = env.get<std::string>("REFERENCE_IMAGE", config.reference_image);
  config.indirect_fallback = env.get<bool>("INDIRECT_FALLBACK", config.indirect_fallback);
  config.skip_images = env.get_list("SKIP_IMAGES");
  config.record_metrics = env.get<bool>("RECORD_METRICS", config.record_metrics);
  return config;
}

redlog::level log_level_for(int verbose) {
  switch (verbose) {
    case 0:
      return redlog::level::info;
    case 1:
      return redlog::level::verbose;
    case 2:
      return redlog::level::trace;
    case 3:
      return redlog::level::debug;
    default:
      return verbose < 0 ? redlog::level::info : redlog::level::pedantic;
  }
}

void apply_logging(const rebind_config& config) { redlog::set_level(log_level_for(config.verbose)); }

} // namespace r3b1nd::config
