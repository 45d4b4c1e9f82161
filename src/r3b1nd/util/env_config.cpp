#include "r3b1nd/util/env_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include <redlog.hpp>

namespace r3b1nd::util {
namespace {

auto log_config = redlog::get_logger("r3b1nd.env_config");

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trim(const std::string& value) {
  const size_t first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return {};
  }
  const size_t last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

template <typename T, typename Parse>
T parse_or_default(const env_config& config, const std::string& name, const std::string& value, T default_value,
                   const char* type_name, Parse parse) {
  if (value.empty()) {
    return default_value;
  }
  try {
    return parse(value);
  } catch (const std::exception& e) {
    log_config.wrn("failed to parse environment value, using default", redlog::field("variable", config.env_name(name)),
                   redlog::field("type", type_name), redlog::field("value", value), redlog::field("error", e.what()));
    return default_value;
  }
}

} // namespace

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(env_name(name).c_str());
  return value ? trim(value) : std::string();
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  const std::string value = to_lower(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  log_config.wrn("unrecognized boolean, using default", redlog::field("variable", env_name(name)),
                 redlog::field("value", value));
  return default_value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  return parse_or_default(*this, name, get_env_value(name), default_value, "int",
                          [](const std::string& value) { return std::stoi(value); });
}

template <> size_t env_config::get<size_t>(const std::string& name, size_t default_value) const {
  return parse_or_default(*this, name, get_env_value(name), default_value, "size_t",
                          [](const std::string& value) { return static_cast<size_t>(std::stoull(value)); });
}

std::vector<std::string> env_config::get_list(const std::string& name, char delimiter) const {
  std::vector<std::string> result;
  const std::string value = get_env_value(name);
  if (value.empty()) {
    return result;
  }

  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, delimiter)) {
    item = trim(item);
    if (!item.empty()) {
      result.push_back(item);
    }
  }
  return result;
}

} // namespace r3b1nd::util
