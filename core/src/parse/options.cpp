#include <cstdlib>
#include <string>

#include "monetize/parser.h"

namespace monetize {

bool parse_env_flag_value(const char* raw, bool fallback) {
  if (!raw || *raw == '\0') {
    return fallback;
  }
  const std::string value(raw);
  if (value == "0" || value == "false" || value == "False" || value == "off" ||
      value == "OFF" || value == "no" || value == "NO") {
    return false;
  }
  return true;
}

bool env_flag_enabled(const char* name, bool fallback) {
  return parse_env_flag_value(std::getenv(name), fallback);
}

ParseOptions options_from_env(ParseOptions fallback) {
  ParseOptions options;
  options.assume_from_symbol = env_flag_enabled("MONETIZE_ASSUME_FROM_SYMBOL", fallback.assume_from_symbol);
  options.infinite_precision = env_flag_enabled("MONETIZE_INFINITE_PRECISION", fallback.infinite_precision);
  return options;
}

}  // namespace monetize
