#include "pgs_split_config.h"
#include "../utils/pgs_env.h"
#include <iostream>

namespace {

  bool parse_flag(const pgs_string& text, bool& out) {
    pgs_string value = text.trim().lower();
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
      out = true;
      return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
      out = false;
      return true;
    }
    return false;
  }

  bool in_range(long long value) {
    return value <= pgs_split_config::max_setting && value >= -pgs_split_config::max_setting;
  }

  pgs_string option_value(const pgs_string& argument, const pgs_string& prefix) {
    if (argument.starts_with(prefix)) {
      return argument.substr(prefix.size());
    }
    return "";
  }

}

pgs_split_config pgs_split_config::from_environment() {
  pgs_split_config config;

  config.output_dir = env_value("PGS_OUTPUT_DIR", config.output_dir);

  pgs_string offset = env_value("PGS_PAGE_OFFSET");
  if (!offset.empty()) {
    if (offset.is_integer() && in_range(offset.to_int())) {
      config.page_offset = offset.to_int();
    } else {
      std::cerr << "⚠️  Ignoring PGS_PAGE_OFFSET='" << offset.c_str() << "': not an integer in range" << std::endl;
    }
  }

  pgs_string tolerance = env_value("PGS_PAGE_TOLERANCE");
  if (!tolerance.empty()) {
    if (tolerance.is_integer() && tolerance.to_int() >= 0 && in_range(tolerance.to_int())) {
      config.page_tolerance = tolerance.to_int();
    } else {
      std::cerr << "⚠️  Ignoring PGS_PAGE_TOLERANCE='" << tolerance.c_str() << "': not a non-negative integer" << std::endl;
    }
  }

  pgs_string verbose = env_value("PGS_VERBOSE");
  if (!verbose.empty() && !parse_flag(verbose, config.verbose)) {
    std::cerr << "⚠️  Ignoring PGS_VERBOSE='" << verbose.c_str() << "': not a boolean" << std::endl;
  }

  return config;
}

bool pgs_split_config::apply_argument(const pgs_string& argument) {
  if (argument == "-v" || argument == "--verbose") {
    verbose = true;
    return true;
  }
  if (argument.starts_with("--output=") || argument.starts_with("-o=")) {
    pgs_string value = argument.starts_with("-o=") ? option_value(argument, "-o=") : option_value(argument, "--output=");
    if (value.trim().empty()) {
      return false;
    }
    output_dir = value;
    return true;
  }
  if (argument.starts_with("--offset=")) {
    pgs_string value = option_value(argument, "--offset=");
    if (!value.is_integer() || !in_range(value.to_int())) {
      return false;
    }
    page_offset = value.to_int();
    return true;
  }
  if (argument.starts_with("--tolerance=")) {
    pgs_string value = option_value(argument, "--tolerance=");
    if (!value.is_integer() || value.to_int() < 0 || !in_range(value.to_int())) {
      return false;
    }
    page_tolerance = value.to_int();
    return true;
  }
  return false;
}
