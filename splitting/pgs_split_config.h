#ifndef PGS_SPLIT_CONFIG_H
#define PGS_SPLIT_CONFIG_H

#include "../utils/pgs_string.h"

// Run settings. Defaults, overridden by the environment (after an optional
// .env file was loaded into it), overridden by command line flags.
class pgs_split_config {
public:
  static constexpr long long default_page_tolerance = 5;
  // Offsets and tolerances beyond this are rejected
  static constexpr long long max_setting = 2147483647LL;

  pgs_string output_dir = "./output";
  long long page_offset = 1;
  long long page_tolerance = default_page_tolerance;
  bool verbose = false;

  // Reads PGS_OUTPUT_DIR, PGS_PAGE_OFFSET, PGS_PAGE_TOLERANCE, PGS_VERBOSE.
  // Unparsable values are reported on stderr and ignored.
  static pgs_split_config from_environment();

  // Applies one "--key=value" or "--flag" argument. Returns false if the
  // argument is not a recognized option or its value is invalid.
  bool apply_argument(const pgs_string& argument);
};

#endif // PGS_SPLIT_CONFIG_H
