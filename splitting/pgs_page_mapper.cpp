#include "pgs_page_mapper.h"
#include <algorithm>

pgs_string pgs_skip_reason_name(pgs_skip_reason reason) {
  switch (reason) {
    case pgs_skip_reason::out_of_range_low: return "out_of_range_low";
    case pgs_skip_reason::out_of_range_high: return "out_of_range_high";
  }
  return "out_of_range_high";
}

long long pgs_mapped_range::skipped_count() const {
  long long total = 0;
  for (const auto& run : skipped) {
    total += run.count();
  }
  return total;
}

bool pgs_mapped_range::is_skipped(long long physical_page) const {
  for (const auto& run : skipped) {
    if (physical_page >= run.first_physical_page && physical_page <= run.last_physical_page) {
      return true;
    }
  }
  return false;
}

pgs_mapped_range pgs_page_mapper::map(const pgs_section& section, long long document_page_count, long long offset) {
  pgs_mapped_range range{section, section.get_start_page() - offset, section.get_end_page() - offset, {}, {}};
  if (document_page_count < 0) {
    document_page_count = 0;
  }

  if (range.physical_start < 0) {
    long long last = std::min(range.physical_end, -1LL);
    range.skipped.push_back({range.physical_start, last, 1, pgs_skip_reason::out_of_range_low});
  }

  long long first_inside = std::max(range.physical_start, 0LL);
  long long last_inside = std::min(range.physical_end, document_page_count - 1);
  for (long long physical = first_inside; physical <= last_inside; physical++) {
    range.pages.push_back({physical, physical - range.physical_start + 1});
  }

  if (range.physical_end >= document_page_count) {
    long long first = std::max(range.physical_start, document_page_count);
    range.skipped.push_back({first, range.physical_end, first - range.physical_start + 1,
                             pgs_skip_reason::out_of_range_high});
  }

  return range;
}
