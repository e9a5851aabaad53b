#ifndef PGS_PAGE_MAPPER_H
#define PGS_PAGE_MAPPER_H

#include "manifest/pgs_manifest.h"
#include <vector>

enum class pgs_skip_reason {
  out_of_range_low,   // physical index below 0
  out_of_range_high   // physical index at or past the document's page count
};

pgs_string pgs_skip_reason_name(pgs_skip_reason reason);

struct pgs_mapped_page {
  long long physical_page;
  long long section_relative_index;  // 1-based position in the declared range
};

// Consecutive physical pages outside the document, all with the same reason
struct pgs_skipped_page {
  long long first_physical_page;
  long long last_physical_page;
  long long first_section_relative_index;
  pgs_skip_reason reason;

  long long count() const { return last_physical_page - first_physical_page + 1; }
  long long last_section_relative_index() const { return first_section_relative_index + count() - 1; }
};

// A section's declared range translated to physical page indices.
// physical_start/physical_end are the shifted bounds before clipping, pages
// holds the in-range part in increasing order. skipped holds at most one
// run below the document and one past its end.
struct pgs_mapped_range {
  pgs_section section;
  long long physical_start;
  long long physical_end;
  std::vector<pgs_mapped_page> pages;
  std::vector<pgs_skipped_page> skipped;

  long long skipped_count() const;
  bool is_skipped(long long physical_page) const;
  bool fully_in_range() const { return skipped.empty(); }
};

class pgs_page_mapper {
public:
  // Manifest page N is physical page N-1 in the reference corpus
  static constexpr long long default_offset = 1;

  // physical = declared - offset. Pages outside [0, document_page_count) are
  // skipped with a reason, the rest keep the index of their declared
  // position, so file names do not depend on clipping. Work is bounded by
  // the document size, not by the declared length.
  static pgs_mapped_range map(const pgs_section& section, long long document_page_count,
                              long long offset = default_offset);
};

#endif // PGS_PAGE_MAPPER_H
