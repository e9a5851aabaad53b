#ifndef PGS_RECONCILIATION_REPORT_H
#define PGS_RECONCILIATION_REPORT_H

#include "pgs_partitioner.h"
#include "../utils/pgs_variant.h"

struct pgs_section_report {
  size_t number;                 // 1-based position in the manifest
  pgs_string title;
  pgs_section_kind kind;
  pgs_string declared_range;     // manifest numbering, e.g. "13-30"
  long long declared_pages;
  long long physical_start;      // after the offset, before clipping
  long long physical_end;
  long long first_output_index;  // 0 when nothing was written
  long long last_output_index;
  pgs_string folder_name;
  std::vector<pgs_string> files;  // file names inside folder_name
  std::vector<pgs_skipped_page> skipped;
  std::vector<pgs_page_failure> failures;
  bool processed;                // false when the run was cancelled first

  // "Page_1 to Page_18", "Page_4" or "none"
  pgs_string output_range() const;
};

struct pgs_report {
  pgs_string source_file_name;
  pgs_string book_folder_name;
  long long declared_total_pages = 0;   // 0 when the manifest does not state it
  long long actual_total_pages = 0;
  long long page_offset = 0;
  long long page_tolerance = 0;
  long long declared_total_sections = -1;
  size_t section_count = 0;
  long long expected_pages = 0;          // sum of declared section lengths
  size_t extracted_pages = 0;
  size_t skipped_pages = 0;
  size_t failed_pages = 0;
  size_t failed_sections = 0;
  bool cancelled = false;
  std::vector<pgs_string> warnings;
  std::vector<pgs_section_report> sections;

  // declared - actual, 0 when no page count was declared
  long long page_difference() const;
  bool exceeds_tolerance() const;
  bool has_warnings() const { return !warnings.empty(); }
};

// Declared vs. actual reconciliation over a finished partition pass.
// Rendering is free of timestamps and working-directory values, so the same
// inputs always give byte-identical artifacts.
class pgs_reconciliation_report {
public:
  static pgs_report build(const pgs_run_context& context, size_t document_page_count,
                          const pgs_partition_result& result);

  static pgs_string render(const pgs_report& report);
  static pgsv_map to_variant(const pgs_report& report);
  static pgs_string to_json(const pgs_report& report);

  // Writes splitting_summary.txt and splitting_summary.json into the book
  // folder. The result reflects the text report only, a failed JSON file
  // is logged to stderr.
  static bool write(const pgs_report& report, const pgs_run_context& context);

private:
  static bool write_text_file(const pgs_string& path, const pgs_string& content);
};

#endif // PGS_RECONCILIATION_REPORT_H
