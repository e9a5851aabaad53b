#ifndef PGS_PARTITIONER_H
#define PGS_PARTITIONER_H

#include "pgs_page_mapper.h"
#include "pgs_run_context.h"
#include "pgs_progress.h"
#include "../documents/pgs_doc_sio.h"
#include <vector>

struct pgs_output_entry {
  pgs_string section_title;
  long long physical_page;
  long long section_relative_index;
  pgs_string output_path;
};

struct pgs_page_failure {
  long long physical_page;
  long long section_relative_index;
  pgs_string reason;
};

// A section that produced no page at all
struct pgs_section_failure {
  size_t section_index;
  pgs_string section_title;
  pgs_string reason;
};

// Everything that happened to one section, in manifest order
struct pgs_section_outcome {
  pgs_mapped_range range;
  pgs_string folder_name;
  pgs_string folder_path;
  std::vector<pgs_output_entry> entries;
  std::vector<pgs_page_failure> page_failures;

  bool failed() const { return entries.empty(); }
};

struct pgs_partition_result {
  std::vector<pgs_output_entry> entries;
  std::vector<pgs_section_failure> failures;
  std::vector<pgs_section_outcome> sections;
  // Stopped at a section boundary on request, sections holds what was done
  bool cancelled = false;

  size_t extracted_count() const { return entries.size(); }
  size_t skipped_count() const;
  size_t failed_page_count() const;
};

// Writes one single-page document per mapped page into the section folders.
// Sections run in manifest order, pages in increasing physical order.
// Failures are recorded and never abort the run.
class pgs_partitioner {
  pgs::progress::i_sink* progress;

public:
  explicit pgs_partitioner(pgs::progress::i_sink* progress = nullptr);

  pgs_partition_result partition(pgs_doc_sio& document, const pgs_run_context& context);

private:
  pgs_section_outcome partition_section(pgs_doc_sio& document, const pgs_run_context& context,
                                        size_t section_index);
  void log_mapping(const pgs_run_context& context, const pgs_mapped_range& range);
};

#endif // PGS_PARTITIONER_H
