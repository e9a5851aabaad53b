#ifndef PGS_RUN_CONTEXT_H
#define PGS_RUN_CONTEXT_H

#include "manifest/pgs_manifest.h"
#include <memory>
#include <vector>

// Everything one run needs, fixed at construction and shared read-only by
// the partitioner and the reporter.
class pgs_run_context {
  std::shared_ptr<const pgs_manifest> manifest;
  pgs_string document_path;
  pgs_string output_root;
  pgs_string book_base_name;
  long long page_offset;
  long long page_tolerance;
  bool verbose;
  std::vector<pgs_string> folder_names;  // per section, unique within the run

public:
  // The book name is derived from the document's file name, not from the
  // manifest, so renamed inputs still land in a folder matching the file.
  pgs_run_context(std::shared_ptr<const pgs_manifest> manifest, const pgs_string& document_path,
                  const pgs_string& output_root, long long page_offset, long long page_tolerance,
                  bool verbose = false);

  const pgs_manifest& get_manifest() const noexcept { return *manifest; }
  const pgs_string& get_document_path() const noexcept { return document_path; }
  const pgs_string& get_output_root() const noexcept { return output_root; }
  const pgs_string& get_book_base_name() const noexcept { return book_base_name; }
  long long get_page_offset() const noexcept { return page_offset; }
  long long get_page_tolerance() const noexcept { return page_tolerance; }
  bool is_verbose() const noexcept { return verbose; }

  // <output_root>/<book>
  pgs_string book_folder() const;
  // <book>_<title>, or <book>_<title>_<n> when an earlier section of the
  // manifest already uses that folder. Indexed by manifest position.
  const pgs_string& section_folder_name(size_t section_index) const;
  // <output_root>/<book>/<folder>
  pgs_string section_folder(size_t section_index) const;
  // <output_root>/<book>/<folder>/<folder>_Page_<n>.<ext>
  pgs_string page_file(size_t section_index, long long section_relative_index,
                       const pgs_string& extension = "pdf") const;
  // <output_root>/<book>/splitting_summary.txt
  pgs_string summary_file() const;
  pgs_string summary_json_file() const;
};

#endif // PGS_RUN_CONTEXT_H
