#ifndef PGS_MANIFEST_H
#define PGS_MANIFEST_H

#include "../../utils/pgs_string.h"
#include <vector>
#include <utility>

enum class pgs_section_kind {
  front_matter,
  chapter,
  back_matter
};

// "front_matter", "chapter", "back_matter"
pgs_string pgs_section_kind_name(pgs_section_kind kind);
// Case-insensitive, also accepts "-" and " " as separators. false if unknown.
bool pgs_parse_section_kind(const pgs_string& name, pgs_section_kind& kind);

// One logical division of the book. Page numbers are zero-based in the
// manifest's own numbering, which may be skewed against the document.
class pgs_section {
  pgs_string title;
  long long start_page;
  long long end_page;
  pgs_section_kind kind;
  pgs_string page_range;

public:
  pgs_section(pgs_string title, long long start_page, long long end_page,
              pgs_section_kind kind, pgs_string page_range = pgs_string());

  const pgs_string& get_title() const noexcept { return title; }
  long long get_start_page() const noexcept { return start_page; }
  long long get_end_page() const noexcept { return end_page; }
  pgs_section_kind get_kind() const noexcept { return kind; }
  // Display string, "13-30" or "7"
  const pgs_string& get_page_range() const noexcept { return page_range; }

  // Number of pages the manifest declares for this section
  long long declared_length() const noexcept { return end_page - start_page + 1; }

  static pgs_string format_page_range(long long start_page, long long end_page);
};

class pgs_manifest_metadata {
  long long declared_total_pages;
  pgs_string source_file_name;
  long long declared_total_sections;

public:
  pgs_manifest_metadata(long long declared_total_pages = 0,
                        pgs_string source_file_name = pgs_string(),
                        long long declared_total_sections = -1)
    : declared_total_pages(declared_total_pages),
      source_file_name(std::move(source_file_name)),
      declared_total_sections(declared_total_sections) {}

  long long get_declared_total_pages() const noexcept { return declared_total_pages; }
  const pgs_string& get_source_file_name() const noexcept { return source_file_name; }
  // -1 when the manifest does not state it
  long long get_declared_total_sections() const noexcept { return declared_total_sections; }
  bool has_declared_total_sections() const noexcept { return declared_total_sections >= 0; }
};

// Validated manifest. Never modified after construction.
class pgs_manifest {
  std::vector<pgs_section> sections;
  pgs_manifest_metadata metadata;

public:
  pgs_manifest(std::vector<pgs_section> sections, pgs_manifest_metadata metadata)
    : sections(std::move(sections)), metadata(std::move(metadata)) {}

  const std::vector<pgs_section>& get_sections() const noexcept { return sections; }
  const pgs_manifest_metadata& get_metadata() const noexcept { return metadata; }
  size_t section_count() const noexcept { return sections.size(); }

  // Sum of declared section lengths, overlaps counted twice
  long long declared_section_pages() const;
};

#endif // PGS_MANIFEST_H
