#include "pgs_manifest.h"

pgs_string pgs_section_kind_name(pgs_section_kind kind) {
  switch (kind) {
    case pgs_section_kind::front_matter: return "front_matter";
    case pgs_section_kind::chapter: return "chapter";
    case pgs_section_kind::back_matter: return "back_matter";
  }
  return "chapter";
}

bool pgs_parse_section_kind(const pgs_string& name, pgs_section_kind& kind) {
  pgs_string normalized = name.trim().lower();
  normalized.replace_any("- ", '_');

  if (normalized == "front_matter") {
    kind = pgs_section_kind::front_matter;
    return true;
  }
  if (normalized == "chapter") {
    kind = pgs_section_kind::chapter;
    return true;
  }
  if (normalized == "back_matter") {
    kind = pgs_section_kind::back_matter;
    return true;
  }
  return false;
}

pgs_section::pgs_section(pgs_string title, long long start_page, long long end_page,
                         pgs_section_kind kind, pgs_string page_range)
  : title(std::move(title)), start_page(start_page), end_page(end_page),
    kind(kind), page_range(std::move(page_range))
{
  if (this->page_range.trim().empty()) {
    this->page_range = format_page_range(start_page, end_page);
  }
}

pgs_string pgs_section::format_page_range(long long start_page, long long end_page) {
  if (start_page == end_page) {
    return pgs_string(start_page);
  }
  return pgs_string(start_page) + "-" + pgs_string(end_page);
}

long long pgs_manifest::declared_section_pages() const {
  long long total = 0;
  for (const auto& section : sections) {
    total += section.declared_length();
  }
  return total;
}
