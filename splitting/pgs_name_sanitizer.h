#ifndef PGS_NAME_SANITIZER_H
#define PGS_NAME_SANITIZER_H

#include "../utils/pgs_string.h"

// Derives file and folder names from free text. Every function is pure and
// deterministic.
class pgs_name_sanitizer {
public:
  // Characters that never appear in a sanitized component
  static const char* const forbidden_characters;
  // Component used when a title sanitizes to nothing
  static const char* const empty_title_component;
  // Marker left on file names by the upstream compression step
  static const char* const compressed_marker;

  // / \ : * ? " < > | become '_', CR and LF become ' ', whitespace runs
  // collapse to one space, both ends are trimmed.
  static pgs_string sanitize(const pgs_string& text);

  // "dir/My Book_compressed.pdf" -> "My Book"
  static pgs_string book_base_name(const pgs_string& source_file_name);

  // "<book>_<sanitized title>"
  static pgs_string folder_name(const pgs_string& book_base_name, const pgs_string& section_title);

  // "<book>_<sanitized title>_Page_<n>.<ext>"
  static pgs_string page_file_name(const pgs_string& book_base_name, const pgs_string& section_title,
                                   long long section_relative_index, const pgs_string& extension = "pdf");

  // "<folder>_Page_<n>.<ext>" for an already resolved folder name
  static pgs_string folder_page_file_name(const pgs_string& folder_name, long long section_relative_index,
                                          const pgs_string& extension = "pdf");
};

#endif // PGS_NAME_SANITIZER_H
