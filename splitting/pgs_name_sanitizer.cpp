#include "pgs_name_sanitizer.h"

const char* const pgs_name_sanitizer::forbidden_characters = "/\\:*?\"<>|";
const char* const pgs_name_sanitizer::empty_title_component = "Untitled";
const char* const pgs_name_sanitizer::compressed_marker = "_compressed";

pgs_string pgs_name_sanitizer::sanitize(const pgs_string& text) {
  pgs_string safe_name = text;
  safe_name.replace_any(forbidden_characters, '_');
  safe_name.replace_any("\r\n", ' ');
  safe_name = safe_name.normalize_whitespace();

  if (safe_name.empty()) {
    return empty_title_component;
  }
  return safe_name;
}

pgs_string pgs_name_sanitizer::book_base_name(const pgs_string& source_file_name) {
  pgs_string name = source_file_name.trim();

  // Either separator, the name may come from a manifest written on Windows
  size_t slash = name.find_last_of("/\\");
  if (slash != pgs_string::npos) {
    name = name.substr(slash + 1);
  }

  size_t dot = name.rfind(".");
  if (dot != pgs_string::npos && dot > 0) {
    name = name.substr(0, dot);
  }

  while (name.ends_with(compressed_marker) && name.size() > pgs_string(compressed_marker).size()) {
    name = name.substr(0, name.size() - pgs_string(compressed_marker).size());
  }

  return sanitize(name);
}

pgs_string pgs_name_sanitizer::folder_name(const pgs_string& book_base_name, const pgs_string& section_title) {
  return book_base_name + "_" + sanitize(section_title);
}

pgs_string pgs_name_sanitizer::page_file_name(const pgs_string& book_base_name, const pgs_string& section_title,
                                              long long section_relative_index, const pgs_string& extension) {
  return folder_page_file_name(folder_name(book_base_name, section_title), section_relative_index, extension);
}

pgs_string pgs_name_sanitizer::folder_page_file_name(const pgs_string& folder_name, long long section_relative_index,
                                                     const pgs_string& extension) {
  return folder_name + "_Page_" + pgs_string(section_relative_index) + "." + extension;
}
