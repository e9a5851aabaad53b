#include "pgs_run_context.h"
#include "pgs_name_sanitizer.h"
#include <filesystem>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

pgs_run_context::pgs_run_context(std::shared_ptr<const pgs_manifest> manifest, const pgs_string& document_path,
                                 const pgs_string& output_root, long long page_offset, long long page_tolerance,
                                 bool verbose)
  : manifest(std::move(manifest)), document_path(document_path), output_root(output_root),
    book_base_name(pgs_name_sanitizer::book_base_name(document_path)),
    page_offset(page_offset), page_tolerance(page_tolerance), verbose(verbose)
{
  if (!this->manifest) {
    throw std::invalid_argument("pgs_run_context requires a manifest");
  }

  // Titles equal after sanitizing get a numeric suffix in manifest order
  std::set<pgs_string> taken;
  for (const auto& section : this->manifest->get_sections()) {
    pgs_string base = pgs_name_sanitizer::folder_name(book_base_name, section.get_title());
    pgs_string name = base;
    for (long long n = 2; taken.count(name) > 0; n++) {
      name = base + "_" + pgs_string(n);
    }
    taken.insert(name);
    folder_names.push_back(name);
  }
}

pgs_string pgs_run_context::book_folder() const {
  return (fs::path(output_root.to_std_const()) / book_base_name.to_std_const()).string();
}

const pgs_string& pgs_run_context::section_folder_name(size_t section_index) const {
  return folder_names.at(section_index);
}

pgs_string pgs_run_context::section_folder(size_t section_index) const {
  return (fs::path(book_folder().to_std_const()) / section_folder_name(section_index).to_std_const()).string();
}

pgs_string pgs_run_context::page_file(size_t section_index, long long section_relative_index,
                                      const pgs_string& extension) const {
  pgs_string file_name = pgs_name_sanitizer::folder_page_file_name(section_folder_name(section_index),
                                                                   section_relative_index, extension);
  return (fs::path(section_folder(section_index).to_std_const()) / file_name.to_std_const()).string();
}

pgs_string pgs_run_context::summary_file() const {
  return (fs::path(book_folder().to_std_const()) / "splitting_summary.txt").string();
}

pgs_string pgs_run_context::summary_json_file() const {
  return (fs::path(book_folder().to_std_const()) / "splitting_summary.json").string();
}
