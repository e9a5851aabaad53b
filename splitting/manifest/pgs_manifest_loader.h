#ifndef PGS_MANIFEST_LOADER_H
#define PGS_MANIFEST_LOADER_H

#include "pgs_manifest.h"
#include "../pgs_split_exceptions.h"
#include "../../utils/pgs_variant.h"

// Validates a raw manifest and turns it into a pgs_manifest.
//
// Fail-fast: the first problem throws pgs_validation_error, nothing is
// repaired. No filesystem side effects apart from reading the manifest file
// in load_file().
//
// Accepted keys per section: title, start_page, end_page, kind (alias type),
// optional page_range. Metadata: declared_total_pages (alias total_pages),
// source_file_name (alias file_name), declared_total_sections (alias
// total_sections), all optional.
class pgs_manifest_loader {
public:
  // Largest magnitude accepted for any page number or count
  static constexpr long long max_page_number = 2147483647LL;

  static pgs_manifest load(const pgsv_map& raw);
  static pgs_manifest load_json(const pgs_string& json_text);
  // Throws pgs_not_found_error if path does not exist
  static pgs_manifest load_file(const pgs_string& path);

private:
  static pgs_section read_section(const pgs_variant& raw, size_t index);
  static pgs_manifest_metadata read_metadata(const pgsv_map& raw);

  // Value of key, falling back to alias. nullptr if neither is present.
  static const pgs_variant* find_field(const pgsv_map& map, const char* key, const char* alias = nullptr);
  static long long read_integer(const pgs_variant& value, const pgs_string& field_path);
  static pgs_string read_text(const pgs_variant& value, const pgs_string& field_path);
};

#endif // PGS_MANIFEST_LOADER_H
