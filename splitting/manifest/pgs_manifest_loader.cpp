#include "pgs_manifest_loader.h"
#include "../../api/json/pgs_json.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <cmath>

namespace {

  pgs_string section_path(size_t index, const char* field = nullptr) {
    pgs_string path = pgs_string("sections[") + pgs_string((unsigned long)index) + "]";
    if (field != nullptr) {
      path += pgs_string(".") + field;
    }
    return path;
  }

}

pgs_manifest pgs_manifest_loader::load(const pgsv_map& raw) {
  auto sections_it = raw.find("sections");
  auto metadata_it = raw.find("metadata");

  if (sections_it == raw.end() || metadata_it == raw.end()) {
    pgs_string missing = sections_it == raw.end() ? "sections" : "metadata";
    if (sections_it == raw.end() && metadata_it == raw.end()) {
      missing = "sections, metadata";
    }
    throw pgs_validation_error(pgs_string("missing required top-level key(s): ") + missing);
  }
  if (!sections_it->second.is_vector()) {
    throw pgs_validation_error("sections", pgs_string("expected an array, got ") +
                               pgs_variant::state_name(sections_it->second.in_state()));
  }
  if (!metadata_it->second.is_map()) {
    throw pgs_validation_error("metadata", pgs_string("expected an object, got ") +
                               pgs_variant::state_name(metadata_it->second.in_state()));
  }

  const pgsv_vector& raw_sections = sections_it->second.vector_value();
  std::vector<pgs_section> sections;
  sections.reserve(raw_sections.size());
  for (size_t i = 0; i < raw_sections.size(); i++) {
    sections.push_back(read_section(raw_sections[i], i));
  }

  return pgs_manifest(std::move(sections), read_metadata(metadata_it->second.map_value()));
}

pgs_manifest pgs_manifest_loader::load_json(const pgs_string& json_text) {
  pgsv_map raw;
  pgs_json json(&raw);
  if (!json.parse(json_text)) {
    throw pgs_validation_error(json.last_error());
  }
  return load(raw);
}

pgs_manifest pgs_manifest_loader::load_file(const pgs_string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path.to_std_const(), ec)) {
    throw pgs_not_found_error("Manifest", path);
  }

  std::ifstream f(path.c_str(), std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    throw pgs_validation_error(pgs_string("cannot read manifest file ") + path);
  }
  std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  return load_json(pgs_string(data));
}

pgs_section pgs_manifest_loader::read_section(const pgs_variant& raw, size_t index) {
  if (!raw.is_map()) {
    throw pgs_validation_error(section_path(index), pgs_string("expected an object, got ") +
                               pgs_variant::state_name(raw.in_state()));
  }
  const pgsv_map& fields = raw.map_value();

  const pgs_variant* title = find_field(fields, "title");
  const pgs_variant* start_page = find_field(fields, "start_page");
  const pgs_variant* end_page = find_field(fields, "end_page");
  const pgs_variant* kind = find_field(fields, "kind", "type");

  if (title == nullptr) throw pgs_validation_error(section_path(index, "title"), "missing");
  if (start_page == nullptr) throw pgs_validation_error(section_path(index, "start_page"), "missing");
  if (end_page == nullptr) throw pgs_validation_error(section_path(index, "end_page"), "missing");
  if (kind == nullptr) throw pgs_validation_error(section_path(index, "kind"), "missing");

  long long start = read_integer(*start_page, section_path(index, "start_page"));
  long long end = read_integer(*end_page, section_path(index, "end_page"));
  if (start > end) {
    throw pgs_validation_error(section_path(index),
                               pgs_string("start_page ") + pgs_string(start) +
                               " is greater than end_page " + pgs_string(end));
  }

  pgs_section_kind section_kind;
  pgs_string kind_text = read_text(*kind, section_path(index, "kind"));
  if (!pgs_parse_section_kind(kind_text, section_kind)) {
    throw pgs_validation_error(section_path(index, "kind"),
                               pgs_string("unknown section kind '") + kind_text +
                               "', expected front_matter, chapter or back_matter");
  }

  pgs_string page_range;
  const pgs_variant* range = find_field(fields, "page_range");
  if (range != nullptr && !range->is_null()) {
    page_range = range->convert(pgs_variant::string_state).string_value();
  }

  return pgs_section(read_text(*title, section_path(index, "title")), start, end, section_kind, page_range);
}

pgs_manifest_metadata pgs_manifest_loader::read_metadata(const pgsv_map& raw) {
  long long total_pages = 0;
  pgs_string file_name;
  long long total_sections = -1;

  const pgs_variant* value = find_field(raw, "declared_total_pages", "total_pages");
  if (value != nullptr && !value->is_null()) {
    total_pages = read_integer(*value, "metadata.declared_total_pages");
  }
  value = find_field(raw, "source_file_name", "file_name");
  if (value != nullptr && !value->is_null()) {
    file_name = read_text(*value, "metadata.source_file_name");
  }
  value = find_field(raw, "declared_total_sections", "total_sections");
  if (value != nullptr && !value->is_null()) {
    total_sections = read_integer(*value, "metadata.declared_total_sections");
  }

  return pgs_manifest_metadata(total_pages, file_name, total_sections);
}

const pgs_variant* pgs_manifest_loader::find_field(const pgsv_map& map, const char* key, const char* alias) {
  auto it = map.find(key);
  if (it != map.end()) {
    return &it->second;
  }
  if (alias != nullptr) {
    it = map.find(alias);
    if (it != map.end()) {
      return &it->second;
    }
  }
  return nullptr;
}

long long pgs_manifest_loader::read_integer(const pgs_variant& value, const pgs_string& field_path) {
  long long result = 0;
  if (value.is_int()) {
    result = value.int_value();
  } else if (value.is_double()) {
    double d = value.double_value();
    if (!std::isfinite(d) || d != std::floor(d)) {
      throw pgs_validation_error(field_path, pgs_string("expected an integer, got ") + pgs_string(d));
    }
    // Range check before the cast, out-of-range conversion is undefined
    if (std::fabs(d) > (double)max_page_number) {
      throw pgs_validation_error(field_path, pgs_string("value ") + pgs_string(d) + " is out of range");
    }
    result = static_cast<long long>(d);
  } else if (value.is_string() && value.string_value().is_integer()) {
    result = value.string_value().to_int();
  } else if (value.is_string()) {
    throw pgs_validation_error(field_path, pgs_string("expected an integer, got '") + value.string_value() + "'");
  } else {
    throw pgs_validation_error(field_path, pgs_string("expected an integer, got ") +
                               pgs_variant::state_name(value.in_state()));
  }

  if (result > max_page_number || result < -max_page_number) {
    throw pgs_validation_error(field_path, pgs_string("value ") + pgs_string(result) + " is out of range");
  }
  return result;
}

pgs_string pgs_manifest_loader::read_text(const pgs_variant& value, const pgs_string& field_path) {
  if (value.is_string()) {
    return value.string_value();
  }
  if (value.is_int() || value.is_double()) {
    return value.convert(pgs_variant::string_state).string_value();
  }
  throw pgs_validation_error(field_path, pgs_string("expected a string, got ") +
                             pgs_variant::state_name(value.in_state()));
}
