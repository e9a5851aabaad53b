#include "pgs_reconciliation_report.h"
#include "../api/json/pgs_json.h"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace {

  const pgs_string rule = pgs_string("-").repeat(30);

  pgs_string file_name_of(const pgs_string& path) {
    return fs::path(path.to_std_const()).filename().string();
  }

  pgs_string range_text(long long first, long long last) {
    if (first == last) {
      return pgs_string(first);
    }
    return pgs_string(first) + "-" + pgs_string(last);
  }

  pgs_string offset_text(long long offset) {
    pgs_string text = pgs_string(offset) + " (manifest page N is physical page N";
    if (offset > 0) {
      text += pgs_string("-") + pgs_string(offset);
    } else if (offset < 0) {
      text += pgs_string("+") + pgs_string(-offset);
    }
    return text + ")";
  }

  // "Page_4" or "Page_4 to Page_7"
  pgs_string page_label_range(long long first, long long last) {
    if (first == last) {
      return pgs_string("Page_") + pgs_string(first);
    }
    return pgs_string("Page_") + pgs_string(first) + " to Page_" + pgs_string(last);
  }

  pgsv_map page_record(long long physical_page, long long section_relative_index) {
    pgsv_map record;
    record["physical_page"] = physical_page;
    record["section_relative_index"] = section_relative_index;
    return record;
  }

}

pgs_string pgs_section_report::output_range() const {
  if (first_output_index == 0) {
    return "none";
  }
  return page_label_range(first_output_index, last_output_index);
}

long long pgs_report::page_difference() const {
  if (declared_total_pages <= 0) {
    return 0;
  }
  return declared_total_pages - actual_total_pages;
}

bool pgs_report::exceeds_tolerance() const {
  long long difference = page_difference();
  return (difference < 0 ? -difference : difference) > page_tolerance;
}

pgs_report pgs_reconciliation_report::build(const pgs_run_context& context, size_t document_page_count,
                                            const pgs_partition_result& result) {
  const pgs_manifest& manifest = context.get_manifest();
  const pgs_manifest_metadata& metadata = manifest.get_metadata();

  pgs_report report;
  report.source_file_name = metadata.get_source_file_name();
  report.book_folder_name = context.get_book_base_name();
  report.declared_total_pages = metadata.get_declared_total_pages();
  report.actual_total_pages = (long long)document_page_count;
  report.page_offset = context.get_page_offset();
  report.page_tolerance = context.get_page_tolerance();
  report.declared_total_sections = metadata.get_declared_total_sections();
  report.section_count = manifest.section_count();
  report.expected_pages = manifest.declared_section_pages();
  report.extracted_pages = result.extracted_count();
  report.skipped_pages = result.skipped_count();
  report.failed_pages = result.failed_page_count();
  report.failed_sections = result.failures.size();
  report.cancelled = result.cancelled;

  if (report.exceeds_tolerance()) {
    report.warnings.push_back(pgs_string("Page count mismatch: manifest declares ") +
                              pgs_string(report.declared_total_pages) + " pages, document has " +
                              pgs_string(report.actual_total_pages) + " (difference " +
                              pgs_string(report.page_difference()) + " exceeds tolerance of " +
                              pgs_string(report.page_tolerance) + ")");
  }

  if (metadata.has_declared_total_sections() &&
      metadata.get_declared_total_sections() != (long long)report.section_count) {
    report.warnings.push_back(pgs_string("Section count mismatch: manifest declares ") +
                              pgs_string(metadata.get_declared_total_sections()) + " sections, found " +
                              pgs_string((long long)report.section_count));
  }

  for (const auto& failure : result.failures) {
    report.warnings.push_back(pgs_string("Section ") + pgs_string((long long)failure.section_index + 1) + " '" +
                              failure.section_title + "' produced no pages: " + failure.reason);
  }

  if (result.cancelled) {
    report.warnings.push_back(pgs_string("Run cancelled after ") + pgs_string((long long)result.sections.size()) +
                              " of " + pgs_string((long long)report.section_count) + " sections");
  }

  const auto& sections = manifest.get_sections();
  for (size_t i = 0; i < sections.size(); i++) {
    const pgs_section& section = sections[i];
    bool processed = i < result.sections.size();
    pgs_mapped_range range = processed
      ? result.sections[i].range
      : pgs_page_mapper::map(section, (long long)document_page_count, context.get_page_offset());

    pgs_section_report entry{i + 1, section.get_title(), section.get_kind(), section.get_page_range(),
                             section.declared_length(), range.physical_start, range.physical_end, 0, 0,
                             context.section_folder_name(i), {}, range.skipped, {}, processed};

    if (processed) {
      const pgs_section_outcome& outcome = result.sections[i];
      for (const auto& written : outcome.entries) {
        if (entry.first_output_index == 0 || written.section_relative_index < entry.first_output_index) {
          entry.first_output_index = written.section_relative_index;
        }
        if (written.section_relative_index > entry.last_output_index) {
          entry.last_output_index = written.section_relative_index;
        }
        entry.files.push_back(file_name_of(written.output_path));
      }
      entry.failures = outcome.page_failures;
    }

    report.sections.push_back(entry);
  }

  return report;
}

pgs_string pgs_reconciliation_report::render(const pgs_report& report) {
  pgs_string out;
  out += "Section Splitting Summary Report\n";
  out += pgs_string("=").repeat(50) + "\n\n";

  out += pgs_string("Original Document: ") + report.source_file_name + "\n";
  if (report.declared_total_pages > 0) {
    out += pgs_string("Declared Pages: ") + pgs_string(report.declared_total_pages) + "\n";
  } else {
    out += "Declared Pages: not stated\n";
  }
  out += pgs_string("Actual Pages: ") + pgs_string(report.actual_total_pages) + "\n";
  if (report.declared_total_pages > 0) {
    out += pgs_string("Page Difference: ") + pgs_string(report.page_difference()) +
           (report.exceeds_tolerance() ? " (exceeds" : " (within") + " tolerance of " +
           pgs_string(report.page_tolerance) + ")\n";
  }
  out += pgs_string("Total Sections: ") + pgs_string((long long)report.section_count) + "\n";
  out += pgs_string("Output Directory: ") + report.book_folder_name + "/\n";
  out += pgs_string("Page Offset: ") + offset_text(report.page_offset) + "\n\n";

  out += "Totals:\n" + rule + "\n";
  out += pgs_string("Expected pages:  ") + pgs_string(report.expected_pages) + "\n";
  out += pgs_string("Extracted pages: ") + pgs_string((long long)report.extracted_pages) + "\n";
  out += pgs_string("Skipped pages:   ") + pgs_string((long long)report.skipped_pages) + "\n";
  out += pgs_string("Failed pages:    ") + pgs_string((long long)report.failed_pages) + "\n";
  out += pgs_string("Failed sections: ") + pgs_string((long long)report.failed_sections) + "\n\n";

  out += "Reconciliation Warnings:\n" + rule + "\n";
  if (report.warnings.empty()) {
    out += "None\n";
  }
  for (const auto& warning : report.warnings) {
    out += pgs_string("• ") + warning + "\n";
  }
  out += "\n";

  out += "Section Details:\n" + rule + "\n";
  for (const auto& section : report.sections) {
    out += pgs_string((long long)section.number).pad_left(2) + ". " + section.title + "\n";
    out += pgs_string("    Kind: ") + pgs_section_kind_name(section.kind) + "\n";
    out += pgs_string("    Manifest Pages (0-based): ") + section.declared_range + "\n";
    out += pgs_string("    Physical Pages: ") + range_text(section.physical_start, section.physical_end) + "\n";
    if (!section.processed) {
      out += "    Output Files: not processed (run cancelled)\n";
    } else {
      out += pgs_string("    Output Files: ") + section.output_range() + " (section-relative, " +
             pgs_string((long long)section.files.size()) + " of " + pgs_string(section.declared_pages) + ")\n";
    }
    out += pgs_string("    Folder: ") + section.folder_name + "\n";
    for (const auto& skipped : section.skipped) {
      out += pgs_string("    Skipped: physical ") + (skipped.count() == 1 ? "page " : "pages ") +
             range_text(skipped.first_physical_page, skipped.last_physical_page) + " (" +
             page_label_range(skipped.first_section_relative_index, skipped.last_section_relative_index()) +
             ", " + pgs_skip_reason_name(skipped.reason) + ")\n";
    }
    for (const auto& failure : section.failures) {
      out += pgs_string("    Failed: physical page ") + pgs_string(failure.physical_page) + " (Page_" +
             pgs_string(failure.section_relative_index) + "): " + failure.reason + "\n";
    }
    out += "\n";
  }

  out += "File Naming Convention:\n" + rule + "\n";
  out += "Each page is saved as: BookName_SectionName_Page_X.pdf\n";
  out += "Page numbers are section-relative and follow the declared position,\n";
  out += "so a section clipped at the document end keeps its numbering.\n\n";

  out += "Folder Structure:\n" + rule + "\n";
  out += pgs_string("📁 ") + report.book_folder_name + "/\n";
  for (const auto& section : report.sections) {
    out += pgs_string("  📂 ") + section.folder_name + "/\n";
    for (const auto& file : section.files) {
      out += pgs_string("    📄 ") + file + "\n";
    }
  }

  return out;
}

pgsv_map pgs_reconciliation_report::to_variant(const pgs_report& report) {
  pgsv_map map;
  map["source_file_name"] = report.source_file_name;
  map["book_folder"] = report.book_folder_name;
  map["declared_total_pages"] = report.declared_total_pages;
  map["actual_total_pages"] = report.actual_total_pages;
  map["page_difference"] = report.page_difference();
  map["page_tolerance"] = report.page_tolerance;
  map["exceeds_tolerance"] = report.exceeds_tolerance();
  map["page_offset"] = report.page_offset;
  if (report.declared_total_sections >= 0) {
    map["declared_total_sections"] = report.declared_total_sections;
  }
  map["section_count"] = (long long)report.section_count;
  map["expected_pages"] = report.expected_pages;
  map["extracted_pages"] = (long long)report.extracted_pages;
  map["skipped_pages"] = (long long)report.skipped_pages;
  map["failed_pages"] = (long long)report.failed_pages;
  map["failed_sections"] = (long long)report.failed_sections;
  map["cancelled"] = report.cancelled;

  pgsv_vector warnings;
  for (const auto& warning : report.warnings) {
    warnings.push_back(warning);
  }
  map["warnings"] = warnings;

  pgsv_vector sections;
  for (const auto& section : report.sections) {
    pgsv_map entry;
    entry["number"] = (long long)section.number;
    entry["title"] = section.title;
    entry["kind"] = pgs_section_kind_name(section.kind);
    entry["declared_range"] = section.declared_range;
    entry["declared_pages"] = section.declared_pages;
    entry["physical_start"] = section.physical_start;
    entry["physical_end"] = section.physical_end;
    entry["output_range"] = section.output_range();
    entry["folder"] = section.folder_name;
    entry["processed"] = section.processed;

    pgsv_vector files;
    for (const auto& file : section.files) {
      files.push_back(file);
    }
    entry["files"] = files;

    pgsv_vector skipped;
    for (const auto& run : section.skipped) {
      pgsv_map record;
      record["first_physical_page"] = run.first_physical_page;
      record["last_physical_page"] = run.last_physical_page;
      record["first_section_relative_index"] = run.first_section_relative_index;
      record["count"] = run.count();
      record["reason"] = pgs_skip_reason_name(run.reason);
      skipped.push_back(record);
    }
    entry["skipped"] = skipped;

    pgsv_vector failures;
    for (const auto& page : section.failures) {
      pgsv_map record = page_record(page.physical_page, page.section_relative_index);
      record["reason"] = page.reason;
      failures.push_back(record);
    }
    entry["failures"] = failures;

    sections.push_back(entry);
  }
  map["sections"] = sections;

  return map;
}

pgs_string pgs_reconciliation_report::to_json(const pgs_report& report) {
  pgsv_map map = to_variant(report);
  pgs_json json(&map);
  return json.create(2);
}

bool pgs_reconciliation_report::write(const pgs_report& report, const pgs_run_context& context) {
  std::error_code ec;
  fs::create_directories(context.book_folder().to_std_const(), ec);
  if (ec) {
    std::cerr << "⚠️  Cannot create " << context.book_folder().c_str() << ": " << ec.message() << std::endl;
    return false;
  }

  if (!write_text_file(context.summary_json_file(), to_json(report) + "\n")) {
    std::cerr << "⚠️  JSON summary skipped, continuing with the text report" << std::endl;
  }
  if (!write_text_file(context.summary_file(), render(report))) {
    return false;
  }
  std::cout << "📋 Summary report created: " << context.summary_file().c_str() << std::endl;
  return true;
}

bool pgs_reconciliation_report::write_text_file(const pgs_string& path, const pgs_string& content) {
  std::ofstream file(path.to_std_const(), std::ios::binary | std::ios::trunc);
  if (!file) {
    std::cerr << "⚠️  Error creating summary report " << path.c_str() << std::endl;
    return false;
  }
  file.write(content.c_str(), (std::streamsize)content.size());
  if (!file) {
    std::cerr << "⚠️  Error writing summary report " << path.c_str() << std::endl;
    return false;
  }
  return true;
}
