#include "pgs_partitioner.h"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

size_t pgs_partition_result::skipped_count() const {
  size_t count = 0;
  for (const auto& outcome : sections) {
    count += (size_t)outcome.range.skipped_count();
  }
  return count;
}

size_t pgs_partition_result::failed_page_count() const {
  size_t count = 0;
  for (const auto& outcome : sections) {
    count += outcome.page_failures.size();
  }
  return count;
}

pgs_partitioner::pgs_partitioner(pgs::progress::i_sink* progress) : progress(progress) {
}

pgs_partition_result pgs_partitioner::partition(pgs_doc_sio& document, const pgs_run_context& context) {
  pgs_partition_result result;
  const auto& sections = context.get_manifest().get_sections();

  std::cout << "\n🔪 Starting PDF splitting process..." << std::endl;
  pgs::progress::publish_status(progress, "Splitting document into sections");

  for (size_t i = 0; i < sections.size(); i++) {
    if (progress != nullptr && progress->cancel_requested()) {
      std::cout << "⏹️  Cancelled after " << i << " of " << sections.size() << " sections" << std::endl;
      pgs::progress::publish_message(progress, "Cancelled");
      result.cancelled = true;
      break;
    }

    const pgs_section& section = sections[i];
    pgs_section_outcome outcome = partition_section(document, context, i);

    if (outcome.failed()) {
      pgs_string reason;
      if (!outcome.page_failures.empty()) {
        reason = outcome.page_failures.front().reason;
      } else if (outcome.range.pages.empty()) {
        reason = "no page of the section lies inside the document";
      } else {
        reason = "no page could be extracted";
      }
      result.failures.push_back({i, section.get_title(), reason});
      std::cout << "   ⚠️  No pages extracted for this section" << std::endl;
    } else {
      std::cout << "   ✅ Extracted " << outcome.entries.size() << " pages" << std::endl;
    }

    result.entries.insert(result.entries.end(), outcome.entries.begin(), outcome.entries.end());
    result.sections.push_back(std::move(outcome));

    pgs::progress::publish_progress(progress, 100.0 * (double)(i + 1) / (double)sections.size());
  }

  std::cout << "\n🎯 PDF splitting finished" << std::endl;
  std::cout << "📊 Total pages extracted: " << result.extracted_count() << std::endl;
  return result;
}

pgs_section_outcome pgs_partitioner::partition_section(pgs_doc_sio& document, const pgs_run_context& context,
                                                       size_t section_index) {
  const pgs_section& section = context.get_manifest().get_sections()[section_index];
  pgs_mapped_range range = pgs_page_mapper::map(section, (long long)document.page_count(),
                                                context.get_page_offset());
  pgs_section_outcome outcome{range, context.section_folder_name(section_index), context.section_folder(section_index),
                              {}, {}};

  std::cout << "\n📖 Processing section: " << section.get_title().c_str() << std::endl;
  std::cout << "   📍 Manifest pages (0-based): " << section.get_start_page() << " to " << section.get_end_page()
            << " (" << section.declared_length() << " pages)" << std::endl;
  pgs::progress::publish_message(progress, pgs_string("Processing section: ") + section.get_title());

  for (const auto& skipped : range.skipped) {
    std::cout << "      ⚠️  Pages " << skipped.first_physical_page << "-" << skipped.last_physical_page
              << " not in document (" << pgs_skip_reason_name(skipped.reason).c_str() << ")" << std::endl;
  }

  std::error_code ec;
  fs::create_directories(outcome.folder_path.to_std_const(), ec);
  std::error_code probe;
  if (ec || !fs::is_directory(outcome.folder_path.to_std_const(), probe)) {
    pgs_string reason = pgs_string("Cannot create folder ") + outcome.folder_path + ": " +
                        (ec ? pgs_string(ec.message()) : pgs_string("path exists and is not a directory"));
    std::cerr << "   ❌ " << reason.c_str() << std::endl;
    for (const auto& page : range.pages) {
      outcome.page_failures.push_back({page.physical_page, page.section_relative_index, reason});
    }
    return outcome;
  }
  std::cout << "   📂 Folder: " << outcome.folder_name.c_str() << std::endl;

  if (context.is_verbose()) {
    log_mapping(context, range);
  }

  for (const auto& page : range.pages) {
    pgs_string output_path = context.page_file(section_index, page.section_relative_index, document.file_extension());

    if (!document.write_page((size_t)page.physical_page, output_path)) {
      pgs_string reason = document.last_error().empty() ? pgs_string("extraction failed") : document.last_error();
      std::cerr << "      ❌ Page " << page.physical_page << ": " << reason.c_str() << std::endl;
      outcome.page_failures.push_back({page.physical_page, page.section_relative_index, reason});
      continue;
    }

    outcome.entries.push_back({section.get_title(), page.physical_page, page.section_relative_index, output_path});

    if (outcome.entries.size() % 5 == 0) {
      std::cout << "      📄 Processed " << outcome.entries.size() << " pages..." << std::endl;
    }
  }

  return outcome;
}

void pgs_partitioner::log_mapping(const pgs_run_context& context, const pgs_mapped_range& range) {
  const pgs_section& section = range.section;
  long long declared = section.declared_length();

  std::cout << "      🔍 Mapping: manifest pages " << section.get_start_page() << "-" << section.get_end_page()
            << " → section pages 1-" << declared << std::endl;
  std::cout << "      🔧 Offset " << context.get_page_offset() << ": physical pages "
            << range.physical_start << "-" << range.physical_end << std::endl;

  // First three and the last page are enough to check the offset by eye
  for (const auto& page : range.pages) {
    if (page.section_relative_index <= 3 || page.section_relative_index == declared) {
      std::cout << "         Manifest page " << section.get_start_page() + page.section_relative_index - 1
                << " (physical page " << page.physical_page << ") → Page_" << page.section_relative_index << std::endl;
    }
  }
}
