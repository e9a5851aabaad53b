#include "pgs_splitter.h"
#include "pgs_split_exceptions.h"
#include "manifest/pgs_manifest_loader.h"
#include "../documents/pdf/pgs_pdf_sio.h"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

pgs_string pgs_split_state_name(pgs_split_state state) {
  switch (state) {
    case pgs_split_state::idle: return "idle";
    case pgs_split_state::loaded: return "loaded";
    case pgs_split_state::mapped: return "mapped";
    case pgs_split_state::partitioned: return "partitioned";
    case pgs_split_state::reported: return "reported";
    case pgs_split_state::done: return "done";
    case pgs_split_state::failed: return "failed";
  }
  return "unknown";
}

pgs_splitter::pgs_splitter(pgs_split_config config, pgs::progress::i_sink* progress)
  : config(std::move(config)), progress(progress), state(pgs_split_state::idle) {
}

pgs_split_result pgs_splitter::split(const pgs_string& manifest_path, const pgs_string& document_path) {
  state = pgs_split_state::idle;
  failure_reason.clear();

  std::shared_ptr<const pgs_manifest> manifest;
  try {
    require_file("Manifest file", manifest_path);
    require_file("Document file", document_path);

    std::cout << "📖 Loading manifest: " << manifest_path.c_str() << std::endl;
    manifest = std::make_shared<pgs_manifest>(pgs_manifest_loader::load_file(manifest_path));
  } catch (const pgs_split_exception& e) {
    return fail(e.what());
  }

  std::cout << "✅ Manifest loaded: " << manifest->section_count() << " sections" << std::endl;
  state = pgs_split_state::loaded;
  return split(manifest, document_path);
}

pgs_split_result pgs_splitter::split(std::shared_ptr<const pgs_manifest> manifest, const pgs_string& document_path) {
  if (!manifest) {
    return fail("No manifest given");
  }
  state = pgs_split_state::loaded;
  failure_reason.clear();

  pgs_pdf_sio document;
  try {
    require_file("Document file", document_path);

    std::cout << "📖 Loading PDF: " << document_path.c_str() << std::endl;
    if (!document.read(document_path)) {
      throw pgs_document_error(document_path, document.last_error());
    }
  } catch (const pgs_split_exception& e) {
    return fail(e.what());
  }

  pgs_split_result result = guarded_run(manifest, document, document_path);
  document.close();
  return result;
}

pgs_split_result pgs_splitter::split(std::shared_ptr<const pgs_manifest> manifest, pgs_doc_sio& document,
                                     const pgs_string& document_path) {
  if (!manifest) {
    return fail("No manifest given");
  }
  state = pgs_split_state::loaded;
  failure_reason.clear();

  if (!document.is_open()) {
    return fail(pgs_document_error(document_path, "document is not open").what());
  }
  return guarded_run(manifest, document, document_path);
}

pgs_split_result pgs_splitter::guarded_run(std::shared_ptr<const pgs_manifest> manifest, pgs_doc_sio& document,
                                           const pgs_string& document_path) {
  try {
    return run(manifest, document, document_path);
  } catch (const std::exception& e) {
    return fail(pgs_string("Split aborted: ") + e.what());
  }
}

pgs_split_result pgs_splitter::run(std::shared_ptr<const pgs_manifest> manifest, pgs_doc_sio& document,
                                   const pgs_string& document_path) {
  pgs_run_context context(manifest, document_path, config.output_dir, config.page_offset,
                          config.page_tolerance, config.verbose);
  size_t page_count = document.page_count();
  long long declared_pages = manifest->get_metadata().get_declared_total_pages();

  std::cout << "📄 Document pages: " << page_count << std::endl;
  if (declared_pages > 0) {
    std::cout << "📄 Manifest pages: " << declared_pages << std::endl;
    long long difference = declared_pages - (long long)page_count;
    if ((difference < 0 ? -difference : difference) > config.page_tolerance) {
      std::cout << "⚠️  Warning: Page count mismatch between document and manifest" << std::endl;
    }
  }

  // Mapping is recomputed per section by the partitioner, this pass only
  // announces how much of the manifest lies inside the document.
  long long in_range = 0;
  for (const auto& section : manifest->get_sections()) {
    in_range += (long long)pgs_page_mapper::map(section, (long long)page_count, config.page_offset).pages.size();
  }
  state = pgs_split_state::mapped;
  std::cout << "🔧 Page offset " << config.page_offset << ": " << in_range << " of "
            << manifest->declared_section_pages() << " declared pages inside the document" << std::endl;
  std::cout << "📁 Output folder: " << context.book_folder().c_str() << std::endl;

  pgs_partitioner partitioner(progress);
  pgs_partition_result partition = partitioner.partition(document, context);
  state = pgs_split_state::partitioned;

  pgs_split_result result;
  result.report = pgs_reconciliation_report::build(context, page_count, partition);
  result.message = pgs_reconciliation_report::render(result.report);
  if (pgs_reconciliation_report::write(result.report, context)) {
    result.summary_path = context.summary_file();
  }
  state = pgs_split_state::reported;

  for (const auto& warning : result.report.warnings) {
    std::cout << "⚠️  " << warning.c_str() << std::endl;
  }

  result.success = true;
  result.extracted_pages = partition.extracted_count();
  result.skipped_pages = partition.skipped_count();
  result.cancelled = partition.cancelled;
  state = pgs_split_state::done;

  pgs::progress::publish_status(progress, "Done");
  std::cout << "✅ Split finished: " << result.extracted_pages << " pages extracted, "
            << result.skipped_pages << " skipped" << std::endl;
  return result;
}

pgs_split_result pgs_splitter::fail(const pgs_string& reason) {
  state = pgs_split_state::failed;
  failure_reason = reason;
  std::cerr << "❌ " << reason.c_str() << std::endl;
  pgs::progress::publish_status(progress, pgs_string("Failed: ") + reason);

  pgs_split_result result;
  result.success = false;
  result.message = reason;
  return result;
}

void pgs_splitter::require_file(const pgs_string& what_file, const pgs_string& path) const {
  std::error_code ec;
  if (path.empty() || !fs::is_regular_file(path.to_std_const(), ec)) {
    throw pgs_not_found_error(what_file, path);
  }
}
