#ifndef PGS_SPLITTER_H
#define PGS_SPLITTER_H

#include "pgs_reconciliation_report.h"
#include "pgs_split_config.h"
#include "manifest/pgs_manifest.h"
#include <memory>

enum class pgs_split_state {
  idle,
  loaded,
  mapped,
  partitioned,
  reported,
  done,
  failed
};

pgs_string pgs_split_state_name(pgs_split_state state);

// Outcome handed back to the caller. On success message holds the rendered
// report, otherwise the reason the run failed.
struct pgs_split_result {
  bool success = false;
  pgs_string message;
  pgs_string summary_path;  // empty when the summary could not be written
  size_t extracted_pages = 0;
  size_t skipped_pages = 0;
  bool cancelled = false;
  pgs_report report;
};

// Runs one split from manifest and document to the populated output tree:
// idle -> loaded -> mapped -> partitioned -> reported -> done.
// Manifest, missing-file and document-open errors move to failed and are
// returned in the result, as does anything thrown later in the run.
// Nothing is thrown to the caller.
class pgs_splitter {
  pgs_split_config config;
  pgs::progress::i_sink* progress;
  pgs_split_state state;
  pgs_string failure_reason;

public:
  explicit pgs_splitter(pgs_split_config config = pgs_split_config(),
                        pgs::progress::i_sink* progress = nullptr);

  // Both files must exist, checked before anything is read
  pgs_split_result split(const pgs_string& manifest_path, const pgs_string& document_path);
  // Opens document_path as PDF, the document is closed on every path
  pgs_split_result split(std::shared_ptr<const pgs_manifest> manifest, const pgs_string& document_path);
  // Works on an already open document, document_path only names the output
  pgs_split_result split(std::shared_ptr<const pgs_manifest> manifest, pgs_doc_sio& document,
                         const pgs_string& document_path);

  pgs_split_state get_state() const { return state; }
  const pgs_string& get_failure_reason() const { return failure_reason; }
  const pgs_split_config& get_config() const { return config; }

private:
  // run() with any escaping exception turned into a failed result
  pgs_split_result guarded_run(std::shared_ptr<const pgs_manifest> manifest, pgs_doc_sio& document,
                               const pgs_string& document_path);
  pgs_split_result run(std::shared_ptr<const pgs_manifest> manifest, pgs_doc_sio& document,
                       const pgs_string& document_path);
  pgs_split_result fail(const pgs_string& reason);
  void require_file(const pgs_string& what_file, const pgs_string& path) const;
};

#endif // PGS_SPLITTER_H
