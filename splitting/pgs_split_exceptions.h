#ifndef PGS_SPLIT_EXCEPTIONS_H
#define PGS_SPLIT_EXCEPTIONS_H

#include "../utils/pgs_string.h"
#include <exception>

// ============================================================================
// SPLIT EXCEPTION HIERARCHY
// ============================================================================
//
// Only conditions that abort a run before any output is written are thrown:
//
// pgs_split_exception (base)
// ├── pgs_validation_error   malformed manifest
// ├── pgs_not_found_error    manifest or document file missing
// └── pgs_document_error     document exists but cannot be opened
//
// Everything later in a run (skipped pages, failed pages, failed sections,
// page count mismatches) is recorded in the result and the report instead.
//
// ============================================================================

class pgs_split_exception : public std::exception {
protected:
  pgs_string message_;

public:
  explicit pgs_split_exception(const pgs_string& message)
    : message_(message) {}

  virtual ~pgs_split_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }
};

class pgs_validation_error : public pgs_split_exception {
private:
  pgs_string field_path_;

public:
  explicit pgs_validation_error(const pgs_string& message)
    : pgs_split_exception(pgs_string("Invalid manifest: ") + message) {}

  pgs_validation_error(const pgs_string& field_path, const pgs_string& message)
    : pgs_split_exception(pgs_string("Invalid manifest: ") + field_path + ": " + message),
      field_path_(field_path) {}

  // e.g. "sections[3].end_page", empty for structural errors
  pgs_string get_field_path() const { return field_path_; }
};

class pgs_not_found_error : public pgs_split_exception {
private:
  pgs_string path_;

public:
  pgs_not_found_error(const pgs_string& what_file, const pgs_string& path)
    : pgs_split_exception(what_file + " not found: " + path),
      path_(path) {}

  pgs_string get_path() const { return path_; }
};

class pgs_document_error : public pgs_split_exception {
private:
  pgs_string path_;

public:
  pgs_document_error(const pgs_string& path, const pgs_string& reason)
    : pgs_split_exception(pgs_string("Cannot open document ") + path + ": " + reason),
      path_(path) {}

  pgs_string get_path() const { return path_; }
};

#endif // PGS_SPLIT_EXCEPTIONS_H
