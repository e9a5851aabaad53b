#ifndef pgs_DOC_SIO_H
#define pgs_DOC_SIO_H

#include "../utils/pgs_string.h"

// Format-agnostic paginated document. The partitioner only needs the page
// count and the ability to cut a single page out as a standalone document.
class pgs_doc_sio
{
protected:
  pgs_string error_message;

public:
  virtual ~pgs_doc_sio() = default;

  // Core document operations
  virtual bool read(pgs_string filename);
  virtual bool write(pgs_string filename);
  virtual bool parse(pgs_string &data) = 0;
  virtual bool serialize(pgs_string &data) = 0;

  virtual bool is_open() const = 0;
  virtual void close() = 0;
  virtual size_t page_count() const = 0;

  // Serializes page page_index as a document of its own. The source
  // document is left untouched.
  virtual bool extract_page(size_t page_index, pgs_string &data) = 0;

  // File extension of serialized documents, without the dot
  virtual pgs_string file_extension() const = 0;

  // extract_page() followed by a binary write to filename
  bool write_page(size_t page_index, pgs_string filename);

  const pgs_string& last_error() const { return error_message; }
};

#endif // pgs_DOC_SIO_H
