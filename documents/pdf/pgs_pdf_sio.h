#ifndef pgs_PDF_SIO_H
#define pgs_PDF_SIO_H

#include "../pgs_doc_sio.h"
#include <vector>
#include <memory>

namespace PoDoFo {
  class PdfMemDocument;
}

// PDF backend on PoDoFo. The loaded document is owned by this object and
// released by close() or the destructor.
class pgs_pdf_sio : public pgs_doc_sio
{
private:
  std::unique_ptr<PoDoFo::PdfMemDocument> m_pdf;
  std::vector<char> pdf_data_buffer;  // must outlive m_pdf, PoDoFo reads objects lazily

public:
  pgs_pdf_sio();
  ~pgs_pdf_sio() override;

  pgs_pdf_sio(const pgs_pdf_sio&) = delete;
  pgs_pdf_sio& operator=(const pgs_pdf_sio&) = delete;

  bool parse(pgs_string &data) override;
  bool serialize(pgs_string &data) override;

  bool is_open() const override;
  void close() override;
  size_t page_count() const override;
  bool extract_page(size_t page_index, pgs_string &data) override;
  pgs_string file_extension() const override { return "pdf"; }

  // Appends an empty page of the given size in points, starting a new
  // document if none is open.
  bool add_blank_page(double width = 595.0, double height = 842.0);

  // Media box width of a page in points, 0 when the page does not exist
  double page_width(size_t page_index) const;
};

#endif // pgs_PDF_SIO_H
