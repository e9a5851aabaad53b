#include "pgs_pdf_sio.h"
#include <podofo/podofo.h>
#include <iostream>
#include <sstream>

using namespace PoDoFo;

namespace {

  // Output must be reproducible: no modification date stamped on save
  const PdfSaveOptions deterministic_save = PdfSaveOptions::NoModifyDateUpdate;

  void save_to_string(PdfMemDocument& doc, pgs_string& data) {
    std::stringstream buffer;
    StandardStreamDevice device(buffer);
    doc.Save(device, deterministic_save);
    std::string bytes = buffer.str();
    data = pgs_string(bytes.data(), bytes.size());
  }

}

pgs_pdf_sio::pgs_pdf_sio() : m_pdf(nullptr) {
}

pgs_pdf_sio::~pgs_pdf_sio() {
  close();
}

bool pgs_pdf_sio::parse(pgs_string &data) {
  close();
  error_message.clear();
  try {
    m_pdf = std::make_unique<PdfMemDocument>();

    pdf_data_buffer.assign(data.c_str(), data.c_str() + data.size());
    bufferview buffer(pdf_data_buffer.data(), pdf_data_buffer.size());

    m_pdf->LoadFromBuffer(buffer);
    return true;
  } catch (const std::exception& e) {
    error_message = pgs_string("PDF loading failed: ") + e.what();
    std::cerr << "❌ " << error_message.c_str() << std::endl;
    close();
    return false;
  }
}

bool pgs_pdf_sio::serialize(pgs_string &data) {
  if (!m_pdf) {
    error_message = "No PDF document loaded";
    return false;
  }
  try {
    save_to_string(*m_pdf, data);
    return true;
  } catch (const std::exception& e) {
    error_message = pgs_string("Error serializing PDF: ") + e.what();
    std::cerr << error_message.c_str() << std::endl;
    return false;
  }
}

bool pgs_pdf_sio::is_open() const {
  return m_pdf != nullptr;
}

void pgs_pdf_sio::close() {
  m_pdf.reset();
  pdf_data_buffer.clear();
}

size_t pgs_pdf_sio::page_count() const {
  if (!m_pdf) {
    return 0;
  }
  return m_pdf->GetPages().GetCount();
}

bool pgs_pdf_sio::extract_page(size_t page_index, pgs_string &data) {
  if (!m_pdf) {
    error_message = "No PDF document loaded";
    return false;
  }
  if (page_index >= page_count()) {
    error_message = pgs_string("Page ") + pgs_string((unsigned long)page_index) +
                    " not found in PDF (" + pgs_string((unsigned long)page_count()) + " pages)";
    return false;
  }

  try {
    PdfMemDocument single_page;
    single_page.GetPages().AppendDocumentPages(*m_pdf, static_cast<unsigned>(page_index), 1);

    // A fresh document is stamped with the current time, carry the source's
    // creation date over instead so repeated runs produce identical bytes
    single_page.GetMetadata().SetCreationDate(m_pdf->GetMetadata().GetCreationDate());

    save_to_string(single_page, data);
    return true;
  } catch (const std::exception& e) {
    error_message = pgs_string("Extracting page ") + pgs_string((unsigned long)page_index) + " failed: " + e.what();
    return false;
  }
}

bool pgs_pdf_sio::add_blank_page(double width, double height) {
  try {
    if (!m_pdf) {
      m_pdf = std::make_unique<PdfMemDocument>();
    }
    m_pdf->GetPages().CreatePage(Rect(0, 0, width, height));
    return true;
  } catch (const std::exception& e) {
    error_message = pgs_string("Creating page failed: ") + e.what();
    std::cerr << error_message.c_str() << std::endl;
    return false;
  }
}

double pgs_pdf_sio::page_width(size_t page_index) const {
  if (!m_pdf || page_index >= page_count()) {
    return 0.0;
  }
  return m_pdf->GetPages().GetPageAt(static_cast<unsigned>(page_index)).GetMediaBox().Width;
}
