#include "QpdfSupport.hpp"

#include "Errors.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDFWriter.hh>

#include <algorithm>
#include <memory>

namespace redact {

void loadDocument(QPDF &pdf, const Document &document) {
  pdf.setSuppressWarnings(true);
  try {
    pdf.processMemoryFile("input document", document.bytes().data(),
                          document.size(),
                          document.password().empty()
                              ? nullptr
                              : document.password().c_str());
  } catch (const std::exception &e) {
    throw InputError(std::string("Cannot open PDF: ") + e.what());
  }
}

Document writeDocument(QPDF &pdf, bool deterministicId) {
  QPDFWriter writer(pdf);
  writer.setOutputMemory();
  writer.setPreserveEncryption(false);
  if (deterministicId) {
    writer.setDeterministicID(true);
  }
  writer.write();

  std::unique_ptr<Buffer> buffer(writer.getBuffer());
  std::string bytes(reinterpret_cast<char const *>(buffer->getBuffer()),
                    buffer->getSize());
  return Document::fromBytes(std::move(bytes));
}

Rect rectFromArray(QPDFObjectHandle array) {
  if (!array.isRectangle()) {
    return Rect();
  }
  QPDFObjectHandle::Rectangle r = array.getArrayAsRectangle();
  return Rect(std::min(r.llx, r.urx), std::min(r.lly, r.ury),
              std::max(r.llx, r.urx), std::max(r.lly, r.ury));
}

} // namespace redact
