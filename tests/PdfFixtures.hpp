#ifndef REDACT_TESTS_PDF_FIXTURES_HPP
#define REDACT_TESTS_PDF_FIXTURES_HPP

#include "Document.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <string>
#include <vector>

namespace redact {
namespace testing {

/**
 * @brief One line of Helvetica text drawn with Td/Tj
 */
struct TextLine {
  double x;
  double y;
  double size;
  std::string text;
};

/// A shared Helvetica font object for fixture pages
QPDFObjectHandle helveticaFont(QPDF &pdf);

/**
 * @brief Append a US Letter page drawing `lines` with font /F1
 * @return the page object
 */
QPDFObjectHandle addTextPage(QPDF &pdf, const std::vector<TextLine> &lines);

/**
 * @brief Append a page with raw content and resources
 */
QPDFObjectHandle addPage(QPDF &pdf, const std::string &content,
                         QPDFObjectHandle resources);

/// A gray image XObject of the given pixel size
QPDFObjectHandle grayImage(QPDF &pdf, int width, int height,
                           unsigned char value = 128);

/// Content stream operators for `lines` (BT ... ET per line)
std::string textContent(const std::vector<TextLine> &lines);

/// Serialise a fixture
Document toDocument(QPDF &pdf);

/// A one-page document with the given lines
Document textDocument(const std::vector<TextLine> &lines);

/// Decoded content of page `pageIndex`, all streams concatenated
std::string pageContent(const Document &document, int pageIndex = 0);

} // namespace testing
} // namespace redact

#endif // REDACT_TESTS_PDF_FIXTURES_HPP
