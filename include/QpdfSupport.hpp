#ifndef REDACT_QPDF_SUPPORT_HPP
#define REDACT_QPDF_SUPPORT_HPP

#include "BoxModel.hpp"
#include "Document.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>

#include <string>

namespace redact {

/**
 * @brief Parse a document into `pdf`
 * @throws InputError if qpdf rejects the bytes or the password
 */
void loadDocument(QPDF &pdf, const Document &document);

/**
 * @brief Rewrite the whole document to memory, unencrypted
 *
 * With `deterministicId` the trailer /ID is derived from the content, so
 * the same content always produces the same bytes.
 */
Document writeDocument(QPDF &pdf, bool deterministicId);

/// Rectangle of a PDF array, normalised so x0 < x1 and y0 < y1
Rect rectFromArray(QPDFObjectHandle array);

} // namespace redact

#endif // REDACT_QPDF_SUPPORT_HPP
