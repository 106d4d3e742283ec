#ifndef REDACT_VERIFIER_HPP
#define REDACT_VERIFIER_HPP

#include "Cancellation.hpp"
#include "Document.hpp"
#include "OcrEngine.hpp"
#include "TextMatcher.hpp"

#include <optional>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief Where a residual match was found
 */
enum class ResidualLayer {
  Text,   ///< Extracted text layer
  Binary, ///< Raw bytes, decoded streams or string objects
  Ocr     ///< Re-OCR of a rendered page
};

const char *toString(ResidualLayer layer);

/**
 * @brief A term or pattern that is still present in the output
 */
struct ResidualMatch {
  std::optional<int> pageIndex; ///< Absent for binary-layer hits
  std::string termOrPattern;
  std::string contextSnippet;
  ResidualLayer layer = ResidualLayer::Text;
};

struct VerificationResult {
  bool passed = true; ///< True iff residualMatches is empty
  std::vector<ResidualMatch> residualMatches;
  std::vector<int> unreadablePages;      ///< Text layer could not be read
  std::optional<std::string> ocrSkipped; ///< Why the OCR layer did not run
};

struct VerifyConfig {
  bool binaryScan = true;          ///< Scan bytes, streams and strings
  bool binaryScanPatterns = false; ///< Also run patterns in the binary scan
  std::size_t minStringLength = 4; ///< Shortest printable run for patterns
  std::size_t contextChars = 20;   ///< Snippet radius
};

/**
 * @brief Pages to re-read with OCR and the engine to do it
 */
struct OcrRecheck {
  std::vector<int> pages;
  OcrEngine *engine = nullptr;
  OcrConfig config;
};

/**
 * @brief Checks an output document for anything that should be gone
 *
 * Independent of the redactor: text is re-extracted with Poppler and the
 * bytes are re-read with qpdf.
 */
class Verifier {
public:
  explicit Verifier(const VerifyConfig &config = VerifyConfig());

  /**
   * @throws InputError if the document cannot be opened
   * @throws OperationCancelled if the token fires
   */
  VerificationResult verify(const Document &document,
                            const TextMatcher &matcher,
                            const OcrRecheck *ocr = nullptr,
                            const CancellationToken *cancel = nullptr) const;

private:
  void verifyText(const Document &document, const TextMatcher &matcher,
                  const CancellationToken *cancel,
                  VerificationResult &result) const;
  void verifyBinary(const Document &document, const TextMatcher &matcher,
                    VerificationResult &result) const;
  void verifyOcr(const Document &document, const TextMatcher &matcher,
                 const OcrRecheck &ocr, const CancellationToken *cancel,
                 VerificationResult &result) const;

  VerifyConfig m_config;
};

} // namespace redact

#endif // REDACT_VERIFIER_HPP
