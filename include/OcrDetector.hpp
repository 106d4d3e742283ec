#ifndef REDACT_OCR_DETECTOR_HPP
#define REDACT_OCR_DETECTOR_HPP

#include "BoxDetector.hpp"
#include "OcrEngine.hpp"
#include "PageSource.hpp"

namespace redact {

/**
 * @brief Reject OCR settings outside their range
 * @throws std::invalid_argument naming the setting
 */
void validateOcrConfig(const OcrConfig &config);

/**
 * @brief Finds terms and patterns by rendering pages and running OCR
 *
 * Words below the confidence threshold are dropped before matching. Each
 * matched word's pixel rectangle goes through pixelRectToPdf().
 */
class OcrDetector : public BoxDetector {
public:
  /// @throws std::invalid_argument if validateOcrConfig() rejects `config`
  OcrDetector(const PageSource &pages, OcrEngine &engine,
              const OcrConfig &config,
              const CancellationToken *cancel = nullptr);

  const char *name() const override { return "ocr"; }

  /**
   * @throws CapabilityUnavailable if the engine cannot be initialised
   * @throws PageProcessingError if rendering or recognition fails or the
   *         page deadline expires
   * @throws OperationCancelled if the token fires
   */
  PageDetection detectPage(int pageIndex, const TextMatcher &matcher) override;

  /**
   * @brief Recognised words of a page as runs in user space
   *
   * Also used by the verifier to re-read redacted pages.
   */
  std::vector<TextRun> recognizePage(int pageIndex);

private:
  const PageSource &m_pages;
  OcrEngine &m_engine;
  OcrConfig m_config;
  const CancellationToken *m_cancel;
};

} // namespace redact

#endif // REDACT_OCR_DETECTOR_HPP
