#include "OcrDetector.hpp"

#include "Errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace redact {

void validateOcrConfig(const OcrConfig &config) {
  if (config.confidenceThreshold < 0.0 || config.confidenceThreshold > 100.0) {
    throw std::invalid_argument("confidence must be between 0 and 100");
  }
  if (config.pageTimeoutMs < 0) {
    throw std::invalid_argument("OCR timeout must not be negative");
  }
}

OcrDetector::OcrDetector(const PageSource &pages, OcrEngine &engine,
                         const OcrConfig &config,
                         const CancellationToken *cancel)
    : m_pages(pages), m_engine(engine), m_config(config), m_cancel(cancel) {
  validateOcrConfig(m_config);
  m_config.dpi = std::max(m_config.dpi, kMinimumOcrDpi);
}

std::vector<TextRun> OcrDetector::recognizePage(int pageIndex) {
  throwIfCancelled(m_cancel);

  if (!m_engine.isAvailable()) {
    throw CapabilityUnavailable("OCR", m_engine.unavailableReason());
  }

  PageFrame frame = m_pages.pageFrame(pageIndex);
  cv::Mat image = m_pages.rasterize(pageIndex, m_config.dpi);

  OcrResult result = m_engine.recognize(image, m_config.pageTimeoutMs, m_cancel);
  if (result.cancelled) {
    throw OperationCancelled();
  }
  if (!result.success) {
    throw PageProcessingError(pageIndex, result.errorMessage);
  }

  std::vector<TextRun> runs;
  for (const auto &word : result.words) {
    if (word.confidence < m_config.confidenceThreshold) {
      continue;
    }
    TextRun run;
    run.text = word.text;
    run.box = pixelRectToPdf(word.box, m_config.dpi, frame);
    run.spaceAfter = true;
    run.confidence = word.confidence;
    runs.push_back(std::move(run));
  }
  return runs;
}

PageDetection OcrDetector::detectPage(int pageIndex,
                                      const TextMatcher &matcher) {
  std::vector<TextRun> runs = recognizePage(pageIndex);
  if (runs.empty() || matcher.empty()) {
    return PageDetection{};
  }

  NormalizedText text = NormalizedText::fromRuns(runs);
  return boxesForMatches(pageIndex, runs, text,
                         findOnPage(pageIndex, matcher, text), true);
}

} // namespace redact
