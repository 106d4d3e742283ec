#ifndef REDACT_BOX_DETECTOR_HPP
#define REDACT_BOX_DETECTOR_HPP

#include "BoxModel.hpp"
#include "TextMatcher.hpp"

#include <vector>

namespace redact {

/**
 * @brief Boxes found on one page and the number of matches behind them
 *
 * A match that wraps across lines yields one box per line, so `matches`
 * can be smaller than `boxes.size()`.
 */
struct PageDetection {
  std::vector<RedactionBox> boxes;
  int matches = 0;
};

/**
 * @brief Common interface of the text-layer and OCR detectors
 */
class BoxDetector {
public:
  virtual ~BoxDetector() = default;

  virtual const char *name() const = 0;

  /**
   * @brief Find every occurrence of the matcher's terms and patterns
   * @throws PageProcessingError if the page cannot be processed
   * @throws CapabilityUnavailable if a required collaborator is missing
   */
  virtual PageDetection detectPage(int pageIndex,
                                   const TextMatcher &matcher) = 0;
};

/**
 * @brief TextMatcher::findAll for one page
 * @throws PageProcessingError if the regex engine gives up on the page text
 */
std::vector<TextMatch> findOnPage(int pageIndex, const TextMatcher &matcher,
                                  const NormalizedText &text);

/**
 * @brief Turn matches over runs into per-line boxes
 *
 * Fully covered runs (or runs without glyph boxes) contribute their run box;
 * partially covered runs contribute the union of the covered glyph boxes.
 */
PageDetection boxesForMatches(int pageIndex, const std::vector<TextRun> &runs,
                              const NormalizedText &text,
                              const std::vector<TextMatch> &matches,
                              bool fromOcr);

} // namespace redact

#endif // REDACT_BOX_DETECTOR_HPP
