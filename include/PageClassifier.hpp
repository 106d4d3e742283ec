#ifndef REDACT_PAGE_CLASSIFIER_HPP
#define REDACT_PAGE_CLASSIFIER_HPP

#include "Cancellation.hpp"
#include "PageSource.hpp"

#include <optional>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief How a page carries its text
 */
enum class PageKind {
  Text,    ///< Real text layer; text detector only
  Scanned, ///< Raster only; OCR detector only
  Mixed    ///< Both detectors
};

const char *toString(PageKind kind);

/**
 * @brief Classification of one page
 */
struct PageClassification {
  int pageIndex = 0;
  PageKind kind = PageKind::Mixed;
  double textCoverageRatio = 0.0;  ///< Text run area / page area
  double imageCoverageRatio = 0.0; ///< Drawn image area / page area
  int charCount = 0;               ///< Non-space characters in the text layer
  std::optional<std::string> error; ///< Set when classification failed
};

/**
 * @brief Thresholds for the classifier
 */
struct ClassifierConfig {
  double thresholdLow = 0.02;  ///< Below: scanned
  double thresholdHigh = 0.20; ///< Above: text
  int minTextChars = 10;       ///< Fewer characters: scanned
  double imageCoverageForMixed = 0.5; ///< Text page with a bigger image: mixed
  double averageGlyphArea = 72.0;     ///< pt^2 per character without geometry
};

class PageClassifier {
public:
  explicit PageClassifier(const PageSource &pages,
                          const ClassifierConfig &config = ClassifierConfig());

  /**
   * @brief Classify one page
   *
   * Never throws for collaborator failures: the page is returned as Mixed
   * with `error` set.
   */
  PageClassification classify(int pageIndex) const;

  /**
   * @brief Classify every page
   * @throws OperationCancelled if the token fires between pages
   */
  std::vector<PageClassification>
  classifyAll(const CancellationToken *cancel = nullptr) const;

private:
  const PageSource &m_pages;
  ClassifierConfig m_config;
};

} // namespace redact

#endif // REDACT_PAGE_CLASSIFIER_HPP
