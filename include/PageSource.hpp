#ifndef REDACT_PAGE_SOURCE_HPP
#define REDACT_PAGE_SOURCE_HPP

#include "BoxModel.hpp"
#include "Document.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <vector>

namespace poppler {
class document;
}
class PDFDoc;
class GlobalParamsIniter;

namespace redact {

/**
 * @brief Read-side view of a document, one page at a time
 *
 * Page indices are 0-based. Every rectangle is in user space.
 */
class PageSource {
public:
  virtual ~PageSource() = default;

  virtual int pageCount() const = 0;

  virtual PageFrame pageFrame(int pageIndex) const = 0;

  /// Text runs in reading order
  virtual std::vector<TextRun> textRuns(int pageIndex) const = 0;

  /**
   * @brief Render the page as displayed (rotation applied) to a BGR image
   * @throws PageProcessingError if rendering fails
   */
  virtual cv::Mat rasterize(int pageIndex, double dpi) const = 0;

  /// Fraction of the page area covered by drawn images (0..1)
  virtual double imageCoverage(int pageIndex) const = 0;
};

/**
 * @brief PageSource backed by Poppler
 *
 * Text and rendering use the poppler-cpp wrapper; image coverage is measured
 * by replaying the page through a Poppler core OutputDev. The source keeps a
 * reference to the document bytes for its whole lifetime.
 */
class PopplerPageSource : public PageSource {
public:
  /**
   * @brief Open a document
   * @throws InputError if the document is corrupt or locked
   */
  static std::unique_ptr<PopplerPageSource> open(const Document &document);

  ~PopplerPageSource() override;

  PopplerPageSource(const PopplerPageSource &) = delete;
  PopplerPageSource &operator=(const PopplerPageSource &) = delete;

  int pageCount() const override;
  PageFrame pageFrame(int pageIndex) const override;
  std::vector<TextRun> textRuns(int pageIndex) const override;
  cv::Mat rasterize(int pageIndex, double dpi) const override;
  double imageCoverage(int pageIndex) const override;

  /// Concatenated page text (runs joined the way the matcher joins them)
  std::string pageText(int pageIndex) const;

private:
  explicit PopplerPageSource(const Document &document);

  PDFDoc &coreDocument() const;

  Document m_document;
  std::unique_ptr<poppler::document> m_popplerDocument;
  mutable std::unique_ptr<GlobalParamsIniter> m_globalParams;
  mutable std::unique_ptr<PDFDoc> m_coreDocument;
};

} // namespace redact

#endif // REDACT_PAGE_SOURCE_HPP
