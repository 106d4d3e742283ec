#ifndef REDACT_REDACTION_APPLIER_HPP
#define REDACT_REDACTION_APPLIER_HPP

#include "BoxModel.hpp"
#include "Document.hpp"
#include "PageClassifier.hpp"

#include <string>
#include <vector>

namespace redact {

/**
 * @brief Opaque RGB fill colour, components in 0..1
 */
struct FillColor {
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;

  /**
   * @brief Parse a named colour (black, white, red, ...) or #rrggbb
   * @throws ValidationError if the text is neither
   */
  static FillColor parse(const std::string &text);
};

/**
 * @brief Which pages with OCR boxes are replaced by a redacted raster
 *
 * Pages where a box covers a kept image are rasterized under either policy.
 */
enum class RasterPolicy {
  ScannedOnly, ///< Only pages classified as scanned
  OcrPages     ///< Scanned and mixed pages
};

struct ApplyConfig {
  FillColor fill;                    ///< Colour of the drawn boxes
  double glyphOverlapThreshold = 0.25;
  bool removeIntersectingImages = false;
  RasterPolicy rasterPolicy = RasterPolicy::OcrPages;
  double rasterDpi = 300.0;
};

struct PageApplyStats {
  int pageIndex = 0;
  int boxesApplied = 0;  ///< Boxes left after clipping to the media box
  int glyphsRemoved = 0;
  int imagesRemoved = 0;
  int appearancesEdited = 0;
  bool rasterized = false;
  bool imageCovered = false; ///< A box lay over an image that was kept
};

struct ApplyResult {
  Document document;
  std::vector<PageApplyStats> pages;
};

/**
 * @brief Removes boxed content from a document for good
 *
 * Glyphs under the boxes are deleted from the content streams, an opaque
 * rectangle is painted over each box, and pages whose redacted pixels live
 * in an image (OCR boxes, or any box over a kept image) are replaced by a
 * new image. The output is a full rewrite of the document.
 */
class RedactionApplier {
public:
  explicit RedactionApplier(const ApplyConfig &config = ApplyConfig());

  /**
   * @brief Apply boxes to a document
   * @param classifications Page kinds used by the raster policy; pages
   *        missing here count as mixed
   * @throws InputError if the document cannot be opened
   * @throws ValidationError if a box refers to a page that does not exist
   * @throws PageProcessingError if a page to be rasterized cannot be rendered
   */
  ApplyResult apply(const Document &document, const PageBoxMap &boxes,
                    const std::vector<PageClassification> &classifications =
                        std::vector<PageClassification>()) const;

  const ApplyConfig &config() const { return m_config; }

private:
  ApplyConfig m_config;
};

} // namespace redact

#endif // REDACT_REDACTION_APPLIER_HPP
