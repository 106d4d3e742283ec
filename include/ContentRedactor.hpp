#ifndef REDACT_CONTENT_REDACTOR_HPP
#define REDACT_CONTENT_REDACTOR_HPP

#include "BoxModel.hpp"

#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <string>
#include <vector>

namespace redact {

/**
 * @brief Affine transform [a b c d e f] in PDF row-vector convention
 */
struct Matrix {
  double a = 1.0;
  double b = 0.0;
  double c = 0.0;
  double d = 1.0;
  double e = 0.0;
  double f = 0.0;

  /// Apply this transform, then `other`
  Matrix then(const Matrix &other) const;

  /// Bounding box of a rectangle after transformation
  Rect transform(const Rect &rect) const;

  static Matrix translation(double tx, double ty);

  /// Matrix from a six-number array object; identity if malformed
  static Matrix fromArray(QPDFObjectHandle array);
};

struct ContentRedactorOptions {
  double glyphOverlapThreshold = 0.25; ///< Share of glyph area to remove it
  bool removeIntersectingImages = false;
};

struct ContentRedactionStats {
  int glyphsRemoved = 0;
  int showOperatorsRewritten = 0;
  int imagesRemoved = 0;
  int imagesCovered = 0; ///< Images under a box that were kept
  int formsCopied = 0;
  int markedContentStripped = 0; ///< /ActualText, /Alt, /E entries removed

  ContentRedactionStats &operator+=(const ContentRedactionStats &other);
};

/**
 * @brief Result of filtering one page
 */
struct PageContentRewrite {
  std::string content;    ///< Decoded replacement content for the page
  int unbalancedSaves = 0; ///< `q` left open at the end of `content`
  bool changed = false;    ///< Anything at all was removed
  ContentRedactionStats stats;
};

/**
 * @brief Removes glyphs and images under redaction boxes from content streams
 *
 * Works at the token level: every operator that does not touch a box is
 * written back byte for byte. Text showing operators that lose glyphs are
 * rewritten as TJ with kerning that keeps the remaining glyphs in place.
 * Form XObjects and annotation appearances drawn over a box are copied
 * before editing, so other users of the same object are unaffected.
 */
class ContentRedactor {
public:
  explicit ContentRedactor(
      const ContentRedactorOptions &options = ContentRedactorOptions());

  /**
   * @brief Filter a page against boxes in user space
   *
   * Resources of the page are replaced by private copies when forms change.
   * The caller installs the returned content.
   */
  PageContentRewrite redactPage(QPDFPageObjectHelper &page,
                                const std::vector<Rect> &boxes);

  /**
   * @brief Filter annotation appearance streams of a page
   * @return number of appearance streams replaced
   */
  int redactAnnotations(QPDFPageObjectHelper &page,
                        const std::vector<Rect> &boxes,
                        ContentRedactionStats &stats);

private:
  ContentRedactorOptions m_options;
};

} // namespace redact

#endif // REDACT_CONTENT_REDACTOR_HPP
