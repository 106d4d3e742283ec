#ifndef REDACT_BOX_MODEL_HPP
#define REDACT_BOX_MODEL_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief Axis-aligned rectangle in PDF points (bottom-left origin)
 *
 * A well-formed rectangle has x0 < x1 and y0 < y1. Operations that can
 * produce an empty result (intersection, clipping) return a rectangle for
 * which isEmpty() is true.
 */
struct Rect {
  double x0 = 0.0; ///< Left edge
  double y0 = 0.0; ///< Bottom edge
  double x1 = 0.0; ///< Right edge
  double y1 = 0.0; ///< Top edge

  Rect() = default;
  Rect(double left, double bottom, double right, double top)
      : x0(left), y0(bottom), x1(right), y1(top) {}

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }
  double area() const { return isEmpty() ? 0.0 : width() * height(); }
  bool isEmpty() const { return !(x0 < x1) || !(y0 < y1); }

  Rect intersection(const Rect &other) const;
  Rect united(const Rect &other) const;
  bool intersects(const Rect &other) const;
  bool contains(const Rect &other) const;
  Rect clippedTo(const Rect &bounds) const;

  bool operator==(const Rect &other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 &&
           y1 == other.y1;
  }
  bool operator!=(const Rect &other) const { return !(*this == other); }
};

/**
 * @brief Area of the union of a set of rectangles (overlaps counted once)
 */
double unionArea(const std::vector<Rect> &rects);

/**
 * @brief Integer rectangle in raster pixels (top-left origin)
 */
struct PixelRect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

/**
 * @brief Geometry of one page as it is displayed
 *
 * User space is the unrotated PDF coordinate system. Display space is the
 * page as a viewer shows it: rotated clockwise by `rotation`, origin at the
 * top-left corner of the crop box, y growing downwards, in points.
 */
struct PageFrame {
  Rect mediaBox;    ///< Media box in user space
  Rect cropBox;     ///< Crop box in user space
  int rotation = 0; ///< Page /Rotate normalised to 0, 90, 180 or 270

  double displayWidth() const;
  double displayHeight() const;

  /// Map a display-space rectangle (left, top, right, bottom) to user space
  Rect displayToUser(double left, double top, double right,
                     double bottom) const;

  /// Map a user-space rectangle to display space as (left, top, right,
  /// bottom) packed into a Rect (x0=left, y0=top, x1=right, y1=bottom)
  Rect userToDisplay(const Rect &rect) const;
};

/// Normalise any multiple of 90 (including negatives) to 0, 90, 180 or 270
int normalizeRotation(int degrees);

/**
 * @brief Convert an OCR pixel rectangle to a user-space rectangle
 *
 * Scales by 72/dpi, flips against the displayed page height, undoes the
 * page rotation and offsets by the crop box origin. Every OCR box goes
 * through this function.
 */
Rect pixelRectToPdf(const PixelRect &pixelRect, double dpi,
                    const PageFrame &frame);

/**
 * @brief Inverse of pixelRectToPdf, rounded outwards to whole pixels
 */
PixelRect pdfRectToPixel(const Rect &rect, double dpi, const PageFrame &frame);

/**
 * @brief Where a redaction box came from
 */
enum class BoxSource {
  ExactTerm, ///< Verbatim term found in the text layer
  Regex,     ///< Pattern match in the text layer
  Ocr,       ///< Term or pattern found by OCR on a rendered page
  Manual     ///< Caller-supplied rectangle
};

const char *toString(BoxSource source);

/**
 * @brief A region of one page that must be removed
 */
struct RedactionBox {
  int pageIndex = 0;                ///< 0-based page index
  Rect rect;                        ///< Region in user space
  BoxSource source = BoxSource::Manual;
  std::optional<std::string> matchedText; ///< Text that triggered the box
  std::optional<double> confidence;       ///< OCR confidence (0-100)
  std::string rule; ///< Term or pattern that produced the box (empty: manual)
};

/// Boxes per 0-based page index
using PageBoxMap = std::map<int, std::vector<RedactionBox>>;

/// Append every box of `from` into `into`, keyed by page
void mergeBoxes(PageBoxMap &into, const PageBoxMap &from);

/// Total number of boxes in the map
std::size_t countBoxes(const PageBoxMap &boxes);

/**
 * @brief One run of text (usually a word) as reported by a text source
 *
 * `glyphBoxes` holds one rectangle per code point of `text` when the
 * source can provide them, and is empty otherwise.
 */
struct TextRun {
  std::string text;            ///< UTF-8 text
  Rect box;                    ///< Run bounds in user space
  std::vector<Rect> glyphBoxes;
  bool spaceAfter = false;     ///< Source reported a space after the run
  std::optional<double> confidence;
};

/// True when two runs sit on the same text line (vertical overlap of at
/// least half of the smaller height)
bool onSameLine(const Rect &a, const Rect &b);

/**
 * @brief Merge rectangles that sit on the same line into one per line
 *
 * Input order is preserved: a rectangle joins the current group when it is
 * on the same line as the group, otherwise it starts a new group.
 */
std::vector<Rect> mergeByLine(const std::vector<Rect> &rects);

} // namespace redact

#endif // REDACT_BOX_MODEL_HPP
