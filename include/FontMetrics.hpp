#ifndef REDACT_FONT_METRICS_HPP
#define REDACT_FONT_METRICS_HPP

#include <qpdf/QPDFObjectHandle.hh>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief Advance widths and vertical extent of one PDF font
 *
 * Widths are in thousandths of text space units per unit font size, the
 * unit of the /Widths array and of TJ adjustments.
 */
class FontMetrics {
public:
  FontMetrics();

  /// Metrics read from a font dictionary; unknown fonts get Helvetica-like
  /// defaults
  static FontMetrics fromFont(QPDFObjectHandle font);

  /// Metrics of a standard 14 font by name (subset prefix tolerated)
  static FontMetrics standard(const std::string &baseFont);

  /// Width of a standard 14 font glyph for a single-byte code, if known
  static std::optional<int> standardWidth(const std::string &baseFont,
                                          unsigned int code);

  /// Composite fonts use two-byte codes
  bool isTwoByte() const { return m_twoByte; }

  double width(unsigned int code) const;
  double ascent() const { return m_ascent; }
  double descent() const { return m_descent; }

private:
  void readDescriptor(QPDFObjectHandle descriptor);
  void readCidWidths(QPDFObjectHandle widths);

  bool m_twoByte;
  std::string m_standardName; ///< Standard 14 table used for missing widths
  unsigned int m_firstChar;
  std::vector<double> m_widths;
  std::map<unsigned int, double> m_cidWidths;
  double m_defaultWidth; ///< /DW of a composite font
  double m_missingWidth;
  bool m_hasMissingWidth;
  double m_scale; ///< Type 3 FontMatrix scale relative to 1/1000
  double m_ascent;
  double m_descent;
};

} // namespace redact

#endif // REDACT_FONT_METRICS_HPP
