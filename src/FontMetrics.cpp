#include "FontMetrics.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace redact {

namespace {

// Advance widths of the printable ASCII range (codes 32..126) from the
// standard 14 font metrics, WinAnsi encoding
using WidthTable = std::array<int, 95>;

const WidthTable kHelvetica = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333,
    278, 278, 556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278,
    584, 584, 584, 556, 1015, 667, 667, 722, 722, 667, 611, 778, 722, 278,
    500, 667, 556, 833, 722, 778, 667, 778, 722, 667, 611, 722, 667, 944,
    667, 667, 611, 278, 278, 278, 469, 556, 333, 556, 556, 500, 556, 556,
    278, 556, 556, 222, 222, 500, 222, 833, 556, 556, 556, 556, 333, 500,
    278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584};

const WidthTable kHelveticaBold = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333,
    278, 278, 556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333,
    584, 584, 584, 611, 975, 722, 722, 722, 722, 667, 611, 778, 722, 278,
    556, 722, 611, 833, 722, 778, 667, 778, 722, 667, 611, 722, 667, 944,
    667, 667, 611, 333, 278, 333, 584, 556, 333, 556, 611, 556, 611, 556,
    333, 611, 611, 278, 278, 556, 278, 889, 611, 611, 611, 611, 389, 556,
    333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584};

const WidthTable kTimesRoman = {
    250, 333, 408, 500, 500, 833, 778, 180, 333, 333, 500, 564, 250, 333,
    250, 278, 500, 500, 500, 500, 500, 500, 500, 500, 500, 500, 278, 278,
    564, 564, 564, 444, 921, 722, 667, 667, 722, 611, 556, 722, 722, 333,
    389, 722, 611, 889, 722, 722, 556, 722, 667, 556, 611, 722, 722, 944,
    722, 722, 611, 333, 278, 333, 469, 500, 333, 444, 500, 444, 500, 444,
    333, 500, 500, 278, 278, 500, 278, 778, 500, 500, 500, 500, 333, 389,
    278, 500, 500, 722, 500, 500, 444, 480, 200, 480, 541};

const WidthTable kTimesBold = {
    250, 333, 555, 500, 500, 1000, 833, 278, 333, 333, 500, 570, 250, 333,
    250, 278, 500, 500, 500, 500, 500, 500, 500, 500, 500, 500, 333, 333,
    570, 570, 570, 500, 930, 722, 667, 722, 722, 667, 611, 778, 778, 389,
    500, 778, 667, 944, 722, 778, 611, 778, 722, 556, 667, 722, 722, 1000,
    722, 722, 667, 333, 278, 333, 581, 500, 333, 500, 556, 444, 556, 444,
    333, 500, 556, 278, 333, 556, 278, 833, 556, 500, 556, 556, 444, 389,
    333, 556, 500, 722, 500, 500, 444, 394, 220, 394, 520};

std::string stripSubsetPrefix(const std::string &name) {
  // Subset fonts are named like ABCDEF+Helvetica
  if (name.size() > 7 && name[6] == '+' &&
      std::all_of(name.begin(), name.begin() + 6,
                  [](char c) { return c >= 'A' && c <= 'Z'; })) {
    return name.substr(7);
  }
  return name;
}

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

// Pick the width table of a standard font family; nullptr if unknown
const WidthTable *tableFor(const std::string &baseFont, bool &monospaced) {
  std::string name = lowercase(stripSubsetPrefix(baseFont));
  bool bold = name.find("bold") != std::string::npos ||
              name.find("black") != std::string::npos ||
              name.find("heavy") != std::string::npos;
  monospaced = false;

  if (name.find("courier") != std::string::npos) {
    monospaced = true;
    return &kHelvetica;
  }
  if (name.find("times") != std::string::npos) {
    return bold ? &kTimesBold : &kTimesRoman;
  }
  if (name.find("helvetica") != std::string::npos ||
      name.find("arial") != std::string::npos) {
    return bold ? &kHelveticaBold : &kHelvetica;
  }
  return nullptr;
}

std::string nameWithoutSlash(QPDFObjectHandle name) {
  if (!name.isName()) {
    return "";
  }
  std::string text = name.getName();
  return text.empty() ? text : text.substr(1);
}

double numberOr(QPDFObjectHandle value, double fallback) {
  return value.isNumber() ? value.getNumericValue() : fallback;
}

} // anonymous namespace

FontMetrics::FontMetrics()
    : m_twoByte(false), m_standardName("Helvetica"), m_firstChar(0),
      m_defaultWidth(1000.0), m_missingWidth(0.0), m_hasMissingWidth(false),
      m_scale(1.0), m_ascent(750.0), m_descent(-250.0) {}

std::optional<int> FontMetrics::standardWidth(const std::string &baseFont,
                                              unsigned int code) {
  bool monospaced = false;
  const WidthTable *table = tableFor(baseFont, monospaced);
  if (table == nullptr) {
    return std::nullopt;
  }
  if (monospaced) {
    return 600;
  }
  if (code < 32 || code > 126) {
    return std::nullopt;
  }
  return (*table)[code - 32];
}

FontMetrics FontMetrics::standard(const std::string &baseFont) {
  FontMetrics metrics;
  metrics.m_standardName = baseFont;
  return metrics;
}

FontMetrics FontMetrics::fromFont(QPDFObjectHandle font) {
  FontMetrics metrics;
  if (!font.isDictionary()) {
    return metrics;
  }

  std::string subtype = nameWithoutSlash(font.getKey("/Subtype"));
  std::string baseFont = nameWithoutSlash(font.getKey("/BaseFont"));

  if (subtype == "Type0") {
    metrics.m_twoByte = true;
    QPDFObjectHandle descendants = font.getKey("/DescendantFonts");
    if (descendants.isArray() && descendants.getArrayNItems() > 0) {
      QPDFObjectHandle cidFont = descendants.getArrayItem(0);
      if (cidFont.isDictionary()) {
        metrics.m_defaultWidth = numberOr(cidFont.getKey("/DW"), 1000.0);
        metrics.readCidWidths(cidFont.getKey("/W"));
        metrics.readDescriptor(cidFont.getKey("/FontDescriptor"));
      }
    }
    return metrics;
  }

  if (standardWidth(baseFont, 'A')) {
    metrics.m_standardName = baseFont;
  }

  QPDFObjectHandle firstChar = font.getKey("/FirstChar");
  if (firstChar.isInteger() && firstChar.getIntValue() >= 0) {
    metrics.m_firstChar = static_cast<unsigned int>(firstChar.getIntValue());
  }
  QPDFObjectHandle widths = font.getKey("/Widths");
  if (widths.isArray()) {
    int count = widths.getArrayNItems();
    for (int i = 0; i < count; ++i) {
      metrics.m_widths.push_back(numberOr(widths.getArrayItem(i), 0.0));
    }
  }

  if (subtype == "Type3") {
    // Type 3 glyph space is mapped by FontMatrix rather than 1/1000
    QPDFObjectHandle matrix = font.getKey("/FontMatrix");
    if (matrix.isArray() && matrix.getArrayNItems() >= 1) {
      double a = numberOr(matrix.getArrayItem(0), 0.001);
      if (a != 0.0) {
        metrics.m_scale = a * 1000.0;
      }
    }
  }

  metrics.readDescriptor(font.getKey("/FontDescriptor"));
  return metrics;
}

void FontMetrics::readDescriptor(QPDFObjectHandle descriptor) {
  if (!descriptor.isDictionary()) {
    return;
  }
  QPDFObjectHandle missing = descriptor.getKey("/MissingWidth");
  if (missing.isNumber()) {
    m_missingWidth = missing.getNumericValue();
    m_hasMissingWidth = true;
  }
  double ascent = numberOr(descriptor.getKey("/Ascent"), 0.0);
  double descent = numberOr(descriptor.getKey("/Descent"), 0.0);
  if (ascent > 0.0) {
    m_ascent = ascent;
  }
  if (descent < 0.0) {
    m_descent = descent;
  }
}

void FontMetrics::readCidWidths(QPDFObjectHandle widths) {
  if (!widths.isArray()) {
    return;
  }
  int count = widths.getArrayNItems();
  int i = 0;
  while (i + 1 < count) {
    QPDFObjectHandle first = widths.getArrayItem(i);
    QPDFObjectHandle next = widths.getArrayItem(i + 1);
    if (!first.isInteger()) {
      break;
    }
    long long start = first.getIntValue();
    if (next.isArray()) {
      // c [w1 w2 ...]
      int n = next.getArrayNItems();
      for (int k = 0; k < n; ++k) {
        m_cidWidths[static_cast<unsigned int>(start + k)] =
            numberOr(next.getArrayItem(k), m_defaultWidth);
      }
      i += 2;
    } else if (next.isInteger() && i + 2 < count) {
      // c_first c_last w
      long long last = next.getIntValue();
      double w = numberOr(widths.getArrayItem(i + 2), m_defaultWidth);
      if (last >= start && last - start <= 0xFFFF) {
        for (long long c = start; c <= last; ++c) {
          m_cidWidths[static_cast<unsigned int>(c)] = w;
        }
      }
      i += 3;
    } else {
      break;
    }
  }
}

double FontMetrics::width(unsigned int code) const {
  if (m_twoByte) {
    auto it = m_cidWidths.find(code);
    return it != m_cidWidths.end() ? it->second : m_defaultWidth;
  }

  if (code >= m_firstChar && code - m_firstChar < m_widths.size()) {
    return m_widths[code - m_firstChar] * m_scale;
  }
  if (m_hasMissingWidth) {
    return m_missingWidth * m_scale;
  }
  if (!m_widths.empty()) {
    return 0.0;
  }
  std::optional<int> standardValue = standardWidth(m_standardName, code);
  return standardValue ? static_cast<double>(*standardValue) : 500.0;
}

} // namespace redact
