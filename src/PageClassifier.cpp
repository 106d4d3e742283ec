#include "PageClassifier.hpp"

#include "Log.hpp"

#include <algorithm>

namespace redact {

const char *toString(PageKind kind) {
  switch (kind) {
  case PageKind::Text:
    return "text";
  case PageKind::Scanned:
    return "scanned";
  case PageKind::Mixed:
    return "mixed";
  }
  return "unknown";
}

PageClassifier::PageClassifier(const PageSource &pages,
                               const ClassifierConfig &config)
    : m_pages(pages), m_config(config) {}

PageClassification PageClassifier::classify(int pageIndex) const {
  PageClassification result;
  result.pageIndex = pageIndex;

  try {
    PageFrame frame = m_pages.pageFrame(pageIndex);
    double pageArea = frame.cropBox.area();
    std::vector<TextRun> runs = m_pages.textRuns(pageIndex);

    std::vector<Rect> boxes;
    int charsWithoutGeometry = 0;
    for (const auto &run : runs) {
      int chars = 0;
      for (char c : run.text) {
        // Count code points that are not whitespace
        bool continuation = (static_cast<unsigned char>(c) & 0xC0) == 0x80;
        if (!continuation && c != ' ' && c != '\t' && c != '\n' &&
            c != '\r') {
          ++chars;
        }
      }
      result.charCount += chars;
      if (run.box.isEmpty()) {
        charsWithoutGeometry += chars;
      } else {
        boxes.push_back(run.box.clippedTo(frame.cropBox));
      }
    }

    if (pageArea > 0.0) {
      double covered =
          unionArea(boxes) + charsWithoutGeometry * m_config.averageGlyphArea;
      result.textCoverageRatio = std::min(1.0, covered / pageArea);
    }
    result.imageCoverageRatio = m_pages.imageCoverage(pageIndex);

    if (result.charCount < m_config.minTextChars ||
        result.textCoverageRatio < m_config.thresholdLow) {
      result.kind = PageKind::Scanned;
    } else if (result.textCoverageRatio > m_config.thresholdHigh) {
      result.kind = result.imageCoverageRatio > m_config.imageCoverageForMixed
                        ? PageKind::Mixed
                        : PageKind::Text;
    } else {
      result.kind = PageKind::Mixed;
    }
  } catch (const std::exception &e) {
    debugLog() << "DEBUG: Classification failed for page " << (pageIndex + 1)
              << ": " << e.what() << std::endl;
    result.kind = PageKind::Mixed;
    result.error = e.what();
  }

  return result;
}

std::vector<PageClassification>
PageClassifier::classifyAll(const CancellationToken *cancel) const {
  std::vector<PageClassification> results;
  int pageCount = m_pages.pageCount();
  for (int pageIndex = 0; pageIndex < pageCount; ++pageIndex) {
    throwIfCancelled(cancel);
    results.push_back(classify(pageIndex));
  }
  return results;
}

} // namespace redact
