#include "BoxDetector.hpp"

#include "Errors.hpp"

#include <algorithm>

namespace redact {

std::vector<TextMatch> findOnPage(int pageIndex, const TextMatcher &matcher,
                                  const NormalizedText &text) {
  try {
    return matcher.findAll(text);
  } catch (const std::regex_error &e) {
    throw PageProcessingError(pageIndex,
                              std::string("pattern search failed: ") +
                                  e.what());
  }
}

PageDetection boxesForMatches(int pageIndex, const std::vector<TextRun> &runs,
                              const NormalizedText &text,
                              const std::vector<TextMatch> &matches,
                              bool fromOcr) {
  PageDetection detection;

  for (const auto &match : matches) {
    std::vector<Rect> pieces;
    std::optional<double> confidence;

    for (const auto &entry : text.glyphsInRange(match.begin, match.end)) {
      const TextRun &run = runs[entry.first];
      const std::vector<std::size_t> &glyphs = entry.second;

      if (fromOcr || run.glyphBoxes.empty() ||
          glyphs.size() >= run.glyphBoxes.size()) {
        pieces.push_back(run.box);
      } else {
        Rect covered;
        bool first = true;
        for (std::size_t glyph : glyphs) {
          if (glyph >= run.glyphBoxes.size()) {
            continue;
          }
          const Rect &g = run.glyphBoxes[glyph];
          covered = first ? g
                          : Rect(std::min(covered.x0, g.x0),
                                 std::min(covered.y0, g.y0),
                                 std::max(covered.x1, g.x1),
                                 std::max(covered.y1, g.y1));
          first = false;
        }
        pieces.push_back(first ? run.box : covered);
      }

      if (run.confidence) {
        confidence = confidence ? std::min(*confidence, *run.confidence)
                                : *run.confidence;
      }
    }

    if (pieces.empty()) {
      continue;
    }

    ++detection.matches;
    for (const auto &rect : mergeByLine(pieces)) {
      RedactionBox box;
      box.pageIndex = pageIndex;
      box.rect = rect;
      box.source = fromOcr ? BoxSource::Ocr : match.source;
      box.matchedText = match.matchedText;
      box.rule = match.rule;
      if (fromOcr) {
        box.confidence = confidence;
      }
      detection.boxes.push_back(std::move(box));
    }
  }

  return detection;
}

} // namespace redact
