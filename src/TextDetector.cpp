#include "TextDetector.hpp"

namespace redact {

TextDetector::TextDetector(const PageSource &pages) : m_pages(pages) {}

PageDetection TextDetector::detectPage(int pageIndex,
                                       const TextMatcher &matcher) {
  std::vector<TextRun> runs = m_pages.textRuns(pageIndex);
  if (runs.empty() || matcher.empty()) {
    return PageDetection{};
  }

  NormalizedText text = NormalizedText::fromRuns(runs);
  std::vector<TextMatch> matches = findOnPage(pageIndex, matcher, text);
  return boxesForMatches(pageIndex, runs, text, matches, false);
}

PageBoxMap TextDetector::detect(const TextMatcher &matcher,
                                const std::vector<int> &pages) {
  PageBoxMap boxes;
  for (int pageIndex : pages) {
    PageDetection detection = detectPage(pageIndex, matcher);
    if (!detection.boxes.empty()) {
      boxes[pageIndex] = std::move(detection.boxes);
    }
  }
  return boxes;
}

PageBoxMap TextDetector::detectAll(const TextMatcher &matcher) {
  std::vector<int> pages;
  for (int i = 0; i < m_pages.pageCount(); ++i) {
    pages.push_back(i);
  }
  return detect(matcher, pages);
}

PageBoxMap TextDetector::findExact(const std::string &term,
                                   bool caseSensitive) {
  MatchCriteria criteria;
  criteria.terms.push_back(term);
  criteria.caseSensitive = caseSensitive;
  return detectAll(TextMatcher(criteria));
}

PageBoxMap TextDetector::findRegex(const std::string &pattern,
                                   bool ignoreCase) {
  MatchCriteria criteria;
  criteria.patterns.push_back(pattern);
  criteria.regexIgnoreCase = ignoreCase;
  return detectAll(TextMatcher(criteria));
}

} // namespace redact
