#ifndef REDACT_TEXT_DETECTOR_HPP
#define REDACT_TEXT_DETECTOR_HPP

#include "BoxDetector.hpp"
#include "PageSource.hpp"

#include <string>
#include <vector>

namespace redact {

/**
 * @brief Finds terms and patterns in the text layer of a document
 */
class TextDetector : public BoxDetector {
public:
  explicit TextDetector(const PageSource &pages);

  const char *name() const override { return "text"; }

  PageDetection detectPage(int pageIndex, const TextMatcher &matcher) override;

  /**
   * @brief Every occurrence of `term` on every page
   */
  PageBoxMap findExact(const std::string &term, bool caseSensitive = false);

  /**
   * @brief Every match of `pattern` on every page
   * @throws PatternError if the pattern does not compile
   */
  PageBoxMap findRegex(const std::string &pattern, bool ignoreCase = true);

  /**
   * @brief Run all of the matcher's rules over the given pages
   */
  PageBoxMap detect(const TextMatcher &matcher, const std::vector<int> &pages);

private:
  PageBoxMap detectAll(const TextMatcher &matcher);

  const PageSource &m_pages;
};

} // namespace redact

#endif // REDACT_TEXT_DETECTOR_HPP
