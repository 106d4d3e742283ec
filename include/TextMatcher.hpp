#ifndef REDACT_TEXT_MATCHER_HPP
#define REDACT_TEXT_MATCHER_HPP

#include "BoxModel.hpp"

#include <cstddef>
#include <map>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace redact {

/**
 * @brief What to look for: verbatim terms and regular expressions
 */
struct MatchCriteria {
  std::vector<std::string> terms;    ///< Exact terms
  std::vector<std::string> patterns; ///< ECMAScript regular expressions
  bool caseSensitive = false;        ///< Applies to exact terms
  bool regexIgnoreCase = true;       ///< Applies to patterns

  bool empty() const { return terms.empty() && patterns.empty(); }
};

/**
 * @brief Position of one byte of normalised text in the source runs
 */
struct GlyphRef {
  static constexpr std::size_t kSeparator = static_cast<std::size_t>(-1);

  std::size_t run = kSeparator; ///< Index of the run, kSeparator for inserted
                                ///< spaces
  std::size_t glyph = 0;        ///< Code point index inside the run
};

/**
 * @brief Whitespace-normalised page text with a map back to runs
 *
 * Runs of whitespace collapse to a single space, runs are joined with a
 * single space when the source reports a gap and with a newline when the
 * next run starts a new line, and leading and trailing whitespace is
 * dropped.
 */
class NormalizedText {
public:
  NormalizedText() = default;

  /// Build from runs in reading order
  static NormalizedText fromRuns(const std::vector<TextRun> &runs);

  /// Normalise a single string (used for search terms)
  static std::string normalize(const std::string &text);

  const std::string &text() const { return m_text; }
  const std::vector<GlyphRef> &origins() const { return m_origins; }

  /// Runs and glyphs covered by the byte range [begin, end)
  std::map<std::size_t, std::vector<std::size_t>>
  glyphsInRange(std::size_t begin, std::size_t end) const;

  /// Text around [begin, end), widened by `radius` bytes each side
  std::string context(std::size_t begin, std::size_t end,
                      std::size_t radius) const;

private:
  void appendRun(std::size_t runIndex, const std::string &text);
  void appendSeparator(char separator);

  std::string m_text;
  std::vector<GlyphRef> m_origins; ///< One entry per byte of m_text
};

/**
 * @brief One hit of a term or pattern in normalised text
 */
struct TextMatch {
  std::string rule;        ///< The term or pattern as given
  BoxSource source;        ///< ExactTerm or Regex
  std::size_t begin = 0;   ///< Byte offset into NormalizedText::text()
  std::size_t end = 0;     ///< One past the last byte
  std::string matchedText; ///< Text between begin and end
};

/**
 * @brief Compiled set of terms and patterns
 *
 * Construction validates every pattern, so a TextMatcher that exists can
 * always be applied.
 */
class TextMatcher {
public:
  /**
   * @throws PatternError for the first pattern that fails to compile
   */
  explicit TextMatcher(const MatchCriteria &criteria);

  const MatchCriteria &criteria() const { return m_criteria; }
  bool empty() const { return m_criteria.empty(); }

  /// All term hits followed by all pattern hits
  std::vector<TextMatch> findAll(const NormalizedText &text) const;

  /// Hits of the exact terms only
  std::vector<TextMatch> findTerms(const NormalizedText &text) const;

  /// Hits of the patterns only
  std::vector<TextMatch> findPatterns(const NormalizedText &text) const;

  /// Search raw bytes (not normalised) for the terms, case-insensitive
  /// when the criteria are; returns (term, offset) of the first hit per term
  std::vector<std::pair<std::string, std::size_t>>
  findTermsInBytes(const std::string &bytes) const;

  /// Regexes compiled from the patterns, in order
  const std::vector<std::regex> &regexes() const { return m_regexes; }

private:
  MatchCriteria m_criteria;
  std::vector<std::string> m_normalizedTerms;
  std::vector<std::regex> m_regexes;
};

/**
 * @brief Compile `pattern` or throw PatternError with a best-effort position
 */
std::regex compilePattern(const std::string &pattern, bool ignoreCase);

/**
 * @brief Unicode simple case folding of UTF-8 text
 *
 * The result has the same byte length as the input: code points whose
 * folded form encodes to a different length, and invalid bytes, are kept.
 */
std::string foldCase(const std::string &text);

/**
 * @brief Non-empty hits [begin, end) of `regex`, searched one line at a time
 *
 * Lines longer than the engine can safely take are searched in overlapping
 * windows.
 */
std::vector<std::pair<std::size_t, std::size_t>>
searchLines(const std::regex &regex, const std::string &text);

/**
 * @brief Built-in pattern for common personal data
 */
struct PiiPattern {
  std::string name;
  std::string pattern;
  std::string description;
};

/// All built-in patterns
const std::vector<PiiPattern> &piiPatterns();

/**
 * @brief Look up a built-in pattern by name
 * @throws PatternError if no such pattern exists
 */
const PiiPattern &piiPattern(const std::string &name);

} // namespace redact

#endif // REDACT_TEXT_MATCHER_HPP
