#include "TextMatcher.hpp"

#include "Errors.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <set>

namespace redact {

namespace {

// Number of bytes in the UTF-8 sequence starting with `lead`
std::size_t sequenceLength(unsigned char lead) {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 2;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  return 1;
}

bool isWhitespace(const std::string &text, std::size_t pos, std::size_t len) {
  unsigned char c = static_cast<unsigned char>(text[pos]);
  if (len == 1) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
  }
  unsigned char c1 = static_cast<unsigned char>(text[pos + 1]);
  if (len == 2) {
    return c == 0xC2 && c1 == 0xA0; // no-break space
  }
  if (len == 3) {
    unsigned char c2 = static_cast<unsigned char>(text[pos + 2]);
    // U+2000..U+200A, U+202F, U+3000
    if (c == 0xE2 && c1 == 0x80 && (c2 <= 0x8A || c2 == 0xAF)) {
      return true;
    }
    return c == 0xE3 && c1 == 0x80 && c2 == 0x80;
  }
  return false;
}

bool isContinuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool isBreak(char c) { return c == ' ' || c == '\n'; }

// Longest slice of one line handed to the regex engine at once. libstdc++
// matches recursively, so the stack use grows with the subject length.
constexpr std::size_t kPatternWindow = 2048;
// Windows overlap so a match that starts near a window end is seen whole
constexpr std::size_t kPatternOverlap = 256;

void searchLine(const std::regex &regex, const std::string &text,
                std::size_t begin, std::size_t end,
                std::vector<std::pair<std::size_t, std::size_t>> &hits) {
  std::size_t start = begin;
  while (start < end) {
    std::size_t stop = end;
    std::size_t next = end;
    if (end - start > kPatternWindow) {
      stop = start + kPatternWindow;
      while (isContinuation(text[stop])) {
        --stop;
      }
      next = stop - kPatternOverlap;
      std::size_t space = text.rfind(' ', stop - 1);
      if (space != std::string::npos && space >= next) {
        next = space + 1;
      }
      while (isContinuation(text[next])) {
        ++next;
      }
    }

    auto flags = std::regex_constants::match_default;
    if (start > begin) {
      flags |= std::regex_constants::match_prev_avail;
    }
    auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
    auto last = text.begin() + static_cast<std::ptrdiff_t>(stop);
    for (auto it = std::sregex_iterator(first, last, regex, flags);
         it != std::sregex_iterator(); ++it) {
      const std::smatch &m = *it;
      if (m.length(0) == 0) {
        continue;
      }
      std::size_t at = start + static_cast<std::size_t>(m.position(0));
      // Hits starting in the overlap belong to the next window
      if (stop < end && at >= next) {
        break;
      }
      hits.emplace_back(at, at + static_cast<std::size_t>(m.length(0)));
    }
    start = next;
  }
}

std::optional<std::size_t>
locatePatternError(const std::string &pattern,
                   std::regex_constants::error_type code) {
  std::vector<std::size_t> openParens;
  std::optional<std::size_t> openBracket;
  std::optional<std::size_t> lastBrace;
  bool escaped = false;

  for (std::size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (escaped) {
      escaped = false;
      continue;
    }
    if (c == '\\') {
      if (i + 1 == pattern.size() && code == std::regex_constants::error_escape) {
        return i;
      }
      escaped = true;
      continue;
    }
    if (openBracket) {
      if (c == ']' && i > *openBracket + 1) {
        openBracket.reset();
      }
      continue;
    }
    switch (c) {
    case '[':
      openBracket = i;
      break;
    case '(':
      openParens.push_back(i);
      break;
    case ')':
      if (openParens.empty()) {
        if (code == std::regex_constants::error_paren) {
          return i;
        }
      } else {
        openParens.pop_back();
      }
      break;
    case '{':
      lastBrace = i;
      break;
    case '*':
    case '+':
    case '?':
      if (code == std::regex_constants::error_badrepeat) {
        bool groupModifier = c == '?' && i > 0 && pattern[i - 1] == '(';
        if (!groupModifier &&
            (i == 0 || pattern[i - 1] == '(' || pattern[i - 1] == '|')) {
          return i;
        }
      }
      break;
    default:
      break;
    }
  }

  switch (code) {
  case std::regex_constants::error_brack:
    if (openBracket) {
      return *openBracket;
    }
    break;
  case std::regex_constants::error_paren:
    if (!openParens.empty()) {
      return openParens.back();
    }
    break;
  case std::regex_constants::error_brace:
  case std::regex_constants::error_badbrace:
    if (lastBrace) {
      return *lastBrace;
    }
    break;
  default:
    break;
  }
  return std::nullopt;
}

} // anonymous namespace

std::string foldCase(const std::string &text) {
  std::string folded = text;
  const auto *bytes = reinterpret_cast<const uint8_t *>(text.data());
  int32_t length = static_cast<int32_t>(text.size());
  int32_t pos = 0;
  while (pos < length) {
    int32_t start = pos;
    UChar32 c = 0;
    U8_NEXT(bytes, pos, length, c);
    if (c < 0x41) {
      continue;
    }
    UChar32 lower = u_foldCase(c, U_FOLD_CASE_DEFAULT);
    // Offsets into the folded text must stay valid for the original
    if (lower == c || U8_LENGTH(lower) != pos - start) {
      continue;
    }
    uint8_t encoded[U8_MAX_LENGTH];
    int32_t written = 0;
    U8_APPEND_UNSAFE(encoded, written, lower);
    for (int32_t k = 0; k < written; ++k) {
      folded[static_cast<std::size_t>(start + k)] =
          static_cast<char>(encoded[k]);
    }
  }
  return folded;
}

std::vector<std::pair<std::size_t, std::size_t>>
searchLines(const std::regex &regex, const std::string &text) {
  std::vector<std::pair<std::size_t, std::size_t>> hits;
  std::size_t begin = 0;
  while (begin <= text.size()) {
    std::size_t end = text.find('\n', begin);
    if (end == std::string::npos) {
      end = text.size();
    }
    if (end > begin) {
      searchLine(regex, text, begin, end, hits);
    }
    begin = end + 1;
  }
  return hits;
}

void NormalizedText::appendSeparator(char separator) {
  if (m_text.empty()) {
    return;
  }
  if (isBreak(m_text.back())) {
    if (separator == '\n') {
      m_text.back() = '\n';
    }
    return;
  }
  m_text.push_back(separator);
  m_origins.push_back(GlyphRef{});
}

void NormalizedText::appendRun(std::size_t runIndex, const std::string &text) {
  std::size_t glyph = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t len =
        std::min(sequenceLength(static_cast<unsigned char>(text[pos])),
                 text.size() - pos);
    if (isWhitespace(text, pos, len)) {
      if (!m_text.empty() && !isBreak(m_text.back())) {
        m_text.push_back(' ');
        m_origins.push_back(GlyphRef{runIndex, glyph});
      }
    } else {
      for (std::size_t k = 0; k < len; ++k) {
        m_text.push_back(text[pos + k]);
        m_origins.push_back(GlyphRef{runIndex, glyph});
      }
    }
    pos += len;
    ++glyph;
  }
}

NormalizedText NormalizedText::fromRuns(const std::vector<TextRun> &runs) {
  NormalizedText result;
  for (std::size_t i = 0; i < runs.size(); ++i) {
    result.appendRun(i, runs[i].text);
    if (i + 1 < runs.size()) {
      const Rect &current = runs[i].box;
      const Rect &next = runs[i + 1].box;
      bool lineBreak = current.height() > 0.0 && next.height() > 0.0 &&
                       !onSameLine(current, next);
      if (lineBreak) {
        result.appendSeparator('\n');
      } else if (runs[i].spaceAfter) {
        result.appendSeparator(' ');
      }
    }
  }
  while (!result.m_text.empty() && isBreak(result.m_text.back())) {
    result.m_text.pop_back();
    result.m_origins.pop_back();
  }
  return result;
}

std::string NormalizedText::normalize(const std::string &text) {
  TextRun run;
  run.text = text;
  return fromRuns({run}).text();
}

std::map<std::size_t, std::vector<std::size_t>>
NormalizedText::glyphsInRange(std::size_t begin, std::size_t end) const {
  std::map<std::size_t, std::set<std::size_t>> collected;
  end = std::min(end, m_origins.size());
  for (std::size_t i = begin; i < end; ++i) {
    const GlyphRef &ref = m_origins[i];
    if (ref.run != GlyphRef::kSeparator) {
      collected[ref.run].insert(ref.glyph);
    }
  }
  std::map<std::size_t, std::vector<std::size_t>> result;
  for (const auto &entry : collected) {
    result[entry.first].assign(entry.second.begin(), entry.second.end());
  }
  return result;
}

std::string NormalizedText::context(std::size_t begin, std::size_t end,
                                    std::size_t radius) const {
  std::size_t start = begin > radius ? begin - radius : 0;
  while (start > 0 && isContinuation(m_text[start])) {
    --start;
  }
  std::size_t stop = std::min(m_text.size(), end + radius);
  while (stop < m_text.size() && isContinuation(m_text[stop])) {
    ++stop;
  }
  return m_text.substr(start, stop - start);
}

std::regex compilePattern(const std::string &pattern, bool ignoreCase) {
  if (pattern.empty()) {
    throw PatternError(pattern, 0, "pattern is empty");
  }
  auto flags = std::regex_constants::ECMAScript;
  if (ignoreCase) {
    flags |= std::regex_constants::icase;
  }
  try {
    return std::regex(pattern, flags);
  } catch (const std::regex_error &e) {
    throw PatternError(pattern, locatePatternError(pattern, e.code()),
                       e.what());
  }
}

TextMatcher::TextMatcher(const MatchCriteria &criteria) : m_criteria(criteria) {
  for (const auto &term : m_criteria.terms) {
    std::string normalized = NormalizedText::normalize(term);
    m_normalizedTerms.push_back(m_criteria.caseSensitive ? normalized
                                                         : foldCase(normalized));
  }
  for (const auto &pattern : m_criteria.patterns) {
    m_regexes.push_back(compilePattern(pattern, m_criteria.regexIgnoreCase));
  }
}

std::vector<TextMatch>
TextMatcher::findTerms(const NormalizedText &text) const {
  std::vector<TextMatch> matches;
  const std::string &source = text.text();
  std::string haystack = m_criteria.caseSensitive ? source : foldCase(source);
  // A term may wrap onto the next line
  std::replace(haystack.begin(), haystack.end(), '\n', ' ');

  for (std::size_t t = 0; t < m_normalizedTerms.size(); ++t) {
    const std::string &needle = m_normalizedTerms[t];
    if (needle.empty()) {
      continue;
    }
    std::size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
      TextMatch match;
      match.rule = m_criteria.terms[t];
      match.source = BoxSource::ExactTerm;
      match.begin = pos;
      match.end = pos + needle.size();
      match.matchedText = source.substr(pos, needle.size());
      std::replace(match.matchedText.begin(), match.matchedText.end(), '\n',
                   ' ');
      matches.push_back(std::move(match));
      pos = haystack.find(needle, pos + 1);
    }
  }
  return matches;
}

std::vector<TextMatch>
TextMatcher::findPatterns(const NormalizedText &text) const {
  std::vector<TextMatch> matches;
  const std::string &source = text.text();

  for (std::size_t p = 0; p < m_regexes.size(); ++p) {
    for (const auto &hit : searchLines(m_regexes[p], source)) {
      TextMatch match;
      match.rule = m_criteria.patterns[p];
      match.source = BoxSource::Regex;
      match.begin = hit.first;
      match.end = hit.second;
      match.matchedText = source.substr(hit.first, hit.second - hit.first);
      matches.push_back(std::move(match));
    }
  }
  return matches;
}

std::vector<TextMatch> TextMatcher::findAll(const NormalizedText &text) const {
  std::vector<TextMatch> matches = findTerms(text);
  std::vector<TextMatch> patternMatches = findPatterns(text);
  matches.insert(matches.end(), patternMatches.begin(), patternMatches.end());
  return matches;
}

std::vector<std::pair<std::string, std::size_t>>
TextMatcher::findTermsInBytes(const std::string &bytes) const {
  std::vector<std::pair<std::string, std::size_t>> hits;
  std::string haystack = m_criteria.caseSensitive ? bytes : foldCase(bytes);
  for (std::size_t t = 0; t < m_normalizedTerms.size(); ++t) {
    const std::string &needle = m_normalizedTerms[t];
    if (needle.empty()) {
      continue;
    }
    std::size_t pos = haystack.find(needle);
    if (pos != std::string::npos) {
      hits.emplace_back(m_criteria.terms[t], pos);
    }
  }
  return hits;
}

const std::vector<PiiPattern> &piiPatterns() {
  static const std::vector<PiiPattern> patterns = {
      {"ssn", R"(\b\d{3}-\d{2}-\d{4}\b)", "US social security number"},
      {"ssn_nohyphen", R"(\b\d{9}\b)", "Social security number, no hyphens"},
      {"email", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)",
       "Email address"},
      {"phone", R"(\b\(?(\d{3})\)?[-.\s]?(\d{3})[-.\s]?(\d{4})\b)",
       "US phone number"},
      {"credit_card", R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)",
       "Credit card number"},
      {"ip_address", R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)",
       "IPv4 address"},
      {"date", R"(\b\d{1,2}[/-]\d{1,2}[/-]\d{2,4}\b)", "Numeric date"},
      {"zip_code", R"(\b\d{5}(?:-\d{4})?\b)", "US ZIP code"},
  };
  return patterns;
}

const PiiPattern &piiPattern(const std::string &name) {
  for (const auto &pattern : piiPatterns()) {
    if (pattern.name == name) {
      return pattern;
    }
  }
  throw PatternError(name, std::nullopt, "unknown built-in pattern name");
}

} // namespace redact
