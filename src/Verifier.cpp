#include "Verifier.hpp"

#include "Errors.hpp"
#include "BoxDetector.hpp"
#include "Log.hpp"
#include "OcrDetector.hpp"
#include "PageSource.hpp"
#include "QpdfSupport.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>

#include <algorithm>
#include <memory>
#include <regex>
#include <set>

namespace redact {

namespace {

constexpr int kMaxObjectDepth = 64;

// Printable slice of raw bytes around [offset, offset + length)
std::string byteContext(const std::string &bytes, std::size_t offset,
                        std::size_t length, std::size_t radius) {
  std::size_t start = offset > radius ? offset - radius : 0;
  std::size_t stop = std::min(bytes.size(), offset + length + radius);
  std::string snippet;
  for (std::size_t i = start; i < stop; ++i) {
    unsigned char c = static_cast<unsigned char>(bytes[i]);
    snippet.push_back(c >= 0x20 && c < 0x7f ? static_cast<char>(c) : '.');
  }
  return snippet;
}

// Runs of printable ASCII at least `minLength` bytes long, like strings(1)
std::vector<std::string> printableRuns(const std::string &bytes,
                                       std::size_t minLength) {
  std::vector<std::string> runs;
  std::string current;
  for (char ch : bytes) {
    unsigned char c = static_cast<unsigned char>(ch);
    if ((c >= 0x20 && c < 0x7f) || c == '\t') {
      current.push_back(ch);
      continue;
    }
    if (current.size() >= minLength) {
      runs.push_back(current);
    }
    current.clear();
  }
  if (current.size() >= minLength) {
    runs.push_back(current);
  }
  return runs;
}

// Strings held directly by an object; indirect children are visited on
// their own
void collectStrings(QPDFObjectHandle object, int depth,
                    std::vector<std::string> &out) {
  if (depth > kMaxObjectDepth) {
    return;
  }
  if (object.isString()) {
    out.push_back(object.getStringValue());
    std::string utf8 = object.getUTF8Value();
    if (utf8 != out.back()) {
      out.push_back(utf8);
    }
  } else if (object.isArray()) {
    for (int i = 0; i < object.getArrayNItems(); ++i) {
      QPDFObjectHandle item = object.getArrayItem(i);
      if (!item.isIndirect()) {
        collectStrings(item, depth + 1, out);
      }
    }
  } else if (object.isDictionary() || object.isStream()) {
    QPDFObjectHandle dict = object.isStream() ? object.getDict() : object;
    for (const auto &key : dict.getKeys()) {
      QPDFObjectHandle value = dict.getKey(key);
      if (!value.isIndirect()) {
        collectStrings(value, depth + 1, out);
      }
    }
  }
}

} // anonymous namespace

const char *toString(ResidualLayer layer) {
  switch (layer) {
  case ResidualLayer::Text:
    return "text";
  case ResidualLayer::Binary:
    return "binary";
  case ResidualLayer::Ocr:
    return "ocr";
  }
  return "unknown";
}

Verifier::Verifier(const VerifyConfig &config) : m_config(config) {}

VerificationResult Verifier::verify(const Document &document,
                                    const TextMatcher &matcher,
                                    const OcrRecheck *ocr,
                                    const CancellationToken *cancel) const {
  VerificationResult result;
  if (matcher.empty()) {
    return result;
  }

  verifyText(document, matcher, cancel, result);
  if (m_config.binaryScan) {
    verifyBinary(document, matcher, result);
  }
  if (ocr != nullptr && !ocr->pages.empty()) {
    verifyOcr(document, matcher, *ocr, cancel, result);
  }

  result.passed = result.residualMatches.empty();
  return result;
}

void Verifier::verifyText(const Document &document, const TextMatcher &matcher,
                          const CancellationToken *cancel,
                          VerificationResult &result) const {
  std::unique_ptr<PopplerPageSource> pages = PopplerPageSource::open(document);

  for (int pageIndex = 0; pageIndex < pages->pageCount(); ++pageIndex) {
    throwIfCancelled(cancel);
    std::vector<TextRun> runs;
    try {
      runs = pages->textRuns(pageIndex);
    } catch (const std::exception &e) {
      debugLog() << "DEBUG: Cannot re-read text of page " << (pageIndex + 1)
                << ": " << e.what() << std::endl;
      result.unreadablePages.push_back(pageIndex);
      continue;
    }

    NormalizedText text = NormalizedText::fromRuns(runs);
    std::vector<TextMatch> matches;
    try {
      matches = findOnPage(pageIndex, matcher, text);
    } catch (const PageProcessingError &e) {
      debugLog() << "DEBUG: " << e.what() << std::endl;
      result.unreadablePages.push_back(pageIndex);
      continue;
    }
    for (const auto &match : matches) {
      ResidualMatch residual;
      residual.pageIndex = pageIndex;
      residual.termOrPattern = match.rule;
      residual.contextSnippet =
          text.context(match.begin, match.end, m_config.contextChars);
      residual.layer = ResidualLayer::Text;
      result.residualMatches.push_back(std::move(residual));
    }
  }
}

void Verifier::verifyBinary(const Document &document,
                            const TextMatcher &matcher,
                            VerificationResult &result) const {
  std::set<std::string> reported;
  auto report = [&](const std::string &rule, const std::string &context) {
    if (!reported.insert(rule).second) {
      return;
    }
    ResidualMatch residual;
    residual.termOrPattern = rule;
    residual.contextSnippet = context;
    residual.layer = ResidualLayer::Binary;
    result.residualMatches.push_back(std::move(residual));
  };

  auto scan = [&](const std::string &bytes, bool decoded) {
    for (const auto &hit : matcher.findTermsInBytes(bytes)) {
      report(hit.first, byteContext(bytes, hit.second, hit.first.size(),
                                    m_config.contextChars));
    }
    // Compressed bytes are noise to a pattern; only decoded data is searched
    if (!decoded || !m_config.binaryScanPatterns) {
      return;
    }
    const auto &patterns = matcher.criteria().patterns;
    for (const auto &run : printableRuns(bytes, m_config.minStringLength)) {
      for (std::size_t p = 0; p < patterns.size(); ++p) {
        auto hits = searchLines(matcher.regexes()[p], run);
        if (!hits.empty()) {
          report(patterns[p],
                 byteContext(run, hits.front().first,
                             hits.front().second - hits.front().first,
                             m_config.contextChars));
        }
      }
    }
  };

  scan(document.bytes(), false);

  QPDF pdf;
  loadDocument(pdf, document);
  for (auto &object : pdf.getAllObjects()) {
    std::vector<std::string> strings;
    collectStrings(object, 0, strings);
    for (const auto &value : strings) {
      scan(value, true);
    }

    if (!object.isStream()) {
      continue;
    }
    try {
      std::shared_ptr<Buffer> data = object.getStreamData(qpdf_dl_generalized);
      scan(std::string(reinterpret_cast<char const *>(data->getBuffer()),
                       data->getSize()),
           true);
    } catch (const std::exception &e) {
      debugLog() << "DEBUG: Stream " << object.getObjectID()
                << " not decodable, raw bytes only: " << e.what()
                << std::endl;
    }
  }
}

void Verifier::verifyOcr(const Document &document, const TextMatcher &matcher,
                         const OcrRecheck &ocr, const CancellationToken *cancel,
                         VerificationResult &result) const {
  if (ocr.engine == nullptr || !ocr.engine->isAvailable()) {
    result.ocrSkipped = ocr.engine == nullptr ? std::string("no OCR engine")
                                              : ocr.engine->unavailableReason();
    return;
  }

  std::unique_ptr<PopplerPageSource> pages = PopplerPageSource::open(document);
  OcrDetector detector(*pages, *ocr.engine, ocr.config, cancel);
  for (int pageIndex : ocr.pages) {
    if (pageIndex < 0 || pageIndex >= pages->pageCount()) {
      continue;
    }
    std::vector<TextRun> runs;
    try {
      runs = detector.recognizePage(pageIndex);
    } catch (const PageProcessingError &e) {
      debugLog() << "DEBUG: OCR re-check failed: " << e.what() << std::endl;
      result.unreadablePages.push_back(pageIndex);
      continue;
    }

    NormalizedText text = NormalizedText::fromRuns(runs);
    std::vector<TextMatch> matches;
    try {
      matches = findOnPage(pageIndex, matcher, text);
    } catch (const PageProcessingError &e) {
      debugLog() << "DEBUG: " << e.what() << std::endl;
      result.unreadablePages.push_back(pageIndex);
      continue;
    }
    for (const auto &match : matches) {
      ResidualMatch residual;
      residual.pageIndex = pageIndex;
      residual.termOrPattern = match.rule;
      residual.contextSnippet =
          text.context(match.begin, match.end, m_config.contextChars);
      residual.layer = ResidualLayer::Ocr;
      result.residualMatches.push_back(std::move(residual));
    }
  }
}

} // namespace redact
