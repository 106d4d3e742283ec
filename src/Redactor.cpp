#include "Redactor.hpp"

#include "Errors.hpp"
#include "Log.hpp"
#include "OcrDetector.hpp"
#include "PageSource.hpp"
#include "RectFile.hpp"
#include "TesseractOcr.hpp"
#include "TextDetector.hpp"

#include <ctime>

namespace redact {

namespace {

void addIssue(std::vector<PageIssue> &issues, std::optional<int> pageIndex,
              IssueKind kind, const std::string &message) {
  debugLog() << "DEBUG: " << toString(kind) << ": " << message << std::endl;
  issues.push_back(PageIssue{pageIndex, kind, message});
}

void collect(DetectionResult &result, int pageIndex,
             PageDetection &&detection) {
  result.matchCount += detection.matches;
  for (auto &box : detection.boxes) {
    result.termsFound.insert(box.rule);
    result.boxes[pageIndex].push_back(std::move(box));
  }
}

} // anonymous namespace

const char *toString(IssueKind kind) {
  switch (kind) {
  case IssueKind::CapabilityUnavailable:
    return "capability_unavailable";
  case IssueKind::PageProcessing:
    return "page_processing";
  case IssueKind::Classification:
    return "classification";
  case IssueKind::VerificationFailure:
    return "verification_failure";
  }
  return "unknown";
}

std::string utcTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm utc{};
  gmtime_r(&now, &utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

Redactor::Redactor(const RedactConfig &config, OcrEngine *engine,
                   const CancellationToken *cancel)
    : m_config(config), m_engine(engine), m_cancel(cancel) {}

Redactor::~Redactor() = default;

OcrEngine *Redactor::engine() const {
  if (m_engine != nullptr) {
    return m_engine;
  }
  if (!m_ownedEngine) {
    m_ownedEngine = std::make_unique<TesseractOcr>(m_config.ocr);
  }
  return m_ownedEngine.get();
}

DetectionResult Redactor::detect(const Document &document) const {
  // Patterns are compiled before the document is touched
  TextMatcher matcher(m_config.criteria);

  DetectionResult result;
  std::unique_ptr<PopplerPageSource> pages = PopplerPageSource::open(document);
  validateAgainstPageCount(m_config.manualBoxes, pages->pageCount());

  PageClassifier classifier(*pages, m_config.classifier);
  result.classifications = classifier.classifyAll(m_cancel);
  for (const auto &classification : result.classifications) {
    if (classification.error) {
      addIssue(result.issues, classification.pageIndex,
               IssueKind::Classification,
               "classification failed, searched as mixed: " +
                   *classification.error);
    }
  }

  if (!matcher.empty()) {
    TextDetector textDetector(*pages);
    std::unique_ptr<OcrDetector> ocrDetector;
    if (m_config.useOcr) {
      ocrDetector = std::make_unique<OcrDetector>(*pages, *engine(),
                                                  m_config.ocr, m_cancel);
    }

    for (const auto &classification : result.classifications) {
      throwIfCancelled(m_cancel);
      int pageIndex = classification.pageIndex;

      // A scan can still carry a text layer worth searching
      bool hasTextLayer =
          classification.kind != PageKind::Scanned ||
          classification.charCount >= m_config.classifier.minTextChars;
      if (hasTextLayer) {
        try {
          collect(result, pageIndex,
                  textDetector.detectPage(pageIndex, matcher));
        } catch (const PageProcessingError &e) {
          addIssue(result.issues, pageIndex, IssueKind::PageProcessing,
                   e.what());
          result.incompletePages.insert(pageIndex);
        }
      }

      if (classification.kind == PageKind::Text) {
        continue;
      }
      if (!ocrDetector) {
        addIssue(result.issues, pageIndex, IssueKind::CapabilityUnavailable,
                 std::string("OCR disabled; ") + toString(classification.kind) +
                     " page not searched for raster text");
        result.incompletePages.insert(pageIndex);
        continue;
      }
      try {
        collect(result, pageIndex, ocrDetector->detectPage(pageIndex, matcher));
      } catch (const CapabilityUnavailable &e) {
        addIssue(result.issues, pageIndex, IssueKind::CapabilityUnavailable,
                 e.what());
        result.incompletePages.insert(pageIndex);
      } catch (const PageProcessingError &e) {
        addIssue(result.issues, pageIndex, IssueKind::PageProcessing,
                 e.what());
        result.incompletePages.insert(pageIndex);
      }
    }
  }

  mergeBoxes(result.boxes, m_config.manualBoxes);
  debugLog() << "DEBUG: " << result.matchCount << " matches, "
             << countBoxes(result.boxes) << " boxes on "
             << result.boxes.size() << " pages" << std::endl;
  return result;
}

RedactOutcome Redactor::run(const Document &document) const {
  DetectionResult detection = detect(document);

  RedactOutcome outcome;
  RedactionReport &report = outcome.report;
  report.timestamp = utcTimestamp();
  report.termsFound.assign(detection.termsFound.begin(),
                           detection.termsFound.end());
  report.totalMatches = detection.matchCount;
  report.classification = detection.classifications;
  report.redactions = detection.boxes;
  report.issues = detection.issues;
  for (const auto &entry : detection.boxes) {
    if (!entry.second.empty()) {
      report.pagesAffected.push_back(entry.first);
    }
  }

  throwIfCancelled(m_cancel);
  ApplyResult applied = RedactionApplier(m_config.apply)
                            .apply(document, detection.boxes,
                                   detection.classifications);
  Document output = applied.document;

  throwIfCancelled(m_cancel);
  if (m_config.sanitize) {
    SanitizeResult sanitized = Sanitizer(m_config.sanitizer).sanitize(output);
    output = sanitized.document;
    report.sanitization = sanitized.report;
  }

  throwIfCancelled(m_cancel);
  TextMatcher matcher(m_config.criteria);
  if (m_config.verify && !matcher.empty()) {
    OcrRecheck recheck;
    if (m_config.ocrRecheck && m_config.useOcr) {
      recheck.engine = engine();
      recheck.config = m_config.ocr;
      for (const auto &page : applied.pages) {
        if (page.rasterized) {
          recheck.pages.push_back(page.pageIndex);
        }
      }
    }

    VerificationResult verification = Verifier(m_config.verifier)
        .verify(output, matcher, recheck.pages.empty() ? nullptr : &recheck,
                m_cancel);

    if (verification.ocrSkipped) {
      addIssue(report.issues, std::nullopt, IssueKind::CapabilityUnavailable,
               "OCR re-check skipped: " + *verification.ocrSkipped);
    }
    for (int pageIndex : verification.unreadablePages) {
      addIssue(report.issues, pageIndex, IssueKind::PageProcessing,
               "page could not be re-read for verification");
    }
    if (!verification.passed) {
      addIssue(report.issues, std::nullopt, IssueKind::VerificationFailure,
               std::to_string(verification.residualMatches.size()) +
                   " residual matches remain in the output");
    }
    report.verification = verification;
  }

  report.incompletePages.assign(detection.incompletePages.begin(),
                                detection.incompletePages.end());
  outcome.document = output;
  return outcome;
}

SanitizeResult Redactor::sanitizeOnly(const Document &document) const {
  return Sanitizer(m_config.sanitizer).sanitize(document);
}

} // namespace redact
