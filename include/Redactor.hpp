#ifndef REDACT_REDACTOR_HPP
#define REDACT_REDACTOR_HPP

#include "BoxModel.hpp"
#include "Cancellation.hpp"
#include "Document.hpp"
#include "OcrEngine.hpp"
#include "PageClassifier.hpp"
#include "RedactionApplier.hpp"
#include "Sanitizer.hpp"
#include "TextMatcher.hpp"
#include "Verifier.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace redact {

enum class IssueKind {
  CapabilityUnavailable, ///< OCR missing or disabled for a page that needs it
  PageProcessing,        ///< A page failed or timed out
  Classification,        ///< Page kind could not be determined
  VerificationFailure    ///< Residual matches remain in the output
};

const char *toString(IssueKind kind);

/**
 * @brief A recoverable problem; the run continued without it
 */
struct PageIssue {
  std::optional<int> pageIndex; ///< 0-based; absent for document-wide issues
  IssueKind kind = IssueKind::PageProcessing;
  std::string message;
};

/**
 * @brief Everything one run needs to know
 */
struct RedactConfig {
  MatchCriteria criteria;
  PageBoxMap manualBoxes;      ///< From a rectangle file, 0-based
  bool useOcr = true;          ///< Run the OCR detector on scanned/mixed pages
  OcrConfig ocr;
  ClassifierConfig classifier;
  ApplyConfig apply;
  bool sanitize = true;
  SanitizeConfig sanitizer;
  bool verify = true;
  VerifyConfig verifier;
  bool ocrRecheck = false;     ///< Re-OCR rasterized pages when verifying
};

/**
 * @brief Boxes and page kinds found by the detection stage
 */
struct DetectionResult {
  std::vector<PageClassification> classifications;
  PageBoxMap boxes;
  std::vector<PageIssue> issues;
  std::set<int> incompletePages;
  int matchCount = 0;
  std::set<std::string> termsFound; ///< Terms and patterns with a hit
};

/**
 * @brief Summary of a complete run, written out as the JSON report
 */
struct RedactionReport {
  std::string inputFile;
  std::string outputFile;
  std::string timestamp; ///< UTC, ISO 8601
  std::vector<std::string> termsFound;
  std::vector<int> pagesAffected; ///< 0-based
  int totalMatches = 0;
  std::vector<PageClassification> classification;
  PageBoxMap redactions;
  std::optional<SanitizationReport> sanitization;
  std::optional<VerificationResult> verification;
  std::vector<PageIssue> issues;
  std::vector<int> incompletePages; ///< 0-based
};

struct RedactOutcome {
  Document document;
  RedactionReport report;
};

/**
 * @brief The whole pipeline: classify, detect, apply, sanitize, verify
 *
 * Recoverable per-page failures become issues in the report; fatal errors
 * are thrown before any output exists. Without an injected engine the
 * redactor creates a Tesseract engine when OCR is enabled.
 */
class Redactor {
public:
  explicit Redactor(const RedactConfig &config, OcrEngine *engine = nullptr,
                    const CancellationToken *cancel = nullptr);
  ~Redactor();

  Redactor(const Redactor &) = delete;
  Redactor &operator=(const Redactor &) = delete;

  /**
   * @brief Classify pages and find boxes without changing the document
   * @throws PatternError, InputError, ValidationError, OperationCancelled
   */
  DetectionResult detect(const Document &document) const;

  /**
   * @brief Run every stage and return the redacted document
   * @throws PatternError, InputError, ValidationError, OperationCancelled
   */
  RedactOutcome run(const Document &document) const;

  /**
   * @brief Sanitize only
   * @throws InputError if the document cannot be opened
   */
  SanitizeResult sanitizeOnly(const Document &document) const;

  const RedactConfig &config() const { return m_config; }

private:
  OcrEngine *engine() const;

  RedactConfig m_config;
  OcrEngine *m_engine;
  mutable std::unique_ptr<OcrEngine> m_ownedEngine;
  const CancellationToken *m_cancel;
};

/// Current UTC time as ISO 8601 (2024-01-31T12:00:00Z)
std::string utcTimestamp();

} // namespace redact

#endif // REDACT_REDACTOR_HPP
