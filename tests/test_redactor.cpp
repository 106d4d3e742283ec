#include <catch2/catch.hpp>

#include "Errors.hpp"
#include "Fakes.hpp"
#include "Log.hpp"
#include "PdfFixtures.hpp"
#include "Redactor.hpp"

#include <algorithm>

using namespace redact;
using namespace redact::testing;

namespace {

Document scannedDocument() {
  QPDF pdf;
  pdf.emptyPDF();
  QPDFObjectHandle resources = QPDFObjectHandle::parse("<< /XObject << >> >>");
  resources.getKey("/XObject").replaceKey("/Im0", grayImage(pdf, 32, 32, 220));
  addPage(pdf, "q 612 0 0 792 0 0 cm /Im0 Do Q\n", resources);
  return toDocument(pdf);
}

bool hasIssue(const RedactionReport &report, IssueKind kind) {
  return std::any_of(report.issues.begin(), report.issues.end(),
                     [kind](const PageIssue &issue) { return issue.kind == kind; });
}

RedactConfig fastConfig() {
  RedactConfig config;
  config.ocr.dpi = 150;
  config.apply.rasterDpi = 72;
  return config;
}

} // anonymous namespace

TEST_CASE("A text document is redacted end to end", "[redactor][pdf]") {
  Document input = textDocument({{72, 700, 12, "Patient: John Smith"},
                                 {72, 680, 12, "SSN: 123-45-6789"},
                                 {72, 660, 12, "Visit notes follow"}});
  RedactConfig config = fastConfig();
  config.criteria.terms = {"John Smith"};
  config.criteria.patterns = {piiPattern("ssn").pattern};

  FakeOcrEngine engine;
  Redactor redactor(config, &engine);
  RedactOutcome outcome = redactor.run(input);
  const RedactionReport &report = outcome.report;

  REQUIRE(report.totalMatches == 2);
  REQUIRE(report.termsFound.size() == 2);
  REQUIRE(report.pagesAffected == std::vector<int>{0});
  REQUIRE(report.redactions.at(0).size() == 2);
  REQUIRE(report.classification.size() == 1);
  REQUIRE_FALSE(report.timestamp.empty());
  REQUIRE(report.sanitization);
  REQUIRE(report.verification);
  REQUIRE(report.verification->passed);
  REQUIRE(report.incompletePages.empty());
  REQUIRE_FALSE(hasIssue(report, IssueKind::VerificationFailure));

  std::unique_ptr<PopplerPageSource> source =
      PopplerPageSource::open(outcome.document);
  std::string text = source->pageText(0);
  REQUIRE(text.find("John") == std::string::npos);
  REQUIRE(text.find("6789") == std::string::npos);
  REQUIRE(text.find("Patient:") != std::string::npos);
  REQUIRE(text.find("Visit notes follow") != std::string::npos);
}

TEST_CASE("detect finds boxes without changing anything", "[redactor]") {
  Document input = textDocument({{72, 700, 12, "secret and secret again"}});
  RedactConfig config = fastConfig();
  config.criteria.terms = {"secret"};
  config.useOcr = false;

  DetectionResult result = Redactor(config).detect(input);
  REQUIRE(result.matchCount == 2);
  REQUIRE(countBoxes(result.boxes) == 2);
  REQUIRE(result.termsFound == std::set<std::string>{"secret"});
}

TEST_CASE("Manual rectangles are merged with detected boxes", "[redactor]") {
  Document input = textDocument({{72, 700, 12, "Nothing to find"}});
  RedactConfig config = fastConfig();
  config.useOcr = false;
  RedactionBox manual;
  manual.rect = Rect(10, 10, 50, 50);
  config.manualBoxes[0].push_back(manual);

  RedactOutcome outcome = Redactor(config).run(input);
  REQUIRE(outcome.report.redactions.at(0).size() == 1);
  REQUIRE(outcome.report.redactions.at(0)[0].source == BoxSource::Manual);
  REQUIRE(outcome.report.pagesAffected == std::vector<int>{0});
  // No criteria: nothing to verify against
  REQUIRE_FALSE(outcome.report.verification);
}

TEST_CASE("Scanned pages without OCR are reported incomplete", "[redactor]") {
  RedactConfig config = fastConfig();
  config.criteria.terms = {"secret"};
  config.useOcr = false;

  RedactOutcome outcome = Redactor(config).run(scannedDocument());
  REQUIRE(outcome.report.classification[0].kind == PageKind::Scanned);
  REQUIRE(outcome.report.incompletePages == std::vector<int>{0});
  REQUIRE(hasIssue(outcome.report, IssueKind::CapabilityUnavailable));
}

TEST_CASE("Sparse text on a scanned page is still searched", "[redactor]") {
  Document input = textDocument({{72, 700, 12, "reference secret"}});
  RedactConfig config = fastConfig();
  config.criteria.terms = {"secret"};
  config.useOcr = false;

  DetectionResult result = Redactor(config).detect(input);
  REQUIRE(result.classifications[0].kind == PageKind::Scanned);
  REQUIRE(result.matchCount == 1);
  REQUIRE(result.boxes.at(0)[0].source == BoxSource::ExactTerm);
  // The raster layer was never looked at
  REQUIRE(result.incompletePages == std::set<int>{0});
}

TEST_CASE("A redactor does not change the logging level", "[redactor]") {
  setDebugLogging(true);
  RedactConfig config = fastConfig();
  config.useOcr = false;
  Redactor redactor(config);
  redactor.detect(textDocument({{72, 700, 12, "plain"}}));
  bool enabled = debugLoggingEnabled();
  setDebugLogging(false);
  REQUIRE(enabled);
}

TEST_CASE("Missing OCR engines are recoverable", "[redactor]") {
  RedactConfig config = fastConfig();
  config.criteria.terms = {"secret"};
  FakeOcrEngine engine;
  engine.available = false;

  RedactOutcome outcome = Redactor(config, &engine).run(scannedDocument());
  REQUIRE(outcome.report.incompletePages == std::vector<int>{0});
  REQUIRE(hasIssue(outcome.report, IssueKind::CapabilityUnavailable));
  REQUIRE_FALSE(outcome.document.empty());
}

TEST_CASE("OCR matches on scanned pages are burned into a raster",
          "[redactor][pdf]") {
  RedactConfig config = fastConfig();
  config.criteria.terms = {"secret"};
  config.ocrRecheck = true;
  FakeOcrEngine engine;
  // 150 dpi: one inch in from the top-left corner
  engine.words = {makeWord("Secret", 95, 150, 150, 200, 40)};

  RedactOutcome outcome = Redactor(config, &engine).run(scannedDocument());
  const RedactionReport &report = outcome.report;
  REQUIRE(report.redactions.at(0).size() == 1);
  REQUIRE(report.redactions.at(0)[0].source == BoxSource::Ocr);

  // The canned engine still reads the word, so the re-check fails
  REQUIRE(engine.calls == 2);
  REQUIRE(report.verification);
  REQUIRE_FALSE(report.verification->passed);
  REQUIRE(report.verification->residualMatches[0].layer == ResidualLayer::Ocr);
  REQUIRE(hasIssue(report, IssueKind::VerificationFailure));
}

TEST_CASE("Page failures during detection are recoverable", "[redactor]") {
  RedactConfig config = fastConfig();
  config.criteria.terms = {"secret"};
  FakeOcrEngine engine;
  engine.fail = true;

  RedactOutcome outcome = Redactor(config, &engine).run(scannedDocument());
  REQUIRE(outcome.report.incompletePages == std::vector<int>{0});
  REQUIRE(hasIssue(outcome.report, IssueKind::PageProcessing));
}

TEST_CASE("Fatal errors surface before any output", "[redactor]") {
  Document input = textDocument({{72, 700, 12, "text"}});
  RedactConfig config = fastConfig();
  config.useOcr = false;

  SECTION("invalid pattern") {
    config.criteria.patterns = {"(open"};
    REQUIRE_THROWS_AS(Redactor(config).run(input), PatternError);
  }

  SECTION("rectangle past the last page") {
    RedactionBox manual;
    manual.pageIndex = 4;
    manual.rect = Rect(0, 0, 10, 10);
    config.manualBoxes[4].push_back(manual);
    REQUIRE_THROWS_AS(Redactor(config).run(input), ValidationError);
  }

  SECTION("unreadable input") {
    Document garbage = Document::fromBytes("%PDF-1.4\ngarbage");
    config.criteria.terms = {"x"};
    REQUIRE_THROWS_AS(Redactor(config).run(garbage), InputError);
  }

  SECTION("cancelled") {
    CancellationToken token;
    token.cancel();
    config.criteria.terms = {"text"};
    REQUIRE_THROWS_AS(Redactor(config, nullptr, &token).run(input),
                      OperationCancelled);
  }
}

TEST_CASE("Sanitization can be skipped", "[redactor]") {
  Document input = textDocument({{72, 700, 12, "Nothing to find"}});
  RedactConfig config = fastConfig();
  config.useOcr = false;
  config.sanitize = false;
  config.criteria.terms = {"absent"};

  RedactOutcome outcome = Redactor(config).run(input);
  REQUIRE_FALSE(outcome.report.sanitization);
  REQUIRE(outcome.report.verification);
  REQUIRE(outcome.report.verification->passed);
  REQUIRE(outcome.report.totalMatches == 0);
}

TEST_CASE("sanitizeOnly runs the sanitizer alone", "[redactor]") {
  QPDF pdf;
  pdf.emptyPDF();
  addTextPage(pdf, {{72, 700, 12, "text"}});
  pdf.getTrailer().replaceKey(
      "/Info", pdf.makeIndirectObject(
                   QPDFObjectHandle::parse("<< /Author (Someone) >>")));

  SanitizeResult result = Redactor(RedactConfig()).sanitizeOnly(toDocument(pdf));
  REQUIRE(result.report.metadataRemoved == std::set<std::string>{"Author"});
}

TEST_CASE("Issue kinds have stable names", "[redactor]") {
  REQUIRE(std::string(toString(IssueKind::CapabilityUnavailable)) ==
          "capability_unavailable");
  REQUIRE(std::string(toString(IssueKind::VerificationFailure)) ==
          "verification_failure");
  REQUIRE(utcTimestamp().size() == 20);
  REQUIRE(utcTimestamp().back() == 'Z');
}
