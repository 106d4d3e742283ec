#include <catch2/catch.hpp>

#include "Fakes.hpp"
#include "PdfFixtures.hpp"
#include "RedactionApplier.hpp"
#include "Verifier.hpp"

#include <algorithm>
#include <string>

using namespace redact;
using namespace redact::testing;

namespace {

TextMatcher matcherFor(std::vector<std::string> terms,
                       std::vector<std::string> patterns = {}) {
  MatchCriteria criteria;
  criteria.terms = std::move(terms);
  criteria.patterns = std::move(patterns);
  return TextMatcher(criteria);
}

std::size_t countLayer(const VerificationResult &result, ResidualLayer layer) {
  return static_cast<std::size_t>(
      std::count_if(result.residualMatches.begin(), result.residualMatches.end(),
                    [layer](const ResidualMatch &m) { return m.layer == layer; }));
}

Document withInfo(const std::string &info) {
  QPDF pdf;
  pdf.emptyPDF();
  addTextPage(pdf, {{72, 700, 12, "Nothing sensitive here"}});
  pdf.getTrailer().replaceKey(
      "/Info", pdf.makeIndirectObject(QPDFObjectHandle::parse(info)));
  return toDocument(pdf);
}

} // anonymous namespace

TEST_CASE("Unredacted text is found in the text and binary layers",
          "[verifier]") {
  Document document = textDocument({{72, 700, 12, "Patient John Smith"}});
  VerificationResult result =
      Verifier().verify(document, matcherFor({"John Smith"}));

  REQUIRE_FALSE(result.passed);
  REQUIRE(countLayer(result, ResidualLayer::Text) == 1);
  REQUIRE(countLayer(result, ResidualLayer::Binary) == 1);

  const ResidualMatch &text = result.residualMatches[0];
  REQUIRE(text.layer == ResidualLayer::Text);
  REQUIRE(text.pageIndex == 0);
  REQUIRE(text.termOrPattern == "John Smith");
  REQUIRE(text.contextSnippet == "Patient John Smith");

  const ResidualMatch &binary = result.residualMatches[1];
  REQUIRE_FALSE(binary.pageIndex);
  REQUIRE(binary.contextSnippet.find("John Smith") != std::string::npos);
}

TEST_CASE("Residual patterns are reported once per line", "[verifier]") {
  std::vector<TextLine> lines;
  for (int i = 0; i < 50; ++i) {
    lines.push_back({72, 760.0 - i * 14, 10,
                     "Account: " + std::to_string(1000 + i) +
                         " lorem ipsum dolor sit amet"});
  }
  VerifyConfig config;
  config.binaryScan = false;
  VerificationResult result = Verifier(config).verify(
      textDocument(lines), matcherFor({}, {"Account: .*"}));

  REQUIRE(result.unreadablePages.empty());
  REQUIRE(countLayer(result, ResidualLayer::Text) == 50);
}

TEST_CASE("The binary scan can be switched off", "[verifier]") {
  Document document = textDocument({{72, 700, 12, "Patient John Smith"}});
  VerifyConfig config;
  config.binaryScan = false;
  VerificationResult result =
      Verifier(config).verify(document, matcherFor({"John Smith"}));
  REQUIRE(result.residualMatches.size() == 1);
  REQUIRE(result.residualMatches[0].layer == ResidualLayer::Text);
}

TEST_CASE("A redacted document passes", "[verifier][pdf]") {
  Document document = textDocument({{72, 700, 12, "SSN: 123-45-6789"}});
  PageBoxMap boxes;
  RedactionBox box;
  box.rect = Rect(103, 690, 172, 715);
  boxes[0].push_back(box);
  Document redacted = RedactionApplier().apply(document, boxes).document;

  VerifyConfig config;
  config.binaryScanPatterns = true;
  VerificationResult result = Verifier(config).verify(
      redacted, matcherFor({"123-45-6789"}, {"\\d{3}-\\d{2}-\\d{4}"}));
  REQUIRE(result.passed);
  REQUIRE(result.residualMatches.empty());
  REQUIRE(result.unreadablePages.empty());
}

TEST_CASE("Terms hidden in metadata strings are found", "[verifier]") {
  Document document = withInfo("<< /Author (John Smith) >>");
  VerificationResult result =
      Verifier().verify(document, matcherFor({"john smith"}));
  REQUIRE(countLayer(result, ResidualLayer::Text) == 0);
  REQUIRE(countLayer(result, ResidualLayer::Binary) == 1);
  REQUIRE_FALSE(result.passed);
}

TEST_CASE("Patterns in the binary scan are opt-in", "[verifier]") {
  Document document = withInfo("<< /Subject (SSN 123-45-6789) >>");
  TextMatcher matcher = matcherFor({}, {"\\b\\d{3}-\\d{2}-\\d{4}\\b"});

  REQUIRE(Verifier().verify(document, matcher).passed);

  VerifyConfig config;
  config.binaryScanPatterns = true;
  VerificationResult result = Verifier(config).verify(document, matcher);
  REQUIRE(result.residualMatches.size() == 1);
  REQUIRE(result.residualMatches[0].layer == ResidualLayer::Binary);
  REQUIRE(result.residualMatches[0].contextSnippet.find("123-45-6789") !=
          std::string::npos);
}

TEST_CASE("An empty matcher always passes", "[verifier]") {
  Document document = textDocument({{72, 700, 12, "anything"}});
  VerificationResult result = Verifier().verify(document, matcherFor({}));
  REQUIRE(result.passed);
}

TEST_CASE("Rasterized pages can be re-read with OCR", "[verifier]") {
  Document document = textDocument({{72, 700, 12, "nothing"}});
  FakeOcrEngine engine;
  engine.words = {makeWord("Secret", 95, 100, 100, 200, 40)};

  OcrRecheck recheck;
  recheck.pages = {0};
  recheck.engine = &engine;
  recheck.config.dpi = 150;

  SECTION("residual found by OCR") {
    VerificationResult result =
        Verifier().verify(document, matcherFor({"secret"}), &recheck);
    REQUIRE(engine.calls == 1);
    REQUIRE(countLayer(result, ResidualLayer::Ocr) == 1);
    REQUIRE_FALSE(result.passed);
  }

  SECTION("engine unavailable") {
    engine.available = false;
    VerificationResult result =
        Verifier().verify(document, matcherFor({"secret"}), &recheck);
    REQUIRE(result.passed);
    REQUIRE(result.ocrSkipped == std::string("no language data"));
  }

  SECTION("engine failure marks the page unreadable") {
    engine.fail = true;
    VerificationResult result =
        Verifier().verify(document, matcherFor({"secret"}), &recheck);
    REQUIRE(result.unreadablePages == std::vector<int>{0});
  }
}

TEST_CASE("Verification honours cancellation", "[verifier]") {
  Document document = textDocument({{72, 700, 12, "text"}});
  CancellationToken token;
  token.cancel();
  REQUIRE_THROWS_AS(
      Verifier().verify(document, matcherFor({"x"}), nullptr, &token),
      OperationCancelled);
}
