#include <catch2/catch.hpp>

#include "Errors.hpp"
#include "Fakes.hpp"
#include "PageClassifier.hpp"
#include "PdfFixtures.hpp"

#include <qpdf/QPDF.hh>

using namespace redact;
using namespace redact::testing;

namespace {

// A run of `chars` glyphs covering `width` x `height` points
TextRun block(int chars, double width, double height) {
  TextRun run;
  run.text = std::string(static_cast<std::size_t>(chars), 'x');
  run.box = Rect(36, 36, 36 + width, 36 + height);
  return run;
}

FakePage pageWith(std::vector<TextRun> runs, double imageCoverage = 0.0) {
  FakePage page;
  page.frame = letterFrame();
  page.runs = std::move(runs);
  page.imageCoverage = imageCoverage;
  return page;
}

} // anonymous namespace

TEST_CASE("Pages are classified by text and image coverage", "[classifier]") {
  const double pageArea = 612.0 * 792.0;
  FakePageSource source;

  SECTION("no text is scanned") {
    source.pages = {pageWith({}, 1.0)};
    PageClassification result = PageClassifier(source).classify(0);
    REQUIRE(result.kind == PageKind::Scanned);
    REQUIRE(result.charCount == 0);
    REQUIRE(result.imageCoverageRatio == Approx(1.0));
  }

  SECTION("a few characters are still scanned") {
    source.pages = {pageWith({block(9, 500, 500)})};
    REQUIRE(PageClassifier(source).classify(0).kind == PageKind::Scanned);
  }

  SECTION("dense text is text") {
    // 30% of the page
    source.pages = {pageWith({block(2000, 300, 0.3 * pageArea / 300)})};
    PageClassification result = PageClassifier(source).classify(0);
    REQUIRE(result.kind == PageKind::Text);
    REQUIRE(result.textCoverageRatio == Approx(0.3));
  }

  SECTION("dense text over a large image is mixed") {
    source.pages = {pageWith({block(2000, 300, 0.3 * pageArea / 300)}, 0.9)};
    REQUIRE(PageClassifier(source).classify(0).kind == PageKind::Mixed);
  }

  SECTION("moderate coverage is mixed") {
    source.pages = {pageWith({block(200, 100, 0.1 * pageArea / 100)})};
    REQUIRE(PageClassifier(source).classify(0).kind == PageKind::Mixed);
  }

  SECTION("sparse text is scanned") {
    source.pages = {pageWith({block(20, 60, 10)})};
    PageClassification result = PageClassifier(source).classify(0);
    REQUIRE(result.textCoverageRatio < 0.02);
    REQUIRE(result.charCount == 20);
    REQUIRE(result.kind == PageKind::Scanned);
  }
}

TEST_CASE("Thresholds are configurable", "[classifier]") {
  const double pageArea = 612.0 * 792.0;
  FakePageSource source;
  source.pages = {pageWith({block(200, 100, 0.1 * pageArea / 100)})};

  ClassifierConfig config;
  config.thresholdHigh = 0.05;
  REQUIRE(PageClassifier(source, config).classify(0).kind == PageKind::Text);
}

TEST_CASE("Classification failures fall back to mixed", "[classifier]") {
  FakePageSource source;
  FakePage broken = pageWith({});
  broken.failText = true;
  source.pages = {pageWith({}), broken};

  std::vector<PageClassification> results = PageClassifier(source).classifyAll();
  REQUIRE(results.size() == 2);
  REQUIRE_FALSE(results[0].error);
  REQUIRE(results[1].kind == PageKind::Mixed);
  REQUIRE(results[1].error);
}

TEST_CASE("classifyAll stops when cancelled", "[classifier]") {
  FakePageSource source;
  source.pages = {pageWith({})};
  CancellationToken token;
  token.cancel();
  REQUIRE_THROWS_AS(PageClassifier(source).classifyAll(&token),
                    OperationCancelled);
}

TEST_CASE("Real documents classify as text and scanned", "[classifier][pdf]") {
  QPDF pdf;
  pdf.emptyPDF();

  std::vector<TextLine> lines;
  for (int i = 0; i < 50; ++i) {
    lines.push_back({36, 750.0 - i * 14, 12,
                     "The quick brown fox jumps over the lazy dog again and "
                     "again until the line is long"});
  }
  addTextPage(pdf, lines);

  QPDFObjectHandle resources = QPDFObjectHandle::parse("<< /XObject << >> >>");
  resources.getKey("/XObject").replaceKey("/Im0", grayImage(pdf, 64, 64));
  addPage(pdf, "q 612 0 0 792 0 0 cm /Im0 Do Q\n", resources);

  Document document = toDocument(pdf);
  std::unique_ptr<PopplerPageSource> source = PopplerPageSource::open(document);
  std::vector<PageClassification> results =
      PageClassifier(*source).classifyAll();

  REQUIRE(results.size() == 2);
  REQUIRE(results[0].kind == PageKind::Text);
  REQUIRE(results[0].charCount > 1000);
  REQUIRE(results[1].kind == PageKind::Scanned);
  REQUIRE(results[1].imageCoverageRatio == Approx(1.0).margin(0.01));
}
