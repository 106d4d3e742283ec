#include <catch2/catch.hpp>

#include "Errors.hpp"
#include "PageSource.hpp"
#include "PdfFixtures.hpp"
#include "QpdfSupport.hpp"
#include "RedactionApplier.hpp"
#include "TextDetector.hpp"

#include <qpdf/QPDFPageDocumentHelper.hh>

using namespace redact;
using namespace redact::testing;

namespace {

RedactionBox box(int pageIndex, const Rect &rect,
                 BoxSource source = BoxSource::ExactTerm) {
  RedactionBox result;
  result.pageIndex = pageIndex;
  result.rect = rect;
  result.source = source;
  return result;
}

PageClassification classified(int pageIndex, PageKind kind) {
  PageClassification result;
  result.pageIndex = pageIndex;
  result.kind = kind;
  return result;
}

Document ssnDocument() {
  return textDocument({{72, 700, 12, "SSN: 123-45-6789"},
                       {72, 600, 12, "Reference 555"}});
}

} // anonymous namespace

TEST_CASE("Fill colours parse from names and hex", "[applier]") {
  FillColor black = FillColor::parse("black");
  REQUIRE(black.r == 0.0);
  REQUIRE(black.g == 0.0);
  REQUIRE(black.b == 0.0);

  FillColor white = FillColor::parse("WHITE");
  REQUIRE(white.r == 1.0);

  FillColor hex = FillColor::parse("#ff8000");
  REQUIRE(hex.r == Approx(1.0));
  REQUIRE(hex.g == Approx(128 / 255.0));
  REQUIRE(hex.b == Approx(0.0));

  REQUIRE_THROWS_AS(FillColor::parse("chartreuse"), ValidationError);
  REQUIRE_THROWS_AS(FillColor::parse("#12345"), ValidationError);
  REQUIRE_THROWS_AS(FillColor::parse("#gggggg"), ValidationError);
}

TEST_CASE("An empty box map leaves the document unchanged", "[applier]") {
  Document input = ssnDocument();
  ApplyResult result = RedactionApplier().apply(input, PageBoxMap());
  REQUIRE(result.document.bytes() == input.bytes());
  REQUIRE(result.pages.empty());
}

TEST_CASE("Applied boxes remove text and paint fills", "[applier][pdf]") {
  PageBoxMap boxes;
  boxes[0].push_back(box(0, Rect(103, 690, 172, 715)));

  ApplyConfig config;
  config.fill = FillColor::parse("red");
  ApplyResult result = RedactionApplier(config).apply(ssnDocument(), boxes);

  REQUIRE(result.pages.size() == 1);
  REQUIRE(result.pages[0].boxesApplied == 1);
  REQUIRE(result.pages[0].glyphsRemoved == 11);
  REQUIRE_FALSE(result.pages[0].rasterized);

  std::string content = pageContent(result.document);
  REQUIRE(content.find("123-45-6789") == std::string::npos);
  REQUIRE(content.find("q 1 0 0 rg 103 690 69 25 re f Q") != std::string::npos);
  REQUIRE(result.document.bytes().find("123-45-6789") == std::string::npos);

  std::unique_ptr<PopplerPageSource> source =
      PopplerPageSource::open(result.document);
  std::string text = source->pageText(0);
  REQUIRE(text.find("6789") == std::string::npos);
  REQUIRE(text.find("SSN:") != std::string::npos);
  REQUIRE(text.find("Reference 555") != std::string::npos);
}

TEST_CASE("Boxes are clipped to the media box", "[applier]") {
  PageBoxMap boxes;
  boxes[0].push_back(box(0, Rect(500, 700, 900, 900)));
  boxes[0].push_back(box(0, Rect(700, 900, 800, 1000)));

  ApplyResult result = RedactionApplier().apply(ssnDocument(), boxes);
  REQUIRE(result.pages[0].boxesApplied == 1);
  std::string content = pageContent(result.document);
  REQUIRE(content.find("500 700 112 92 re f") != std::string::npos);
}

TEST_CASE("Boxes on missing pages are rejected", "[applier]") {
  PageBoxMap boxes;
  boxes[3].push_back(box(3, Rect(0, 0, 10, 10)));
  try {
    RedactionApplier().apply(ssnDocument(), boxes);
    FAIL("expected ValidationError");
  } catch (const ValidationError &e) {
    REQUIRE(e.page() == 4);
  }
}

TEST_CASE("Existing graphics state cannot leak into the fills", "[applier]") {
  QPDF pdf;
  pdf.emptyPDF();
  QPDFObjectHandle resources = QPDFObjectHandle::parse("<< /Font << >> >>");
  resources.getKey("/Font").replaceKey("/F1", helveticaFont(pdf));
  addPage(pdf, "q q 0 0 1 rg 5 0 0 5 0 0 cm BT /F1 10 Tf 10 10 Td (x) Tj ET",
          resources);

  PageBoxMap boxes;
  boxes[0].push_back(box(0, Rect(300, 300, 310, 310)));
  ApplyResult result = RedactionApplier().apply(toDocument(pdf), boxes);

  std::string content = pageContent(result.document);
  std::size_t fill = content.find("300 300 10 10 re f");
  REQUIRE(fill != std::string::npos);
  // One Q per open q, plus the outer wrapper, before the fill
  std::string before = content.substr(0, fill);
  REQUIRE(before.rfind("Q\nQ\nQ\n") != std::string::npos);
}

TEST_CASE("Scanned pages with OCR boxes are rasterized", "[applier][pdf]") {
  // The scan covers the top half of the page; the boxes sit below it
  QPDF pdf;
  pdf.emptyPDF();
  QPDFObjectHandle resources = QPDFObjectHandle::parse("<< /XObject << >> >>");
  resources.getKey("/XObject").replaceKey("/Im0", grayImage(pdf, 32, 32, 200));
  addPage(pdf, "q 612 0 0 396 0 396 cm /Im0 Do Q\n", resources);
  Document scanned = toDocument(pdf);

  PageBoxMap boxes;
  boxes[0].push_back(box(0, Rect(100, 100, 200, 150), BoxSource::Ocr));

  ApplyConfig config;
  config.rasterDpi = 72;

  SECTION("scanned page") {
    ApplyResult result = RedactionApplier(config).apply(
        scanned, boxes, {classified(0, PageKind::Scanned)});
    REQUIRE(result.pages[0].rasterized);

    QPDF output;
    loadDocument(output, result.document);
    QPDFPageObjectHelper page = QPDFPageDocumentHelper(output).getAllPages()[0];
    QPDFObjectHandle image =
        page.getAttribute("/Resources", false).getKey("/XObject").getKey("/Im0");
    REQUIRE(image.isStream());
    REQUIRE(image.getDict().getKey("/Width").getIntValue() == 612);
    REQUIRE(image.getDict().getKey("/Height").getIntValue() == 792);
    REQUIRE(image.getDict().getKey("/ColorSpace").getName() == "/DeviceRGB");

    std::unique_ptr<PopplerPageSource> source =
        PopplerPageSource::open(result.document);
    cv::Mat rendered = source->rasterize(0, 72);
    // Inside the box (user y 100..150 is pixel row 642..692)
    cv::Vec3b inside = rendered.at<cv::Vec3b>(660, 150);
    REQUIRE(inside[0] < 30);
    REQUIRE(inside[1] < 30);
    REQUIRE(inside[2] < 30);
    cv::Vec3b outside = rendered.at<cv::Vec3b>(100, 400);
    REQUIRE(outside[1] > 150);
  }

  SECTION("mixed page under the scanned-only policy") {
    config.rasterPolicy = RasterPolicy::ScannedOnly;
    ApplyResult result = RedactionApplier(config).apply(
        scanned, boxes, {classified(0, PageKind::Mixed)});
    REQUIRE_FALSE(result.pages[0].rasterized);
    REQUIRE(pageContent(result.document).find("100 100 100 50 re f") !=
            std::string::npos);
  }

  SECTION("text-layer boxes clear of images never rasterize") {
    PageBoxMap textBoxes;
    textBoxes[0].push_back(box(0, Rect(100, 100, 200, 150)));
    ApplyResult result = RedactionApplier(config).apply(
        scanned, textBoxes, {classified(0, PageKind::Scanned)});
    REQUIRE_FALSE(result.pages[0].rasterized);
    REQUIRE_FALSE(result.pages[0].imageCovered);
  }
}

TEST_CASE("Boxes over images never leave the pixels behind",
          "[applier][pdf]") {
  QPDF pdf;
  pdf.emptyPDF();
  QPDFObjectHandle resources = QPDFObjectHandle::parse("<< /XObject << >> >>");
  resources.getKey("/XObject").replaceKey("/Im0", grayImage(pdf, 40, 20, 200));
  addPage(pdf, "q 200 0 0 100 300 500 cm /Im0 Do Q\n", resources);
  Document photo = toDocument(pdf);

  // A signature drawn on a text page, covered by a manual box
  PageBoxMap boxes;
  boxes[0].push_back(box(0, Rect(320, 520, 380, 560), BoxSource::Manual));
  ApplyConfig config;
  config.rasterDpi = 72;

  auto imageOf = [](const Document &document) {
    QPDF output;
    loadDocument(output, document);
    QPDFPageObjectHelper page = QPDFPageDocumentHelper(output).getAllPages()[0];
    return page.getAttribute("/Resources", false)
        .getKey("/XObject")
        .getKey("/Im0");
  };

  SECTION("the page is rasterized with the box burned in") {
    ApplyResult result = RedactionApplier(config).apply(
        photo, boxes, {classified(0, PageKind::Text)});
    REQUIRE(result.pages[0].imageCovered);
    REQUIRE(result.pages[0].rasterized);
    // The 40x20 original is gone; only the full-page raster remains
    QPDFObjectHandle image = imageOf(result.document);
    REQUIRE(image.getDict().getKey("/Width").getIntValue() == 612);

    std::unique_ptr<PopplerPageSource> source =
        PopplerPageSource::open(result.document);
    cv::Mat rendered = source->rasterize(0, 72);
    // User (350, 540) is pixel (350, 252)
    REQUIRE(rendered.at<cv::Vec3b>(252, 350)[1] < 30);
    // Rest of the photo survives
    REQUIRE(rendered.at<cv::Vec3b>(280, 480)[1] > 150);
  }

  SECTION("or the image is dropped when asked") {
    config.removeIntersectingImages = true;
    ApplyResult result = RedactionApplier(config).apply(
        photo, boxes, {classified(0, PageKind::Text)});
    REQUIRE(result.pages[0].imagesRemoved == 1);
    REQUIRE_FALSE(result.pages[0].imageCovered);
    REQUIRE_FALSE(result.pages[0].rasterized);
    REQUIRE(imageOf(result.document).isNull());
  }

  SECTION("boxes elsewhere leave the image alone") {
    PageBoxMap elsewhere;
    elsewhere[0].push_back(box(0, Rect(50, 50, 100, 100), BoxSource::Manual));
    ApplyResult result = RedactionApplier(config).apply(photo, elsewhere);
    REQUIRE_FALSE(result.pages[0].rasterized);
    REQUIRE(imageOf(result.document).getDict().getKey("/Width").getIntValue() ==
            40);
  }
}

TEST_CASE("Overlapping boxes give the same page in any order",
          "[applier][pdf]") {
  Document input = ssnDocument();
  RedactionBox left = box(0, Rect(100, 695, 160, 715));
  RedactionBox right = box(0, Rect(140, 698, 200, 712), BoxSource::Regex);

  PageBoxMap forward;
  forward[0] = {left, right};
  PageBoxMap backward;
  backward[0] = {right, left};

  ApplyResult first = RedactionApplier().apply(input, forward);
  ApplyResult second = RedactionApplier().apply(input, backward);
  REQUIRE(pageContent(first.document) == pageContent(second.document));
  REQUIRE(first.pages[0].glyphsRemoved == second.pages[0].glyphsRemoved);
  REQUIRE(first.pages[0].glyphsRemoved > 0);

  std::string text = PopplerPageSource::open(first.document)->pageText(0);
  REQUIRE(text == PopplerPageSource::open(second.document)->pageText(0));
}

TEST_CASE("Nothing is found again after applying detected boxes",
          "[applier][pdf]") {
  Document input = textDocument({{72, 700, 12, "Patient: John Smith"},
                                 {72, 680, 12, "SSN: 123-45-6789"},
                                 {72, 660, 12, "Call John Smith back"}});
  MatchCriteria criteria;
  criteria.terms = {"John Smith"};
  criteria.patterns = {piiPattern("ssn").pattern};
  TextMatcher matcher(criteria);

  std::unique_ptr<PopplerPageSource> before = PopplerPageSource::open(input);
  PageBoxMap boxes = TextDetector(*before).detectAll(matcher);
  REQUIRE(countBoxes(boxes) == 3);

  ApplyResult result = RedactionApplier().apply(input, boxes);
  std::unique_ptr<PopplerPageSource> after =
      PopplerPageSource::open(result.document);
  REQUIRE(countBoxes(TextDetector(*after).detectAll(matcher)) == 0);
  REQUIRE(after->pageText(0).find("Patient:") != std::string::npos);
}
