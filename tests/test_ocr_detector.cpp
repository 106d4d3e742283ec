#include <catch2/catch.hpp>

#include "Errors.hpp"
#include "Fakes.hpp"
#include "OcrDetector.hpp"
#include "TesseractOcr.hpp"

#include <stdexcept>

using namespace redact;
using namespace redact::testing;

namespace {

FakePageSource scannedSource(int rotation = 0) {
  FakePageSource source;
  FakePage page;
  page.frame = letterFrame(rotation);
  page.imageCoverage = 1.0;
  source.pages = {page};
  return source;
}

OcrConfig ocrConfig() {
  OcrConfig config;
  config.dpi = 300;
  config.confidenceThreshold = 60;
  return config;
}

TextMatcher termMatcher(const std::string &term) {
  MatchCriteria criteria;
  criteria.terms = {term};
  return TextMatcher(criteria);
}

} // anonymous namespace

TEST_CASE("OCR words map to page boxes", "[ocr-detector]") {
  FakePageSource source = scannedSource();
  FakeOcrEngine engine;
  // 300 dpi: 300 px per inch
  engine.words = {makeWord("Patient", 95, 300, 300, 400, 50),
                  makeWord("John", 92, 750, 300, 200, 50),
                  makeWord("Smith", 90, 1000, 300, 250, 50)};

  OcrDetector detector(source, engine, ocrConfig());
  PageDetection detection = detector.detectPage(0, termMatcher("john smith"));

  REQUIRE(engine.calls == 1);
  REQUIRE(engine.lastImageSize == cv::Size(2550, 3300));
  REQUIRE(detection.matches == 1);
  REQUIRE(detection.boxes.size() == 1);

  const RedactionBox &box = detection.boxes[0];
  REQUIRE(box.source == BoxSource::Ocr);
  REQUIRE(box.confidence);
  REQUIRE(*box.confidence == Approx(90));
  REQUIRE(box.rect.x0 == Approx(750 * 72.0 / 300));
  REQUIRE(box.rect.x1 == Approx(1250 * 72.0 / 300));
  REQUIRE(box.rect.y1 == Approx(792 - 300 * 72.0 / 300));
  REQUIRE(box.rect.y0 == Approx(792 - 350 * 72.0 / 300));
}

TEST_CASE("Low-confidence words are ignored", "[ocr-detector]") {
  FakePageSource source = scannedSource();
  FakeOcrEngine engine;
  engine.words = {makeWord("John", 30, 750, 300, 200, 50)};

  PageDetection detection =
      OcrDetector(source, engine, ocrConfig()).detectPage(0, termMatcher("john"));
  REQUIRE(detection.boxes.empty());
  REQUIRE(detection.matches == 0);
}

TEST_CASE("OCR boxes on rotated pages land in user space", "[ocr-detector]") {
  FakePageSource source = scannedSource(90);
  FakeOcrEngine engine;
  engine.words = {makeWord("Secret", 99, 0, 0, 300, 150)};

  PageDetection detection = OcrDetector(source, engine, ocrConfig())
                                .detectPage(0, termMatcher("secret"));
  REQUIRE(engine.lastImageSize == cv::Size(3300, 2550));
  REQUIRE(detection.boxes.size() == 1);
  const Rect &rect = detection.boxes[0].rect;
  REQUIRE(rect.x0 == Approx(0).margin(1e-9));
  REQUIRE(rect.y0 == Approx(0).margin(1e-9));
  REQUIRE(rect.x1 == Approx(36));
  REQUIRE(rect.y1 == Approx(72));
}

TEST_CASE("Resolution is raised to the minimum", "[ocr-detector]") {
  FakePageSource source = scannedSource();
  FakeOcrEngine engine;
  OcrConfig config = ocrConfig();
  config.dpi = 72;

  OcrDetector(source, engine, config).detectPage(0, termMatcher("x"));
  REQUIRE(engine.lastImageSize == cv::Size(1275, 1650));
}

TEST_CASE("Confidence outside 0-100 is rejected", "[ocr-detector]") {
  FakePageSource source = scannedSource();
  FakeOcrEngine engine;
  OcrConfig config = ocrConfig();

  config.confidenceThreshold = 101;
  REQUIRE_THROWS_AS(validateOcrConfig(config), std::invalid_argument);
  REQUIRE_THROWS_AS(OcrDetector(source, engine, config), std::invalid_argument);

  config.confidenceThreshold = -1;
  REQUIRE_THROWS_AS(validateOcrConfig(config), std::invalid_argument);

  config.confidenceThreshold = 100;
  REQUIRE_NOTHROW(validateOcrConfig(config));
  config.confidenceThreshold = 0;
  REQUIRE_NOTHROW(validateOcrConfig(config));

  config.pageTimeoutMs = -5;
  REQUIRE_THROWS_AS(validateOcrConfig(config), std::invalid_argument);
}

TEST_CASE("OCR failures map to errors", "[ocr-detector]") {
  FakePageSource source = scannedSource();
  FakeOcrEngine engine;
  OcrDetector detector(source, engine, ocrConfig());

  SECTION("engine missing") {
    engine.available = false;
    REQUIRE_THROWS_AS(detector.detectPage(0, termMatcher("x")),
                      CapabilityUnavailable);
  }

  SECTION("recognition failure") {
    engine.fail = true;
    REQUIRE_THROWS_AS(detector.detectPage(0, termMatcher("x")),
                      PageProcessingError);
  }

  SECTION("deadline") {
    engine.timeOut = true;
    REQUIRE_THROWS_AS(detector.detectPage(0, termMatcher("x")),
                      PageProcessingError);
  }
}

TEST_CASE("OCR honours cancellation", "[ocr-detector]") {
  FakePageSource source = scannedSource();
  FakeOcrEngine engine;
  CancellationToken token;
  token.cancel();

  OcrDetector detector(source, engine, ocrConfig(), &token);
  REQUIRE_THROWS_AS(detector.detectPage(0, termMatcher("x")),
                    OperationCancelled);
  REQUIRE(engine.calls == 0);
}

TEST_CASE("Tesseract reports why it is unavailable", "[ocr-detector][tesseract]") {
  OcrConfig config;
  config.language = "xx_missing_language";
  TesseractOcr engine(config);
  REQUIRE_FALSE(engine.isAvailable());
  REQUIRE_FALSE(engine.unavailableReason().empty());
  REQUIRE_FALSE(TesseractOcr::getTesseractVersion().empty());
}
