#include <catch2/catch.hpp>

#include "Errors.hpp"
#include "RectFile.hpp"

#include <cstdio>
#include <fstream>

using namespace redact;

namespace {

// Field named by the ValidationError that `text` raises
std::string failingField(const std::string &text) {
  try {
    parseRectJson(text);
  } catch (const ValidationError &e) {
    return e.field();
  }
  return "<none>";
}

} // anonymous namespace

TEST_CASE("Rectangle files are keyed by 1-based page", "[rect-file]") {
  PageBoxMap boxes = parseRectJson(R"({
    "1": [{"x0": 10, "y0": 20, "x1": 110, "y1": 40}],
    "3": [{"x0": 0.5, "y0": 0.5, "x1": 1.5, "y1": 1.5},
          {"x0": 200, "y0": 300, "x1": 250, "y1": 320}]
  })");

  REQUIRE(boxes.size() == 2);
  REQUIRE(boxes.count(0) == 1);
  REQUIRE(boxes.count(2) == 1);
  REQUIRE(boxes[0][0].rect == Rect(10, 20, 110, 40));
  REQUIRE(boxes[0][0].pageIndex == 0);
  REQUIRE(boxes[0][0].source == BoxSource::Manual);
  REQUIRE(boxes[2].size() == 2);
  REQUIRE(boxes[2][1].pageIndex == 2);
}

TEST_CASE("An empty object is valid", "[rect-file]") {
  REQUIRE(parseRectJson("{}").empty());
}

TEST_CASE("Invalid rectangle files name the field", "[rect-file]") {
  REQUIRE(failingField("not json") == "");
  REQUIRE(failingField("[1, 2]") == "");
  REQUIRE(failingField(R"({"0": []})") == "page");
  REQUIRE(failingField(R"({"one": []})") == "page");
  REQUIRE(failingField(R"({"1": {"x0": 1}})") == "rects");
  REQUIRE(failingField(R"({"1": [{"y0": 0, "x1": 1, "y1": 1}]})") == "x0");
  REQUIRE(failingField(R"({"1": [{"x0": "a", "y0": 0, "x1": 1, "y1": 1}]})") ==
          "x0");
  REQUIRE(failingField(R"({"1": [{"x0": 5, "y0": 0, "x1": 5, "y1": 1}]})") ==
          "x0");
  REQUIRE(failingField(R"({"1": [{"x0": 0, "y0": 3, "x1": 5, "y1": 1}]})") ==
          "y0");
}

TEST_CASE("Validation errors carry the page", "[rect-file]") {
  try {
    parseRectJson(R"({"4": [{"x0": 9, "y0": 0, "x1": 1, "y1": 1}]})");
    FAIL("expected ValidationError");
  } catch (const ValidationError &e) {
    REQUIRE(e.page() == 4);
    REQUIRE(std::string(e.what()).find("page 4") != std::string::npos);
  }
}

TEST_CASE("Boxes beyond the last page are rejected", "[rect-file]") {
  PageBoxMap boxes =
      parseRectJson(R"({"2": [{"x0": 0, "y0": 0, "x1": 1, "y1": 1}]})");
  REQUIRE_NOTHROW(validateAgainstPageCount(boxes, 2));
  try {
    validateAgainstPageCount(boxes, 1);
    FAIL("expected ValidationError");
  } catch (const ValidationError &e) {
    REQUIRE(e.page() == 2);
  }
}

TEST_CASE("Rectangle files are read from disk", "[rect-file]") {
  REQUIRE_THROWS_AS(loadRectFile("/nonexistent/rects.json"), InputError);

  std::string path = "rect_file_test.json";
  {
    std::ofstream out(path);
    out << R"({"1": [{"x0": 1, "y0": 2, "x1": 3, "y1": 4}]})";
  }
  PageBoxMap boxes = loadRectFile(path);
  std::remove(path.c_str());
  REQUIRE(countBoxes(boxes) == 1);
}
