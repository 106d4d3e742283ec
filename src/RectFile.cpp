#include "RectFile.hpp"

#include "Errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace redact {

namespace {

// Page keys are plain decimal integers starting at 1
int parsePageKey(const std::string &key) {
  if (key.empty() || key.size() > 9 ||
      !std::all_of(key.begin(), key.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw ValidationError(0, "page", "page key '" + key + "' is not an integer");
  }
  int page = std::stoi(key);
  if (page < 1) {
    throw ValidationError(page, "page", "page numbers start at 1");
  }
  return page;
}

double coordinate(const json &entry, const char *field, int page) {
  auto it = entry.find(field);
  if (it == entry.end()) {
    throw ValidationError(page, field, "missing coordinate");
  }
  if (!it->is_number()) {
    throw ValidationError(page, field, "coordinate is not a number");
  }
  return it->get<double>();
}

} // anonymous namespace

PageBoxMap parseRectJson(const std::string &text) {
  json document;
  try {
    document = json::parse(text);
  } catch (const json::parse_error &e) {
    throw ValidationError(0, "", std::string("not valid JSON: ") + e.what());
  }
  if (!document.is_object()) {
    throw ValidationError(0, "", "top level must be an object keyed by page");
  }

  PageBoxMap boxes;
  for (auto it = document.begin(); it != document.end(); ++it) {
    int page = parsePageKey(it.key());
    const json &entries = it.value();
    if (!entries.is_array()) {
      throw ValidationError(page, "rects", "value must be an array");
    }

    for (const auto &entry : entries) {
      if (!entry.is_object()) {
        throw ValidationError(page, "rects", "rectangle must be an object");
      }
      Rect rect(coordinate(entry, "x0", page), coordinate(entry, "y0", page),
                coordinate(entry, "x1", page), coordinate(entry, "y1", page));
      if (!(rect.x0 < rect.x1)) {
        throw ValidationError(page, "x0", "x0 must be less than x1");
      }
      if (!(rect.y0 < rect.y1)) {
        throw ValidationError(page, "y0", "y0 must be less than y1");
      }

      RedactionBox box;
      box.pageIndex = page - 1;
      box.rect = rect;
      box.source = BoxSource::Manual;
      boxes[page - 1].push_back(box);
    }
  }
  return boxes;
}

PageBoxMap loadRectFile(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw InputError("Cannot open rectangle file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseRectJson(buffer.str());
}

void validateAgainstPageCount(const PageBoxMap &boxes, int pageCount) {
  for (const auto &entry : boxes) {
    if (entry.first >= pageCount) {
      throw ValidationError(entry.first + 1, "page",
                            "document has only " + std::to_string(pageCount) +
                                " pages");
    }
  }
}

} // namespace redact
