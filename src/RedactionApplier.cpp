#include "RedactionApplier.hpp"

#include "ContentRedactor.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "PageSource.hpp"
#include "QpdfSupport.hpp"

#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <tuple>

namespace redact {

namespace {

struct NamedColor {
  const char *name;
  double r, g, b;
};

const NamedColor kNamedColors[] = {
    {"black", 0.0, 0.0, 0.0}, {"white", 1.0, 1.0, 1.0},
    {"red", 1.0, 0.0, 0.0},   {"green", 0.0, 0.5, 0.0},
    {"blue", 0.0, 0.0, 1.0},  {"gray", 0.5, 0.5, 0.5},
    {"grey", 0.5, 0.5, 0.5},  {"yellow", 1.0, 1.0, 0.0},
};

std::string number(double value) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(3);
  out << value;
  std::string text = out.str();
  while (text.back() == '0') {
    text.pop_back();
  }
  if (text.back() == '.') {
    text.pop_back();
  }
  return text == "-0" ? "0" : text;
}

bool rectLess(const Rect &a, const Rect &b) {
  return std::tie(a.x0, a.y0, a.x1, a.y1) < std::tie(b.x0, b.y0, b.x1, b.y1);
}

// One filled rectangle per box; boxes are sorted so the output does not
// depend on the order they were found in
std::string fillOperators(std::vector<Rect> rects, const FillColor &fill) {
  std::sort(rects.begin(), rects.end(), rectLess);
  std::string content;
  for (const auto &rect : rects) {
    content += "q " + number(fill.r) + " " + number(fill.g) + " " +
               number(fill.b) + " rg " + number(rect.x0) + " " +
               number(rect.y0) + " " + number(rect.width()) + " " +
               number(rect.height()) + " re f Q\n";
  }
  return content;
}

PageKind kindOf(int pageIndex,
                const std::vector<PageClassification> &classifications) {
  for (const auto &classification : classifications) {
    if (classification.pageIndex == pageIndex) {
      return classification.kind;
    }
  }
  return PageKind::Mixed;
}

bool needsRaster(const std::vector<RedactionBox> &boxes, PageKind kind,
                 RasterPolicy policy) {
  bool hasOcrBox = std::any_of(
      boxes.begin(), boxes.end(),
      [](const RedactionBox &box) { return box.source == BoxSource::Ocr; });
  if (!hasOcrBox) {
    return false;
  }
  if (kind == PageKind::Scanned) {
    return true;
  }
  return policy == RasterPolicy::OcrPages && kind == PageKind::Mixed;
}

// Undo the clockwise display rotation of a rendered page
cv::Mat unrotate(const cv::Mat &image, int rotation) {
  cv::Mat result;
  switch (rotation) {
  case 90:
    cv::rotate(image, result, cv::ROTATE_90_COUNTERCLOCKWISE);
    break;
  case 180:
    cv::rotate(image, result, cv::ROTATE_180);
    break;
  case 270:
    cv::rotate(image, result, cv::ROTATE_90_CLOCKWISE);
    break;
  default:
    result = image;
    break;
  }
  return result;
}

void replaceWithRaster(QPDF &pdf, QPDFPageObjectHelper &page,
                       const PageSource &source, int pageIndex,
                       const std::vector<Rect> &rects,
                       const ApplyConfig &config) {
  PageFrame frame = source.pageFrame(pageIndex);
  cv::Mat image = source.rasterize(pageIndex, config.rasterDpi);

  cv::Scalar color(config.fill.b * 255.0, config.fill.g * 255.0,
                   config.fill.r * 255.0);
  cv::Rect bounds(0, 0, image.cols, image.rows);
  for (const auto &rect : rects) {
    PixelRect pixels = pdfRectToPixel(rect, config.rasterDpi, frame);
    cv::Rect region =
        cv::Rect(pixels.x, pixels.y, pixels.width, pixels.height) & bounds;
    if (region.area() > 0) {
      image(region).setTo(color);
    }
  }

  cv::Mat rgb;
  cv::cvtColor(unrotate(image, frame.rotation), rgb, cv::COLOR_BGR2RGB);
  std::string data(reinterpret_cast<const char *>(rgb.data),
                   rgb.total() * rgb.elemSize());

  QPDFObjectHandle imageStream = QPDFObjectHandle::newStream(&pdf, data);
  QPDFObjectHandle imageDict = imageStream.getDict();
  imageDict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
  imageDict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
  imageDict.replaceKey("/Width", QPDFObjectHandle::newInteger(rgb.cols));
  imageDict.replaceKey("/Height", QPDFObjectHandle::newInteger(rgb.rows));
  imageDict.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceRGB"));
  imageDict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));

  QPDFObjectHandle resources = QPDFObjectHandle::parse("<< /XObject << >> >>");
  resources.getKey("/XObject").replaceKey("/Im0", imageStream);

  const Rect &crop = frame.cropBox;
  std::string content = "q " + number(crop.width()) + " 0 0 " +
                        number(crop.height()) + " " + number(crop.x0) + " " +
                        number(crop.y0) + " cm /Im0 Do Q\n";

  QPDFObjectHandle pageObject = page.getObjectHandle();
  pageObject.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, content));
  pageObject.replaceKey("/Resources", resources);
}

} // anonymous namespace

FillColor FillColor::parse(const std::string &text) {
  std::string lower;
  for (char c : text) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  for (const auto &named : kNamedColors) {
    if (lower == named.name) {
      return FillColor{named.r, named.g, named.b};
    }
  }

  if (lower.size() == 7 && lower[0] == '#' &&
      std::all_of(lower.begin() + 1, lower.end(),
                  [](unsigned char c) { return std::isxdigit(c) != 0; })) {
    auto channel = [&lower](std::size_t at) {
      return std::stoi(lower.substr(at, 2), nullptr, 16) / 255.0;
    };
    return FillColor{channel(1), channel(3), channel(5)};
  }

  throw ValidationError(0, "fill",
                        "'" + text + "' is not a colour name or #rrggbb");
}

RedactionApplier::RedactionApplier(const ApplyConfig &config)
    : m_config(config) {}

ApplyResult RedactionApplier::apply(
    const Document &document, const PageBoxMap &boxes,
    const std::vector<PageClassification> &classifications) const {
  ApplyResult result;
  result.document = document;
  if (countBoxes(boxes) == 0) {
    return result;
  }

  QPDF pdf;
  loadDocument(pdf, document);
  std::vector<QPDFPageObjectHelper> pages =
      QPDFPageDocumentHelper(pdf).getAllPages();

  ContentRedactorOptions options;
  options.glyphOverlapThreshold = m_config.glyphOverlapThreshold;
  options.removeIntersectingImages = m_config.removeIntersectingImages;
  ContentRedactor redactor(options);

  std::map<int, std::vector<Rect>> rasterPages;

  for (const auto &entry : boxes) {
    int pageIndex = entry.first;
    if (entry.second.empty()) {
      continue;
    }
    if (pageIndex < 0 || pageIndex >= static_cast<int>(pages.size())) {
      throw ValidationError(pageIndex + 1, "page",
                            "document has " + std::to_string(pages.size()) +
                                " pages");
    }
    QPDFPageObjectHelper &page = pages[pageIndex];

    Rect mediaBox = rectFromArray(page.getMediaBox());
    std::vector<Rect> rects;
    for (const auto &box : entry.second) {
      Rect clipped = box.rect.clippedTo(mediaBox);
      if (!clipped.isEmpty()) {
        rects.push_back(clipped);
      }
    }

    // Same output whatever order the boxes arrive in
    std::sort(rects.begin(), rects.end(), [](const Rect &a, const Rect &b) {
      return std::tie(a.y0, a.x0, a.y1, a.x1) < std::tie(b.y0, b.x0, b.y1, b.x1);
    });

    PageApplyStats stats;
    stats.pageIndex = pageIndex;
    stats.boxesApplied = static_cast<int>(rects.size());
    if (rects.empty()) {
      result.pages.push_back(stats);
      continue;
    }

    PageContentRewrite rewrite = redactor.redactPage(page, rects);
    stats.appearancesEdited =
        redactor.redactAnnotations(page, rects, rewrite.stats);
    stats.glyphsRemoved = rewrite.stats.glyphsRemoved;
    stats.imagesRemoved = rewrite.stats.imagesRemoved;
    stats.imageCovered = rewrite.stats.imagesCovered > 0;

    std::string content = "q\n" + rewrite.content + "\n";
    for (int i = 0; i < rewrite.unbalancedSaves; ++i) {
      content += "Q\n";
    }
    content += "Q\n" + fillOperators(rects, m_config.fill);
    page.getObjectHandle().replaceKey(
        "/Contents", QPDFObjectHandle::newStream(&pdf, content));

    if (stats.imageCovered ||
        needsRaster(entry.second, kindOf(pageIndex, classifications),
                    m_config.rasterPolicy)) {
      rasterPages[pageIndex] = rects;
      stats.rasterized = true;
    }

    debugLog() << "DEBUG: Page " << (pageIndex + 1) << ": " << rects.size()
              << " boxes, " << stats.glyphsRemoved << " glyphs removed"
              << std::endl;
    result.pages.push_back(stats);
  }

  if (!rasterPages.empty()) {
    // Render the page with its text already removed, then burn the boxes
    // into the pixels as well
    Document intermediate = writeDocument(pdf, false);
    std::unique_ptr<PopplerPageSource> source =
        PopplerPageSource::open(intermediate);
    for (const auto &entry : rasterPages) {
      replaceWithRaster(pdf, pages[entry.first], *source, entry.first,
                        entry.second, m_config);
    }
  }

  QPDFPageDocumentHelper(pdf).removeUnreferencedResources();
  result.document = writeDocument(pdf, false);
  return result;
}

} // namespace redact
