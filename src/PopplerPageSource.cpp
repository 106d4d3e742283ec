#include "PageSource.hpp"

#include "Errors.hpp"
#include "TextMatcher.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <optional>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

// Poppler low-level API for image coverage
#include <GfxState.h>
#include <GlobalParams.h>
#include <Object.h>
#include <OutputDev.h>
#include <PDFDoc.h>
#include <Stream.h>
#include <goo/GooString.h>

namespace redact {

namespace {

// Append one UTF-16 code unit sequence as UTF-8
void appendUtf8(std::string &out, unsigned int codePoint) {
  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else if (codePoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
}

// Decode a poppler ustring (UTF-16) into UTF-8, one entry per code point
std::vector<std::string> splitCodePoints(const poppler::ustring &text) {
  std::vector<std::string> codePoints;
  for (std::size_t i = 0; i < text.size(); ++i) {
    unsigned int unit = text[i];
    unsigned int codePoint = unit;
    if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < text.size()) {
      unsigned int low = text[i + 1];
      if (low >= 0xDC00 && low <= 0xDFFF) {
        codePoint = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
        ++i;
      }
    }
    std::string utf8;
    appendUtf8(utf8, codePoint);
    codePoints.push_back(std::move(utf8));
  }
  return codePoints;
}

int rotationOf(poppler::page::orientation_enum orientation) {
  switch (orientation) {
  case poppler::page::landscape:
    return 90;
  case poppler::page::upside_down:
    return 180;
  case poppler::page::seascape:
    return 270;
  default:
    return 0;
  }
}

Rect toRect(const poppler::rectf &r) {
  return Rect(r.x(), r.y(), r.x() + r.width(), r.y() + r.height());
}

// Collects the device-space footprint of every image drawn on a page
class ImageCoverageOutputDev : public OutputDev {
public:
  double coverage() const {
    double pageArea = m_pageWidth * m_pageHeight;
    if (pageArea <= 0.0) {
      return 0.0;
    }
    return std::min(1.0, unionArea(m_footprints) / pageArea);
  }

  // Required OutputDev overrides
  bool upsideDown() override { return false; }
  bool useDrawChar() override { return false; }
  bool interpretType3Chars() override { return false; }
  bool needNonText() override { return true; }

  void startPage(int /*pageNum*/, GfxState *state, XRef * /*xref*/) override {
    m_footprints.clear();
    if (state != nullptr) {
      m_pageWidth = state->getPageWidth();
      m_pageHeight = state->getPageHeight();
    }
  }

  void drawImageMask(GfxState *state, Object *ref, Stream *str, int width,
                     int height, bool invert, bool interpolate,
                     bool inlineImg) override {
    recordFootprint(state);
    OutputDev::drawImageMask(state, ref, str, width, height, invert,
                             interpolate, inlineImg);
  }

  // Masked variants fall through to drawImage in the base class
  void drawImage(GfxState *state, Object *ref, Stream *str, int width,
                 int height, GfxImageColorMap *colorMap, bool interpolate,
                 const int *maskColors, bool inlineImg) override {
    recordFootprint(state);
    OutputDev::drawImage(state, ref, str, width, height, colorMap, interpolate,
                         maskColors, inlineImg);
  }

private:
  void recordFootprint(GfxState *state) {
    // The CTM maps the unit square onto the image; take the bounding box of
    // its four corners
    const auto &ctm = state->getCTM();
    double xs[4] = {ctm[4], ctm[4] + ctm[0], ctm[4] + ctm[2],
                    ctm[4] + ctm[0] + ctm[2]};
    double ys[4] = {ctm[5], ctm[5] + ctm[1], ctm[5] + ctm[3],
                    ctm[5] + ctm[1] + ctm[3]};
    Rect footprint(*std::min_element(xs, xs + 4), *std::min_element(ys, ys + 4),
                   *std::max_element(xs, xs + 4),
                   *std::max_element(ys, ys + 4));
    Rect clipped = footprint.clippedTo(Rect(0.0, 0.0, m_pageWidth, m_pageHeight));
    if (!clipped.isEmpty()) {
      m_footprints.push_back(clipped);
    }
  }

  std::vector<Rect> m_footprints;
  double m_pageWidth = 0.0;
  double m_pageHeight = 0.0;
};

} // anonymous namespace

PopplerPageSource::PopplerPageSource(const Document &document)
    : m_document(document) {}

PopplerPageSource::~PopplerPageSource() = default;

std::unique_ptr<PopplerPageSource>
PopplerPageSource::open(const Document &document) {
  std::unique_ptr<PopplerPageSource> source(new PopplerPageSource(document));

  const std::string &bytes = source->m_document.bytes();
  source->m_popplerDocument.reset(poppler::document::load_from_raw_data(
      bytes.data(), static_cast<int>(bytes.size()), document.password(),
      document.password()));

  if (!source->m_popplerDocument) {
    throw InputError("Failed to load PDF document (corrupt or unsupported)");
  }
  if (source->m_popplerDocument->is_locked()) {
    throw InputError(document.password().empty()
                         ? "PDF document is password protected"
                         : "Wrong password for PDF document");
  }
  return source;
}

int PopplerPageSource::pageCount() const {
  return m_popplerDocument->pages();
}

namespace {

std::unique_ptr<poppler::page> loadPage(poppler::document &document,
                                        int pageIndex) {
  if (pageIndex < 0 || pageIndex >= document.pages()) {
    throw PageProcessingError(pageIndex, "page index out of range");
  }
  std::unique_ptr<poppler::page> page(document.create_page(pageIndex));
  if (!page) {
    throw PageProcessingError(pageIndex, "failed to load page");
  }
  return page;
}

} // anonymous namespace

PageFrame PopplerPageSource::pageFrame(int pageIndex) const {
  std::unique_ptr<poppler::page> page =
      loadPage(*m_popplerDocument, pageIndex);

  PageFrame frame;
  frame.mediaBox = toRect(page->page_rect(poppler::media_box));
  frame.cropBox = toRect(page->page_rect(poppler::crop_box));
  if (frame.cropBox.isEmpty()) {
    frame.cropBox = frame.mediaBox;
  }
  frame.rotation = rotationOf(page->orientation());
  return frame;
}

std::vector<TextRun> PopplerPageSource::textRuns(int pageIndex) const {
  std::unique_ptr<poppler::page> page =
      loadPage(*m_popplerDocument, pageIndex);
  PageFrame frame = pageFrame(pageIndex);

  std::vector<TextRun> runs;
  std::vector<poppler::text_box> textBoxes = page->text_list();

  for (auto &textBox : textBoxes) {
    std::vector<std::string> codePoints = splitCodePoints(textBox.text());
    if (codePoints.empty()) {
      continue;
    }

    // Text boxes are in display space (origin top-left, rotation applied)
    poppler::rectf bbox = textBox.bbox();
    TextRun run;
    run.box = frame.displayToUser(bbox.left(), bbox.top(), bbox.right(),
                                  bbox.bottom());
    run.spaceAfter = textBox.has_space_after();

    bool glyphsUsable = true;
    for (std::size_t i = 0; i < codePoints.size(); ++i) {
      run.text += codePoints[i];
      poppler::rectf charBox = textBox.char_bbox(i);
      if (charBox.width() <= 0.0 && charBox.height() <= 0.0) {
        glyphsUsable = false;
        continue;
      }
      run.glyphBoxes.push_back(frame.displayToUser(
          charBox.left(), charBox.top(), charBox.right(), charBox.bottom()));
    }
    if (!glyphsUsable || run.glyphBoxes.size() != codePoints.size()) {
      run.glyphBoxes.clear();
    }

    runs.push_back(std::move(run));
  }

  return runs;
}

std::string PopplerPageSource::pageText(int pageIndex) const {
  return NormalizedText::fromRuns(textRuns(pageIndex)).text();
}

cv::Mat PopplerPageSource::rasterize(int pageIndex, double dpi) const {
  std::unique_ptr<poppler::page> page =
      loadPage(*m_popplerDocument, pageIndex);

  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);
  if (!popplerImage.is_valid()) {
    throw PageProcessingError(pageIndex, "failed to render page");
  }

  int width = popplerImage.width();
  int height = popplerImage.height();
  cv::Mat mat;

  switch (popplerImage.format()) {
  case poppler::image::format_argb32: {
    // ARGB32 is stored as BGRA in memory
    mat = cv::Mat(height, width, CV_8UC4,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
    break;
  }
  case poppler::image::format_rgb24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_RGB2BGR);
    break;
  }
  case poppler::image::format_bgr24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    break;
  }
  case poppler::image::format_gray8: {
    mat = cv::Mat(height, width, CV_8UC1,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_GRAY2BGR);
    break;
  }
  default:
    throw PageProcessingError(pageIndex, "unsupported rendered image format");
  }

  return mat;
}

PDFDoc &PopplerPageSource::coreDocument() const {
  if (!m_coreDocument) {
    // Required before any use of the low-level API
    if (!m_globalParams) {
      m_globalParams = std::make_unique<GlobalParamsIniter>(nullptr);
    }

    const std::string &bytes = m_document.bytes();
    auto *stream = new MemStream(bytes.data(), 0,
                                 static_cast<Goffset>(bytes.size()),
                                 Object(objNull));
    std::optional<GooString> password;
    if (!m_document.password().empty()) {
      password = GooString(m_document.password());
    }
    auto doc = std::make_unique<PDFDoc>(stream, password, password);
    if (!doc->isOk()) {
      throw InputError("Failed to load PDF document for image analysis");
    }
    m_coreDocument = std::move(doc);
  }
  return *m_coreDocument;
}

double PopplerPageSource::imageCoverage(int pageIndex) const {
  if (pageIndex < 0 || pageIndex >= pageCount()) {
    throw PageProcessingError(pageIndex, "page index out of range");
  }

  PDFDoc &doc = coreDocument();
  ImageCoverageOutputDev outputDev;
  doc.displayPage(&outputDev, pageIndex + 1, 72.0, 72.0,
                  0,      // rotation
                  false,  // useMediaBox
                  true,   // crop
                  false); // printing
  return outputDev.coverage();
}

} // namespace redact
