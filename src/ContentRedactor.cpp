#include "ContentRedactor.hpp"

#include "FontMetrics.hpp"
#include "Log.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/Pl_Buffer.hh>
#include <qpdf/Pl_QPDFTokenizer.hh>
#include <qpdf/QPDFAnnotationObjectHelper.hh>
#include <qpdf/QPDFTokenizer.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>

namespace redact {

Matrix Matrix::then(const Matrix &o) const {
  Matrix r;
  r.a = a * o.a + b * o.c;
  r.b = a * o.b + b * o.d;
  r.c = c * o.a + d * o.c;
  r.d = c * o.b + d * o.d;
  r.e = e * o.a + f * o.c + o.e;
  r.f = e * o.b + f * o.d + o.f;
  return r;
}

Rect Matrix::transform(const Rect &rect) const {
  double xs[4];
  double ys[4];
  double px[4] = {rect.x0, rect.x1, rect.x0, rect.x1};
  double py[4] = {rect.y0, rect.y0, rect.y1, rect.y1};
  for (int i = 0; i < 4; ++i) {
    xs[i] = a * px[i] + c * py[i] + e;
    ys[i] = b * px[i] + d * py[i] + f;
  }
  return Rect(*std::min_element(xs, xs + 4), *std::min_element(ys, ys + 4),
              *std::max_element(xs, xs + 4), *std::max_element(ys, ys + 4));
}

Matrix Matrix::translation(double tx, double ty) {
  Matrix m;
  m.e = tx;
  m.f = ty;
  return m;
}

Matrix Matrix::fromArray(QPDFObjectHandle array) {
  Matrix m;
  if (!array.isArray() || array.getArrayNItems() != 6) {
    return m;
  }
  double values[6];
  for (int i = 0; i < 6; ++i) {
    QPDFObjectHandle item = array.getArrayItem(i);
    if (!item.isNumber()) {
      return Matrix();
    }
    values[i] = item.getNumericValue();
  }
  m.a = values[0];
  m.b = values[1];
  m.c = values[2];
  m.d = values[3];
  m.e = values[4];
  m.f = values[5];
  return m;
}

ContentRedactionStats &
ContentRedactionStats::operator+=(const ContentRedactionStats &other) {
  glyphsRemoved += other.glyphsRemoved;
  showOperatorsRewritten += other.showOperatorsRewritten;
  imagesRemoved += other.imagesRemoved;
  imagesCovered += other.imagesCovered;
  formsCopied += other.formsCopied;
  markedContentStripped += other.markedContentStripped;
  return *this;
}

namespace {

constexpr int kMaxFormDepth = 12;

using FormPlacements = std::map<std::string, std::vector<Matrix>>;

std::string formatNumber(double value) {
  if (std::fabs(value) < 0.0005) {
    return "0";
  }
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.3f", value);
  std::string text = buffer;
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text;
}

bool isNumberToken(const QPDFTokenizer::Token &token) {
  return token.getType() == QPDFTokenizer::tt_integer ||
         token.getType() == QPDFTokenizer::tt_real;
}

double tokenNumber(const QPDFTokenizer::Token &token) {
  return std::strtod(token.getValue().c_str(), nullptr);
}

bool intersectsAny(const Rect &rect, const std::vector<Rect> &boxes) {
  return std::any_of(boxes.begin(), boxes.end(),
                     [&rect](const Rect &box) { return rect.intersects(box); });
}

// Token filter that tracks the graphics and text state of a content stream
// and drops the glyphs whose boxes fall under a redaction rectangle
class GlyphRemovalFilter : public QPDFObjectHandle::TokenFilter {
public:
  GlyphRemovalFilter(QPDFObjectHandle resources, const std::vector<Rect> &boxes,
                     const Matrix &ctm, const ContentRedactorOptions &options)
      : m_resources(resources), m_boxes(boxes), m_options(options) {
    m_state.ctm = ctm;
  }

  void handleToken(QPDFTokenizer::Token const &token) override {
    switch (token.getType()) {
    case QPDFTokenizer::tt_space:
    case QPDFTokenizer::tt_comment:
      m_pending += token.getRawValue();
      break;
    case QPDFTokenizer::tt_inline_image:
      m_pending += token.getRawValue();
      finishInlineImage();
      break;
    case QPDFTokenizer::tt_word:
      if (m_inInlineImage) {
        m_pending += token.getRawValue();
        break;
      }
      if (m_dropNextEI && token.getValue() == "EI") {
        m_dropNextEI = false;
        m_pending.clear();
        m_operands.clear();
        break;
      }
      m_dropNextEI = false;
      handleOperator(token.getValue(), token.getRawValue());
      break;
    case QPDFTokenizer::tt_eof:
      break;
    default:
      m_pending += token.getRawValue();
      if (!m_inInlineImage) {
        m_operands.push_back(token);
      }
      break;
    }
  }

  void handleEOF() override {
    write(m_pending);
    m_pending.clear();
  }

  bool changed() const { return m_changed; }
  int openSaves() const { return m_openSaves; }
  const ContentRedactionStats &stats() const { return m_stats; }
  const FormPlacements &formPlacements() const { return m_forms; }

private:
  struct GraphicsState {
    Matrix ctm;
    double charSpacing = 0.0;
    double wordSpacing = 0.0;
    double horizontalScale = 1.0;
    double leading = 0.0;
    double fontSize = 0.0;
    double rise = 0.0;
    const FontMetrics *font = nullptr;
  };

  // One element of a rewritten TJ array
  struct ShowElement {
    bool isString;
    std::string bytes;
    double adjustment;
  };

  void emit(const std::string &operatorText) {
    write(m_pending);
    write(operatorText);
    m_pending.clear();
    m_operands.clear();
  }

  void discard() {
    m_pending.clear();
    m_operands.clear();
  }

  std::vector<double> numericOperands() const {
    std::vector<double> numbers;
    for (const auto &token : m_operands) {
      if (isNumberToken(token)) {
        numbers.push_back(tokenNumber(token));
      }
    }
    return numbers;
  }

  const FontMetrics *fontNamed(const std::string &name) {
    auto it = m_fonts.find(name);
    if (it != m_fonts.end()) {
      return &it->second;
    }
    QPDFObjectHandle font;
    if (m_resources.isDictionary()) {
      QPDFObjectHandle fonts = m_resources.getKey("/Font");
      if (fonts.isDictionary()) {
        font = fonts.getKey(name);
      }
    }
    FontMetrics metrics = font.isInitialized() ? FontMetrics::fromFont(font)
                                               : FontMetrics();
    return &m_fonts.emplace(name, metrics).first->second;
  }

  void moveLine(double tx, double ty) {
    m_lineMatrix = Matrix::translation(tx, ty).then(m_lineMatrix);
    m_textMatrix = m_lineMatrix;
  }

  void handleOperator(const std::string &op, const std::string &raw) {
    if (op == "BI") {
      write(m_pending);
      m_pending = raw;
      m_operands.clear();
      m_inInlineImage = true;
      return;
    }
    if (op == "Tj" || op == "TJ" || op == "'" || op == "\"") {
      if (showText(op)) {
        discard();
        return;
      }
      emit(raw);
      return;
    }
    if (op == "Do" && dropImageXObject()) {
      discard();
      return;
    }
    if (op == "BDC") {
      stripMarkedContentText();
    }

    updateState(op);
    emit(raw);
  }

  void updateState(const std::string &op) {
    std::vector<double> n = numericOperands();

    if (op == "q") {
      m_stack.push_back(m_state);
      ++m_openSaves;
    } else if (op == "Q") {
      if (!m_stack.empty()) {
        m_state = m_stack.back();
        m_stack.pop_back();
      }
      if (m_openSaves > 0) {
        --m_openSaves;
      }
    } else if (op == "cm" && n.size() >= 6) {
      std::size_t k = n.size() - 6;
      Matrix m;
      m.a = n[k];
      m.b = n[k + 1];
      m.c = n[k + 2];
      m.d = n[k + 3];
      m.e = n[k + 4];
      m.f = n[k + 5];
      m_state.ctm = m.then(m_state.ctm);
    } else if (op == "BT") {
      m_textMatrix = Matrix();
      m_lineMatrix = Matrix();
    } else if (op == "Tc" && !n.empty()) {
      m_state.charSpacing = n.back();
    } else if (op == "Tw" && !n.empty()) {
      m_state.wordSpacing = n.back();
    } else if (op == "Tz" && !n.empty()) {
      m_state.horizontalScale = n.back() / 100.0;
    } else if (op == "TL" && !n.empty()) {
      m_state.leading = n.back();
    } else if (op == "Ts" && !n.empty()) {
      m_state.rise = n.back();
    } else if (op == "Tf" && !n.empty()) {
      m_state.fontSize = n.back();
      for (const auto &token : m_operands) {
        if (token.getType() == QPDFTokenizer::tt_name) {
          m_state.font = fontNamed(token.getValue());
        }
      }
    } else if (op == "Td" && n.size() >= 2) {
      moveLine(n[n.size() - 2], n.back());
    } else if (op == "TD" && n.size() >= 2) {
      m_state.leading = -n.back();
      moveLine(n[n.size() - 2], n.back());
    } else if (op == "Tm" && n.size() >= 6) {
      std::size_t k = n.size() - 6;
      Matrix m;
      m.a = n[k];
      m.b = n[k + 1];
      m.c = n[k + 2];
      m.d = n[k + 3];
      m.e = n[k + 4];
      m.f = n[k + 5];
      m_textMatrix = m;
      m_lineMatrix = m;
    } else if (op == "T*") {
      moveLine(0.0, -m_state.leading);
    }
  }

  bool glyphUnderBox(const Rect &glyph) const {
    double area = glyph.area();
    if (area <= 1e-9) {
      double cx = (glyph.x0 + glyph.x1) / 2.0;
      double cy = (glyph.y0 + glyph.y1) / 2.0;
      return std::any_of(m_boxes.begin(), m_boxes.end(), [&](const Rect &box) {
        return cx >= box.x0 && cx <= box.x1 && cy >= box.y0 && cy <= box.y1;
      });
    }
    std::vector<Rect> overlaps;
    for (const auto &box : m_boxes) {
      Rect overlap = glyph.intersection(box);
      if (!overlap.isEmpty()) {
        overlaps.push_back(overlap);
      }
    }
    if (overlaps.empty()) {
      return false;
    }
    return unionArea(overlaps) / area >= m_options.glyphOverlapThreshold;
  }

  // Walks the glyphs of a text showing operator, advancing the text matrix.
  // Returns true when the operator was rewritten (and already written).
  bool showText(const std::string &op) {
    std::vector<const QPDFTokenizer::Token *> elements;
    if (op == "TJ") {
      bool inArray = false;
      for (const auto &token : m_operands) {
        if (token.getType() == QPDFTokenizer::tt_array_open) {
          inArray = true;
        } else if (token.getType() == QPDFTokenizer::tt_array_close) {
          inArray = false;
        } else if (inArray && (token.getType() == QPDFTokenizer::tt_string ||
                               isNumberToken(token))) {
          elements.push_back(&token);
        }
      }
    } else {
      for (const auto &token : m_operands) {
        if (token.getType() == QPDFTokenizer::tt_string) {
          elements.assign(1, &token);
        }
      }
      if (elements.empty()) {
        return false;
      }
    }

    std::string prefix;
    if (op == "'") {
      moveLine(0.0, -m_state.leading);
      prefix = "T* ";
    } else if (op == "\"") {
      std::vector<const QPDFTokenizer::Token *> numbers;
      for (const auto &token : m_operands) {
        if (isNumberToken(token)) {
          numbers.push_back(&token);
        }
      }
      if (numbers.size() < 2) {
        return false;
      }
      m_state.wordSpacing = tokenNumber(*numbers[0]);
      m_state.charSpacing = tokenNumber(*numbers[1]);
      moveLine(0.0, -m_state.leading);
      prefix = numbers[0]->getRawValue() + " Tw " + numbers[1]->getRawValue() +
               " Tc T* ";
    }

    FontMetrics fallback;
    const FontMetrics &font = m_state.font ? *m_state.font : fallback;
    double size = m_state.fontSize;
    double scale = m_state.horizontalScale;
    double bottom = font.descent() / 1000.0 * size + m_state.rise;
    double top = font.ascent() / 1000.0 * size + m_state.rise;
    std::size_t codeLength = font.isTwoByte() ? 2 : 1;

    std::vector<ShowElement> output;
    std::string kept;
    double adjustment = 0.0;
    int removed = 0;

    auto flushKept = [&]() {
      if (!kept.empty()) {
        output.push_back(ShowElement{true, kept, 0.0});
        kept.clear();
      }
    };

    for (const auto *element : elements) {
      if (isNumberToken(*element)) {
        double n = tokenNumber(*element);
        adjustment += n;
        m_textMatrix =
            Matrix::translation(-n / 1000.0 * size * scale, 0.0).then(m_textMatrix);
        continue;
      }

      const std::string &bytes = element->getValue();
      std::size_t pos = 0;
      while (pos < bytes.size()) {
        std::size_t len = std::min(codeLength, bytes.size() - pos);
        unsigned int code = 0;
        for (std::size_t k = 0; k < len; ++k) {
          code = (code << 8) | static_cast<unsigned char>(bytes[pos + k]);
        }
        std::string codeBytes = bytes.substr(pos, len);
        pos += len;

        double w = len == codeLength ? font.width(code) : 0.0;
        double spacing = m_state.charSpacing;
        if (codeLength == 1 && code == 32) {
          spacing += m_state.wordSpacing;
        }

        Matrix toUser = m_textMatrix.then(m_state.ctm);
        Rect glyph = toUser.transform(Rect(0.0, bottom, w / 1000.0 * size * scale, top));
        bool drop = glyphUnderBox(glyph);

        if (drop) {
          ++removed;
          if (size != 0.0) {
            adjustment -= w + spacing * 1000.0 / size;
          }
        } else {
          if (adjustment != 0.0) {
            flushKept();
            output.push_back(ShowElement{false, "", adjustment});
            adjustment = 0.0;
          }
          kept += codeBytes;
        }

        double tx = (w / 1000.0 * size + spacing) * scale;
        m_textMatrix = Matrix::translation(tx, 0.0).then(m_textMatrix);
      }
    }

    if (removed == 0) {
      return false;
    }

    flushKept();
    if (adjustment != 0.0) {
      output.push_back(ShowElement{false, "", adjustment});
    }

    std::string replacement = "\n" + prefix + "[";
    for (const auto &item : output) {
      if (item.isString) {
        replacement += "<" + QUtil::hex_encode(item.bytes) + ">";
      } else {
        replacement += " " + formatNumber(item.adjustment) + " ";
      }
    }
    replacement += "] TJ";
    write(replacement);

    m_changed = true;
    m_stats.glyphsRemoved += removed;
    ++m_stats.showOperatorsRewritten;
    return true;
  }

  QPDFObjectHandle xobjectNamed(const std::string &name) const {
    if (m_resources.isDictionary()) {
      QPDFObjectHandle xobjects = m_resources.getKey("/XObject");
      if (xobjects.isDictionary() && xobjects.hasKey(name)) {
        return xobjects.getKey(name);
      }
    }
    return QPDFObjectHandle::newNull();
  }

  // Records form placements; returns true when an image is to be dropped
  bool dropImageXObject() {
    std::string name;
    for (const auto &token : m_operands) {
      if (token.getType() == QPDFTokenizer::tt_name) {
        name = token.getValue();
      }
    }
    QPDFObjectHandle xobject = xobjectNamed(name);
    if (!xobject.isStream()) {
      return false;
    }
    QPDFObjectHandle subtype = xobject.getDict().getKey("/Subtype");
    if (subtype.isName() && subtype.getName() == "/Form") {
      m_forms[name].push_back(m_state.ctm);
      return false;
    }
    if (subtype.isName() && subtype.getName() == "/Image") {
      Rect placement = m_state.ctm.transform(Rect(0.0, 0.0, 1.0, 1.0));
      if (!intersectsAny(placement, m_boxes)) {
        return false;
      }
      if (m_options.removeIntersectingImages) {
        ++m_stats.imagesRemoved;
        m_changed = true;
        return true;
      }
      ++m_stats.imagesCovered;
    }
    return false;
  }

  void finishInlineImage() {
    m_inInlineImage = false;
    Rect placement = m_state.ctm.transform(Rect(0.0, 0.0, 1.0, 1.0));
    if (intersectsAny(placement, m_boxes)) {
      if (m_options.removeIntersectingImages) {
        ++m_stats.imagesRemoved;
        m_changed = true;
        m_dropNextEI = true;
        discard();
        return;
      }
      ++m_stats.imagesCovered;
    }
    write(m_pending);
    discard();
  }

  // Replacement text for marked content lives in the property list; drop it
  // so removed glyphs do not survive there
  void stripMarkedContentText() {
    std::size_t open = m_pending.find("<<");
    std::size_t close = m_pending.rfind(">>");
    if (open == std::string::npos || close == std::string::npos ||
        close < open) {
      return;
    }
    std::string dictText = m_pending.substr(open, close + 2 - open);
    try {
      QPDFObjectHandle properties = QPDFObjectHandle::parse(dictText);
      if (!properties.isDictionary()) {
        return;
      }
      int stripped = 0;
      for (const char *key : {"/ActualText", "/Alt", "/E"}) {
        if (properties.hasKey(key)) {
          properties.removeKey(key);
          ++stripped;
        }
      }
      if (stripped > 0) {
        m_pending = m_pending.substr(0, open) + properties.unparse() +
                    m_pending.substr(close + 2);
        m_stats.markedContentStripped += stripped;
        m_changed = true;
      }
    } catch (const std::exception &e) {
      debugLog() << "DEBUG: Unparsable marked content properties: " << e.what()
                << std::endl;
    }
  }

  QPDFObjectHandle m_resources;
  const std::vector<Rect> &m_boxes;
  ContentRedactorOptions m_options;

  GraphicsState m_state;
  std::vector<GraphicsState> m_stack;
  Matrix m_textMatrix;
  Matrix m_lineMatrix;
  std::map<std::string, FontMetrics> m_fonts;

  std::string m_pending;
  std::vector<QPDFTokenizer::Token> m_operands;
  bool m_inInlineImage = false;
  bool m_dropNextEI = false;

  bool m_changed = false;
  int m_openSaves = 0;
  ContentRedactionStats m_stats;
  FormPlacements m_forms;
};

struct FilterOutcome {
  std::string content;
  bool changed = false;
  int openSaves = 0;
  ContentRedactionStats stats;
  FormPlacements forms;
};

FilterOutcome runFilter(const std::string &data, QPDFObjectHandle resources,
                        const Matrix &ctm, const std::vector<Rect> &boxes,
                        const ContentRedactorOptions &options) {
  GlyphRemovalFilter filter(resources, boxes, ctm, options);
  Pl_Buffer buffer("redacted content");
  Pl_QPDFTokenizer tokenizer("redaction filter", &filter, &buffer);
  tokenizer.write(reinterpret_cast<unsigned char const *>(data.data()),
                  data.size());
  tokenizer.finish();

  FilterOutcome outcome;
  std::unique_ptr<Buffer> result(buffer.getBuffer());
  if (result && result->getSize() > 0) {
    outcome.content.assign(reinterpret_cast<char const *>(result->getBuffer()),
                           result->getSize());
  }
  outcome.changed = filter.changed();
  outcome.openSaves = filter.openSaves();
  outcome.stats = filter.stats();
  outcome.forms = filter.formPlacements();
  return outcome;
}

bool isFormXObject(QPDFObjectHandle object) {
  if (!object.isStream()) {
    return false;
  }
  QPDFObjectHandle subtype = object.getDict().getKey("/Subtype");
  return subtype.isName() && subtype.getName() == "/Form";
}

QPDFObjectHandle redactFormsIn(QPDFObjectHandle resources,
                               const FormPlacements &placements,
                               const std::vector<Rect> &boxes,
                               const ContentRedactorOptions &options,
                               int depth, ContentRedactionStats &stats);

// Returns an edited copy of `form`, or null when nothing under the boxes
QPDFObjectHandle redactForm(QPDFObjectHandle form,
                            const std::vector<Matrix> &placements,
                            QPDFObjectHandle inheritedResources,
                            const std::vector<Rect> &boxes,
                            const ContentRedactorOptions &options, int depth,
                            ContentRedactionStats &stats) {
  QPDFObjectHandle dict = form.getDict();
  QPDFObjectHandle resources = dict.getKey("/Resources");
  if (!resources.isDictionary()) {
    resources = inheritedResources;
  }
  Matrix formMatrix = Matrix::fromArray(dict.getKey("/Matrix"));

  std::string data;
  try {
    std::shared_ptr<Buffer> buffer = form.getStreamData(qpdf_dl_generalized);
    data.assign(reinterpret_cast<char const *>(buffer->getBuffer()),
                buffer->getSize());
  } catch (const std::exception &e) {
    debugLog() << "DEBUG: Cannot decode form XObject: " << e.what()
              << std::endl;
    return QPDFObjectHandle::newNull();
  }

  bool changed = false;
  FormPlacements nested;
  for (const auto &placement : placements) {
    FilterOutcome outcome =
        runFilter(data, resources, formMatrix.then(placement), boxes, options);
    if (outcome.changed) {
      data = outcome.content;
      changed = true;
      stats += outcome.stats;
    }
    for (const auto &entry : outcome.forms) {
      auto &target = nested[entry.first];
      target.insert(target.end(), entry.second.begin(), entry.second.end());
    }
  }

  QPDFObjectHandle nestedXObjects =
      redactFormsIn(resources, nested, boxes, options, depth + 1, stats);
  if (!changed && nestedXObjects.isNull()) {
    return QPDFObjectHandle::newNull();
  }

  QPDFObjectHandle copy = form.copyStream();
  if (changed) {
    copy.replaceStreamData(data, QPDFObjectHandle::newNull(),
                           QPDFObjectHandle::newNull());
  }
  if (!nestedXObjects.isNull()) {
    QPDFObjectHandle newResources =
        resources.isDictionary() ? resources.shallowCopy()
                                 : QPDFObjectHandle::newDictionary();
    newResources.replaceKey("/XObject", nestedXObjects);
    copy.getDict().replaceKey("/Resources", newResources);
  }
  ++stats.formsCopied;
  return copy;
}

// Returns a replacement /XObject dictionary, or null when no form changed
QPDFObjectHandle redactFormsIn(QPDFObjectHandle resources,
                               const FormPlacements &placements,
                               const std::vector<Rect> &boxes,
                               const ContentRedactorOptions &options,
                               int depth, ContentRedactionStats &stats) {
  if (placements.empty() || depth >= kMaxFormDepth ||
      !resources.isDictionary()) {
    return QPDFObjectHandle::newNull();
  }
  QPDFObjectHandle xobjects = resources.getKey("/XObject");
  if (!xobjects.isDictionary()) {
    return QPDFObjectHandle::newNull();
  }

  QPDFObjectHandle replacement = QPDFObjectHandle::newNull();
  for (const auto &entry : placements) {
    QPDFObjectHandle form = xobjects.getKey(entry.first);
    if (!isFormXObject(form)) {
      continue;
    }
    QPDFObjectHandle edited = redactForm(form, entry.second, resources, boxes,
                                         options, depth, stats);
    if (edited.isNull()) {
      continue;
    }
    if (replacement.isNull()) {
      replacement = xobjects.shallowCopy();
    }
    replacement.replaceKey(entry.first, edited);
  }
  return replacement;
}

// Maps an appearance stream's transformed bounding box onto the annotation
// rectangle
Matrix appearancePlacement(QPDFObjectHandle appearance, const Rect &rect) {
  QPDFObjectHandle dict = appearance.getDict();
  Matrix formMatrix = Matrix::fromArray(dict.getKey("/Matrix"));
  QPDFObjectHandle bboxArray = dict.getKey("/BBox");
  Rect bbox(0.0, 0.0, rect.width(), rect.height());
  if (bboxArray.isRectangle()) {
    QPDFObjectHandle::Rectangle r = bboxArray.getArrayAsRectangle();
    bbox = Rect(std::min(r.llx, r.urx), std::min(r.lly, r.ury),
                std::max(r.llx, r.urx), std::max(r.lly, r.ury));
  }
  Rect transformed = formMatrix.transform(bbox);
  Matrix placement;
  if (transformed.width() > 0.0 && transformed.height() > 0.0) {
    placement.a = rect.width() / transformed.width();
    placement.d = rect.height() / transformed.height();
  }
  placement.e = rect.x0 - transformed.x0 * placement.a;
  placement.f = rect.y0 - transformed.y0 * placement.d;
  return placement;
}

} // anonymous namespace

ContentRedactor::ContentRedactor(const ContentRedactorOptions &options)
    : m_options(options) {}

PageContentRewrite ContentRedactor::redactPage(QPDFPageObjectHelper &page,
                                               const std::vector<Rect> &boxes) {
  PageContentRewrite rewrite;

  Pl_Buffer contents("page contents");
  page.pipeContents(&contents);
  std::unique_ptr<Buffer> buffer(contents.getBuffer());
  std::string data;
  if (buffer && buffer->getSize() > 0) {
    data.assign(reinterpret_cast<char const *>(buffer->getBuffer()),
                buffer->getSize());
  }

  QPDFObjectHandle resources = page.getAttribute("/Resources", false);
  FilterOutcome outcome = runFilter(data, resources, Matrix(), boxes, m_options);
  rewrite.content = outcome.changed ? outcome.content : data;
  rewrite.unbalancedSaves = outcome.openSaves;
  rewrite.changed = outcome.changed;
  rewrite.stats = outcome.stats;

  QPDFObjectHandle xobjects = redactFormsIn(resources, outcome.forms, boxes,
                                            m_options, 0, rewrite.stats);
  if (!xobjects.isNull()) {
    QPDFObjectHandle newResources = resources.shallowCopy();
    newResources.replaceKey("/XObject", xobjects);
    page.getObjectHandle().replaceKey("/Resources", newResources);
    rewrite.changed = true;
  }

  return rewrite;
}

int ContentRedactor::redactAnnotations(QPDFPageObjectHelper &page,
                                       const std::vector<Rect> &boxes,
                                       ContentRedactionStats &stats) {
  int replaced = 0;
  QPDFObjectHandle resources = page.getAttribute("/Resources", false);

  for (auto &annotation : page.getAnnotations()) {
    QPDFObjectHandle::Rectangle r = annotation.getRect();
    Rect rect(std::min(r.llx, r.urx), std::min(r.lly, r.ury),
              std::max(r.llx, r.urx), std::max(r.lly, r.ury));
    if (!intersectsAny(rect, boxes)) {
      continue;
    }

    QPDFObjectHandle annot = annotation.getObjectHandle();
    QPDFObjectHandle appearances = annot.getKey("/AP");
    if (!appearances.isDictionary()) {
      continue;
    }

    QPDFObjectHandle newAppearances = appearances.shallowCopy();
    bool changed = false;
    for (const auto &key : appearances.getKeys()) {
      QPDFObjectHandle entry = appearances.getKey(key);
      if (entry.isStream()) {
        QPDFObjectHandle edited =
            redactForm(entry, {appearancePlacement(entry, rect)}, resources,
                       boxes, m_options, 0, stats);
        if (!edited.isNull()) {
          newAppearances.replaceKey(key, edited);
          changed = true;
        }
      } else if (entry.isDictionary()) {
        // Appearance states (/On, /Off, ...)
        QPDFObjectHandle newStates = entry.shallowCopy();
        bool statesChanged = false;
        for (const auto &state : entry.getKeys()) {
          QPDFObjectHandle stream = entry.getKey(state);
          if (!stream.isStream()) {
            continue;
          }
          QPDFObjectHandle edited =
              redactForm(stream, {appearancePlacement(stream, rect)},
                         resources, boxes, m_options, 0, stats);
          if (!edited.isNull()) {
            newStates.replaceKey(state, edited);
            statesChanged = true;
          }
        }
        if (statesChanged) {
          newAppearances.replaceKey(key, newStates);
          changed = true;
        }
      }
    }

    if (changed) {
      annot.replaceKey("/AP", newAppearances);
      ++replaced;
    }
  }

  return replaced;
}

} // namespace redact
