#include "BoxModel.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace redact {

Rect Rect::intersection(const Rect &other) const {
  return Rect(std::max(x0, other.x0), std::max(y0, other.y0),
              std::min(x1, other.x1), std::min(y1, other.y1));
}

Rect Rect::united(const Rect &other) const {
  if (isEmpty()) {
    return other;
  }
  if (other.isEmpty()) {
    return *this;
  }
  return Rect(std::min(x0, other.x0), std::min(y0, other.y0),
              std::max(x1, other.x1), std::max(y1, other.y1));
}

bool Rect::intersects(const Rect &other) const {
  return !intersection(other).isEmpty();
}

bool Rect::contains(const Rect &other) const {
  return x0 <= other.x0 && y0 <= other.y0 && x1 >= other.x1 &&
         y1 >= other.y1;
}

Rect Rect::clippedTo(const Rect &bounds) const { return intersection(bounds); }

double unionArea(const std::vector<Rect> &rects) {
  std::vector<Rect> boxes;
  std::vector<double> xs;
  for (const auto &rect : rects) {
    if (rect.isEmpty()) {
      continue;
    }
    boxes.push_back(rect);
    xs.push_back(rect.x0);
    xs.push_back(rect.x1);
  }
  if (boxes.empty()) {
    return 0.0;
  }

  std::sort(xs.begin(), xs.end());
  xs.erase(std::unique(xs.begin(), xs.end()), xs.end());

  // Sweep over vertical slabs; inside a slab the covered length along y is
  // the union of the y intervals of the boxes spanning it.
  double total = 0.0;
  std::vector<std::pair<double, double>> spans;
  for (std::size_t i = 0; i + 1 < xs.size(); ++i) {
    double left = xs[i];
    double right = xs[i + 1];
    spans.clear();
    for (const auto &box : boxes) {
      if (box.x0 <= left && box.x1 >= right) {
        spans.emplace_back(box.y0, box.y1);
      }
    }
    if (spans.empty()) {
      continue;
    }
    std::sort(spans.begin(), spans.end());
    double covered = 0.0;
    double start = spans.front().first;
    double end = spans.front().second;
    for (std::size_t k = 1; k < spans.size(); ++k) {
      if (spans[k].first > end) {
        covered += end - start;
        start = spans[k].first;
        end = spans[k].second;
      } else {
        end = std::max(end, spans[k].second);
      }
    }
    covered += end - start;
    total += covered * (right - left);
  }
  return total;
}

double PageFrame::displayWidth() const {
  return (rotation == 90 || rotation == 270) ? cropBox.height()
                                             : cropBox.width();
}

double PageFrame::displayHeight() const {
  return (rotation == 90 || rotation == 270) ? cropBox.width()
                                             : cropBox.height();
}

namespace {

std::pair<double, double> displayPointToUser(const PageFrame &frame, double dx,
                                             double dy) {
  double w = frame.cropBox.width();
  double h = frame.cropBox.height();
  double u = 0.0;
  double v = 0.0;
  switch (frame.rotation) {
  case 90:
    u = dy;
    v = dx;
    break;
  case 180:
    u = w - dx;
    v = dy;
    break;
  case 270:
    u = w - dy;
    v = h - dx;
    break;
  default:
    u = dx;
    v = h - dy;
    break;
  }
  return {frame.cropBox.x0 + u, frame.cropBox.y0 + v};
}

std::pair<double, double> userPointToDisplay(const PageFrame &frame, double x,
                                             double y) {
  double w = frame.cropBox.width();
  double h = frame.cropBox.height();
  double u = x - frame.cropBox.x0;
  double v = y - frame.cropBox.y0;
  switch (frame.rotation) {
  case 90:
    return {v, u};
  case 180:
    return {w - u, v};
  case 270:
    return {h - v, w - u};
  default:
    return {u, h - v};
  }
}

} // anonymous namespace

Rect PageFrame::displayToUser(double left, double top, double right,
                              double bottom) const {
  auto a = displayPointToUser(*this, left, top);
  auto b = displayPointToUser(*this, right, bottom);
  return Rect(std::min(a.first, b.first), std::min(a.second, b.second),
              std::max(a.first, b.first), std::max(a.second, b.second));
}

Rect PageFrame::userToDisplay(const Rect &rect) const {
  auto a = userPointToDisplay(*this, rect.x0, rect.y0);
  auto b = userPointToDisplay(*this, rect.x1, rect.y1);
  return Rect(std::min(a.first, b.first), std::min(a.second, b.second),
              std::max(a.first, b.first), std::max(a.second, b.second));
}

int normalizeRotation(int degrees) {
  int r = degrees % 360;
  if (r < 0) {
    r += 360;
  }
  // Non-multiples of 90 are invalid in PDF; viewers round them down
  return (r / 90) * 90;
}

Rect pixelRectToPdf(const PixelRect &pixelRect, double dpi,
                    const PageFrame &frame) {
  double scale = 72.0 / dpi;
  double left = pixelRect.x * scale;
  double top = pixelRect.y * scale;
  double right = (pixelRect.x + pixelRect.width) * scale;
  double bottom = (pixelRect.y + pixelRect.height) * scale;
  return frame.displayToUser(left, top, right, bottom);
}

PixelRect pdfRectToPixel(const Rect &rect, double dpi,
                         const PageFrame &frame) {
  double scale = dpi / 72.0;
  Rect display = frame.userToDisplay(rect);
  int left = static_cast<int>(std::floor(display.x0 * scale));
  int top = static_cast<int>(std::floor(display.y0 * scale));
  int right = static_cast<int>(std::ceil(display.x1 * scale));
  int bottom = static_cast<int>(std::ceil(display.y1 * scale));
  PixelRect pixels;
  pixels.x = left;
  pixels.y = top;
  pixels.width = right - left;
  pixels.height = bottom - top;
  return pixels;
}

const char *toString(BoxSource source) {
  switch (source) {
  case BoxSource::ExactTerm:
    return "exact";
  case BoxSource::Regex:
    return "regex";
  case BoxSource::Ocr:
    return "ocr";
  case BoxSource::Manual:
    return "manual";
  }
  return "unknown";
}

void mergeBoxes(PageBoxMap &into, const PageBoxMap &from) {
  for (const auto &entry : from) {
    auto &target = into[entry.first];
    target.insert(target.end(), entry.second.begin(), entry.second.end());
  }
}

std::size_t countBoxes(const PageBoxMap &boxes) {
  std::size_t count = 0;
  for (const auto &entry : boxes) {
    count += entry.second.size();
  }
  return count;
}

bool onSameLine(const Rect &a, const Rect &b) {
  double overlap = std::min(a.y1, b.y1) - std::max(a.y0, b.y0);
  double smaller = std::min(a.height(), b.height());
  if (smaller <= 0.0) {
    return overlap >= 0.0;
  }
  return overlap >= 0.5 * smaller;
}

std::vector<Rect> mergeByLine(const std::vector<Rect> &rects) {
  std::vector<Rect> lines;
  for (const auto &rect : rects) {
    if (!lines.empty() && onSameLine(lines.back(), rect)) {
      Rect &line = lines.back();
      line = Rect(std::min(line.x0, rect.x0), std::min(line.y0, rect.y0),
                  std::max(line.x1, rect.x1), std::max(line.y1, rect.y1));
    } else {
      lines.push_back(rect);
    }
  }
  return lines;
}

} // namespace redact
