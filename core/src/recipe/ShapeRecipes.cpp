#include "vb/recipe/ShapeRecipes.hpp"

#include <utility>

namespace vb {

namespace {

Attributes merged(Attributes geometry, const Attributes& extra) {
  for (const auto& kv : extra) geometry.add(kv.first, kv.second);
  return geometry;
}

} // namespace

Element makeCircle(double cx, double cy, double r, const Attributes& extra) {
  return Element("circle", merged({{"cx", formatNumber(cx)},
                                   {"cy", formatNumber(cy)},
                                   {"r", formatNumber(r)}}, extra));
}

Element makeRect(double x, double y, double width, double height, const Attributes& extra) {
  return Element("rect", merged({{"x", formatNumber(x)},
                                 {"y", formatNumber(y)},
                                 {"width", formatNumber(width)},
                                 {"height", formatNumber(height)}}, extra));
}

Element makeEllipse(double cx, double cy, double rx, double ry, const Attributes& extra) {
  return Element("ellipse", merged({{"cx", formatNumber(cx)},
                                    {"cy", formatNumber(cy)},
                                    {"rx", formatNumber(rx)},
                                    {"ry", formatNumber(ry)}}, extra));
}

Element makeLine(double x1, double y1, double x2, double y2, const Attributes& extra) {
  return Element("line", merged({{"x1", formatNumber(x1)},
                                 {"y1", formatNumber(y1)},
                                 {"x2", formatNumber(x2)},
                                 {"y2", formatNumber(y2)}}, extra));
}

std::string formatPoints(const std::vector<Point>& points) {
  std::string out;
  for (std::size_t i = 0; i < points.size(); ++i) {
    if (i) out += ' ';
    out += formatNumber(points[i].x);
    out += ',';
    out += formatNumber(points[i].y);
  }
  return out;
}

Element makePolyline(const std::vector<Point>& points, const Attributes& extra) {
  return Element("polyline", merged({{"points", formatPoints(points)}}, extra));
}

Element makePolygon(const std::vector<Point>& points, const Attributes& extra) {
  return Element("polygon", merged({{"points", formatPoints(points)}}, extra));
}

Element makePath(const std::string& d, const Attributes& extra) {
  return Element("path", merged({{"d", d}}, extra));
}

Element makeText(double x, double y, const std::string& text, const Attributes& extra) {
  return Element("text", merged({{"x", formatNumber(x)}, {"y", formatNumber(y)}}, extra),
                 {}, text);
}

Element makeGroup(std::vector<Element> children, const Attributes& extra) {
  return Element("g", extra, std::move(children));
}

} // namespace vb
