#pragma once
#include "vb/scene/Element.hpp"
#include <string>
#include <vector>

namespace vb {

// Element factories for the basic shapes. Geometry attributes come first,
// followed by `extra` in its own order; repeating a geometry key in `extra`
// throws InvalidElementError.

struct Point {
  double x{0};
  double y{0};
};

Element makeCircle(double cx, double cy, double r, const Attributes& extra = {});
Element makeRect(double x, double y, double width, double height, const Attributes& extra = {});
Element makeEllipse(double cx, double cy, double rx, double ry, const Attributes& extra = {});
Element makeLine(double x1, double y1, double x2, double y2, const Attributes& extra = {});
Element makePolyline(const std::vector<Point>& points, const Attributes& extra = {});
Element makePolygon(const std::vector<Point>& points, const Attributes& extra = {});
Element makePath(const std::string& d, const Attributes& extra = {});
Element makeText(double x, double y, const std::string& text, const Attributes& extra = {});
Element makeGroup(std::vector<Element> children, const Attributes& extra = {});

// "x1,y1 x2,y2 ..."
std::string formatPoints(const std::vector<Point>& points);

} // namespace vb
