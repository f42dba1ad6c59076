#pragma once
#include "vb/scene/Element.hpp"
#include <optional>
#include <string>
#include <vector>

namespace vb {

// Gradient definitions for Scene::registerDef. Coordinates are in
// objectBoundingBox units (0..1).

struct GradientStop {
  std::string offset;                 // "0%", "0.5", ...
  std::string color{"#000"};
  std::optional<double> opacity;
};

Element makeLinearGradient(const std::string& id,
                           double x1, double y1, double x2, double y2,
                           const std::vector<GradientStop>& stops);

Element makeRadialGradient(const std::string& id,
                           double cx, double cy, double r,
                           std::optional<double> fx, std::optional<double> fy,
                           const std::vector<GradientStop>& stops);

// Seven-stop spectrum, left to right (or top to bottom).
Element rainbowGradient(const std::string& id, bool horizontal = true);

// Vertical highlight / base / shadow sheen around `baseColor`.
Element metallicGradient(const std::string& id, const std::string& baseColor = "#888888");

// "url(#id)" for fill / stroke.
std::string gradientRef(const std::string& id);

} // namespace vb
