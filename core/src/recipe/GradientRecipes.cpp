#include "vb/recipe/GradientRecipes.hpp"

#include <utility>

namespace vb {

namespace {

std::vector<Element> makeStops(const std::vector<GradientStop>& stops) {
  std::vector<Element> out;
  out.reserve(stops.size());
  for (const auto& s : stops) {
    ElementBuilder b("stop");
    b.attr("offset", s.offset.empty() ? std::string("0") : s.offset);
    b.attr("stop-color", s.color);
    if (s.opacity) b.attr("stop-opacity", *s.opacity);
    out.push_back(b.build());
  }
  return out;
}

} // namespace

Element makeLinearGradient(const std::string& id,
                           double x1, double y1, double x2, double y2,
                           const std::vector<GradientStop>& stops) {
  Attributes attrs{{"id", id},
                   {"x1", formatNumber(x1)},
                   {"y1", formatNumber(y1)},
                   {"x2", formatNumber(x2)},
                   {"y2", formatNumber(y2)}};
  return Element("linearGradient", std::move(attrs), makeStops(stops));
}

Element makeRadialGradient(const std::string& id,
                           double cx, double cy, double r,
                           std::optional<double> fx, std::optional<double> fy,
                           const std::vector<GradientStop>& stops) {
  Attributes attrs{{"id", id},
                   {"cx", formatNumber(cx)},
                   {"cy", formatNumber(cy)},
                   {"r", formatNumber(r)}};
  if (fx) attrs.add("fx", formatNumber(*fx));
  if (fy) attrs.add("fy", formatNumber(*fy));
  return Element("radialGradient", std::move(attrs), makeStops(stops));
}

Element rainbowGradient(const std::string& id, bool horizontal) {
  const std::vector<GradientStop> stops = {
    {"0%", "#ff0000", std::nullopt},
    {"16.67%", "#ffff00", std::nullopt},
    {"33.33%", "#00ff00", std::nullopt},
    {"50%", "#00ffff", std::nullopt},
    {"66.67%", "#0000ff", std::nullopt},
    {"83.33%", "#ff00ff", std::nullopt},
    {"100%", "#ff0000", std::nullopt},
  };
  return horizontal ? makeLinearGradient(id, 0, 0, 1, 0, stops)
                    : makeLinearGradient(id, 0, 0, 0, 1, stops);
}

Element metallicGradient(const std::string& id, const std::string& baseColor) {
  const std::vector<GradientStop> stops = {
    {"0%", "#ffffff", 0.7},
    {"45%", baseColor, std::nullopt},
    {"55%", baseColor, std::nullopt},
    {"100%", "#000000", 0.3},
  };
  return makeLinearGradient(id, 0, 0, 0, 1, stops);
}

std::string gradientRef(const std::string& id) {
  return "url(#" + id + ")";
}

} // namespace vb
