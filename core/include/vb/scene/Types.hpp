#pragma once
#include "vb/scene/Element.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace vb {

struct Layer {
  std::string name;
  int zIndex{0};
  std::uint64_t sequence{0};   // creation order, breaks zIndex ties
  std::vector<Element> elements;
};

// Fixed namespace declared on every emitted root.
inline constexpr const char* kSvgNamespace = "http://www.w3.org/2000/svg";
inline constexpr const char* kXlinkNamespace = "http://www.w3.org/1999/xlink";

} // namespace vb
