#pragma once
#include "vb/scene/Element.hpp"
#include <string>

namespace vb {

class Scene;

struct SerializeOptions {
  bool pretty{true};   // newline + indentation between nodes
  int indent{2};
};

// Escape markup-reserved characters.
std::string escapeAttribute(const std::string& value);
std::string escapeText(const std::string& text);

// Append the markup for `e` (and its sub-tree) to `out`. Pretty output never
// adds whitespace inside text content or next to character data.
void writeElement(std::string& out, const Element& e,
                  const SerializeOptions& opts, int depth = 0);

std::string serializeElement(const Element& e, const SerializeOptions& opts = {});

// True if any attribute in the sub-tree uses the xlink: prefix, so the
// document root must declare it.
bool usesXlinkPrefix(const Element& root);

// Root Element for a Scene:
//   <svg xmlns [xmlns:xlink] width height viewBox> [<defs>...] <g id=layer>... </svg>
// Layers in (zIndex, creation) order; empty layers are skipped.
Element buildDocument(const Scene& scene);

std::string serializeScene(const Scene& scene, const SerializeOptions& opts = {});

} // namespace vb
