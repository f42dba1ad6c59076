#include "vb/svg/Serializer.hpp"
#include "vb/scene/Scene.hpp"

namespace vb {

namespace {

std::string escape(const std::string& s, bool attribute) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"':
        if (attribute) out += "&quot;";
        else out += c;
        break;
      default: out += c; break;
    }
  }
  return out;
}

void newline(std::string& out, const SerializeOptions& opts, int depth) {
  if (!opts.pretty) return;
  out += '\n';
  out.append(static_cast<std::size_t>(depth * opts.indent), ' ');
}

} // namespace

std::string escapeAttribute(const std::string& value) { return escape(value, true); }
std::string escapeText(const std::string& text) { return escape(text, false); }

namespace {

// `flat`: no formatting whitespace inside this node, because it would become
// character data (mixed content, or text content elements).
void writeNode(std::string& out, const Element& e,
               const SerializeOptions& opts, int depth, bool flat) {
  out += '<';
  out += e.tag();
  for (const auto& kv : e.attributes()) {
    out += ' ';
    out += kv.first;
    out += "=\"";
    out += escapeAttribute(kv.second);
    out += '"';
  }

  if (e.children().empty() && e.text().empty()) {
    out += "/>";
    return;
  }

  out += '>';
  out += escapeText(e.text());
  const bool inner = flat || isTextContentTag(e.tag()) || !e.text().empty() || e.hasTails();
  for (std::size_t i = 0; i < e.children().size(); ++i) {
    if (!inner) newline(out, opts, depth + 1);
    writeNode(out, e.children()[i], opts, depth + 1, inner);
    out += escapeText(e.tail(i));
  }
  if (!e.children().empty() && !inner) newline(out, opts, depth);
  out += "</";
  out += e.tag();
  out += '>';
}

bool usesXlink(const Element& e) {
  for (const auto& kv : e.attributes()) {
    if (kv.first.compare(0, 6, "xlink:") == 0) return true;
  }
  for (const auto& c : e.children()) {
    if (usesXlink(c)) return true;
  }
  return false;
}

} // namespace

void writeElement(std::string& out, const Element& e,
                  const SerializeOptions& opts, int depth) {
  writeNode(out, e, opts, depth, !opts.pretty);
}

bool usesXlinkPrefix(const Element& root) {
  return usesXlink(root);
}

std::string serializeElement(const Element& e, const SerializeOptions& opts) {
  std::string out;
  writeElement(out, e, opts, 0);
  return out;
}

Element buildDocument(const Scene& scene) {
  const std::string w = formatNumber(scene.width());
  const std::string h = formatNumber(scene.height());

  Attributes rootAttrs;
  rootAttrs.add("xmlns", kSvgNamespace);
  bool xlink = false;
  for (const auto& d : scene.defs()) xlink = xlink || usesXlinkPrefix(d);
  for (const Layer* l : scene.orderedLayers()) {
    for (const auto& e : l->elements) xlink = xlink || usesXlinkPrefix(e);
  }
  if (xlink) rootAttrs.add("xmlns:xlink", kXlinkNamespace);
  rootAttrs.add("width", w);
  rootAttrs.add("height", h);
  rootAttrs.add("viewBox", "0 0 " + w + " " + h);

  std::vector<Element> children;
  if (!scene.defs().empty()) {
    children.emplace_back("defs", Attributes{}, scene.defs());
  }
  for (const Layer* l : scene.orderedLayers()) {
    if (l->elements.empty()) continue;
    Attributes groupAttrs;
    if (!l->name.empty()) groupAttrs.add("id", l->name);
    children.emplace_back("g", std::move(groupAttrs), l->elements);
  }

  return Element("svg", std::move(rootAttrs), std::move(children));
}

std::string serializeScene(const Scene& scene, const SerializeOptions& opts) {
  return serializeElement(buildDocument(scene), opts);
}

} // namespace vb
