#include "vb/compliance/ComplianceSanitizer.hpp"
#include "vb/errors/Errors.hpp"
#include "vb/optimize/NumberFormat.hpp"
#include "vb/scene/Types.hpp"
#include "vb/svg/Serializer.hpp"
#include "vb/svg/XmlParser.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

namespace vb {

namespace {

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool isHrefKey(const std::string& key) {
  return key == "href" || key == "xlink:href";
}

// Values that could run script or pull in anything outside the document.
bool unsafeValue(const std::string& key, const std::string& value) {
  const std::string v = lower(value);
  for (const char* needle : {"javascript:", "vbscript:", "data:", "expression("}) {
    if (v.find(needle) != std::string::npos) return true;
  }
  if (isHrefKey(key)) return v.empty() || v[0] != '#';

  std::size_t pos = 0;
  while ((pos = v.find("url(", pos)) != std::string::npos) {
    std::size_t i = pos + 4;
    while (i < v.size() && (v[i] == ' ' || v[i] == '\'' || v[i] == '"')) ++i;
    if (i >= v.size() || v[i] != '#') return true;
    pos = i;
  }
  return false;
}

// Canvas dimension as a plain number, optionally with a "px" unit.
bool canvasValue(const std::string& raw, double& out) {
  std::string s = raw;
  if (s.size() > 2 && s.compare(s.size() - 2, 2, "px") == 0) s.resize(s.size() - 2);
  return parseNumber(s, out);
}

std::string canvasProblem(const Element& root, const char* key, const CompliancePolicy& p) {
  const std::string* v = root.attr(key);
  if (!v) return std::string("missing ") + key;

  double d = 0;
  if (!canvasValue(*v, d)) return std::string(key) + " is not a number: '" + *v + "'";
  if (d < p.minCanvas || d > p.maxCanvas) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "%s %s outside [%.9g, %.9g]",
                  key, v->c_str(), p.minCanvas, p.maxCanvas);
    return buf;
  }
  return {};
}

} // namespace

ComplianceSanitizer::ComplianceSanitizer() : ComplianceSanitizer(defaultPolicy()) {}

ComplianceSanitizer::ComplianceSanitizer(Policy policy)
  : policy_(std::move(policy)), optimizer_(policy_.optimizer) {}

bool ComplianceSanitizer::isTagAllowed(const std::string& tag) const {
  return policy_.compliance.tagAttributes.count(tag) != 0;
}

bool ComplianceSanitizer::isAttributeAllowed(const std::string& tag, const std::string& key,
                                             const std::string& value) const {
  // Event handlers are never allowed, whatever the tables say.
  if (lower(key).rfind("on", 0) == 0) return false;

  const auto& cp = policy_.compliance;
  const auto tagIt = cp.tagAttributes.find(tag);
  const bool listed = cp.globalAttributes.count(key) != 0 ||
                      (tagIt != cp.tagAttributes.end() && tagIt->second.count(key) != 0);
  if (!listed) return false;

  if (key == "xmlns") return value == kSvgNamespace;
  if (key == "xmlns:xlink") return value == kXlinkNamespace;
  return !unsafeValue(key, value);
}

// -------------------- audit --------------------

std::vector<std::string> ComplianceSanitizer::audit(const std::string& document) const {
  return audit(parseDocument(document));
}

std::vector<std::string> ComplianceSanitizer::audit(const Element& root) const {
  std::vector<std::string> out;

  if (root.tag() != "svg") out.push_back("root element <" + root.tag() + "> is not <svg>");
  if (!root.attr("xmlns")) out.push_back("root element does not declare the svg namespace");
  const std::string* xlink = root.attr("xmlns:xlink");
  if (usesXlinkPrefix(root) && (!xlink || *xlink != kXlinkNamespace)) {
    out.push_back("xlink: prefix used without a root declaration");
  }
  for (const char* key : {"width", "height"}) {
    std::string problem = canvasProblem(root, key, policy_.compliance);
    if (!problem.empty()) out.push_back(std::move(problem));
  }

  std::vector<const Element*> pending{&root};
  while (!pending.empty()) {
    const Element* e = pending.back();
    pending.pop_back();

    if (!isTagAllowed(e->tag())) {
      out.push_back("disallowed element <" + e->tag() + ">");
      continue;
    }
    for (const auto& kv : e->attributes()) {
      if (!isAttributeAllowed(e->tag(), kv.first, kv.second)) {
        out.push_back("disallowed attribute '" + kv.first + "' on <" + e->tag() + ">");
      }
    }
    for (const auto& c : e->children()) pending.push_back(&c);
  }
  return out;
}

// -------------------- sanitize --------------------

void ComplianceSanitizer::checkRoot(const Element& root) const {
  if (root.tag() != "svg") {
    throw ComplianceError("root-element", "<" + root.tag() + "> cannot be the document root");
  }
  const std::string w = canvasProblem(root, "width", policy_.compliance);
  if (!w.empty()) throw ComplianceError("canvas-width", w);
  const std::string h = canvasProblem(root, "height", policy_.compliance);
  if (!h.empty()) throw ComplianceError("canvas-height", h);
}

namespace {

Element filterNode(const ComplianceSanitizer& s, const Element& e, SanitizeReport& report) {
  Attributes attrs;
  for (const auto& kv : e.attributes()) {
    if (s.isAttributeAllowed(e.tag(), kv.first, kv.second)) attrs.add(kv.first, kv.second);
    else ++report.removedAttributes;
  }

  // Text around a dropped element stays in place; the element's own text goes with it.
  ElementContent content;
  content.appendText(e.text());
  for (std::size_t i = 0; i < e.children().size(); ++i) {
    const Element& c = e.children()[i];
    if (s.isTagAllowed(c.tag())) content.appendChild(filterNode(s, c, report));
    else ++report.removedElements;
    content.appendText(e.tail(i));
  }
  return content.build(e.tag(), std::move(attrs));
}

} // namespace

Element ComplianceSanitizer::sanitize(const Element& root, SanitizeReport* report) const {
  if (root.tag() != "svg") checkRoot(root);

  SanitizeReport local;
  const Element filtered = filterNode(*this, root, local);

  // The namespace is fixed; declare it first whatever the input said. A
  // surviving xlink: attribute needs its prefix declared on the root, since
  // declarations on other elements are not allowed.
  Attributes rootAttrs;
  rootAttrs.add("xmlns", kSvgNamespace);
  if (usesXlinkPrefix(filtered) && !filtered.attributes().has("xmlns:xlink")) {
    rootAttrs.add("xmlns:xlink", kXlinkNamespace);
  }
  for (const auto& kv : filtered.attributes()) {
    if (kv.first != "xmlns") rootAttrs.add(kv.first, kv.second);
  }
  const Element clean = filtered.withAttributes(std::move(rootAttrs));
  checkRoot(clean);

  if (local.removedElements > 0 || local.removedAttributes > 0) {
    std::fprintf(stderr, "ComplianceSanitizer: removed %zu element(s) and %zu attribute(s)\n",
                 local.removedElements, local.removedAttributes);
  }
  if (report) *report = local;
  return clean;
}

std::string ComplianceSanitizer::sanitize(const std::string& document, SanitizeReport* report) const {
  SerializeOptions compact;
  compact.pretty = false;
  return serializeElement(sanitize(parseDocument(document), report), compact);
}

OptimizationOutcome ComplianceSanitizer::ensureComplianceOutcome(const std::string& document,
                                                                 double maxSizeKb) const {
  OptimizationOutcome out = optimizer_.optimize(sanitize(document), maxSizeKb);

  const auto violations = audit(out.document);
  if (!violations.empty()) throw ComplianceError("allowlist", violations.front());
  return out;
}

std::string ComplianceSanitizer::ensureCompliance(const std::string& document, double maxSizeKb) const {
  return ensureComplianceOutcome(document, maxSizeKb).document;
}

std::string ensureCompliance(const std::string& document, double maxSizeKb) {
  return ComplianceSanitizer().ensureCompliance(document, maxSizeKb);
}

} // namespace vb
