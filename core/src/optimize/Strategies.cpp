#include "vb/optimize/Strategies.hpp"
#include "vb/optimize/NumberFormat.hpp"
#include "vb/svg/Serializer.hpp"
#include "vb/svg/XmlParser.hpp"

#include <cctype>
#include <set>
#include <utility>
#include <vector>

namespace vb {

namespace {

// Content whose rendering context is decided by whoever references it.
const std::set<std::string> kReusableTags = {
  "defs", "symbol", "pattern", "clipPath", "mask", "marker",
};

bool isHrefKey(const std::string& key) {
  return key == "href" || key == "xlink:href";
}

std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool isHexColor(const std::string& v, std::size_t digits) {
  if (v.size() != digits + 1 || v[0] != '#') return false;
  for (std::size_t i = 1; i < v.size(); ++i) {
    if (!std::isxdigit(static_cast<unsigned char>(v[i]))) return false;
  }
  return true;
}

std::string expandColor(const std::string& v) {
  if (!isHexColor(v, 3)) return v;
  return std::string{'#', v[1], v[1], v[2], v[2], v[3], v[3]};
}

// Character data of a <style> element, children excluded.
std::string sheetText(const Element& e) {
  std::string out = e.text();
  for (const auto& t : e.tails()) out += t;
  return out;
}

// Calls fn(offset, length) for every id referenced from `value`.
template <typename Fn>
void scanReferences(const std::string& key, const std::string& value, Fn&& fn) {
  if (isHrefKey(key)) {
    if (value.size() > 1 && value[0] == '#') fn(std::size_t{1}, value.size() - 1);
    return;
  }
  std::size_t pos = 0;
  while ((pos = value.find("url(", pos)) != std::string::npos) {
    std::size_t i = pos + 4;
    while (i < value.size() && (value[i] == ' ' || value[i] == '\'' || value[i] == '"')) ++i;
    if (i >= value.size() || value[i] != '#') { pos = i; continue; }

    const std::size_t b = i + 1;
    std::size_t e = b;
    while (e < value.size() && value[e] != ')' && value[e] != '\'' &&
           value[e] != '"' && value[e] != ' ') {
      ++e;
    }
    if (e > b) fn(b, e - b);
    pos = e;
  }
}

void countReferences(const Element& e, std::map<std::string, std::size_t>& refs) {
  for (const auto& kv : e.attributes()) {
    scanReferences(kv.first, kv.second, [&](std::size_t b, std::size_t n) {
      ++refs[kv.second.substr(b, n)];
    });
  }
  if (e.tag() == "style") {
    const std::string sheet = sheetText(e);
    scanReferences("", sheet, [&](std::size_t b, std::size_t n) { ++refs[sheet.substr(b, n)]; });
  }
  for (const auto& c : e.children()) countReferences(c, refs);
}

void countIds(const Element& e, std::map<std::string, std::size_t>& ids) {
  if (const std::string* id = e.attr("id")) ++ids[*id];
  for (const auto& c : e.children()) countIds(c, ids);
}

void collectHrefTargets(const Element& e, std::set<std::string>& out) {
  for (const auto& kv : e.attributes()) {
    if (isHrefKey(kv.first) && kv.second.size() > 1 && kv.second[0] == '#') {
      out.insert(kv.second.substr(1));
    }
  }
  for (const auto& c : e.children()) collectHrefTargets(c, out);
}

bool hasStyling(const Element& e) {
  if (e.tag() == "style" || e.attributes().has("style")) return true;
  for (const auto& c : e.children()) {
    if (hasStyling(c)) return true;
  }
  return false;
}

// -------------------- default elision --------------------

Element elideNode(const Element& e, const OptimizerPolicy& policy,
                  const std::set<std::string>& hrefTargets,
                  std::map<std::string, std::string> inherited, bool reusable) {
  const std::string* id = e.attr("id");
  if (kReusableTags.count(e.tag()) || (id && hrefTargets.count(*id))) reusable = true;

  Attributes kept;
  for (const auto& kv : e.attributes()) {
    const bool isInherited = policy.inheritedAttributes.count(kv.first) != 0;
    const auto def = policy.defaultValues.find(kv.first);

    bool drop = false;
    if (def != policy.defaultValues.end() && sameValue(kv.second, def->second)) {
      if (!isInherited) {
        drop = true;
      } else if (!reusable) {
        const auto up = inherited.find(kv.first);
        drop = up == inherited.end() || sameValue(up->second, def->second);
      }
    }
    if (isInherited) inherited[kv.first] = kv.second;
    if (!drop) kept.add(kv.first, kv.second);
  }

  std::vector<Element> kids;
  kids.reserve(e.children().size());
  for (const auto& c : e.children()) {
    kids.push_back(elideNode(c, policy, hrefTargets, inherited, reusable));
  }
  return Element(e.tag(), std::move(kept), std::move(kids), e.text(), e.tails());
}

// -------------------- color folding --------------------

Element foldNode(const Element& e, const OptimizerPolicy& policy) {
  Attributes attrs;
  for (const auto& kv : e.attributes()) {
    attrs.add(kv.first, policy.colorAttributes.count(kv.first) ? shortenHexColor(kv.second)
                                                               : kv.second);
  }
  std::vector<Element> kids;
  kids.reserve(e.children().size());
  for (const auto& c : e.children()) kids.push_back(foldNode(c, policy));
  return Element(e.tag(), std::move(attrs), std::move(kids), e.text(), e.tails());
}

// -------------------- definition dedup / prune --------------------

std::string canonicalKey(const Element& def) {
  Attributes attrs = def.attributes();
  attrs.remove("id");
  SerializeOptions compact;
  compact.pretty = false;
  return serializeElement(def.withAttributes(std::move(attrs)), compact);
}

void findDuplicates(const Element& e, const std::map<std::string, std::size_t>& idCounts,
                    std::map<std::string, std::string>& firstByKey,
                    std::map<std::string, std::string>& renames) {
  if (e.tag() == "defs") {
    for (const auto& c : e.children()) {
      const std::string* id = c.attr("id");
      if (!id || idCounts.at(*id) != 1) continue;
      const auto inserted = firstByKey.emplace(canonicalKey(c), *id);
      if (!inserted.second) renames[*id] = inserted.first->second;
    }
  }
  for (const auto& c : e.children()) findDuplicates(c, idCounts, firstByKey, renames);
}

// Drop defs children whose id is in `removed`, rewrite references.
Element rebuildDefs(const Element& e, const std::set<std::string>& removed,
                    const std::map<std::string, std::string>& renames) {
  Attributes attrs;
  for (const auto& kv : e.attributes()) {
    attrs.add(kv.first, renames.empty() ? kv.second : rewriteReferences(kv.first, kv.second, renames));
  }

  const bool sheet = e.tag() == "style" && !renames.empty();
  ElementContent content;
  content.appendText(sheet ? rewriteReferences("", e.text(), renames) : e.text());
  for (std::size_t i = 0; i < e.children().size(); ++i) {
    const Element& c = e.children()[i];
    const std::string* id = c.attr("id");
    if (e.tag() != "defs" || !id || !removed.count(*id)) {
      content.appendChild(rebuildDefs(c, removed, renames));
    }
    content.appendText(sheet ? rewriteReferences("", e.tail(i), renames) : e.tail(i));
  }
  return content.build(e.tag(), std::move(attrs));
}

void findUnused(const Element& e, const std::map<std::string, std::size_t>& idCounts,
                const std::map<std::string, std::size_t>& refs, std::set<std::string>& unused) {
  if (e.tag() == "defs") {
    for (const auto& c : e.children()) {
      const std::string* id = c.attr("id");
      if (!id || idCounts.at(*id) != 1) continue;

      std::map<std::string, std::size_t> own;
      countReferences(c, own);
      const auto total = refs.find(*id);
      const std::size_t all = total == refs.end() ? 0 : total->second;
      const auto self = own.find(*id);
      const std::size_t mine = self == own.end() ? 0 : self->second;
      if (all == mine) unused.insert(*id);
    }
  }
  for (const auto& c : e.children()) findUnused(c, idCounts, refs, unused);
}

Element dropEmptyDefs(const Element& e) {
  ElementContent content;
  content.appendText(e.text());
  for (std::size_t i = 0; i < e.children().size(); ++i) {
    const Element& c = e.children()[i];
    if (c.tag() != "defs" || !c.children().empty()) content.appendChild(dropEmptyDefs(c));
    content.appendText(e.tail(i));
  }
  return content.build(e.tag(), e.attributes());
}

// -------------------- precision --------------------

Element roundNode(const Element& e, int decimals, const OptimizerPolicy& policy, bool isRoot) {
  Attributes attrs;
  const bool touch = !isRoot && policy.precisionExemptTags.count(e.tag()) == 0;
  for (const auto& kv : e.attributes()) {
    const bool numeric = touch && policy.precisionAttributes.count(kv.first) != 0;
    attrs.add(kv.first, numeric ? roundNumbersIn(kv.second, decimals) : kv.second);
  }
  std::vector<Element> kids;
  kids.reserve(e.children().size());
  for (const auto& c : e.children()) kids.push_back(roundNode(c, decimals, policy, false));
  return Element(e.tag(), std::move(attrs), std::move(kids), e.text(), e.tails());
}

} // namespace

std::string normalizeWhitespace(const std::string& document) {
  SerializeOptions compact;
  compact.pretty = false;
  return serializeElement(parseDocument(document), compact);
}

Element elideDefaults(const Element& root, const OptimizerPolicy& policy) {
  std::set<std::string> hrefTargets;
  collectHrefTargets(root, hrefTargets);
  // Stylesheets can override inherited values in ways attributes don't show.
  const bool reusable = hasStyling(root);
  return elideNode(root, policy, hrefTargets, {}, reusable);
}

Element foldColors(const Element& root, const OptimizerPolicy& policy) {
  return foldNode(root, policy);
}

Element dedupDefs(const Element& root) {
  Element cur = root;

  for (;;) {
    std::map<std::string, std::size_t> idCounts;
    countIds(cur, idCounts);
    std::map<std::string, std::string> firstByKey, renames;
    findDuplicates(cur, idCounts, firstByKey, renames);
    if (renames.empty()) break;

    std::set<std::string> removed;
    for (const auto& kv : renames) removed.insert(kv.first);
    cur = rebuildDefs(cur, removed, renames);
  }

  for (;;) {
    std::map<std::string, std::size_t> idCounts, refs;
    countIds(cur, idCounts);
    countReferences(cur, refs);
    std::set<std::string> unused;
    findUnused(cur, idCounts, refs, unused);
    if (unused.empty()) break;
    cur = rebuildDefs(cur, unused, {});
  }

  return dropEmptyDefs(cur);
}

Element reducePrecision(const Element& root, int decimals, const OptimizerPolicy& policy) {
  return roundNode(root, decimals, policy, true);
}

Element losslessCleanup(const Element& root, const OptimizerPolicy& policy) {
  return dedupDefs(foldColors(elideDefaults(root, policy), policy));
}

std::string shortenHexColor(const std::string& value) {
  if (!isHexColor(value, 6)) return value;
  const auto same = [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  };
  if (!same(value[1], value[2]) || !same(value[3], value[4]) || !same(value[5], value[6])) {
    return value;
  }
  return std::string{'#', value[1], value[3], value[5]};
}

bool sameValue(const std::string& a, const std::string& b) {
  const std::string ta = trim(a), tb = trim(b);
  double x = 0, y = 0;
  if (parseNumber(ta, x) && parseNumber(tb, y)) return x == y;
  return lower(expandColor(ta)) == lower(expandColor(tb));
}

std::string rewriteReferences(const std::string& key, const std::string& value,
                              const std::map<std::string, std::string>& renames) {
  std::string out;
  std::size_t copied = 0;
  scanReferences(key, value, [&](std::size_t b, std::size_t n) {
    const auto it = renames.find(value.substr(b, n));
    if (it == renames.end()) return;
    out.append(value, copied, b - copied);
    out += it->second;
    copied = b + n;
  });
  if (copied == 0) return value;
  out.append(value, copied, std::string::npos);
  return out;
}

} // namespace vb
