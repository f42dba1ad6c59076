#include "vb/scene/Element.hpp"
#include "vb/errors/Errors.hpp"

#include <algorithm>
#include <cstdio>

namespace vb {

namespace {

bool isNameStart(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == ':' || c >= 0x80;
}

bool isNameChar(unsigned char c) {
  return isNameStart(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

} // namespace

bool isValidName(const std::string& name) {
  if (name.empty()) return false;
  if (!isNameStart(static_cast<unsigned char>(name[0]))) return false;
  return std::all_of(name.begin() + 1, name.end(),
                     [](char c) { return isNameChar(static_cast<unsigned char>(c)); });
}

bool isTextContentTag(const std::string& tag) {
  return tag == "text" || tag == "tspan" || tag == "textPath";
}

// -------------------- Attributes --------------------

Attributes::Attributes(std::initializer_list<Entry> entries) {
  for (const auto& e : entries) add(e.first, e.second);
}

void Attributes::add(std::string key, std::string value) {
  if (!isValidName(key)) {
    throw InvalidElementError("invalid attribute name: '" + key + "'");
  }
  if (has(key)) {
    throw InvalidElementError("duplicate attribute: " + key);
  }
  entries_.emplace_back(std::move(key), std::move(value));
}

void Attributes::set(std::string key, std::string value) {
  for (auto& e : entries_) {
    if (e.first == key) { e.second = std::move(value); return; }
  }
  add(std::move(key), std::move(value));
}

bool Attributes::remove(const std::string& key) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e) { return e.first == key; });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

bool Attributes::has(const std::string& key) const {
  return get(key) != nullptr;
}

const std::string* Attributes::get(const std::string& key) const {
  for (const auto& e : entries_) {
    if (e.first == key) return &e.second;
  }
  return nullptr;
}

// -------------------- Element --------------------

Element::Element(std::string tag, Attributes attributes,
                 std::vector<Element> children, std::string text,
                 std::vector<std::string> tails)
  : tag_(std::move(tag)),
    attributes_(std::move(attributes)),
    children_(std::move(children)),
    text_(std::move(text)),
    tails_(std::move(tails)) {
  if (!isValidName(tag_)) {
    throw InvalidElementError("invalid element tag: '" + tag_ + "'");
  }
  if (!tails_.empty() && tails_.size() != children_.size()) {
    throw InvalidElementError("<" + tag_ + ">: text runs do not match children");
  }
  // All-empty runs compare equal to no runs.
  if (std::all_of(tails_.begin(), tails_.end(), [](const std::string& t) { return t.empty(); })) {
    tails_.clear();
  }
}

const std::string& Element::tail(std::size_t i) const {
  static const std::string kNone;
  return i < tails_.size() ? tails_[i] : kNone;
}

Element Element::withAttributes(Attributes attributes) const {
  Element e(*this);
  e.attributes_ = std::move(attributes);
  return e;
}

Element Element::withChildren(std::vector<Element> children) const {
  Element e(*this);
  e.children_ = std::move(children);
  e.tails_.clear();
  return e;
}

std::size_t Element::nodeCount() const {
  std::size_t n = 1;
  for (const auto& c : children_) n += c.nodeCount();
  return n;
}

bool Element::operator==(const Element& o) const {
  return tag_ == o.tag_ && text_ == o.text_ && tails_ == o.tails_ &&
         attributes_ == o.attributes_ && children_ == o.children_;
}

// -------------------- ElementBuilder --------------------

ElementBuilder& ElementBuilder::attr(std::string key, std::string value) {
  attrs_.add(std::move(key), std::move(value));
  return *this;
}

ElementBuilder& ElementBuilder::attr(std::string key, double value) {
  attrs_.add(std::move(key), formatNumber(value));
  return *this;
}

ElementBuilder& ElementBuilder::child(Element e) {
  content_.appendChild(std::move(e));
  return *this;
}

ElementBuilder& ElementBuilder::text(const std::string& t) {
  content_.appendText(t);
  return *this;
}

Element ElementBuilder::build() const {
  ElementContent copy = content_;
  return copy.build(tag_, attrs_);
}

std::string formatNumber(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.9g", v);
  std::string s(buf);
  if (s == "-0") s = "0";
  return s;
}

} // namespace vb
