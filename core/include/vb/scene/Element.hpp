#pragma once
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace vb {

// True if `name` is usable as a markup tag or attribute name.
bool isValidName(const std::string& name);

// Elements whose whitespace-only character data is rendered (text, tspan,
// textPath); elsewhere it is formatting.
bool isTextContentTag(const std::string& tag);

// Ordered attribute mapping. Keys are unique and validated on insertion;
// iteration follows insertion order so serialization is deterministic.
class Attributes {
public:
  using Entry = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Entry>::const_iterator;

  Attributes() = default;
  // Throws InvalidElementError on an invalid or repeated key.
  Attributes(std::initializer_list<Entry> entries);

  // Append a new key. Throws InvalidElementError if invalid or already present.
  void add(std::string key, std::string value);
  // Replace in place if present (keeps position), append otherwise.
  void set(std::string key, std::string value);
  bool remove(const std::string& key);

  bool has(const std::string& key) const;
  // nullptr when absent
  const std::string* get(const std::string& key) const;

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

  bool operator==(const Attributes& o) const { return entries_ == o.entries_; }
  bool operator!=(const Attributes& o) const { return !(*this == o); }

private:
  std::vector<Entry> entries_;
};

// One vector-graphics node. Immutable after construction: every "with"
// operation returns a new value, so a sub-tree can be shared freely.
//
// Character data is kept in order with the children: `text` precedes the
// first child and `tails[i]` follows child i. An empty `tails` means no
// character data between or after children.
class Element {
public:
  // Throws InvalidElementError if the tag is not a valid name, or if `tails`
  // is non-empty and not one entry per child.
  explicit Element(std::string tag,
                   Attributes attributes = {},
                   std::vector<Element> children = {},
                   std::string text = {},
                   std::vector<std::string> tails = {});

  const std::string& tag() const { return tag_; }
  const Attributes& attributes() const { return attributes_; }
  const std::vector<Element>& children() const { return children_; }
  const std::string& text() const { return text_; }
  const std::vector<std::string>& tails() const { return tails_; }
  // Character data after child `i`; empty when there is none.
  const std::string& tail(std::size_t i) const;
  bool hasTails() const { return !tails_.empty(); }

  const std::string* attr(const std::string& key) const { return attributes_.get(key); }

  Element withAttributes(Attributes attributes) const;
  // Replaces children; character data between the old children is dropped.
  Element withChildren(std::vector<Element> children) const;

  // Number of nodes in this sub-tree, including this one.
  std::size_t nodeCount() const;

  bool operator==(const Element& o) const;
  bool operator!=(const Element& o) const { return !(*this == o); }

private:
  std::string tag_;
  Attributes attributes_;
  std::vector<Element> children_;
  std::string text_;
  std::vector<std::string> tails_;
};

// Children and character data collected in document order, for rebuilding
// an Element while children are added or skipped. Text that follows a
// skipped child joins the preceding text run.
struct ElementContent {
  std::string text;
  std::vector<Element> children;
  std::vector<std::string> tails;   // always one per child

  void appendText(const std::string& s) { (tails.empty() ? text : tails.back()) += s; }
  void appendChild(Element e) {
    children.push_back(std::move(e));
    tails.emplace_back();
  }

  Element build(std::string tag, Attributes attributes) {
    return Element(std::move(tag), std::move(attributes), std::move(children),
                   std::move(text), std::move(tails));
  }
};

// Convenience for assembling an Element in several statements.
class ElementBuilder {
public:
  explicit ElementBuilder(std::string tag) : tag_(std::move(tag)) {}

  ElementBuilder& attr(std::string key, std::string value);
  ElementBuilder& attr(std::string key, double value);
  ElementBuilder& child(Element e);
  // Appends character data after the last child added (or before any child).
  ElementBuilder& text(const std::string& t);

  Element build() const;

private:
  std::string tag_;
  Attributes attrs_;
  ElementContent content_;
};

// "%.9g" rendering shared by the serializer and the recipes.
std::string formatNumber(double v);

} // namespace vb
