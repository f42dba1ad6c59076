#pragma once
#include "vb/scene/Element.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace vb {

struct ParseError {
  std::size_t offset{0};
  std::string message;
};

// Parse a single-root markup document into an Element tree.
// Comments, processing instructions and DOCTYPE are skipped; whitespace-only
// character data is dropped and other text is trimmed. On failure returns
// nullopt and fills `error`.
std::optional<Element> parseMarkup(const std::string& text, ParseError& error);

// Same, but throws MalformedDocumentError.
Element parseDocument(const std::string& text);

} // namespace vb
