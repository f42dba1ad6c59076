#include "vb/svg/XmlParser.hpp"
#include "vb/errors/Errors.hpp"

#include <cstdint>
#include <cstdlib>
#include <utility>
#include <vector>

namespace vb {

namespace {

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool isNameStart(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == ':' || c >= 0x80;
}

bool isNameChar(unsigned char c) {
  return isNameStart(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

bool isBlank(const std::string& s) {
  for (char c : s) {
    if (!isSpace(c)) return false;
  }
  return true;
}

bool isDigits(const std::string& s, bool hex) {
  if (s.empty()) return false;
  for (char c : s) {
    const bool ok = (c >= '0' && c <= '9') ||
                    (hex && ((c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F')));
    if (!ok) return false;
  }
  return true;
}

// Code points allowed in XML 1.0 character data.
bool isXmlChar(unsigned long cp) {
  if (cp < 0x20) return cp == 0x9 || cp == 0xA || cp == 0xD;
  if (cp >= 0xD800 && cp <= 0xDFFF) return false;
  if (cp == 0xFFFE || cp == 0xFFFF) return false;
  return cp <= 0x10FFFF;
}

void appendUtf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Expand predefined entities and character references. False on an unknown
// or unterminated reference.
bool decodeEntities(const std::string& in, std::string& out, std::string& why) {
  out.clear();
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '&') { out += in[i]; continue; }

    const auto semi = in.find(';', i);
    if (semi == std::string::npos) { why = "unterminated entity reference"; return false; }
    const std::string name = in.substr(i + 1, semi - i - 1);

    if (name == "amp") out += '&';
    else if (name == "lt") out += '<';
    else if (name == "gt") out += '>';
    else if (name == "quot") out += '"';
    else if (name == "apos") out += '\'';
    else if (name.size() > 1 && name[0] == '#') {
      const bool hex = name[1] == 'x';
      const std::string digits = name.substr(hex ? 2 : 1);
      // Digits only: strtoul alone would take a sign, spaces or "0x".
      if (!isDigits(digits, hex) || digits.size() > 8) {
        why = "invalid character reference &" + name + ";";
        return false;
      }
      const unsigned long cp = std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10);
      if (!isXmlChar(cp)) {
        why = "invalid character reference &" + name + ";";
        return false;
      }
      appendUtf8(out, static_cast<std::uint32_t>(cp));
    } else {
      why = "unknown entity &" + name + ";";
      return false;
    }
    i = semi;
  }
  return true;
}

struct Frame {
  std::string tag;
  Attributes attrs;
  ElementContent content;
};

class Reader {
public:
  Reader(const std::string& text, ParseError& error) : s_(text), err_(error) {}

  std::optional<Element> run();

private:
  const std::string& s_;
  ParseError& err_;
  std::size_t pos_{0};
  std::vector<Frame> stack_;
  std::optional<Element> root_;

  bool fail(const std::string& msg) {
    err_.offset = pos_;
    err_.message = msg;
    return false;
  }

  bool startsWith(const char* lit) const {
    return s_.compare(pos_, std::char_traits<char>::length(lit), lit) == 0;
  }

  void skipSpace() {
    while (pos_ < s_.size() && isSpace(s_[pos_])) ++pos_;
  }

  bool skipPast(const char* terminator, const char* what) {
    const auto at = s_.find(terminator, pos_);
    if (at == std::string::npos) return fail(std::string("unterminated ") + what);
    pos_ = at + std::char_traits<char>::length(terminator);
    return true;
  }

  bool skipDoctype();
  bool readName(std::string& out);
  bool readStartTag();
  bool readEndTag();
  bool readText();
  bool readCdata();
  bool closeFrame();
};

std::optional<Element> Reader::run() {
  while (pos_ < s_.size()) {
    if (s_[pos_] != '<') {
      if (!readText()) return std::nullopt;
      continue;
    }

    bool ok = true;
    if (startsWith("<!--")) {
      ok = skipPast("-->", "comment");
    } else if (startsWith("<?")) {
      ok = skipPast("?>", "processing instruction");
    } else if (startsWith("<![CDATA[")) {
      ok = readCdata();
    } else if (startsWith("<!DOCTYPE")) {
      ok = (root_ || !stack_.empty()) ? fail("DOCTYPE inside document") : skipDoctype();
    } else if (startsWith("<!")) {
      ok = fail("unexpected markup declaration");
    } else if (startsWith("</")) {
      ok = readEndTag();
    } else {
      ok = root_ && stack_.empty() ? fail("content after root element") : readStartTag();
    }
    if (!ok) return std::nullopt;
  }

  if (!stack_.empty()) {
    fail("unclosed element <" + stack_.back().tag + ">");
    return std::nullopt;
  }
  if (!root_) {
    fail("no root element");
    return std::nullopt;
  }
  return root_;
}

bool Reader::skipDoctype() {
  int depth = 0;
  char quote = 0;
  for (; pos_ < s_.size(); ++pos_) {
    const char c = s_[pos_];
    if (quote) { if (c == quote) quote = 0; continue; }
    if (c == '"' || c == '\'') quote = c;
    else if (c == '[') ++depth;
    else if (c == ']' && depth > 0) --depth;
    else if (c == '>' && depth == 0) { ++pos_; return true; }
  }
  return fail("unterminated DOCTYPE");
}

bool Reader::readName(std::string& out) {
  const std::size_t b = pos_;
  if (pos_ >= s_.size() || !isNameStart(static_cast<unsigned char>(s_[pos_]))) {
    return fail("expected a name");
  }
  ++pos_;
  while (pos_ < s_.size() && isNameChar(static_cast<unsigned char>(s_[pos_]))) ++pos_;
  out = s_.substr(b, pos_ - b);
  return true;
}

bool Reader::readStartTag() {
  ++pos_; // '<'
  Frame f;
  if (!readName(f.tag)) return false;

  for (;;) {
    const std::size_t before = pos_;
    skipSpace();
    if (pos_ >= s_.size()) return fail("unterminated start tag <" + f.tag + ">");

    if (s_[pos_] == '/') {
      ++pos_;
      if (pos_ >= s_.size() || s_[pos_] != '>') return fail("expected '>' after '/'");
      ++pos_;
      stack_.push_back(std::move(f));
      return closeFrame();
    }
    if (s_[pos_] == '>') {
      ++pos_;
      stack_.push_back(std::move(f));
      return true;
    }
    if (pos_ == before) return fail("expected whitespace before attribute");

    std::string key;
    if (!readName(key)) return false;
    skipSpace();
    if (pos_ >= s_.size() || s_[pos_] != '=') return fail("expected '=' after attribute " + key);
    ++pos_;
    skipSpace();
    if (pos_ >= s_.size() || (s_[pos_] != '"' && s_[pos_] != '\'')) {
      return fail("attribute value must be quoted");
    }
    const char quote = s_[pos_++];
    const auto close = s_.find(quote, pos_);
    if (close == std::string::npos) return fail("unterminated attribute value");
    const std::string raw = s_.substr(pos_, close - pos_);
    if (raw.find('<') != std::string::npos) return fail("'<' in attribute value");

    std::string value, why;
    if (!decodeEntities(raw, value, why)) return fail(why);
    if (f.attrs.has(key)) return fail("duplicate attribute " + key);
    f.attrs.add(std::move(key), std::move(value));
    pos_ = close + 1;
  }
}

bool Reader::readEndTag() {
  pos_ += 2; // "</"
  std::string name;
  if (!readName(name)) return false;
  skipSpace();
  if (pos_ >= s_.size() || s_[pos_] != '>') return fail("expected '>' in closing tag");
  ++pos_;
  if (stack_.empty()) return fail("unexpected closing tag </" + name + ">");
  if (stack_.back().tag != name) {
    return fail("mismatched closing tag </" + name + "> for <" + stack_.back().tag + ">");
  }
  return closeFrame();
}

bool Reader::readText() {
  const auto next = s_.find('<', pos_);
  const std::size_t end = next == std::string::npos ? s_.size() : next;
  const std::string raw = s_.substr(pos_, end - pos_);

  // Whitespace-only runs are formatting, except inside text content.
  const bool blank = isBlank(raw);
  if (stack_.empty()) {
    if (!blank) return fail("text outside root element");
  } else if (!blank || isTextContentTag(stack_.back().tag)) {
    std::string decoded, why;
    if (!decodeEntities(raw, decoded, why)) return fail(why);
    stack_.back().content.appendText(decoded);
  }
  pos_ = end;
  return true;
}

bool Reader::readCdata() {
  pos_ += 9; // "<![CDATA["
  const auto close = s_.find("]]>", pos_);
  if (close == std::string::npos) return fail("unterminated CDATA section");
  if (stack_.empty()) return fail("CDATA outside root element");
  stack_.back().content.appendText(s_.substr(pos_, close - pos_));
  pos_ = close + 3;
  return true;
}

bool Reader::closeFrame() {
  Frame f = std::move(stack_.back());
  stack_.pop_back();
  Element e = f.content.build(std::move(f.tag), std::move(f.attrs));
  if (stack_.empty()) root_ = std::move(e);
  else stack_.back().content.appendChild(std::move(e));
  return true;
}

} // namespace

std::optional<Element> parseMarkup(const std::string& text, ParseError& error) {
  error = {};
  Reader r(text, error);
  return r.run();
}

Element parseDocument(const std::string& text) {
  ParseError err;
  auto root = parseMarkup(text, err);
  if (!root) {
    throw MalformedDocumentError("malformed document at offset " +
                                 std::to_string(err.offset) + ": " + err.message);
  }
  return std::move(*root);
}

} // namespace vb
