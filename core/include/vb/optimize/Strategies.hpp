#pragma once
#include "vb/config/Policy.hpp"
#include "vb/scene/Element.hpp"
#include <map>
#include <string>

namespace vb {

// Individual size-reduction strategies. Each is a pure tree -> tree
// transform that never grows the document; the SizeOptimizer sequences them.

// Re-serialize compactly, dropping formatting-only whitespace.
std::string normalizeWhitespace(const std::string& document);

// Drop attributes whose value equals the implicit default. Inherited
// attributes are kept when an ancestor overrides them, and inside reusable
// content (defs, symbols, <use> targets) where the ancestry is not known.
Element elideDefaults(const Element& root, const OptimizerPolicy& policy);

// #aabbcc -> #abc on color attributes.
Element foldColors(const Element& root, const OptimizerPolicy& policy);

// Merge structurally identical resource definitions (rewriting url(#id) and
// href references to the first copy), then drop definitions nothing
// references. Repeats until nothing changes.
Element dedupDefs(const Element& root);

// Round numbers in precision attributes to `decimals` places. The root and
// policy-exempt tags are left alone.
Element reducePrecision(const Element& root, int decimals, const OptimizerPolicy& policy);

// The lossless passes in pipeline order: defaults, colors, dedup.
Element losslessCleanup(const Element& root, const OptimizerPolicy& policy);

// "#aabbcc" -> "#abc"; anything else unchanged.
std::string shortenHexColor(const std::string& value);

// Numeric values compare numerically, colors by their long form, everything
// else case-insensitively.
bool sameValue(const std::string& a, const std::string& b);

// Rewrite url(#id) and, for href attributes, "#id" through `renames`.
std::string rewriteReferences(const std::string& key, const std::string& value,
                              const std::map<std::string, std::string>& renames);

} // namespace vb
