#pragma once
#include "vb/config/Policy.hpp"
#include "vb/optimize/SizeOptimizer.hpp"
#include "vb/scene/Element.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace vb {

struct SanitizeReport {
  std::size_t removedElements{0};   // sub-tree roots dropped
  std::size_t removedAttributes{0};
};

// Allowlist enforcement. Everything not explicitly allowed is removed; the
// only fatal outcome is a document whose root or canvas cannot be made legal.
class ComplianceSanitizer {
public:
  ComplianceSanitizer();
  explicit ComplianceSanitizer(Policy policy);

  const Policy& policy() const { return policy_; }

  bool isTagAllowed(const std::string& tag) const;
  // Allowlist plus value rules: no on* handlers, no non-local references,
  // no script or data URIs.
  bool isAttributeAllowed(const std::string& tag, const std::string& key,
                          const std::string& value) const;

  // Every violation in the document, without modifying it.
  // Throws MalformedDocumentError for unparseable input.
  std::vector<std::string> audit(const std::string& document) const;
  std::vector<std::string> audit(const Element& root) const;

  // Drop disallowed nodes (with descendants) and attributes.
  // Throws ComplianceError if the root or canvas is illegal.
  Element sanitize(const Element& root, SanitizeReport* report = nullptr) const;
  std::string sanitize(const std::string& document, SanitizeReport* report = nullptr) const;

  // Sanitize, then optimize toward the budget, then re-audit.
  OptimizationOutcome ensureComplianceOutcome(const std::string& document, double maxSizeKb) const;
  std::string ensureCompliance(const std::string& document, double maxSizeKb) const;

private:
  Policy policy_;
  SizeOptimizer optimizer_;

  void checkRoot(const Element& root) const;
};

// ComplianceSanitizer with the default policy.
std::string ensureCompliance(const std::string& document, double maxSizeKb);

} // namespace vb
