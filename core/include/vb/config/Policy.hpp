#pragma once
#include <map>
#include <set>
#include <string>

namespace vb {

// Policy data for the size optimizer. Lossless steps consult these tables.
struct OptimizerPolicy {
  // Attribute -> value equal to the renderer's implicit default.
  std::map<std::string, std::string> defaultValues;
  // Presentation attributes that inherit down the tree; such an attribute
  // is only elided when no ancestor overrides it.
  std::set<std::string> inheritedAttributes;
  // Attributes whose whole value may be a #rrggbb color.
  std::set<std::string> colorAttributes;
  // Attributes whose numbers are rounded by precision reduction.
  std::set<std::string> precisionAttributes;
  // Elements left untouched by precision reduction.
  std::set<std::string> precisionExemptTags;

  int startPrecision{3};
  int precisionStep{1};
};

// Allowlist for the compliance sanitizer. A tag is allowed iff it has an
// entry in `tagAttributes`.
struct CompliancePolicy {
  std::set<std::string> globalAttributes;
  std::map<std::string, std::set<std::string>> tagAttributes;
  double minCanvas{1};
  double maxCanvas{8192};
};

struct Policy {
  OptimizerPolicy optimizer;
  CompliancePolicy compliance;
};

OptimizerPolicy defaultOptimizerPolicy();
CompliancePolicy defaultCompliancePolicy();
Policy defaultPolicy();

// JSON form:
// {"optimizer":{"defaults":{...},"inherited":[...],"colorAttributes":[...],
//               "precisionAttributes":[...],"precisionExemptTags":[...],
//               "startPrecision":3,"precisionStep":1},
//  "compliance":{"globalAttributes":[...],"tags":{"circle":[...],...},
//                "minCanvas":1,"maxCanvas":8192}}
std::string serializePolicy(const Policy& policy);

// Overlay `json` on `out`; keys that are absent keep their current value.
// Returns false on a parse error or a wrongly typed field.
bool deserializePolicy(const std::string& json, Policy& out);

} // namespace vb
