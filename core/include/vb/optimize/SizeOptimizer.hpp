#pragma once
#include "vb/config/Policy.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace vb {

struct OptimizationOutcome {
  std::string document;
  double sizeKb{0};                 // bytes / 1024
  std::size_t sizeBytes{0};
  std::size_t originalBytes{0};
  bool metBudget{false};
  std::vector<std::string> appliedSteps;  // strategies that changed the document, in order
  int finalPrecision{-1};           // decimals kept by precision reduction, -1 if not applied
};

// One entry of the strategy list. `apply` maps a document to a document that
// is never larger. Leveled steps (non-empty `levels`) are tried once per level
// in order, each level applied to the step's input, with a budget check after
// every level.
struct OptimizationStep {
  std::string name;
  bool lossy{false};
  std::vector<int> levels;
  std::function<std::string(const std::string& document, int level)> apply;
};

// Step names, in pipeline order.
inline constexpr const char* kStepWhitespace = "whitespace";
inline constexpr const char* kStepDefaultElision = "default-elision";
inline constexpr const char* kStepColorShorthand = "color-shorthand";
inline constexpr const char* kStepStructuralDedup = "structural-dedup";
inline constexpr const char* kStepPrecision = "precision-reduction";

double sizeInKb(const std::string& document);

class SizeOptimizer {
public:
  SizeOptimizer();
  explicit SizeOptimizer(OptimizerPolicy policy);

  const OptimizerPolicy& policy() const { return policy_; }
  const std::vector<OptimizationStep>& steps() const { return steps_; }

  // Apply steps in order until the document fits `maxSizeKb`.
  // Throws MalformedDocumentError if `document` does not parse; a budget miss
  // is reported through metBudget.
  OptimizationOutcome optimize(const std::string& document, double maxSizeKb) const;

private:
  OptimizerPolicy policy_;
  std::vector<OptimizationStep> steps_;
};

// Precision schedule: start, start - step, ..., always ending at 0.
std::vector<int> precisionLevels(const OptimizerPolicy& policy);

// SizeOptimizer with the default policy.
OptimizationOutcome optimize(const std::string& document, double maxSizeKb);

} // namespace vb
