#include "vb/optimize/SizeOptimizer.hpp"
#include "vb/optimize/Strategies.hpp"
#include "vb/svg/Serializer.hpp"
#include "vb/svg/XmlParser.hpp"

#include <cstdio>
#include <utility>

namespace vb {

namespace {

std::string compact(const Element& root) {
  SerializeOptions opts;
  opts.pretty = false;
  return serializeElement(root, opts);
}

std::vector<OptimizationStep> buildSteps(const OptimizerPolicy& policy) {
  std::vector<OptimizationStep> steps;

  steps.push_back({kStepWhitespace, false, {},
    [](const std::string& doc, int) { return normalizeWhitespace(doc); }});

  steps.push_back({kStepDefaultElision, false, {},
    [policy](const std::string& doc, int) {
      return compact(elideDefaults(parseDocument(doc), policy));
    }});

  steps.push_back({kStepColorShorthand, false, {},
    [policy](const std::string& doc, int) {
      return compact(foldColors(parseDocument(doc), policy));
    }});

  steps.push_back({kStepStructuralDedup, false, {},
    [](const std::string& doc, int) { return compact(dedupDefs(parseDocument(doc))); }});

  // Rounding can expose new defaults and duplicate defs; clean them up in the
  // same step so the output is a fixed point of the whole pipeline.
  steps.push_back({kStepPrecision, true, precisionLevels(policy),
    [policy](const std::string& doc, int decimals) {
      return compact(losslessCleanup(reducePrecision(parseDocument(doc), decimals, policy), policy));
    }});

  return steps;
}

} // namespace

double sizeInKb(const std::string& document) {
  return static_cast<double>(document.size()) / 1024.0;
}

std::vector<int> precisionLevels(const OptimizerPolicy& policy) {
  std::vector<int> levels;
  const int step = policy.precisionStep > 0 ? policy.precisionStep : 1;
  for (int p = policy.startPrecision; p > 0; p -= step) levels.push_back(p);
  levels.push_back(0);
  return levels;
}

SizeOptimizer::SizeOptimizer() : SizeOptimizer(defaultOptimizerPolicy()) {}

SizeOptimizer::SizeOptimizer(OptimizerPolicy policy)
  : policy_(std::move(policy)), steps_(buildSteps(policy_)) {}

OptimizationOutcome SizeOptimizer::optimize(const std::string& document, double maxSizeKb) const {
  parseDocument(document); // throws MalformedDocumentError

  OptimizationOutcome out;
  out.originalBytes = document.size();

  std::string current = document;
  bool met = sizeInKb(current) <= maxSizeKb;

  for (const auto& step : steps_) {
    if (met) break;

    const std::string input = current;
    const std::vector<int> levels = step.levels.empty() ? std::vector<int>{0} : step.levels;
    bool changed = false;

    for (int level : levels) {
      std::string candidate = step.apply(input, level);
      if (candidate != current && candidate.size() <= current.size()) {
        current = std::move(candidate);
        changed = true;
        if (!step.levels.empty()) out.finalPrecision = level;
      }
      met = sizeInKb(current) <= maxSizeKb;
      if (met) break;
    }
    if (changed) out.appliedSteps.push_back(step.name);
  }

  out.document = std::move(current);
  out.sizeBytes = out.document.size();
  out.sizeKb = sizeInKb(out.document);
  out.metBudget = met;

  if (!met) {
    std::fprintf(stderr, "SizeOptimizer: budget not met (%.2f KB > %.2f KB)\n",
                 out.sizeKb, maxSizeKb);
  }
  return out;
}

OptimizationOutcome optimize(const std::string& document, double maxSizeKb) {
  return SizeOptimizer().optimize(document, maxSizeKb);
}

} // namespace vb
