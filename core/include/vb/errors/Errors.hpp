#pragma once
#include <stdexcept>
#include <string>

namespace vb {

// Base for every hard failure raised by the library.
// Budget misses are never errors; see OptimizationOutcome::metBudget.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class DuplicateLayerError : public Error {
public:
  explicit DuplicateLayerError(const std::string& layer)
    : Error("layer already exists: " + layer), layer_(layer) {}
  const std::string& layer() const { return layer_; }

private:
  std::string layer_;
};

class UnknownLayerError : public Error {
public:
  explicit UnknownLayerError(const std::string& layer)
    : Error("unknown layer: " + layer), layer_(layer) {}
  const std::string& layer() const { return layer_; }

private:
  std::string layer_;
};

class InvalidElementError : public Error {
public:
  explicit InvalidElementError(const std::string& what) : Error(what) {}
};

class MalformedDocumentError : public Error {
public:
  explicit MalformedDocumentError(const std::string& what) : Error(what) {}
};

// Fatal: the document cannot be made legal without changing its meaning.
class ComplianceError : public Error {
public:
  ComplianceError(const std::string& constraint, const std::string& detail)
    : Error("compliance: " + constraint + ": " + detail), constraint_(constraint) {}
  const std::string& constraint() const { return constraint_; }

private:
  std::string constraint_;
};

} // namespace vb
