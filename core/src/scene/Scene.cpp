#include "vb/scene/Scene.hpp"
#include "vb/errors/Errors.hpp"
#include "vb/config/Policy.hpp"
#include "vb/svg/Serializer.hpp"
#include "vb/compliance/ComplianceSanitizer.hpp"
#include "vb/optimize/SizeOptimizer.hpp"

#include <algorithm>
#include <stdexcept>

namespace vb {

Scene::Scene(const SceneConfig& config) : config_(config) {
  if (!(config_.width > 0) || !(config_.height > 0)) {
    throw std::invalid_argument("Scene: width and height must be positive");
  }
}

Scene::Scene(double width, double height, std::optional<double> maxSizeKb)
  : Scene(SceneConfig{width, height, maxSizeKb, 0}) {}

void Scene::createLayer(const std::string& name, int zIndex) {
  if (index_.find(name) != index_.end()) throw DuplicateLayerError(name);

  Layer l;
  l.name = name;
  l.zIndex = zIndex;
  l.sequence = nextSequence_++;
  index_[name] = layers_.size();
  layers_.push_back(std::move(l));
}

bool Scene::addToLayer(const std::string& name, std::string tag,
                       Attributes attributes, std::vector<Element> children) {
  // Resolve the layer before building so an unknown layer wins over a bad tag.
  if (index_.find(name) == index_.end()) throw UnknownLayerError(name);
  return addToLayer(name, Element(std::move(tag), std::move(attributes), std::move(children)));
}

bool Scene::addToLayer(const std::string& name, Element element) {
  auto it = index_.find(name);
  if (it == index_.end()) throw UnknownLayerError(name);
  if (config_.maxElements != 0 && elementCount_ >= config_.maxElements) return false;

  layers_[it->second].elements.push_back(std::move(element));
  ++elementCount_;
  return true;
}

bool Scene::registerDef(Element element) {
  for (const auto& d : defs_) {
    if (d == element) return false;
  }
  defs_.push_back(std::move(element));
  return true;
}

std::string Scene::generateSvg() const {
  return serializeScene(*this);
}

bool Scene::validate() const {
  return validate(defaultPolicy());
}

bool Scene::validate(const Policy& policy) const {
  if (config_.maxElements != 0 && elementCount_ > config_.maxElements) return false;

  const std::string svg = generateSvg();
  ComplianceSanitizer sanitizer(policy);
  if (!sanitizer.audit(svg).empty()) return false;

  if (config_.maxSizeKb) {
    SizeOptimizer optimizer(policy.optimizer);
    return optimizer.optimize(svg, *config_.maxSizeKb).metBudget;
  }
  return true;
}

bool Scene::hasLayer(const std::string& name) const {
  return index_.find(name) != index_.end();
}

const Layer* Scene::layer(const std::string& name) const {
  auto it = index_.find(name);
  return it == index_.end() ? nullptr : &layers_[it->second];
}

std::vector<const Layer*> Scene::orderedLayers() const {
  std::vector<const Layer*> out;
  out.reserve(layers_.size());
  for (const auto& l : layers_) out.push_back(&l);
  std::sort(out.begin(), out.end(), [](const Layer* a, const Layer* b) {
    if (a->zIndex != b->zIndex) return a->zIndex < b->zIndex;
    return a->sequence < b->sequence;
  });
  return out;
}

std::vector<std::string> Scene::layerNames() const {
  std::vector<std::string> names;
  for (const Layer* l : orderedLayers()) names.push_back(l->name);
  return names;
}

} // namespace vb
