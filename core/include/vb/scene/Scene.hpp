#pragma once
#include "vb/scene/Types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vb {

struct Policy;

struct SceneConfig {
  double width{800};
  double height{600};
  std::optional<double> maxSizeKb;
  std::size_t maxElements{0};   // 0 = unlimited
};

// Layered composition of Elements plus the shared defs collection.
// Not safe for concurrent mutation; use one Scene per unit of work.
class Scene {
public:
  // Throws std::invalid_argument for non-positive canvas dimensions.
  explicit Scene(const SceneConfig& config);
  Scene(double width, double height, std::optional<double> maxSizeKb = std::nullopt);

  double width() const { return config_.width; }
  double height() const { return config_.height; }
  const std::optional<double>& maxSizeKb() const { return config_.maxSizeKb; }
  std::size_t maxElements() const { return config_.maxElements; }

  // Throws DuplicateLayerError if `name` exists.
  void createLayer(const std::string& name, int zIndex = 0);

  // Append to a layer. Throws UnknownLayerError / InvalidElementError.
  // Returns false (nothing appended) once the element cap is reached.
  bool addToLayer(const std::string& name, std::string tag,
                  Attributes attributes = {}, std::vector<Element> children = {});
  bool addToLayer(const std::string& name, Element element);

  // Returns false if a structurally identical def is already registered.
  bool registerDef(Element element);

  // Serialized document (pretty form). Does not touch the Scene.
  std::string generateSvg() const;

  // Whitelist satisfied and, when a budget is set, optimized size within it.
  bool validate() const;
  bool validate(const Policy& policy) const;

  bool hasLayer(const std::string& name) const;
  const Layer* layer(const std::string& name) const;
  // Layers in render order: zIndex ascending, then creation order.
  std::vector<const Layer*> orderedLayers() const;
  std::vector<std::string> layerNames() const;

  const std::vector<Element>& defs() const { return defs_; }
  std::size_t elementCount() const { return elementCount_; }

private:
  SceneConfig config_;
  std::vector<Layer> layers_;                          // creation order
  std::unordered_map<std::string, std::size_t> index_; // name -> layers_ slot
  std::vector<Element> defs_;
  std::size_t elementCount_{0};
  std::uint64_t nextSequence_{1};
};

} // namespace vb
