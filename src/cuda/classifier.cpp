#include "cuda/classifier.hpp"

#include "config/project.hpp"

namespace comfytest::cuda {

CudaClassification ClassifyCudaNodes(const std::vector<std::string>& declared_packages,
                                     const workflow::NodeDefinitionSet& definitions) {
  std::set<std::string> declared;
  for (const std::string& package : declared_packages) {
    declared.insert(config::CanonicalPackageName(package));
  }

  CudaClassification classification;
  if (declared.empty()) {
    return classification;
  }

  for (const auto& [class_name, definition] : definitions) {
    std::set<std::string> matched;
    for (const std::string& dependency : definition.dependencies) {
      const std::string canonical = config::CanonicalPackageName(dependency);
      if (declared.count(canonical) != 0U) {
        matched.insert(canonical);
      }
    }
    if (!matched.empty()) {
      classification.flagged.insert(class_name);
      classification.reasons[class_name].assign(matched.begin(), matched.end());
    }
  }
  return classification;
}

} // namespace comfytest::cuda
