#pragma once

#include "workflow/node_definition.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace comfytest::cuda {

// Node classes that need a GPU for the current project.
using CudaFlagSet = std::set<std::string>;

struct CudaClassification {
  CudaFlagSet flagged;
  // Flagged class -> declared packages found in its dependency closure.
  std::map<std::string, std::vector<std::string>> reasons;

  bool IsFlagged(const std::string& class_name) const {
    return flagged.count(class_name) != 0U;
  }

  bool operator==(const CudaClassification& other) const = default;
};

// Pure function of the declared package list and each definition's resolved
// dependency closure. Both sides are compared after package-name
// canonicalization; there is no prefix or fuzzy matching.
CudaClassification ClassifyCudaNodes(const std::vector<std::string>& declared_packages,
                                     const workflow::NodeDefinitionSet& definitions);

} // namespace comfytest::cuda
