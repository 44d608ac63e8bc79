#include "cuda/classifier.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

comfytest::workflow::NodeDefinitionSet DefinitionsWithDependencies() {
  comfytest::workflow::NodeDefinitionSet definitions;
  definitions["DemoFlash"].class_name = "DemoFlash";
  definitions["DemoFlash"].dependencies = {"torch", "Flash-Attn", "numpy"};
  definitions["DemoLoader"].class_name = "DemoLoader";
  definitions["DemoLoader"].dependencies = {"numpy", "PIL"};
  definitions["DemoSampler"].class_name = "DemoSampler";
  definitions["DemoSampler"].dependencies = {"flash_attn_ext"};
  return definitions;
}

} // namespace

TEST_CASE("Classes whose dependency closure hits a declared package are flagged", "[cuda]") {
  const auto classification =
      comfytest::cuda::ClassifyCudaNodes({"flash-attn"}, DefinitionsWithDependencies());
  CHECK(classification.flagged == comfytest::cuda::CudaFlagSet{"DemoFlash"});
  CHECK(classification.reasons.at("DemoFlash") == std::vector<std::string>{"flash_attn"});
  // No prefix matching.
  CHECK_FALSE(classification.IsFlagged("DemoSampler"));
  CHECK_FALSE(classification.IsFlagged("DemoLoader"));
}

TEST_CASE("Nothing is flagged without declared packages", "[cuda]") {
  CHECK(comfytest::cuda::ClassifyCudaNodes({}, DefinitionsWithDependencies()).flagged.empty());
}

TEST_CASE("Classification is a pure function of its inputs", "[cuda]") {
  const auto definitions = DefinitionsWithDependencies();
  const auto first = comfytest::cuda::ClassifyCudaNodes({"Flash.Attn", "nvdiffrast"}, definitions);
  const auto second = comfytest::cuda::ClassifyCudaNodes({"nvdiffrast", "flash_attn"}, definitions);
  CHECK(first == second);
  CHECK(first == comfytest::cuda::ClassifyCudaNodes({"Flash.Attn", "nvdiffrast"}, definitions));
}
