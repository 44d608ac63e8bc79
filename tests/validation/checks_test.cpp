#include "validation/graph_check.hpp"
#include "validation/introspection_check.hpp"
#include "validation/schema_check.hpp"

#include "../common/extension_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

namespace {

using comfytest::core::json::Value;
using comfytest::report::Diagnostic;
using comfytest::workflow::NodeDefinitionSet;
using comfytest::workflow::Workflow;

NodeDefinitionSet DemoDefinitions() {
  NodeDefinitionSet definitions;
  std::string error;
  REQUIRE(comfytest::workflow::ParseObjectInfoText(
      comfytest::tests::common::DemoObjectInfoJson(), definitions, error));
  return definitions;
}

Workflow ParseOrFail(const std::string& text) {
  Workflow workflow;
  std::string error;
  REQUIRE(comfytest::workflow::ParseWorkflowText(text, "test.json", workflow, error));
  return workflow;
}

bool Mentions(const std::vector<Diagnostic>& diagnostics, const std::string& needle) {
  return std::any_of(diagnostics.begin(), diagnostics.end(), [&needle](const Diagnostic& d) {
    return comfytest::report::FormatDiagnostic(d).find(needle) != std::string::npos;
  });
}

// Flash workflow with the strength widget set to `strength`.
std::string FlashWorkflowWithStrength(const std::string& strength) {
  std::string text = comfytest::tests::common::DemoFlashWorkflowJson();
  const std::string saved = "\"widgets_values\": [1.0]";
  text.replace(text.find(saved), saved.size(), "\"widgets_values\": [" + strength + "]");
  return text;
}

} // namespace

TEST_CASE("Widget values are checked against their declaration", "[validation][schema]") {
  comfytest::workflow::InputSpec spec;
  spec.name = "steps";
  spec.kind = comfytest::workflow::InputKind::kInt;
  spec.min = 1.0;
  spec.max = 100.0;
  CHECK_FALSE(comfytest::validation::CheckWidgetValue(spec, Value::MakeNumber(20)).has_value());
  CHECK(comfytest::validation::CheckWidgetValue(spec, Value::MakeNumber(0)).value() ==
        "0 < minimum 1");
  CHECK(comfytest::validation::CheckWidgetValue(spec, Value::MakeString("x")).value() ==
        "expected INT, got string");

  comfytest::workflow::InputSpec sampler;
  sampler.kind = comfytest::workflow::InputKind::kEnum;
  sampler.enum_values = {Value::MakeString("euler"), Value::MakeString("dpmpp_2m")};
  CHECK_FALSE(
      comfytest::validation::CheckWidgetValue(sampler, Value::MakeString("euler")).has_value());
  CHECK(comfytest::validation::CheckWidgetValue(sampler, Value::MakeString("ddim")).has_value());

  sampler.upload = true;
  CHECK_FALSE(
      comfytest::validation::CheckWidgetValue(sampler, Value::MakeString("ddim")).has_value());
}

TEST_CASE("Schema check reports out of range widgets by node and field", "[validation][schema]") {
  const NodeDefinitionSet definitions = DemoDefinitions();
  CHECK(comfytest::validation::CheckSchema(ParseOrFail(FlashWorkflowWithStrength("1.5")),
                                           definitions)
            .empty());

  const auto diagnostics = comfytest::validation::CheckSchema(
      ParseOrFail(FlashWorkflowWithStrength("3.5")), definitions);
  REQUIRE(diagnostics.size() == 1U);
  CHECK(diagnostics.front().node_id == 2);
  CHECK(diagnostics.front().node_class == "DemoFlash");
  CHECK(diagnostics.front().field == "strength");
  CHECK(diagnostics.front().message == "3.5 > maximum 2");
}

TEST_CASE("Schema check leaves unknown classes to the graph check", "[validation][schema]") {
  NodeDefinitionSet definitions = DemoDefinitions();
  definitions.erase("DemoFlash");
  const Workflow workflow = ParseOrFail(FlashWorkflowWithStrength("\"not a number\""));
  CHECK(comfytest::validation::CheckSchema(workflow, definitions).empty());
  CHECK(Mentions(comfytest::validation::CheckGraph(workflow, definitions),
                 "unknown class 'DemoFlash'"));
}

TEST_CASE("Graph check reports a link from a missing node by its id", "[validation][graph]") {
  const NodeDefinitionSet definitions = DemoDefinitions();
  const Workflow workflow = ParseOrFail(R"({
    "nodes": [
      {"id": 2, "type": "DemoSaver", "mode": 0,
       "inputs": [{"name": "images", "type": "IMAGE", "link": 5}],
       "outputs": [], "widgets_values": ["demo"]}
    ],
    "links": [[5, 7, 0, 2, 0, "IMAGE"]]
  })");

  const auto diagnostics = comfytest::validation::CheckGraph(workflow, definitions);
  REQUIRE_FALSE(diagnostics.empty());
  const bool names_missing_node =
      std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& d) {
        return d.node_id == 7 && d.message.find("source node 7 does not exist") != std::string::npos;
      });
  CHECK(names_missing_node);

  // The other sub-levels do not depend on the graph being sound.
  CHECK(comfytest::validation::CheckSchema(workflow, definitions).empty());
  CHECK(comfytest::validation::CheckIntrospection(workflow, definitions).empty());
}

TEST_CASE("Graph check reports unconnected required inputs", "[validation][graph]") {
  const NodeDefinitionSet definitions = DemoDefinitions();
  const Workflow workflow = ParseOrFail(R"({
    "nodes": [
      {"id": 3, "type": "DemoSaver", "mode": 0,
       "inputs": [{"name": "images", "type": "IMAGE", "link": null}],
       "outputs": [], "widgets_values": ["demo"]}
    ],
    "links": []
  })");
  const auto diagnostics = comfytest::validation::CheckGraph(workflow, definitions);
  REQUIRE(diagnostics.size() == 1U);
  CHECK(diagnostics.front().field == "images");
  CHECK(diagnostics.front().message.find("is not connected") != std::string::npos);
}

TEST_CASE("Graph check accepts the sound demo workflows", "[validation][graph]") {
  const NodeDefinitionSet definitions = DemoDefinitions();
  CHECK(comfytest::validation::CheckGraph(
            ParseOrFail(comfytest::tests::common::DemoBasicWorkflowJson()), definitions)
            .empty());
  CHECK(comfytest::validation::CheckGraph(
            ParseOrFail(comfytest::tests::common::DemoFlashWorkflowJson()), definitions)
            .empty());
}

TEST_CASE("Types match by wildcard or comma separated list", "[validation][graph]") {
  CHECK(comfytest::validation::TypesCompatible("IMAGE", "IMAGE"));
  CHECK(comfytest::validation::TypesCompatible("*", "LATENT"));
  CHECK(comfytest::validation::TypesCompatible("FILE_3D_GLB", "STRING,FILE_3D_GLB"));
  CHECK_FALSE(comfytest::validation::TypesCompatible("IMAGE", "LATENT"));
}

TEST_CASE("Graph check finds dependency cycles", "[validation][graph]") {
  const Workflow workflow = ParseOrFail(R"({
    "nodes": [
      {"id": 1, "type": "DemoFlash", "mode": 0,
       "inputs": [{"name": "images", "type": "IMAGE", "link": 2}],
       "outputs": [{"name": "image", "type": "IMAGE", "links": [1]}], "widgets_values": [1.0]},
      {"id": 2, "type": "DemoFlash", "mode": 0,
       "inputs": [{"name": "images", "type": "IMAGE", "link": 1}],
       "outputs": [{"name": "image", "type": "IMAGE", "links": [2]}], "widgets_values": [1.0]}
    ],
    "links": [[1, 1, 0, 2, 0, "IMAGE"], [2, 2, 0, 1, 0, "IMAGE"]]
  })");
  CHECK(comfytest::validation::FindCycleNodes(workflow) == std::vector<std::int64_t>{1, 2});
  CHECK(Mentions(comfytest::validation::CheckGraph(workflow, DemoDefinitions()),
                 "dependency cycle through nodes 1, 2"));
}

TEST_CASE("Introspection reports each broken class once", "[validation][introspection]") {
  NodeDefinitionSet definitions = DemoDefinitions();
  definitions.at("DemoLoader").entry_point_resolved = false;
  definitions.at("DemoFlash").return_arity = 2;

  const Workflow workflow = ParseOrFail(R"({
    "nodes": [
      {"id": 1, "type": "DemoLoader", "mode": 0, "inputs": [], "outputs": [], "widgets_values": ["a.png"]},
      {"id": 5, "type": "DemoLoader", "mode": 0, "inputs": [], "outputs": [], "widgets_values": ["b.png"]},
      {"id": 6, "type": "DemoFlash", "mode": 0, "inputs": [], "outputs": [], "widgets_values": [1.0]}
    ],
    "links": []
  })");
  const auto diagnostics = comfytest::validation::CheckIntrospection(workflow, definitions);
  REQUIRE(diagnostics.size() == 2U);
  CHECK(diagnostics[0].node_id == 1);
  CHECK(diagnostics[0].message == "FUNCTION 'DemoLoader' is not defined on the class");
  CHECK(diagnostics[1].node_id == 6);
  CHECK(diagnostics[1].message.find("returns 2 value(s) but RETURN_TYPES has 1") !=
        std::string::npos);
}
