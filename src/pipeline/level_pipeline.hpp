#pragma once

#include "collaborators/collaborators.hpp"
#include "config/project.hpp"
#include "config/run_config.hpp"
#include "core/cancellation.hpp"
#include "cuda/classifier.hpp"
#include "events/emitter.hpp"
#include "pipeline/level_gate.hpp"
#include "pipeline/run_plan.hpp"
#include "report/result_aggregator.hpp"
#include "workflow/discovery.hpp"
#include "workflow/node_definition.hpp"
#include "workflow/workflow.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace comfytest::pipeline {

// Everything one platform pipeline needs. `config`, `project` and `catalog`
// are shared read-only across platforms; `run` is owned by this platform.
struct PipelineContext {
  const config::RunConfig* config = nullptr;
  const config::Project* project = nullptr;
  const workflow::WorkflowCatalog* catalog = nullptr;
  LevelSelection selection;
  collaborators::CollaboratorSet collaborators;
  collaborators::RunContext run;
};

// Seven-level state machine for one platform.
//
// Contract:
// - Levels run strictly in order through RunLevelGate; results stream into
//   the aggregator as they finish, and the platform is finalized before Run
//   returns.
// - The host server acquired at REGISTRATION lives until Run returns and is
//   stopped on every path.
// - Every collaborator call carries a child of `cancel`; calls with a budget
//   are wrapped in RunWithDeadline so expiry is reported as `Timeout`.
class LevelPipeline : private LevelObserver {
public:
  LevelPipeline(PipelineContext context, report::ResultAggregator& aggregator);

  LevelPipeline(const LevelPipeline&) = delete;
  LevelPipeline& operator=(const LevelPipeline&) = delete;

  // Returns false when the results could not be recorded (aggregator or
  // event sink failure); level failures are reported through the aggregator.
  bool Run(const core::CancellationToken& cancel, std::string& error);

  const workflow::NodeDefinitionSet& Definitions() const {
    return definitions_;
  }
  const cuda::CudaClassification& CudaFlags() const {
    return cuda_;
  }

private:
  void LevelStarted(config::Level level, bool implicit,
                    std::chrono::system_clock::time_point at) override;
  void LevelFinished(const report::LevelResult& result) override;

  std::vector<LevelDescriptor> BuildDescriptors();

  report::LevelResult RunSyntax(const core::CancellationToken& cancel);
  report::LevelResult RunInstall(const core::CancellationToken& cancel);
  report::LevelResult RunRegistration(const core::CancellationToken& cancel);
  report::LevelResult RunInstantiation(const core::CancellationToken& cancel);
  report::LevelResult RunStaticCapture(const core::CancellationToken& cancel);
  report::LevelResult RunValidation(const core::CancellationToken& cancel);
  report::LevelResult RunExecution(const core::CancellationToken& cancel);

  collaborators::ExecutionOutcome ExecuteWithDeadline(const collaborators::ExecutionRequest& request,
                                                      const core::CancellationToken& cancel);
  std::vector<const workflow::WorkflowEntry*> LevelWorkflows(config::Level level) const;
  // True under `surviving_only` when the graph uses a class that failed INSTANTIATION.
  bool ExcludedByInstantiation(const workflow::Workflow& graph) const;
  void RecordError(const std::string& message);

  PipelineContext context_;
  report::ResultAggregator& aggregator_;
  events::Emitter emitter_;

  collaborators::Installation installation_;
  std::unique_ptr<collaborators::ServerSession> session_;
  workflow::NodeDefinitionSet definitions_;
  std::vector<std::string> extension_classes_;
  std::set<std::string> failed_classes_;
  cuda::CudaClassification cuda_;

  // First recording failure; Run reports it once the gate finishes.
  std::string record_error_;
};

} // namespace comfytest::pipeline
