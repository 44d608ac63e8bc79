#pragma once

#include "collaborators/collaborators.hpp"
#include "collaborators/http_client.hpp"
#include "core/process/process_runner.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace comfytest::collaborators {

struct LocalServerOptions {
  std::chrono::milliseconds ready_timeout = std::chrono::seconds(180);
  std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500);
  // Per-call budget for the inspection and instantiation helpers.
  std::chrono::milliseconds helper_timeout = std::chrono::seconds(120);
};

// Lines of a server log that report a custom node failing to import.
std::vector<std::string> ScanImportErrors(std::string_view server_log);

// A host server process owned by one platform. The process group is torn down
// when the session is destroyed.
class LocalServerSession final : public ServerSession {
public:
  LocalServerSession(core::process::ScopedProcess process, std::string base_url,
                     const RunContext& context, Installation installation,
                     std::filesystem::path helper_dir, LocalServerOptions options);
  ~LocalServerSession() override;

  std::string BaseUrl() const override;
  bool QueryNodeDefinitions(const core::CancellationToken& cancel,
                            workflow::NodeDefinitionSet& definitions,
                            std::string& error) override;
  std::vector<std::string> ImportErrors() override;
  bool InspectNodes(const std::vector<std::string>& class_names,
                    const core::CancellationToken& cancel,
                    std::map<std::string, NodeInspection>& inspections,
                    std::string& error) override;
  bool InstantiateNodes(const std::vector<std::string>& class_names,
                        const core::CancellationToken& cancel,
                        std::map<std::string, InstantiationResult>& results,
                        std::string& error) override;

  const HttpClient& Http() const {
    return http_;
  }

private:
  bool RunHelper(const char* script_name, const std::vector<std::string>& class_names,
                 const core::CancellationToken& cancel, core::json::Value& root,
                 std::string& error);

  core::process::ScopedProcess process_;
  HttpClient http_;
  std::map<std::string, std::string> env_;
  core::logging::Logger logger_;
  std::filesystem::path server_log_;
  Installation installation_;
  std::filesystem::path helper_dir_;
  LocalServerOptions options_;
};

// Starts `python main.py --listen 127.0.0.1 --port <port>` from the installed
// host and waits until `/system_stats` answers.
class LocalServer final : public ServerCollaborator {
public:
  explicit LocalServer(LocalServerOptions options = {});

  StepOutcome Start(const RunContext& context, const Installation& installation,
                    const core::CancellationToken& cancel,
                    std::unique_ptr<ServerSession>& session) override;

private:
  LocalServerOptions options_;
};

} // namespace comfytest::collaborators
