#pragma once

#include "collaborators/collaborators.hpp"

#include <string>

namespace comfytest::collaborators {

inline constexpr const char* kComfyUiRepository = "https://github.com/comfyanonymous/ComfyUI.git";
inline constexpr const char* kPytorchCudaIndex = "https://download.pytorch.org/whl/cu128";
inline constexpr const char* kPypiIndex = "https://pypi.org/simple";

// Installs the host application and the extension into the platform
// workspace with git and uv:
//   <workspace>/ComfyUI                   host checkout at the declared version
//   <workspace>/.venv                     isolated interpreter
//   <workspace>/ComfyUI/custom_nodes/<n>  copy of the extension
//
// Every command appends to `<output>/install.log`.
class LocalEnvironment final : public EnvironmentCollaborator {
public:
  explicit LocalEnvironment(std::string repository = kComfyUiRepository);

  StepOutcome Install(const RunContext& context, const core::CancellationToken& cancel,
                      Installation& installation) override;

private:
  std::string repository_;
};

// Recursive copy that leaves VCS metadata, caches and virtual environments
// behind. Used to stage the extension into custom_nodes.
bool CopyExtensionTree(const std::filesystem::path& source, const std::filesystem::path& target,
                       std::string& error);

} // namespace comfytest::collaborators
