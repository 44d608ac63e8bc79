#include "events/jsonl_writer.hpp"

#include "artifacts/output_dir_utils.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace comfytest::events {

bool AppendEventJsonl(const Event& event, const fs::path& output_dir, fs::path& written_path,
                      std::string& error) {
  if (!artifacts::EnsureOutputDir(output_dir, error)) {
    return false;
  }

  written_path = output_dir / artifacts::kEventsFileName;
  std::ofstream out_file(written_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open event log '" + written_path.string() + "' for append";
    return false;
  }

  out_file << ToJson(event) << '\n';
  if (!out_file) {
    error = "failed while writing event log '" + written_path.string() + "'";
    return false;
  }

  return true;
}

} // namespace comfytest::events
