#include "collaborators/http_execution.hpp"

#include "collaborators/http_client.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <optional>
#include <sstream>
#include <thread>
#include <utility>

namespace comfytest::collaborators {

namespace {

const std::string* StringField(const core::json::Value& value, std::string_view key) {
  const core::json::Value* field = value.Find(key);
  return field != nullptr && field->IsString() ? &field->string_value : nullptr;
}

std::optional<std::int64_t> ParseNodeId(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::int64_t id = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    id = id * 10 + (c - '0');
  }
  return id;
}

// Collects progress lines and publishes them to the request's log file.
class ExecutionLog {
public:
  void Line(std::string_view text) {
    out_ << core::FormatUtcTimestamp(std::chrono::system_clock::now()) << ' ' << text << '\n';
  }

  void Flush(const std::filesystem::path& path, const core::logging::Logger& logger) const {
    if (path.empty()) {
      return;
    }
    std::string error;
    if (!core::WriteTextFileAtomic(path, out_.str(), error)) {
      logger.Warn("failed to write execution log", {{"error", error}});
    }
  }

private:
  std::ostringstream out_;
};

void Interrupt(const HttpClient& http, ExecutionLog& log) {
  // A fresh token: the run's own token is usually the one that fired.
  core::CancellationToken interrupt_token;
  HttpResponse response;
  std::string error;
  if (!http.PostJson("/interrupt", "{}", interrupt_token, response, error)) {
    log.Line("interrupt failed: " + error);
    return;
  }
  log.Line("interrupt sent (HTTP " + std::to_string(response.status) + ")");
}

// Downloads the images a finished prompt reports under `outputs`.
std::vector<std::string> DownloadOutputs(const HttpClient& http, const core::json::Value& outputs,
                                         const RunContext& context, const std::string& stem,
                                         const core::CancellationToken& cancel,
                                         ExecutionLog& log) {
  std::vector<std::string> artifacts;
  if (!outputs.IsObject()) {
    return artifacts;
  }
  for (const auto& [node_id, node_output] : outputs.object_value) {
    const core::json::Value* images = node_output.Find("images");
    if (images == nullptr || !images->IsArray()) {
      continue;
    }
    for (const core::json::Value& image : images->array_value) {
      const std::string* filename = StringField(image, "filename");
      if (filename == nullptr) {
        continue;
      }
      const std::string* subfolder = StringField(image, "subfolder");
      const std::string* type = StringField(image, "type");
      const std::string query = "/view?filename=" + EncodeQueryValue(*filename) +
                                "&subfolder=" + EncodeQueryValue(subfolder ? *subfolder : "") +
                                "&type=" + EncodeQueryValue(type ? *type : "output");
      HttpResponse response;
      std::string error;
      if (!http.Get(query, cancel, response, error) || response.status != 200) {
        log.Line("node " + node_id + ": could not download " + *filename +
                 (error.empty() ? "" : ": " + error));
        continue;
      }
      const std::string relative =
          "outputs/" + stem + "/" + core::SanitizeFileStem(*filename);
      if (!core::WriteTextFileAtomic(context.output_dir / relative, response.body, error)) {
        log.Line("node " + node_id + ": " + error);
        continue;
      }
      artifacts.push_back(relative);
    }
  }
  return artifacts;
}

} // namespace

std::vector<report::Diagnostic> ParseNodeErrors(const core::json::Value& node_errors) {
  std::vector<report::Diagnostic> diagnostics;
  if (!node_errors.IsObject()) {
    return diagnostics;
  }
  for (const auto& [node_id, entry] : node_errors.object_value) {
    report::Diagnostic base;
    base.node_id = ParseNodeId(node_id);
    if (const std::string* class_type = StringField(entry, "class_type")) {
      base.node_class = *class_type;
    }
    const core::json::Value* errors = entry.Find("errors");
    if (errors == nullptr || !errors->IsArray() || errors->array_value.empty()) {
      base.message = "rejected by the server";
      diagnostics.push_back(std::move(base));
      continue;
    }
    for (const core::json::Value& error : errors->array_value) {
      report::Diagnostic diagnostic = base;
      const std::string* message = StringField(error, "message");
      const std::string* details = StringField(error, "details");
      diagnostic.message = message != nullptr ? *message : "rejected by the server";
      if (details != nullptr && !details->empty()) {
        diagnostic.message += ": " + *details;
      }
      if (const core::json::Value* extra = error.Find("extra_info")) {
        if (const std::string* input_name = StringField(*extra, "input_name")) {
          diagnostic.field = *input_name;
        }
      }
      diagnostics.push_back(std::move(diagnostic));
    }
  }
  return diagnostics;
}

std::vector<report::Diagnostic> ParseExecutionErrors(const core::json::Value& status) {
  std::vector<report::Diagnostic> diagnostics;
  const core::json::Value* messages = status.Find("messages");
  if (messages == nullptr || !messages->IsArray()) {
    return diagnostics;
  }
  // Each message is a `[event, data]` pair.
  for (const core::json::Value& message : messages->array_value) {
    if (!message.IsArray() || message.array_value.size() != 2 ||
        !message.array_value[0].IsString() ||
        message.array_value[0].string_value != "execution_error") {
      continue;
    }
    const core::json::Value& data = message.array_value[1];
    report::Diagnostic diagnostic;
    if (const std::string* node_id = StringField(data, "node_id")) {
      diagnostic.node_id = ParseNodeId(*node_id);
    }
    if (const std::string* node_type = StringField(data, "node_type")) {
      diagnostic.node_class = *node_type;
    }
    const std::string* exception_type = StringField(data, "exception_type");
    const std::string* exception_message = StringField(data, "exception_message");
    diagnostic.message = exception_type != nullptr ? *exception_type : "execution error";
    if (exception_message != nullptr && !exception_message->empty()) {
      diagnostic.message += ": " + *exception_message;
    }
    diagnostics.push_back(std::move(diagnostic));
  }
  return diagnostics;
}

HttpExecution::HttpExecution(HttpExecutionOptions options) : options_(options) {}

ExecutionOutcome HttpExecution::Execute(const RunContext& context, ServerSession& session,
                                        const ExecutionRequest& request,
                                        const core::CancellationToken& cancel) {
  const auto started = std::chrono::steady_clock::now();
  const HttpClient http(session.BaseUrl());
  ExecutionLog log;
  ExecutionOutcome outcome;
  auto finish = [&](ExecutionOutcome result) {
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    log.Line(std::string("status=") + ToString(result.status) +
             (result.message.empty() ? "" : " message=" + result.message));
    log.Flush(request.log_path, context.logger);
    return result;
  };

  core::json::Value body = core::json::Value::MakeObject();
  body.object_value.emplace_back("prompt", request.prompt);
  body.object_value.emplace_back(
      "client_id", core::json::Value::MakeString("comfy-test-" +
                                                 std::string(config::ToString(context.platform))));
  log.Line("submitting " + request.workflow + " to " + http.BaseUrl());

  HttpResponse response;
  std::string error;
  if (!http.PostJson("/prompt", core::SerializeJson(body), cancel, response, error)) {
    outcome.status = cancel.IsCancelled() ? ExecutionStatus::kCancelled : ExecutionStatus::kFailed;
    outcome.message = error;
    return finish(std::move(outcome));
  }

  core::json::Value submitted;
  if (!core::json::Parse(response.body, submitted, error)) {
    outcome.status = ExecutionStatus::kFailed;
    outcome.message = "/prompt returned HTTP " + std::to_string(response.status) +
                      " with an unparsable body: " + error;
    return finish(std::move(outcome));
  }
  if (response.status != 200) {
    outcome.status = ExecutionStatus::kFailed;
    outcome.message = "prompt rejected (HTTP " + std::to_string(response.status) + ")";
    if (const core::json::Value* top = submitted.Find("error")) {
      if (const std::string* message = StringField(*top, "message")) {
        outcome.message += ": " + *message;
      }
    }
    if (const core::json::Value* node_errors = submitted.Find("node_errors")) {
      outcome.diagnostics = ParseNodeErrors(*node_errors);
    }
    outcome.details = response.body;
    return finish(std::move(outcome));
  }
  const std::string* prompt_id = StringField(submitted, "prompt_id");
  if (prompt_id == nullptr) {
    outcome.status = ExecutionStatus::kFailed;
    outcome.message = "/prompt response has no prompt_id";
    return finish(std::move(outcome));
  }
  log.Line("queued prompt_id=" + *prompt_id);

  const std::string history_path = "/history/" + *prompt_id;
  while (true) {
    if (cancel.IsCancelled()) {
      Interrupt(http, log);
      outcome.status = ExecutionStatus::kCancelled;
      outcome.message = "cancelled";
      return finish(std::move(outcome));
    }
    if (request.timeout.count() > 0 &&
        std::chrono::steady_clock::now() - started >= request.timeout) {
      Interrupt(http, log);
      outcome.status = ExecutionStatus::kTimedOut;
      outcome.message = "exceeded timeout of " +
                        std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                           request.timeout)
                                           .count()) +
                        "s";
      return finish(std::move(outcome));
    }

    if (http.Get(history_path, cancel, response, error) && response.status == 200) {
      core::json::Value history;
      if (!core::json::Parse(response.body, history, error)) {
        log.Line("unparsable history: " + error);
      } else if (const core::json::Value* entry = history.Find(*prompt_id)) {
        const core::json::Value* status = entry->Find("status");
        const std::string* status_str =
            status != nullptr ? StringField(*status, "status_str") : nullptr;
        if (status_str != nullptr && *status_str == "success") {
          const core::json::Value* outputs = entry->Find("outputs");
          if (options_.download_outputs && outputs != nullptr) {
            outcome.outputs =
                DownloadOutputs(http, *outputs, context,
                                core::SanitizeFileStem(request.workflow), cancel, log);
          }
          outcome.status = ExecutionStatus::kCompleted;
          return finish(std::move(outcome));
        }
        if (status_str != nullptr && *status_str == "error") {
          outcome.status = ExecutionStatus::kFailed;
          outcome.diagnostics = ParseExecutionErrors(*status);
          outcome.message = outcome.diagnostics.empty()
                                ? "execution failed"
                                : report::FormatDiagnostic(outcome.diagnostics.front());
          outcome.details = core::SerializeJson(*status);
          return finish(std::move(outcome));
        }
      }
    } else if (!error.empty()) {
      log.Line("history poll failed: " + error);
      error.clear();
    }
    std::this_thread::sleep_for(options_.poll_interval);
  }
}

} // namespace comfytest::collaborators
