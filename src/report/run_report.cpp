#include "report/run_report.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <sstream>

namespace comfytest::report {

namespace {

using core::EscapeJson;
using core::errors::ErrorKind;
using JsonValue = core::json::Value;

void AppendStringArray(std::ostringstream& out, const std::vector<std::string>& values) {
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    out << "\"" << EscapeJson(values[i]) << "\"";
  }
  out << "]";
}

template <typename T>
void AppendObjectArray(std::ostringstream& out, const std::vector<T>& values) {
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    out << ToJson(values[i]);
  }
  out << "]";
}

bool ReadString(const JsonValue& object, std::string_view key, std::string& out,
                const std::string& where, std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr || !value->IsString()) {
    error = where + "." + std::string(key) + ": expected string";
    return false;
  }
  out = value->string_value;
  return true;
}

bool ReadStringArray(const JsonValue& object, std::string_view key, std::vector<std::string>& out,
                     const std::string& where, std::string& error) {
  out.clear();
  const JsonValue* value = object.Find(key);
  if (value == nullptr) {
    return true;
  }
  if (!value->IsArray()) {
    error = where + "." + std::string(key) + ": expected array";
    return false;
  }
  for (const JsonValue& item : value->array_value) {
    if (!item.IsString()) {
      error = where + "." + std::string(key) + ": expected array of strings";
      return false;
    }
    out.push_back(item.string_value);
  }
  return true;
}

bool ReadTimestamp(const JsonValue& object, std::string_view key,
                   std::optional<std::chrono::system_clock::time_point>& out,
                   const std::string& where, std::string& error) {
  out.reset();
  const JsonValue* value = object.Find(key);
  if (value == nullptr) {
    return true;
  }
  std::chrono::system_clock::time_point parsed;
  if (!value->IsString() || !core::ParseUtcTimestamp(value->string_value, parsed)) {
    error = where + "." + std::string(key) + ": expected UTC timestamp";
    return false;
  }
  out = parsed;
  return true;
}

bool ReadErrorKind(const JsonValue& object, std::string_view key, ErrorKind& kind,
                   const std::string& where, std::string& error) {
  kind = ErrorKind::kNone;
  const JsonValue* value = object.Find(key);
  if (value == nullptr) {
    return true;
  }
  if (!value->IsString() || !core::errors::ParseErrorKind(value->string_value, kind)) {
    error = where + "." + std::string(key) + ": unknown error kind";
    return false;
  }
  return true;
}

bool ReadLevelStatus(const JsonValue& object, LevelStatus& status, const std::string& where,
                     std::string& error) {
  std::string raw;
  if (!ReadString(object, "status", raw, where, error)) {
    return false;
  }
  if (!ParseLevelStatus(raw, status)) {
    error = where + ".status: unknown status '" + raw + "'";
    return false;
  }
  return true;
}

const JsonValue* RequireArray(const JsonValue& object, std::string_view key,
                              const std::string& where, std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr || !value->IsArray()) {
    error = where + "." + std::string(key) + ": expected array";
    return nullptr;
  }
  return value;
}

bool ParseDiagnostics(const JsonValue& object, std::vector<Diagnostic>& out,
                      const std::string& where, std::string& error) {
  out.clear();
  const JsonValue* items = object.Find("diagnostics");
  if (items == nullptr) {
    return true;
  }
  if (!items->IsArray()) {
    error = where + ".diagnostics: expected array";
    return false;
  }
  for (std::size_t i = 0; i < items->array_value.size(); ++i) {
    const JsonValue& item = items->array_value[i];
    const std::string item_where = where + ".diagnostics[" + std::to_string(i) + "]";
    if (!item.IsObject()) {
      error = item_where + ": expected object";
      return false;
    }
    Diagnostic diagnostic;
    if (const JsonValue* node_id = item.Find("node_id"); node_id != nullptr) {
      if (!node_id->IsInteger()) {
        error = item_where + ".node_id: expected integer";
        return false;
      }
      diagnostic.node_id = static_cast<std::int64_t>(node_id->number_value);
    }
    if (item.Find("node_class") != nullptr &&
        !ReadString(item, "node_class", diagnostic.node_class, item_where, error)) {
      return false;
    }
    if (item.Find("field") != nullptr &&
        !ReadString(item, "field", diagnostic.field, item_where, error)) {
      return false;
    }
    if (!ReadString(item, "message", diagnostic.message, item_where, error)) {
      return false;
    }
    out.push_back(std::move(diagnostic));
  }
  return true;
}

bool ParseValidation(const JsonValue& object, ValidationReport& validation,
                     const std::string& where, std::string& error) {
  const JsonValue* workflows = RequireArray(object, "workflows", where, error);
  if (workflows == nullptr) {
    return false;
  }
  for (std::size_t i = 0; i < workflows->array_value.size(); ++i) {
    const JsonValue& item = workflows->array_value[i];
    const std::string item_where = where + ".workflows[" + std::to_string(i) + "]";
    WorkflowValidation entry;
    if (!ReadString(item, "workflow", entry.workflow, item_where, error)) {
      return false;
    }
    const JsonValue* sub_levels = RequireArray(item, "sub_levels", item_where, error);
    if (sub_levels == nullptr) {
      return false;
    }
    if (sub_levels->array_value.size() != kSubLevelCount) {
      error = item_where + ".sub_levels: expected " + std::to_string(kSubLevelCount) + " entries";
      return false;
    }
    for (std::size_t s = 0; s < kSubLevelCount; ++s) {
      const JsonValue& sub = sub_levels->array_value[s];
      const std::string sub_where = item_where + ".sub_levels[" + std::to_string(s) + "]";
      SubLevelResult& result = entry.sub_levels[s];
      std::string name;
      SubLevel sub_level = SubLevel::kSchema;
      if (!ReadString(sub, "name", name, sub_where, error)) {
        return false;
      }
      if (!ParseSubLevel(name, sub_level) || sub_level != result.sub_level) {
        error = sub_where + ".name: expected '" + ToString(result.sub_level) + "'";
        return false;
      }
      if (!ReadLevelStatus(sub, result.status, sub_where, error) ||
          !ReadErrorKind(sub, "failure_kind", result.failure_kind, sub_where, error) ||
          !ParseDiagnostics(sub, result.diagnostics, sub_where, error)) {
        return false;
      }
      if (sub.Find("note") != nullptr && !ReadString(sub, "note", result.note, sub_where, error)) {
        return false;
      }
    }
    validation.workflows.push_back(std::move(entry));
  }
  return ReadStringArray(object, "excluded", validation.excluded, where, error);
}

bool ParseWorkflowRuns(const JsonValue& object, std::vector<WorkflowRun>& out,
                       const std::string& where, std::string& error) {
  out.clear();
  const JsonValue* items = object.Find("workflows");
  if (items == nullptr) {
    return true;
  }
  if (!items->IsArray()) {
    error = where + ".workflows: expected array";
    return false;
  }
  for (std::size_t i = 0; i < items->array_value.size(); ++i) {
    const JsonValue& item = items->array_value[i];
    const std::string item_where = where + ".workflows[" + std::to_string(i) + "]";
    WorkflowRun run;
    if (!ReadString(item, "workflow", run.workflow, item_where, error) ||
        !ReadLevelStatus(item, run.status, item_where, error) ||
        !ReadErrorKind(item, "failure_kind", run.failure_kind, item_where, error) ||
        !ReadStringArray(item, "artifacts", run.artifacts, item_where, error)) {
      return false;
    }
    if (item.Find("message") != nullptr &&
        !ReadString(item, "message", run.message, item_where, error)) {
      return false;
    }
    if (const JsonValue* elapsed = item.Find("elapsed_ms"); elapsed != nullptr) {
      if (!elapsed->IsInteger()) {
        error = item_where + ".elapsed_ms: expected integer";
        return false;
      }
      run.elapsed = std::chrono::milliseconds(static_cast<std::int64_t>(elapsed->number_value));
    }
    out.push_back(std::move(run));
  }
  return true;
}

bool ParseLevel(const JsonValue& object, LevelResult& result, const std::string& where,
                std::string& error) {
  std::string name;
  if (!ReadString(object, "level", name, where, error)) {
    return false;
  }
  config::Level level = config::Level::kSyntax;
  if (!config::ParseLevel(name, level) || level != result.level) {
    error = where + ".level: expected '" + std::string(config::ToString(result.level)) + "'";
    return false;
  }
  if (!ReadLevelStatus(object, result.status, where, error) ||
      !ReadTimestamp(object, "started_at_utc", result.started_at, where, error) ||
      !ReadTimestamp(object, "finished_at_utc", result.finished_at, where, error) ||
      !ParseDiagnostics(object, result.diagnostics, where, error) ||
      !ReadStringArray(object, "warnings", result.warnings, where, error) ||
      !ParseWorkflowRuns(object, result.workflows, where, error) ||
      !ReadStringArray(object, "artifacts", result.artifacts, where, error)) {
    return false;
  }
  if (const JsonValue* implicit = object.Find("implicit"); implicit != nullptr) {
    if (!implicit->IsBool()) {
      error = where + ".implicit: expected boolean";
      return false;
    }
    result.implicit = implicit->bool_value;
  }
  if (const JsonValue* skip = object.Find("skip_reason"); skip != nullptr) {
    if (!skip->IsString() || !ParseSkipReason(skip->string_value, result.skip_reason)) {
      error = where + ".skip_reason: unknown reason";
      return false;
    }
  }
  if (const JsonValue* failure = object.Find("failure"); failure != nullptr) {
    if (!failure->IsObject()) {
      error = where + ".failure: expected object";
      return false;
    }
    core::errors::Failure parsed;
    const std::string failure_where = where + ".failure";
    if (!ReadErrorKind(*failure, "kind", parsed.kind, failure_where, error) ||
        !ReadString(*failure, "message", parsed.message, failure_where, error)) {
      return false;
    }
    if (failure->Find("details") != nullptr &&
        !ReadString(*failure, "details", parsed.details, failure_where, error)) {
      return false;
    }
    result.failure = std::move(parsed);
  }
  if (const JsonValue* validation = object.Find("validation"); validation != nullptr) {
    if (!validation->IsObject()) {
      error = where + ".validation: expected object";
      return false;
    }
    ValidationReport parsed;
    if (!ParseValidation(*validation, parsed, where + ".validation", error)) {
      return false;
    }
    result.validation = std::move(parsed);
  }
  return true;
}

bool ParsePlatform(const JsonValue& object, PlatformReport& platform, const std::string& where,
                   std::string& error) {
  std::string raw;
  if (!ReadString(object, "platform", raw, where, error)) {
    return false;
  }
  if (!config::ParsePlatformId(raw, platform.platform)) {
    error = where + ".platform: unknown platform '" + raw + "'";
    return false;
  }
  if (!ReadString(object, "runner", raw, where, error)) {
    return false;
  }
  if (raw == "cpu") {
    platform.runner = config::RunnerClass::kCpu;
  } else if (raw == "gpu") {
    platform.runner = config::RunnerClass::kGpu;
  } else {
    error = where + ".runner: expected cpu|gpu";
    return false;
  }
  const JsonValue* port = object.Find("server_port");
  if (port == nullptr || !port->IsInteger() || port->number_value < 0.0 ||
      port->number_value > 65535.0) {
    error = where + ".server_port: expected port number";
    return false;
  }
  platform.server_port = static_cast<std::uint16_t>(port->number_value);
  const JsonValue* finalized = object.Find("finalized");
  platform.finalized = finalized != nullptr && finalized->IsBool() && finalized->bool_value;

  const JsonValue* levels = RequireArray(object, "levels", where, error);
  if (levels == nullptr) {
    return false;
  }
  if (levels->array_value.size() != config::kLevelCount) {
    error = where + ".levels: expected " + std::to_string(config::kLevelCount) + " entries";
    return false;
  }
  for (std::size_t i = 0; i < config::kLevelCount; ++i) {
    if (!ParseLevel(levels->array_value[i], platform.levels[i],
                    where + ".levels[" + std::to_string(i) + "]", error)) {
      return false;
    }
  }
  return true;
}

} // namespace

const char* ToString(LevelStatus status) {
  switch (status) {
  case LevelStatus::kPending:
    return "pending";
  case LevelStatus::kRunning:
    return "running";
  case LevelStatus::kPassed:
    return "passed";
  case LevelStatus::kFailed:
    return "failed";
  case LevelStatus::kSkipped:
    return "skipped";
  }
  return "pending";
}

bool ParseLevelStatus(std::string_view raw, LevelStatus& status) {
  for (const LevelStatus candidate : {LevelStatus::kPending, LevelStatus::kRunning,
                                      LevelStatus::kPassed, LevelStatus::kFailed,
                                      LevelStatus::kSkipped}) {
    if (raw == ToString(candidate)) {
      status = candidate;
      return true;
    }
  }
  return false;
}

const char* ToString(SkipReason reason) {
  switch (reason) {
  case SkipReason::kNone:
    return "none";
  case SkipReason::kNotRequested:
    return "not requested";
  case SkipReason::kSkipWorkflow:
    return "skip_workflow";
  case SkipReason::kNoWorkflows:
    return "no workflows in scope";
  case SkipReason::kBlocked:
    return "blocked by failed predecessor";
  case SkipReason::kCancelled:
    return "cancelled";
  }
  return "none";
}

bool ParseSkipReason(std::string_view raw, SkipReason& reason) {
  for (const SkipReason candidate :
       {SkipReason::kNone, SkipReason::kNotRequested, SkipReason::kSkipWorkflow,
        SkipReason::kNoWorkflows, SkipReason::kBlocked, SkipReason::kCancelled}) {
    if (raw == ToString(candidate)) {
      reason = candidate;
      return true;
    }
  }
  return false;
}

std::string FormatDiagnostic(const Diagnostic& diagnostic) {
  std::string text;
  if (diagnostic.node_id.has_value()) {
    text = "node " + std::to_string(*diagnostic.node_id);
    if (!diagnostic.node_class.empty()) {
      text += " (" + diagnostic.node_class + ")";
    }
  } else if (!diagnostic.node_class.empty()) {
    text = diagnostic.node_class;
  }
  if (!diagnostic.field.empty()) {
    text += text.empty() ? diagnostic.field : " " + diagnostic.field;
  }
  if (!text.empty()) {
    text += ": ";
  }
  return text + diagnostic.message;
}

const char* ToString(SubLevel sub_level) {
  switch (sub_level) {
  case SubLevel::kSchema:
    return "schema";
  case SubLevel::kGraph:
    return "graph";
  case SubLevel::kIntrospection:
    return "introspection";
  case SubLevel::kPartialExecution:
    return "partial_execution";
  }
  return "schema";
}

bool ParseSubLevel(std::string_view raw, SubLevel& sub_level) {
  for (const SubLevel candidate : kAllSubLevels) {
    if (raw == ToString(candidate)) {
      sub_level = candidate;
      return true;
    }
  }
  return false;
}

ErrorKind FailureKindFor(SubLevel sub_level) {
  switch (sub_level) {
  case SubLevel::kSchema:
    return ErrorKind::kValidationSchema;
  case SubLevel::kGraph:
    return ErrorKind::kValidationGraph;
  case SubLevel::kIntrospection:
    return ErrorKind::kValidationIntrospection;
  case SubLevel::kPartialExecution:
    return ErrorKind::kValidationPartialExecution;
  }
  return ErrorKind::kValidationSchema;
}

bool WorkflowValidation::Passed() const {
  return std::none_of(sub_levels.begin(), sub_levels.end(), [](const SubLevelResult& result) {
    return result.status == LevelStatus::kFailed || result.status == LevelStatus::kPending ||
           result.status == LevelStatus::kRunning;
  });
}

bool ValidationReport::Passed() const {
  return std::all_of(workflows.begin(), workflows.end(),
                     [](const WorkflowValidation& workflow) { return workflow.Passed(); });
}

bool PlatformReport::Succeeded() const {
  return std::all_of(levels.begin(), levels.end(), [](const LevelResult& result) {
    if (result.status == LevelStatus::kPassed) {
      return true;
    }
    return result.status == LevelStatus::kSkipped && IsConfigurationSkip(result.skip_reason);
  });
}

const PlatformReport* RunReport::FindPlatform(config::PlatformId platform) const {
  for (const PlatformReport& entry : platforms) {
    if (entry.platform == platform) {
      return &entry;
    }
  }
  return nullptr;
}

bool RunReport::Succeeded() const {
  return std::all_of(platforms.begin(), platforms.end(),
                     [](const PlatformReport& platform) { return platform.Succeeded(); });
}

std::string ToJson(const Diagnostic& diagnostic) {
  std::ostringstream out;
  out << "{";
  if (diagnostic.node_id.has_value()) {
    out << "\"node_id\":" << diagnostic.node_id.value() << ",";
  }
  if (!diagnostic.node_class.empty()) {
    out << "\"node_class\":\"" << EscapeJson(diagnostic.node_class) << "\",";
  }
  if (!diagnostic.field.empty()) {
    out << "\"field\":\"" << EscapeJson(diagnostic.field) << "\",";
  }
  out << "\"message\":\"" << EscapeJson(diagnostic.message) << "\"}";
  return out.str();
}

std::string ToJson(const SubLevelResult& result) {
  std::ostringstream out;
  out << "{"
      << "\"name\":\"" << ToString(result.sub_level) << "\","
      << "\"status\":\"" << ToString(result.status) << "\"";
  if (result.failure_kind != ErrorKind::kNone) {
    out << ",\"failure_kind\":\"" << core::errors::ToString(result.failure_kind) << "\"";
  }
  if (!result.note.empty()) {
    out << ",\"note\":\"" << EscapeJson(result.note) << "\"";
  }
  out << ",\"diagnostics\":";
  AppendObjectArray(out, result.diagnostics);
  out << "}";
  return out.str();
}

std::string ToJson(const WorkflowValidation& validation) {
  std::ostringstream out;
  out << "{"
      << "\"workflow\":\"" << EscapeJson(validation.workflow) << "\","
      << "\"passed\":" << (validation.Passed() ? "true" : "false") << ","
      << "\"sub_levels\":[";
  for (std::size_t i = 0; i < validation.sub_levels.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    out << ToJson(validation.sub_levels[i]);
  }
  out << "]}";
  return out.str();
}

std::string ToJson(const ValidationReport& report) {
  std::ostringstream out;
  out << "{\"workflows\":";
  AppendObjectArray(out, report.workflows);
  out << ",\"excluded\":";
  AppendStringArray(out, report.excluded);
  out << "}";
  return out.str();
}

std::string ToJson(const WorkflowRun& run) {
  std::ostringstream out;
  out << "{"
      << "\"workflow\":\"" << EscapeJson(run.workflow) << "\","
      << "\"status\":\"" << ToString(run.status) << "\"";
  if (run.failure_kind != ErrorKind::kNone) {
    out << ",\"failure_kind\":\"" << core::errors::ToString(run.failure_kind) << "\"";
  }
  if (!run.message.empty()) {
    out << ",\"message\":\"" << EscapeJson(run.message) << "\"";
  }
  out << ",\"elapsed_ms\":" << run.elapsed.count() << ",\"artifacts\":";
  AppendStringArray(out, run.artifacts);
  out << "}";
  return out.str();
}

std::string ToJson(const LevelResult& result) {
  std::ostringstream out;
  out << "{"
      << "\"level\":\"" << config::ToString(result.level) << "\","
      << "\"status\":\"" << ToString(result.status) << "\"";
  if (result.implicit) {
    out << ",\"implicit\":true";
  }
  if (result.skip_reason != SkipReason::kNone) {
    out << ",\"skip_reason\":\"" << ToString(result.skip_reason) << "\"";
  }
  if (result.started_at.has_value()) {
    out << ",\"started_at_utc\":\"" << core::FormatUtcTimestamp(result.started_at.value()) << "\"";
  }
  if (result.finished_at.has_value()) {
    out << ",\"finished_at_utc\":\"" << core::FormatUtcTimestamp(result.finished_at.value())
        << "\"";
  }
  if (result.failure.has_value()) {
    out << ",\"failure\":{"
        << "\"kind\":\"" << core::errors::ToString(result.failure->kind) << "\","
        << "\"message\":\"" << EscapeJson(result.failure->message) << "\"";
    if (!result.failure->details.empty()) {
      out << ",\"details\":\"" << EscapeJson(result.failure->details) << "\"";
    }
    out << "}";
  }
  out << ",\"diagnostics\":";
  AppendObjectArray(out, result.diagnostics);
  out << ",\"warnings\":";
  AppendStringArray(out, result.warnings);
  out << ",\"workflows\":";
  AppendObjectArray(out, result.workflows);
  if (result.validation.has_value()) {
    out << ",\"validation\":" << ToJson(result.validation.value());
  }
  out << ",\"artifacts\":";
  AppendStringArray(out, result.artifacts);
  out << "}";
  return out.str();
}

std::string ToJson(const PlatformReport& report) {
  std::ostringstream out;
  out << "{"
      << "\"platform\":\"" << config::ToString(report.platform) << "\","
      << "\"runner\":\"" << config::ToString(report.runner) << "\","
      << "\"server_port\":" << report.server_port << ","
      << "\"finalized\":" << (report.finalized ? "true" : "false") << ","
      << "\"succeeded\":" << (report.Succeeded() ? "true" : "false") << ","
      << "\"levels\":[";
  for (std::size_t i = 0; i < report.levels.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    out << ToJson(report.levels[i]);
  }
  out << "]}";
  return out.str();
}

std::string ToJson(const RunReport& report) {
  std::ostringstream out;
  out << "{"
      << "\"tool_version\":\"" << EscapeJson(report.tool_version) << "\","
      << "\"project\":{"
      << "\"name\":\"" << EscapeJson(report.project.name) << "\","
      << "\"comfyui_version\":\"" << EscapeJson(report.project.comfyui_version) << "\","
      << "\"python_version\":\"" << EscapeJson(report.project.python_version) << "\","
      << "\"cuda_packages\":";
  AppendStringArray(out, report.project.cuda_packages);
  out << "},"
      << "\"timestamps\":{"
      << "\"started_at_utc\":\"" << core::FormatUtcTimestamp(report.started_at) << "\","
      << "\"finished_at_utc\":\"" << core::FormatUtcTimestamp(report.finished_at) << "\""
      << "},"
      << "\"succeeded\":" << (report.Succeeded() ? "true" : "false") << ","
      << "\"platforms\":";
  AppendObjectArray(out, report.platforms);
  out << "}";
  return out.str();
}

bool ParseRunReport(std::string_view json_text, RunReport& report, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "run report must be a JSON object";
    return false;
  }

  RunReport parsed;
  if (!ReadString(root, "tool_version", parsed.tool_version, "$", error)) {
    return false;
  }

  const JsonValue* project = root.Find("project");
  if (project == nullptr || !project->IsObject()) {
    error = "$.project: expected object";
    return false;
  }
  if (!ReadString(*project, "name", parsed.project.name, "$.project", error) ||
      !ReadString(*project, "comfyui_version", parsed.project.comfyui_version, "$.project",
                  error) ||
      !ReadString(*project, "python_version", parsed.project.python_version, "$.project",
                  error) ||
      !ReadStringArray(*project, "cuda_packages", parsed.project.cuda_packages, "$.project",
                       error)) {
    return false;
  }

  const JsonValue* timestamps = root.Find("timestamps");
  if (timestamps == nullptr || !timestamps->IsObject()) {
    error = "$.timestamps: expected object";
    return false;
  }
  std::optional<std::chrono::system_clock::time_point> started;
  std::optional<std::chrono::system_clock::time_point> finished;
  if (!ReadTimestamp(*timestamps, "started_at_utc", started, "$.timestamps", error) ||
      !ReadTimestamp(*timestamps, "finished_at_utc", finished, "$.timestamps", error)) {
    return false;
  }
  parsed.started_at = started.value_or(std::chrono::system_clock::time_point{});
  parsed.finished_at = finished.value_or(std::chrono::system_clock::time_point{});

  const JsonValue* platforms = RequireArray(root, "platforms", "$", error);
  if (platforms == nullptr) {
    return false;
  }
  for (std::size_t i = 0; i < platforms->array_value.size(); ++i) {
    PlatformReport platform;
    if (!ParsePlatform(platforms->array_value[i], platform,
                       "$.platforms[" + std::to_string(i) + "]", error)) {
      return false;
    }
    parsed.platforms.push_back(std::move(platform));
  }

  report = std::move(parsed);
  return true;
}

} // namespace comfytest::report
