#ifndef COMFYTEST_CORE_ERRORS_ERROR_KIND_HPP_
#define COMFYTEST_CORE_ERRORS_ERROR_KIND_HPP_

#include <string>
#include <string_view>

namespace comfytest::core::errors {

// Failure taxonomy shared by levels, validation sub-levels and the report.
// String forms are part of run_report.json and must stay stable.
enum class ErrorKind {
  kNone,
  kConfig,
  kSyntax,
  kEnvironment,
  kRegistration,
  kInstantiation,
  kValidationSchema,
  kValidationGraph,
  kValidationIntrospection,
  kValidationPartialExecution,
  kExecution,
  kTimeout,
  kCancelled,
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kConfig:
    return "ConfigError";
  case ErrorKind::kSyntax:
    return "SyntaxError";
  case ErrorKind::kEnvironment:
    return "EnvironmentError";
  case ErrorKind::kRegistration:
    return "RegistrationError";
  case ErrorKind::kInstantiation:
    return "InstantiationError";
  case ErrorKind::kValidationSchema:
    return "ValidationError.Schema";
  case ErrorKind::kValidationGraph:
    return "ValidationError.Graph";
  case ErrorKind::kValidationIntrospection:
    return "ValidationError.Introspection";
  case ErrorKind::kValidationPartialExecution:
    return "ValidationError.PartialExecution";
  case ErrorKind::kExecution:
    return "ExecutionError";
  case ErrorKind::kTimeout:
    return "Timeout";
  case ErrorKind::kCancelled:
    return "Cancelled";
  }
  return "none";
}

inline bool ParseErrorKind(std::string_view text, ErrorKind& kind) {
  for (const ErrorKind candidate :
       {ErrorKind::kNone, ErrorKind::kConfig, ErrorKind::kSyntax, ErrorKind::kEnvironment,
        ErrorKind::kRegistration, ErrorKind::kInstantiation, ErrorKind::kValidationSchema, ErrorKind::kValidationGraph,
        ErrorKind::kValidationIntrospection, ErrorKind::kValidationPartialExecution,
        ErrorKind::kExecution, ErrorKind::kTimeout, ErrorKind::kCancelled}) {
    if (text == ToString(candidate)) {
      kind = candidate;
      return true;
    }
  }
  return false;
}

// One failure with its classification. `details` holds the multi-line
// collaborator output (stderr tail, traceback) when there is one.
struct Failure {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;
  std::string details;

  bool operator==(const Failure& other) const = default;
};

} // namespace comfytest::core::errors

#endif // COMFYTEST_CORE_ERRORS_ERROR_KIND_HPP_
