#pragma once

// warden/types.hpp - Core value types shared by the driver, governor and interceptor.
//
// LIFECYCLE:
//   - ExecutionRequest is built once per invocation from argv (resolve_request)
//     and consumed immediately by Driver::run().
//   - ExecutionOutcome is produced once per request and returned by value.
//     Nothing holds a reference to it after run() returns.
//
// MEMORY OWNERSHIP:
//   - All members are value-owned. No borrowed references, no raw pointers.

#include <cstdint>
#include <string>
#include <vector>

namespace warden {

enum class ErrorCode {
  none,
  config_invalid,
  policy_invalid,
  namespace_conflict,
  runtime_init_failed,
  governor_already_installed,
  governor_install_failed,
  interceptor_install_failed,
  source_unavailable,
  spawn_failed,
  capability_denied,
  resource_exceeded,
  timeout,
  runtime_error,
};

std::string to_string(ErrorCode code);

// Terminal status of one execution.
enum class OutcomeStatus {
  completed,
  capability_denied,
  resource_exceeded,
  runtime_error,
  timeout,
};

std::string to_string(OutcomeStatus status);

enum class ResourceKind {
  none,
  memory,
  cpu,
  recursion,
};

std::string to_string(ResourceKind kind);
ResourceKind resource_kind_from_string(const std::string& s);

enum class ExecutionMode {
  stream,
  version_query,
  inline_snippet,
  module_invocation,
  file_path,
  passthrough_flag,
};

std::string to_string(ExecutionMode mode);

// ---------------------------------------------------------------------------
// ExecutionRequest
// ---------------------------------------------------------------------------
//   payload:     code body (inline_snippet), module name (module_invocation),
//                file path (file_path); empty otherwise.
//   script_argv: what the executed code sees as sys.argv.
//   raw_args:    the untouched argument vector (without argv[0]), forwarded
//                verbatim by passthrough_flag.
struct ExecutionRequest {
  ExecutionMode mode{ExecutionMode::stream};
  std::string payload;
  std::vector<std::string> script_argv;
  std::vector<std::string> raw_args;
};

// ---------------------------------------------------------------------------
// ExecutionOutcome
// ---------------------------------------------------------------------------
struct ExecutionOutcome {
  OutcomeStatus status{OutcomeStatus::completed};
  ErrorCode error_code{ErrorCode::none};
  std::string denied_capability;              // capability_denied only
  ResourceKind resource_kind{ResourceKind::none};  // resource_exceeded only
  std::string message;                        // human-readable, safe to log
  std::string stdout_text;                    // OutputMode::capture only
  std::string stderr_text;                    // OutputMode::capture only
  std::string source_digest;                  // BLAKE3 of the executed source
  int exit_code{0};

  bool ok() const { return status == OutcomeStatus::completed && exit_code == 0; }
  std::string to_json() const;
};

}  // namespace warden
