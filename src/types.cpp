#include "warden/types.hpp"

#include <sstream>

#include "warden/jsonlite.hpp"

namespace warden {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::policy_invalid: return "policy_invalid";
    case ErrorCode::namespace_conflict: return "namespace_conflict";
    case ErrorCode::runtime_init_failed: return "runtime_init_failed";
    case ErrorCode::governor_already_installed: return "governor_already_installed";
    case ErrorCode::governor_install_failed: return "governor_install_failed";
    case ErrorCode::interceptor_install_failed: return "interceptor_install_failed";
    case ErrorCode::source_unavailable: return "source_unavailable";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::capability_denied: return "capability_denied";
    case ErrorCode::resource_exceeded: return "resource_exceeded";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::runtime_error: return "runtime_error";
  }
  return "";
}

std::string to_string(OutcomeStatus status) {
  switch (status) {
    case OutcomeStatus::completed: return "completed";
    case OutcomeStatus::capability_denied: return "capability_denied";
    case OutcomeStatus::resource_exceeded: return "resource_exceeded";
    case OutcomeStatus::runtime_error: return "runtime_error";
    case OutcomeStatus::timeout: return "timeout";
  }
  return "";
}

std::string to_string(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::none: return "";
    case ResourceKind::memory: return "memory";
    case ResourceKind::cpu: return "cpu";
    case ResourceKind::recursion: return "recursion";
  }
  return "";
}

ResourceKind resource_kind_from_string(const std::string& s) {
  if (s == "memory") return ResourceKind::memory;
  if (s == "cpu") return ResourceKind::cpu;
  if (s == "recursion") return ResourceKind::recursion;
  return ResourceKind::none;
}

std::string to_string(ExecutionMode mode) {
  switch (mode) {
    case ExecutionMode::stream: return "stream";
    case ExecutionMode::version_query: return "version_query";
    case ExecutionMode::inline_snippet: return "inline_snippet";
    case ExecutionMode::module_invocation: return "module_invocation";
    case ExecutionMode::file_path: return "file_path";
    case ExecutionMode::passthrough_flag: return "passthrough_flag";
  }
  return "";
}

// Output text is deliberately left out; only its size is recorded.
std::string ExecutionOutcome::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"status\":\"" << to_string(status) << "\""
    << ",\"error_code\":\"" << to_string(error_code) << "\""
    << ",\"exit_code\":" << exit_code
    << ",\"denied_capability\":\"" << jsonlite::escape(denied_capability) << "\""
    << ",\"resource_kind\":\"" << to_string(resource_kind) << "\""
    << ",\"message\":\"" << jsonlite::escape(message) << "\""
    << ",\"source_digest\":\"" << source_digest << "\""
    << ",\"bytes_stdout\":" << stdout_text.size()
    << ",\"bytes_stderr\":" << stderr_text.size()
    << "}";
  return o.str();
}

}  // namespace warden
