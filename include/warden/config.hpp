#pragma once

// warden/config.hpp - Static configuration, read once at process entry.
//
// LIFECYCLE:
//   WardenConfig::from_env() parses every WARDEN_* variable and collects
//   invalid values in `errors` instead of throwing. init_config() installs
//   the process-wide copy; global_config() is read-only afterwards.
//
// INVARIANTS:
//   - Configuration can only add denials to the built-in policy table.
//   - A config with errors must not be used to run code (the CLI exits 1).

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "warden/governor.hpp"
#include "warden/namespace.hpp"
#include "warden/policy.hpp"

#ifndef WARDEN_DEFAULT_RUNTIME
#define WARDEN_DEFAULT_RUNTIME "/usr/bin/python3"
#endif

namespace warden {

struct WardenConfig {
  uint64_t max_memory_bytes{2ULL * 1024 * 1024 * 1024};
  uint64_t max_cpu_seconds{200};
  double   timeout_seconds{200.0};
  int      max_recursion{1000};
  double   grace_seconds{2.0};

  std::vector<std::string> disabled_modules;
  bool allow_network{false};

  std::vector<std::pair<std::string, std::string>> extension_paths;  // provider, path
  std::string app_dir{"/app"};
  std::string scratch_path;
  std::vector<std::pair<std::string, std::string>> conflicts;
  std::vector<std::string> solvers;

  std::string license_file{"/app/gurobi.lic"};
  std::string license_env{"GRB_LICENSE_FILE"};
  std::string runtime_binary{WARDEN_DEFAULT_RUNTIME};

  std::string event_log;
  std::string audit_log;

  std::vector<std::string> errors;

  bool ok() const { return errors.empty(); }

  static WardenConfig from_env();

  ResourceLimits limits() const;
  Policy build_policy() const;
  // Trusted and user segments plus conflicts. System segments are added by
  // the runtime once the interpreter reports its initial sys.path.
  ExtensionNamespace build_namespace() const;

  std::string to_json() const;
};

// Subsequent calls are no-ops.
void init_config(const WardenConfig& config = WardenConfig::from_env());
const WardenConfig& global_config();

}  // namespace warden
