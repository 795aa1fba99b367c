#pragma once

// warden/driver.hpp - Maps one invocation to one governed execution.
//
// LIFECYCLE (governed modes: stream, inline_snippet, module_invocation, file_path):
//   1. Interceptor installed; fresh __main__ with restricted builtins.
//   2. Governor lease acquired. Refuse to run if that fails.
//   3. Source loaded (stdin reads happen under the deadline), compiled with
//      its real filename, evaluated.
//   4. Lease released before the fault is classified.
//   5. Outcome recorded: one execution event, one audit entry.
//
// version_query and passthrough_flag never start the interpreter.
//
// INVARIANTS:
//   - run() never throws. Every fault becomes an ExecutionOutcome.
//   - Every fault outcome has exit_code 1, except SystemExit (its own code)
//     and passthrough (the child's code).
//   - The deadline timer is disarmed before run() returns, on every path.

#include <memory>
#include <string>
#include <vector>

#include "warden/config.hpp"
#include "warden/types.hpp"

namespace warden {

class Runtime;

enum class OutputMode {
  passthrough,  // user code writes to the process stdout/stderr
  capture,      // collected into ExecutionOutcome::stdout_text/stderr_text
};

// Fixed precedence, first match wins. Pure function of argv (without argv[0]).
ExecutionRequest resolve_request(const std::vector<std::string>& args);

class Driver {
 public:
  // With runtime == nullptr the driver starts its own on first governed run.
  explicit Driver(const WardenConfig& config, Runtime* runtime = nullptr,
                  OutputMode output = OutputMode::passthrough);
  ~Driver();

  Driver(const Driver&) = delete;
  Driver& operator=(const Driver&) = delete;

  ExecutionOutcome run(const ExecutionRequest& request);

  // Descriptor the stream mode and the interactive loop read from.
  void set_input_fd(int fd) { input_fd_ = fd; }

 private:
  ExecutionOutcome run_version();
  ExecutionOutcome run_passthrough(const ExecutionRequest& request);
  ExecutionOutcome run_governed(const ExecutionRequest& request);
  bool ensure_runtime(ExecutionOutcome& out);
  void record(const ExecutionRequest& request, const ExecutionOutcome& out,
              uint64_t duration_ns, size_t source_bytes);

  WardenConfig config_;
  Runtime* runtime_;
  std::unique_ptr<Runtime> owned_runtime_;
  OutputMode output_;
  int input_fd_{0};
  size_t last_source_bytes_{0};
};

}  // namespace warden
