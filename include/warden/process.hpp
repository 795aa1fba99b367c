#pragma once

// warden/process.hpp - Supervised child process with rlimits and a wall deadline.
//
// Used for passthrough invocations of the real interpreter and by the test
// suite to run the warden binary end to end.
//
// DESIGN:
//   fork + execve. The child applies its rlimits before exec; the parent
//   enforces the wall deadline by polling waitpid and killing the child's
//   process group. An exec failure is reported through a close-on-exec pipe,
//   so "could not start" is distinguishable from "exited 127".
//
// INVARIANTS:
//   - run_process never throws. Failures land in ProcessResult::error_code.
//   - timed_out implies the child was killed with SIGKILL and reaped.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "warden/types.hpp"

namespace warden {

struct ProcessSpec {
  std::string command;
  std::vector<std::string> argv;           // without argv[0]
  std::map<std::string, std::string> env;  // overrides on top of the inherited env
  bool inherit_env{true};
  std::string cwd;
  uint64_t timeout_ms{0};                  // 0 = no deadline
  uint64_t max_memory_bytes{0};            // 0 = unchanged
  uint64_t max_cpu_seconds{0};             // 0 = unchanged

  // capture=false: the child shares our stdin/stdout/stderr.
  bool capture{false};
  std::string stdin_text;                  // capture mode only
  std::size_t max_output_bytes{1 << 20};

  // Own process group so the deadline kill reaches grandchildren. Off for a
  // child that must stay in the terminal's foreground group.
  bool new_process_group{true};
};

struct ProcessResult {
  bool started{false};
  int exit_code{0};
  int term_signal{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;
  uint64_t duration_ms{0};
};

ProcessResult run_process(const ProcessSpec& spec);

}  // namespace warden
