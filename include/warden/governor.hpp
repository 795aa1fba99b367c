#pragma once

// warden/governor.hpp - Process-wide resource ceilings and the wall deadline.
//
// DESIGN:
//   install() applies every configured ceiling and hands back a lease. The
//   lease is the only way to end enforcement: its destructor disarms the
//   deadline timer, stops the backstop watchdog and restores the previous
//   signal handlers, on every exit path.
//
//   Deadline enforcement has two layers:
//     1. ITIMER_REAL -> SIGALRM -> Python handler raising ExecutionTimeout
//        at the next bytecode boundary.
//     2. A watchdog thread that terminates the process with _exit(1) when the
//        deadline plus a grace period passes without teardown, covering code
//        stuck inside one long C call that never reaches a bytecode boundary.
//
// INVARIANTS:
//   - At most one lease exists per process. A second install() while a lease
//     is active is rejected and changes nothing.
//   - Ceilings only move down: RLIMIT_AS, RLIMIT_CPU and the recursion limit
//     are set to min(current, requested). They are not restored on teardown.
//   - Fail safe: if any requested ceiling cannot be applied, install() fails
//     and the caller must not run user code.
//   - install() and the lease destructor need the GIL and the main thread.
//
// EXTENSION_POINT: per_thread_cpu_accounting
//   Current: RLIMIT_CPU covers the whole process including the watchdog.
//   Upgrade path: timer_create(CLOCK_THREAD_CPUTIME_ID) on the main thread.

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "warden/types.hpp"

namespace warden {

// Zero means "leave unchanged".
struct ResourceLimits {
  uint64_t max_address_space_bytes{0};
  uint64_t max_cpu_seconds{0};
  double   max_wall_seconds{0};
  int      max_recursion_depth{0};
  double   grace_seconds{2.0};
};

struct GovernorInstall;
GovernorInstall install_governor(const ResourceLimits& limits);

class GovernorLease {
 public:
  ~GovernorLease();
  GovernorLease(const GovernorLease&) = delete;
  GovernorLease& operator=(const GovernorLease&) = delete;

  // Idempotent. The destructor calls it.
  void release();

 private:
  friend GovernorInstall install_governor(const ResourceLimits& limits);
  struct State;
  explicit GovernorLease(std::unique_ptr<State> state);
  std::unique_ptr<State> state_;
};

struct GovernorInstall {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string message;
  std::vector<std::string> enforced;  // "rlimit_as", "rlimit_cpu", "recursion", "wall_timer", "watchdog"
  std::vector<std::string> failed;
  std::unique_ptr<GovernorLease> lease;
};

bool governor_active();

}  // namespace warden
