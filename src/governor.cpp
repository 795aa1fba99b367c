#include "warden/governor.hpp"

#include <pybind11/pybind11.h>

#include <pthread.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>

#include "warden/observability.hpp"
#include "warden/pyhost.hpp"

namespace py = pybind11;

namespace warden {

namespace {

std::atomic<bool> g_active{false};

// Moves a limit down, never up. RLIM_INFINITY counts as "above anything".
bool lower_rlimit(int resource, rlim_t soft, rlim_t hard) {
  struct rlimit cur;
  if (getrlimit(resource, &cur) != 0) return false;
  struct rlimit next;
  next.rlim_max = cur.rlim_max == RLIM_INFINITY ? hard : std::min(cur.rlim_max, hard);
  next.rlim_cur = cur.rlim_cur == RLIM_INFINITY ? soft : std::min(cur.rlim_cur, soft);
  if (next.rlim_cur > next.rlim_max) next.rlim_cur = next.rlim_max;
  return setrlimit(resource, &next) == 0;
}

bool arm_wall_timer(double seconds) {
  struct itimerval it{};
  it.it_value.tv_sec = static_cast<time_t>(seconds);
  it.it_value.tv_usec =
      static_cast<suseconds_t>((seconds - static_cast<double>(it.it_value.tv_sec)) * 1e6);
  if (it.it_value.tv_sec == 0 && it.it_value.tv_usec == 0) it.it_value.tv_usec = 1;
  return setitimer(ITIMER_REAL, &it, nullptr) == 0;
}

void disarm_wall_timer() {
  struct itimerval zero{};
  setitimer(ITIMER_REAL, &zero, nullptr);
}

std::string join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& i : items) {
    if (!out.empty()) out += ", ";
    out += i;
  }
  return out;
}

}  // namespace

struct GovernorLease::State {
  bool released{false};
  bool timer_armed{false};
  bool handlers_installed{false};
  py::object prev_alarm;
  py::object prev_cpu;

  std::mutex mu;
  std::condition_variable cv;
  bool stop{false};
  std::thread watchdog;
};

namespace {

void watchdog_main(GovernorLease::State* st, std::chrono::steady_clock::time_point limit) {
  std::unique_lock<std::mutex> lk(st->mu);
  if (st->cv.wait_until(lk, limit, [st] { return st->stop; })) return;
  // The interpreter never reached a bytecode boundary: the GIL cannot be
  // taken, so only async-signal-safe calls from here.
  static const char kMsg[] = "Error: ExecutionTimeout: Code execution timeout\n";
  const ssize_t n = ::write(STDERR_FILENO, kMsg, sizeof(kMsg) - 1);
  (void)n;
  _exit(1);
}

// signal.signal() runs pending handlers before it swaps. A deadline that
// tripped just before disarm is consumed by the first attempt.
bool restore_handler(py::module_& sig, int signum, const py::object& previous) {
  for (int attempt = 0; attempt < 2; ++attempt) {
    try {
      sig.attr("signal")(signum, previous);
      return true;
    } catch (const py::error_already_set& e) {
      if (attempt == 1) {
        std::cerr << "warden: could not restore handler for signal " << signum << ": "
                  << e.what() << "\n";
      }
    }
  }
  return false;
}

}  // namespace

GovernorLease::GovernorLease(std::unique_ptr<State> state) : state_(std::move(state)) {}

GovernorLease::~GovernorLease() {
  release();
}

void GovernorLease::release() {
  if (!state_ || state_->released) return;
  State& st = *state_;
  st.released = true;

  // Timer first: nothing below may be interrupted by our own deadline.
  if (st.timer_armed) {
    disarm_wall_timer();
    st.timer_armed = false;
  }

  if (st.watchdog.joinable()) {
    {
      std::lock_guard<std::mutex> lk(st.mu);
      st.stop = true;
    }
    st.cv.notify_all();
    st.watchdog.join();
  }

  if (st.handlers_installed) {
    py::error_scope pending;  // keeps the user's exception intact
    try {
      py::module_ sig = pyhost::import_unchecked("signal");
      if (st.prev_alarm) restore_handler(sig, SIGALRM, st.prev_alarm);
      if (st.prev_cpu) restore_handler(sig, SIGXCPU, st.prev_cpu);
    } catch (const py::error_already_set& e) {
      std::cerr << "warden: signal module unavailable during teardown: " << e.what() << "\n";
    }
    st.handlers_installed = false;
  }
  st.prev_alarm = py::object();
  st.prev_cpu = py::object();

  g_active.store(false, std::memory_order_release);
}

bool governor_active() {
  return g_active.load(std::memory_order_acquire);
}

GovernorInstall install_governor(const ResourceLimits& limits) {
  GovernorInstall r;
  if (g_active.exchange(true, std::memory_order_acq_rel)) {
    r.error_code = ErrorCode::governor_already_installed;
    r.message = "a governor lease is already active in this process";
    global_sandbox_stats().governor_rejections.fetch_add(1, std::memory_order_relaxed);
    return r;
  }

  r.lease.reset(new GovernorLease(std::make_unique<GovernorLease::State>()));
  GovernorLease::State& st = *r.lease->state_;

  // Watchdog before RLIMIT_AS: its stack mapping must not count against the
  // new ceiling.
  if (limits.max_wall_seconds > 0) {
    const auto limit = std::chrono::steady_clock::now() +
                       std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                           std::chrono::duration<double>(limits.max_wall_seconds +
                                                         std::max(0.0, limits.grace_seconds)));
    // The watchdog inherits a mask with the governor's signals blocked, so
    // SIGALRM and SIGXCPU always land on the interpreter thread and interrupt
    // its blocking reads.
    sigset_t governed, previous;
    sigemptyset(&governed);
    sigaddset(&governed, SIGALRM);
    sigaddset(&governed, SIGXCPU);
    pthread_sigmask(SIG_BLOCK, &governed, &previous);
    try {
      st.watchdog = std::thread(watchdog_main, &st, limit);
      r.enforced.push_back("watchdog");
    } catch (const std::system_error&) {
      r.failed.push_back("watchdog");
    }
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);
  }

  if (limits.max_address_space_bytes > 0) {
    const auto bytes = static_cast<rlim_t>(limits.max_address_space_bytes);
    (lower_rlimit(RLIMIT_AS, bytes, bytes) ? r.enforced : r.failed).push_back("rlimit_as");
  }

  if (limits.max_cpu_seconds > 0) {
    // Hard limit one second above soft: SIGXCPU first, SIGKILL if ignored.
    const auto secs = static_cast<rlim_t>(limits.max_cpu_seconds);
    (lower_rlimit(RLIMIT_CPU, secs, secs + 1) ? r.enforced : r.failed).push_back("rlimit_cpu");
  }

  if (limits.max_recursion_depth > 0) {
    if (limits.max_recursion_depth < Py_GetRecursionLimit()) {
      Py_SetRecursionLimit(limits.max_recursion_depth);
    }
    r.enforced.push_back("recursion");
  }

  try {
    py::module_ sig = pyhost::import_unchecked("signal");
    st.prev_alarm = sig.attr("signal")(SIGALRM, pyhost::alarm_handler());
    st.handlers_installed = true;
    st.prev_cpu = sig.attr("signal")(SIGXCPU, pyhost::cpu_limit_handler());
    r.enforced.push_back("signal_handlers");
  } catch (const py::error_already_set& e) {
    r.failed.push_back("signal_handlers");
    r.message = e.what();
  }

  if (limits.max_wall_seconds > 0 && r.failed.empty()) {
    if (arm_wall_timer(limits.max_wall_seconds)) {
      st.timer_armed = true;
      r.enforced.push_back("wall_timer");
    } else {
      r.failed.push_back("wall_timer");
    }
  }

  if (!r.failed.empty()) {
    r.lease->release();
    r.lease.reset();
    r.error_code = ErrorCode::governor_install_failed;
    r.message = "could not apply: " + join(r.failed) +
                (r.message.empty() ? std::string() : " (" + r.message + ")");
    return r;
  }

  global_sandbox_stats().governor_installs.fetch_add(1, std::memory_order_relaxed);
  r.ok = true;
  return r;
}

}  // namespace warden
