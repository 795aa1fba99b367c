#include "warden/process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

extern char** environ;

namespace warden {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n, std::size_t limit,
                    bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) truncated = true;
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// write(2) that turns SIGPIPE into EPIPE for the calling thread only.
ssize_t write_no_sigpipe(int fd, const char* data, std::size_t len) {
  sigset_t pipe_set, old_set;
  sigemptyset(&pipe_set);
  sigaddset(&pipe_set, SIGPIPE);
  pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);
  const ssize_t n = ::write(fd, data, len);
  const int saved = errno;
  if (n < 0 && saved == EPIPE) {
    struct timespec zero{};
    sigtimedwait(&pipe_set, nullptr, &zero);
  }
  pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
  errno = saved;
  return n;
}

void apply_child_limits(const ProcessSpec& spec) {
  if (spec.max_memory_bytes > 0) {
    struct rlimit rl;
    rl.rlim_cur = spec.max_memory_bytes;
    rl.rlim_max = spec.max_memory_bytes;
    setrlimit(RLIMIT_AS, &rl);
  }
  if (spec.max_cpu_seconds > 0) {
    struct rlimit rl;
    rl.rlim_cur = spec.max_cpu_seconds;
    rl.rlim_max = spec.max_cpu_seconds + 1;  // SIGXCPU first, SIGKILL one second later
    setrlimit(RLIMIT_CPU, &rl);
  }
}

// Ignores terminal interrupts in the supervisor while a child shares the
// terminal, the way system(3) does.
class InterruptGuard {
 public:
  explicit InterruptGuard(bool active) : active_(active) {
    if (!active_) return;
    struct sigaction ign{};
    ign.sa_handler = SIG_IGN;
    sigemptyset(&ign.sa_mask);
    sigaction(SIGINT, &ign, &old_int_);
    sigaction(SIGQUIT, &ign, &old_quit_);
  }
  ~InterruptGuard() {
    if (!active_) return;
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGQUIT, &old_quit_, nullptr);
  }

 private:
  bool active_;
  struct sigaction old_int_{};
  struct sigaction old_quit_{};
};

}  // namespace

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  const auto started_at = std::chrono::steady_clock::now();

  int exec_pipe[2] = {-1, -1};
  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  auto close_all = [&] {
    for (int* p : {exec_pipe, in_pipe, out_pipe, err_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  };

  if (pipe2(exec_pipe, O_CLOEXEC) != 0 ||
      (spec.capture && (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0))) {
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = std::string("pipe: ") + std::strerror(errno);
    close_all();
    return result;
  }

  // Everything the child needs is built before fork(): the parent may be
  // multi-threaded, so the child must not allocate.
  std::vector<std::string> args = {spec.command};
  args.insert(args.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& s : args) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::map<std::string, std::string> merged;
  if (spec.inherit_env) {
    for (char** e = environ; e && *e; ++e) {
      char* eq = std::strchr(*e, '=');
      if (eq) merged[std::string(*e, eq)] = eq + 1;
    }
  }
  for (const auto& [k, v] : spec.env) merged[k] = v;
  std::vector<std::string> envs;
  envs.reserve(merged.size());
  for (const auto& [k, v] : merged) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  InterruptGuard guard(!spec.capture);

  const pid_t pid = fork();
  if (pid < 0) {
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = std::string("fork: ") + std::strerror(errno);
    close_all();
    return result;
  }

  if (pid == 0) {
    if (spec.new_process_group) setpgid(0, 0);
    if (!spec.capture) {
      signal(SIGINT, SIG_DFL);
      signal(SIGQUIT, SIG_DFL);
    }
    if (spec.capture) {
      dup2(in_pipe[0], STDIN_FILENO);
      dup2(out_pipe[1], STDOUT_FILENO);
      dup2(err_pipe[1], STDERR_FILENO);
      for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
        ::close(fd);
      }
    }
    ::close(exec_pipe[0]);

    int err = 0;
    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
      err = errno;
    } else {
      apply_child_limits(spec);
      execve(spec.command.c_str(), argv.data(), envp.data());
      err = errno;
    }
    const ssize_t w = ::write(exec_pipe[1], &err, sizeof(err));
    (void)w;
    _exit(127);
  }

  if (spec.new_process_group) setpgid(pid, pid);  // either side may win the race
  close_fd(exec_pipe[1]);
  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);

  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    waitpid(pid, &status, 0);
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = spec.command + ": " + std::strerror(child_errno);
    result.exit_code = 127;
    close_all();
    return result;
  }
  result.started = true;

  if (spec.capture) {
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(in_pipe[1], F_SETFL, O_NONBLOCK);
    if (spec.stdin_text.empty()) close_fd(in_pipe[1]);
  }

  const bool has_deadline = spec.timeout_ms > 0;
  const auto deadline = started_at + std::chrono::milliseconds(spec.timeout_ms);
  std::size_t in_off = 0;
  char buf[4096];
  int status = 0;

  while (true) {
    if (spec.capture) {
      if (in_pipe[1] >= 0) {
        const ssize_t n = write_no_sigpipe(in_pipe[1], spec.stdin_text.data() + in_off,
                                           spec.stdin_text.size() - in_off);
        if (n > 0) in_off += static_cast<std::size_t>(n);
        if (in_off >= spec.stdin_text.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) {
          close_fd(in_pipe[1]);
        }
      }
      ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
      append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
      n = ::read(err_pipe[0], buf, sizeof(buf));
      append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);
    }

    const pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) break;
    if (w < 0 && errno != EINTR) break;

    if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      if (spec.new_process_group) kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  if (spec.capture) {
    ssize_t n;
    while ((n = ::read(out_pipe[0], buf, sizeof(buf))) > 0) {
      append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
    }
    while ((n = ::read(err_pipe[0], buf, sizeof(buf))) > 0) {
      append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);
    }
  }
  close_all();

  if (result.timed_out) {
    result.exit_code = 124;
    result.error_code = ErrorCode::timeout;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + result.term_signal;
  }
  result.duration_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started_at)
          .count());
  return result;
}

}  // namespace warden
