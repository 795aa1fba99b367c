#include "warden/driver.hpp"

#include <pybind11/embed.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

#include "warden/audit.hpp"
#include "warden/governor.hpp"
#include "warden/hash.hpp"
#include "warden/interceptor.hpp"
#include "warden/observability.hpp"
#include "warden/process.hpp"
#include "warden/pyhost.hpp"
#include "warden/runtime.hpp"
#include "warden/version.hpp"

namespace warden {

namespace py = pybind11;

// ---------------------------------------------------------------------------
// Mode table
// ---------------------------------------------------------------------------

namespace {

using Args = std::vector<std::string>;

struct ModeRule {
  ExecutionMode mode;
  bool (*matches)(const Args& args);
  void (*fill)(const Args& args, ExecutionRequest& request);
};

bool starts_with(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

Args tail(const Args& args, std::size_t from) {
  if (from >= args.size()) return {};
  return Args(args.begin() + static_cast<std::ptrdiff_t>(from), args.end());
}

// -c CODE / -cCODE and -m MOD / -mMOD share one shape: the option takes a
// value either attached or as the next argument.
bool option_with_value(const Args& args, const char* flag) {
  if (args.empty() || !starts_with(args[0], flag)) return false;
  return args[0].size() > 2 || args.size() >= 2;
}

void fill_option(const Args& args, ExecutionRequest& request, const char* argv0) {
  std::size_t rest = 1;
  if (args[0].size() > 2) {
    request.payload = args[0].substr(2);
  } else {
    request.payload = args[1];
    rest = 2;
  }
  request.script_argv = {argv0};
  for (auto& a : tail(args, rest)) request.script_argv.push_back(a);
}

static const ModeRule kModeTable[] = {
  { ExecutionMode::stream,
    [](const Args& a) { return a.empty(); },
    [](const Args&, ExecutionRequest& r) { r.script_argv = {""}; } },
  { ExecutionMode::version_query,
    [](const Args& a) { return a.size() == 1 && (a[0] == "--version" || a[0] == "-V"); },
    [](const Args&, ExecutionRequest&) {} },
  { ExecutionMode::stream,
    [](const Args& a) { return a[0] == "-"; },
    [](const Args& a, ExecutionRequest& r) {
      r.script_argv = {"-"};
      for (auto& s : tail(a, 1)) r.script_argv.push_back(s);
    } },
  { ExecutionMode::inline_snippet,
    [](const Args& a) { return option_with_value(a, "-c"); },
    [](const Args& a, ExecutionRequest& r) { fill_option(a, r, "-c"); } },
  { ExecutionMode::module_invocation,
    [](const Args& a) { return option_with_value(a, "-m"); },
    // argv[0] becomes the resolved file path at run time.
    [](const Args& a, ExecutionRequest& r) { fill_option(a, r, "-m"); } },
  { ExecutionMode::passthrough_flag,
    [](const Args& a) { return starts_with(a[0], "-"); },
    [](const Args&, ExecutionRequest&) {} },
  { ExecutionMode::file_path,
    [](const Args& a) { return !starts_with(a[0], "-"); },
    [](const Args& a, ExecutionRequest& r) {
      r.payload = a[0];
      r.script_argv = a;
    } },
};

}  // namespace

ExecutionRequest resolve_request(const std::vector<std::string>& args) {
  ExecutionRequest request;
  request.raw_args = args;
  request.mode = ExecutionMode::passthrough_flag;
  for (const auto& rule : kModeTable) {
    if (!rule.matches(args)) continue;
    request.mode = rule.mode;
    rule.fill(args, request);
    break;
  }
  return request;
}

// ---------------------------------------------------------------------------
// Host-side helpers
// ---------------------------------------------------------------------------

namespace {

std::string join(const std::vector<std::string>& parts, char sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

bool license_file_present(const std::string& path) {
  return !path.empty() && ::access(path.c_str(), F_OK) == 0;
}

// Writes through the interpreter's sys.stderr when one is running, so that
// captured runs collect it. Falls back to std::cerr.
void write_stderr(const std::string& text) {
  if (Py_IsInitialized()) {
    py::error_scope keep;
    try {
      py::object err = pyhost::import_unchecked("sys").attr("stderr");
      if (!err.is_none()) {
        err.attr("write")(text);
        err.attr("flush")();
        return;
      }
    } catch (const py::error_already_set&) {
      PyErr_Clear();
    }
  }
  std::cerr << text << std::flush;
}

void report_fault(const std::string& kind, const std::string& detail) {
  write_stderr("Error: " + kind + ": " + detail + "\n");
}

void flush_std_streams() {
  py::error_scope keep;
  try {
    py::module_ sys = pyhost::import_unchecked("sys");
    for (const char* name : {"stdout", "stderr"}) {
      py::object stream = sys.attr(name);
      if (!stream.is_none()) stream.attr("flush")();
    }
  } catch (const py::error_already_set& e) {
    std::cerr << "warden: flush failed: " << e.what() << "\n";
  }
}

// Swaps sys.stdout/sys.stderr for StringIO buffers for the lifetime of the
// object. finish() collects the text and restores the originals.
class OutputCapture {
 public:
  explicit OutputCapture(bool active) : active_(active) {
    if (!active_) return;
    sys_ = pyhost::import_unchecked("sys");
    py::module_ io = pyhost::import_unchecked("io");
    saved_out_ = sys_.attr("stdout");
    saved_err_ = sys_.attr("stderr");
    out_ = io.attr("StringIO")();
    err_ = io.attr("StringIO")();
    sys_.attr("stdout") = out_;
    sys_.attr("stderr") = err_;
  }

  ~OutputCapture() { restore(); }

  OutputCapture(const OutputCapture&) = delete;
  OutputCapture& operator=(const OutputCapture&) = delete;

  void finish(ExecutionOutcome& out) {
    if (!active_ || restored_) return;
    py::error_scope keep;
    try {
      out.stdout_text = out_.attr("getvalue")().cast<std::string>();
      out.stderr_text = err_.attr("getvalue")().cast<std::string>();
    } catch (const py::error_already_set& e) {
      std::cerr << "warden: could not collect output: " << e.what() << "\n";
    }
    restore();
  }

 private:
  void restore() {
    if (!active_ || restored_) return;
    restored_ = true;
    py::error_scope keep;
    try {
      sys_.attr("stdout") = saved_out_;
      sys_.attr("stderr") = saved_err_;
    } catch (const py::error_already_set& e) {
      std::cerr << "warden: could not restore std streams: " << e.what() << "\n";
    }
  }

  bool active_;
  bool restored_{false};
  py::module_ sys_;
  py::object saved_out_, saved_err_;
  py::object out_, err_;
};

// EINTR-aware: a deadline that fires during a blocked read surfaces as the
// pending ExecutionTimeout.
std::string read_all(int fd) {
  std::string out;
  char buf[1 << 16];
  while (true) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) return out;
    if (errno == EINTR) {
      if (PyErr_CheckSignals() != 0) throw py::error_already_set();
      continue;
    }
    PyErr_SetFromErrno(PyExc_OSError);
    throw py::error_already_set();
  }
}

class LineReader {
 public:
  explicit LineReader(int fd) : fd_(fd) {}

  // False at end of input. The returned line has no trailing newline.
  bool next(std::string& line) {
    while (true) {
      const auto nl = buffer_.find('\n');
      if (nl != std::string::npos) {
        line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        return true;
      }
      if (eof_) {
        if (buffer_.empty()) return false;
        line.swap(buffer_);
        buffer_.clear();
        return true;
      }
      char buf[4096];
      const ssize_t n = ::read(fd_, buf, sizeof(buf));
      if (n > 0) {
        buffer_.append(buf, static_cast<std::size_t>(n));
      } else if (n == 0) {
        eof_ = true;
      } else if (errno == EINTR) {
        if (PyErr_CheckSignals() != 0) throw py::error_already_set();
      } else {
        PyErr_SetFromErrno(PyExc_OSError);
        throw py::error_already_set();
      }
    }
  }

 private:
  int fd_;
  std::string buffer_;
  bool eof_{false};
};

void exec_source(const std::string& source, const std::string& filename,
                 const py::dict& globals) {
  PyObject* code = Py_CompileStringExFlags(source.c_str(), filename.c_str(), Py_file_input,
                                           nullptr, -1);
  if (code == nullptr) throw py::error_already_set();
  py::object code_obj = py::reinterpret_steal<py::object>(code);
  PyObject* result = PyEval_EvalCode(code_obj.ptr(), globals.ptr(), globals.ptr());
  if (result == nullptr) throw py::error_already_set();
  Py_DECREF(result);
}

// Restricted read-eval loop over `fd`. Ordinary exceptions print a traceback
// and the loop continues; any other BaseException ends the session by
// propagating.
void run_interactive(int fd, const py::dict& globals, std::string& transcript) {
  const bool tty = ::isatty(fd) == 1;
  py::object compile_command = pyhost::import_unchecked("codeop").attr("compile_command");

  if (tty) {
    write_stderr("Python " + version::runtime_version() + " (warden restricted)\n");
  }

  LineReader reader(fd);
  std::vector<std::string> pending;
  while (true) {
    if (tty) write_stderr(pending.empty() ? ">>> " : "... ");
    std::string line;
    if (!reader.next(line)) {
      if (tty) write_stderr("\n");
      return;
    }
    transcript += line + "\n";
    pending.push_back(line);

    py::object code;
    try {
      code = compile_command(join(pending, '\n'), "<stdin>", "single");
    } catch (py::error_already_set& e) {
      if (!e.matches(PyExc_Exception)) throw;
      pending.clear();
      e.restore();
      PyErr_Print();
      continue;
    }
    if (code.is_none()) continue;  // incomplete statement
    pending.clear();

    PyObject* result = PyEval_EvalCode(code.ptr(), globals.ptr(), globals.ptr());
    if (result != nullptr) {
      Py_DECREF(result);
      continue;
    }
    if (PyErr_ExceptionMatches(PyExc_Exception) ||
        PyErr_ExceptionMatches(PyExc_KeyboardInterrupt)) {
      PyErr_Print();
      continue;
    }
    throw py::error_already_set();
  }
}

std::string str_of(const py::handle& obj) {
  try {
    return py::str(obj).cast<std::string>();
  } catch (const py::error_already_set&) {
    return "<unprintable>";
  }
}

// Maps the fault that ended execution onto the outcome and reports it.
void classify_fault(py::error_already_set& err, ExecutionOutcome& out) {
  const py::object value = err.value();
  out.exit_code = 1;

  if (err.matches(PyExc_SystemExit)) {
    out.status = OutcomeStatus::completed;
    py::object code = py::getattr(value, "code", py::none());
    if (code.is_none()) {
      out.exit_code = 0;
    } else if (py::isinstance<py::int_>(code)) {
      out.exit_code = code.cast<int>();
    } else {
      write_stderr(str_of(code) + "\n");
      out.exit_code = 1;
    }
    return;
  }

  if (err.matches(pyhost::capability_denied_type())) {
    out.status = OutcomeStatus::capability_denied;
    out.error_code = ErrorCode::capability_denied;
    out.denied_capability = str_of(py::getattr(value, "name", py::str("")));
    out.message = str_of(value);
    report_fault("CapabilityDenied", out.message);
    return;
  }

  if (err.matches(pyhost::execution_timeout_type())) {
    out.status = OutcomeStatus::timeout;
    out.error_code = ErrorCode::timeout;
    out.message = str_of(value);
    report_fault("ExecutionTimeout", out.message);
    return;
  }

  if (err.matches(pyhost::resource_exceeded_type())) {
    out.status = OutcomeStatus::resource_exceeded;
    out.error_code = ErrorCode::resource_exceeded;
    out.resource_kind =
        resource_kind_from_string(str_of(py::getattr(value, "kind", py::str(""))));
    py::tuple args = py::getattr(value, "args", py::tuple());
    out.message = args.size() > 0 ? str_of(args[0]) : str_of(value);
    report_fault("ResourceExceeded", out.message);
    return;
  }

  if (err.matches(PyExc_MemoryError)) {
    out.status = OutcomeStatus::resource_exceeded;
    out.error_code = ErrorCode::resource_exceeded;
    out.resource_kind = ResourceKind::memory;
    out.message = "Memory limit exceeded";
    report_fault("ResourceExceeded", out.message);
    return;
  }

  if (err.matches(PyExc_RecursionError)) {
    out.status = OutcomeStatus::resource_exceeded;
    out.error_code = ErrorCode::resource_exceeded;
    out.resource_kind = ResourceKind::recursion;
    out.message = str_of(value);
    report_fault("ResourceExceeded", out.message);
    return;
  }

  out.status = OutcomeStatus::runtime_error;
  out.error_code = ErrorCode::runtime_error;
  out.message = str_of(py::getattr(err.type(), "__name__", py::str("Exception")));
  const std::string detail = str_of(value);
  if (!detail.empty()) out.message += ": " + detail;
  err.restore();
  PyErr_Print();
}

ExecutionOutcome setup_failure(ErrorCode code, OutcomeStatus status, const std::string& message) {
  ExecutionOutcome out;
  out.status = status;
  out.error_code = code;
  out.message = message;
  out.exit_code = 1;
  report_fault(status == OutcomeStatus::capability_denied ? "CapabilityDenied" : "RuntimeError",
               message);
  return out;
}

std::string parent_package(const std::string& dotted) {
  const auto dot = dotted.rfind('.');
  return dot == std::string::npos ? std::string() : dotted.substr(0, dot);
}

bool read_file(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// Driver
// ---------------------------------------------------------------------------

Driver::Driver(const WardenConfig& config, Runtime* runtime, OutputMode output)
    : config_(config), runtime_(runtime), output_(output) {}

Driver::~Driver() = default;

ExecutionOutcome Driver::run(const ExecutionRequest& request) {
  ExecutionOutcome out;
  uint64_t duration_ns = 0;
  last_source_bytes_ = 0;
  {
    ScopeTimer timer(duration_ns);
    try {
      switch (request.mode) {
        case ExecutionMode::version_query:    out = run_version(); break;
        case ExecutionMode::passthrough_flag: out = run_passthrough(request); break;
        default:                              out = run_governed(request); break;
      }
    } catch (const std::exception& e) {
      out = ExecutionOutcome{};
      out.status = OutcomeStatus::runtime_error;
      out.error_code = ErrorCode::runtime_error;
      out.message = e.what();
      out.exit_code = 1;
      std::cerr << "Error: RuntimeError: " << e.what() << "\n";
    }
  }
  record(request, out, duration_ns, last_source_bytes_);
  return out;
}

ExecutionOutcome Driver::run_version() {
  ExecutionOutcome out;
  const std::string text = "Python " + version::runtime_version() + "\n";
  if (output_ == OutputMode::capture) {
    out.stdout_text = text;
  } else {
    std::cout << text << std::flush;
  }
  return out;
}

ExecutionOutcome Driver::run_passthrough(const ExecutionRequest& request) {
  ExecutionOutcome out;

  ProcessSpec spec;
  spec.command = config_.runtime_binary;
  spec.argv = request.raw_args;
  const std::vector<std::string> delegate = config_.build_namespace().delegate_path();
  if (!delegate.empty()) spec.env["PYTHONPATH"] = join(delegate, ':');
  if (!config_.license_env.empty() && std::getenv(config_.license_env.c_str()) == nullptr) {
    spec.env[config_.license_env] = config_.license_file;
  }
  spec.timeout_ms = static_cast<uint64_t>(config_.timeout_seconds * 1000.0);
  spec.max_memory_bytes = config_.max_memory_bytes;
  spec.max_cpu_seconds = config_.max_cpu_seconds;
  spec.capture = output_ == OutputMode::capture;
  // An interactive child has to stay in the terminal's foreground group.
  spec.new_process_group = spec.capture || ::isatty(STDIN_FILENO) != 1;

  const ProcessResult result = run_process(spec);
  out.stdout_text = result.stdout_text;
  out.stderr_text = result.stderr_text;

  if (!result.started) {
    out.status = OutcomeStatus::runtime_error;
    out.error_code = result.error_code == ErrorCode::none ? ErrorCode::spawn_failed
                                                          : result.error_code;
    out.message = result.error_message;
    out.exit_code = 1;
    std::cerr << "Error: RuntimeError: " << out.message << "\n";
    return out;
  }
  if (result.timed_out) {
    out.status = OutcomeStatus::timeout;
    out.error_code = ErrorCode::timeout;
    out.message = "Code execution timeout";
    out.exit_code = 1;
    const std::string line = "Error: ExecutionTimeout: " + out.message + "\n";
    if (spec.capture) {
      out.stderr_text += line;
    } else {
      std::cerr << line;
    }
    return out;
  }

  out.exit_code = result.exit_code;
  if (result.term_signal == SIGXCPU) {
    out.status = OutcomeStatus::resource_exceeded;
    out.error_code = ErrorCode::resource_exceeded;
    out.resource_kind = ResourceKind::cpu;
    out.message = "CPU time limit exceeded";
  }
  return out;
}

bool Driver::ensure_runtime(ExecutionOutcome& out) {
  if (runtime_) return true;
  RuntimeStart rs = start_runtime(config_);
  if (!rs.ok) {
    out.status = OutcomeStatus::runtime_error;
    out.error_code = rs.error_code;
    out.message = rs.message;
    out.exit_code = 1;
    std::cerr << "Error: RuntimeError: " << rs.message << "\n";
    return false;
  }
  owned_runtime_ = std::move(rs.runtime);
  runtime_ = owned_runtime_.get();
  return true;
}

ExecutionOutcome Driver::run_governed(const ExecutionRequest& request) {
  ExecutionOutcome out;
  if (!ensure_runtime(out)) return out;

  const Policy policy = config_.build_policy();
  const PolicyLint lint = policy.lint();
  if (!lint.valid) {
    return setup_failure(ErrorCode::policy_invalid, OutcomeStatus::runtime_error,
                         "invalid policy: " + lint.errors.front());
  }
  const ExtensionNamespace& ns = runtime_->extension_namespace();
  const NamespaceValidation nv = ns.validate();
  if (!nv.ok) {
    return setup_failure(nv.error_code, OutcomeStatus::runtime_error,
                         "invalid extension namespace: " +
                             (nv.errors.empty() ? std::string() : nv.errors.front()));
  }

  try {
    OutputCapture capture(output_ == OutputMode::capture);
    Interceptor interceptor(policy, ns, config_.solvers);
    const InterceptorInstall ii = interceptor.install();
    if (!ii.ok) {
      out = setup_failure(ii.error_code, OutcomeStatus::runtime_error, ii.message);
      capture.finish(out);
      return out;
    }

    // Sources other than stdin are loaded before the deadline starts.
    std::string source;
    std::string filename;
    std::string file_attr;
    std::string package_attr;
    std::vector<std::string> argv = request.script_argv;
    switch (request.mode) {
      case ExecutionMode::inline_snippet:
        source = request.payload;
        filename = "<string>";
        break;

      case ExecutionMode::file_path:
        if (!read_file(request.payload, source)) {
          const int err = errno;
          out = setup_failure(ErrorCode::source_unavailable, OutcomeStatus::runtime_error,
                              "can't open file '" + request.payload + "': [Errno " +
                                  std::to_string(err) + "] " + std::strerror(err));
          capture.finish(out);
          return out;
        }
        filename = request.payload;
        file_attr = request.payload;
        break;

      case ExecutionMode::module_invocation: {
        const std::string& name = request.payload;
        if (const auto prefix = policy.is_import_denied(name)) {
          const CapabilityName capability = CapabilityName::module(*prefix);
          emit_denial_event({capability.name, to_string(capability.kind),
                             to_string(DenialTier::hard_denied)});
          out = setup_failure(ErrorCode::capability_denied, OutcomeStatus::capability_denied,
                              denial_message(capability));
          out.denied_capability = capability.name;
          capture.finish(out);
          return out;
        }
        const Resolution res = ns.resolve(name);
        std::string path = res.path;
        if (res.found && !res.package_dir.empty()) {
          path = res.package_dir + "/__main__.py";
          package_attr = name;
        } else {
          package_attr = parent_package(name);
        }
        const bool is_extension = path.size() > 3 && path.compare(path.size() - 3, 3, ".so") == 0;
        if (!res.found || is_extension || !read_file(path, source)) {
          const std::string why = !res.found ? "No module named '" + name + "'"
                                  : is_extension
                                      ? "cannot execute extension module '" + name + "'"
                                      : "No module named " + name +
                                            ".__main__; '" + name +
                                            "' is a package and cannot be directly executed";
          out = setup_failure(ErrorCode::source_unavailable, OutcomeStatus::runtime_error, why);
          capture.finish(out);
          return out;
        }
        filename = path;
        file_attr = path;
        argv[0] = path;
        break;
      }

      default:
        filename = "<stdin>";
        break;
    }

    py::module_ sys = pyhost::import_unchecked("sys");
    py::object main_module = pyhost::import_unchecked("types").attr("ModuleType")("__main__");
    py::dict globals = main_module.attr("__dict__");
    globals["__builtins__"] = interceptor.make_builtins();
    if (!file_attr.empty()) globals["__file__"] = file_attr;
    if (request.mode == ExecutionMode::module_invocation) globals["__package__"] = package_attr;
    sys.attr("modules")["__main__"] = main_module;
    py::list py_argv;
    for (const auto& a : argv) py_argv.append(a);
    sys.attr("argv") = py_argv;

    std::optional<py::error_already_set> fault;
    std::string transcript;
    {
      GovernorInstall gi = install_governor(config_.limits());
      if (!gi.ok) {
        out = setup_failure(gi.error_code, OutcomeStatus::runtime_error, gi.message);
        capture.finish(out);
        return out;
      }
      try {
        if (request.mode == ExecutionMode::stream) {
          if (::isatty(input_fd_) == 1) {
            run_interactive(input_fd_, globals, transcript);
          } else {
            source = read_all(input_fd_);
            if (source.empty()) {
              run_interactive(input_fd_, globals, transcript);
            } else {
              exec_source(source, filename, globals);
            }
          }
        } else {
          exec_source(source, filename, globals);
        }
      } catch (py::error_already_set& e) {
        fault.emplace(std::move(e));
      }
      gi.lease->release();
    }

    if (source.empty()) source = transcript;
    last_source_bytes_ = source.size();
    out.source_digest = source_digest(source);
    if (fault) classify_fault(*fault, out);

    flush_std_streams();
    interceptor.detach();
    capture.finish(out);
  } catch (const py::error_already_set& e) {
    out.status = OutcomeStatus::runtime_error;
    out.error_code = ErrorCode::runtime_error;
    out.message = e.what();
    out.exit_code = 1;
    report_fault("RuntimeError", out.message);
  }
  return out;
}

void Driver::record(const ExecutionRequest& request, const ExecutionOutcome& out,
                    uint64_t duration_ns, size_t source_bytes) {
  ExecutionEvent ev;
  ev.mode = to_string(request.mode);
  ev.status = to_string(out.status);
  ev.error_code = to_string(out.error_code);
  ev.capability = out.denied_capability;
  ev.resource_kind = to_string(out.resource_kind);
  ev.source_digest = out.source_digest;
  ev.exit_code = out.exit_code;
  ev.duration_ns = duration_ns;
  ev.bytes_source = source_bytes;
  ev.bytes_stdout = out.stdout_text.size();
  ev.bytes_stderr = out.stderr_text.size();
  ev.license_present = runtime_ ? runtime_->license_present()
                                : license_file_present(config_.license_file);
  emit_execution_event(ev);

  ProvenanceRecord rec;
  rec.mode = ev.mode;
  rec.status = ev.status;
  rec.error_code = ev.error_code;
  rec.capability = ev.capability;
  rec.resource_kind = ev.resource_kind;
  rec.source_digest = ev.source_digest;
  rec.exit_code = ev.exit_code;
  rec.duration_ns = ev.duration_ns;
  if (!global_audit_log().append(rec)) {
    std::cerr << "warden: audit append failed\n";
  }
}

}  // namespace warden
