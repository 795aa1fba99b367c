#include <pybind11/embed.h>
#include <pthread.h>
#include <signal.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "warden/audit.hpp"
#include "warden/config.hpp"
#include "warden/driver.hpp"
#include "warden/governor.hpp"
#include "warden/hash.hpp"
#include "warden/import_finder.hpp"
#include "warden/interceptor.hpp"
#include "warden/jsonlite.hpp"
#include "warden/namespace.hpp"
#include "warden/observability.hpp"
#include "warden/policy.hpp"
#include "warden/process.hpp"
#include "warden/pyhost.hpp"
#include "warden/runtime.hpp"
#include "warden/version.hpp"

namespace fs = std::filesystem;
namespace py = pybind11;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

warden::Runtime* g_runtime = nullptr;
fs::path g_app_dir;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  std::cout.flush();
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void write_file(const fs::path& path, const std::string& data) {
  fs::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
}

std::string read_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

bool raises_denied(const std::function<void()>& fn) {
  try {
    fn();
  } catch (py::error_already_set& e) {
    return e.matches(warden::pyhost::capability_denied_type());
  }
  return false;
}

bool timer_armed() {
  struct itimerval it{};
  getitimer(ITIMER_REAL, &it);
  return it.it_value.tv_sec != 0 || it.it_value.tv_usec != 0;
}

warden::WardenConfig test_config() {
  warden::WardenConfig c;
  c.max_memory_bytes = 0;  // rlimits stay untouched in the test process
  c.max_cpu_seconds = 0;
  c.timeout_seconds = 30.0;
  c.app_dir = g_app_dir.string();
  c.license_file = (g_app_dir / "missing.lic").string();
  return c;
}

warden::ExecutionOutcome run_captured(const std::vector<std::string>& args,
                                      const warden::WardenConfig& config = test_config()) {
  warden::Driver driver(config, g_runtime, warden::OutputMode::capture);
  return driver.run(warden::resolve_request(args));
}

py::dict restricted_globals(const warden::Interceptor& ic) {
  py::dict g;
  g["__builtins__"] = ic.make_builtins();
  g["__name__"] = "__main__";
  return g;
}

// ============================================================================
// Policy
// ============================================================================

void test_policy_default_tiers() {
  using warden::CapabilityName;
  using warden::DenialTier;
  const auto p = warden::Policy::defaults();
  expect(p.is_denied(CapabilityName::module("os")).tier == DenialTier::hard_denied,
         "os is hard_denied");
  expect(p.is_denied(CapabilityName::module("subprocess")).tier == DenialTier::hard_denied,
         "subprocess is hard_denied");
  expect(p.is_denied(CapabilityName::builtin("exec")).tier == DenialTier::function_denied,
         "exec is function_denied");
  expect(p.is_denied(CapabilityName::builtin("open")).tier == DenialTier::function_denied,
         "open is function_denied");
  expect(p.is_denied(CapabilityName::member("signal", "alarm")).tier ==
             DenialTier::selectively_denied,
         "signal.alarm is selectively_denied");
  expect(!p.is_denied(CapabilityName::member("signal", "getsignal")).denied(),
         "signal.getsignal stays allowed");
  expect(!p.is_denied(CapabilityName::module("json")).denied(), "json is allowed");
  expect(p.is_denied(CapabilityName::operation("os.system")).denied(),
         "os.system audit event is denied");
  expect(p.is_denied(CapabilityName::module("timeit")).tier == DenialTier::hard_denied,
         "string-evaluating timeit is hard_denied");
  expect(p.is_denied(CapabilityName::operation(warden::kOpenForWrite)).tier ==
             DenialTier::function_denied,
         "write opens are function_denied");
  expect(p.is_denied(CapabilityName::member("codecs", "open")).tier ==
             DenialTier::selectively_denied,
         "codecs.open is selectively_denied");
  expect(p.is_denied(CapabilityName::operation("signal.pthread_kill")).denied() &&
             !p.is_denied(CapabilityName::member("signal", "pthread_kill")).denied(),
         "signal.pthread_kill lives in one tier");
  expect(p.lint().valid, "default table lints clean");
}

void test_policy_dotted_prefix() {
  const auto p = warden::Policy::defaults();
  const auto hit = p.is_import_denied("os.path");
  expect(hit.has_value() && *hit == "os", "os.path is denied through prefix os");
  expect(!p.is_import_denied("osx").has_value(), "osx does not match os");
  const auto deep = p.is_import_denied("urllib.request.parse");
  expect(deep.has_value() && *deep == "urllib", "deep urllib submodule is denied");
  expect(!p.is_import_denied("").has_value(), "empty name is not denied");
}

void test_policy_network_toggle() {
  const auto closed = warden::Policy::defaults(false);
  const auto open = warden::Policy::defaults(true);
  expect(closed.is_operation_denied("socket.connect"), "socket.connect denied by default");
  expect(!open.is_operation_denied("socket.connect"), "allow_network lifts socket.connect");
  expect(open.is_import_denied("socket").has_value(), "socket module stays hard_denied");
}

void test_policy_import_gate_not_stubbable() {
  auto p = warden::Policy::defaults();
  expect(!p.deny_builtin("__import__"), "__import__ cannot be function_denied");
  const auto lint = p.lint();
  expect(!lint.valid, "registration error surfaces in lint");
  expect(contains(lint.errors.front(), "__import__"), "lint names __import__");
}

void test_policy_tighten_promotes() {
  auto p = warden::Policy::defaults();
  p.tighten({" signal ", "eval", "json", "__import__", ""});
  expect(p.is_import_denied("signal").has_value(), "signal promoted to hard_denied");
  expect(p.denied_members("signal").empty(), "promotion drops member stubs");
  expect(!p.has_selective_entries("signal"), "no selective entries left for signal");
  expect(p.is_import_denied("json").has_value(), "json added");
  expect(p.is_denied(warden::CapabilityName::builtin("eval")).denied(), "eval stays denied");
  expect(p.lint().valid, "tightened default policy lints clean");
}

void test_policy_tier_conflicts() {
  warden::Policy p;
  p.deny_import("xml");
  expect(!p.deny_member("xml", "parse"), "member of a hard_denied module is rejected");

  warden::Policy q;
  q.deny_member("xml.etree", "parse");
  q.deny_import("xml");
  const auto lint = q.lint();
  expect(!lint.valid, "shadowed selective entry is a lint error");
  expect(contains(lint.errors.front(), "unreachable"), "lint explains the shadowing");

  warden::Policy r;
  r.deny_member("json", "loads");
  expect(!r.deny_import("json"), "selective module cannot also be hard_denied");
}

void test_policy_to_json() {
  const auto json = warden::Policy::defaults().to_json();
  expect(contains(json, "\"hard_denied\":["), "json has hard_denied");
  expect(contains(json, "\"signal\":["), "json lists selective signal members");
  expect(contains(json, "\"os.system\""), "json lists os_operations");
}

// ============================================================================
// Mode resolution
// ============================================================================

void test_mode_table() {
  using warden::ExecutionMode;
  auto r = warden::resolve_request({});
  expect(r.mode == ExecutionMode::stream, "no args -> stream");
  expect(r.script_argv == std::vector<std::string>{""}, "stream argv is ['']");

  expect(warden::resolve_request({"--version"}).mode == ExecutionMode::version_query,
         "--version -> version_query");
  expect(warden::resolve_request({"-V"}).mode == ExecutionMode::version_query,
         "-V -> version_query");
  expect(warden::resolve_request({"--version", "x"}).mode == ExecutionMode::passthrough_flag,
         "--version with extra args falls through");

  r = warden::resolve_request({"-c", "print(1)", "a"});
  expect(r.mode == ExecutionMode::inline_snippet, "-c CODE -> inline_snippet");
  expect(r.payload == "print(1)", "-c payload");
  expect((r.script_argv == std::vector<std::string>{"-c", "a"}), "-c argv");

  r = warden::resolve_request({"-cprint(2)"});
  expect(r.mode == ExecutionMode::inline_snippet && r.payload == "print(2)", "-cCODE");

  expect(warden::resolve_request({"-c"}).mode == ExecutionMode::passthrough_flag,
         "-c without code is delegated");

  r = warden::resolve_request({"-m", "json.tool", "--help"});
  expect(r.mode == ExecutionMode::module_invocation && r.payload == "json.tool", "-m MOD");
  expect(r.script_argv.size() == 2 && r.script_argv[1] == "--help", "-m argv tail");

  r = warden::resolve_request({"-", "x"});
  expect(r.mode == ExecutionMode::stream, "- -> stream");
  expect((r.script_argv == std::vector<std::string>{"-", "x"}), "- argv");

  r = warden::resolve_request({"-W", "ignore", "script.py"});
  expect(r.mode == ExecutionMode::passthrough_flag, "other flag -> passthrough");
  expect(r.raw_args.size() == 3, "raw args kept verbatim");

  r = warden::resolve_request({"script.py", "--flag"});
  expect(r.mode == ExecutionMode::file_path && r.payload == "script.py", "bare path -> file");
  expect((r.script_argv == std::vector<std::string>{"script.py", "--flag"}), "file argv");
}

// ============================================================================
// Extension namespace
// ============================================================================

void test_namespace_lookup_order() {
  warden::ExtensionNamespace ns;
  ns.add_system("/usr/lib/python3");
  ns.add_user("app", "/app");
  ns.add_trusted("gurobipy", "/opt/gurobi");
  ns.set_scratch("/scratch");
  ns.add_system("/usr/lib/python3");

  const auto path = ns.search_path();
  expect(path.size() == 4, "duplicate system segment dropped");
  expect(path[0] == "/opt/gurobi", "trusted first");
  expect(path[1] == "/app", "application dir second");
  expect(path[2] == "/scratch", "scratch after app");
  expect(path[3] == "/usr/lib/python3", "system last");
  expect(ns.delegate_path().size() == 3, "delegate path has no system segments");
  expect(ns.has_provider("gurobipy"), "provider registered");
}

void test_namespace_conflict_isolation() {
  const fs::path tmp = fs::temp_directory_path() / "warden_ns_conflict";
  fs::remove_all(tmp);
  write_file(tmp / "alpha" / "shared.py", "X = 'alpha'\n");
  write_file(tmp / "alpha" / "only_alpha.py", "X = 1\n");
  fs::create_directories(tmp / "beta");
  fs::create_symlink(tmp / "alpha" / "only_alpha.py", tmp / "beta" / "leak.py");

  warden::ExtensionNamespace ns;
  ns.add_trusted("alpha", (tmp / "alpha").string());
  ns.add_trusted("beta", (tmp / "beta").string());
  ns.add_conflict("beta", "alpha");

  expect(ns.conflicts("alpha", "beta"), "conflict is symmetric");
  expect(ns.validate().ok, "distinct segments validate");

  auto r = ns.resolve("shared", "alpha");
  expect(r.found && r.provider == "alpha", "alpha sees its own module");

  r = ns.resolve("shared", "beta");
  expect(!r.found, "beta never sees alpha's module");

  r = ns.resolve("leak", "beta");
  expect(!r.found, "symlink into alpha's segment is rejected");
  expect(!r.rejected.empty(), "rejected candidate is reported");

  r = ns.resolve("leak");
  expect(r.found && r.provider == "beta", "without a requester the symlink resolves");
  fs::remove_all(tmp);
}

void test_namespace_validate_rejects_sharing() {
  const fs::path tmp = fs::temp_directory_path() / "warden_ns_validate";
  fs::remove_all(tmp);
  fs::create_directories(tmp / "shared" / "nested");

  warden::ExtensionNamespace ns;
  ns.add_trusted("a", (tmp / "shared").string());
  ns.add_trusted("b", (tmp / "shared" / "nested/").string());
  ns.add_conflict("a", "b");
  auto v = ns.validate();
  expect(!v.ok, "nested segments of conflicting providers are rejected");
  expect(v.error_code == warden::ErrorCode::namespace_conflict, "namespace_conflict code");

  warden::ExtensionNamespace scratch;
  scratch.add_trusted("a", (tmp / "shared").string());
  scratch.set_scratch((tmp / "shared" / "nested").string());
  expect(!scratch.validate().ok, "trusted segment overlapping scratch is rejected");
  fs::remove_all(tmp);
}

void test_namespace_packages() {
  const fs::path tmp = fs::temp_directory_path() / "warden_ns_pkg";
  fs::remove_all(tmp);
  write_file(tmp / "pkg" / "__init__.py", "");
  write_file(tmp / "pkg" / "sub.py", "");

  warden::ExtensionNamespace ns;
  ns.add_user("app", tmp.string());
  auto r = ns.resolve("pkg");
  expect(r.found && !r.package_dir.empty(), "package resolves to its directory");
  expect(contains(r.path, "__init__.py"), "package file is __init__.py");
  r = ns.resolve("pkg.sub");
  expect(r.found && r.package_dir.empty() && contains(r.path, "sub.py"), "dotted submodule");
  expect(!ns.resolve("pkg.missing").found, "missing submodule");
  fs::remove_all(tmp);
}

void test_namespace_finder_isolates_providers() {
  const fs::path tmp = fs::temp_directory_path() / "warden_ns_finder";
  fs::remove_all(tmp);
  write_file(tmp / "alpha" / "shared.py", "X = 'alpha'\n");
  write_file(tmp / "alpha" / "amod.py", "import shared\nWHICH = shared.X\n");
  write_file(tmp / "alpha" / "aneeds.py", "import bonly\n");
  write_file(tmp / "beta" / "shared.py", "X = 'beta'\n");
  write_file(tmp / "beta" / "bmod.py", "import shared\nWHICH = shared.X\n");
  write_file(tmp / "beta" / "bonly.py", "");

  // beta precedes alpha, so a flat lookup hands alpha beta's `shared`.
  warden::ExtensionNamespace ns;
  ns.add_trusted("beta", (tmp / "beta").string());
  ns.add_trusted("alpha", (tmp / "alpha").string());
  ns.add_conflict("alpha", "beta");
  expect(ns.provider_of((tmp / "alpha" / "amod.py").string()) == "alpha", "provider_of");
  expect(ns.provider_of("/nonexistent/x.py").empty(), "no provider outside segments");

  py::module_ sys = warden::pyhost::import_unchecked("sys");
  py::list path = sys.attr("path");
  path.attr("insert")(0, (tmp / "alpha").string());
  path.attr("insert")(0, (tmp / "beta").string());
  py::object finder = warden::install_namespace_finder(ns);
  py::dict modules = sys.attr("modules");
  auto forget = [&] {
    for (const char* m : {"shared", "amod", "bmod", "aneeds", "bonly"}) {
      modules.attr("pop")(m, py::none());
    }
  };
  forget();

  py::object amod = warden::pyhost::import_unchecked("amod");
  expect(amod.attr("WHICH").cast<std::string>() == "alpha",
         "alpha's module imports alpha's shared copy");
  forget();

  py::object bmod = warden::pyhost::import_unchecked("bmod");
  expect(bmod.attr("WHICH").cast<std::string>() == "beta", "beta keeps its own copy");
  forget();

  try {
    warden::pyhost::import_unchecked("aneeds");
    expect(false, "alpha must not load a module only beta ships");
  } catch (py::error_already_set& e) {
    expect(e.matches(PyExc_ModuleNotFoundError), "ModuleNotFoundError");
    expect(contains(py::str(e.value()), "alpha"), "message names the provider");
  }
  forget();

  sys.attr("meta_path").attr("remove")(finder);
  path.attr("remove")((tmp / "alpha").string());
  path.attr("remove")((tmp / "beta").string());
  fs::remove_all(tmp);
}

// ============================================================================
// Hashing, versions, audit chain
// ============================================================================

void test_blake3_known_vectors() {
  expect(warden::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(warden::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string src = warden::source_digest("print(1)");
  const std::string audit = warden::hash_domain("audit:", "print(1)");
  expect(src.size() == 64 && audit.size() == 64, "digests are 64 hex chars");
  expect(src != audit, "src and audit domains differ");
  expect(src != warden::blake3_hex("print(1)"), "domain-tagged digest differs from raw");
}

void test_version_manifest() {
  const auto m = warden::version::current_manifest();
  expect(m.warden_semver == warden::version::WARDEN_SEMVER, "semver in manifest");
  const std::string rv = warden::version::runtime_version();
  expect(!rv.empty() && rv[0] == '3', "runtime version is 3.x");
  expect(contains(warden::version::manifest_to_json(m), "\"policy_table\""),
         "manifest json has policy_table");
}

void test_audit_chain() {
  const fs::path tmp = fs::temp_directory_path() / "warden_audit_chain.ndjson";
  fs::remove(tmp);
  {
    warden::ImmutableAuditLog log(tmp.string());
    warden::ProvenanceRecord a;
    a.mode = "inline_snippet";
    a.status = "completed";
    a.source_digest = warden::source_digest("print(1)");
    warden::ProvenanceRecord b = a;
    expect(log.append(a), "first append");
    expect(log.append(b), "second append");
    expect(a.sequence == 1 && b.sequence == 2, "sequence numbers are monotonic");
    expect(log.entry_count() == 2 && log.failure_count() == 0, "counters");
  }
  std::ifstream in(tmp);
  std::string first, second;
  std::getline(in, first);
  std::getline(in, second);
  expect(warden::jsonlite::get_string(first, "prev", "") == std::string(64, '0'),
         "first entry chains to the zero digest");
  expect(warden::jsonlite::get_string(second, "prev", "") ==
             warden::hash_domain("audit:", first),
         "second entry chains to the first line");
  expect(warden::jsonlite::get_i64(second, "seq", 0) == 2, "seq field");
  fs::remove(tmp);
}

void test_audit_unwritable_path() {
  warden::ImmutableAuditLog log("/nonexistent-dir/warden/audit.ndjson");
  warden::ProvenanceRecord r;
  expect(!log.append(r), "append to an unopenable path fails");
  expect(log.failure_count() == 1 && log.entry_count() == 0, "failure counted, nothing chained");

  warden::ImmutableAuditLog disabled;
  expect(disabled.append(r), "unconfigured log is a no-op success");
}

void test_jsonlite_escape() {
  const std::string raw = "a\"b\\c\nd\x01";
  const std::string esc = warden::jsonlite::escape(raw);
  expect(esc == "a\\\"b\\\\c\\nd\\u0001", "escape covers quotes, slashes and controls");
  expect(warden::jsonlite::unescape(esc) == raw, "unescape inverts escape");
  const std::string obj = "{\"k\":\"" + esc + "\",\"n\":-7,\"b\":true}";
  expect(warden::jsonlite::get_string(obj, "k", "") == raw, "get_string");
  expect(warden::jsonlite::get_i64(obj, "n", 0) == -7, "get_i64");
  expect(warden::jsonlite::get_bool(obj, "b", false), "get_bool");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_from_env() {
  setenv("WARDEN_MAX_MEMORY_BYTES", "1048576", 1);
  setenv("WARDEN_TIMEOUT_SECONDS", "2.5", 1);
  setenv("WARDEN_DISABLE_MODULES", "json, pathlib", 1);
  setenv("WARDEN_EXTENSION_PATHS", "gurobipy=/opt/gurobi,highs=/opt/highs", 1);
  setenv("WARDEN_CONFLICTS", "gurobipy:highs", 1);
  setenv("WARDEN_SOLVERS", "gurobipy", 1);
  const auto c = warden::WardenConfig::from_env();
  unsetenv("WARDEN_MAX_MEMORY_BYTES");
  unsetenv("WARDEN_TIMEOUT_SECONDS");
  unsetenv("WARDEN_DISABLE_MODULES");
  unsetenv("WARDEN_EXTENSION_PATHS");
  unsetenv("WARDEN_CONFLICTS");
  unsetenv("WARDEN_SOLVERS");

  expect(c.ok(), "valid environment parses");
  expect(c.max_memory_bytes == 1048576, "memory override");
  expect(c.timeout_seconds == 2.5, "fractional timeout");
  expect(c.disabled_modules.size() == 2 && c.disabled_modules[1] == "pathlib", "disabled list");
  expect(c.extension_paths.size() == 2, "extension paths");
  expect(c.build_policy().is_import_denied("pathlib").has_value(), "disabled module denied");

  const auto ns = c.build_namespace();
  expect(ns.conflicts("highs", "gurobipy"), "conflict pair");
  expect(ns.search_path().front() == "/opt/gurobi", "trusted segment first");
  expect(contains(c.to_json(), "\"solvers\""), "config json lists solvers");
}

void test_config_errors_collected() {
  setenv("WARDEN_MAX_CPU_SECONDS", "-3", 1);
  setenv("WARDEN_ALLOW_NETWORK", "maybe", 1);
  setenv("WARDEN_SOLVERS", "cplex", 1);
  const auto c = warden::WardenConfig::from_env();
  unsetenv("WARDEN_MAX_CPU_SECONDS");
  unsetenv("WARDEN_ALLOW_NETWORK");
  unsetenv("WARDEN_SOLVERS");

  expect(!c.ok(), "invalid environment rejected");
  expect(c.errors.size() == 3, "every invalid value reported");
  expect(c.max_cpu_seconds == 200, "invalid value leaves the default");
}

// ============================================================================
// Governor
// ============================================================================

void test_governor_single_lease() {
  warden::ResourceLimits limits;
  limits.max_wall_seconds = 30;
  const uint64_t before = warden::global_sandbox_stats().governor_rejections.load();

  auto first = warden::install_governor(limits);
  expect(first.ok, "first install succeeds: " + first.message);
  expect(warden::governor_active(), "governor active");
  expect(timer_armed(), "deadline timer armed");

  auto second = warden::install_governor(limits);
  expect(!second.ok, "second install rejected");
  expect(second.error_code == warden::ErrorCode::governor_already_installed,
         "rejection code");
  expect(!second.lease, "rejected install hands out no lease");
  expect(timer_armed(), "rejected install leaves the active timer alone");
  expect(warden::global_sandbox_stats().governor_rejections.load() == before + 1,
         "rejection counted");

  first.lease->release();
  expect(!timer_armed(), "release disarms the timer");
  expect(!warden::governor_active(), "governor inactive after release");
  first.lease->release();  // idempotent

  auto third = warden::install_governor(limits);
  expect(third.ok, "install works again after release");
}

void test_governor_recursion_only_lowers() {
  const int current = Py_GetRecursionLimit();
  warden::ResourceLimits limits;
  limits.max_recursion_depth = current + 5000;
  {
    auto g = warden::install_governor(limits);
    expect(g.ok, "install with a higher recursion request");
    expect(Py_GetRecursionLimit() == current, "recursion limit never raised");
  }
  expect(!warden::governor_active(), "lease destructor releases");
}

void test_governor_restores_handlers() {
  py::module_ sig = warden::pyhost::import_unchecked("signal");
  py::object before = sig.attr("getsignal")(14);  // SIGALRM
  {
    warden::ResourceLimits limits;
    limits.max_wall_seconds = 30;
    auto g = warden::install_governor(limits);
    expect(g.ok, "install");
    py::object during = sig.attr("getsignal")(14);
    expect(!during.is(before), "deadline handler installed");
  }
  py::object after = sig.attr("getsignal")(14);
  expect(after.equal(before), "previous SIGALRM handler restored");
}

// SigBlk of every thread but the main one, from /proc/self/task.
std::vector<unsigned long long> helper_thread_sigmasks() {
  std::vector<unsigned long long> masks;
  const std::string main_tid = std::to_string(getpid());
  for (const auto& task : fs::directory_iterator("/proc/self/task")) {
    if (task.path().filename().string() == main_tid) continue;
    std::ifstream status(task.path() / "status");
    std::string line;
    while (std::getline(status, line)) {
      if (line.rfind("SigBlk:", 0) == 0) {
        masks.push_back(std::stoull(line.substr(7), nullptr, 16));
        break;
      }
    }
  }
  return masks;
}

void test_governor_watchdog_blocks_signals() {
  const auto bit = [](int signum) { return 1ULL << (signum - 1); };
  sigset_t before;
  pthread_sigmask(SIG_SETMASK, nullptr, &before);

  warden::ResourceLimits limits;
  limits.max_wall_seconds = 30;
  auto g = warden::install_governor(limits);
  expect(g.ok, "install");

  const auto masks = helper_thread_sigmasks();
  expect(!masks.empty(), "watchdog thread running");
  bool blocked = false;
  for (auto m : masks) {
    if ((m & bit(SIGALRM)) && (m & bit(SIGXCPU))) blocked = true;
  }
  expect(blocked, "watchdog blocks SIGALRM and SIGXCPU");

  sigset_t during;
  pthread_sigmask(SIG_SETMASK, nullptr, &during);
  expect(sigismember(&during, SIGALRM) == sigismember(&before, SIGALRM) &&
             sigismember(&during, SIGXCPU) == sigismember(&before, SIGXCPU),
         "interpreter thread mask unchanged");
  g.lease->release();
}

// ============================================================================
// Interceptor
// ============================================================================

void test_gate_hard_denied() {
  warden::Interceptor ic(warden::Policy::defaults(), g_runtime->extension_namespace());
  expect(ic.install().ok, "install");
  expect(raises_denied([&] { ic.import_module("os"); }), "os denied");
  expect(raises_denied([&] { ic.import_module("os.path"); }), "os.path denied");
  expect(raises_denied([&] { ic.import_module("subprocess"); }), "subprocess denied");
  expect(raises_denied([&] { ic.import_module("builtins"); }), "builtins denied");
  expect(!ic.import_module("json").is_none(), "json imports");

  try {
    ic.import_module("socket");
    expect(false, "socket must not import");
  } catch (py::error_already_set& e) {
    expect(e.matches(PyExc_ImportError), "CapabilityDenied is an ImportError");
    py::object name = e.value().attr("name");
    expect(name.cast<std::string>() == "socket", "exception names the capability");
    expect(std::string(py::str(e.value())) ==
               "Module 'socket' is not allowed in secure environment",
           "denial message");
  }
}

void test_gate_fromlist_and_relative() {
  const fs::path tmp = fs::temp_directory_path() / "warden_relative";
  fs::remove_all(tmp);
  write_file(tmp / "wrel" / "__init__.py", "");
  write_file(tmp / "wrel" / "helper.py", "VALUE = 42\n");
  write_file(tmp / "wrel" / "secret.py", "VALUE = 0\n");

  py::module_ sys = warden::pyhost::import_unchecked("sys");
  sys.attr("path").attr("insert")(0, tmp.string());

  auto policy = warden::Policy::defaults();
  policy.deny_import("wrel.secret");
  warden::Interceptor ic(policy, g_runtime->extension_namespace());
  expect(ic.install().ok, "install");

  py::dict pkg_globals;
  pkg_globals["__name__"] = "wrel.user";
  pkg_globals["__package__"] = "wrel";

  py::object helper = ic.import_module("helper", pkg_globals, py::tuple(), 1);
  expect(helper.attr("VALUE").cast<int>() == 42, "relative import resolves inside the package");
  expect(raises_denied([&] { ic.import_module("secret", pkg_globals, py::tuple(), 1); }),
         "relative import of a denied submodule");
  expect(raises_denied([&] {
           ic.import_module("wrel", py::none(), py::make_tuple("secret"), 0);
         }),
         "fromlist submodule denied");
  expect(raises_denied([&] { ic.import_module("", pkg_globals, py::make_tuple("secret"), 1); }),
         "from . import secret denied");

  sys.attr("path").attr("remove")(tmp.string());
  fs::remove_all(tmp);
}

void test_selective_members_proxy() {
  warden::Interceptor ic(warden::Policy::defaults(), g_runtime->extension_namespace());
  expect(ic.install().ok, "install");
  py::dict g = restricted_globals(ic);
  py::exec(R"(
import signal
try:
    signal.alarm(0)
    alarm_ok = True
except ImportError as e:
    alarm_ok = False
    alarm_msg = str(e)
default_int = signal.getsignal(signal.SIGINT)
del signal.alarm
import signal as again
try:
    again.alarm(0)
    reexposed = True
except ImportError:
    reexposed = False
from signal import setitimer
try:
    setitimer(signal.ITIMER_REAL, 0)
    setitimer_ok = True
except ImportError:
    setitimer_ok = False
)", g);
  expect(!g["alarm_ok"].cast<bool>(), "signal.alarm denied");
  expect(g["alarm_msg"].cast<std::string>() ==
             "signal.alarm() is not allowed in secure environment",
         "member denial message");
  expect(!g["default_int"].is_none(), "other signal members keep working");
  expect(!g["reexposed"].cast<bool>(), "re-import builds a fresh proxy");
  expect(!g["setitimer_ok"].cast<bool>(), "from-import of a denied member");

  py::module_ real = warden::pyhost::import_unchecked("signal");
  expect(py::hasattr(real, "alarm"), "real signal module untouched");
}

void test_builtin_stubs_have_no_side_effects() {
  const fs::path target = fs::temp_directory_path() / "warden_stub_side_effect";
  fs::remove(target);

  warden::Interceptor ic(warden::Policy::defaults(), g_runtime->extension_namespace());
  expect(ic.install().ok, "install");
  py::dict g = restricted_globals(ic);
  g["target"] = target.string();
  py::exec(R"(
effects = []
messages = []
for attempt in (lambda: exec("effects.append(1)"),
                lambda: eval("effects.append(2)"),
                lambda: compile("1", "<x>", "exec"),
                lambda: open(target, "w")):
    try:
        attempt()
    except CapabilityDenied as e:
        messages.append(str(e))
)", g);
  expect(py::len(g["effects"]) == 0, "stubbed exec/eval ran nothing");
  expect(py::len(g["messages"]) == 4, "every stub raised");
  expect(py::list(g["messages"])[0].cast<std::string>() ==
             "exec() is not allowed in secure environment",
         "exec denial message");
  expect(!fs::exists(target), "stubbed open created no file");

  py::module_ builtins = warden::pyhost::import_unchecked("builtins");
  py::object real_exec = builtins.attr("exec");
  py::object stubbed_exec = g["__builtins__"]["exec"];
  expect(!real_exec.is(stubbed_exec), "real builtins module not modified");
}

void test_audit_hook_blocks_library_paths() {
  auto ic = std::make_unique<warden::Interceptor>(warden::Policy::defaults(),
                                                  g_runtime->extension_namespace());
  expect(ic->install().ok, "install");
  expect(ic->attached(), "attached to the audit hook");

  // The host imports os directly: only the audit hook stands in the way.
  py::module_ os = warden::pyhost::import_unchecked("os");
  const uint64_t denials = warden::global_sandbox_stats().denials_raised.load();
  expect(raises_denied([&] { os.attr("system")("true"); }), "os.system vetoed");
  expect(raises_denied([&] { os.attr("kill")(getpid(), 0); }), "os.kill vetoed");
  expect(warden::global_sandbox_stats().denials_raised.load() >= denials + 2,
         "each denial emitted");

  ic->detach();
  expect(!ic->attached(), "detached");
  ic.reset();
}

void test_string_evaluating_modules_denied() {
  warden::Interceptor ic(warden::Policy::defaults(), g_runtime->extension_namespace());
  expect(ic.install().ok, "install");
  for (const char* name : {"timeit", "doctest", "pdb", "bdb", "profile", "cProfile", "trace"}) {
    expect(raises_denied([&] { ic.import_module(name); }),
           std::string(name) + " denied: it runs strings with the real builtins");
  }

  py::dict g = restricted_globals(ic);
  py::exec(R"(
try:
    import timeit
    timeit.timeit("__import__('os').listdir('/')", number=1)
    reached = True
except CapabilityDenied as e:
    reached = False
    denied_name = e.name
)", g);
  expect(!g["reached"].cast<bool>(), "timeit cannot smuggle os in");
  expect(g["denied_name"].cast<std::string>() == "timeit", "denial names timeit");
}

void test_library_file_mutation_denied() {
  const fs::path tmp = fs::temp_directory_path() / "warden_file_mutation";
  fs::remove_all(tmp);
  write_file(tmp / "source.txt", "payload");
  fs::create_directories(tmp / "keep");

  warden::Interceptor ic(warden::Policy::defaults(), g_runtime->extension_namespace());
  expect(ic.install().ok, "install");
  py::dict g = restricted_globals(ic);
  g["source"] = (tmp / "source.txt").string();
  g["target"] = (tmp / "target.txt").string();
  g["keep_dir"] = (tmp / "keep").string();
  py::exec(R"(
import codecs, pathlib, shutil
results = {}
def attempt(key, fn):
    try:
        fn()
        results[key] = 'ran'
    except CapabilityDenied as e:
        results[key] = e.name
attempt('write_text', lambda: pathlib.Path(target).write_text('x'))
attempt('copyfile', lambda: shutil.copyfile(source, target))
attempt('rmtree', lambda: shutil.rmtree(keep_dir))
attempt('unlink', lambda: pathlib.Path(source).unlink())
attempt('codecs', lambda: codecs.open(source).read())
read_back = pathlib.Path(source).read_text()
)", g);
  py::dict results = g["results"];
  auto outcome = [&](const char* key) { return results[key].cast<std::string>(); };
  expect(outcome("write_text") == "open.write", "pathlib write vetoed as open.write");
  expect(outcome("copyfile") == "shutil.copyfile", "shutil.copyfile vetoed");
  expect(outcome("rmtree") == "shutil.rmtree", "shutil.rmtree vetoed");
  expect(outcome("unlink") == "os.remove", "unlink vetoed as os.remove");
  expect(outcome("codecs") == "codecs.open", "codecs.open stubbed");
  expect(g["read_back"].cast<std::string>() == "payload", "reads stay allowed");

  expect(!fs::exists(tmp / "target.txt"), "no file created");
  expect(fs::exists(tmp / "source.txt"), "source not removed");
  expect(fs::is_directory(tmp / "keep"), "directory not removed");
  ic.detach();
  fs::remove_all(tmp);
}

const char* kConnectScript = R"(
import http.client
try:
    http.client.HTTPConnection('127.0.0.1', 9, timeout=2).connect()
    outcome = 'connected'
except CapabilityDenied as e:
    outcome = e.name
except OSError:
    outcome = 'refused'
)";

void test_network_operations_denied() {
  {
    warden::Interceptor ic(warden::Policy::defaults(false), g_runtime->extension_namespace());
    expect(ic.install().ok, "install");
    py::dict g = restricted_globals(ic);
    py::exec(kConnectScript, g);
    const std::string outcome = g["outcome"].cast<std::string>();
    expect(outcome == "socket.getaddrinfo" || outcome == "socket.connect",
           "library-level connect vetoed, got " + outcome);
  }
  {
    warden::Interceptor ic(warden::Policy::defaults(true), g_runtime->extension_namespace());
    expect(ic.install().ok, "install");
    py::dict g = restricted_globals(ic);
    py::exec(kConnectScript, g);
    const std::string outcome = g["outcome"].cast<std::string>();
    expect(outcome == "refused" || outcome == "connected",
           "allow_network reaches the socket layer, got " + outcome);
  }
}

void test_solver_hook() {
  const fs::path tmp = fs::temp_directory_path() / "warden_solver";
  fs::remove_all(tmp);
  write_file(tmp / "user" / "fakesolver.py", "PLANTED = True\n");
  write_file(tmp / "trusted" / "realsolver" / "__init__.py", "TRUSTED = True\n");
  fs::create_directories(tmp / "trusted_fake");

  warden::ExtensionNamespace ns;
  ns.add_trusted("fakesolver", (tmp / "trusted_fake").string());
  ns.add_trusted("realsolver", (tmp / "trusted").string());
  ns.add_user("app", (tmp / "user").string());

  py::module_ sys = warden::pyhost::import_unchecked("sys");
  sys.attr("path").attr("insert")(0, (tmp / "trusted").string());
  sys.attr("path").attr("insert")(0, (tmp / "user").string());

  warden::Interceptor ic(warden::Policy::defaults(), ns, {"fakesolver", "realsolver"});
  expect(ic.install().ok, "install");
  expect(raises_denied([&] { ic.import_module("fakesolver"); }),
         "solver planted in a user segment is denied");
  py::object real = ic.import_module("realsolver");
  expect(real.attr("TRUSTED").cast<bool>(), "solver in its own trusted segment imports");

  sys.attr("path").attr("remove")((tmp / "trusted").string());
  sys.attr("path").attr("remove")((tmp / "user").string());
  sys.attr("modules").attr("pop")("realsolver", py::none());
  fs::remove_all(tmp);
}

// ============================================================================
// Driver (in process, captured output)
// ============================================================================

void test_driver_inline_snippet() {
  const auto out = run_captured({"-c", "print(1+1)"});
  expect(out.ok(), "snippet completes: " + out.stderr_text);
  expect(out.stdout_text == "2\n", "stdout is 2");
  expect(out.source_digest == warden::source_digest("print(1+1)"), "digest of executed source");
  expect(!timer_armed(), "deadline disarmed after completion");
}

void test_driver_file_denial_keeps_partial_output() {
  const fs::path script = fs::temp_directory_path() / "warden_denied_script.py";
  write_file(script, "print('before')\nimport os\nprint('after')\n");
  const auto out = run_captured({script.string()});
  expect(out.status == warden::OutcomeStatus::capability_denied, "denied outcome");
  expect(out.denied_capability == "os", "names the import");
  expect(out.exit_code == 1, "exit 1");
  expect(out.stdout_text == "before\n", "output before the import survives, nothing after");
  expect(contains(out.stderr_text,
                  "Error: CapabilityDenied: Module 'os' is not allowed in secure environment"),
         "denial printed");
  fs::remove(script);
}

void test_driver_missing_file() {
  const auto out = run_captured({"/nonexistent/warden_script.py"});
  expect(out.status == warden::OutcomeStatus::runtime_error, "runtime error");
  expect(out.error_code == warden::ErrorCode::source_unavailable, "source_unavailable");
  expect(out.exit_code == 1, "exit 1");
  expect(contains(out.stderr_text, "can't open file"), "message printed");
}

void test_driver_denial_is_catchable() {
  const auto out = run_captured(
      {"-c", "try:\n    import subprocess\nexcept ImportError:\n    print('caught')\n"});
  expect(out.ok(), "caught denial does not fail the run");
  expect(out.stdout_text == "caught\n", "handler ran");
}

void test_driver_timeout_tight_loop() {
  auto config = test_config();
  config.timeout_seconds = 1.0;
  const auto start = std::chrono::steady_clock::now();
  const auto out = run_captured(
      {"-c", "try:\n    while True:\n        pass\nexcept Exception:\n    print('absorbed')\n"},
      config);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(out.status == warden::OutcomeStatus::timeout, "timeout outcome");
  expect(out.exit_code == 1, "exit 1");
  expect(!contains(out.stdout_text, "absorbed"), "except Exception cannot absorb the deadline");
  expect(contains(out.stderr_text, "Error: ExecutionTimeout: Code execution timeout"),
         "timeout printed");
  expect(elapsed < std::chrono::seconds(5), "bounded overshoot");
  expect(!timer_armed(), "deadline disarmed after timeout");
  expect(!warden::governor_active(), "lease released after timeout");
}

void test_driver_system_exit() {
  auto out = run_captured({"-c", "raise SystemExit(3)"});
  expect(out.status == warden::OutcomeStatus::completed && out.exit_code == 3,
         "SystemExit code propagates");

  out = run_captured({"-c", "raise SystemExit('bye')"});
  expect(out.exit_code == 1 && contains(out.stderr_text, "bye"), "SystemExit message");

  out = run_captured({"-c", "raise SystemExit"});
  expect(out.ok(), "bare SystemExit is success");
}

void test_driver_runtime_error() {
  const auto out = run_captured({"-c", "print('x')\n1/0\n"});
  expect(out.status == warden::OutcomeStatus::runtime_error, "runtime error");
  expect(out.exit_code == 1, "exit 1");
  expect(contains(out.stderr_text, "ZeroDivisionError"), "traceback printed");
  expect(contains(out.message, "ZeroDivisionError"), "message names the type");
  expect(out.stdout_text == "x\n", "earlier output kept");
}

void test_driver_recursion() {
  const auto out = run_captured({"-c", "def f():\n    return f()\nf()\n"});
  expect(out.status == warden::OutcomeStatus::resource_exceeded, "resource exceeded");
  expect(out.resource_kind == warden::ResourceKind::recursion, "recursion kind");
  expect(contains(out.stderr_text, "Error: ResourceExceeded:"), "printed");
}

void test_driver_stream_from_pipe() {
  int fds[2];
  expect(pipe(fds) == 0, "pipe");
  const std::string code = "import json\nprint(json.dumps({'a': 1}))\n";
  expect(write(fds[1], code.data(), code.size()) == static_cast<ssize_t>(code.size()), "write");
  close(fds[1]);

  warden::Driver driver(test_config(), g_runtime, warden::OutputMode::capture);
  driver.set_input_fd(fds[0]);
  const auto out = driver.run(warden::resolve_request({}));
  close(fds[0]);
  expect(out.ok(), "stream completes: " + out.stderr_text);
  expect(out.stdout_text == "{\"a\": 1}\n", "stream output");
  expect(out.source_digest == warden::source_digest(code), "digest of stdin text");
}

void test_driver_empty_stream_falls_back_to_loop() {
  int fds[2];
  expect(pipe(fds) == 0, "pipe");
  close(fds[1]);
  warden::Driver driver(test_config(), g_runtime, warden::OutputMode::capture);
  driver.set_input_fd(fds[0]);
  const auto out = driver.run(warden::resolve_request({}));
  close(fds[0]);
  expect(out.ok(), "empty stream ends the loop cleanly");
  expect(out.stdout_text.empty(), "no output");
}

void test_driver_module_invocation() {
  auto out = run_captured({"-m", "wapp", "one"});
  expect(out.ok(), "package __main__ runs: " + out.stderr_text);
  expect(contains(out.stdout_text, "wapp/__main__.py"), "__file__ is the resolved file");
  expect(contains(out.stdout_text, "one"), "argv tail");
  expect(contains(out.stdout_text, "pkg=wapp"), "__package__ set");

  out = run_captured({"-m", "os"});
  expect(out.status == warden::OutcomeStatus::capability_denied, "-m os denied");
  expect(out.exit_code == 1, "exit 1");

  out = run_captured({"-m", "warden_no_such_module"});
  expect(out.error_code == warden::ErrorCode::source_unavailable, "missing module");
}

void test_driver_version_query() {
  const auto out = run_captured({"--version"});
  expect(out.ok(), "version completes");
  expect(out.stdout_text == "Python " + warden::version::runtime_version() + "\n",
         "version line");
}

std::vector<std::string> g_hooked_lines;

void collect_line(const std::string& line) {
  g_hooked_lines.push_back(line);
}

void test_events_and_stats() {
  auto& stats = warden::global_sandbox_stats();
  const uint64_t total = stats.total_executions.load();
  const uint64_t denied = stats.capability_denied.load();

  g_hooked_lines.clear();
  warden::set_event_hook(collect_line);
  run_captured({"-c", "print('secret-output')\nimport socket\n"});
  warden::set_event_hook(nullptr);

  expect(stats.total_executions.load() == total + 1, "execution counted");
  expect(stats.capability_denied.load() == denied + 1, "denial outcome counted");

  bool saw_denial = false, saw_execution = false;
  for (const auto& line : g_hooked_lines) {
    expect(!contains(line, "secret-output"), "events never carry output text");
    if (contains(line, "\"event\":\"denial\"")) {
      saw_denial = true;
      expect(warden::jsonlite::get_string(line, "capability", "") == "socket", "denial name");
    }
    if (contains(line, "\"event\":\"execution\"")) {
      saw_execution = true;
      expect(warden::jsonlite::get_string(line, "status", "") == "capability_denied",
             "execution status");
      expect(warden::jsonlite::get_i64(line, "bytes_stdout", 0) == 14, "stdout size only");
      expect(!warden::jsonlite::get_bool(line, "license_present", true), "no license file");
    }
  }
  expect(saw_denial && saw_execution, "both event kinds emitted");
  expect(contains(stats.to_json(), "\"denials_raised\""), "stats json");
}

void test_outcome_json() {
  const auto out = run_captured({"-c", "print('hidden')"});
  const std::string json = out.to_json();
  expect(warden::jsonlite::get_string(json, "status", "") == "completed", "status field");
  expect(!contains(json, "hidden"), "outcome json carries no output text");
}

// ============================================================================
// End to end (warden binary as a child process)
// ============================================================================

warden::ProcessResult run_warden(const std::vector<std::string>& args,
                                 const std::map<std::string, std::string>& env = {},
                                 const std::string& stdin_text = "",
                                 uint64_t timeout_ms = 60000) {
  warden::ProcessSpec spec;
  spec.command = WARDEN_BINARY;
  spec.argv = args;
  spec.env = env;
  spec.env["WARDEN_APP_DIR"] = g_app_dir.string();
  spec.capture = true;
  spec.stdin_text = stdin_text;
  spec.timeout_ms = timeout_ms;
  return warden::run_process(spec);
}

void test_e2e_stream_round_trip() {
  const auto r = run_warden({}, {}, "print(1+1)\n");
  expect(r.started, "warden started: " + r.error_message);
  expect(r.exit_code == 0, "exit 0: " + r.stderr_text);
  expect(r.stdout_text == "2\n", "stdout 2");
}

void test_e2e_version() {
  const auto r = run_warden({"--version"});
  expect(r.exit_code == 0, "exit 0");
  expect(r.stdout_text.rfind("Python 3.", 0) == 0, "version line");
}

void test_e2e_file_denial() {
  const fs::path script = fs::temp_directory_path() / "warden_e2e_denied.py";
  write_file(script, "print('before')\nimport os\nprint('after')\n");
  const auto r = run_warden({script.string()});
  expect(r.exit_code == 1, "exit 1");
  expect(r.stdout_text == "before\n", "partial output only");
  expect(contains(r.stderr_text, "Module 'os' is not allowed in secure environment"),
         "denial named");
  fs::remove(script);
}

void test_e2e_timeout() {
  const auto start = std::chrono::steady_clock::now();
  const auto r = run_warden({"-c", "while True:\n    pass\n"},
                            {{"WARDEN_TIMEOUT_SECONDS", "1"}});
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(r.exit_code == 1, "exit 1");
  expect(contains(r.stderr_text, "Error: ExecutionTimeout: Code execution timeout"),
         "timeout printed");
  expect(elapsed < std::chrono::seconds(10), "bounded overshoot");
}

void test_e2e_watchdog_non_yielding_call() {
  // sum() over a range stays in C and never reaches a bytecode boundary.
  const auto start = std::chrono::steady_clock::now();
  const auto r = run_warden({"-c", "sum(range(10**13))"},
                            {{"WARDEN_TIMEOUT_SECONDS", "1"}, {"WARDEN_GRACE_SECONDS", "1"}});
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(r.exit_code == 1, "watchdog exit 1");
  expect(contains(r.stderr_text, "ExecutionTimeout"), "watchdog reports the deadline");
  expect(elapsed < std::chrono::seconds(15), "watchdog fires within grace");
}

void test_e2e_memory_ceiling() {
  // 512 MiB fits under the default ceiling and fails under a 256 MiB one.
  const std::string script = "x = bytearray(512 << 20)\nprint('allocated')\n";
  const auto control = run_warden({"-c", script});
  expect(control.exit_code == 0, "control run exit 0: " + control.stderr_text);
  expect(contains(control.stdout_text, "allocated"), "allocation fits the default ceiling");

  const auto r = run_warden({"-c", script}, {{"WARDEN_MAX_MEMORY_BYTES", "268435456"}});
  expect(r.exit_code == 1, "exit 1");
  expect(!contains(r.stdout_text, "allocated"), "allocation did not succeed");
  expect(contains(r.stderr_text, "Error: ResourceExceeded: Memory limit exceeded"),
         "memory reported");
}

void test_e2e_network_toggle() {
  const std::string script = std::string(kConnectScript) + "print(outcome)\n";
  auto r = run_warden({"-c", script});
  expect(r.exit_code == 0, "exit 0: " + r.stderr_text);
  expect(contains(r.stdout_text, "socket."), "sockets denied by default");

  r = run_warden({"-c", script}, {{"WARDEN_ALLOW_NETWORK", "1"}});
  expect(r.exit_code == 0, "exit 0: " + r.stderr_text);
  expect(contains(r.stdout_text, "refused") || contains(r.stdout_text, "connected"),
         "WARDEN_ALLOW_NETWORK=1 lifts the socket denials");
}

void test_e2e_cpu_ceiling() {
  const auto r = run_warden({"-c", "while True:\n    pass\n"},
                            {{"WARDEN_MAX_CPU_SECONDS", "1"}, {"WARDEN_TIMEOUT_SECONDS", "30"}});
  expect(r.exit_code == 1, "exit 1");
  expect(contains(r.stderr_text, "Error: ResourceExceeded: CPU time limit exceeded"),
         "cpu reported");
}

void test_e2e_module_and_passthrough() {
  auto r = run_warden({"-m", "wapp", "two"});
  expect(r.exit_code == 0, "-m exit 0: " + r.stderr_text);
  expect(contains(r.stdout_text, "two"), "-m argv");

  r = run_warden({"-E", "-c", "import sys; sys.exit(7)"});
  expect(r.exit_code == 7, "passthrough propagates the child's exit code");
}

void test_e2e_invalid_config() {
  const auto r = run_warden({"-c", "print(1)"}, {{"WARDEN_TIMEOUT_SECONDS", "soon"}});
  expect(r.exit_code == 1, "invalid config exits 1");
  expect(contains(r.stderr_text, "WARDEN_TIMEOUT_SECONDS"), "names the variable");
  expect(r.stdout_text.empty(), "nothing ran");
}

void test_e2e_event_and_audit_logs() {
  const fs::path tmp = fs::temp_directory_path() / "warden_e2e_logs";
  fs::remove_all(tmp);
  fs::create_directories(tmp);
  const auto r = run_warden({"-c", "print(3)"},
                            {{"WARDEN_EVENT_LOG", (tmp / "events.jsonl").string()},
                             {"WARDEN_AUDIT_LOG", (tmp / "audit.ndjson").string()}});
  expect(r.exit_code == 0, "exit 0");
  const std::string events = read_file(tmp / "events.jsonl");
  expect(contains(events, "\"event\":\"execution\""), "execution event written");
  const std::string audit = read_file(tmp / "audit.ndjson");
  expect(warden::jsonlite::get_string(audit, "source_digest", "") ==
             warden::source_digest("print(3)"),
         "audit records the source digest");
  fs::remove_all(tmp);
}

}  // namespace

int main() {
  std::cout << "=== warden Test Suite ===\n";

  g_app_dir = fs::temp_directory_path() / "warden_test_app";
  fs::remove_all(g_app_dir);
  write_file(g_app_dir / "wapp" / "__init__.py", "");
  // sys is denied to user code; argparse reads sys.argv on its behalf.
  write_file(g_app_dir / "wapp" / "__main__.py",
             "import argparse\n"
             "parser = argparse.ArgumentParser()\n"
             "parser.add_argument('word')\n"
             "print(__file__, parser.parse_args().word, 'pkg=' + __package__)\n");

  auto started = warden::start_runtime(test_config());
  expect(started.ok, "runtime starts: " + started.message);
  g_runtime = started.runtime.get();

  std::cout << "\n[Policy]\n";
  run_test("default tiers", test_policy_default_tiers);
  run_test("dotted prefix denial", test_policy_dotted_prefix);
  run_test("network toggle", test_policy_network_toggle);
  run_test("import gate not stubbable", test_policy_import_gate_not_stubbable);
  run_test("tighten promotes", test_policy_tighten_promotes);
  run_test("tier conflicts", test_policy_tier_conflicts);
  run_test("policy json", test_policy_to_json);

  std::cout << "\n[Mode resolution]\n";
  run_test("precedence table", test_mode_table);

  std::cout << "\n[Extension namespace]\n";
  run_test("lookup order", test_namespace_lookup_order);
  run_test("conflict isolation", test_namespace_conflict_isolation);
  run_test("validate rejects sharing", test_namespace_validate_rejects_sharing);
  run_test("packages and submodules", test_namespace_packages);
  run_test("finder isolates conflicting providers", test_namespace_finder_isolates_providers);

  std::cout << "\n[Hashing & audit]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("version manifest", test_version_manifest);
  run_test("audit chain", test_audit_chain);
  run_test("audit unwritable path", test_audit_unwritable_path);
  run_test("jsonlite escape", test_jsonlite_escape);

  std::cout << "\n[Configuration]\n";
  run_test("from_env", test_config_from_env);
  run_test("errors collected", test_config_errors_collected);

  std::cout << "\n[Governor]\n";
  run_test("single lease", test_governor_single_lease);
  run_test("recursion only lowers", test_governor_recursion_only_lowers);
  run_test("handlers restored", test_governor_restores_handlers);
  run_test("watchdog blocks governor signals", test_governor_watchdog_blocks_signals);

  std::cout << "\n[Interceptor]\n";
  run_test("hard denied imports", test_gate_hard_denied);
  run_test("fromlist and relative imports", test_gate_fromlist_and_relative);
  run_test("selective member proxy", test_selective_members_proxy);
  run_test("builtin stubs have no side effects", test_builtin_stubs_have_no_side_effects);
  run_test("audit hook blocks library paths", test_audit_hook_blocks_library_paths);
  run_test("string-evaluating modules denied", test_string_evaluating_modules_denied);
  run_test("library file mutation denied", test_library_file_mutation_denied);
  run_test("network operations denied", test_network_operations_denied);
  run_test("solver hook", test_solver_hook);

  std::cout << "\n[Driver]\n";
  run_test("inline snippet", test_driver_inline_snippet);
  run_test("file denial keeps partial output", test_driver_file_denial_keeps_partial_output);
  run_test("missing file", test_driver_missing_file);
  run_test("denial is catchable", test_driver_denial_is_catchable);
  run_test("timeout on tight loop", test_driver_timeout_tight_loop);
  run_test("SystemExit", test_driver_system_exit);
  run_test("runtime error", test_driver_runtime_error);
  run_test("recursion", test_driver_recursion);
  run_test("stream from pipe", test_driver_stream_from_pipe);
  run_test("empty stream", test_driver_empty_stream_falls_back_to_loop);
  run_test("module invocation", test_driver_module_invocation);
  run_test("version query", test_driver_version_query);
  run_test("events and stats", test_events_and_stats);
  run_test("outcome json", test_outcome_json);

  std::cout << "\n[End to end]\n";
  run_test("stream round trip", test_e2e_stream_round_trip);
  run_test("--version", test_e2e_version);
  run_test("file denial", test_e2e_file_denial);
  run_test("timeout", test_e2e_timeout);
  run_test("watchdog on non-yielding call", test_e2e_watchdog_non_yielding_call);
  run_test("memory ceiling", test_e2e_memory_ceiling);
  run_test("cpu ceiling", test_e2e_cpu_ceiling);
  run_test("network allowed by config", test_e2e_network_toggle);
  run_test("module and passthrough", test_e2e_module_and_passthrough);
  run_test("invalid config", test_e2e_invalid_config);
  run_test("event and audit logs", test_e2e_event_and_audit_logs);

  fs::remove_all(g_app_dir);
  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
