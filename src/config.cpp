#include "warden/config.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <mutex>
#include <sstream>

#include "warden/jsonlite.hpp"

namespace warden {

namespace {

const char* env(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

std::vector<std::string> split_list(const std::string& s, char sep = ',') {
  std::vector<std::string> out;
  std::string item;
  std::istringstream in(s);
  while (std::getline(in, item, sep)) {
    const auto b = item.find_first_not_of(" \t");
    if (b == std::string::npos) continue;
    const auto e = item.find_last_not_of(" \t");
    out.push_back(item.substr(b, e - b + 1));
  }
  return out;
}

void read_u64(const char* name, uint64_t& out, std::vector<std::string>& errors) {
  const char* v = env(name);
  if (!v) return;
  char* end = nullptr;
  errno = 0;
  const unsigned long long n = std::strtoull(v, &end, 10);
  if (errno != 0 || end == v || *end != '\0' || v[0] == '-') {
    errors.push_back(std::string(name) + ": expected a non-negative integer, got '" + v + "'");
    return;
  }
  out = n;
}

void read_seconds(const char* name, double& out, std::vector<std::string>& errors) {
  const char* v = env(name);
  if (!v) return;
  char* end = nullptr;
  errno = 0;
  const double d = std::strtod(v, &end);
  if (errno != 0 || end == v || *end != '\0' || !std::isfinite(d) || d < 0) {
    errors.push_back(std::string(name) + ": expected non-negative seconds, got '" + v + "'");
    return;
  }
  out = d;
}

void read_pairs(const char* name, char sep,
                std::vector<std::pair<std::string, std::string>>& out,
                std::vector<std::string>& errors) {
  const char* v = env(name);
  if (!v) return;
  for (const auto& item : split_list(v)) {
    const auto pos = item.find(sep);
    if (pos == std::string::npos || pos == 0 || pos + 1 == item.size()) {
      errors.push_back(std::string(name) + ": malformed entry '" + item + "'");
      continue;
    }
    out.emplace_back(item.substr(0, pos), item.substr(pos + 1));
  }
}

}  // namespace

WardenConfig WardenConfig::from_env() {
  WardenConfig c;

  read_u64("WARDEN_MAX_MEMORY_BYTES", c.max_memory_bytes, c.errors);
  read_u64("WARDEN_MAX_CPU_SECONDS", c.max_cpu_seconds, c.errors);
  read_seconds("WARDEN_TIMEOUT_SECONDS", c.timeout_seconds, c.errors);
  read_seconds("WARDEN_GRACE_SECONDS", c.grace_seconds, c.errors);

  uint64_t recursion = static_cast<uint64_t>(c.max_recursion);
  read_u64("WARDEN_MAX_RECURSION", recursion, c.errors);
  if (recursion > 1000000) {
    c.errors.push_back("WARDEN_MAX_RECURSION: must not exceed 1000000");
  } else {
    c.max_recursion = static_cast<int>(recursion);
  }

  if (const char* v = env("WARDEN_DISABLE_MODULES")) c.disabled_modules = split_list(v);
  if (const char* v = env("WARDEN_ALLOW_NETWORK")) {
    const std::string s = v;
    if (s == "1" || s == "true") c.allow_network = true;
    else if (s == "0" || s == "false") c.allow_network = false;
    else c.errors.push_back("WARDEN_ALLOW_NETWORK: expected 0 or 1, got '" + s + "'");
  }

  read_pairs("WARDEN_EXTENSION_PATHS", '=', c.extension_paths, c.errors);
  read_pairs("WARDEN_CONFLICTS", ':', c.conflicts, c.errors);
  if (const char* v = env("WARDEN_SOLVERS")) c.solvers = split_list(v);

  if (const char* v = env("WARDEN_APP_DIR")) c.app_dir = v;
  if (const char* v = env("WARDEN_SCRATCH_PATH")) c.scratch_path = v;
  if (const char* v = env("WARDEN_LICENSE_FILE")) c.license_file = v;
  if (const char* v = env("WARDEN_LICENSE_ENV")) c.license_env = v;
  if (const char* v = env("WARDEN_RUNTIME_BINARY")) c.runtime_binary = v;
  if (const char* v = env("WARDEN_EVENT_LOG")) c.event_log = v;
  if (const char* v = env("WARDEN_AUDIT_LOG")) c.audit_log = v;

  for (const auto& solver : c.solvers) {
    bool owned = false;
    for (const auto& [provider, path] : c.extension_paths) {
      if (provider == solver) owned = true;
    }
    if (!owned) {
      c.errors.push_back("WARDEN_SOLVERS: '" + solver +
                         "' has no trusted segment in WARDEN_EXTENSION_PATHS");
    }
  }
  return c;
}

ResourceLimits WardenConfig::limits() const {
  ResourceLimits l;
  l.max_address_space_bytes = max_memory_bytes;
  l.max_cpu_seconds = max_cpu_seconds;
  l.max_wall_seconds = timeout_seconds;
  l.max_recursion_depth = max_recursion;
  l.grace_seconds = grace_seconds;
  return l;
}

Policy WardenConfig::build_policy() const {
  Policy p = Policy::defaults(allow_network);
  p.tighten(disabled_modules);
  return p;
}

ExtensionNamespace WardenConfig::build_namespace() const {
  ExtensionNamespace ns;
  for (const auto& [provider, path] : extension_paths) ns.add_trusted(provider, path);
  ns.add_user("app", app_dir);
  ns.set_scratch(scratch_path);
  for (const auto& [a, b] : conflicts) ns.add_conflict(a, b);
  return ns;
}

std::string WardenConfig::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"max_memory_bytes\":" << max_memory_bytes
    << ",\"max_cpu_seconds\":" << max_cpu_seconds
    << ",\"timeout_seconds\":" << timeout_seconds
    << ",\"max_recursion\":" << max_recursion
    << ",\"grace_seconds\":" << grace_seconds
    << ",\"allow_network\":" << (allow_network ? "true" : "false")
    << ",\"app_dir\":\"" << jsonlite::escape(app_dir) << "\""
    << ",\"scratch_path\":\"" << jsonlite::escape(scratch_path) << "\""
    << ",\"runtime_binary\":\"" << jsonlite::escape(runtime_binary) << "\""
    << ",\"solvers\":" << solvers.size()
    << ",\"extension_paths\":" << extension_paths.size()
    << ",\"errors\":" << errors.size()
    << "}";
  return o.str();
}

namespace {
std::once_flag g_config_once;
WardenConfig g_config;
}  // namespace

void init_config(const WardenConfig& config) {
  std::call_once(g_config_once, [&config] { g_config = config; });
}

const WardenConfig& global_config() {
  std::call_once(g_config_once, [] { g_config = WardenConfig::from_env(); });
  return g_config;
}

}  // namespace warden
