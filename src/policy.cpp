#include "warden/policy.hpp"

#include <algorithm>
#include <sstream>

#include "warden/jsonlite.hpp"

namespace warden {

std::string to_string(CapabilityKind kind) {
  switch (kind) {
    case CapabilityKind::module:       return "module";
    case CapabilityKind::builtin:      return "builtin";
    case CapabilityKind::member:       return "member";
    case CapabilityKind::os_operation: return "os_operation";
  }
  return "unknown";
}

std::string to_string(DenialTier tier) {
  switch (tier) {
    case DenialTier::allowed:            return "allowed";
    case DenialTier::hard_denied:        return "hard_denied";
    case DenialTier::function_denied:    return "function_denied";
    case DenialTier::selectively_denied: return "selectively_denied";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Default table
// ---------------------------------------------------------------------------

namespace {

struct TableEntry {
  CapabilityKind kind;
  const char*    name;  // members are "module.member"
};

static const TableEntry kDefaultTable[] = {
  // Import targets that are blocked outright.
  { CapabilityKind::module, "os" },
  { CapabilityKind::module, "sys" },
  { CapabilityKind::module, "subprocess" },
  { CapabilityKind::module, "importlib" },
  { CapabilityKind::module, "socket" },
  { CapabilityKind::module, "urllib" },
  { CapabilityKind::module, "requests" },
  { CapabilityKind::module, "ftplib" },
  { CapabilityKind::module, "smtplib" },
  { CapabilityKind::module, "poplib" },
  { CapabilityKind::module, "imaplib" },
  { CapabilityKind::module, "nntplib" },
  { CapabilityKind::module, "telnetlib" },
  // Aliases and side doors to the above.
  { CapabilityKind::module, "builtins" },
  { CapabilityKind::module, "posix" },
  { CapabilityKind::module, "nt" },
  { CapabilityKind::module, "_posixsubprocess" },
  { CapabilityKind::module, "_socket" },
  { CapabilityKind::module, "_io" },
  { CapabilityKind::module, "_signal" },
  { CapabilityKind::module, "ctypes" },
  { CapabilityKind::module, "_ctypes" },
  { CapabilityKind::module, "pty" },
  { CapabilityKind::module, "multiprocessing" },
  // Modules that evaluate code or rebuild objects with the real builtins.
  { CapabilityKind::module, "code" },
  { CapabilityKind::module, "codeop" },
  { CapabilityKind::module, "runpy" },
  { CapabilityKind::module, "pickle" },
  { CapabilityKind::module, "_pickle" },
  { CapabilityKind::module, "shelve" },
  { CapabilityKind::module, "marshal" },
  { CapabilityKind::module, "gc" },
  { CapabilityKind::module, "_warden" },
  // Standard modules that compile and run strings they are handed.
  { CapabilityKind::module, "timeit" },
  { CapabilityKind::module, "doctest" },
  { CapabilityKind::module, "pdb" },
  { CapabilityKind::module, "bdb" },
  { CapabilityKind::module, "profile" },
  { CapabilityKind::module, "cProfile" },
  { CapabilityKind::module, "trace" },

  // Builtins replaced by failing wrappers.
  { CapabilityKind::builtin, "exec" },
  { CapabilityKind::builtin, "eval" },
  { CapabilityKind::builtin, "compile" },
  { CapabilityKind::builtin, "open" },
  { CapabilityKind::builtin, "input" },
  { CapabilityKind::builtin, "breakpoint" },

  // Audit events: process spawning and process control.
  { CapabilityKind::os_operation, "os.system" },
  { CapabilityKind::os_operation, "os.exec" },
  { CapabilityKind::os_operation, "os.posix_spawn" },
  { CapabilityKind::os_operation, "os.spawn" },
  { CapabilityKind::os_operation, "os.fork" },
  { CapabilityKind::os_operation, "os.forkpty" },
  { CapabilityKind::os_operation, "os.kill" },
  { CapabilityKind::os_operation, "os.killpg" },
  { CapabilityKind::os_operation, "os.startfile" },
  { CapabilityKind::os_operation, "subprocess.Popen" },
  { CapabilityKind::os_operation, "pty.spawn" },
  { CapabilityKind::os_operation, "signal.pthread_kill" },

  // Audit events: filesystem mutation. "open.write" stands for an `open`
  // event whose mode or flags write, append, create or truncate.
  { CapabilityKind::os_operation, kOpenForWrite },
  { CapabilityKind::os_operation, "os.remove" },
  { CapabilityKind::os_operation, "os.rename" },
  { CapabilityKind::os_operation, "os.rmdir" },
  { CapabilityKind::os_operation, "os.mkdir" },
  { CapabilityKind::os_operation, "os.chmod" },
  { CapabilityKind::os_operation, "os.chown" },
  { CapabilityKind::os_operation, "os.truncate" },
  { CapabilityKind::os_operation, "os.symlink" },
  { CapabilityKind::os_operation, "os.link" },
  { CapabilityKind::os_operation, "os.utime" },
  { CapabilityKind::os_operation, "shutil.rmtree" },
  { CapabilityKind::os_operation, "shutil.copyfile" },
  { CapabilityKind::os_operation, "shutil.copytree" },
  { CapabilityKind::os_operation, "shutil.move" },
  { CapabilityKind::os_operation, "shutil.chown" },

  // Members of importable modules that could undo the governor or hand out
  // raw file handles.
  { CapabilityKind::member, "signal.alarm" },
  { CapabilityKind::member, "signal.setitimer" },
  { CapabilityKind::member, "signal.signal" },
  { CapabilityKind::member, "signal.raise_signal" },
  { CapabilityKind::member, "signal.siginterrupt" },
  { CapabilityKind::member, "signal.pthread_sigmask" },
  { CapabilityKind::member, "signal.set_wakeup_fd" },
  { CapabilityKind::member, "resource.setrlimit" },
  { CapabilityKind::member, "resource.prlimit" },
  { CapabilityKind::member, "io.open" },
  { CapabilityKind::member, "io.open_code" },
  { CapabilityKind::member, "io.FileIO" },
  { CapabilityKind::member, "codecs.open" },
};

static const char* const kNetworkOperations[] = {
  "socket.connect",
  "socket.bind",
  "socket.sendto",
  "socket.sendmsg",
  "socket.getaddrinfo",
  "socket.gethostbyname",
  "socket.gethostbyaddr",
};

// Names in a tighten() list that are builtins rather than modules.
static const char* const kBuiltinNames[] = {
  "exec", "eval", "compile", "open", "input", "breakpoint", "help",
  "file", "raw_input", "globals", "locals", "vars",
  "getattr", "setattr", "delattr",
};

bool is_builtin_name(const std::string& name) {
  for (const char* b : kBuiltinNames) {
    if (name == b) return true;
  }
  return false;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

}  // namespace

Policy Policy::defaults(bool allow_network) {
  Policy p;
  for (const auto& entry : kDefaultTable) {
    const std::string name = entry.name;
    switch (entry.kind) {
      case CapabilityKind::module:       p.deny_import(name); break;
      case CapabilityKind::builtin:      p.deny_builtin(name); break;
      case CapabilityKind::os_operation: p.deny_operation(name); break;
      case CapabilityKind::member: {
        const auto dot = name.rfind('.');
        p.deny_member(name.substr(0, dot), name.substr(dot + 1));
        break;
      }
    }
  }
  if (!allow_network) {
    for (const char* op : kNetworkOperations) p.deny_operation(op);
  }
  return p;
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

bool Policy::registered_elsewhere(const CapabilityName& capability,
                                  DenialTier target) const {
  const Decision current = is_denied(capability);
  return current.denied() && current.tier != target;
}

bool Policy::deny_import(const std::string& module) {
  if (module.empty()) return false;
  if (members_.count(module) != 0) {
    registration_errors_.push_back("module '" + module +
                                   "' has selectively denied members; "
                                   "cannot also be hard_denied");
    return false;
  }
  modules_.insert(module);
  return true;
}

bool Policy::deny_builtin(const std::string& name) {
  if (name.empty()) return false;
  if (name == "__import__") {
    registration_errors_.push_back(
        "builtin '__import__' is the import gate itself and cannot be stubbed");
    return false;
  }
  builtins_.insert(name);
  return true;
}

bool Policy::deny_operation(const std::string& event) {
  if (event.empty()) return false;
  operations_.insert(event);
  return true;
}

bool Policy::deny_member(const std::string& module, const std::string& member) {
  if (module.empty() || member.empty()) return false;
  const auto capability = CapabilityName::member(module, member);
  if (registered_elsewhere(capability, DenialTier::selectively_denied)) {
    registration_errors_.push_back("member '" + capability.name +
                                   "' belongs to a hard_denied module");
    return false;
  }
  members_[module].insert(member);
  return true;
}

void Policy::tighten(const std::vector<std::string>& names) {
  for (const auto& raw : names) {
    const std::string name = trim(raw);
    if (name.empty() || name == "__import__") continue;
    if (is_builtin_name(name)) {
      deny_builtin(name);
      continue;
    }
    // Promotion: a whole-module denial supersedes its member stubs.
    members_.erase(name);
    deny_import(name);
  }
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

std::optional<std::string> Policy::is_import_denied(std::string_view dotted) const {
  if (dotted.empty()) return std::nullopt;
  std::size_t pos = 0;
  while (true) {
    const std::size_t dot = dotted.find('.', pos);
    const std::string_view prefix = dotted.substr(0, dot);
    if (modules_.find(prefix) != modules_.end()) {
      return std::string(prefix);
    }
    if (dot == std::string_view::npos) break;
    pos = dot + 1;
  }
  return std::nullopt;
}

bool Policy::is_operation_denied(std::string_view event) const {
  return operations_.find(event) != operations_.end();
}

Decision Policy::is_denied(const CapabilityName& capability) const {
  Decision d;
  switch (capability.kind) {
    case CapabilityKind::module:
      if (is_import_denied(capability.name)) d.tier = DenialTier::hard_denied;
      break;
    case CapabilityKind::builtin:
      if (builtins_.find(capability.name) != builtins_.end())
        d.tier = DenialTier::function_denied;
      break;
    case CapabilityKind::os_operation:
      if (is_operation_denied(capability.name)) d.tier = DenialTier::function_denied;
      break;
    case CapabilityKind::member: {
      const auto dot = capability.name.rfind('.');
      if (dot == std::string::npos) break;
      const std::string module = capability.name.substr(0, dot);
      if (is_import_denied(module)) {
        d.tier = DenialTier::hard_denied;
        break;
      }
      const auto it = members_.find(module);
      if (it != members_.end() && it->second.count(capability.name.substr(dot + 1)) != 0) {
        d.tier = DenialTier::selectively_denied;
      }
      break;
    }
  }
  return d;
}

std::vector<std::string> Policy::denied_members(const std::string& module) const {
  const auto it = members_.find(module);
  if (it == members_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

bool Policy::has_selective_entries(const std::string& module) const {
  return members_.count(module) != 0;
}

// ---------------------------------------------------------------------------
// lint
// ---------------------------------------------------------------------------
// Errors: registration conflicts, and selective entries shadowed by a
// hard_denied prefix (e.g. members of "xml.etree" while "xml" is denied).
// Warnings: os_operation names that cannot match an audit event.
PolicyLint Policy::lint() const {
  PolicyLint result;
  result.errors = registration_errors_;

  for (const auto& [module, members] : members_) {
    if (const auto prefix = is_import_denied(module)) {
      std::ostringstream ss;
      ss << "selectively denied module '" << module
         << "' is unreachable: prefix '" << *prefix << "' is hard_denied";
      result.errors.push_back(ss.str());
    }
    if (members.empty()) {
      result.warnings.push_back("module '" + module + "' has an empty member list");
    }
  }

  for (const auto& op : operations_) {
    if (op.find('.') == std::string::npos) {
      result.warnings.push_back("os_operation '" + op +
                                "' is not a dotted audit event name");
    }
  }

  result.valid = result.errors.empty();
  return result;
}

std::string Policy::to_json() const {
  auto list = [](const auto& items) {
    std::string out = "[";
    bool first = true;
    for (const auto& item : items) {
      if (!first) out += ",";
      first = false;
      out += "\"" + jsonlite::escape(item) + "\"";
    }
    return out + "]";
  };

  std::ostringstream o;
  o << "{"
    << "\"hard_denied\":" << list(modules_)
    << ",\"function_denied\":{\"builtins\":" << list(builtins_)
    << ",\"os_operations\":" << list(operations_) << "}"
    << ",\"selectively_denied\":{";
  bool first = true;
  for (const auto& [module, members] : members_) {
    if (!first) o << ",";
    first = false;
    o << "\"" << jsonlite::escape(module) << "\":" << list(members);
  }
  o << "}}";
  return o.str();
}

}  // namespace warden
