#pragma once

// warden/policy.hpp - Static capability deny table.
//
// DESIGN:
//   A capability is a typed name: an import target, a builtin function, a
//   member of an otherwise importable module, or a runtime operation reported
//   through the interpreter's audit hooks. The Policy maps each registered
//   capability to exactly one denial tier:
//
//     hard_denied         module        import blocked for every dotted prefix
//     function_denied     builtin       builtin replaced by a failing wrapper
//                         os_operation  audit event vetoed
//     selectively_denied  member        module importable, member stubbed
//
//   The tier is decided by the table an entry is registered in, never by a
//   lookup order, so is_denied() is a pure function of the table.
//
// INVARIANTS:
//   - A capability appears in at most one tier.
//   - A selectively_denied member never belongs to a hard_denied module.
//   - The table is built once at process entry and only ever tightened:
//     there is no API that removes a denial.
//   - Unregistered names are allowed. This is a deny-list posture; new
//     dangerous capabilities in the host runtime stay allowed until listed.
//
// EXTENSION_POINT: allow_list_posture
//   Current: deny-list, unknown -> allowed.
//   Upgrade path: add Policy::Posture::allow_list where unknown module and
//   os_operation names are denied. lint() must then warn on every module the
//   trusted extension segments import transitively.

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace warden {

enum class CapabilityKind {
  module,
  builtin,
  member,
  os_operation,
};

std::string to_string(CapabilityKind kind);

// os_operation name for an `open` audit event that writes, appends, creates
// or truncates. The interpreter raises plain "open" for every mode.
inline constexpr const char kOpenForWrite[] = "open.write";

struct CapabilityName {
  CapabilityKind kind{CapabilityKind::module};
  std::string name;  // "socket", "eval", "signal.alarm", "subprocess.Popen"

  static CapabilityName module(std::string n) { return {CapabilityKind::module, std::move(n)}; }
  static CapabilityName builtin(std::string n) { return {CapabilityKind::builtin, std::move(n)}; }
  static CapabilityName member(const std::string& module, const std::string& member) {
    return {CapabilityKind::member, module + "." + member};
  }
  static CapabilityName operation(std::string n) { return {CapabilityKind::os_operation, std::move(n)}; }

  bool operator<(const CapabilityName& o) const {
    return kind != o.kind ? kind < o.kind : name < o.name;
  }
  bool operator==(const CapabilityName& o) const { return kind == o.kind && name == o.name; }
};

enum class DenialTier {
  allowed,
  hard_denied,
  function_denied,
  selectively_denied,
};

std::string to_string(DenialTier tier);

struct Decision {
  DenialTier tier{DenialTier::allowed};
  bool denied() const { return tier != DenialTier::allowed; }
};

struct PolicyLint {
  bool valid{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

class Policy {
 public:
  // Empty table: everything allowed.
  Policy() = default;

  // The built-in table. allow_network=false adds the socket operations.
  static Policy defaults(bool allow_network = false);

  // Registration. Each returns false (and records a lint error) when the
  // capability is already registered in another tier or has the wrong kind.
  bool deny_import(const std::string& module);
  bool deny_builtin(const std::string& name);
  bool deny_operation(const std::string& event);
  bool deny_member(const std::string& module, const std::string& member);

  // Tightening from configuration: builtin names go to function_denied, any
  // other name becomes hard_denied. A module that had selective entries is
  // promoted to hard_denied and its member entries are dropped.
  void tighten(const std::vector<std::string>& names);

  Decision is_denied(const CapabilityName& capability) const;

  // Returns the first dotted prefix of `dotted_module` that is hard_denied.
  std::optional<std::string> is_import_denied(std::string_view dotted_module) const;

  // Fast path for the audit hook: no allocation per event.
  bool is_operation_denied(std::string_view event) const;

  // Member names (without module prefix) denied for `module`.
  std::vector<std::string> denied_members(const std::string& module) const;
  bool has_selective_entries(const std::string& module) const;

  const std::set<std::string, std::less<>>& denied_builtins() const { return builtins_; }

  PolicyLint lint() const;
  std::string to_json() const;

 private:
  bool registered_elsewhere(const CapabilityName& capability, DenialTier target) const;

  std::set<std::string, std::less<>> modules_;
  std::set<std::string, std::less<>> builtins_;
  std::set<std::string, std::less<>> operations_;
  std::map<std::string, std::set<std::string>> members_;  // module -> members
  std::vector<std::string> registration_errors_;
};

}  // namespace warden
