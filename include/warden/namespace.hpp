#pragma once

// warden/namespace.hpp - Extension namespace: where importable code may come from.
//
// DESIGN:
//   The module search path is assembled from typed segments instead of a flat
//   list, so a provider's code can be kept away from the segments of
//   providers it conflicts with:
//
//     trusted  - vetted extension providers, configured order
//     user     - application directory, then the writable scratch directory
//     system   - the interpreter's own initial sys.path
//
// INVARIANTS:
//   - search_path() is trusted > user > system, stable for a given config.
//   - resolve() on behalf of provider P never returns a file located inside
//     a segment owned by a provider that conflicts with P, whatever the
//     lookup order and whatever symlinks point there.
//   - validate() rejects configurations where conflicting providers share a
//     physical directory, and where a trusted segment overlaps scratch.
//
//   - Imports made by a provider's modules go through the namespace finder
//     (import_finder.hpp), which calls resolve() with that provider whenever
//     the flat sys.path lookup would land in a conflicting segment.
//
// EXTENSION_POINT: per_provider_module_table
//   Current: sys.modules is process-wide, so the first provider to load a
//   shared name keeps it for the rest of the process.
//   Upgrade path: load provider-private copies under a mangled name and alias
//   them per importer.

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "warden/types.hpp"

namespace warden {

enum class SegmentKind {
  trusted,
  user,
  system,
};

std::string to_string(SegmentKind kind);

struct Segment {
  std::string provider;
  std::string path;
  SegmentKind kind{SegmentKind::user};
};

struct NamespaceValidation {
  bool ok{true};
  ErrorCode error_code{ErrorCode::none};
  std::vector<std::string> errors;
};

struct Resolution {
  bool found{false};
  std::string path;         // file to load: .py, __init__.py or extension .so
  std::string package_dir;  // non-empty when the module is a package
  std::string provider;     // owner of the segment it was found in
  SegmentKind kind{SegmentKind::user};
  bool contained{false};    // canonical path lies inside that segment
  std::string rejected;     // last candidate rejected by the conflict rule
};

class ExtensionNamespace {
 public:
  void add_trusted(const std::string& provider, const std::string& path);
  void add_user(const std::string& provider, const std::string& path);
  void add_system(const std::string& path);
  void set_scratch(const std::string& path);

  void add_conflict(const std::string& a, const std::string& b);
  bool conflicts(const std::string& a, const std::string& b) const;

  NamespaceValidation validate() const;

  // Find `module` (dotted) along the lookup order on behalf of `on_behalf_of`.
  Resolution resolve(const std::string& module, const std::string& on_behalf_of = "") const;

  // Lookup order as sys.path entries.
  std::vector<std::string> search_path() const;
  // Same order without system segments, for PYTHONPATH of a delegated runtime.
  std::vector<std::string> delegate_path() const;

  std::vector<Segment> segments() const;
  bool has_provider(const std::string& provider) const;

  // Owner of the trusted or user segment containing `file`; "" otherwise.
  std::string provider_of(const std::string& file) const;
  // True when `provider` has at least one registered conflict.
  bool has_conflicts(const std::string& provider) const;

 private:
  std::vector<Segment> trusted_;
  std::vector<Segment> user_;
  std::vector<Segment> system_;
  std::string scratch_;
  std::set<std::pair<std::string, std::string>> conflicts_;
};

}  // namespace warden
