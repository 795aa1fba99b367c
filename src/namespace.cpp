#include "warden/namespace.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace warden {

std::string to_string(SegmentKind kind) {
  switch (kind) {
    case SegmentKind::trusted: return "trusted";
    case SegmentKind::user:    return "user";
    case SegmentKind::system:  return "system";
  }
  return "";
}

namespace {

// Canonical form for comparison. Paths that do not exist yet still compare
// by their lexically normalized absolute form.
fs::path canonical_or_normal(const fs::path& p) {
  std::error_code ec;
  fs::path out = fs::weakly_canonical(p, ec);
  if (ec) {
    out = fs::absolute(p, ec).lexically_normal();
  }
  if (out.filename().empty() && out.has_relative_path()) out = out.parent_path();
  return out;
}

// True when `path` equals `root` or lies below it.
bool within(const fs::path& path, const fs::path& root) {
  auto [root_end, ignored] = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
  (void)ignored;
  return root_end == root.end();
}

bool overlaps(const fs::path& a, const fs::path& b) {
  return within(a, b) || within(b, a);
}

std::vector<std::string> split_dotted(const std::string& module) {
  std::vector<std::string> parts;
  std::string part;
  std::istringstream in(module);
  while (std::getline(in, part, '.')) parts.push_back(part);
  return parts;
}

// Candidate file for `name` directly inside `dir`: package, source module or
// extension module, in that order.
struct Candidate {
  fs::path file;
  fs::path package_dir;
};

bool find_candidate(const fs::path& dir, const std::string& name, Candidate& out) {
  std::error_code ec;
  const fs::path pkg = dir / name;
  if (fs::is_regular_file(pkg / "__init__.py", ec)) {
    out.file = pkg / "__init__.py";
    out.package_dir = pkg;
    return true;
  }
  if (fs::is_regular_file(dir / (name + ".py"), ec)) {
    out.file = dir / (name + ".py");
    return true;
  }
  if (!fs::is_directory(dir, ec)) return false;
  // mod.so, mod.abi3.so, mod.cpython-311-x86_64-linux-gnu.so
  std::vector<fs::path> shared;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    const std::string fname = entry.path().filename().string();
    if (fname.size() > name.size() + 3 && fname.compare(0, name.size() + 1, name + ".") == 0 &&
        fname.compare(fname.size() - 3, 3, ".so") == 0) {
      shared.push_back(entry.path());
    }
  }
  if (shared.empty()) return false;
  std::sort(shared.begin(), shared.end());
  out.file = shared.front();
  return true;
}

}  // namespace

void ExtensionNamespace::add_trusted(const std::string& provider, const std::string& path) {
  if (path.empty()) return;
  trusted_.push_back({provider, path, SegmentKind::trusted});
}

void ExtensionNamespace::add_user(const std::string& provider, const std::string& path) {
  if (path.empty()) return;
  user_.push_back({provider, path, SegmentKind::user});
}

void ExtensionNamespace::add_system(const std::string& path) {
  if (path.empty()) return;
  for (const auto& s : system_) {
    if (s.path == path) return;
  }
  system_.push_back({"", path, SegmentKind::system});
}

void ExtensionNamespace::set_scratch(const std::string& path) {
  scratch_ = path;
  if (!path.empty()) user_.push_back({"scratch", path, SegmentKind::user});
}

void ExtensionNamespace::add_conflict(const std::string& a, const std::string& b) {
  if (a.empty() || b.empty() || a == b) return;
  conflicts_.insert(std::minmax(a, b));
}

bool ExtensionNamespace::conflicts(const std::string& a, const std::string& b) const {
  if (a.empty() || b.empty()) return false;
  return conflicts_.count(std::minmax(a, b)) != 0;
}

std::vector<Segment> ExtensionNamespace::segments() const {
  std::vector<Segment> out;
  out.reserve(trusted_.size() + user_.size() + system_.size());
  out.insert(out.end(), trusted_.begin(), trusted_.end());
  out.insert(out.end(), user_.begin(), user_.end());
  out.insert(out.end(), system_.begin(), system_.end());
  return out;
}

bool ExtensionNamespace::has_provider(const std::string& provider) const {
  for (const auto& s : trusted_) {
    if (s.provider == provider) return true;
  }
  return false;
}

std::string ExtensionNamespace::provider_of(const std::string& file) const {
  if (file.empty()) return {};
  const fs::path real = canonical_or_normal(file);
  for (const auto* group : {&trusted_, &user_}) {
    for (const auto& s : *group) {
      if (within(real, canonical_or_normal(s.path))) return s.provider;
    }
  }
  return {};
}

bool ExtensionNamespace::has_conflicts(const std::string& provider) const {
  for (const auto& [a, b] : conflicts_) {
    if (a == provider || b == provider) return true;
  }
  return false;
}

NamespaceValidation ExtensionNamespace::validate() const {
  NamespaceValidation v;
  const auto all = segments();

  for (size_t i = 0; i < all.size(); ++i) {
    for (size_t j = i + 1; j < all.size(); ++j) {
      if (!conflicts(all[i].provider, all[j].provider)) continue;
      if (overlaps(canonical_or_normal(all[i].path), canonical_or_normal(all[j].path))) {
        v.errors.push_back("conflicting providers '" + all[i].provider + "' and '" +
                           all[j].provider + "' share segment " + all[i].path);
      }
    }
  }

  if (!scratch_.empty()) {
    const fs::path scratch = canonical_or_normal(scratch_);
    for (const auto& t : trusted_) {
      if (overlaps(canonical_or_normal(t.path), scratch)) {
        v.errors.push_back("trusted segment '" + t.provider + "' (" + t.path +
                           ") overlaps scratch " + scratch_);
      }
    }
  }

  v.ok = v.errors.empty();
  if (!v.ok) v.error_code = ErrorCode::namespace_conflict;
  return v;
}

Resolution ExtensionNamespace::resolve(const std::string& module,
                                       const std::string& on_behalf_of) const {
  Resolution res;
  const auto parts = split_dotted(module);
  if (parts.empty()) return res;

  const auto all = segments();

  // Roots a resolved file must stay out of.
  std::vector<fs::path> forbidden;
  for (const auto& s : all) {
    if (conflicts(s.provider, on_behalf_of)) forbidden.push_back(canonical_or_normal(s.path));
  }

  for (const auto& seg : all) {
    if (conflicts(seg.provider, on_behalf_of)) continue;

    std::error_code ec;
    fs::path dir = seg.path;
    bool parents_ok = true;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
      dir /= parts[i];
      if (!fs::is_directory(dir, ec)) {
        parents_ok = false;
        break;
      }
    }
    if (!parents_ok) continue;

    Candidate cand;
    if (!find_candidate(dir, parts.back(), cand)) continue;

    const fs::path real = canonical_or_normal(cand.file);
    const bool escapes = std::any_of(forbidden.begin(), forbidden.end(),
                                     [&](const fs::path& root) { return within(real, root); });
    if (escapes) {
      res.rejected = cand.file.string();
      continue;
    }

    res.found = true;
    res.path = cand.file.string();
    res.package_dir = cand.package_dir.string();
    res.provider = seg.provider;
    res.kind = seg.kind;
    res.contained = within(real, canonical_or_normal(seg.path));
    return res;
  }
  return res;
}

std::vector<std::string> ExtensionNamespace::search_path() const {
  std::vector<std::string> out;
  for (const auto& s : segments()) out.push_back(s.path);
  return out;
}

std::vector<std::string> ExtensionNamespace::delegate_path() const {
  std::vector<std::string> out;
  for (const auto& s : segments()) {
    if (s.kind != SegmentKind::system) out.push_back(s.path);
  }
  return out;
}

}  // namespace warden
