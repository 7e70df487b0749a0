#include "Mounts.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <system_error>

#include <wx/log.h>

#ifdef SANDBAR_USE_GIO
#include <gio/gio.h>
#include <gio/gunixmounts.h>
#endif

namespace fs = std::filesystem;

namespace mounts {

namespace {
std::string LabelFor(const fs::path& p) {
  auto label = p.filename().string();
  if (label.empty()) label = p.string();
  return label;
}

std::vector<fs::path> WellKnownBases() {
  std::vector<fs::path> bases{"/media"};
  const char* user = std::getenv("USER");
  if (user && *user) {
    bases.push_back(fs::path("/media") / user);
    bases.push_back(fs::path("/run/media") / user);
  }
  bases.emplace_back("/mnt");
  bases.emplace_back("/Volumes");
  return bases;
}

#ifdef SANDBAR_USE_GIO
std::vector<MountPoint> ListGioMounts() {
  std::vector<MountPoint> out;
  GList* entries = g_unix_mounts_get(nullptr);
  for (GList* l = entries; l; l = l->next) {
    auto* entry = static_cast<GUnixMountEntry*>(l->data);
    const char* mp = g_unix_mount_get_mount_path(entry);
    if (mp && *mp && std::string(mp) != "/" && !g_unix_mount_is_system_internal(entry)) {
      char* name = g_unix_mount_guess_name(entry);
      out.push_back(MountPoint{
          .path = mp,
          .label = (name && *name) ? std::string(name) : LabelFor(fs::path(mp)),
      });
      g_free(name);
    }
    g_unix_mount_free(entry);
  }
  g_list_free(entries);
  return out;
}
#else
std::vector<MountPoint> ListProcMounts() {
  std::vector<MountPoint> out;
  std::ifstream f("/proc/mounts");
  if (!f.is_open()) return out;

  for (const auto& mp : ParseProcMounts(f)) {
    if (!IsRemovableMountPoint(mp)) continue;
    out.push_back(MountPoint{.path = mp, .label = LabelFor(fs::path(mp))});
  }
  return out;
}
#endif
}  // namespace

std::string UnescapeProcMountsField(std::string s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] == '\\' && i + 3 < s.size() && std::isdigit(static_cast<unsigned char>(s[i + 1])) &&
        std::isdigit(static_cast<unsigned char>(s[i + 2])) &&
        std::isdigit(static_cast<unsigned char>(s[i + 3]))) {
      const int v = (s[i + 1] - '0') * 64 + (s[i + 2] - '0') * 8 + (s[i + 3] - '0');
      out.push_back(static_cast<char>(v));
      i += 3;
      continue;
    }
    out.push_back(s[i]);
  }
  return out;
}

std::vector<std::string> ParseProcMounts(std::istream& in) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  std::string dev, mnt, type, opts;
  while (in >> dev >> mnt >> type >> opts) {
    std::string rest;
    std::getline(in, rest);
    const auto mp = UnescapeProcMountsField(mnt);
    if (mp.empty()) continue;
    if (seen.insert(mp).second) out.push_back(mp);
  }
  return out;
}

bool IsRemovableMountPoint(const std::string& mp) {
  if (mp == "/") return false;
  if (mp.rfind("/run/media/", 0) == 0) return true;
  if (mp.rfind("/media/", 0) == 0) return true;
  if (mp.rfind("/mnt/", 0) == 0) return true;
  return false;
}

std::vector<MountPoint> ScanMountBase(const fs::path& base) {
  std::vector<MountPoint> out;
  std::error_code ec;
  if (!fs::is_directory(base, ec)) return out;

  for (fs::directory_iterator it(base, fs::directory_options::skip_permission_denied, ec), end;
       !ec && it != end; it.increment(ec)) {
    std::error_code stEc;
    if (!it->is_directory(stEc) || stEc) continue;
    out.push_back(MountPoint{.path = it->path().string(), .label = LabelFor(it->path())});
  }
  if (ec) wxLogDebug("Stopped scanning %s: %s", base.string(), ec.message());

  std::sort(out.begin(), out.end(),
            [](const MountPoint& a, const MountPoint& b) { return a.path < b.path; });
  return out;
}

std::vector<MountPoint> ListCandidateMounts(const std::vector<std::string>& extraRoots) {
  std::vector<MountPoint> out;
  std::set<std::string> seen;

  const auto add = [&](const MountPoint& m) {
    std::error_code ec;
    const auto canon = fs::canonical(m.path, ec);
    const auto key = ec ? m.path : canon.string();
    if (!seen.insert(key).second) return;
    out.push_back(m);
  };

#ifdef SANDBAR_USE_GIO
  for (const auto& m : ListGioMounts()) add(m);
#else
  for (const auto& m : ListProcMounts()) add(m);
#endif

  const auto bases = WellKnownBases();
  for (const auto& base : bases) {
    for (const auto& m : ScanMountBase(base)) {
      // /media/$USER is itself a base; offer its children instead.
      if (std::find(bases.begin(), bases.end(), fs::path(m.path)) != bases.end()) continue;
      add(m);
    }
  }

  for (const auto& root : extraRoots) {
    if (root.empty()) continue;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      wxLogDebug("Configured root %s is not available", root);
      continue;
    }
    add(MountPoint{.path = root, .label = LabelFor(fs::path(root))});
  }

  wxLogDebug("Found %d candidate mounts", static_cast<int>(out.size()));
  return out;
}

}  // namespace mounts
