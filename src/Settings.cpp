#include "Settings.h"

#include <wx/config.h>

namespace settings {

namespace {
constexpr const char* kExtraRootsKey = "/mounts/extra";
constexpr const char* kShowHiddenKey = "/view/showHidden";
constexpr const char* kLastRootKey = "/view/lastRoot";

std::vector<std::string> Split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == delim) {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

std::string Join(const std::vector<std::string>& parts, char delim) {
  std::string out;
  for (size_t i = 0; i < parts.size(); i++) {
    if (i) out.push_back(delim);
    out += parts[i];
  }
  return out;
}
}  // namespace

Settings LoadFrom(wxConfigBase& cfg) {
  Settings s;

  wxString extra;
  if (cfg.Read(kExtraRootsKey, &extra) && !extra.empty()) {
    s.extraRoots = Split(extra.utf8_string(), ';');
  }

  bool showHidden = false;
  if (cfg.Read(kShowHiddenKey, &showHidden)) s.showHidden = showHidden;

  wxString lastRoot;
  if (cfg.Read(kLastRootKey, &lastRoot)) s.lastRoot = lastRoot.utf8_string();

  return s;
}

void SaveTo(wxConfigBase& cfg, const Settings& s) {
  cfg.Write(kExtraRootsKey, wxString::FromUTF8(Join(s.extraRoots, ';')));
  cfg.Write(kShowHiddenKey, s.showHidden);
  cfg.Write(kLastRootKey, wxString::FromUTF8(s.lastRoot));
  cfg.Flush();
}

Settings Load() {
  wxConfig cfg("Sandbar");
  return LoadFrom(cfg);
}

void Save(const Settings& s) {
  wxConfig cfg("Sandbar");
  SaveTo(cfg, s);
}

}  // namespace settings
