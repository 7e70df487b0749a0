#pragma once

#include <string>
#include <vector>

class wxConfigBase;

namespace settings {

struct Settings {
  // Folders offered as device candidates in addition to discovered mounts.
  std::vector<std::string> extraRoots;
  bool showHidden{false};
  std::string lastRoot;
};

Settings LoadFrom(wxConfigBase& cfg);
void SaveTo(wxConfigBase& cfg, const Settings& s);

// Per-user application config ("Sandbar").
Settings Load();
void Save(const Settings& s);

}  // namespace settings
