#pragma once

#include "util.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace listing {

struct FileEntry {
  std::string path;          // host-native absolute path
  std::string relativePath;  // '/'-separated, relative to the listed root
  std::uint64_t size{0};
};

// A subtree (or single file) the walk could not read.
struct SkippedDir {
  std::string relativePath;
  ErrorKind kind{ErrorKind::IOError};
  wxString message;
};

struct Listing {
  OpResult status;
  std::vector<FileEntry> entries;
  std::vector<SkippedDir> skipped;
};

bool IsHiddenName(const std::string& name);

// Every regular file below root, sorted by relativePath. Directory links are
// never followed; file links are listed only when they point inside root.
// Unreadable subdirectories land in Listing::skipped without failing the call.
Listing ListFiles(const std::filesystem::path& root, bool showHidden);

}  // namespace listing
