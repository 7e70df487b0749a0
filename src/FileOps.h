#pragma once

#include "util.h"

#include <filesystem>
#include <string_view>

// Mutations below a user-selected root. Every path argument is resolved via
// sandbox::Resolve before anything on disk changes, and relative paths are
// '/'-separated on every platform.
namespace fileops {

// Host path of an existing file below root, for handing to other programs.
OpResult ResolveFile(const std::filesystem::path& root,
                     std::string_view relativePath,
                     std::filesystem::path* out);

// Renames a file within its folder; newName must be a single component.
OpResult Rename(const std::filesystem::path& root,
                std::string_view relativePath,
                std::string_view newName);

// Permanently removes a file. Folders are refused.
OpResult Delete(const std::filesystem::path& root, std::string_view relativePath);

// Moves a file into toRelativeDir (empty means root), keeping its name.
// With createDir, a missing destination folder chain is created first; folders
// created before a later failure are left in place.
OpResult Move(const std::filesystem::path& root,
              std::string_view fromRelative,
              std::string_view toRelativeDir,
              bool createDir);

// Creates relativeDir and any missing parents. Fails if it already exists.
OpResult CreateFolder(const std::filesystem::path& root, std::string_view relativeDir);

}  // namespace fileops
