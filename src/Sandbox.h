#pragma once

#include "util.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// Confines user-supplied relative paths to a root directory. Every function
// here is stateless; the root is passed on each call.
namespace sandbox {

struct Resolved {
  std::filesystem::path root;  // canonical root
  std::filesystem::path path;  // root joined with the validated segments
  bool exists{false};          // something (file, dir, link) was at path when resolved
};

// Lexical checks only; never touches the filesystem.
OpResult ValidateRelative(std::string_view relative);
// Checks a single path component such as a rename target.
OpResult ValidateName(std::string_view name);

// Non-empty segments of an already validated relative path, "." dropped.
std::vector<std::string> SplitRelative(std::string_view relative);
std::string JoinRelative(const std::vector<std::string>& segments);

// True when candidate equals root or lies below it, comparing whole components.
// Both paths must already be canonical.
bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate);

// Absolute path with every link followed, including dangling ones; missing
// components are appended lexically. p must be absolute.
OpResult Canonicalize(const std::filesystem::path& p, std::filesystem::path* out);

OpResult CanonicalRoot(const std::filesystem::path& root, std::filesystem::path* out);

OpResult Resolve(const std::filesystem::path& root, std::string_view relative, Resolved* out);

}  // namespace sandbox
