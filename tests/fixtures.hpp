#pragma once
#include "FileLister.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>
#include <unistd.h>

// Scratch directory under the system temp dir, removed on destruction.
class TempTree {
public:
  explicit TempTree(const std::string& tag) {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    base_ = std::filesystem::temp_directory_path() /
            ("sandbar_test_" + tag + "_" + std::to_string(::getpid()) + "_" +
             std::to_string(stamp) + "_" + std::to_string(counter++));
    root_ = base_ / "root";
    std::filesystem::create_directories(root_);
  }
  ~TempTree() {
    std::error_code ec;
    // Restore access to anything a test locked down before removing it.
    for (auto it = std::filesystem::recursive_directory_iterator(base_, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
      std::error_code pec;
      if (it->is_directory(pec) && !it->is_symlink(pec))
        std::filesystem::permissions(it->path(), std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, pec);
    }
    std::filesystem::remove_all(base_, ec);
  }
  TempTree(const TempTree&) = delete;
  TempTree& operator=(const TempTree&) = delete;

  const std::filesystem::path& root() const { return root_; }
  // Sibling of root, for link targets that must lie outside it.
  std::filesystem::path outside() const { return base_ / "outside"; }

  std::filesystem::path write(const std::string& rel, std::size_t bytes) const {
    const auto p = root_ / rel;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary);
    f << std::string(bytes, 'x');
    return p;
  }
  std::filesystem::path mkdir(const std::string& rel) const {
    const auto p = root_ / rel;
    std::filesystem::create_directories(p);
    return p;
  }
  void symlink(const std::filesystem::path& target, const std::string& rel) const {
    const auto p = root_ / rel;
    std::filesystem::create_directories(p.parent_path());
    std::filesystem::create_symlink(target, p);
  }
  bool exists(const std::string& rel) const {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(root_ / rel, ec));
  }

private:
  std::filesystem::path base_;
  std::filesystem::path root_;
};

inline std::vector<std::string> relative_paths(const listing::Listing& l) {
  std::vector<std::string> out;
  for (const auto& e : l.entries) out.push_back(e.relativePath);
  return out;
}

inline bool contains(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

// Permission bits do not stop root, so permission tests are skipped there.
inline bool running_as_root() { return ::geteuid() == 0; }
