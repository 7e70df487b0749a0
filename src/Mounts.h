#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace mounts {

struct MountPoint {
  std::string path;
  std::string label;
};

// Snapshot of removable volumes and well-known mount directories, followed by
// extraRoots that currently exist. Never fails; sources that cannot be read
// contribute nothing.
std::vector<MountPoint> ListCandidateMounts(const std::vector<std::string>& extraRoots = {});

// /proc/mounts escapes spaces and tabs using octal sequences (e.g. \040).
std::string UnescapeProcMountsField(std::string s);
// Mount point column of a mounts(5) table.
std::vector<std::string> ParseProcMounts(std::istream& in);
bool IsRemovableMountPoint(const std::string& mp);

// Immediate subdirectories of base, labelled by name.
std::vector<MountPoint> ScanMountBase(const std::filesystem::path& base);

}  // namespace mounts
