#include "FileLister.h"

#include "Sandbox.h"

#include <algorithm>
#include <system_error>
#include <utility>

#include <wx/log.h>

namespace fs = std::filesystem;

namespace listing {

namespace {
std::string JoinRel(const std::string& dir, const std::string& name) {
  return dir.empty() ? name : dir + "/" + name;
}

void Skip(Listing& out, const std::string& rel, const std::error_code& ec, const char* what) {
  wxLogDebug("Skipping %s (%s): %s", rel.empty() ? std::string(".") : rel, what, ec.message());
  out.skipped.push_back(SkippedDir{
      .relativePath = rel,
      .kind = ErrorKindFromCode(ec),
      .message = wxString::FromUTF8(ec.message()),
  });
}

// A symlink is listed as a file only when it resolves to a regular file that
// is still inside root.
bool LinkedFileInside(const fs::path& rootCanon, const fs::path& link) {
  std::error_code ec;
  const auto target = fs::canonical(link, ec);
  if (ec) return false;  // dangling or looping
  if (!sandbox::IsWithin(rootCanon, target)) return false;
  return fs::is_regular_file(target, ec) && !ec;
}
}  // namespace

bool IsHiddenName(const std::string& name) { return !name.empty() && name.front() == '.'; }

Listing ListFiles(const fs::path& root, bool showHidden) {
  Listing out;
  fs::path rootCanon;
  out.status = sandbox::CanonicalRoot(root, &rootCanon);
  if (!out.status.ok) return out;

  std::vector<std::pair<fs::path, std::string>> stack;
  stack.emplace_back(rootCanon, std::string{});

  while (!stack.empty()) {
    auto [dir, relDir] = std::move(stack.back());
    stack.pop_back();

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
      if (relDir.empty()) {
        out.status = FromErrorCode(ec, wxString::Format("Unable to read %s", rootCanon.string()));
        out.entries.clear();
        return out;
      }
      Skip(out, relDir, ec, "unreadable folder");
      continue;
    }

    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
      const auto name = it->path().filename().string();
      if (!showHidden && IsHiddenName(name)) continue;
      const auto rel = JoinRel(relDir, name);

      std::error_code stEc;
      const auto st = it->symlink_status(stEc);
      if (stEc) {
        Skip(out, rel, stEc, "unreadable entry");
        continue;
      }

      if (fs::is_directory(st)) {
        stack.emplace_back(it->path(), rel);
        continue;
      }

      if (fs::is_symlink(st)) {
        if (!LinkedFileInside(rootCanon, it->path())) {
          wxLogDebug("Not following link %s", rel);
          continue;
        }
      } else if (!fs::is_regular_file(st)) {
        continue;  // sockets, fifos, devices
      }

      std::error_code sizeEc;
      const auto size = fs::file_size(it->path(), sizeEc);
      if (sizeEc) {
        Skip(out, rel, sizeEc, "size unavailable");
        continue;
      }

      out.entries.push_back(FileEntry{
          .path = it->path().string(),
          .relativePath = rel,
          .size = static_cast<std::uint64_t>(size),
      });
    }

    if (ec) Skip(out, relDir, ec, "listing interrupted");
  }

  std::sort(out.entries.begin(), out.entries.end(),
            [](const FileEntry& a, const FileEntry& b) { return a.relativePath < b.relativePath; });

  wxLogVerbose("Listed %d files under %s (%d skipped)", static_cast<int>(out.entries.size()),
               rootCanon.string(), static_cast<int>(out.skipped.size()));
  out.status = Ok();
  return out;
}

}  // namespace listing
