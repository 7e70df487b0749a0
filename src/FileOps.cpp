#include "FileOps.h"

#include "Sandbox.h"

#include <string>
#include <system_error>

#include <wx/log.h>

namespace fs = std::filesystem;

namespace fileops {

namespace {
wxString Quoted(std::string_view rel) {
  return "\"" + wxString::FromUTF8(std::string(rel)) + "\"";
}

// Regular files and links to them qualify; a dangling link is treated as a file.
OpResult RequireFile(const sandbox::Resolved& r, std::string_view rel) {
  if (!r.exists) {
    return Fail(ErrorKind::NotFound, wxString::Format("%s does not exist.", Quoted(rel)));
  }
  std::error_code ec;
  const auto st = fs::status(r.path, ec);
  if (ec) {
    if (ErrorKindFromCode(ec) == ErrorKind::NotFound) return Ok();
    return FromErrorCode(ec, wxString::Format("Unable to inspect %s", Quoted(rel)));
  }
  if (fs::is_directory(st)) {
    return Fail(ErrorKind::InvalidArgument,
                wxString::Format("%s is a folder; only files can be used here.", Quoted(rel)));
  }
  if (!fs::is_regular_file(st)) {
    return Fail(ErrorKind::InvalidArgument,
                wxString::Format("%s is not a regular file.", Quoted(rel)));
  }
  return Ok();
}

OpResult RequireAbsent(const sandbox::Resolved& r, const std::string& rel) {
  if (!r.exists) return Ok();
  return Fail(ErrorKind::AlreadyExists, wxString::Format("%s already exists.", Quoted(rel)));
}

OpResult RequireFolder(const sandbox::Resolved& r, std::string_view rel) {
  std::error_code ec;
  const auto st = fs::status(r.path, ec);
  if (ec && ErrorKindFromCode(ec) != ErrorKind::NotFound) {
    return FromErrorCode(ec, wxString::Format("Unable to inspect %s", Quoted(rel)));
  }
  if (ec || !fs::is_directory(st)) {
    return Fail(ErrorKind::InvalidArgument, wxString::Format("%s is not a folder.", Quoted(rel)));
  }
  return Ok();
}

// A relative link target is re-anchored by a move. Refuse moves that would
// leave the link pointing outside root.
OpResult RequireLinkStaysInside(const sandbox::Resolved& src,
                                const fs::path& destDir,
                                std::string_view rel) {
  std::error_code ec;
  const auto st = fs::symlink_status(src.path, ec);
  if (ec) return FromErrorCode(ec, wxString::Format("Unable to inspect %s", Quoted(rel)));
  if (!fs::is_symlink(st)) return Ok();

  const auto target = fs::read_symlink(src.path, ec);
  if (ec) return FromErrorCode(ec, wxString::Format("Unable to read link %s", Quoted(rel)));
  if (target.is_absolute()) return Ok();

  fs::path canon;
  auto res = sandbox::Canonicalize(destDir / target, &canon);
  if (!res.ok) return res;
  if (!sandbox::IsWithin(src.root, canon)) {
    wxLogWarning("Refusing to move link %s: it would point to %s", Quoted(rel), canon.string());
    return Fail(ErrorKind::PathEscape,
                wxString::Format("Moving %s would make it point outside the selected folder.",
                                 Quoted(rel)));
  }
  return Ok();
}
}  // namespace

OpResult ResolveFile(const fs::path& root, std::string_view relativePath, fs::path* out) {
  sandbox::Resolved target;
  auto res = sandbox::Resolve(root, relativePath, &target);
  if (!res.ok) return res;
  res = RequireFile(target, relativePath);
  if (!res.ok) return res;
  *out = target.path;
  return Ok();
}

OpResult Rename(const fs::path& root, std::string_view relativePath, std::string_view newName) {
  auto res = sandbox::ValidateName(newName);
  if (!res.ok) return res;

  sandbox::Resolved src;
  res = sandbox::Resolve(root, relativePath, &src);
  if (!res.ok) return res;
  res = RequireFile(src, relativePath);
  if (!res.ok) return res;

  // RequireFile refuses the root itself, so there is at least one segment.
  auto segments = sandbox::SplitRelative(relativePath);
  segments.back() = std::string(newName);
  const auto destRel = sandbox::JoinRelative(segments);

  sandbox::Resolved dst;
  res = sandbox::Resolve(root, destRel, &dst);
  if (!res.ok) return res;
  res = RequireAbsent(dst, destRel);
  if (!res.ok) return res;

  std::error_code ec;
  fs::rename(src.path, dst.path, ec);
  if (ec) return FromErrorCode(ec, wxString::Format("Unable to rename %s", Quoted(relativePath)));

  wxLogVerbose("Renamed %s to %s", src.path.string(), dst.path.string());
  return Ok();
}

OpResult Delete(const fs::path& root, std::string_view relativePath) {
  sandbox::Resolved target;
  auto res = sandbox::Resolve(root, relativePath, &target);
  if (!res.ok) return res;
  res = RequireFile(target, relativePath);
  if (!res.ok) return res;

  std::error_code ec;
  const bool removed = fs::remove(target.path, ec);
  if (ec) return FromErrorCode(ec, wxString::Format("Unable to delete %s", Quoted(relativePath)));
  if (!removed) {
    return Fail(ErrorKind::NotFound, wxString::Format("%s does not exist.", Quoted(relativePath)));
  }

  wxLogVerbose("Deleted %s", target.path.string());
  return Ok();
}

OpResult Move(const fs::path& root,
              std::string_view fromRelative,
              std::string_view toRelativeDir,
              bool createDir) {
  sandbox::Resolved src;
  auto res = sandbox::Resolve(root, fromRelative, &src);
  if (!res.ok) return res;
  res = RequireFile(src, fromRelative);
  if (!res.ok) return res;

  sandbox::Resolved dir;
  res = sandbox::Resolve(root, toRelativeDir, &dir);
  if (!res.ok) return res;
  res = RequireLinkStaysInside(src, dir.path, fromRelative);
  if (!res.ok) return res;

  if (dir.exists) {
    res = RequireFolder(dir, toRelativeDir);
    if (!res.ok) return res;
  } else {
    if (!createDir) {
      return Fail(ErrorKind::NotFound,
                  wxString::Format("Destination folder %s does not exist.", Quoted(toRelativeDir)));
    }

    std::error_code ec;
    fs::create_directories(dir.path, ec);
    if (ec) {
      return FromErrorCode(ec, wxString::Format("Unable to create %s", Quoted(toRelativeDir)));
    }
    wxLogVerbose("Created folder %s", dir.path.string());

    // The chain exists now; make sure what was created still resolves inside root.
    res = sandbox::Resolve(root, toRelativeDir, &dir);
    if (!res.ok) return res;
    res = RequireFolder(dir, toRelativeDir);
    if (!res.ok) return res;
  }

  auto segments = sandbox::SplitRelative(toRelativeDir);
  segments.push_back(src.path.filename().string());
  const auto destRel = sandbox::JoinRelative(segments);

  sandbox::Resolved dst;
  res = sandbox::Resolve(root, destRel, &dst);
  if (!res.ok) return res;
  res = RequireAbsent(dst, destRel);
  if (!res.ok) return res;

  res = MovePath(src.path, dst.path);
  if (!res.ok) return res;

  wxLogVerbose("Moved %s to %s", src.path.string(), dst.path.string());
  return Ok();
}

OpResult CreateFolder(const fs::path& root, std::string_view relativeDir) {
  sandbox::Resolved target;
  auto res = sandbox::Resolve(root, relativeDir, &target);
  if (!res.ok) return res;
  res = RequireAbsent(target, sandbox::JoinRelative(sandbox::SplitRelative(relativeDir)));
  if (!res.ok) return res;

  std::error_code ec;
  fs::create_directories(target.path, ec);
  if (ec) return FromErrorCode(ec, wxString::Format("Unable to create %s", Quoted(relativeDir)));

  wxLogVerbose("Created folder %s", target.path.string());
  return Ok();
}

}  // namespace fileops
