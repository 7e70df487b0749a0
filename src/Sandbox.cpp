#include "Sandbox.h"

#include <wx/log.h>

namespace fs = std::filesystem;

namespace sandbox {

namespace {
constexpr int kMaxLinkDepth = 40;

OpResult Escape(std::string_view relative, const wxString& why) {
  wxLogWarning("Rejected path \"%s\": %s", wxString::FromUTF8(std::string(relative)), why);
  return Fail(ErrorKind::PathEscape,
              wxString::Format("\"%s\" is outside the selected folder (%s).",
                               wxString::FromUTF8(std::string(relative)), why));
}

bool Exists(const fs::path& p, fs::file_status* st, OpResult* err) {
  std::error_code ec;
  *st = fs::symlink_status(p, ec);
  if (ec) {
    if (ErrorKindFromCode(ec) == ErrorKind::NotFound) return false;
    *err = FromErrorCode(ec, wxString::Format("Unable to inspect %s", p.string()));
    return false;
  }
  return fs::exists(*st);
}

// Like realpath(3), but dangling links are still followed and missing
// components are appended lexically. p must be absolute.
OpResult CanonicalizeLenient(const fs::path& p, int depth, fs::path* out) {
  if (depth > kMaxLinkDepth) {
    return Fail(ErrorKind::IOError,
                wxString::Format("Too many levels of symbolic links at %s", p.string()));
  }

  fs::path current;
  for (const auto& part : p) {
    if (current.empty()) {
      current = part;  // root directory
      continue;
    }
    if (part.empty() || part == ".") continue;
    if (part == "..") {
      current = current.parent_path();
      continue;
    }

    const auto next = current / part;
    fs::file_status st;
    OpResult err = Ok();
    if (!Exists(next, &st, &err)) {
      if (!err.ok) return err;
      current = next;
      continue;
    }
    if (!fs::is_symlink(st)) {
      current = next;
      continue;
    }

    std::error_code ec;
    const auto target = fs::read_symlink(next, ec);
    if (ec) return FromErrorCode(ec, wxString::Format("Unable to read link %s", next.string()));
    const auto followed = target.is_absolute() ? target : current / target;
    const auto res = CanonicalizeLenient(followed, depth + 1, &current);
    if (!res.ok) return res;
  }

  *out = current;
  return Ok();
}
}  // namespace

OpResult ValidateRelative(std::string_view relative) {
  if (relative.find('\0') != std::string_view::npos) {
    return Escape(relative, "embedded NUL");
  }
  if (!relative.empty() && (relative.front() == '/' || relative.front() == '\\')) {
    return Escape(relative, "leading separator");
  }

  const fs::path asPath{std::string(relative)};
  if (asPath.is_absolute() || asPath.has_root_name() || asPath.has_root_directory()) {
    return Escape(relative, "absolute path");
  }

  std::size_t start = 0;
  while (start <= relative.size()) {
    const auto end = relative.find('/', start);
    const auto seg = relative.substr(start, end == std::string_view::npos ? std::string_view::npos
                                                                          : end - start);
    if (seg == "..") return Escape(relative, "parent directory segment");
    if (end == std::string_view::npos) break;
    start = end + 1;
  }
  return Ok();
}

OpResult ValidateName(std::string_view name) {
  if (name.empty() || name == ".") {
    return Fail(ErrorKind::InvalidArgument, "Name must not be empty.");
  }
  if (name.find('\0') != std::string_view::npos) {
    return Fail(ErrorKind::InvalidArgument, "Name contains a NUL character.");
  }
  if (name == ".." || name.find('/') != std::string_view::npos) {
    return Escape(name, "name would leave its folder");
  }
  return Ok();
}

std::vector<std::string> SplitRelative(std::string_view relative) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : relative) {
    if (c == '/') {
      if (!cur.empty() && cur != ".") out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty() && cur != ".") out.push_back(cur);
  return out;
}

std::string JoinRelative(const std::vector<std::string>& segments) {
  std::string out;
  for (std::size_t i = 0; i < segments.size(); i++) {
    if (i) out.push_back('/');
    out += segments[i];
  }
  return out;
}

bool IsWithin(const fs::path& root, const fs::path& candidate) {
  auto c = candidate.begin();
  for (const auto& part : root) {
    if (part.empty()) break;  // trailing separator
    if (c == candidate.end() || part != *c) return false;
    ++c;
  }
  return true;
}

OpResult Canonicalize(const fs::path& p, fs::path* out) { return CanonicalizeLenient(p, 0, out); }

OpResult CanonicalRoot(const fs::path& root, fs::path* out) {
  if (root.empty()) return Fail(ErrorKind::NotFound, "No folder selected.");

  std::error_code ec;
  const auto st = fs::status(root, ec);
  if (ec) return FromErrorCode(ec, wxString::Format("Unable to open %s", root.string()));
  if (!fs::exists(st)) {
    return Fail(ErrorKind::NotFound, wxString::Format("%s does not exist.", root.string()));
  }
  if (!fs::is_directory(st)) {
    return Fail(ErrorKind::NotFound, wxString::Format("%s is not a folder.", root.string()));
  }

  const auto canon = fs::canonical(root, ec);
  if (ec) return FromErrorCode(ec, wxString::Format("Unable to open %s", root.string()));
  *out = canon;
  return Ok();
}

OpResult Resolve(const fs::path& root, std::string_view relative, Resolved* out) {
  auto res = ValidateRelative(relative);
  if (!res.ok) return res;

  fs::path rootCanon;
  res = CanonicalRoot(root, &rootCanon);
  if (!res.ok) return res;

  auto candidate = rootCanon;
  for (const auto& seg : SplitRelative(relative)) candidate /= seg;

  fs::file_status st;
  OpResult err = Ok();
  const bool exists = Exists(candidate, &st, &err);
  if (!err.ok) return err;

  fs::path canon;
  res = CanonicalizeLenient(candidate, 0, &canon);
  if (!res.ok) return res;
  if (!IsWithin(rootCanon, canon)) {
    return Escape(relative, wxString::Format("resolves to %s", canon.string()));
  }

  wxLogDebug("Resolved \"%s\" under %s", wxString::FromUTF8(std::string(relative)),
             rootCanon.string());
  out->root = rootCanon;
  out->path = candidate;
  out->exists = exists;
  return Ok();
}

}  // namespace sandbox
