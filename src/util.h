#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#include <wx/string.h>

enum class ErrorKind {
  None,
  NotFound,
  PathEscape,
  AlreadyExists,
  PermissionDenied,
  InvalidArgument,
  IOError,
};

struct OpResult {
  bool ok{false};
  ErrorKind kind{ErrorKind::None};
  wxString message;
};

inline OpResult Ok() { return {.ok = true}; }
inline OpResult Fail(ErrorKind kind, const wxString& message) {
  return {.ok = false, .kind = kind, .message = message};
}

// Short user-facing name, e.g. "Not found".
wxString ErrorKindName(ErrorKind kind);
ErrorKind ErrorKindFromCode(const std::error_code& ec);
// "<context>: <system message>" with the kind derived from ec.
OpResult FromErrorCode(const std::error_code& ec, const wxString& context);

std::string HumanSize(std::uintmax_t bytes);

// Renames src to dst. When the two live on different devices, copies and then
// removes the source; a failed copy is cleaned up and src is left untouched.
// Does not check whether dst exists before the rename; the copy fallback
// refuses an existing dst.
OpResult MovePath(const std::filesystem::path& src, const std::filesystem::path& dst);
