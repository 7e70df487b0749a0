#include "util.h"

#include <cstdio>
#include <fstream>

#include <wx/log.h>

namespace fs = std::filesystem;

namespace {
// *created is set once dst has been opened, so callers only clean up what they made.
OpResult CopyRegularFileChunked(const fs::path& src, const fs::path& dst, bool* created) {
  std::ifstream in(src, std::ios::binary);
  if (!in.is_open()) {
    return Fail(ErrorKind::IOError, "Unable to open source file for reading.");
  }

  std::ofstream out(dst, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return Fail(ErrorKind::IOError, "Unable to open destination file for writing.");
  }
  *created = true;

  static constexpr std::size_t kBufSize = 4 * 1024 * 1024;
  std::string buf;
  buf.resize(kBufSize);

  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = in.gcount();
    if (got <= 0) break;

    out.write(buf.data(), got);
    if (!out) return Fail(ErrorKind::IOError, "Write failed.");
  }
  if (in.bad()) return Fail(ErrorKind::IOError, "Read failed.");

  out.flush();
  if (!out) return Fail(ErrorKind::IOError, "Write failed.");
  return Ok();
}

OpResult CopyAcrossDevices(const fs::path& src, const fs::path& dst, bool* created) {
  std::error_code ec;
  const auto st = fs::symlink_status(src, ec);
  if (ec) return FromErrorCode(ec, "Unable to inspect source");

  if (fs::exists(fs::symlink_status(dst, ec))) {
    return Fail(ErrorKind::AlreadyExists, "Destination already exists.");
  }

  if (fs::is_symlink(st)) {
    fs::copy_symlink(src, dst, ec);
    if (ec) return FromErrorCode(ec, "Unable to copy link");
    *created = true;
    return Ok();
  }

  const auto res = CopyRegularFileChunked(src, dst, created);
  if (!res.ok) return res;

  // Best effort: keep the permission bits of the original.
  fs::permissions(dst, st.permissions(), fs::perm_options::replace, ec);
  if (ec) wxLogDebug("Unable to copy permissions to %s: %s", dst.string(), ec.message());
  return Ok();
}
}  // namespace

wxString ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "OK";
    case ErrorKind::NotFound: return "Not found";
    case ErrorKind::PathEscape: return "Path outside the selected folder";
    case ErrorKind::AlreadyExists: return "Already exists";
    case ErrorKind::PermissionDenied: return "Permission denied";
    case ErrorKind::InvalidArgument: return "Invalid request";
    case ErrorKind::IOError: return "I/O error";
  }
  return "Unknown error";
}

ErrorKind ErrorKindFromCode(const std::error_code& ec) {
  if (!ec) return ErrorKind::None;
  if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
    return ErrorKind::NotFound;
  }
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
      ec == std::errc::read_only_file_system) {
    return ErrorKind::PermissionDenied;
  }
  if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty) {
    return ErrorKind::AlreadyExists;
  }
  return ErrorKind::IOError;
}

OpResult FromErrorCode(const std::error_code& ec, const wxString& context) {
  return Fail(ErrorKindFromCode(ec),
              wxString::Format("%s: %s", context, wxString::FromUTF8(ec.message())));
}

std::string HumanSize(std::uintmax_t bytes) {
  static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 5) {
    value /= 1024.0;
    unit++;
  }
  char buf[64];
  if (unit == 0) {
    std::snprintf(buf, sizeof(buf), "%llu %s",
                  static_cast<unsigned long long>(bytes), units[unit]);
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
  }
  return std::string(buf);
}

OpResult MovePath(const fs::path& src, const fs::path& dst) {
  std::error_code ec;
  fs::rename(src, dst, ec);
  if (!ec) return Ok();
  if (ec != std::errc::cross_device_link) return FromErrorCode(ec, "Move failed");

  // Cross-device moves can fail; fall back to copy+delete.
  wxLogVerbose("Moving %s across devices (copy then delete)", src.string());
  bool created = false;
  const auto copyRes = CopyAcrossDevices(src, dst, &created);
  if (!copyRes.ok) {
    if (!created) return copyRes;
    std::error_code rmEc;
    fs::remove(dst, rmEc);
    if (rmEc) wxLogDebug("Unable to remove partial copy %s: %s", dst.string(), rmEc.message());
    return copyRes;
  }

  ec.clear();
  fs::remove(src, ec);
  if (ec) return FromErrorCode(ec, "Copied, but unable to remove the original");
  return Ok();
}
