#include "minitest.hpp"
#include "fixtures.hpp"
#include "Sandbox.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

TEST(sandbox_rejects_parent_segments) {
  TempTree t("dotdot");
  sandbox::Resolved r;
  for (const char* rel : {"..", "../x", "a/../b", "a/..", "a/b/../../..", "./.."}) {
    ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), rel, &r), ErrorKind::PathEscape);
  }
}

TEST(sandbox_rejects_absolute_and_leading_separator) {
  TempTree t("abs");
  sandbox::Resolved r;
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "/etc/passwd", &r), ErrorKind::PathEscape);
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "/", &r), ErrorKind::PathEscape);
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "\\x", &r), ErrorKind::PathEscape);
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), t.root().string(), &r), ErrorKind::PathEscape);
}

TEST(sandbox_validation_happens_before_root_lookup) {
  // Escape attempts are refused even when the root itself is missing.
  ASSERT_FAILS_WITH(sandbox::ValidateRelative("../x"), ErrorKind::PathEscape);
  sandbox::Resolved r;
  ASSERT_FAILS_WITH(sandbox::Resolve("/nonexistent/sandbar/root", "../x", &r),
                    ErrorKind::PathEscape);
}

TEST(sandbox_dotted_names_are_not_parent_segments) {
  ASSERT_OK(sandbox::ValidateRelative("..hidden"));
  ASSERT_OK(sandbox::ValidateRelative("a/...b"));
  ASSERT_OK(sandbox::ValidateRelative("a/b.."));
  ASSERT_OK(sandbox::ValidateRelative(""));
}

TEST(sandbox_missing_root_is_not_found) {
  TempTree t("noroot");
  sandbox::Resolved r;
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root() / "missing", "a.txt", &r), ErrorKind::NotFound);
  const auto file = t.write("file.txt", 3);
  ASSERT_FAILS_WITH(sandbox::Resolve(file, "", &r), ErrorKind::NotFound);
  ASSERT_FAILS_WITH(sandbox::Resolve("", "a.txt", &r), ErrorKind::NotFound);
}

TEST(sandbox_resolves_existing_and_missing_targets) {
  TempTree t("resolve");
  t.write("photos/img1.jpg", 10);
  const auto canonRoot = fs::canonical(t.root());

  sandbox::Resolved r;
  ASSERT_OK(sandbox::Resolve(t.root(), "photos/img1.jpg", &r));
  ASSERT_TRUE(r.exists);
  ASSERT_EQ(r.root, canonRoot);
  ASSERT_EQ(r.path, canonRoot / "photos" / "img1.jpg");

  ASSERT_OK(sandbox::Resolve(t.root(), "archive/2024/new", &r));
  ASSERT_FALSE(r.exists);
  ASSERT_EQ(r.path, canonRoot / "archive" / "2024" / "new");
}

TEST(sandbox_empty_relative_is_root) {
  TempTree t("empty");
  sandbox::Resolved r;
  ASSERT_OK(sandbox::Resolve(t.root(), "", &r));
  ASSERT_TRUE(r.exists);
  ASSERT_EQ(r.path, fs::canonical(t.root()));
}

TEST(sandbox_normalizes_redundant_separators) {
  TempTree t("norm");
  t.write("a/b/c.txt", 1);
  sandbox::Resolved r;
  ASSERT_OK(sandbox::Resolve(t.root(), "a//b/./c.txt", &r));
  ASSERT_EQ(r.path, fs::canonical(t.root()) / "a" / "b" / "c.txt");
  ASSERT_OK(sandbox::Resolve(t.root(), "a/b/", &r));
  ASSERT_EQ(r.path, fs::canonical(t.root()) / "a" / "b");
}

TEST(sandbox_symlink_escape_is_rejected) {
  TempTree t("linkout");
  fs::create_directories(t.outside());
  {
    std::ofstream f(t.outside() / "secret.txt");
    f << "secret";
  }
  t.symlink(t.outside(), "escape");
  t.symlink(t.outside() / "secret.txt", "secret-link");

  sandbox::Resolved r;
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "escape", &r), ErrorKind::PathEscape);
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "escape/secret.txt", &r), ErrorKind::PathEscape);
  // Targets that do not exist yet are checked through their nearest existing ancestor.
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "escape/new/dir", &r), ErrorKind::PathEscape);
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "secret-link", &r), ErrorKind::PathEscape);
}

TEST(sandbox_relative_symlink_escape_is_rejected) {
  TempTree t("linkrel");
  t.mkdir("sub");
  t.symlink("../..", "sub/up");
  sandbox::Resolved r;
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "sub/up", &r), ErrorKind::PathEscape);
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "sub/up/anything", &r), ErrorKind::PathEscape);
}

TEST(sandbox_dangling_symlink_pointing_outside_is_rejected) {
  TempTree t("dangling");
  t.symlink(t.outside() / "not-yet", "dangling");
  sandbox::Resolved r;
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "dangling", &r), ErrorKind::PathEscape);
  ASSERT_FAILS_WITH(sandbox::Resolve(t.root(), "dangling/child", &r), ErrorKind::PathEscape);
}

TEST(sandbox_symlink_inside_root_is_allowed) {
  TempTree t("linkin");
  t.write("real/file.txt", 4);
  t.symlink(t.root() / "real", "alias");
  sandbox::Resolved r;
  ASSERT_OK(sandbox::Resolve(t.root(), "alias/file.txt", &r));
  ASSERT_TRUE(r.exists);
  // The joined path is returned, not the link target.
  ASSERT_EQ(r.path, fs::canonical(t.root()) / "alias" / "file.txt");
}

TEST(sandbox_symlinked_root_is_canonicalized) {
  TempTree t("rootlink");
  t.write("card/DCIM/a.jpg", 2);
  const auto link = t.outside();
  fs::create_symlink(t.root() / "card", link);
  sandbox::Resolved r;
  ASSERT_OK(sandbox::Resolve(link, "DCIM/a.jpg", &r));
  ASSERT_EQ(r.root, fs::canonical(t.root() / "card"));
}

TEST(sandbox_symlink_loop_fails_without_escaping) {
  TempTree t("loop");
  t.symlink(t.root() / "b", "a");
  t.symlink(t.root() / "a", "b");
  sandbox::Resolved r;
  const auto res = sandbox::Resolve(t.root(), "a/x", &r);
  ASSERT_FALSE(res.ok);
}

TEST(sandbox_is_within_compares_whole_components) {
  ASSERT_TRUE(sandbox::IsWithin("/media/card", "/media/card"));
  ASSERT_TRUE(sandbox::IsWithin("/media/card", "/media/card/DCIM"));
  ASSERT_FALSE(sandbox::IsWithin("/media/card", "/media/card2"));
  ASSERT_FALSE(sandbox::IsWithin("/media/card", "/media"));
  ASSERT_TRUE(sandbox::IsWithin("/", "/anything"));
}

TEST(sandbox_validate_name) {
  ASSERT_OK(sandbox::ValidateName("b.txt"));
  ASSERT_OK(sandbox::ValidateName(".hidden"));
  ASSERT_FAILS_WITH(sandbox::ValidateName(""), ErrorKind::InvalidArgument);
  ASSERT_FAILS_WITH(sandbox::ValidateName("."), ErrorKind::InvalidArgument);
  ASSERT_FAILS_WITH(sandbox::ValidateName(".."), ErrorKind::PathEscape);
  ASSERT_FAILS_WITH(sandbox::ValidateName("sub/b.txt"), ErrorKind::PathEscape);
}

TEST(sandbox_split_and_join) {
  const auto segs = sandbox::SplitRelative("a//b/./c/");
  ASSERT_EQ(segs.size(), 3u);
  ASSERT_EQ(sandbox::JoinRelative(segs), std::string("a/b/c"));
  ASSERT_TRUE(sandbox::SplitRelative("").empty());
}
