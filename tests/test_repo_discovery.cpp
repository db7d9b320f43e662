#include "repo_discovery.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

using gitfindr_test::TempDir;
using gitfindr_test::make_repo;
namespace fs = std::filesystem;

namespace {

std::set<std::pair<std::string, std::string>>
as_set(const gitfindr::ScanResult &result) {
  std::set<std::pair<std::string, std::string>> out;
  for (const auto &record : result.repositories) {
    out.emplace(record.name, record.path.string());
  }
  return out;
}

/// Restores the working directory on scope exit.
struct CwdGuard {
  fs::path saved = fs::current_path();
  ~CwdGuard() {
    std::error_code ec;
    fs::current_path(saved, ec);
  }
};

/// Gives the owner full access again so the directory can be removed.
struct PermissionGuard {
  fs::path dir;
  ~PermissionGuard() {
    std::error_code ec;
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, ec);
  }
};

} // namespace

TEST_CASE("nested repo policy string conversion") {
  REQUIRE(gitfindr::nested_repo_policy_from_string("descend") ==
          gitfindr::NestedRepoPolicy::Descend);
  REQUIRE(gitfindr::nested_repo_policy_from_string("DESCEND") ==
          gitfindr::NestedRepoPolicy::Descend);
  REQUIRE(gitfindr::nested_repo_policy_from_string("nested") ==
          gitfindr::NestedRepoPolicy::Descend);
  REQUIRE(gitfindr::nested_repo_policy_from_string("stop") ==
          gitfindr::NestedRepoPolicy::StopAtRepository);
  REQUIRE(gitfindr::nested_repo_policy_from_string("Boundary") ==
          gitfindr::NestedRepoPolicy::StopAtRepository);

  REQUIRE(gitfindr::to_string(gitfindr::NestedRepoPolicy::Descend) ==
          "descend");
  REQUIRE(gitfindr::to_string(gitfindr::NestedRepoPolicy::StopAtRepository) ==
          "stop");

  REQUIRE_THROWS_AS(gitfindr::nested_repo_policy_from_string("sideways"),
                    std::invalid_argument);
}

TEST_CASE("default names come from the directory itself") {
  REQUIRE(gitfindr::derive_repo_name("root/b/c") == std::string("c"));
  REQUIRE(gitfindr::derive_repo_name("/home/user/project/") ==
          std::string("project"));
  REQUIRE(gitfindr::derive_repo_name("work/./tool") == std::string("tool"));
  REQUIRE(gitfindr::derive_repo_name("single") == std::string("single"));

  REQUIRE_FALSE(gitfindr::derive_repo_name("/").has_value());
  REQUIRE_FALSE(gitfindr::derive_repo_name(".").has_value());
  REQUIRE_FALSE(gitfindr::derive_repo_name("..").has_value());
  REQUIRE_FALSE(gitfindr::derive_repo_name("").has_value());
}

TEST_CASE("scan finds repositories by their own directory name", "[scan]") {
  TempDir tmp;
  fs::path root = tmp.path / "root";
  make_repo(root / "a");
  fs::create_directories(root / "b");
  make_repo(root / "b" / "c");
  fs::create_directories(root / "d" / "e");

  auto result = gitfindr::scan_repositories(root);
  REQUIRE(result.issues.empty());
  REQUIRE(result.repositories.size() == 2);
  REQUIRE(as_set(result) ==
          std::set<std::pair<std::string, std::string>>{
              {"a", (root / "a").string()}, {"c", (root / "b" / "c").string()}});
}

TEST_CASE("scan reports the root and nested repositories", "[scan]") {
  TempDir tmp;
  fs::path root = make_repo(tmp.path / "outer");
  make_repo(root / "vendor" / "lib");
  make_repo(root / "vendor" / "lib" / "sub" / "inner");
  make_repo(root / "tools");

  auto result = gitfindr::scan_repositories(root);
  REQUIRE(result.repositories.size() == 4);
  auto found = as_set(result);
  REQUIRE(found.count({"outer", root.string()}) == 1);
  REQUIRE(found.count({"lib", (root / "vendor" / "lib").string()}) == 1);
  REQUIRE(found.count(
              {"inner", (root / "vendor" / "lib" / "sub" / "inner").string()}) ==
          1);
  REQUIRE(found.count({"tools", (root / "tools").string()}) == 1);

  gitfindr::ScanOptions stop;
  stop.nested = gitfindr::NestedRepoPolicy::StopAtRepository;
  auto outer_only = gitfindr::scan_repositories(root, stop);
  REQUIRE(outer_only.repositories.size() == 1);
  REQUIRE(outer_only.repositories[0].name == "outer");

  auto below = gitfindr::scan_repositories(root / "vendor", stop);
  REQUIRE(below.repositories.size() == 1);
  REQUIRE(below.repositories[0].name == "lib");
}

TEST_CASE("scan keeps duplicate names", "[scan]") {
  TempDir tmp;
  make_repo(tmp.path / "team-a" / "api");
  make_repo(tmp.path / "team-b" / "api");

  auto result = gitfindr::scan_repositories(tmp.path);
  REQUIRE(result.repositories.size() == 2);
  REQUIRE(std::all_of(result.repositories.begin(), result.repositories.end(),
                      [](const gitfindr::RepoRecord &r) {
                        return r.name == "api";
                      }));
}

TEST_CASE("scan handles deep trees", "[scan]") {
  TempDir tmp;
  fs::path dir = tmp.path;
  for (int i = 0; i < 150; ++i) {
    dir /= "d";
  }
  make_repo(dir / "bottom");

  auto result = gitfindr::scan_repositories(tmp.path);
  REQUIRE(result.repositories.size() == 1);
  REQUIRE(result.repositories[0].name == "bottom");
}

TEST_CASE("scan does not follow directory symlinks", "[scan]") {
  TempDir tmp;
  make_repo(tmp.path / "real" / "repo");
  std::error_code ec;
  fs::create_directory_symlink(tmp.path / "real", tmp.path / "link", ec);
  if (ec) {
    return; // filesystem without symlink support
  }
  fs::create_directory_symlink(tmp.path, tmp.path / "real" / "loop", ec);

  auto result = gitfindr::scan_repositories(tmp.path);
  REQUIRE(result.repositories.size() == 1);
  REQUIRE(result.repositories[0].path == tmp.path / "real" / "repo");
}

TEST_CASE("scan records per-directory issues and continues", "[scan]") {
  TempDir tmp;
  auto missing = gitfindr::scan_repositories(tmp.path / "missing");
  REQUIRE(missing.repositories.empty());
  REQUIRE(missing.issues.size() == 1);
  REQUIRE(missing.issues[0].path == tmp.path / "missing");

  // A repository scanned as "." has no derivable name; its children are
  // still discovered.
  fs::path root = make_repo(tmp.path / "here");
  make_repo(root / "child");
  CwdGuard guard;
  fs::current_path(root);
  auto result = gitfindr::scan_repositories(".");
  REQUIRE(result.repositories.size() == 1);
  REQUIRE(result.repositories[0].name == "child");
  REQUIRE(result.issues.size() == 1);
  REQUIRE(result.issues[0].path == fs::path("."));
}

TEST_CASE("utf-8 validation") {
  REQUIRE(gitfindr::is_valid_utf8(""));
  REQUIRE(gitfindr::is_valid_utf8("/src/plain-ascii"));
  REQUIRE(gitfindr::is_valid_utf8("/src/caf\xc3\xa9"));
  REQUIRE(gitfindr::is_valid_utf8("\xe2\x82\xac \xf0\x9f\x98\x80"));

  REQUIRE_FALSE(gitfindr::is_valid_utf8("caf\xe9"));
  REQUIRE_FALSE(gitfindr::is_valid_utf8("\xc3"));
  REQUIRE_FALSE(gitfindr::is_valid_utf8("\xc0\xaf"));         // overlong
  REQUIRE_FALSE(gitfindr::is_valid_utf8("\xed\xa0\x80"));     // surrogate
  REQUIRE_FALSE(gitfindr::is_valid_utf8("\xf4\x90\x80\x80")); // > U+10FFFF
  REQUIRE_FALSE(gitfindr::is_valid_utf8("\x80"));
}

TEST_CASE("scan reports repositories whose path is not utf-8", "[scan]") {
  TempDir tmp;
  fs::path latin1 = tmp.path / std::string("caf\xe9");
  std::error_code ec;
  fs::create_directories(latin1 / ".git", ec);
  if (ec) {
    SKIP("filesystem rejects non-UTF-8 names");
  }
  make_repo(tmp.path / "ok");

  auto result = gitfindr::scan_repositories(tmp.path);
  REQUIRE(result.repositories.size() == 1);
  REQUIRE(result.repositories[0].name == "ok");
  REQUIRE(result.issues.size() == 1);
  REQUIRE(result.issues[0].path == latin1);
}

TEST_CASE("scan continues past an unreadable subdirectory", "[scan]") {
  if (geteuid() == 0) {
    SKIP("permission checks do not apply to root");
  }
  TempDir tmp;
  fs::path locked = tmp.path / "locked";
  make_repo(locked / "hidden");
  make_repo(tmp.path / "ok");
  fs::permissions(locked, fs::perms::none);
  PermissionGuard restore{locked};

  auto result = gitfindr::scan_repositories(tmp.path);
  REQUIRE(result.repositories.size() == 1);
  REQUIRE(result.repositories[0].name == "ok");
  REQUIRE(result.issues.size() == 1);
  REQUIRE(result.issues[0].path == locked);
}
