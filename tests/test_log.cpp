#include "log.hpp"
#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <spdlog/spdlog.h>
#include <string>

using gitfindr_test::TempDir;

TEST_CASE("test log") {
  TempDir tmp;
  auto path = tmp.path / "test.log";
  gitfindr::init_logger(spdlog::level::info, "%v", path.string(), 0);
  spdlog::debug("debug message");
  spdlog::info("info message");
  gitfindr::category_logger("registry")->info("category message");
  spdlog::default_logger()->flush();

  std::string content = gitfindr_test::read_file(path);
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("category message") != std::string::npos);
  REQUIRE(content.find("debug message") == std::string::npos);

  gitfindr::init_logger(spdlog::level::info, "%v");
  spdlog::info("after file removed");
  REQUIRE(gitfindr_test::read_file(path).find("after file removed") ==
          std::string::npos);
  gitfindr::init_logger(spdlog::level::warn, "[%l] %v");
}

TEST_CASE("log category overrides") {
  TempDir tmp;
  auto path = tmp.path / "categories.log";
  gitfindr::init_logger(spdlog::level::warn, "%n %v", path.string(), 2);
  gitfindr::configure_log_categories(
      {{"repo.discovery", spdlog::level::debug}});
  auto discovery = gitfindr::category_logger("repo.discovery");
  REQUIRE(discovery->level() == spdlog::level::debug);
  REQUIRE(gitfindr::category_logger("store")->level() == spdlog::level::warn);

  discovery->debug("walking tree");
  gitfindr::category_logger("store")->info("hidden store message");
  spdlog::default_logger()->flush();

  std::string content = gitfindr_test::read_file(path);
  REQUIRE(content.find("gitfindr.repo.discovery walking tree") !=
          std::string::npos);
  REQUIRE(content.find("hidden store message") == std::string::npos);

  gitfindr::init_logger(spdlog::level::warn, "[%l] %v");
  REQUIRE(discovery->level() == spdlog::level::warn);
}

TEST_CASE("default logger is created on demand") {
  gitfindr::ensure_default_logger();
  REQUIRE(spdlog::default_logger() != nullptr);
  REQUIRE(spdlog::get("gitfindr") == spdlog::default_logger());
  auto first = gitfindr::category_logger("app");
  REQUIRE(gitfindr::category_logger("app") == first);
}
