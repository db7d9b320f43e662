#include "config.hpp"
#include "log.hpp"
#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

using gitfindr::Config;
using gitfindr::NestedRepoPolicy;
using gitfindr_test::TempDir;

TEST_CASE("config defaults") {
  Config cfg;
  REQUIRE(cfg.log_level() == "warn");
  REQUIRE(cfg.log_pattern() == "[%l] %v");
  REQUIRE(cfg.log_file().empty());
  REQUIRE(cfg.log_rotate() == 3);
  REQUIRE(cfg.log_categories().empty());
  REQUIRE(cfg.registry_file().empty());
  REQUIRE(cfg.nested_repos() == NestedRepoPolicy::Descend);

  cfg.set_log_rotate(-4);
  REQUIRE(cfg.log_rotate() == 0);
}

TEST_CASE("config from flat json") {
  nlohmann::json j = {{"log_level", "debug"},
                      {"log_pattern", "%v"},
                      {"log_file", "out.log"},
                      {"log_rotate", 0},
                      {"log_categories", {{"registry", "trace"}}},
                      {"registry_file", "/data/repos.json"},
                      {"nested_repos", "stop"}};
  Config cfg = Config::from_json(j);
  REQUIRE(cfg.log_level() == "debug");
  REQUIRE(cfg.log_pattern() == "%v");
  REQUIRE(cfg.log_file() == "out.log");
  REQUIRE(cfg.log_rotate() == 0);
  REQUIRE(cfg.log_categories().at("registry") == "trace");
  REQUIRE(cfg.registry_file() == "/data/repos.json");
  REQUIRE(cfg.nested_repos() == NestedRepoPolicy::StopAtRepository);
}

TEST_CASE("config from grouped json") {
  nlohmann::json j = {
      {"logging", {{"log_level", "info"}, {"log_file", "g.log"}}},
      {"registry", {{"file", "/data/repos.toml"}}},
      {"scan", {{"nested_repos", "descend"}}}};
  Config cfg = Config::from_json(j);
  REQUIRE(cfg.log_level() == "info");
  REQUIRE(cfg.log_file() == "g.log");
  REQUIRE(cfg.registry_file() == "/data/repos.toml");
  REQUIRE(cfg.nested_repos() == NestedRepoPolicy::Descend);

  REQUIRE(Config::from_json(nlohmann::json()).log_level() == "warn");
}

TEST_CASE("config rejects invalid values") {
  REQUIRE_THROWS_AS(Config::from_json({{"nested_repos", "sideways"}}),
                    std::runtime_error);
  REQUIRE_THROWS_AS(Config::from_json({{"log_rotate", "many"}}),
                    std::runtime_error);
  REQUIRE_THROWS_AS(Config::from_json({{"log_categories", "registry"}}),
                    std::runtime_error);
  REQUIRE_THROWS_AS(Config::from_json({{"log_categories", {{"registry", 3}}}}),
                    std::runtime_error);
  REQUIRE_THROWS_AS(Config::from_json(nlohmann::json::array({1, 2})),
                    std::runtime_error);
}

TEST_CASE("config from files") {
  TempDir tmp;

  auto yaml = tmp.path / "settings.yaml";
  gitfindr_test::write_file(yaml, "logging:\n"
                                  "  log_level: error\n"
                                  "  log_rotate: 5\n"
                                  "  log_categories:\n"
                                  "    repo.discovery: debug\n"
                                  "scan:\n"
                                  "  nested_repos: stop\n");
  Config from_yaml = Config::from_file(yaml.string());
  REQUIRE(from_yaml.log_level() == "error");
  REQUIRE(from_yaml.log_rotate() == 5);
  REQUIRE(from_yaml.log_categories().at("repo.discovery") == "debug");
  REQUIRE(from_yaml.nested_repos() == NestedRepoPolicy::StopAtRepository);

  auto toml = tmp.path / "settings.toml";
  gitfindr_test::write_file(toml, "[logging]\n"
                                  "log_level = \"info\"\n"
                                  "[registry]\n"
                                  "file = \"/tmp/repos.yaml\"\n");
  Config from_toml = Config::from_file(toml.string());
  REQUIRE(from_toml.log_level() == "info");
  REQUIRE(from_toml.registry_file() == "/tmp/repos.yaml");

  auto json = tmp.path / "settings.json";
  gitfindr_test::write_file(json, "{\"log_pattern\": \"%l %v\"}");
  Config from_json = Config::from_file(json.string());
  REQUIRE(from_json.log_pattern() == "%l %v");
}

TEST_CASE("config file errors") {
  TempDir tmp;
  REQUIRE_THROWS_AS(Config::from_file((tmp.path / "missing.yaml").string()),
                    std::runtime_error);

  auto unsupported = tmp.path / "settings.ini";
  gitfindr_test::write_file(unsupported, "log_level=debug\n");
  REQUIRE_THROWS_AS(Config::from_file(unsupported.string()),
                    std::runtime_error);

  auto wrong_type = tmp.path / "settings.yaml";
  gitfindr_test::write_file(wrong_type, "log_rotate: lots\n");
  REQUIRE_THROWS_AS(Config::from_file(wrong_type.string()),
                    std::runtime_error);
}

TEST_CASE("config load failures are left to the caller to report") {
  TempDir tmp;
  auto log = tmp.path / "config.log";
  gitfindr::init_logger(spdlog::level::trace, "%l|%v", log.string(), 0);

  auto broken = tmp.path / "settings.yaml";
  gitfindr_test::write_file(broken, "scan:\n  nested_repos: sideways\n");
  REQUIRE_THROWS_AS(Config::from_file(broken.string()), std::runtime_error);
  spdlog::default_logger()->flush();

  std::string content = gitfindr_test::read_file(log);
  REQUIRE(content.find("Loading config from") != std::string::npos);
  REQUIRE(content.find("error|") == std::string::npos);
  gitfindr::init_logger(spdlog::level::warn, "[%l] %v");
}
