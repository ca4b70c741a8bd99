#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace stud;

namespace {
CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "stud");
  std::vector<char *> argv;
  for (auto &a : args)
    argv.push_back(a.data());
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

int exit_code_of(std::vector<std::string> args) {
  try {
    parse(std::move(args));
  } catch (const CliParseExit &e) {
    return e.exit_code();
  }
  return -1;
}
} // namespace

TEST_CASE("branches clean is selected", "[cli]") {
  auto options = parse({"branches", "clean"});
  REQUIRE(options.command == CliCommand::BranchesClean);
  REQUIRE_FALSE(options.quiet);
  REQUIRE(options.verbose == 0);
}

TEST_CASE("branches list is selected", "[cli]") {
  auto options = parse({"branches", "list"});
  REQUIRE(options.command == CliCommand::BranchesList);
}

TEST_CASE("quiet flag belongs to clean", "[cli]") {
  REQUIRE(parse({"branches", "clean", "-q"}).quiet);
  REQUIRE(parse({"branches", "clean", "--quiet"}).quiet);
  REQUIRE(exit_code_of({"branches", "list", "--quiet"}) != 0);
}

TEST_CASE("global options are accepted after the subcommand", "[cli]") {
  auto options = parse({"branches", "clean", "-vv", "--base-branch",
                        "origin/main", "--remote", "upstream", "-B", "main",
                        "-B", "release"});
  REQUIRE(options.verbose == 2);
  REQUIRE(options.base_branch == "origin/main");
  REQUIRE(options.remote == "upstream");
  REQUIRE(options.protected_branches ==
          std::vector<std::string>{"main", "release"});
}

TEST_CASE("forge options", "[cli]") {
  auto options = parse({"--token", "abc", "--api-base", "https://ghe/api/v3",
                        "--http-timeout", "5", "--http-retries", "0",
                        "--no-forge", "branches", "list"});
  REQUIRE(options.token == "abc");
  REQUIRE(options.api_base == "https://ghe/api/v3");
  REQUIRE(options.http_timeout == 5);
  REQUIRE(options.http_timeout_explicit);
  REQUIRE(options.http_retries == 0);
  REQUIRE(options.http_retries_explicit);
  REQUIRE(options.no_forge);
}

TEST_CASE("defaults are not marked explicit", "[cli]") {
  auto options = parse({"branches", "list"});
  REQUIRE_FALSE(options.log_level_explicit);
  REQUIRE_FALSE(options.http_timeout_explicit);
  REQUIRE_FALSE(options.http_retries_explicit);
  REQUIRE(options.log_level == "info");
}

TEST_CASE("logging options", "[cli]") {
  auto options = parse({"-G", "debug", "-F", "stud.log", "--log-category",
                        "git=trace", "--log-category", "branches.index",
                        "branches", "list"});
  REQUIRE(options.log_level == "debug");
  REQUIRE(options.log_level_explicit);
  REQUIRE(options.log_file == "stud.log");
  REQUIRE(options.log_categories.at("git") == "trace");
  REQUIRE(options.log_categories.at("branches.index") == "debug");
}

TEST_CASE("invalid values are rejected", "[cli]") {
  REQUIRE(exit_code_of({"-G", "loud", "branches", "list"}) != 0);
  REQUIRE(exit_code_of({"--http-timeout", "0", "branches", "list"}) != 0);
  REQUIRE(exit_code_of({"--http-retries", "-1", "branches", "list"}) != 0);
  REQUIRE(exit_code_of({"--log-category", "=debug", "branches", "list"}) ==
          1);
}

TEST_CASE("a subcommand is required", "[cli]") {
  REQUIRE(exit_code_of({}) != 0);
  REQUIRE(exit_code_of({"branches"}) != 0);
  REQUIRE(exit_code_of({"tags"}) != 0);
}

TEST_CASE("help and version exit successfully", "[cli]") {
  REQUIRE(exit_code_of({"--help"}) == 0);
  REQUIRE(exit_code_of({"branches", "clean", "--help"}) == 0);
  REQUIRE(exit_code_of({"--version"}) == 0);
}
