#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>

TEST_CASE("log file receives messages at the configured level", "[log]") {
  const char *path = "stud_test.log";
  std::remove(path);
  stud::LogOptions options;
  options.file = path;
  options.rotate_files = 0;
  stud::init_logger(options);
  spdlog::debug("debug message");
  spdlog::info("info message");
  stud::category_logger("branches.cleaner")->info("category message");
  spdlog::default_logger()->flush();
  stud::category_logger("branches.cleaner")->flush();

  std::ifstream f(path);
  REQUIRE(f.good());
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("category message") != std::string::npos);
  REQUIRE(content.find("debug message") == std::string::npos);
}

TEST_CASE("category overrides change only that category", "[log]") {
  stud::init_logger(spdlog::level::info);
  REQUIRE(stud::configure_log_categories(
              {{"git", "trace"}, {"branches.index", "chatty"}}) == 1);
  REQUIRE(stud::category_logger("git")->level() == spdlog::level::trace);
  REQUIRE(stud::category_logger("github.client")->level() ==
          spdlog::level::info);
  REQUIRE(stud::category_logger("git") == stud::category_logger("git"));
}

TEST_CASE("level names are parsed", "[log]") {
  REQUIRE(stud::parse_log_level("debug") == spdlog::level::debug);
  REQUIRE(stud::parse_log_level("warning") == spdlog::level::warn);
  REQUIRE(stud::parse_log_level("off") == spdlog::level::off);
  REQUIRE_FALSE(stud::parse_log_level("loud").has_value());
}

TEST_CASE("verbosity count maps to levels", "[log]") {
  REQUIRE(stud::level_from_verbosity(0) == spdlog::level::info);
  REQUIRE(stud::level_from_verbosity(1) == spdlog::level::debug);
  REQUIRE(stud::level_from_verbosity(2) == spdlog::level::trace);
  REQUIRE(stud::level_from_verbosity(5) == spdlog::level::trace);
}
