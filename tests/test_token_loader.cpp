#include "token_loader.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace stud;

namespace {
std::string write_file(const std::string &name, const std::string &text) {
  std::filesystem::path path = std::filesystem::temp_directory_path() / name;
  std::ofstream f(path.string());
  f << text;
  return path.string();
}

/// Sets GITHUB_TOKEN for one scope and restores the previous value.
class ScopedToken {
public:
  explicit ScopedToken(const char *value) {
    if (const char *old = std::getenv("GITHUB_TOKEN")) {
      saved_ = old;
      had_ = true;
    }
    if (value)
      ::setenv("GITHUB_TOKEN", value, 1);
    else
      ::unsetenv("GITHUB_TOKEN");
  }
  ~ScopedToken() {
    if (had_)
      ::setenv("GITHUB_TOKEN", saved_.c_str(), 1);
    else
      ::unsetenv("GITHUB_TOKEN");
  }

private:
  std::string saved_;
  bool had_{false};
};
} // namespace

TEST_CASE("tokens load from yaml, json and toml", "[tokens]") {
  auto yaml = write_file("stud_tokens.yaml", "tokens:\n  - a\n  - \"\"\n  - b\n");
  REQUIRE(load_tokens_from_file(yaml) == std::vector<std::string>{"a", "b"});

  auto json = write_file("stud_tokens.json", R"({"token": "c"})");
  REQUIRE(load_tokens_from_file(json) == std::vector<std::string>{"c"});

  auto toml = write_file("stud_tokens.toml", "tokens = [\"d\", \"e\"]\n");
  REQUIRE(load_tokens_from_file(toml) == std::vector<std::string>{"d", "e"});

  auto list = write_file("stud_tokens_list.json", R"(["f"])");
  REQUIRE(load_tokens_from_file(list) == std::vector<std::string>{"f"});

  for (const auto &p : {yaml, json, toml, list})
    std::filesystem::remove(p);
}

TEST_CASE("unsupported token files are rejected", "[tokens]") {
  REQUIRE_THROWS_AS(load_tokens_from_file("tokens.txt"), std::runtime_error);
  auto bad = write_file("stud_tokens_bad.json", R"({"tokens": "x"})");
  REQUIRE_THROWS_AS(load_tokens_from_file(bad), std::runtime_error);
  std::filesystem::remove(bad);
}

TEST_CASE("token sources are tried in order", "[tokens]") {
  ScopedToken env("from-env");
  auto file = write_file("stud_tokens_order.yaml", "token: from-file\n");

  REQUIRE(resolve_token("cli", "config", file) == "cli");
  REQUIRE(resolve_token("", "config", file) == "config");
  REQUIRE(resolve_token("", "", file) == "from-file");
  REQUIRE(resolve_token("", "", "") == "from-env");
  std::filesystem::remove(file);
}

TEST_CASE("empty token file falls through to the environment", "[tokens]") {
  ScopedToken env("from-env");
  auto file = write_file("stud_tokens_empty.json", "[]");
  REQUIRE(resolve_token("", "", file) == "from-env");
  std::filesystem::remove(file);
}

TEST_CASE("no token anywhere", "[tokens]") {
  ScopedToken env(nullptr);
  REQUIRE_FALSE(resolve_token("", "", "").has_value());
}
