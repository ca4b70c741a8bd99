#include "token_loader.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace stud {

namespace {

void add_token(std::vector<std::string> &tokens, std::string token) {
  if (!token.empty()) {
    tokens.push_back(std::move(token));
  }
}

std::vector<std::string> tokens_from_yaml(const std::string &path) {
  std::vector<std::string> tokens;
  YAML::Node node = YAML::LoadFile(path);
  if (node.IsSequence()) {
    for (const auto &item : node)
      add_token(tokens, item.as<std::string>());
  } else if (node.IsScalar()) {
    add_token(tokens, node.as<std::string>());
  } else if (node.IsMap()) {
    if (node["token"]) {
      add_token(tokens, node["token"].as<std::string>());
    }
    if (const YAML::Node list = node["tokens"]) {
      if (!list.IsSequence()) {
        throw std::runtime_error("YAML tokens entry must be a sequence");
      }
      for (const auto &item : list)
        add_token(tokens, item.as<std::string>());
    }
  }
  return tokens;
}

std::vector<std::string> tokens_from_json(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Failed to open token file " + path);
  }
  nlohmann::json j;
  f >> j;
  std::vector<std::string> tokens;
  auto add_array = [&tokens](const nlohmann::json &array) {
    for (const auto &item : array)
      add_token(tokens, item.get<std::string>());
  };
  if (j.is_array()) {
    add_array(j);
  } else if (j.is_string()) {
    add_token(tokens, j.get<std::string>());
  } else if (j.is_object()) {
    if (j.contains("token")) {
      add_token(tokens, j["token"].get<std::string>());
    }
    if (j.contains("tokens")) {
      if (!j["tokens"].is_array()) {
        throw std::runtime_error("JSON tokens entry must be an array");
      }
      add_array(j["tokens"]);
    }
  }
  return tokens;
}

std::vector<std::string> tokens_from_toml(const std::string &path) {
  std::vector<std::string> tokens;
  toml::table tbl = toml::parse_file(path);
  if (auto single = tbl["token"].value<std::string>()) {
    add_token(tokens, *single);
  }
  if (auto arr = tbl["tokens"].as_array()) {
    for (const auto &item : *arr) {
      auto value = item.value<std::string>();
      if (!value) {
        throw std::runtime_error("TOML tokens array must contain strings");
      }
      add_token(tokens, *value);
    }
  }
  return tokens;
}

} // namespace

std::vector<std::string> load_tokens_from_file(const std::string &path) {
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    throw std::runtime_error("Unknown token file extension");
  }
  std::string ext = path.substr(pos + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (ext == "yaml" || ext == "yml") {
    return tokens_from_yaml(path);
  }
  if (ext == "json") {
    return tokens_from_json(path);
  }
  if (ext == "toml" || ext == "tml") {
    return tokens_from_toml(path);
  }
  throw std::runtime_error("Unsupported token file format");
}

std::optional<std::string> resolve_token(const std::string &explicit_token,
                                         const std::string &config_token,
                                         const std::string &token_file) {
  auto log = category_logger("config");
  if (!explicit_token.empty()) {
    log->debug("Using token from the command line");
    return explicit_token;
  }
  if (!config_token.empty()) {
    log->debug("Using token from the configuration");
    return config_token;
  }
  if (!token_file.empty()) {
    auto tokens = load_tokens_from_file(token_file);
    if (!tokens.empty()) {
      log->debug("Using token from {}", token_file);
      return tokens.front();
    }
    log->warn("Token file {} contains no tokens", token_file);
  }
  if (const char *env = std::getenv("GITHUB_TOKEN"); env && *env) {
    log->debug("Using token from GITHUB_TOKEN");
    return std::string(env);
  }
  return std::nullopt;
}

} // namespace stud
