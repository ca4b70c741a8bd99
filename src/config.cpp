#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace stud {

namespace {

constexpr int kMaxHttpRetries = 10;

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// Parse @p s entirely as a number, or return `std::nullopt`.
std::optional<nlohmann::json> yaml_number(const std::string &s) {
  if (s.empty())
    return std::nullopt;
  try {
    size_t idx = 0;
    long long i = std::stoll(s, &idx, 10);
    if (idx == s.size())
      return nlohmann::json(i);
  } catch (const std::logic_error &) {
    // not an integer
  }
  try {
    size_t idx = 0;
    double d = std::stod(s, &idx);
    if (idx == s.size())
      return nlohmann::json(d);
  } catch (const std::logic_error &) {
    // not a floating point value
  }
  return std::nullopt;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Quoted scalars stay strings; plain scalars become booleans or numbers when
 * they read as such.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (node.Tag() == "!") {
      return s;
    }
    const std::string lower = to_lower_copy(s);
    if (lower == "true")
      return true;
    if (lower == "false")
      return false;
    if (lower == "~" || lower == "null")
      return nullptr;
    if (auto number = yaml_number(s))
      return *number;
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    std::transform(node.begin(), node.end(), std::back_inserter(arr),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  std::ostringstream oss;
  if (const auto *date = node.as_date()) {
    oss << date->get();
  } else if (const auto *time = node.as_time()) {
    oss << time->get();
  } else if (const auto *date_time = node.as_date_time()) {
    oss << date_time->get();
  } else {
    return nullptr;
  }
  return oss.str();
}

/**
 * Lift the keys of the recognised sections to the root object.
 *
 * Section values replace flat values of the same name. Keys listed in
 * @p renames are stored under their flat spelling.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section =
      [&normalized](
          std::string_view name,
          std::initializer_list<std::pair<std::string_view, std::string_view>>
              renames) {
        auto it = normalized.find(std::string{name});
        if (it == normalized.end() || !it->is_object()) {
          return;
        }
        const nlohmann::json section = *it;
        for (const auto &[key, value] : section.items()) {
          std::string flat = key;
          for (const auto &[from, to] : renames) {
            if (key == from) {
              flat = std::string{to};
            }
          }
          normalized[flat] = value;
        }
      };

  merge_section("core", {});
  merge_section("git", {});
  merge_section("branches", {{"protected", "protected_branches"}});
  merge_section("forge", {{"enabled", "forge_enabled"}});
  merge_section("logging", {});
  return normalized;
}

std::unordered_map<std::string, std::string>
parse_log_categories(const nlohmann::json &value) {
  std::unordered_map<std::string, std::string> categories;
  auto assign = [&categories](const std::string &raw) {
    auto pos = raw.find('=');
    std::string name = raw.substr(0, pos);
    std::string level =
        pos == std::string::npos ? std::string{} : raw.substr(pos + 1);
    if (name.empty()) {
      return;
    }
    categories[name] = level.empty() ? "debug" : level;
  };
  if (value.is_object()) {
    for (const auto &[key, v] : value.items()) {
      if (v.is_string()) {
        assign(key + "=" + v.get<std::string>());
      } else if (v.is_null()) {
        assign(key);
      } else {
        config_log()->warn("Unsupported value for log category '{}'; "
                           "expected string or null",
                           key);
      }
    }
  } else if (value.is_array()) {
    for (const auto &item : value) {
      if (item.is_string()) {
        assign(item.get<std::string>());
      }
    }
  } else if (value.is_string()) {
    assign(value.get<std::string>());
  }
  return categories;
}

} // namespace

/**
 * Populate configuration settings from a JSON object.
 *
 * @param j JSON document holding configuration keys.
 * @throws nlohmann::json::exception When values cannot be converted to the
 *         expected types.
 */
void Config::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    if (j.is_null()) {
      return;
    }
    throw std::runtime_error("Configuration root must be a mapping");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("quiet")) {
    set_quiet(cfg["quiet"].get<bool>());
  }
  if (cfg.contains("base_branch")) {
    set_base_branch(cfg["base_branch"].get<std::string>());
  }
  if (cfg.contains("remote")) {
    set_remote(cfg["remote"].get<std::string>());
  }
  if (cfg.contains("protected_branches")) {
    set_protected_branches(
        cfg["protected_branches"].get<std::vector<std::string>>());
  }
  if (cfg.contains("forge_enabled")) {
    set_forge_enabled(cfg["forge_enabled"].get<bool>());
  }
  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("owner")) {
    set_owner(cfg["owner"].get<std::string>());
  }
  if (cfg.contains("repo")) {
    set_repo(cfg["repo"].get<std::string>());
  }
  if (cfg.contains("token")) {
    set_token(cfg["token"].get<std::string>());
  }
  if (cfg.contains("token_file")) {
    set_token_file(cfg["token_file"].get<std::string>());
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(cfg["http_timeout"].get<int>());
  }
  if (cfg.contains("http_retries")) {
    set_http_retries(cfg["http_retries"].get<int>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_categories")) {
    set_log_categories(parse_log_categories(cfg["log_categories"]));
  }
}

BranchSettings Config::branch_settings() const {
  BranchSettings settings;
  settings.base_ref = base_branch_;
  settings.remote = remote_;
  settings.protected_branches = ProtectedBranches(protected_branches_.begin(),
                                                  protected_branches_.end());
  return settings;
}

std::vector<std::string> Config::validate() {
  std::vector<std::string> problems;
  if (base_branch_.empty()) {
    problems.emplace_back("base branch is empty; merge checks will fail");
  }
  if (remote_.empty()) {
    problems.emplace_back("remote name is empty");
  }
  if (protected_branches_.empty()) {
    problems.emplace_back(
        "protected branch list is empty; using the default list");
    auto defaults = default_protected_branches();
    protected_branches_.assign(defaults.begin(), defaults.end());
  }
  if (http_retries_ < 0) {
    problems.emplace_back("http_retries " + std::to_string(http_retries_) +
                          " is negative; using 0");
    http_retries_ = 0;
  } else if (http_retries_ > kMaxHttpRetries) {
    problems.emplace_back("http_retries " + std::to_string(http_retries_) +
                          " is too large; using " +
                          std::to_string(kMaxHttpRetries));
    http_retries_ = kMaxHttpRetries;
  }
  if (http_timeout_ <= 0) {
    problems.emplace_back("http_timeout " + std::to_string(http_timeout_) +
                          " is not positive; using 30");
    http_timeout_ = 30;
  }
  for (const auto &problem : problems) {
    config_log()->warn("Config: {}", problem);
  }
  return problems;
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 * @throws nlohmann::json::exception When value conversions fail.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 * @throws std::runtime_error When the file cannot be opened, parsed, or when
 *         the extension is unsupported.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file " + path);
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      j = toml_to_json(toml::parse_file(path));
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->debug("Config loaded from {}", path);
  return cfg;
}

} // namespace stud
