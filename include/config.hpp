#ifndef STUD_CONFIG_HPP
#define STUD_CONFIG_HPP

#include "branch_inventory.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace stud {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Whether cleanup skips confirmations and keeps remote copies.
  bool quiet() const { return quiet_; }

  /// Set quiet mode.
  void set_quiet(bool quiet) { quiet_ = quiet; }

  /// Reference merge status is checked against, e.g. `origin/develop`.
  const std::string &base_branch() const { return base_branch_; }

  /// Set the base reference.
  void set_base_branch(const std::string &ref) { base_branch_ = ref; }

  /// Remote that holds shared branches.
  const std::string &remote() const { return remote_; }

  /// Set the remote name.
  void set_remote(const std::string &remote) { remote_ = remote; }

  /// Branch names never deleted.
  const std::vector<std::string> &protected_branches() const {
    return protected_branches_;
  }

  /// Replace the protected branch list.
  void set_protected_branches(const std::vector<std::string> &branches) {
    protected_branches_ = branches;
  }

  /// Whether pull request checks use the forge.
  bool forge_enabled() const { return forge_enabled_; }

  /// Enable or disable the forge.
  void set_forge_enabled(bool enabled) { forge_enabled_ = enabled; }

  /// Base URL for the GitHub API.
  const std::string &api_base() const { return api_base_; }

  /// Set base URL for the GitHub API.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// Repository owner on the forge; empty means derive from the remote URL.
  const std::string &owner() const { return owner_; }

  /// Set the repository owner.
  void set_owner(const std::string &owner) { owner_ = owner; }

  /// Repository name on the forge; empty means derive from the remote URL.
  const std::string &repo() const { return repo_; }

  /// Set the repository name.
  void set_repo(const std::string &repo) { repo_ = repo; }

  /// Access token given directly in the configuration.
  const std::string &token() const { return token_; }

  /// Set the access token.
  void set_token(const std::string &token) { token_ = token; }

  /// File holding access tokens.
  const std::string &token_file() const { return token_file_; }

  /// Set the token file path.
  void set_token_file(const std::string &path) { token_file_ = path; }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(int t) { http_timeout_ = t; }

  /// Number of HTTP retry attempts.
  int http_retries() const { return http_retries_; }

  /// Set number of HTTP retry attempts.
  void set_http_retries(int r) { http_retries_ = r; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files.
  void set_log_rotate(int rotate) { log_rotate_ = rotate < 0 ? 0 : rotate; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace the per-category log level overrides.
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  /// Settings consumed by the branch commands.
  BranchSettings branch_settings() const;

  /**
   * Check the loaded values and repair the ones with safe fallbacks.
   *
   * @return One message per problem found. Problems are logged as warnings.
   */
  std::vector<std::string> validate();

  /**
   * Load configuration from a YAML, TOML, or JSON file.
   *
   * @param path Path to the configuration file.
   * @return Parsed configuration object.
   */
  static Config from_file(const std::string &path);

  /**
   * Load configuration from a JSON object.
   *
   * @param j JSON object containing configuration values.
   * @return Parsed configuration object.
   */
  static Config from_json(const nlohmann::json &j);

private:
  void load_json(const nlohmann::json &j);

  bool verbose_ = false;
  bool quiet_ = false;
  std::string base_branch_ = "origin/develop";
  std::string remote_ = "origin";
  std::vector<std::string> protected_branches_{"develop", "main", "master"};
  bool forge_enabled_ = true;
  std::string api_base_ = "https://api.github.com";
  std::string owner_;
  std::string repo_;
  std::string token_;
  std::string token_file_;
  int http_timeout_ = 30;
  int http_retries_ = 3;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace stud

#endif // STUD_CONFIG_HPP
