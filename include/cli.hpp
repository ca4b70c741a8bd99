/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for stud.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef STUD_CLI_HPP
#define STUD_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace stud {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Command selected on the command line.
enum class CliCommand {
  None,          ///< No command given
  BranchesClean, ///< `branches clean`
  BranchesList   ///< `branches list`
};

/**
 * Parsed command line options supplied via the CLI.
 *
 * `*_explicit` members record whether the value came from the command line so
 * that it can override the configuration file.
 */
struct CliOptions {
  CliCommand command{CliCommand::None}; ///< Selected subcommand
  int verbose{0};                  ///< Number of `-v` flags
  std::string config_file;         ///< Optional path to configuration file
  std::string log_level = "info";  ///< Logging verbosity level
  bool log_level_explicit{false};  ///< True if CLI set the log level
  std::string log_file;            ///< Optional path to rotating log file
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
  std::string base_branch;         ///< Base reference override
  std::string remote;              ///< Remote name override
  std::vector<std::string>
      protected_branches;          ///< Replaces the configured protected set
  std::string token;               ///< Access token
  std::string api_base;            ///< Base URL for GitHub API
  int http_timeout = 30;           ///< HTTP timeout in seconds
  bool http_timeout_explicit{false}; ///< True if CLI set the timeout
  int http_retries = 3;            ///< Number of HTTP retries
  bool http_retries_explicit{false}; ///< True if CLI set the retry count
  bool no_forge{false};            ///< Skip pull request checks
  bool quiet{false};               ///< `branches clean`: no prompts
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit When parsing fails or `--help`/`--version` was given.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace stud

#endif // STUD_CLI_HPP
