/**
 * @file app.hpp
 * @brief Application entry point and orchestrator for stud.
 *
 * Declares the App class, which parses the command line, merges it with the
 * configuration file, sets up logging and dispatches the selected command.
 */

#ifndef STUD_APP_HPP
#define STUD_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "git_repository.hpp"
#include "pull_request_provider.hpp"
#include "user_interaction.hpp"
#include <memory>

namespace stud {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * Parse the command line, load the configuration and initialise logging.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /**
   * Build the forge client for @p repo.
   *
   * Owner and repository come from the configuration or, when unset, from
   * the URL of the configured remote.
   *
   * @return Client, or `nullptr` when the forge is disabled or lacks a token
   *         or repository coordinates.
   */
  std::unique_ptr<PullRequestProvider>
  make_provider(VersionControlRepository &repo) const;

  /**
   * Run the selected command against the given collaborators.
   *
   * @return Process exit code of the command.
   */
  int execute(VersionControlRepository &repo, PullRequestProvider *provider,
              UserInteraction &ui, Console &console) const;

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Configuration with command line overrides applied.
  const Config &config() const { return config_; }

  /**
   * Determine whether the application should exit immediately after
   * `run()` completes.
   */
  bool should_exit() const { return should_exit_; }

private:
  void apply_cli_overrides();
  void setup_logging() const;

  CliOptions options_;
  Config config_;
  bool should_exit_{false};
};

} // namespace stud

#endif // STUD_APP_HPP
