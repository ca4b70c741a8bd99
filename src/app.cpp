#include "app.hpp"
#include "branch_cleaner.hpp"
#include "branch_lister.hpp"
#include "github_client.hpp"
#include "log.hpp"
#include "token_loader.hpp"
#include <exception>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace stud {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

/**
 * Execute the start-up sequence.
 *
 * This routine orchestrates CLI parsing, configuration loading and logger
 * initialization. Commands run later through execute().
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  if (!options_.config_file.empty()) {
    try {
      config_ = Config::from_file(options_.config_file);
    } catch (const std::exception &e) {
      app_log()->error("Cannot load configuration {}: {}",
                       options_.config_file, e.what());
      should_exit_ = true;
      return 1;
    }
  }
  apply_cli_overrides();
  try {
    setup_logging();
  } catch (const spdlog::spdlog_ex &e) {
    app_log()->error("Cannot set up logging: {}", e.what());
    should_exit_ = true;
    return 1;
  }
  config_.validate();
  if (options_.command == CliCommand::None) {
    app_log()->error("No command given; see --help");
    should_exit_ = true;
    return 1;
  }
  return 0;
}

void App::apply_cli_overrides() {
  if (!options_.base_branch.empty()) {
    config_.set_base_branch(options_.base_branch);
  }
  if (!options_.remote.empty()) {
    config_.set_remote(options_.remote);
  }
  if (!options_.protected_branches.empty()) {
    config_.set_protected_branches(options_.protected_branches);
  }
  if (!options_.api_base.empty()) {
    config_.set_api_base(options_.api_base);
  }
  if (options_.http_timeout_explicit) {
    config_.set_http_timeout(options_.http_timeout);
  }
  if (options_.http_retries_explicit) {
    config_.set_http_retries(options_.http_retries);
  }
  if (options_.no_forge) {
    config_.set_forge_enabled(false);
  }
  if (options_.quiet) {
    config_.set_quiet(true);
  }
  if (options_.verbose > 0) {
    config_.set_verbose(true);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (!options_.log_categories.empty()) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(categories);
  }
}

void App::setup_logging() const {
  LogOptions log_options;
  if (options_.log_level_explicit) {
    log_options.level =
        parse_log_level(options_.log_level).value_or(spdlog::level::info);
  } else if (options_.verbose > 0) {
    log_options.level = level_from_verbosity(options_.verbose);
  } else if (config_.log_level() != "info") {
    auto level = parse_log_level(config_.log_level());
    if (!level) {
      app_log()->warn("Unknown log level '{}' in configuration; using info",
                      config_.log_level());
    }
    log_options.level = level.value_or(spdlog::level::info);
  } else if (config_.verbose()) {
    log_options.level = spdlog::level::debug;
  }
  log_options.pattern = config_.log_pattern();
  log_options.file = config_.log_file();
  log_options.rotate_files = static_cast<std::size_t>(config_.log_rotate());
  init_logger(log_options);
  configure_log_categories(config_.log_categories());
}

std::unique_ptr<PullRequestProvider>
App::make_provider(VersionControlRepository &repo) const {
  if (!config_.forge_enabled()) {
    app_log()->debug("Forge disabled");
    return nullptr;
  }
  std::string owner = config_.owner();
  std::string name = config_.repo();
  if (owner.empty() || name.empty()) {
    auto url = repo.remote_url(config_.remote());
    auto parsed = url ? parse_github_repo_from_url(*url) : std::nullopt;
    if (!parsed) {
      app_log()->debug("Remote '{}' is not a GitHub repository; pull request "
                       "checks disabled",
                       config_.remote());
      return nullptr;
    }
    if (owner.empty())
      owner = parsed->first;
    if (name.empty())
      name = parsed->second;
  }
  std::optional<std::string> token;
  try {
    token = resolve_token(options_.token, config_.token(),
                          config_.token_file());
  } catch (const std::exception &e) {
    app_log()->warn("Cannot read token file {}: {}", config_.token_file(),
                    e.what());
  }
  if (!token) {
    app_log()->debug("No GitHub token available; pull request checks "
                     "disabled");
    return nullptr;
  }
  app_log()->debug("Using GitHub repository {}/{}", owner, name);
  return std::make_unique<GitHubClient>(*token, owner, name, nullptr,
                                        config_.http_timeout() * 1000,
                                        config_.http_retries(),
                                        config_.api_base());
}

int App::execute(VersionControlRepository &repo, PullRequestProvider *provider,
                 UserInteraction &ui, Console &console) const {
  switch (options_.command) {
  case CliCommand::BranchesClean: {
    BranchCleaner cleaner(repo, provider, ui, console,
                          config_.branch_settings());
    return cleaner.run(config_.quiet());
  }
  case CliCommand::BranchesList: {
    BranchLister lister(repo, provider, console, config_.branch_settings());
    return lister.run();
  }
  case CliCommand::None:
    break;
  }
  app_log()->error("No command given; see --help");
  return 1;
}

} // namespace stud
