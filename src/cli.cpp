#include "cli.hpp"
#include "log.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace stud {

namespace {

constexpr const char *kVersionString = "0.1.0";

std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 11> categories = {
      "app",
      "cli",
      "config",
      "git",
      "github.client",
      "branches.inventory",
      "branches.index",
      "branches.eligibility",
      "branches.cleaner",
      "branches.list",
      "logging"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "branches.cleaner=debug).";
  return oss.str();
}

} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"stud developer workflow command line"};
  app.footer(log_category_help_text());
  app.require_subcommand(1);
  app.fallthrough();
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose,
               "Increase verbosity (-v debug, -vv trace)")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "stud " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  auto *log_level_opt =
      app.add_option(
             "-G,--log-level", options.log_level,
             "Set logging level (trace, debug, info, warn, error, critical, "
             "off)")
          ->type_name("LEVEL")
          ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning",
                                 "error", "critical", "off"}))
          ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  std::vector<std::string> log_category_args;
  app.add_option("--log-category", log_category_args,
                 "Override a logging category (NAME or NAME=LEVEL)")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_option("--base-branch", options.base_branch,
                 "Reference merge status is checked against")
      ->type_name("REF")
      ->group("Git");
  app.add_option("--remote", options.remote, "Remote holding shared branches")
      ->type_name("NAME")
      ->group("Git");
  app.add_option("-B,--protected-branch", options.protected_branches,
                 "Branch that is never deleted (repeatable)")
      ->type_name("NAME")
      ->group("Git");

  app.add_option("--token", options.token, "GitHub access token")
      ->type_name("TOKEN")
      ->group("Forge");
  app.add_option("--api-base", options.api_base, "Base URL for the GitHub API")
      ->type_name("URL")
      ->group("Forge");
  auto *timeout_opt =
      app.add_option("--http-timeout", options.http_timeout,
                     "HTTP timeout in seconds")
          ->type_name("SECONDS")
          ->check(CLI::PositiveNumber)
          ->group("Forge");
  auto *retries_opt =
      app.add_option("--http-retries", options.http_retries,
                     "Retries for transient HTTP failures")
          ->type_name("N")
          ->check(CLI::NonNegativeNumber)
          ->group("Forge");
  app.add_flag("--no-forge", options.no_forge,
               "Skip pull request checks against the forge")
      ->group("Forge");

  auto *branches = app.add_subcommand("branches", "Inspect and clean branches");
  branches->require_subcommand(1);
  branches->fallthrough();
  auto *clean = branches->add_subcommand(
      "clean", "Delete local branches merged into the base branch");
  clean->fallthrough();
  clean->add_flag("-q,--quiet", options.quiet,
                  "Do not ask for confirmation; keep remote branches");
  auto *list = branches->add_subcommand(
      "list", "Show local branches with their merge and pull request status");
  list->fallthrough();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  for (const auto &value : log_category_args) {
    auto pos = value.find('=');
    std::string name = pos == std::string::npos ? value : value.substr(0, pos);
    std::string level =
        pos == std::string::npos ? std::string{} : value.substr(pos + 1);
    if (name.empty()) {
      std::cerr << "--log-category: category name must not be empty"
                << std::endl;
      throw CliParseExit(1);
    }
    options.log_categories[name] = level.empty() ? "debug" : level;
  }
  if (clean->parsed()) {
    options.command = CliCommand::BranchesClean;
  } else if (list->parsed()) {
    options.command = CliCommand::BranchesList;
  }
  options.log_level_explicit = log_level_opt->count() > 0U;
  options.http_timeout_explicit = timeout_opt->count() > 0U;
  options.http_retries_explicit = retries_opt->count() > 0U;
  cli_log()->trace("Parsed command line ({} argument(s))", argc);
  return options;
}

} // namespace stud
