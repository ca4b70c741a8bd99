/**
 * @file git_repository.cpp
 * @brief Git command adapter for the branch commands.
 *
 * Runs git without a shell and converts its exit codes and messages into the
 * typed results consumed by the cleanup engine.
 */
#include "git_repository.hpp"
#include "log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>
#include <poll.h>
#include <spawn.h>
#include <sstream>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#include <spdlog/spdlog.h>

extern char **environ;

namespace stud {

namespace {

std::shared_ptr<spdlog::logger> git_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("git");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string trim(const std::string &s) {
  auto first = std::find_if_not(
      s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  if (first == s.end())
    return {};
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return last <= first ? std::string{} : std::string(first, last);
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::stringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    line = trim(line);
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

std::string join_args(const std::vector<std::string> &argv) {
  std::string joined;
  for (const auto &arg : argv) {
    if (!joined.empty())
      joined += ' ';
    joined += arg;
  }
  return joined;
}

/// Closes a file descriptor on scope exit.
struct FdGuard {
  int fd{-1};
  ~FdGuard() {
    if (fd >= 0)
      ::close(fd);
  }
  void reset() {
    if (fd >= 0)
      ::close(fd);
    fd = -1;
  }
};

/// RAII holder for posix_spawn file actions.
struct SpawnActions {
  posix_spawn_file_actions_t actions;
  SpawnActions() { posix_spawn_file_actions_init(&actions); }
  ~SpawnActions() { posix_spawn_file_actions_destroy(&actions); }
  SpawnActions(const SpawnActions &) = delete;
  SpawnActions &operator=(const SpawnActions &) = delete;
};

} // namespace

std::string to_string(DeleteStatus status) {
  switch (status) {
  case DeleteStatus::Deleted:
    return "deleted";
  case DeleteStatus::NotFullyMerged:
    return "not fully merged";
  case DeleteStatus::NotWritable:
    return "not writable";
  case DeleteStatus::OtherError:
    break;
  }
  return "error";
}

std::vector<std::string> untranslated_environment(char *const *env) {
  static const std::array<std::string_view, 4> dropped = {
      "LANGUAGE=", "LANG=", "LC_ALL=", "LC_MESSAGES="};
  std::vector<std::string> entries;
  for (char *const *it = env; it != nullptr && *it != nullptr; ++it) {
    std::string_view entry(*it);
    bool drop = std::any_of(dropped.begin(), dropped.end(),
                            [&](std::string_view prefix) {
                              return entry.substr(0, prefix.size()) == prefix;
                            });
    if (!drop)
      entries.emplace_back(entry);
  }
  entries.emplace_back("LC_ALL=C");
  return entries;
}

CommandResult run_command(const std::vector<std::string> &argv) {
  CommandResult result;
  if (argv.empty()) {
    result.exit_code = 127;
    result.err = "empty command";
    return result;
  }
  int out_pipe[2];
  int err_pipe[2];
  if (::pipe(out_pipe) != 0) {
    result.exit_code = 127;
    result.err = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }
  FdGuard out_read{out_pipe[0]};
  FdGuard out_write{out_pipe[1]};
  if (::pipe(err_pipe) != 0) {
    result.exit_code = 127;
    result.err = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }
  FdGuard err_read{err_pipe[0]};
  FdGuard err_write{err_pipe[1]};

  SpawnActions actions;
  posix_spawn_file_actions_addclose(&actions.actions, out_read.fd);
  posix_spawn_file_actions_addclose(&actions.actions, err_read.fd);
  posix_spawn_file_actions_adddup2(&actions.actions, out_write.fd,
                                   STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions.actions, err_write.fd,
                                   STDERR_FILENO);
  posix_spawn_file_actions_addclose(&actions.actions, out_write.fd);
  posix_spawn_file_actions_addclose(&actions.actions, err_write.fd);

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &s : argv)
    cargv.push_back(const_cast<char *>(s.c_str()));
  cargv.push_back(nullptr);

  const auto env = untranslated_environment(environ);
  std::vector<char *> cenv;
  cenv.reserve(env.size() + 1);
  for (const auto &s : env)
    cenv.push_back(const_cast<char *>(s.c_str()));
  cenv.push_back(nullptr);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, cargv[0], &actions.actions, nullptr,
                        cargv.data(), cenv.data());
  out_write.reset();
  err_write.reset();
  if (rc != 0) {
    result.exit_code = 127;
    result.err = "posix_spawnp('" + argv[0] + "') failed: " +
                 std::strerror(rc);
    return result;
  }

  std::array<pollfd, 2> fds{{{out_read.fd, POLLIN, 0}, {err_read.fd, POLLIN, 0}}};
  std::array<std::string *, 2> sinks{&result.out, &result.err};
  char buffer[4096];
  int open_streams = 2;
  while (open_streams > 0) {
    int ready = ::poll(fds.data(), fds.size(), -1);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        sinks[i]->append(buffer, static_cast<std::size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.exit_code = 127;
      result.err += std::string("waitpid failed: ") + std::strerror(errno);
      return result;
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else {
    result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
  }
  return result;
}

DeleteStatus classify_delete_failure(const std::string &err) {
  const std::string lower = to_lower_copy(err);
  if (lower.find("not fully merged") != std::string::npos) {
    return DeleteStatus::NotFullyMerged;
  }
  static const std::array<std::string_view, 5> not_writable = {
      "permission denied", "read-only", "unable to create", "cannot lock ref",
      "unable to delete"};
  for (const auto &needle : not_writable) {
    if (lower.find(needle) != std::string::npos) {
      return DeleteStatus::NotWritable;
    }
  }
  return DeleteStatus::OtherError;
}

std::optional<std::pair<std::string, std::string>>
parse_github_repo_from_url(const std::string &url_in) {
  std::string url = trim(url_in);
  while (!url.empty() && url.back() == '.')
    url.pop_back();
  if (url.empty())
    return std::nullopt;

  auto pos = url.find("github.com");
  if (pos == std::string::npos)
    return std::nullopt;
  std::size_t start = pos + std::string_view("github.com").size();
  if (start >= url.size() || (url[start] != '/' && url[start] != ':'))
    return std::nullopt;
  std::string remainder = url.substr(start + 1);
  constexpr std::string_view git_suffix = ".git";
  if (remainder.size() > git_suffix.size() &&
      remainder.compare(remainder.size() - git_suffix.size(),
                        git_suffix.size(), git_suffix.data()) == 0) {
    remainder.erase(remainder.size() - git_suffix.size());
  }
  if (!remainder.empty() && remainder.back() == '/')
    remainder.pop_back();
  auto slash = remainder.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 >= remainder.size())
    return std::nullopt;
  std::string owner = remainder.substr(0, slash);
  std::string repo = remainder.substr(slash + 1);
  if (repo.find('/') != std::string::npos)
    return std::nullopt;
  return std::make_pair(owner, repo);
}

GitRepository::GitRepository(CommandRunner runner, std::string git_binary)
    : runner_(runner ? std::move(runner) : CommandRunner(run_command)),
      git_binary_(std::move(git_binary)) {}

CommandResult GitRepository::git(const std::vector<std::string> &args) {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(git_binary_);
  argv.insert(argv.end(), args.begin(), args.end());
  git_log()->trace("Running {}", join_args(argv));
  CommandResult res = runner_(argv);
  git_log()->trace("{} exited with {}", join_args(argv), res.exit_code);
  return res;
}

CommandResult GitRepository::git_checked(const std::vector<std::string> &args,
                                         const std::string &what) {
  CommandResult res = git(args);
  if (res.exit_code != 0) {
    std::string details = "git " + join_args(args) + " (exit " +
                          std::to_string(res.exit_code) + "): " +
                          trim(res.err);
    git_log()->debug("{}", details);
    throw GitError("Failed to " + what + ".", details);
  }
  return res;
}

std::vector<std::string> GitRepository::list_local_branches() {
  auto res = git_checked(
      {"for-each-ref", "--format=%(refname:short)", "refs/heads/"},
      "list local branches");
  return split_lines(res.out);
}

std::vector<std::string>
GitRepository::list_remote_branches(const std::string &remote) {
  auto res = git_checked({"for-each-ref", "--format=%(refname:short)",
                          "refs/remotes/" + remote + "/"},
                         "list branches of remote '" + remote + "'");
  const std::string prefix = remote + "/";
  std::vector<std::string> branches;
  for (const auto &line : split_lines(res.out)) {
    if (line.rfind(prefix, 0) != 0)
      continue;
    std::string name = line.substr(prefix.size());
    // The symbolic origin/HEAD ref shortens to the bare remote name.
    if (name.empty() || name == "HEAD")
      continue;
    branches.push_back(name);
  }
  return branches;
}

std::string GitRepository::current_branch_name() {
  auto res = git_checked({"rev-parse", "--abbrev-ref", "HEAD"},
                         "determine the current branch");
  return trim(res.out);
}

MergeCheckResult GitRepository::is_merged_into(const std::string &branch,
                                               const std::string &base_ref) {
  auto res = git({"merge-base", "--is-ancestor", "refs/heads/" + branch,
                  base_ref});
  if (res.exit_code == 0) {
    return {MergeStatus::Merged, {}};
  }
  if (res.exit_code == 1) {
    return {MergeStatus::NotMerged, {}};
  }
  std::string detail = trim(res.err);
  if (detail.empty())
    detail = "git merge-base exited with " + std::to_string(res.exit_code);
  return {MergeStatus::Unknown, detail};
}

DeleteResult GitRepository::delete_local_branch(const std::string &branch,
                                                bool force) {
  auto res = git({"branch", force ? "-D" : "-d", branch});
  if (res.exit_code == 0) {
    return {DeleteStatus::Deleted, {}};
  }
  std::string detail = trim(res.err);
  return {classify_delete_failure(detail), detail};
}

DeleteResult GitRepository::delete_remote_branch(const std::string &remote,
                                                 const std::string &branch) {
  auto res = git({"push", remote, "--delete", branch});
  if (res.exit_code == 0) {
    return {DeleteStatus::Deleted, {}};
  }
  std::string detail = trim(res.err);
  DeleteStatus status = classify_delete_failure(detail);
  if (status == DeleteStatus::NotFullyMerged)
    status = DeleteStatus::OtherError;
  return {status, detail};
}

bool GitRepository::remote_branch_exists(const std::string &remote,
                                         const std::string &branch) {
  auto res = git_checked({"ls-remote", "--heads", remote, "refs/heads/" + branch},
                         "query remote '" + remote + "'");
  return !trim(res.out).empty();
}

std::optional<std::string>
GitRepository::remote_url(const std::string &remote) {
  auto res = git({"config", "--get", "remote." + remote + ".url"});
  if (res.exit_code != 0)
    return std::nullopt;
  std::string url = trim(res.out);
  if (url.empty())
    return std::nullopt;
  return url;
}

} // namespace stud
