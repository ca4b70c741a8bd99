/**
 * @file git_repository.hpp
 * @brief Version control access used by the branch commands.
 *
 * Declares the repository interface consumed by the cleanup engine, the
 * result types for merge checks and deletions, and the git-backed
 * implementation.
 */

#ifndef STUD_GIT_REPOSITORY_HPP
#define STUD_GIT_REPOSITORY_HPP

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stud {

/**
 * Raised when a git command needed to proceed fails.
 *
 * The message is suitable for users; technical details carry the command and
 * its stderr.
 */
class GitError : public std::runtime_error {
public:
  GitError(const std::string &message, std::string technical_details)
      : std::runtime_error(message),
        technical_details_(std::move(technical_details)) {}

  /// Command line and stderr of the failing invocation.
  const std::string &technical_details() const noexcept {
    return technical_details_;
  }

private:
  std::string technical_details_;
};

/// Outcome of asking whether a branch is merged into a base ref.
enum class MergeStatus {
  Merged,    ///< Branch tip is reachable from the base ref
  NotMerged, ///< Branch has commits the base ref lacks
  Unknown    ///< The check itself failed
};

/// Merge check result with the failure detail for `Unknown`.
struct MergeCheckResult {
  MergeStatus status{MergeStatus::Unknown};
  std::string detail;
};

/// Outcome classes of a branch deletion.
enum class DeleteStatus {
  Deleted,        ///< Branch removed
  NotFullyMerged, ///< Git refused a safe delete of unmerged work
  NotWritable,    ///< Ref storage could not be modified
  OtherError      ///< Any other failure
};

/// Deletion result with the git message for failures.
struct DeleteResult {
  DeleteStatus status{DeleteStatus::OtherError};
  std::string detail;

  bool ok() const { return status == DeleteStatus::Deleted; }
};

/// Human readable name of a delete status.
std::string to_string(DeleteStatus status);

/** Version control operations needed by the branch commands. */
class VersionControlRepository {
public:
  virtual ~VersionControlRepository() = default;

  /**
   * List local branch names.
   * @throws GitError When the branch list cannot be read.
   */
  virtual std::vector<std::string> list_local_branches() = 0;

  /**
   * List branch names known under @p remote, without the remote prefix.
   * @throws GitError When the remote-tracking refs cannot be read.
   */
  virtual std::vector<std::string>
  list_remote_branches(const std::string &remote) = 0;

  /**
   * Name of the checked out branch.
   * @throws GitError When HEAD cannot be resolved.
   */
  virtual std::string current_branch_name() = 0;

  /// Check whether @p branch is merged into @p base_ref.
  virtual MergeCheckResult is_merged_into(const std::string &branch,
                                          const std::string &base_ref) = 0;

  /// Delete a local branch, optionally forcing unmerged deletes.
  virtual DeleteResult delete_local_branch(const std::string &branch,
                                           bool force = false) = 0;

  /// Delete @p branch on @p remote.
  virtual DeleteResult delete_remote_branch(const std::string &remote,
                                            const std::string &branch) = 0;

  /**
   * Ask the remote itself whether @p branch exists, bypassing local
   * remote-tracking refs.
   * @throws GitError When the remote cannot be queried.
   */
  virtual bool remote_branch_exists(const std::string &remote,
                                    const std::string &branch) = 0;

  /**
   * URL configured for @p remote.
   * @return URL or `std::nullopt` when the remote is not configured.
   */
  virtual std::optional<std::string>
  remote_url(const std::string &remote) = 0;
};

/// Captured result of a child process.
struct CommandResult {
  int exit_code{-1};
  std::string out;
  std::string err;
};

/// Executes an argument vector and captures its output.
using CommandRunner =
    std::function<CommandResult(const std::vector<std::string> &)>;

/**
 * Copy of an environment with message translation disabled.
 *
 * `LANGUAGE` and the `LC_*`/`LANG` variables that select the message language
 * are removed and `LC_ALL=C` is appended, so git prints the untranslated
 * messages classify_delete_failure() expects.
 *
 * @param env Null-terminated `NAME=value` array, e.g. `environ`.
 * @return Entries for the child process.
 */
std::vector<std::string> untranslated_environment(char *const *env);

/**
 * Run a command without a shell using `posix_spawnp`, capturing stdout and
 * stderr. The child gets untranslated_environment() of this process.
 *
 * @param argv Program followed by its arguments.
 * @return Exit status and captured streams. A spawn failure reports exit code
 *         127 and the reason in `err`.
 */
CommandResult run_command(const std::vector<std::string> &argv);

/** Repository implementation driving the `git` executable. */
class GitRepository : public VersionControlRepository {
public:
  /**
   * @param runner Command runner; defaults to run_command().
   * @param git_binary Name or path of the git executable.
   */
  explicit GitRepository(CommandRunner runner = CommandRunner{},
                         std::string git_binary = "git");

  std::vector<std::string> list_local_branches() override;
  std::vector<std::string>
  list_remote_branches(const std::string &remote) override;
  std::string current_branch_name() override;
  MergeCheckResult is_merged_into(const std::string &branch,
                                  const std::string &base_ref) override;
  DeleteResult delete_local_branch(const std::string &branch,
                                   bool force = false) override;
  DeleteResult delete_remote_branch(const std::string &remote,
                                    const std::string &branch) override;
  bool remote_branch_exists(const std::string &remote,
                            const std::string &branch) override;
  std::optional<std::string> remote_url(const std::string &remote) override;

private:
  CommandResult git(const std::vector<std::string> &args);
  CommandResult git_checked(const std::vector<std::string> &args,
                            const std::string &what);

  CommandRunner runner_;
  std::string git_binary_;
};

/**
 * Classify a failed `git branch -d/-D` or `git push --delete` by its stderr.
 *
 * @param err Captured stderr.
 * @return Failure class; never `Deleted`.
 */
DeleteStatus classify_delete_failure(const std::string &err);

/**
 * Extract `owner` and `repo` from a GitHub remote URL.
 *
 * Supports `git@github.com:owner/repo.git`, `https://github.com/owner/repo`
 * and `ssh://git@github.com/owner/repo.git`.
 *
 * @param url Remote URL.
 * @return Owner/repository pair or `std::nullopt` for other hosts.
 */
std::optional<std::pair<std::string, std::string>>
parse_github_repo_from_url(const std::string &url);

} // namespace stud

#endif // STUD_GIT_REPOSITORY_HPP
