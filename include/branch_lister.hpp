#ifndef STUD_BRANCH_LISTER_HPP
#define STUD_BRANCH_LISTER_HPP

#include "branch_inventory.hpp"
#include "git_repository.hpp"
#include "pull_request_index.hpp"
#include "user_interaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace stud {

/// Lifecycle status shown by `branches list`.
enum class BranchStatus {
  ActivePullRequest, ///< Open same-repository pull request
  Merged,            ///< Merged and still on the remote
  Stale,             ///< Merged and gone from the remote
  Unknown,           ///< Merge check failed
  Active             ///< Anything else
};

/// Label used in the listing ("active-pr", "merged", ...).
std::string to_string(BranchStatus status);

/// One row of the listing.
struct BranchRow {
  std::string name;
  bool current{false};
  bool on_remote{false};
  BranchStatus status{BranchStatus::Active};
  std::optional<PullRequestRecord> pull_request;
};

/**
 * Decide the status of a branch.
 *
 * @param merged Merge check result against the base ref.
 * @param on_remote Whether the remote branch set contains the branch.
 * @param pr Associated pull request, if any.
 */
BranchStatus branch_status(const MergeCheckResult &merged, bool on_remote,
                           const std::optional<PullRequestRecord> &pr);

/** The `branches list` command. */
class BranchLister {
public:
  BranchLister(VersionControlRepository &repo, PullRequestProvider *provider,
               Console &console, BranchSettings settings);

  /**
   * Collect the rows for every local branch.
   * @throws GitError When the inventory cannot be read.
   */
  std::vector<BranchRow> collect();

  /**
   * Print the listing.
   * @return 0, or 1 when the inventory cannot be read.
   */
  int run();

private:
  void print_table(const std::vector<BranchRow> &rows);

  VersionControlRepository &repo_;
  PullRequestProvider *provider_;
  Console &console_;
  BranchSettings settings_;
};

} // namespace stud

#endif // STUD_BRANCH_LISTER_HPP
