/**
 * @file branch_cleaner.hpp
 * @brief Deletion of merged branches.
 *
 * DeletionExecutor removes already classified branches one at a time and
 * records an outcome for each. BranchCleaner runs the whole `branches clean`
 * command: inventory, pull request lookup, classification and deletion.
 */

#ifndef STUD_BRANCH_CLEANER_HPP
#define STUD_BRANCH_CLEANER_HPP

#include "branch_eligibility.hpp"
#include "branch_inventory.hpp"
#include "git_repository.hpp"
#include "pull_request_provider.hpp"
#include "user_interaction.hpp"
#include <string>
#include <vector>

namespace stud {

/// Failure classes recorded for a deletion attempt.
enum class DeletionFailure {
  None,                        ///< Deleted as requested
  NotWritable,                 ///< Ref storage refused the change
  NotFullyMergedThenRecovered, ///< Stale remote ref, force delete succeeded
  NotFullyMergedThenFailed,    ///< Unmerged work or failed force delete
  RemoteFailure,               ///< Local copy deleted, remote delete failed
  Unknown                      ///< Any other error
};

/// Lowercase label ("none", "not-writable", ...).
std::string to_string(DeletionFailure failure);

/// What happened to one branch.
struct DeletionOutcome {
  std::string branch;
  bool local_deleted{false};
  bool remote_deleted{false};
  bool skipped{false}; ///< Protected branch refused before any git call
  DeletionFailure failure{DeletionFailure::None};
  std::string detail;
};

/**
 * Deletes eligible branches with stale remote ref recovery.
 *
 * Each branch is handled independently; a failure is recorded and the batch
 * continues.
 */
class DeletionExecutor {
public:
  DeletionExecutor(VersionControlRepository &repo, UserInteraction &ui,
                   Console &console, std::string remote,
                   ProtectedBranches protected_branches);

  /**
   * Delete the local-only batch, then the remote-tracked batch.
   *
   * Unless @p quiet, one confirmation covers both batches and each
   * remote-tracked branch asks separately before its remote copy is removed.
   * Quiet runs never delete remote copies.
   *
   * @return Number of branches whose local copy was deleted.
   */
  int delete_branches(const std::vector<std::string> &local_only,
                      const std::vector<std::string> &with_remote, bool quiet);

  /// Outcomes of the last run in processing order.
  const std::vector<DeletionOutcome> &outcomes() const { return outcomes_; }

  /// Whether the last run was declined at the confirmation prompt.
  bool cancelled() const { return cancelled_; }

private:
  DeletionOutcome delete_one(const std::string &branch, bool offer_remote,
                             bool quiet);
  void recover_stale_ref(DeletionOutcome &outcome,
                         const DeleteResult &first_attempt);
  void delete_remote_copy(DeletionOutcome &outcome);

  VersionControlRepository &repo_;
  UserInteraction &ui_;
  Console &console_;
  std::string remote_;
  ProtectedBranches protected_branches_;
  std::vector<DeletionOutcome> outcomes_;
  bool cancelled_{false};
};

/// Summary fold over deletion outcomes: branches whose local copy is gone.
int count_deleted(const std::vector<DeletionOutcome> &outcomes);

/**
 * The `branches clean` command.
 */
class BranchCleaner {
public:
  /**
   * @param repo Repository to clean.
   * @param provider Forge access or `nullptr` to skip pull request checks.
   * @param ui Confirmation prompts.
   * @param console Command output.
   * @param settings Base ref, remote and protected set.
   */
  BranchCleaner(VersionControlRepository &repo, PullRequestProvider *provider,
                UserInteraction &ui, Console &console, BranchSettings settings);

  /**
   * Run the cleanup.
   *
   * @param quiet Skip confirmations and keep remote copies.
   * @return Process exit code: 1 when the inventory cannot be read, otherwise
   *         0 whatever happened to individual branches.
   */
  int run(bool quiet);

  /// Branches deleted by the last run.
  int deleted_count() const { return deleted_; }

  /// Classification of the last run.
  const EligibleBranches &eligible() const { return eligible_; }

  /// Per-branch deletion outcomes of the last run.
  const std::vector<DeletionOutcome> &outcomes() const { return outcomes_; }

private:
  VersionControlRepository &repo_;
  PullRequestProvider *provider_;
  UserInteraction &ui_;
  Console &console_;
  BranchSettings settings_;
  EligibleBranches eligible_;
  std::vector<DeletionOutcome> outcomes_;
  int deleted_{0};
};

} // namespace stud

#endif // STUD_BRANCH_CLEANER_HPP
