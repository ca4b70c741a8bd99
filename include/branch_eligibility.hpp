#ifndef STUD_BRANCH_ELIGIBILITY_HPP
#define STUD_BRANCH_ELIGIBILITY_HPP

#include "branch_inventory.hpp"
#include "git_repository.hpp"
#include "pull_request_index.hpp"
#include <string>
#include <vector>

namespace stud {

/// Why a branch may or may not be deleted.
enum class EligibilityReason {
  Protected,       ///< Name is in the protected set
  Current,         ///< Branch is checked out
  OpenPullRequest, ///< An open same-repository pull request exists
  NotMerged,       ///< Branch is not merged into the base ref
  LookupFailed,    ///< Merge status could not be determined
  Eligible         ///< Safe to delete
};

/// Lowercase label ("protected", "current", "open-pr", ...).
std::string to_string(EligibilityReason reason);

/// Outcome of classifying one branch.
struct EligibilityDecision {
  std::string branch;
  bool eligible{false};
  EligibilityReason reason{EligibilityReason::NotMerged};
  std::string detail; ///< Merge check failure text for `LookupFailed`
};

/**
 * Applies the ordered deletion policy to single branches.
 *
 * Rules, first match wins: protected, current, open pull request, merge
 * status. A failing pull request lookup counts as "no pull request"; a
 * failing merge check blocks the branch.
 */
class EligibilityClassifier {
public:
  /**
   * @param repo Repository used for merge checks.
   * @param lookup Pull request lookup strategy.
   * @param base_ref Reference merge status is evaluated against.
   */
  EligibilityClassifier(VersionControlRepository &repo,
                        PullRequestLookup &lookup, std::string base_ref);

  /// Classify @p branch.
  EligibilityDecision classify(const Branch &branch);

private:
  VersionControlRepository &repo_;
  PullRequestLookup &lookup_;
  std::string base_ref_;
};

/// Eligible branches grouped by remote presence, plus every decision.
struct EligibleBranches {
  std::vector<std::string> local_only;  ///< Absent from the remote set
  std::vector<std::string> with_remote; ///< Present in the remote set
  std::vector<EligibilityDecision> decisions;
  bool current_skipped{false}; ///< The checked out branch was a candidate

  std::size_t size() const { return local_only.size() + with_remote.size(); }
  bool empty() const { return size() == 0; }
};

/**
 * Classify every local branch of @p inventory and partition the eligible ones.
 */
EligibleBranches
partition_eligible_branches(const BranchInventory &inventory,
                            EligibilityClassifier &classifier,
                            const ProtectedBranches &protected_branches);

} // namespace stud

#endif // STUD_BRANCH_ELIGIBILITY_HPP
