#ifndef STUD_BRANCH_INVENTORY_HPP
#define STUD_BRANCH_INVENTORY_HPP

#include "git_repository.hpp"
#include <set>
#include <string>

namespace stud {

/// Branch names that must never be deleted automatically.
using ProtectedBranches = std::set<std::string>;

/// Default protected set: the main-line branches.
ProtectedBranches default_protected_branches();

/// Repository settings shared by the branch commands.
struct BranchSettings {
  std::string base_ref{"origin/develop"}; ///< Merge status reference
  std::string remote{"origin"};           ///< Remote holding shared branches
  ProtectedBranches protected_branches{default_protected_branches()};
};

/**
 * A branch as seen by one invocation, with flags derived from the inventory.
 */
struct Branch {
  std::string name;
  bool is_local{false};     ///< Present in the local branch set
  bool is_remote{false};    ///< Present in the remote branch set
  bool is_current{false};   ///< Checked out
  bool is_protected{false}; ///< Member of the protected set
};

/**
 * Snapshot of the local and remote branch sets and the checked out branch.
 */
class BranchInventory {
public:
  BranchInventory(std::set<std::string> local, std::set<std::string> remote,
                  std::string current);

  /**
   * Read the inventory from a repository.
   *
   * @param repo Repository to query.
   * @param remote Remote whose branches are listed.
   * @throws GitError When any of the lists cannot be read. There is no retry;
   *         nothing can be decided without the inventory.
   */
  static BranchInventory collect(VersionControlRepository &repo,
                                 const std::string &remote);

  const std::set<std::string> &local_branches() const { return local_; }
  const std::set<std::string> &remote_branches() const { return remote_; }
  const std::string &current_branch() const { return current_; }

  /// Derive the flags of @p name against this inventory.
  Branch branch(const std::string &name,
                const ProtectedBranches &protected_branches) const;

private:
  std::set<std::string> local_;
  std::set<std::string> remote_;
  std::string current_;
};

} // namespace stud

#endif // STUD_BRANCH_INVENTORY_HPP
