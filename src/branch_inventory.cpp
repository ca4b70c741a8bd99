#include "branch_inventory.hpp"
#include "log.hpp"
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace stud {

namespace {
std::shared_ptr<spdlog::logger> inventory_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("branches.inventory");
  }();
  return logger;
}
} // namespace

ProtectedBranches default_protected_branches() {
  return {"develop", "main", "master"};
}

BranchInventory::BranchInventory(std::set<std::string> local,
                                 std::set<std::string> remote,
                                 std::string current)
    : local_(std::move(local)), remote_(std::move(remote)),
      current_(std::move(current)) {}

BranchInventory BranchInventory::collect(VersionControlRepository &repo,
                                         const std::string &remote) {
  inventory_log()->debug("Fetching local branches");
  std::vector<std::string> local = repo.list_local_branches();
  inventory_log()->debug("Fetching branches of remote '{}'", remote);
  std::vector<std::string> remote_list = repo.list_remote_branches(remote);
  std::string current = repo.current_branch_name();
  inventory_log()->debug("{} local, {} remote branch(es), current '{}'",
                         local.size(), remote_list.size(), current);
  return BranchInventory({local.begin(), local.end()},
                         {remote_list.begin(), remote_list.end()},
                         std::move(current));
}

Branch BranchInventory::branch(const std::string &name,
                               const ProtectedBranches &protected_branches) const {
  Branch b;
  b.name = name;
  b.is_local = local_.count(name) > 0;
  b.is_remote = remote_.count(name) > 0;
  b.is_current = !current_.empty() && name == current_;
  b.is_protected = protected_branches.count(name) > 0;
  return b;
}

} // namespace stud
