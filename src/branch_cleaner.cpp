#include "branch_cleaner.hpp"
#include "log.hpp"
#include "pull_request_index.hpp"
#include <optional>
#include <spdlog/spdlog.h>
#include <utility>

namespace stud {

namespace {
std::shared_ptr<spdlog::logger> cleaner_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("branches.cleaner");
  }();
  return logger;
}

DeletionFailure failure_for(DeleteStatus status) {
  switch (status) {
  case DeleteStatus::Deleted:
    return DeletionFailure::None;
  case DeleteStatus::NotWritable:
    return DeletionFailure::NotWritable;
  case DeleteStatus::NotFullyMerged:
    return DeletionFailure::NotFullyMergedThenFailed;
  case DeleteStatus::OtherError:
    break;
  }
  return DeletionFailure::Unknown;
}
} // namespace

std::string to_string(DeletionFailure failure) {
  switch (failure) {
  case DeletionFailure::None:
    return "none";
  case DeletionFailure::NotWritable:
    return "not-writable";
  case DeletionFailure::NotFullyMergedThenRecovered:
    return "not-fully-merged-then-recovered";
  case DeletionFailure::NotFullyMergedThenFailed:
    return "not-fully-merged-then-failed";
  case DeletionFailure::RemoteFailure:
    return "remote-failure";
  case DeletionFailure::Unknown:
    break;
  }
  return "unknown";
}

int count_deleted(const std::vector<DeletionOutcome> &outcomes) {
  int count = 0;
  for (const auto &o : outcomes) {
    if (o.local_deleted)
      ++count;
  }
  return count;
}

DeletionExecutor::DeletionExecutor(VersionControlRepository &repo,
                                   UserInteraction &ui, Console &console,
                                   std::string remote,
                                   ProtectedBranches protected_branches)
    : repo_(repo), ui_(ui), console_(console), remote_(std::move(remote)),
      protected_branches_(std::move(protected_branches)) {}

int DeletionExecutor::delete_branches(
    const std::vector<std::string> &local_only,
    const std::vector<std::string> &with_remote, bool quiet) {
  outcomes_.clear();
  cancelled_ = false;
  const std::size_t total = local_only.size() + with_remote.size();
  if (total == 0) {
    return 0;
  }
  if (!quiet &&
      !ui_.confirm("Delete " + std::to_string(total) + " branch(es)?", true)) {
    cleaner_log()->info("Cleanup declined, nothing deleted");
    cancelled_ = true;
    return 0;
  }
  for (const auto &branch : local_only) {
    outcomes_.push_back(delete_one(branch, false, quiet));
  }
  for (const auto &branch : with_remote) {
    outcomes_.push_back(delete_one(branch, true, quiet));
  }
  int deleted = count_deleted(outcomes_);
  cleaner_log()->debug("Deleted {} of {} branch(es)", deleted, total);
  return deleted;
}

DeletionOutcome DeletionExecutor::delete_one(const std::string &branch,
                                             bool offer_remote, bool quiet) {
  DeletionOutcome outcome;
  outcome.branch = branch;
  if (protected_branches_.count(branch) > 0) {
    cleaner_log()->warn("Refusing to delete protected branch {}", branch);
    outcome.skipped = true;
    return outcome;
  }

  console_.line("Deleting " + branch + "...");
  DeleteResult result = repo_.delete_local_branch(branch, false);
  if (result.ok()) {
    outcome.local_deleted = true;
    cleaner_log()->debug("Deleted local branch {}", branch);
  } else if (result.status == DeleteStatus::NotFullyMerged) {
    recover_stale_ref(outcome, result);
  } else {
    outcome.failure = failure_for(result.status);
    outcome.detail = result.detail;
    cleaner_log()->warn("Could not delete {}: {}", branch, result.detail);
  }

  // A recovered stale ref has no remote copy left to delete.
  if (!outcome.local_deleted ||
      outcome.failure == DeletionFailure::NotFullyMergedThenRecovered ||
      !offer_remote) {
    return outcome;
  }
  if (quiet) {
    cleaner_log()->debug("Keeping {}/{} (quiet mode)", remote_, branch);
    return outcome;
  }
  if (!ui_.confirm("Also delete " + remote_ + "/" + branch + "?", false)) {
    cleaner_log()->debug("Keeping {}/{}", remote_, branch);
    return outcome;
  }
  delete_remote_copy(outcome);
  return outcome;
}

void DeletionExecutor::recover_stale_ref(DeletionOutcome &outcome,
                                         const DeleteResult &first_attempt) {
  const std::string &branch = outcome.branch;
  bool exists = true;
  try {
    exists = repo_.remote_branch_exists(remote_, branch);
  } catch (const GitError &e) {
    outcome.failure = DeletionFailure::NotFullyMergedThenFailed;
    outcome.detail = first_attempt.detail + "; " + e.technical_details();
    cleaner_log()->warn("Could not delete {}: {}", branch, first_attempt.detail);
    cleaner_log()->debug("Remote check for {} failed: {}", branch,
                         e.technical_details());
    return;
  }
  if (exists) {
    outcome.failure = DeletionFailure::NotFullyMergedThenFailed;
    outcome.detail = first_attempt.detail;
    cleaner_log()->warn("Could not delete {}: {}", branch, first_attempt.detail);
    return;
  }

  cleaner_log()->debug("{} is gone from {}, force deleting stale branch",
                       branch, remote_);
  DeleteResult forced = repo_.delete_local_branch(branch, true);
  if (forced.ok()) {
    outcome.local_deleted = true;
    outcome.failure = DeletionFailure::NotFullyMergedThenRecovered;
    outcome.detail = first_attempt.detail;
    return;
  }
  outcome.failure = DeletionFailure::NotFullyMergedThenFailed;
  outcome.detail = first_attempt.detail + "; force delete: " + forced.detail;
  cleaner_log()->warn("Could not delete {}: {}; force delete failed: {}",
                      branch, first_attempt.detail, forced.detail);
}

void DeletionExecutor::delete_remote_copy(DeletionOutcome &outcome) {
  DeleteResult remote = repo_.delete_remote_branch(remote_, outcome.branch);
  if (remote.ok()) {
    outcome.remote_deleted = true;
    console_.line("Deleted " + remote_ + "/" + outcome.branch);
    return;
  }
  outcome.failure = DeletionFailure::RemoteFailure;
  outcome.detail = remote.detail;
  cleaner_log()->warn("Could not delete {}/{}: {}", remote_, outcome.branch,
                      remote.detail);
}

BranchCleaner::BranchCleaner(VersionControlRepository &repo,
                             PullRequestProvider *provider, UserInteraction &ui,
                             Console &console, BranchSettings settings)
    : repo_(repo), provider_(provider), ui_(ui), console_(console),
      settings_(std::move(settings)) {}

int BranchCleaner::run(bool quiet) {
  auto log = cleaner_log();
  eligible_ = {};
  outcomes_.clear();
  deleted_ = 0;
  log->info("Cleaning merged branches");
  log->debug("Remote '{}', base ref '{}'", settings_.remote,
             settings_.base_ref);

  std::optional<BranchInventory> inventory;
  try {
    inventory.emplace(BranchInventory::collect(repo_, settings_.remote));
  } catch (const GitError &e) {
    log->error("{}", e.what());
    log->debug("{}", e.technical_details());
    return 1;
  }

  auto lookup = make_pull_request_lookup(provider_);
  log->debug("Using {} pull request lookup", lookup->name());
  EligibilityClassifier classifier(repo_, *lookup, settings_.base_ref);
  eligible_ = partition_eligible_branches(*inventory, classifier,
                                          settings_.protected_branches);

  if (eligible_.empty()) {
    console_.line("No branches to clean.");
    return 0;
  }
  if (eligible_.current_skipped) {
    console_.line("Skipping the current branch " + inventory->current_branch() +
                  ".");
  }
  console_.line("Found " + std::to_string(eligible_.size()) +
                " branch(es) to clean:");
  if (!eligible_.local_only.empty()) {
    console_.line("Local only (" + std::to_string(eligible_.local_only.size()) +
                  "):");
    for (const auto &b : eligible_.local_only)
      console_.item(b);
  }
  if (!eligible_.with_remote.empty()) {
    console_.line("Also on " + settings_.remote + " (" +
                  std::to_string(eligible_.with_remote.size()) + "):");
    for (const auto &b : eligible_.with_remote)
      console_.item(b);
  }

  DeletionExecutor executor(repo_, ui_, console_, settings_.remote,
                            settings_.protected_branches);
  deleted_ = executor.delete_branches(eligible_.local_only,
                                      eligible_.with_remote, quiet);
  outcomes_ = executor.outcomes();
  if (executor.cancelled()) {
    console_.line("Cleanup cancelled.");
    return 0;
  }
  if (deleted_ > 0) {
    console_.line("Deleted " + std::to_string(deleted_) + " branch(es).");
  }
  std::size_t failed = 0;
  for (const auto &o : outcomes_) {
    if (!o.local_deleted && !o.skipped)
      ++failed;
  }
  log->info("Branch cleanup finished: {} deleted, {} failed", deleted_,
            failed);
  return 0;
}

} // namespace stud
