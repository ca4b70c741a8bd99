#include "branch_eligibility.hpp"
#include "log.hpp"
#include <exception>
#include <spdlog/spdlog.h>
#include <utility>

namespace stud {

namespace {
std::shared_ptr<spdlog::logger> eligibility_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("branches.eligibility");
  }();
  return logger;
}

EligibilityDecision decide(const Branch &branch, EligibilityReason reason,
                           std::string detail = {}) {
  return {branch.name, reason == EligibilityReason::Eligible, reason,
          std::move(detail)};
}
} // namespace

std::string to_string(EligibilityReason reason) {
  switch (reason) {
  case EligibilityReason::Protected:
    return "protected";
  case EligibilityReason::Current:
    return "current";
  case EligibilityReason::OpenPullRequest:
    return "open-pr";
  case EligibilityReason::NotMerged:
    return "not-merged";
  case EligibilityReason::LookupFailed:
    return "lookup-failed";
  case EligibilityReason::Eligible:
    break;
  }
  return "eligible";
}

EligibilityClassifier::EligibilityClassifier(VersionControlRepository &repo,
                                             PullRequestLookup &lookup,
                                             std::string base_ref)
    : repo_(repo), lookup_(lookup), base_ref_(std::move(base_ref)) {}

EligibilityDecision EligibilityClassifier::classify(const Branch &branch) {
  auto log = eligibility_log();
  if (branch.is_protected) {
    log->debug("Skipping {}: protected", branch.name);
    return decide(branch, EligibilityReason::Protected);
  }
  if (branch.is_current) {
    log->debug("Skipping {}: current branch", branch.name);
    return decide(branch, EligibilityReason::Current);
  }

  try {
    auto pr = lookup_.find(branch.name);
    if (pr) {
      log->debug("Found PR #{} for {} (state: {})", pr->number, branch.name,
                 pr->state);
      if (pr->is_open()) {
        return decide(branch, EligibilityReason::OpenPullRequest);
      }
    }
  } catch (const std::exception &e) {
    log->debug("Pull request lookup for {} failed, treating as none: {}",
               branch.name, e.what());
  }

  MergeCheckResult merged = repo_.is_merged_into(branch.name, base_ref_);
  switch (merged.status) {
  case MergeStatus::Merged:
    break;
  case MergeStatus::NotMerged:
    log->debug("Skipping {}: not merged into {}", branch.name, base_ref_);
    return decide(branch, EligibilityReason::NotMerged);
  case MergeStatus::Unknown:
    log->debug("Skipping {}: merge check against {} failed: {}", branch.name,
               base_ref_, merged.detail);
    return decide(branch, EligibilityReason::LookupFailed, merged.detail);
  }
  log->debug("{} is eligible for deletion", branch.name);
  return decide(branch, EligibilityReason::Eligible);
}

EligibleBranches
partition_eligible_branches(const BranchInventory &inventory,
                            EligibilityClassifier &classifier,
                            const ProtectedBranches &protected_branches) {
  EligibleBranches result;
  for (const auto &name : inventory.local_branches()) {
    Branch branch = inventory.branch(name, protected_branches);
    EligibilityDecision decision = classifier.classify(branch);
    if (decision.reason == EligibilityReason::Current) {
      result.current_skipped = true;
    }
    if (decision.eligible) {
      if (branch.is_remote) {
        result.with_remote.push_back(name);
      } else {
        result.local_only.push_back(name);
      }
    }
    result.decisions.push_back(std::move(decision));
  }
  eligibility_log()->debug("{} local-only and {} remote-tracked branch(es) "
                           "eligible",
                           result.local_only.size(), result.with_remote.size());
  return result;
}

} // namespace stud
