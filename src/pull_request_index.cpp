#include "pull_request_index.hpp"
#include "log.hpp"
#include <exception>
#include <spdlog/spdlog.h>
#include <utility>

namespace stud {

namespace {
std::shared_ptr<spdlog::logger> index_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("branches.index");
  }();
  return logger;
}
} // namespace

PullRequestIndex
index_pull_requests(const std::vector<PullRequestRecord> &prs) {
  PullRequestIndex index;
  for (const auto &pr : prs) {
    if (pr.head_ref.empty()) {
      continue;
    }
    if (!pr.same_repository()) {
      index_log()->trace("Skipping PR #{} for {}: head '{}' base '{}'",
                         pr.number, pr.head_ref, pr.head_repo, pr.base_repo);
      continue;
    }
    auto [it, inserted] = index.emplace(pr.head_ref, pr);
    if (inserted) {
      continue;
    }
    if (it->second.is_open() && !pr.is_open()) {
      index_log()->trace("Keeping open PR #{} for {} over {} PR #{}",
                         it->second.number, pr.head_ref, pr.state, pr.number);
      continue;
    }
    it->second = pr;
  }
  return index;
}

std::optional<PullRequestIndex>
build_pull_request_index(PullRequestProvider &provider) {
  try {
    index_log()->debug("Fetching all pull requests for bulk lookups");
    auto prs = provider.list_all_pull_requests(PullRequestState::All);
    auto index = index_pull_requests(prs);
    index_log()->debug("Fetched {} pull request(s), indexed {} branch(es)",
                       prs.size(), index.size());
    return index;
  } catch (const std::exception &e) {
    index_log()->debug(
        "Failed to fetch all pull requests, using per-branch lookups: {}",
        e.what());
    return std::nullopt;
  }
}

BulkIndexLookup::BulkIndexLookup(PullRequestIndex index)
    : index_(std::move(index)) {}

std::optional<PullRequestRecord>
BulkIndexLookup::find(const std::string &branch) {
  auto it = index_.find(branch);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

PerBranchLookup::PerBranchLookup(PullRequestProvider &provider)
    : provider_(provider) {}

std::optional<PullRequestRecord>
PerBranchLookup::find(const std::string &branch) {
  auto pr = provider_.find_pull_request_by_branch(branch, PullRequestState::All);
  if (pr && !pr->same_repository()) {
    return std::nullopt;
  }
  return pr;
}

std::unique_ptr<PullRequestLookup>
make_pull_request_lookup(PullRequestProvider *provider) {
  if (provider == nullptr) {
    index_log()->debug("No forge configured, pull request checks disabled");
    return std::make_unique<NoPullRequestLookup>();
  }
  auto index = build_pull_request_index(*provider);
  if (index) {
    return std::make_unique<BulkIndexLookup>(std::move(*index));
  }
  return std::make_unique<PerBranchLookup>(*provider);
}

} // namespace stud
