#include "branch_lister.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>
#include <exception>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <utility>

namespace stud {

namespace {
std::shared_ptr<spdlog::logger> list_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("branches.list");
  }();
  return logger;
}

std::string pull_request_cell(const std::optional<PullRequestRecord> &pr) {
  if (!pr)
    return "-";
  return "#" + std::to_string(pr->number) + " " + pr->state;
}
} // namespace

std::string to_string(BranchStatus status) {
  switch (status) {
  case BranchStatus::ActivePullRequest:
    return "active-pr";
  case BranchStatus::Merged:
    return "merged";
  case BranchStatus::Stale:
    return "stale";
  case BranchStatus::Unknown:
    return "unknown";
  case BranchStatus::Active:
    break;
  }
  return "active";
}

BranchStatus branch_status(const MergeCheckResult &merged, bool on_remote,
                           const std::optional<PullRequestRecord> &pr) {
  if (pr && pr->is_open()) {
    return BranchStatus::ActivePullRequest;
  }
  switch (merged.status) {
  case MergeStatus::Merged:
    return on_remote ? BranchStatus::Merged : BranchStatus::Stale;
  case MergeStatus::Unknown:
    return BranchStatus::Unknown;
  case MergeStatus::NotMerged:
    break;
  }
  return BranchStatus::Active;
}

BranchLister::BranchLister(VersionControlRepository &repo,
                           PullRequestProvider *provider, Console &console,
                           BranchSettings settings)
    : repo_(repo), provider_(provider), console_(console),
      settings_(std::move(settings)) {}

std::vector<BranchRow> BranchLister::collect() {
  auto inventory = BranchInventory::collect(repo_, settings_.remote);
  std::vector<BranchRow> rows;
  if (inventory.local_branches().empty()) {
    return rows;
  }
  auto lookup = make_pull_request_lookup(provider_);
  for (const auto &name : inventory.local_branches()) {
    Branch branch = inventory.branch(name, settings_.protected_branches);
    BranchRow row;
    row.name = name;
    row.current = branch.is_current;
    row.on_remote = branch.is_remote;
    try {
      row.pull_request = lookup->find(name);
    } catch (const std::exception &e) {
      list_log()->debug("Pull request lookup for {} failed: {}", name,
                        e.what());
    }
    MergeCheckResult merged = repo_.is_merged_into(name, settings_.base_ref);
    if (merged.status == MergeStatus::Unknown) {
      list_log()->debug("Merge check for {} failed: {}", name, merged.detail);
    }
    row.status = branch_status(merged, row.on_remote, row.pull_request);
    list_log()->trace("{}: {}", name, to_string(row.status));
    rows.push_back(std::move(row));
  }
  return rows;
}

int BranchLister::run() {
  list_log()->info("Listing branches");
  std::vector<BranchRow> rows;
  try {
    rows = collect();
  } catch (const GitError &e) {
    list_log()->error("{}", e.what());
    list_log()->debug("{}", e.technical_details());
    return 1;
  }
  if (rows.empty()) {
    console_.line("No local branches found.");
    return 0;
  }
  print_table(rows);
  return 0;
}

void BranchLister::print_table(const std::vector<BranchRow> &rows) {
  std::vector<std::array<std::string, 4>> cells;
  cells.push_back({"BRANCH", "STATUS", "REMOTE", "PR"});
  for (const auto &row : rows) {
    cells.push_back({row.current ? row.name + " (current)" : row.name,
                     to_string(row.status), row.on_remote ? "yes" : "no",
                     pull_request_cell(row.pull_request)});
  }
  std::array<std::size_t, 4> widths{};
  for (const auto &line : cells) {
    for (std::size_t i = 0; i < line.size(); ++i)
      widths[i] = std::max(widths[i], line[i].size());
  }
  auto &out = console_.stream();
  for (const auto &line : cells) {
    for (std::size_t i = 0; i < line.size(); ++i) {
      if (i + 1 == line.size()) {
        out << line[i];
      } else {
        out << std::left << std::setw(static_cast<int>(widths[i] + 2))
            << line[i];
      }
    }
    out << '\n';
  }
}

} // namespace stud
