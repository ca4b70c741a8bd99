#include "branch_lister.hpp"
#include "fakes.hpp"
#include <catch2/catch_test_macros.hpp>
#include <sstream>

using namespace stud;
using namespace stud_test;

TEST_CASE("status follows pull request, merge and remote state",
          "[branches][list]") {
  MergeCheckResult merged{MergeStatus::Merged, {}};
  MergeCheckResult unmerged{MergeStatus::NotMerged, {}};
  MergeCheckResult unknown{MergeStatus::Unknown, "fatal"};
  auto open_pr = std::optional<PullRequestRecord>(pr(1, "open", "feat/a"));
  auto closed_pr = std::optional<PullRequestRecord>(pr(2, "closed", "feat/a"));

  REQUIRE(branch_status(merged, true, open_pr) ==
          BranchStatus::ActivePullRequest);
  REQUIRE(branch_status(merged, true, closed_pr) == BranchStatus::Merged);
  REQUIRE(branch_status(merged, false, std::nullopt) == BranchStatus::Stale);
  REQUIRE(branch_status(unknown, true, std::nullopt) == BranchStatus::Unknown);
  REQUIRE(branch_status(unmerged, true, std::nullopt) == BranchStatus::Active);
}

TEST_CASE("rows cover every local branch", "[branches][list]") {
  FakeRepository repo;
  repo.local = {"develop", "feat/a", "feat/b"};
  repo.remote = {"develop", "feat/a"};
  repo.current = "develop";
  repo.merge["develop"] = {MergeStatus::Merged, {}};
  repo.merge["feat/b"] = {MergeStatus::NotMerged, {}};
  FakeProvider provider;
  provider.all = {pr(12, "open", "feat/a")};
  std::ostringstream out;
  Console console(out);

  BranchLister lister(repo, &provider, console, BranchSettings{});
  auto rows = lister.collect();
  REQUIRE(rows.size() == 3);
  REQUIRE(rows[0].name == "develop");
  REQUIRE(rows[0].current);
  REQUIRE(rows[0].status == BranchStatus::Merged);
  REQUIRE(rows[1].status == BranchStatus::ActivePullRequest);
  REQUIRE(rows[1].pull_request->number == 12);
  REQUIRE(rows[2].status == BranchStatus::Active);
  REQUIRE_FALSE(rows[2].on_remote);
}

TEST_CASE("listing prints an aligned table", "[branches][list]") {
  FakeRepository repo;
  repo.local = {"feat/a", "main"};
  repo.remote = {"main"};
  repo.current = "main";
  std::ostringstream out;
  Console console(out);

  BranchLister lister(repo, nullptr, console, BranchSettings{});
  REQUIRE(lister.run() == 0);
  const std::string text = out.str();
  REQUIRE(text.find("BRANCH") == 0);
  REQUIRE(text.find("main (current)") != std::string::npos);
  REQUIRE(text.find("stale") != std::string::npos);
  REQUIRE(text.find("merged") != std::string::npos);
  REQUIRE(repo.local_deletes.empty());
}

TEST_CASE("empty repository prints a notice", "[branches][list]") {
  FakeRepository repo;
  std::ostringstream out;
  Console console(out);
  BranchLister lister(repo, nullptr, console, BranchSettings{});
  REQUIRE(lister.run() == 0);
  REQUIRE(out.str() == "No local branches found.\n");
}

TEST_CASE("listing fails when the inventory cannot be read",
          "[branches][list]") {
  FakeRepository repo;
  repo.fail_inventory = true;
  std::ostringstream out;
  Console console(out);
  BranchLister lister(repo, nullptr, console, BranchSettings{});
  REQUIRE(lister.run() == 1);
}
