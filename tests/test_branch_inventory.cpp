#include "branch_inventory.hpp"
#include "fakes.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace stud;
using namespace stud_test;

TEST_CASE("inventory collects both branch sets", "[inventory]") {
  FakeRepository repo;
  repo.local = {"feat/b", "develop", "feat/a", "feat/a"};
  repo.remote = {"develop", "feat/b"};
  repo.current = "feat/a";

  auto inventory = BranchInventory::collect(repo, "origin");
  REQUIRE(inventory.local_branches() ==
          std::set<std::string>{"develop", "feat/a", "feat/b"});
  REQUIRE(inventory.remote_branches().size() == 2);
  REQUIRE(inventory.current_branch() == "feat/a");
}

TEST_CASE("inventory failure is reported as GitError", "[inventory]") {
  FakeRepository repo;
  repo.fail_inventory = true;
  REQUIRE_THROWS_AS(BranchInventory::collect(repo, "origin"), GitError);
}

TEST_CASE("branch flags are derived from the inventory", "[inventory]") {
  BranchInventory inventory({"main", "feat/a"}, {"main"}, "feat/a");
  auto protected_set = default_protected_branches();

  Branch main = inventory.branch("main", protected_set);
  REQUIRE(main.is_local);
  REQUIRE(main.is_remote);
  REQUIRE(main.is_protected);
  REQUIRE_FALSE(main.is_current);

  Branch feature = inventory.branch("feat/a", protected_set);
  REQUIRE(feature.is_current);
  REQUIRE_FALSE(feature.is_remote);
  REQUIRE_FALSE(feature.is_protected);
}

TEST_CASE("detached head has no current branch", "[inventory]") {
  BranchInventory inventory({"feat/a"}, {}, "");
  REQUIRE_FALSE(inventory.branch("feat/a", {}).is_current);
}

TEST_CASE("default protected set", "[inventory]") {
  REQUIRE(default_protected_branches() ==
          ProtectedBranches{"develop", "main", "master"});
  REQUIRE(BranchSettings{}.base_ref == "origin/develop");
  REQUIRE(BranchSettings{}.remote == "origin");
}
