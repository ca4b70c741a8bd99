#include "git_repository.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <deque>
#include <string>
#include <vector>

using namespace stud;

namespace {

/// Records argument vectors and replies with scripted results.
struct ScriptedRunner {
  std::vector<std::vector<std::string>> calls;
  std::deque<CommandResult> replies;

  CommandRunner runner() {
    return [this](const std::vector<std::string> &argv) {
      calls.push_back(argv);
      if (replies.empty())
        return CommandResult{0, "", ""};
      CommandResult r = replies.front();
      replies.pop_front();
      return r;
    };
  }
};

} // namespace

TEST_CASE("local branches are listed with for-each-ref", "[git]") {
  ScriptedRunner script;
  script.replies = {{0, "develop\nfeat/a\n\n  feat/b  \n", ""}};
  GitRepository repo(script.runner());

  auto branches = repo.list_local_branches();
  REQUIRE(branches == std::vector<std::string>{"develop", "feat/a", "feat/b"});
  REQUIRE(script.calls.size() == 1);
  REQUIRE(script.calls[0] ==
          std::vector<std::string>{"git", "for-each-ref",
                                   "--format=%(refname:short)", "refs/heads/"});
}

TEST_CASE("remote branches drop the prefix and the HEAD ref", "[git]") {
  ScriptedRunner script;
  script.replies = {{0, "origin\norigin/HEAD\norigin/develop\norigin/feat/a\n",
                     ""}};
  GitRepository repo(script.runner());

  auto branches = repo.list_remote_branches("origin");
  REQUIRE(branches == std::vector<std::string>{"develop", "feat/a"});
  REQUIRE(script.calls[0].back() == "refs/remotes/origin/");
}

TEST_CASE("inventory failures raise GitError with details", "[git]") {
  ScriptedRunner script;
  script.replies = {{128, "", "fatal: not a git repository\n"}};
  GitRepository repo(script.runner());

  try {
    repo.list_local_branches();
    FAIL("expected GitError");
  } catch (const GitError &e) {
    REQUIRE(std::string(e.what()) == "Failed to list local branches.");
    REQUIRE(e.technical_details().find("fatal: not a git repository") !=
            std::string::npos);
    REQUIRE(e.technical_details().find("exit 128") != std::string::npos);
  }
}

TEST_CASE("current branch is trimmed", "[git]") {
  ScriptedRunner script;
  script.replies = {{0, "feat/a\n", ""}};
  GitRepository repo(script.runner());
  REQUIRE(repo.current_branch_name() == "feat/a");
  REQUIRE(script.calls[0] ==
          std::vector<std::string>{"git", "rev-parse", "--abbrev-ref", "HEAD"});
}

TEST_CASE("merge check maps exit codes", "[git]") {
  ScriptedRunner script;
  script.replies = {{0, "", ""}, {1, "", ""}, {128, "", "fatal: bad ref\n"}};
  GitRepository repo(script.runner());

  REQUIRE(repo.is_merged_into("feat/a", "origin/develop").status ==
          MergeStatus::Merged);
  REQUIRE(repo.is_merged_into("feat/b", "origin/develop").status ==
          MergeStatus::NotMerged);
  auto unknown = repo.is_merged_into("feat/c", "origin/develop");
  REQUIRE(unknown.status == MergeStatus::Unknown);
  REQUIRE(unknown.detail == "fatal: bad ref");
  REQUIRE(script.calls[0] ==
          std::vector<std::string>{"git", "merge-base", "--is-ancestor",
                                   "refs/heads/feat/a", "origin/develop"});
}

TEST_CASE("local deletes use -d and -D", "[git]") {
  ScriptedRunner script;
  script.replies = {
      {1, "", "error: the branch 'feat/a' is not fully merged.\n"},
      {0, "Deleted branch feat/a\n", ""}};
  GitRepository repo(script.runner());

  auto first = repo.delete_local_branch("feat/a");
  REQUIRE(first.status == DeleteStatus::NotFullyMerged);
  REQUIRE_FALSE(first.ok());
  REQUIRE(repo.delete_local_branch("feat/a", true).ok());
  REQUIRE(script.calls[0] ==
          std::vector<std::string>{"git", "branch", "-d", "feat/a"});
  REQUIRE(script.calls[1] ==
          std::vector<std::string>{"git", "branch", "-D", "feat/a"});
}

TEST_CASE("remote delete pushes a deletion", "[git]") {
  ScriptedRunner script;
  script.replies = {{1, "", "error: unable to delete 'feat/a': remote ref "
                            "does not exist\n"}};
  GitRepository repo(script.runner());

  auto result = repo.delete_remote_branch("origin", "feat/a");
  REQUIRE_FALSE(result.ok());
  REQUIRE(script.calls[0] ==
          std::vector<std::string>{"git", "push", "origin", "--delete",
                                   "feat/a"});
}

TEST_CASE("remote existence asks the remote", "[git]") {
  ScriptedRunner script;
  script.replies = {{0, "abc123\trefs/heads/feat/a\n", ""},
                    {0, "", ""},
                    {128, "", "fatal: Could not read from remote repository."}};
  GitRepository repo(script.runner());

  REQUIRE(repo.remote_branch_exists("origin", "feat/a"));
  REQUIRE_FALSE(repo.remote_branch_exists("origin", "feat/b"));
  REQUIRE_THROWS_AS(repo.remote_branch_exists("origin", "feat/c"), GitError);
  REQUIRE(script.calls[0] ==
          std::vector<std::string>{"git", "ls-remote", "--heads", "origin",
                                   "refs/heads/feat/a"});
}

TEST_CASE("remote url is optional", "[git]") {
  ScriptedRunner script;
  script.replies = {{0, "git@github.com:me/repo.git\n", ""}, {1, "", ""}};
  GitRepository repo(script.runner(), "/usr/bin/git");

  REQUIRE(repo.remote_url("origin") == "git@github.com:me/repo.git");
  REQUIRE_FALSE(repo.remote_url("upstream").has_value());
  REQUIRE(script.calls[0][0] == "/usr/bin/git");
}

TEST_CASE("delete failures are classified by message", "[git]") {
  REQUIRE(classify_delete_failure(
              "error: The branch 'x' is not fully merged.") ==
          DeleteStatus::NotFullyMerged);
  REQUIRE(classify_delete_failure(
              "error: cannot lock ref 'refs/heads/x': Permission denied") ==
          DeleteStatus::NotWritable);
  REQUIRE(classify_delete_failure("fatal: unable to create "
                                  "'.git/packed-refs.lock'") ==
          DeleteStatus::NotWritable);
  REQUIRE(classify_delete_failure("error: branch 'x' not found.") ==
          DeleteStatus::OtherError);
}

TEST_CASE("GitHub remotes are parsed", "[git]") {
  auto ssh = parse_github_repo_from_url("git@github.com:me/repo.git");
  REQUIRE(ssh);
  REQUIRE(ssh->first == "me");
  REQUIRE(ssh->second == "repo");

  auto https = parse_github_repo_from_url("https://github.com/me/repo");
  REQUIRE(https);
  REQUIRE(https->second == "repo");

  auto ssh_url = parse_github_repo_from_url("ssh://git@github.com/me/repo.git/");
  REQUIRE(ssh_url);
  REQUIRE(ssh_url->first == "me");

  REQUIRE_FALSE(parse_github_repo_from_url("https://gitlab.com/me/repo"));
  REQUIRE_FALSE(parse_github_repo_from_url("https://github.com/me"));
  REQUIRE_FALSE(parse_github_repo_from_url(""));
}

TEST_CASE("run_command captures output and exit status", "[git][process]") {
  auto res = run_command({"sh", "-c", "echo out; echo err >&2; exit 3"});
  REQUIRE(res.exit_code == 3);
  REQUIRE(res.out == "out\n");
  REQUIRE(res.err == "err\n");
}

TEST_CASE("run_command reports spawn failures", "[git][process]") {
  auto res = run_command({"stud-no-such-binary-for-tests"});
  REQUIRE(res.exit_code == 127);
  REQUIRE_FALSE(res.err.empty());
  REQUIRE(run_command({}).exit_code == 127);
}

TEST_CASE("child environment disables message translation", "[git][process]") {
  char home[] = "HOME=/home/dev";
  char language[] = "LANGUAGE=de";
  char lang[] = "LANG=de_DE.UTF-8";
  char lc_all[] = "LC_ALL=de_DE.UTF-8";
  char lc_messages[] = "LC_MESSAGES=de_DE.UTF-8";
  char lc_time[] = "LC_TIME=de_DE.UTF-8";
  char *env[] = {home, language, lang, lc_all, lc_messages, lc_time, nullptr};

  auto entries = untranslated_environment(env);
  REQUIRE(entries == std::vector<std::string>{"HOME=/home/dev",
                                              "LC_TIME=de_DE.UTF-8",
                                              "LC_ALL=C"});
  REQUIRE(untranslated_environment(nullptr) ==
          std::vector<std::string>{"LC_ALL=C"});
}

TEST_CASE("run_command starts children in the C locale", "[git][process]") {
  ::setenv("LANGUAGE", "de", 1);
  ::setenv("LC_ALL", "de_DE.UTF-8", 1);
  auto res = run_command(
      {"sh", "-c", "printf '%s|%s' \"$LC_ALL\" \"${LANGUAGE-unset}\""});
  ::unsetenv("LANGUAGE");
  ::unsetenv("LC_ALL");
  REQUIRE(res.exit_code == 0);
  REQUIRE(res.out == "C|unset");
}
