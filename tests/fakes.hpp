#ifndef STUD_TESTS_FAKES_HPP
#define STUD_TESTS_FAKES_HPP

#include "git_repository.hpp"
#include "pull_request_provider.hpp"
#include "user_interaction.hpp"
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stud_test {

/// In-memory repository recording every mutating call.
class FakeRepository : public stud::VersionControlRepository {
public:
  std::vector<std::string> local;
  std::vector<std::string> remote;
  std::string current;
  bool fail_inventory{false};

  std::map<std::string, stud::MergeCheckResult> merge;
  stud::MergeStatus default_merge{stud::MergeStatus::Merged};

  /// Scripted results per branch, consumed in order; `Deleted` when empty.
  std::map<std::string, std::deque<stud::DeleteResult>> local_results;
  std::map<std::string, stud::DeleteResult> remote_results;
  std::map<std::string, bool> remote_exists;
  std::set<std::string> remote_probe_fails;
  std::optional<std::string> url;

  std::vector<std::pair<std::string, bool>> local_deletes;
  std::vector<std::string> remote_deletes;
  std::vector<std::string> remote_probes;
  std::vector<std::string> merge_checks;
  std::string last_base_ref;

  std::vector<std::string> list_local_branches() override {
    if (fail_inventory)
      throw stud::GitError("Failed to list local branches.",
                           "git for-each-ref: fatal: not a git repository");
    return local;
  }

  std::vector<std::string>
  list_remote_branches(const std::string &) override {
    return remote;
  }

  std::string current_branch_name() override { return current; }

  stud::MergeCheckResult is_merged_into(const std::string &branch,
                                        const std::string &base_ref) override {
    merge_checks.push_back(branch);
    last_base_ref = base_ref;
    auto it = merge.find(branch);
    if (it != merge.end())
      return it->second;
    return {default_merge, {}};
  }

  stud::DeleteResult delete_local_branch(const std::string &branch,
                                         bool force) override {
    local_deletes.emplace_back(branch, force);
    auto it = local_results.find(branch);
    if (it == local_results.end() || it->second.empty())
      return {stud::DeleteStatus::Deleted, {}};
    stud::DeleteResult r = it->second.front();
    it->second.pop_front();
    return r;
  }

  stud::DeleteResult delete_remote_branch(const std::string &,
                                          const std::string &branch) override {
    remote_deletes.push_back(branch);
    auto it = remote_results.find(branch);
    if (it == remote_results.end())
      return {stud::DeleteStatus::Deleted, {}};
    return it->second;
  }

  bool remote_branch_exists(const std::string &,
                            const std::string &branch) override {
    remote_probes.push_back(branch);
    if (remote_probe_fails.count(branch))
      throw stud::GitError("Failed to query remote 'origin'.",
                           "git ls-remote: Could not read from remote");
    auto it = remote_exists.find(branch);
    return it != remote_exists.end() && it->second;
  }

  std::optional<std::string> remote_url(const std::string &) override {
    return url;
  }

  bool deleted(const std::string &branch) const {
    for (const auto &call : local_deletes) {
      if (call.first == branch)
        return true;
    }
    return false;
  }
};

/// Provider answering from canned records.
class FakeProvider : public stud::PullRequestProvider {
public:
  std::vector<stud::PullRequestRecord> all;
  bool fail_listing{false};
  bool fail_find{false};
  std::map<std::string, stud::PullRequestRecord> by_branch;
  int list_calls{0};
  std::vector<std::string> find_calls;

  std::vector<stud::PullRequestRecord>
  list_all_pull_requests(stud::PullRequestState) override {
    ++list_calls;
    if (fail_listing)
      throw std::runtime_error("GitHub unavailable");
    return all;
  }

  std::optional<stud::PullRequestRecord>
  find_pull_request_by_branch(const std::string &branch,
                              stud::PullRequestState) override {
    find_calls.push_back(branch);
    if (fail_find)
      throw std::runtime_error("GitHub unavailable");
    auto it = by_branch.find(branch);
    if (it == by_branch.end())
      return std::nullopt;
    return it->second;
  }
};

/// Answers prompts from a script, falling back to each prompt's default.
class ScriptedInteraction : public stud::UserInteraction {
public:
  std::deque<bool> answers;
  std::vector<std::string> prompts;

  bool confirm(const std::string &prompt, bool default_answer) override {
    prompts.push_back(prompt);
    if (answers.empty())
      return default_answer;
    bool answer = answers.front();
    answers.pop_front();
    return answer;
  }
};

inline stud::PullRequestRecord pr(int number, const std::string &state,
                                  const std::string &head,
                                  const std::string &head_repo = "me/repo",
                                  const std::string &base_repo = "me/repo") {
  stud::PullRequestRecord r;
  r.number = number;
  r.state = state;
  r.head_ref = head;
  r.head_repo = head_repo;
  r.base_repo = base_repo;
  return r;
}

inline stud::DeleteResult not_fully_merged(const std::string &branch) {
  return {stud::DeleteStatus::NotFullyMerged,
          "error: the branch '" + branch + "' is not fully merged."};
}

} // namespace stud_test

#endif // STUD_TESTS_FAKES_HPP
