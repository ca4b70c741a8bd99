/**
 * @file pull_request_provider.hpp
 * @brief Forge-independent pull request records and the provider interface.
 */

#ifndef STUD_PULL_REQUEST_PROVIDER_HPP
#define STUD_PULL_REQUEST_PROVIDER_HPP

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stud {

/// Pull request state filter understood by forge queries.
enum class PullRequestState {
  Open,   ///< Only open pull requests
  Closed, ///< Closed or merged pull requests
  All     ///< Any state
};

/// Lowercase query value for a state filter ("open", "closed", "all").
std::string to_string(PullRequestState state);

/// Representation of a pull request as far as branch cleanup cares.
struct PullRequestRecord {
  int number{0};               ///< Pull request number
  std::string state;           ///< "open", "closed", ...
  std::string head_ref;        ///< Source branch name
  std::string head_repo;       ///< Full name of the source repository
  std::string base_repo;       ///< Full name of the target repository

  /// Whether the pull request is still open.
  bool is_open() const { return state == "open"; }

  /**
   * Whether head and base live in the same repository.
   *
   * Records with a missing repository name never qualify.
   */
  bool same_repository() const {
    return !head_repo.empty() && !base_repo.empty() && head_repo == base_repo;
  }
};

/**
 * Parse a pull request object as returned by the GitHub REST API.
 *
 * Missing or `null` fields are left empty; a deleted fork reports a `null`
 * head repository.
 *
 * @param item JSON object describing one pull request.
 * @return Parsed record.
 */
PullRequestRecord pull_request_from_json(const nlohmann::json &item);

/** Interface for querying pull requests of the current repository. */
class PullRequestProvider {
public:
  virtual ~PullRequestProvider() = default;

  /**
   * List every pull request in the given state.
   *
   * @param state State filter.
   * @return All matching pull requests across pages.
   * @throws std::runtime_error On transport or API failures.
   */
  virtual std::vector<PullRequestRecord>
  list_all_pull_requests(PullRequestState state) = 0;

  /**
   * Find the pull request whose head is @p branch in this repository.
   *
   * @param branch Branch name without remote prefix.
   * @param state State filter; `All` prefers an open pull request.
   * @return Matching record or `std::nullopt` when none exists.
   * @throws std::runtime_error On transport or API failures.
   */
  virtual std::optional<PullRequestRecord>
  find_pull_request_by_branch(const std::string &branch,
                              PullRequestState state) = 0;
};

} // namespace stud

#endif // STUD_PULL_REQUEST_PROVIDER_HPP
