/**
 * @file pull_request_index.hpp
 * @brief Branch to pull request lookup strategies.
 *
 * The bulk strategy answers from an index built with a single listing call.
 * When that listing fails the per-branch strategy asks the forge once per
 * branch. Without a forge no branch has a pull request.
 */

#ifndef STUD_PULL_REQUEST_INDEX_HPP
#define STUD_PULL_REQUEST_INDEX_HPP

#include "pull_request_provider.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stud {

/// Branch name to the pull request whose head it is.
using PullRequestIndex = std::map<std::string, PullRequestRecord>;

/**
 * Build the index from a list of pull requests.
 *
 * Records without a head ref, with a missing repository name or from a fork
 * are skipped. Later records replace earlier ones for the same branch,
 * except that an open pull request is never replaced by one in another state.
 */
PullRequestIndex index_pull_requests(const std::vector<PullRequestRecord> &prs);

/**
 * Fetch all pull requests in any state and index them.
 *
 * @return The index, or `std::nullopt` when the listing failed. Errors are
 *         logged and never propagated.
 */
std::optional<PullRequestIndex>
build_pull_request_index(PullRequestProvider &provider);

/** Resolves the pull request associated with a branch. */
class PullRequestLookup {
public:
  virtual ~PullRequestLookup() = default;

  /**
   * @param branch Branch name.
   * @return Same-repository pull request or `std::nullopt`.
   * @throws std::runtime_error When the forge query fails.
   */
  virtual std::optional<PullRequestRecord>
  find(const std::string &branch) = 0;

  /// Short strategy name for diagnostics.
  virtual const char *name() const = 0;
};

/// Answers from a prebuilt index.
class BulkIndexLookup : public PullRequestLookup {
public:
  explicit BulkIndexLookup(PullRequestIndex index);
  std::optional<PullRequestRecord> find(const std::string &branch) override;
  const char *name() const override { return "bulk"; }
  const PullRequestIndex &index() const { return index_; }

private:
  PullRequestIndex index_;
};

/// Queries the forge for every branch.
class PerBranchLookup : public PullRequestLookup {
public:
  explicit PerBranchLookup(PullRequestProvider &provider);
  std::optional<PullRequestRecord> find(const std::string &branch) override;
  const char *name() const override { return "per-branch"; }

private:
  PullRequestProvider &provider_;
};

/// Used when no forge is configured.
class NoPullRequestLookup : public PullRequestLookup {
public:
  std::optional<PullRequestRecord> find(const std::string &) override {
    return std::nullopt;
  }
  const char *name() const override { return "none"; }
};

/**
 * Pick the lookup strategy.
 *
 * @param provider Forge access or `nullptr` when disabled.
 * @return Bulk lookup when the index could be built, per-branch lookup when
 *         it could not, and an empty lookup without a provider.
 */
std::unique_ptr<PullRequestLookup>
make_pull_request_lookup(PullRequestProvider *provider);

} // namespace stud

#endif // STUD_PULL_REQUEST_INDEX_HPP
