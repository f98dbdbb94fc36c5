#pragma once
#include <prflow/error.hpp>
#include <prflow/vcs.hpp>

#include <optional>
#include <string>

namespace prflow {

enum class SyncOutcome { Committed, NoChanges };

const char *to_string(SyncOutcome outcome);

// Turns a development branch into one squashed commit on top of a parent.
class BranchReconciler {
public:
  explicit BranchReconciler(VersionControl &vcs) : vcs_(vcs) {}

  // Leaves pr_branch checked out at the tip of parent_branch and returns the
  // message of its previous single commit, if it had exactly one.
  // TooManyForeignCommits, before touching anything, when it had more.
  Result<std::optional<std::string>>
  prepare_pr_branch(const std::string &pr_branch,
                    const std::string &parent_branch);

  // Message of the only non-update commit on dev_branch since it forked from
  // parent_branch; nullopt when there are none or several.
  Result<std::optional<std::string>>
  infer_message_from_dev_branch(const std::string &dev_branch,
                                const std::string &parent_branch);

  // Squashes dev_branch onto the checked out branch and commits; onto_branch
  // names that branch in a conflict report. With cleanup_on_conflict the
  // conflicted changes are discarded before failing, otherwise they stay for
  // the operator to resolve.
  Result<SyncOutcome>
  squash_and_commit(const std::string &dev_branch,
                    const std::string &onto_branch,
                    const std::optional<std::string> &candidate,
                    bool cleanup_on_conflict);

private:
  VersionControl &vcs_;
};

} // namespace prflow
