#include <prflow/message.hpp>
#include <prflow/naming.hpp>
#include <prflow/reconciler.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace prflow {

const char *to_string(SyncOutcome outcome) {
  switch (outcome) {
  case SyncOutcome::Committed:
    return "committed";
  case SyncOutcome::NoChanges:
    return "no changes";
  }
  return "unknown";
}

Result<std::optional<std::string>>
BranchReconciler::prepare_pr_branch(const std::string &pr_branch,
                                    const std::string &parent_branch) {
  auto exists = vcs_.branch_exists(pr_branch);
  if (!exists)
    return exists.error();

  if (!exists.value()) {
    spdlog::debug("[pr] creating {} from {}", pr_branch, parent_branch);
    if (auto s = vcs_.checkout(parent_branch); !s)
      return s.error();
    if (auto s = vcs_.create_branch(pr_branch); !s)
      return s.error();
    return std::optional<std::string>{};
  }

  auto counts = vcs_.ahead_counts(pr_branch, parent_branch);
  if (!counts)
    return counts.error();
  int ahead = counts.value().first;

  if (ahead > 1)
    return make_error(
        ErrorKind::TooManyForeignCommits,
        fmt::format("{} is {} commits ahead of {}; it may hold commits not "
                    "made by prflow. Inspect it and delete it to continue",
                    pr_branch, ahead, parent_branch));

  std::optional<std::string> candidate;
  if (ahead == 1) {
    auto msg = vcs_.get_commit_message(pr_branch);
    if (!msg)
      return msg.error();
    candidate = msg.value();
    spdlog::debug("[pr] reusing message of {} tip", pr_branch);
  }

  // the old tip is dropped only after its message is captured
  if (auto s = vcs_.checkout(pr_branch); !s)
    return s.error();
  if (auto s = vcs_.reset_hard(parent_branch); !s)
    return s.error();
  return candidate;
}

Result<std::optional<std::string>>
BranchReconciler::infer_message_from_dev_branch(
    const std::string &dev_branch, const std::string &parent_branch) {
  auto base = vcs_.common_ancestor(dev_branch, parent_branch);
  if (!base)
    return base.error();

  auto refs = vcs_.log_messages(base.value() + ".." + dev_branch,
                                "^" + kUpdateMarker);
  if (!refs)
    return refs.error();

  if (refs.value().size() != 1) {
    spdlog::debug("[pr] {} non-update commits on {}, keeping default message",
                  refs.value().size(), dev_branch);
    return std::optional<std::string>{};
  }

  auto msg = vcs_.get_commit_message(refs.value().front());
  if (!msg)
    return msg.error();
  return std::optional<std::string>{msg.value()};
}

Result<SyncOutcome>
BranchReconciler::squash_and_commit(const std::string &dev_branch,
                                    const std::string &onto_branch,
                                    const std::optional<std::string> &candidate,
                                    bool cleanup_on_conflict) {
  auto squashed = vcs_.squash_merge(dev_branch);
  if (!squashed) {
    if (squashed.kind() != ErrorKind::MergeConflict)
      return squashed.error();
    if (cleanup_on_conflict) {
      if (auto s = vcs_.discard_all_changes(); !s)
        spdlog::warn("[squash] cleanup after conflict failed: {}",
                     s.error().message);
    }
    return make_error(ErrorKind::MergeConflict,
                      fmt::format("merge conflict squashing {} onto {}",
                                  dev_branch, onto_branch));
  }

  // checked before any carried message is applied
  if (is_trivial_squash_message(squashed.value())) {
    spdlog::debug("[squash] default message has {} lines, nothing to commit",
                  count_lines(squashed.value()));
    return SyncOutcome::NoChanges;
  }

  if (candidate) {
    auto path = vcs_.message_buffer_path();
    if (!path)
      return path.error();
    if (auto s = rewrite_message_buffer(path.value(), *candidate); !s)
      return s.error();
  }

  // empty allowed: a squash with messages but no diff must still land
  if (auto s = vcs_.commit(std::nullopt, true); !s)
    return s.error();
  return SyncOutcome::Committed;
}

} // namespace prflow
