#include <prflow/naming.hpp>
#include <prflow/workflow.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace prflow {

// Anything unexpected from the service on the dev path is a plain
// CommandFailure; conflicts keep their kind.
static Error as_command_failure(const Error &e) {
  if (e.kind == ErrorKind::MergeConflict)
    return e;
  return make_error(ErrorKind::CommandFailure, e.message);
}

Status Workflow::create_development_branch(const DevOptions &opts) {
  const std::string dev = development(opts.base_name);
  spdlog::info("[dev] creating {} on {}", dev, opts.parent);

  if (auto s = vcs_.checkout(opts.parent); !s)
    return as_command_failure(s.error());
  if (auto s = vcs_.create_branch(dev); !s)
    return as_command_failure(s.error());

  if (opts.enable_updates) {
    if (auto s = vcs_.commit(update_marker_message(opts.parent), true); !s)
      return as_command_failure(s.error());
  }

  if (opts.seed) {
    auto msg = reconciler_.infer_message_from_dev_branch(*opts.seed,
                                                         opts.parent);
    if (!msg)
      return as_command_failure(msg.error());
    auto r = reconciler_.squash_and_commit(*opts.seed, dev, msg.value(),
                                           true);
    if (!r)
      return as_command_failure(r.error());
    if (r.value() == SyncOutcome::NoChanges)
      spdlog::info("[dev] {} has nothing beyond {}", *opts.seed, opts.parent);
  }
  return ok_status();
}

Result<ResolvedPr> Workflow::resolve(const PrOptions &opts) {
  std::string target;
  if (opts.target) {
    target = *opts.target;
  } else {
    auto current = vcs_.current_branch();
    if (!current)
      return current.error();
    auto base = strip_development(current.value());
    if (!base)
      return make_error(
          ErrorKind::NamingMismatch,
          fmt::format("current branch {} does not start with {}; name the "
                      "branch explicitly",
                      current.value(), kDevPrefix));
    target = *base;
  }

  ResolvedPr r;
  r.dev_branch = development(opts.dev.value_or(target));
  r.pr_branch = pull_request(target);
  r.parent = opts.parent.value_or(opts.default_parent);

  auto exists = vcs_.branch_exists(r.dev_branch);
  if (!exists)
    return exists.error();
  if (!exists.value())
    return make_error(ErrorKind::NoSuchDevelopmentBranch,
                      fmt::format("no such branch {}", r.dev_branch));
  return r;
}

Result<SyncOutcome>
Workflow::sync_pull_request_branch(const PrOptions &opts) {
  auto resolved = resolve(opts);
  if (!resolved)
    return resolved.error();
  const auto &r = resolved.value();
  spdlog::info("[pr] {} -> {} on {}", r.dev_branch, r.pr_branch, r.parent);

  auto candidate = reconciler_.prepare_pr_branch(r.pr_branch, r.parent);
  if (!candidate)
    return candidate.error();

  std::optional<std::string> message = candidate.value();
  if (!message) {
    auto inferred =
        reconciler_.infer_message_from_dev_branch(r.dev_branch, r.parent);
    if (!inferred)
      return inferred.error();
    message = inferred.value();
  }

  return reconciler_.squash_and_commit(r.dev_branch, r.parent, message, false);
}

} // namespace prflow
