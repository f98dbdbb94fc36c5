#pragma once
#include <prflow/error.hpp>
#include <prflow/reconciler.hpp>
#include <prflow/vcs.hpp>

#include <optional>
#include <string>

namespace prflow {

struct DevOptions {
  std::string base_name;
  std::string parent;
  bool enable_updates = true;
  // squashed onto the new branch right after it is created
  std::optional<std::string> seed;
};

struct PrOptions {
  std::optional<std::string> target; // base name; from the current dev/ branch
  std::optional<std::string> dev;    // base name; defaults to target
  std::optional<std::string> parent; // defaults to default_parent
  std::string default_parent = "master";
};

// Branch names a PrOptions resolves to, fixed before anything is mutated.
struct ResolvedPr {
  std::string dev_branch;
  std::string pr_branch;
  std::string parent;
};

class Workflow {
public:
  explicit Workflow(VersionControl &vcs) : vcs_(vcs), reconciler_(vcs) {}

  Status create_development_branch(const DevOptions &opts);

  Result<ResolvedPr> resolve(const PrOptions &opts);

  Result<SyncOutcome> sync_pull_request_branch(const PrOptions &opts);

private:
  VersionControl &vcs_;
  BranchReconciler reconciler_;
};

} // namespace prflow
