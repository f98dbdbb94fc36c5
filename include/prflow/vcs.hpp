#pragma once
#include <prflow/error.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prflow {

// Everything the reconciler needs from a repository. The checkout, index and
// working tree behind it are one exclusive resource: implementations do no
// locking and only one workflow may drive a repository at a time.
class VersionControl {
public:
  virtual ~VersionControl() = default;

  // NotOnABranch when HEAD is detached.
  virtual Result<std::string> current_branch() = 0;

  virtual Status checkout(const std::string &branch) = 0;
  // New branch from the current HEAD, checked out.
  virtual Status create_branch(const std::string &name) = 0;
  virtual Status reset_hard(const std::string &target) = 0;
  virtual Result<bool> branch_exists(const std::string &name) = 0;

  // Stages the changes of source onto the current branch without committing
  // and returns the default message from the message buffer.
  // MergeConflict leaves the conflicted state in place.
  virtual Result<std::string> squash_merge(const std::string &source) = 0;
  virtual Status discard_all_changes() = 0;

  // Without an explicit message the message buffer is committed, cut at its
  // scissors line. Only whitespace is cleaned up otherwise.
  virtual Status commit(const std::optional<std::string> &message,
                        bool allow_empty) = 0;

  virtual Result<std::string> get_commit_message(const std::string &ref) = 0;
  virtual Result<std::string> common_ancestor(const std::string &a,
                                              const std::string &b) = 0;
  // (commits of a not in b, commits of b not in a)
  virtual Result<std::pair<int, int>> ahead_counts(const std::string &a,
                                                   const std::string &b) = 0;
  // Commit refs in range, newest first, skipping commits with a message line
  // matching exclude_pattern.
  virtual Result<std::vector<std::string>>
  log_messages(const std::string &range,
               const std::string &exclude_pattern) = 0;

  virtual Result<std::filesystem::path> repo_root() = 0;
  virtual Result<std::filesystem::path> message_buffer_path() = 0;
};

} // namespace prflow
