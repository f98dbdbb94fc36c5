#pragma once
#include <prflow/process.hpp>
#include <prflow/vcs.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace prflow {

// VersionControl over the git executable. Every invocation is logged at debug
// level before it runs.
class GitService : public VersionControl {
public:
  explicit GitService(std::filesystem::path workdir, std::string git = "git");

  const std::filesystem::path &workdir() const { return workdir_; }

  Result<std::string> current_branch() override;
  Status checkout(const std::string &branch) override;
  Status create_branch(const std::string &name) override;
  Status reset_hard(const std::string &target) override;
  Result<bool> branch_exists(const std::string &name) override;
  Result<std::string> squash_merge(const std::string &source) override;
  Status discard_all_changes() override;
  Status commit(const std::optional<std::string> &message,
                bool allow_empty) override;
  Result<std::string> get_commit_message(const std::string &ref) override;
  Result<std::string> common_ancestor(const std::string &a,
                                      const std::string &b) override;
  Result<std::pair<int, int>> ahead_counts(const std::string &a,
                                           const std::string &b) override;
  Result<std::vector<std::string>>
  log_messages(const std::string &range,
               const std::string &exclude_pattern) override;
  Result<std::filesystem::path> repo_root() override;
  Result<std::filesystem::path> message_buffer_path() override;

private:
  CmdResult run_git(const std::vector<std::string> &args) const;
  // run_git, mapping a non-zero exit to CommandFailure with git's output.
  Result<std::string> git_out(const std::vector<std::string> &args) const;
  Status git_ok(const std::vector<std::string> &args) const;

  std::filesystem::path workdir_;
  std::string git_;
  std::optional<std::filesystem::path> root_;
};

} // namespace prflow
