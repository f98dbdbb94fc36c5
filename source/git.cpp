#include <prflow/git.hpp>
#include <prflow/message.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <sstream>

namespace fs = std::filesystem;

namespace prflow {

GitService::GitService(fs::path workdir, std::string git)
    : workdir_(std::move(workdir)), git_(std::move(git)) {}

CmdResult GitService::run_git(const std::vector<std::string> &args) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(git_);
  argv.insert(argv.end(), args.begin(), args.end());
  spdlog::debug("[git] {}", join_args(argv));
  auto r = run_command(argv, workdir_);
  if (r.exit_code != 0)
    spdlog::debug("[git] rc={} {}", r.exit_code,
                  trim_trailing_newlines(r.err.empty() ? r.out : r.err));
  return r;
}

static Error command_failure(const std::vector<std::string> &args,
                             const CmdResult &r) {
  std::string detail = trim_trailing_newlines(r.err.empty() ? r.out : r.err);
  return make_error(ErrorKind::CommandFailure,
                    fmt::format("git {} failed (rc={}): {}", join_args(args),
                                r.exit_code, detail));
}

Result<std::string> GitService::git_out(const std::vector<std::string> &args) const {
  auto r = run_git(args);
  if (r.exit_code != 0)
    return command_failure(args, r);
  return std::move(r.out);
}

Status GitService::git_ok(const std::vector<std::string> &args) const {
  auto r = run_git(args);
  if (r.exit_code != 0)
    return command_failure(args, r);
  return ok_status();
}

Result<std::string> GitService::current_branch() {
  std::vector<std::string> args{"symbolic-ref", "--short", "-q", "HEAD"};
  auto r = run_git(args);
  // symbolic-ref -q exits 1 silently on a detached HEAD
  if (r.exit_code == 1)
    return make_error(ErrorKind::NotOnABranch,
                      "HEAD is detached, check out a branch first");
  if (r.exit_code != 0)
    return command_failure(args, r);
  return trim_trailing_newlines(r.out);
}

Status GitService::checkout(const std::string &branch) {
  return git_ok({"checkout", branch});
}

Status GitService::create_branch(const std::string &name) {
  return git_ok({"checkout", "-b", name});
}

Status GitService::reset_hard(const std::string &target) {
  return git_ok({"reset", "--hard", target});
}

Result<bool> GitService::branch_exists(const std::string &name) {
  std::vector<std::string> args{"rev-parse", "--verify", "--quiet",
                                "refs/heads/" + name};
  auto r = run_git(args);
  if (r.exit_code == 0)
    return true;
  if (r.exit_code == 1)
    return false;
  return command_failure(args, r);
}

Result<std::string> GitService::squash_merge(const std::string &source) {
  auto buffer = message_buffer_path();
  if (!buffer)
    return buffer.error();

  // A buffer left behind by an earlier run must not be read back as ours.
  std::error_code ec;
  fs::remove(buffer.value(), ec);
  if (ec)
    return make_error(ErrorKind::CommandFailure,
                      fmt::format("cannot remove {}: {}",
                                  buffer.value().string(), ec.message()));

  std::vector<std::string> args{"merge", "--squash", source};
  auto r = run_git(args);
  if (r.exit_code != 0) {
    // unmerged index entries, whatever language git printed in
    auto unmerged = git_out({"ls-files", "-u"});
    if (!unmerged)
      return unmerged.error();
    if (!trim_trailing_newlines(unmerged.value()).empty())
      return make_error(ErrorKind::MergeConflict,
                        fmt::format("squashing {} produced conflicts",
                                    source));
    return command_failure(args, r);
  }

  auto text = read_message_buffer(buffer.value());
  if (!text)
    return text.error();
  // "Already up to date." writes no buffer at all
  return text.value().value_or("");
}

Status GitService::discard_all_changes() {
  return git_ok({"reset", "--hard", "HEAD"});
}

Status GitService::commit(const std::optional<std::string> &message,
                          bool allow_empty) {
  std::string text;
  if (message) {
    text = *message;
  } else {
    auto buffer = message_buffer_path();
    if (!buffer)
      return buffer.error();
    auto content = read_message_buffer(buffer.value());
    if (!content)
      return content.error();
    // only the commented block under the scissors goes; '#' lines above it
    // belong to the message
    text = committable_message(content.value().value_or(""));
  }

  std::vector<std::string> args{"commit"};
  if (allow_empty)
    args.push_back("--allow-empty");
  args.push_back("--cleanup=whitespace");
  args.push_back("-m");
  args.push_back(text);
  return git_ok(args);
}

Result<std::string> GitService::get_commit_message(const std::string &ref) {
  auto r = git_out({"log", "-1", "--format=%B", ref});
  if (!r)
    return r;
  return trim_trailing_newlines(r.value());
}

Result<std::string> GitService::common_ancestor(const std::string &a,
                                                const std::string &b) {
  auto r = git_out({"merge-base", a, b});
  if (!r)
    return r;
  return trim_trailing_newlines(r.value());
}

Result<std::pair<int, int>> GitService::ahead_counts(const std::string &a,
                                                     const std::string &b) {
  std::vector<std::string> args{"rev-list", "--left-right", "--count",
                                a + "..." + b};
  auto r = git_out(args);
  if (!r)
    return r.error();
  std::istringstream in(r.value());
  int left = 0, right = 0;
  if (!(in >> left >> right))
    return make_error(ErrorKind::CommandFailure,
                      fmt::format("unexpected rev-list output: '{}'",
                                  trim_trailing_newlines(r.value())));
  return std::make_pair(left, right);
}

Result<std::vector<std::string>>
GitService::log_messages(const std::string &range,
                         const std::string &exclude_pattern) {
  std::vector<std::string> args{"log", "--format=%H"};
  if (!exclude_pattern.empty()) {
    args.push_back("--invert-grep");
    args.push_back("--grep=" + exclude_pattern);
  }
  args.push_back(range);
  args.push_back("--");
  auto r = git_out(args);
  if (!r)
    return r.error();
  std::vector<std::string> refs;
  std::istringstream in(r.value());
  std::string line;
  while (std::getline(in, line)) {
    line = trim_trailing_newlines(line);
    if (!line.empty())
      refs.push_back(line);
  }
  return refs;
}

Result<fs::path> GitService::repo_root() {
  if (root_)
    return *root_;
  auto r = git_out({"rev-parse", "--show-toplevel"});
  if (!r)
    return r.error();
  root_ = fs::path(trim_trailing_newlines(r.value()));
  return *root_;
}

Result<fs::path> GitService::message_buffer_path() {
  // --git-path follows linked worktrees and submodules, where .git is a file
  auto r = git_out({"rev-parse", "--git-path", "SQUASH_MSG"});
  if (!r)
    return r.error();
  fs::path p(trim_trailing_newlines(r.value()));
  if (p.is_relative())
    p = workdir_ / p;
  return p;
}

} // namespace prflow
