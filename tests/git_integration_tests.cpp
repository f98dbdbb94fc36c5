#include <catch2/catch_all.hpp>
#include <prflow/app.hpp>
#include <prflow/git.hpp>
#include <prflow/workflow.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>

using namespace prflow;
namespace fs = std::filesystem;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("prflow_git_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void sh(const std::string &cmd, const fs::path &wd) {
  auto full = "cd \"" + wd.string() + "\" && " + cmd + " >/dev/null 2>&1";
  REQUIRE(std::system(full.c_str()) == 0);
}

static std::string out(const std::string &cmd, const fs::path &wd) {
  auto r = run_command({"sh", "-c", cmd}, wd);
  REQUIRE(r.exit_code == 0);
  return trim_trailing_newlines(r.out);
}

static fs::path init_repo(const char *name) {
  auto repo = mkd(name);
  sh("git init -q", repo);
  sh("git symbolic-ref HEAD refs/heads/master", repo);
  sh("git config user.email test@example.com", repo);
  sh("git config user.name tester", repo);
  sh("git config commit.gpgsign false", repo);
  std::ofstream(repo / "README") << "base\n";
  sh("git add README && git commit -q -m base", repo);
  return repo;
}

static void commit_file(const fs::path &repo, const std::string &file,
                        const std::string &text, const std::string &msg) {
  std::ofstream(repo / file) << text;
  sh("git add \"" + file + "\" && git commit -q -m \"" + msg + "\"", repo);
}

static int ahead(const fs::path &repo, const std::string &a,
                 const std::string &b) {
  return std::stoi(out("git rev-list --count " + b + ".." + a, repo));
}

// Sets environment variables for one scope, restoring the old values.
struct ScopedEnv {
  explicit ScopedEnv(const std::map<std::string, std::string> &vars) {
    for (const auto &[k, v] : vars) {
      const char *old = std::getenv(k.c_str());
      saved_[k] = old ? std::optional<std::string>(old) : std::nullopt;
      ::setenv(k.c_str(), v.c_str(), 1);
    }
  }
  ~ScopedEnv() {
    for (const auto &[k, v] : saved_) {
      if (v)
        ::setenv(k.c_str(), v->c_str(), 1);
      else
        ::unsetenv(k.c_str());
    }
  }
  std::map<std::string, std::optional<std::string>> saved_;
};

static int run_app(const fs::path &repo, std::vector<std::string> args) {
  Config cfg;
  cfg.repo = repo;
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  return App{cfg}.run(static_cast<int>(args.size()), argv.data());
}

TEST_CASE("git service queries") {
  auto repo = init_repo("queries");
  GitService git(repo);

  auto cur = git.current_branch();
  REQUIRE(cur.ok());
  REQUIRE(cur.value() == "master");
  REQUIRE(git.branch_exists("master").value());
  REQUIRE_FALSE(git.branch_exists("dev/none").value());
  REQUIRE(fs::equivalent(git.repo_root().value(), repo));
  REQUIRE(fs::weakly_canonical(git.message_buffer_path().value()) ==
          fs::weakly_canonical(repo / ".git" / "SQUASH_MSG"));

  sh("git checkout -q -b side", repo);
  commit_file(repo, "a.txt", "a\n", "side one");
  commit_file(repo, "b.txt", "b\n", "side two");
  auto counts = git.ahead_counts("side", "master");
  REQUIRE(counts.ok());
  REQUIRE(counts.value() == std::make_pair(2, 0));

  auto base = git.common_ancestor("side", "master");
  REQUIRE(base.ok());
  REQUIRE(base.value() == out("git rev-parse master", repo));

  auto refs = git.log_messages(base.value() + "..side", "^side one");
  REQUIRE(refs.ok());
  REQUIRE(refs.value().size() == 1);
  REQUIRE(git.get_commit_message(refs.value().front()).value() == "side two");

  sh("git checkout -q --detach HEAD", repo);
  auto detached = git.current_branch();
  REQUIRE_FALSE(detached.ok());
  REQUIRE(detached.kind() == ErrorKind::NotOnABranch);
}

TEST_CASE("git failures carry CommandFailure") {
  auto repo = init_repo("failures");
  GitService git(repo);
  auto s = git.checkout("no-such-branch");
  REQUIRE_FALSE(s.ok());
  REQUIRE(s.kind() == ErrorKind::CommandFailure);
  REQUIRE_THAT(s.error().message,
               Catch::Matchers::ContainsSubstring("no-such-branch"));
}

TEST_CASE("dev then pr on a real repository") {
  auto repo = init_repo("flow");
  GitService git(repo);
  Workflow wf(git);

  DevOptions d;
  d.base_name = "feature";
  d.parent = "master";
  REQUIRE(wf.create_development_branch(d).ok());
  REQUIRE(out("git rev-parse --abbrev-ref HEAD", repo) == "dev/feature");
  REQUIRE(ahead(repo, "dev/feature", "master") == 1);
  REQUIRE(out("git log -1 --format=%B dev/feature", repo) ==
          "!update-from: master");

  commit_file(repo, "bug.c", "fixed\n", "fix bug");

  auto r = wf.sync_pull_request_branch(PrOptions{});
  REQUIRE(r.ok());
  REQUIRE(r.value() == SyncOutcome::Committed);
  REQUIRE(out("git rev-parse --abbrev-ref HEAD", repo) == "pr/feature");
  REQUIRE(ahead(repo, "pr/feature", "master") == 1);
  REQUIRE(out("git log -1 --format=%B pr/feature", repo) == "fix bug");
  REQUIRE(out("git diff pr/feature dev/feature", repo).empty());

  // reword, then sync again: the reworded message survives
  sh("git commit -q --amend -m \"Fix the bug properly\"", repo);
  sh("git checkout -q dev/feature", repo);
  commit_file(repo, "more.c", "more\n", "follow up");

  auto again = wf.sync_pull_request_branch(PrOptions{});
  REQUIRE(again.ok());
  REQUIRE(again.value() == SyncOutcome::Committed);
  REQUIRE(ahead(repo, "pr/feature", "master") == 1);
  REQUIRE(out("git log -1 --format=%B pr/feature", repo) ==
          "Fix the bug properly");
  REQUIRE(out("git diff pr/feature dev/feature", repo).empty());
}

TEST_CASE("pr is a no-op once upstream has the work") {
  auto repo = init_repo("noop");
  GitService git(repo);
  Workflow wf(git);

  DevOptions d;
  d.base_name = "feature";
  d.parent = "master";
  d.enable_updates = false;
  REQUIRE(wf.create_development_branch(d).ok());
  commit_file(repo, "f.c", "f\n", "feature");

  sh("git checkout -q master && git merge -q --ff-only dev/feature", repo);
  auto master_tip = out("git rev-parse master", repo);

  PrOptions o;
  o.target = "feature";
  auto r = wf.sync_pull_request_branch(o);
  REQUIRE(r.ok());
  REQUIRE(r.value() == SyncOutcome::NoChanges);
  REQUIRE(out("git rev-parse pr/feature", repo) == master_tip);

  auto again = wf.sync_pull_request_branch(o);
  REQUIRE(again.ok());
  REQUIRE(again.value() == SyncOutcome::NoChanges);
}

TEST_CASE("drifted pr branch is left alone") {
  auto repo = init_repo("drift");
  sh("git checkout -q -b dev/feature", repo);
  commit_file(repo, "f.c", "f\n", "feature");
  sh("git checkout -q -b pr/feature master", repo);
  commit_file(repo, "x.c", "x\n", "foreign one");
  commit_file(repo, "y.c", "y\n", "foreign two");
  sh("git checkout -q dev/feature", repo);
  auto pr_tip = out("git rev-parse pr/feature", repo);
  auto master_tip = out("git rev-parse master", repo);

  GitService git(repo);
  Workflow wf(git);
  auto r = wf.sync_pull_request_branch(PrOptions{});
  REQUIRE_FALSE(r.ok());
  REQUIRE(r.kind() == ErrorKind::TooManyForeignCommits);
  REQUIRE(out("git rev-parse pr/feature", repo) == pr_tip);
  REQUIRE(out("git rev-parse master", repo) == master_tip);
  REQUIRE(out("git rev-parse --abbrev-ref HEAD", repo) == "dev/feature");
}

TEST_CASE("conflicting squash is left for the operator") {
  auto repo = init_repo("conflict");
  sh("git checkout -q -b dev/feature", repo);
  commit_file(repo, "README", "dev side\n", "dev edit");
  sh("git checkout -q master", repo);
  commit_file(repo, "README", "master side\n", "master edit");
  sh("git checkout -q dev/feature", repo);

  GitService git(repo);
  Workflow wf(git);
  auto r = wf.sync_pull_request_branch(PrOptions{});
  REQUIRE_FALSE(r.ok());
  REQUIRE(r.kind() == ErrorKind::MergeConflict);
  REQUIRE(out("git rev-parse --abbrev-ref HEAD", repo) == "pr/feature");
  REQUIRE_FALSE(out("git diff --name-only --diff-filter=U", repo).empty());
}

TEST_CASE("app exit codes") {
  auto repo = init_repo("app");
  REQUIRE(run_app(repo, {"prflow", "dev", "feature"}) == 0);
  commit_file(repo, "f.c", "f\n", "feature work");
  REQUIRE(run_app(repo, {"prflow", "-v", "pr"}) == 0);
  REQUIRE(out("git log -1 --format=%B pr/feature", repo) == "feature work");

  REQUIRE(run_app(repo, {"prflow", "pr"}) == 1);   // on pr/feature now
  REQUIRE(run_app(repo, {"prflow", "pr", "ghost"}) == 1);
  REQUIRE(run_app(repo, {"prflow", "bogus"}) == 2);
  REQUIRE(run_app(repo, {"prflow", "version"}) == 0);
}

TEST_CASE("a hash-prefixed dev commit becomes the pr message") {
  auto repo = init_repo("hash");
  sh("git checkout -q -b dev/feature", repo);
  commit_file(repo, "crash.c", "fixed\n", "#42: fix crash");

  GitService git(repo);
  Workflow wf(git);
  auto r = wf.sync_pull_request_branch(PrOptions{});
  REQUIRE(r.ok());
  REQUIRE(r.value() == SyncOutcome::Committed);
  REQUIRE(ahead(repo, "pr/feature", "master") == 1);
  REQUIRE(out("git log -1 --format=%B pr/feature", repo) == "#42: fix crash");

  // the reused message keeps its hash lines too
  sh("git commit -q --amend --cleanup=verbatim -m \"Fix crash\n\n# Testing\"",
     repo);
  auto reworded = out("git log -1 --format=%B pr/feature", repo);
  sh("git checkout -q dev/feature", repo);
  commit_file(repo, "more.c", "more\n", "follow up");
  auto again = wf.sync_pull_request_branch(PrOptions{});
  REQUIRE(again.ok());
  REQUIRE(out("git log -1 --format=%B pr/feature", repo) == reworded);
  REQUIRE_THAT(reworded, Catch::Matchers::ContainsSubstring("# Testing"));
}

TEST_CASE("pr inside a linked worktree") {
  auto repo = init_repo("wt_main");
  sh("git checkout -q -b dev/feature", repo);
  commit_file(repo, "f.c", "f\n", "feature work");
  sh("git checkout -q --detach master", repo);

  auto wt = repo.parent_path() / "prflow_git_wt_linked";
  fs::remove_all(wt);
  sh("git worktree prune && git worktree add -q \"" + wt.string() +
         "\" dev/feature",
     repo);

  GitService git(wt);
  auto buffer = git.message_buffer_path();
  REQUIRE(buffer.ok());
  REQUIRE(fs::is_directory(buffer.value().parent_path()));

  Workflow wf(git);
  auto r = wf.sync_pull_request_branch(PrOptions{});
  REQUIRE(r.ok());
  REQUIRE(r.value() == SyncOutcome::Committed);
  REQUIRE(out("git rev-parse --abbrev-ref HEAD", wt) == "pr/feature");
  REQUIRE(ahead(wt, "pr/feature", "master") == 1);
  REQUIRE(out("git log -1 --format=%B pr/feature", wt) == "feature work");
}

TEST_CASE("conflicts are detected whatever language git speaks") {
  auto repo = init_repo("conflict_locale");
  sh("git checkout -q -b dev/feature", repo);
  commit_file(repo, "README", "dev side\n", "dev edit");
  sh("git checkout -q master", repo);
  commit_file(repo, "README", "master side\n", "master edit");
  sh("git checkout -q dev/feature", repo);

  ScopedEnv env({{"LANGUAGE", "de"}, {"LC_ALL", "de_DE.UTF-8"}});
  GitService git(repo);
  Workflow wf(git);
  auto r = wf.sync_pull_request_branch(PrOptions{});
  REQUIRE_FALSE(r.ok());
  REQUIRE(r.kind() == ErrorKind::MergeConflict);
}
