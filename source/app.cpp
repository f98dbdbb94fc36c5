#include <prflow/app.hpp>
#include <prflow/cli.hpp>
#include <prflow/git.hpp>
#include <prflow/naming.hpp>
#include <prflow/workflow.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <type_traits>

#ifndef PRFLOW_VERSION
#define PRFLOW_VERSION "unknown"
#endif
#ifndef PRFLOW_COMMIT
#define PRFLOW_COMMIT "unknown"
#endif

namespace prflow {

static void print_help() {
  std::cout <<
      R"(prflow - squash development branches into pull-request branches

Usage:
  prflow [-v] dev <branch> [--on PARENT] [--no-updates] [--from SEED]
      create dev/<branch> from PARENT; unless --no-updates, start it with an
      empty "!update-from: PARENT" commit; --from squashes SEED onto it

  prflow [-v] pr [<branch>] [--on PARENT] [-D DEV]
      rebuild pr/<branch> as PARENT plus one squashed commit of dev/<DEV>;
      <branch> defaults to the current dev/ branch, DEV to <branch>

  prflow help | version

Environment:
  PRFLOW_PARENT   default PARENT (master)
  PRFLOW_GIT      git executable (git)
  PRFLOW_REPO     repository directory (.)
  PRFLOW_VERBOSE  non-zero logs every git command, like -v

Only one prflow may run against a repository at a time.
)";
}

static int report(const Error &e) {
  spdlog::error("{}: {}", to_string(e.kind), e.message);
  if (e.kind == ErrorKind::MergeConflict)
    spdlog::error("resolve the conflicts and commit, or run 'git reset "
                  "--hard' to abandon the squash");
  return 1;
}

int App::run(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto pr = parse_cli(argc, argv);
  spdlog::set_level(pr.verbose || cfg_.verbose ? spdlog::level::debug
                                               : spdlog::level::info);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  try {
    GitService git(cfg_.repo, cfg_.git);
    Workflow wf(git);

    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("prflow {} ({})\n", PRFLOW_VERSION,
                                     PRFLOW_COMMIT);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdDev>) {
            DevOptions opts;
            opts.base_name = c.branch;
            opts.parent = c.on.value_or(cfg_.default_parent);
            opts.enable_updates = c.updates;
            opts.seed = c.from;
            auto s = wf.create_development_branch(opts);
            if (!s)
              return report(s.error());
            spdlog::info("[dev] {} ready", development(c.branch));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdPr>) {
            PrOptions opts;
            opts.target = c.branch;
            opts.dev = c.dev;
            opts.parent = c.on;
            opts.default_parent = cfg_.default_parent;
            auto r = wf.sync_pull_request_branch(opts);
            if (!r)
              return report(r.error());
            if (r.value() == SyncOutcome::NoChanges)
              spdlog::info("[pr] no changes to squash");
            else
              spdlog::info("[pr] squashed commit created");
            return 0;
          }
        },
        *pr.cmd);
  } catch (const std::exception &e) {
    spdlog::error("unexpected failure: {}", e.what());
    return 1;
  }
}

} // namespace prflow
