#include <prflow/cli.hpp>
#include <string_view>
#include <vector>

namespace prflow {

static bool has_arg(size_t i, size_t n) { return i + 1 < n; }

static ParseResult parse_dev(const std::vector<std::string_view> &args,
                             ParseResult r) {
  CmdDev c{};
  bool have_branch = false;
  for (size_t i = 0; i < args.size(); ++i) {
    std::string_view a = args[i];
    if (a == "--on" && has_arg(i, args.size())) {
      c.on = std::string(args[++i]);
    } else if (a == "--from" && has_arg(i, args.size())) {
      c.from = std::string(args[++i]);
    } else if (a == "--no-updates") {
      c.updates = false;
    } else if (!a.empty() && a[0] == '-') {
      r.error = "dev: unknown or incomplete option " + std::string(a);
      return r;
    } else if (!have_branch) {
      c.branch = std::string(a);
      have_branch = true;
    } else {
      r.error = "dev: unexpected argument " + std::string(a);
      return r;
    }
  }
  if (!have_branch) {
    r.error = "dev: branch required";
    return r;
  }
  r.cmd = c;
  return r;
}

static ParseResult parse_pr(const std::vector<std::string_view> &args,
                            ParseResult r) {
  CmdPr c{};
  for (size_t i = 0; i < args.size(); ++i) {
    std::string_view a = args[i];
    if (a == "--on" && has_arg(i, args.size())) {
      c.on = std::string(args[++i]);
    } else if (a == "-D" && has_arg(i, args.size())) {
      c.dev = std::string(args[++i]);
    } else if (!a.empty() && a[0] == '-') {
      r.error = "pr: unknown or incomplete option " + std::string(a);
      return r;
    } else if (!c.branch) {
      c.branch = std::string(a);
    } else {
      r.error = "pr: unexpected argument " + std::string(a);
      return r;
    }
  }
  r.cmd = c;
  return r;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  int i = 1;
  for (; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "-v" || a == "--verbose")
      r.verbose = true;
    else
      break;
  }

  if (i >= argc) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[i];
  std::vector<std::string_view> rest;
  for (int k = i + 1; k < argc; ++k) {
    std::string_view a = argv[k];
    if (a == "-v" || a == "--verbose")
      r.verbose = true;
    else
      rest.push_back(a);
  }

  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }
  if (cmd == "dev")
    return parse_dev(rest, r);
  if (cmd == "pr")
    return parse_pr(rest, r);

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace prflow
