#pragma once
#include <optional>
#include <string>
#include <variant>

namespace prflow {

struct CmdDev {
  std::string branch;
  std::optional<std::string> on;
  bool updates = true;
  std::optional<std::string> from;
};

struct CmdPr {
  std::optional<std::string> branch;
  std::optional<std::string> on;
  std::optional<std::string> dev;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdDev, CmdPr, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  bool verbose = false;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace prflow
