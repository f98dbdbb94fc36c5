#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace prflow {

struct CmdResult {
  int exit_code{};
  std::string out;
  std::string err;
};

// Runs argv[0] from PATH in cwd, capturing stdout and stderr separately.
// exit_code is -1 when the child could not be set up, 127 when exec failed,
// 128+N when killed by signal N.
CmdResult run_command(const std::vector<std::string> &argv,
                      const std::filesystem::path &cwd);

std::string join_args(const std::vector<std::string> &argv);

std::string trim_trailing_newlines(std::string s);

} // namespace prflow
