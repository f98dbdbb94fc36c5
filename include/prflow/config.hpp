#pragma once
#include <filesystem>
#include <string>

namespace prflow {

struct Config {
  std::string default_parent = "master";
  std::string git = "git";
  std::filesystem::path repo = ".";
  bool verbose = false;
};

// Defaults, then PRFLOW_PARENT, PRFLOW_GIT, PRFLOW_REPO, PRFLOW_VERBOSE.
Config load_config();

} // namespace prflow
