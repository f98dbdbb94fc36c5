#pragma once
#include <prflow/config.hpp>

#include <utility>

namespace prflow {

class App {
public:
  App() : cfg_(load_config()) {}
  explicit App(Config cfg) : cfg_(std::move(cfg)) {}

  // 0 on success or no changes, 1 on a workflow failure, 2 on bad usage.
  int run(int argc, char **argv);

private:
  Config cfg_;
};

} // namespace prflow
