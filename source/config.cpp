#include <prflow/config.hpp>

#include <cstdlib>
#include <string_view>

namespace prflow {

Config load_config() {
  Config cfg;
  if (const char *e = std::getenv("PRFLOW_PARENT"); e && *e)
    cfg.default_parent = e;
  if (const char *e = std::getenv("PRFLOW_GIT"); e && *e)
    cfg.git = e;
  if (const char *e = std::getenv("PRFLOW_REPO"); e && *e)
    cfg.repo = e;
  if (const char *e = std::getenv("PRFLOW_VERBOSE"))
    cfg.verbose = *e && std::string_view(e) != "0";
  return cfg;
}

} // namespace prflow
