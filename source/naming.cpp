#include <prflow/naming.hpp>
#include <sstream>

namespace prflow {

std::string development(const std::string &base) { return kDevPrefix + base; }

std::string pull_request(const std::string &base) { return kPrPrefix + base; }

std::optional<std::string> strip_development(const std::string &branch) {
  if (branch.rfind(kDevPrefix, 0) != 0 || branch.size() == kDevPrefix.size())
    return std::nullopt;
  return branch.substr(kDevPrefix.size());
}

std::string update_marker_message(const std::string &parent) {
  return kUpdateMarker + " " + parent;
}

bool is_update_commit(const std::string &message) {
  std::istringstream in(message);
  std::string line;
  while (std::getline(in, line)) {
    if (line.rfind(kUpdateMarker, 0) == 0)
      return true;
  }
  return false;
}

} // namespace prflow
