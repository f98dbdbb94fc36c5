#pragma once
#include <optional>
#include <string>

namespace prflow {

inline const std::string kDevPrefix = "dev/";
inline const std::string kPrPrefix = "pr/";

// Tags synthetic "pull updates from parent" commits.
inline const std::string kUpdateMarker = "!update-from:";

std::string development(const std::string &base);
std::string pull_request(const std::string &base);

// "dev/foo" -> "foo"; nullopt when the prefix is missing or nothing follows it.
std::optional<std::string> strip_development(const std::string &branch);

std::string update_marker_message(const std::string &parent);

// True when some line of the message begins with the update marker.
bool is_update_commit(const std::string &message);

} // namespace prflow
