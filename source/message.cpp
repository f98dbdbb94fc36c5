#include <prflow/message.hpp>

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace prflow {

std::size_t count_lines(const std::string &text) {
  if (text.empty())
    return 0;
  std::size_t n = 0;
  for (char c : text) {
    if (c == '\n')
      ++n;
  }
  // last line without a terminating newline
  if (text.back() != '\n')
    ++n;
  return n;
}

bool is_trivial_squash_message(const std::string &text) {
  return count_lines(text) <= kTrivialMessageLines;
}

std::string compose_message(const std::string &candidate,
                            const std::string &previous) {
  std::string out = candidate;
  if (out.empty() || out.back() != '\n')
    out += '\n';
  out += '\n';
  out += kScissorsLine + '\n';

  std::istringstream in(previous);
  std::string line;
  while (std::getline(in, line)) {
    if (line.rfind('#', 0) == 0)
      out += line;
    else if (line.empty())
      out += "#";
    else
      out += "# " + line;
    out += '\n';
  }
  return out;
}

std::string committable_message(const std::string &buffer) {
  std::string out;
  std::istringstream in(buffer);
  std::string line;
  while (std::getline(in, line)) {
    if (line == kScissorsLine)
      break;
    out += line;
    out += '\n';
  }
  while (!out.empty() && (out.back() == '\n' || out.back() == ' ' ||
                          out.back() == '\t' || out.back() == '\r'))
    out.pop_back();
  return out;
}

Result<std::optional<std::string>>
read_message_buffer(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec))
    return std::optional<std::string>{};

  std::ifstream in(path, std::ios::binary);
  if (!in)
    return make_error(ErrorKind::CommandFailure,
                      fmt::format("cannot open {}", path.string()));
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (in.bad())
    return make_error(ErrorKind::CommandFailure,
                      fmt::format("cannot read {}", path.string()));
  return std::optional<std::string>{std::move(data)};
}

Status write_message_buffer(const fs::path &path, const std::string &text) {
  std::ofstream o(path, std::ios::binary | std::ios::trunc);
  if (!o)
    return make_error(ErrorKind::CommandFailure,
                      fmt::format("cannot open {} for writing", path.string()));
  o << text;
  o.flush();
  if (!o)
    return make_error(ErrorKind::CommandFailure,
                      fmt::format("cannot write {}", path.string()));
  return ok_status();
}

Status rewrite_message_buffer(const fs::path &path,
                              const std::string &candidate) {
  std::string previous;
  {
    auto r = read_message_buffer(path);
    if (!r)
      return r.error();
    previous = r.value().value_or("");
  }
  return write_message_buffer(path, compose_message(candidate, previous));
}

} // namespace prflow
