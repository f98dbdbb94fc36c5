#include <prflow/error.hpp>

namespace prflow {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotOnABranch:
    return "NotOnABranch";
  case ErrorKind::NamingMismatch:
    return "NamingMismatch";
  case ErrorKind::NoSuchDevelopmentBranch:
    return "NoSuchDevelopmentBranch";
  case ErrorKind::TooManyForeignCommits:
    return "TooManyForeignCommits";
  case ErrorKind::MergeConflict:
    return "MergeConflict";
  case ErrorKind::CommandFailure:
    return "CommandFailure";
  }
  return "unknown";
}

Error make_error(ErrorKind kind, std::string message) {
  return Error{kind, std::move(message)};
}

} // namespace prflow
