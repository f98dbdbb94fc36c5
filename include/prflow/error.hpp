#pragma once
#include <string>
#include <utility>
#include <variant>

namespace prflow {

enum class ErrorKind {
  NotOnABranch,
  NamingMismatch,
  NoSuchDevelopmentBranch,
  TooManyForeignCommits,
  MergeConflict,
  CommandFailure,
};

const char *to_string(ErrorKind kind);

struct Error {
  ErrorKind kind{ErrorKind::CommandFailure};
  std::string message;
};

Error make_error(ErrorKind kind, std::string message);

// Value or Error. Callers branch on error().kind, nothing is thrown.
template <typename T> class Result {
public:
  Result(T value) : v_(std::move(value)) {}
  Result(Error err) : v_(std::move(err)) {}

  bool ok() const { return std::holds_alternative<T>(v_); }
  explicit operator bool() const { return ok(); }

  T &value() { return std::get<T>(v_); }
  const T &value() const { return std::get<T>(v_); }
  const Error &error() const { return std::get<Error>(v_); }
  ErrorKind kind() const { return error().kind; }

private:
  std::variant<T, Error> v_;
};

using Status = Result<std::monostate>;

inline Status ok_status() { return Status(std::monostate{}); }

} // namespace prflow
