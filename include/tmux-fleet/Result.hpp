#pragma once
#include <fmt/format.h>
#include <string>
#include <utility>
#include <variant>

namespace fleet {

enum class ErrorKind {
  InvalidInput,       // malformed name, port or configuration
  PreconditionFailed, // required state (already exists) does not hold
  NotFound,           // PreconditionFailed: directory/session/window missing
  ExternalToolError,  // tmux returned an unexpected status
  IOFailure           // filesystem create/copy/move/remove/read failed
};

const char *error_kind_name(ErrorKind kind);

struct Error {
  ErrorKind kind{ErrorKind::IOFailure};
  std::string message;

  /// NotFound is reported as a precondition failure as well
  bool is_precondition() const {
    return kind == ErrorKind::PreconditionFailed ||
           kind == ErrorKind::NotFound;
  }
};

template <typename... Args>
Error make_error(ErrorKind kind, const std::string &fmt_str, Args &&...args) {
  return Error{kind, fmt::format(fmt::runtime(fmt_str),
                                 std::forward<Args>(args)...)};
}

/// Either a value or an Error. Returned by every lifecycle operation; only
/// the CLI dispatch turns an Error into an exit code.
template <typename T> class Result {
public:
  Result(T value) : data_(std::move(value)) {}
  Result(Error error) : data_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(data_); }
  explicit operator bool() const { return ok(); }

  const T &value() const & { return std::get<T>(data_); }
  T &value() & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  const Error &error() const { return std::get<Error>(data_); }

private:
  std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
  Result() = default;
  Result(Error error) : error_(std::move(error)), ok_(false) {}

  bool ok() const { return ok_; }
  explicit operator bool() const { return ok_; }

  const Error &error() const { return error_; }

private:
  Error error_;
  bool ok_{true};
};

using Status = Result<void>;

inline Status ok_status() { return Status(); }

} // namespace fleet
