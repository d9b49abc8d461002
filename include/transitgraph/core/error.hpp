/* Error taxonomy: Status/Result for expected domain failures, exceptions for
 * programming-contract violations only.
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace transitgraph::core {

struct TypeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RuntimeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

enum class ErrorKind {
  Ok = 0,
  InvalidInput = 1,  // self-loop, non-positive duration, bad split point, bad config
  Duplicate = 2,     // connection already exists in either order
  NotFound = 3,      // unknown city, connection or branch id
  Unavailable = 4    // undo/redo with nothing to act on, I/O failure
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind) noexcept;

// Outcome of a core operation. Cheap to copy; message is empty on success.
class Status {
public:
  Status() = default;

  [[nodiscard]] static Status ok() { return Status{}; }
  [[nodiscard]] static Status invalid_input(std::string msg) { return Status(ErrorKind::InvalidInput, std::move(msg)); }
  [[nodiscard]] static Status duplicate(std::string msg) { return Status(ErrorKind::Duplicate, std::move(msg)); }
  [[nodiscard]] static Status not_found(std::string msg) { return Status(ErrorKind::NotFound, std::move(msg)); }
  [[nodiscard]] static Status unavailable(std::string msg) { return Status(ErrorKind::Unavailable, std::move(msg)); }

  [[nodiscard]] bool is_ok() const noexcept { return kind_ == ErrorKind::Ok; }
  explicit operator bool() const noexcept { return is_ok(); }
  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  // "<Kind>: <message>" for logs; "OK" on success.
  [[nodiscard]] std::string to_string() const;

private:
  Status(ErrorKind kind, std::string msg) : kind_(kind), message_(std::move(msg)) {}

  ErrorKind kind_ {ErrorKind::Ok};
  std::string message_ {};
};

// Value-or-Status. A Result built from a Status must carry a failure.
template <typename T>
class Result {
public:
  Result(T value) : value_(std::move(value)) {}  // NOLINT(google-explicit-constructor)
  Result(Status status) : status_(std::move(status)) {  // NOLINT(google-explicit-constructor)
    if (status_.is_ok()) {
      throw RuntimeError("Result constructed from an OK status without a value");
    }
  }

  [[nodiscard]] bool is_ok() const noexcept { return value_.has_value(); }
  explicit operator bool() const noexcept { return is_ok(); }
  [[nodiscard]] const Status& status() const noexcept { return status_; }

  [[nodiscard]] const T& value() const& {
    if (!value_) throw RuntimeError("Result::value on failure: " + status_.to_string());
    return *value_;
  }
  [[nodiscard]] T& value() & {
    if (!value_) throw RuntimeError("Result::value on failure: " + status_.to_string());
    return *value_;
  }
  [[nodiscard]] T&& value() && {
    if (!value_) throw RuntimeError("Result::value on failure: " + status_.to_string());
    return std::move(*value_);
  }

private:
  std::optional<T> value_ {};
  Status status_ {};
};

} // namespace transitgraph::core
