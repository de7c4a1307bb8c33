#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ledge {

/**
 * @brief Thrown for programmer errors: binding an adapter to a dead world or
 * body, or constructing a helper with nonsensical parameters.
 */
class LedgeException : public std::exception {
public:
  explicit LedgeException(const std::string &message);
  const char *what() const noexcept override;

private:
  std::string message;
};

// Logs message at error level, then throws LedgeException
[[noreturn]] void throwError(const std::string &message);

// Recoverable failure categories (config loading)
enum class ErrorCode : uint16_t {
  Ok = 0,
  InvalidArgument, // value out of its allowed range
  InvalidState,    // value of the wrong kind
  NotFound,
  ParseError,
  Internal
};

std::string_view errorCodeToString(ErrorCode code);

/**
 * @brief Value or error code plus message. Move-only so a failure cannot be
 * silently duplicated and dropped.
 */
template <typename T>
class Result {
public:
  static Result ok(T value) { return Result(std::move(value)); }

  static Result error(ErrorCode code, std::string message = "") {
    return Result(code, std::move(message));
  }

  bool isOk() const { return code_ == ErrorCode::Ok; }
  bool isError() const { return code_ != ErrorCode::Ok; }
  ErrorCode code() const { return code_; }
  const std::string &message() const { return message_; }

  T &value() {
    if (isError())
      throwError("Result contains error: " + message_);
    return *value_;
  }

  const T &value() const {
    if (isError())
      throwError("Result contains error: " + message_);
    return *value_;
  }

  T valueOr(T fallback) const {
    if (isOk())
      return *value_;
    return fallback;
  }

  // Same failure, different value type
  template <typename U>
  Result<U> forward() const {
    return Result<U>::error(code_, message_);
  }

  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

private:
  explicit Result(T value) : code_(ErrorCode::Ok), value_(std::move(value)) {}

  Result(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code_;
  std::string message_;
  std::optional<T> value_;
};

template <>
class Result<void> {
public:
  static Result ok() { return Result(); }

  static Result error(ErrorCode code, std::string message = "") {
    return Result(code, std::move(message));
  }

  bool isOk() const { return code_ == ErrorCode::Ok; }
  bool isError() const { return code_ != ErrorCode::Ok; }
  ErrorCode code() const { return code_; }
  const std::string &message() const { return message_; }

  template <typename U>
  Result<U> forward() const {
    return Result<U>::error(code_, message_);
  }

  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

private:
  Result() : code_(ErrorCode::Ok) {}

  Result(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code_;
  std::string message_;
};

} // namespace ledge
