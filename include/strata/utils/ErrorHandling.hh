#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace strata {

// Why a draw, pipeline specialization or config load was rejected
enum class ErrorCode : uint16_t {
  Ok = 0,
  InvalidState,      // bindings or flags that cannot be used together
  NotFound,          // missing file, key, block or instance
  AlreadyExists,     // duplicate block identifier
  ResourceExhausted, // block id space is full
  TypeMismatch,      // config value has the wrong TOML type
  OutOfRange,        // config value or block id outside its valid range
  ParseError         // malformed or unreadable TOML document
};

std::string_view errorCodeToString(ErrorCode code);

/**
 * @brief Thrown for misuse that callers cannot recover from, such as
 * reading the value of a failed Result or querying an unregistered block.
 */
class StrataException : public std::exception {
public:
  explicit StrataException(const std::string &message,
                           ErrorCode code = ErrorCode::InvalidState);
  const char *what() const noexcept override;
  ErrorCode code() const noexcept { return code_; }

private:
  std::string message_;
  ErrorCode code_;
};

// Logs through the root logger, then throws StrataException.
[[noreturn]] void throwError(const std::string &message);
[[noreturn]] void throwError(ErrorCode code, const std::string &message);

template <typename T> class Result;

namespace detail {

// Shared state for Result<T> and Result<void>
class ResultBase {
public:
  bool isOk() const { return code_ == ErrorCode::Ok; }
  bool isError() const { return code_ != ErrorCode::Ok; }
  ErrorCode code() const { return code_; }
  const std::string &message() const { return message_; }

protected:
  ResultBase() : code_(ErrorCode::Ok) {}
  ResultBase(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  void requireOk() const {
    if (isError())
      throwError(code_, std::string(errorCodeToString(code_)) + ": " + message_);
  }

  ErrorCode code_;
  std::string message_;
};

} // namespace detail

// Value or error. Move-only so large vertex and fragment buffers are never copied.
template <typename T>
class Result : public detail::ResultBase {
public:
  static Result ok(T value) { return Result(std::move(value)); }

  static Result error(ErrorCode code, std::string message = "") {
    return Result(code, std::move(message));
  }

  // Carries a failure from a Result of another type up the call chain.
  template <typename U>
  static Result errorFrom(const Result<U> &failed) {
    return Result(failed.code(), failed.message());
  }

  T &value() {
    requireOk();
    return *value_;
  }

  const T &value() const {
    requireOk();
    return *value_;
  }

  T valueOr(T defaultValue) const {
    if (isOk())
      return *value_;
    return defaultValue;
  }

  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

private:
  explicit Result(T value) : value_(std::move(value)) {}
  Result(ErrorCode code, std::string message)
      : ResultBase(code, std::move(message)) {}

  std::optional<T> value_;
};

template <>
class Result<void> : public detail::ResultBase {
public:
  static Result ok() { return Result(); }

  static Result error(ErrorCode code, std::string message = "") {
    return Result(code, std::move(message));
  }

  template <typename U>
  static Result errorFrom(const Result<U> &failed) {
    return Result(failed.code(), failed.message());
  }

  // Throws StrataException when this holds an error.
  void check() const { requireOk(); }

  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

private:
  Result() = default;
  Result(ErrorCode code, std::string message)
      : ResultBase(code, std::move(message)) {}
};

} // namespace strata
