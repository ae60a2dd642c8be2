#pragma once

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <source_location>

namespace keyward::core {

// Error code definitions. The transport layer maps each code to a protocol status.
enum class ErrorCode : int {
  Success = 0,
  UnknownError = 1,
  InvalidCredentials = 2,
  TokenInvalid = 3,
  PermissionDenied = 4,
  NotFound = 5,
  Conflict = 6,
  ValidationError = 7,
  StoreUnavailable = 8,
  ConfigurationError = 9,
};

[[nodiscard]] kj::String to_string(ErrorCode code);
[[nodiscard]] ErrorCode to_error_code(kj::StringPtr str);

/**
 * @brief Reason a token failed validation
 *
 * Kept for logging only. Callers always see TokenInvalid regardless of the reason.
 */
enum class TokenError {
  NONE,
  INVALID_FORMAT,
  INVALID_BASE64,
  INVALID_JSON,
  MISSING_CLAIMS,
  ALGORITHM_MISMATCH,
  UNKNOWN_KEY,
  INVALID_SIGNATURE,
  EXPIRED,
  FUTURE_ISSUED,
  TYPE_MISMATCH,
  REVOKED,
  INACTIVE_SUBJECT, // user or application disabled or deleted since issue
};

[[nodiscard]] kj::StringPtr to_string(TokenError error);

/**
 * @brief Base exception class for the keyward core
 *
 * Captures source location information and a kj::Exception::Type so failures can be
 * rethrown through KJ infrastructure when needed. Every subclass reports a distinct
 * ErrorCode.
 *
 * Usage:
 *   throw NotFound("No application with slug", slug);
 */
class KeywardException {
public:
  explicit KeywardException(kj::StringPtr message,
                            kj::Exception::Type type = kj::Exception::Type::FAILED,
                            const std::source_location& location = std::source_location::current())
      : message_(kj::str(message)), file_(kj::str(location.file_name())), line_(location.line()),
        function_(kj::str(location.function_name())), type_(type) {}

  virtual ~KeywardException() = default;

  KeywardException(KeywardException&&) = default;
  KeywardException& operator=(KeywardException&&) = default;

  KeywardException(const KeywardException& other)
      : message_(kj::str(other.message_)), file_(kj::str(other.file_)), line_(other.line_),
        function_(kj::str(other.function_)), type_(other.type_) {}

  KeywardException& operator=(const KeywardException& other) {
    if (this != &other) {
      message_ = kj::str(other.message_);
      file_ = kj::str(other.file_);
      line_ = other.line_;
      function_ = kj::str(other.function_);
      type_ = other.type_;
    }
    return *this;
  }

  [[nodiscard]] virtual ErrorCode code() const noexcept {
    return ErrorCode::UnknownError;
  }
  [[nodiscard]] kj::StringPtr message() const noexcept {
    return message_;
  }
  [[nodiscard]] kj::StringPtr file() const noexcept {
    return file_;
  }
  [[nodiscard]] int line() const noexcept {
    return line_;
  }
  [[nodiscard]] kj::StringPtr function() const noexcept {
    return function_;
  }
  [[nodiscard]] kj::Exception::Type type() const noexcept {
    return type_;
  }

  [[nodiscard]] const char* what() const noexcept {
    return message_.cStr();
  }

  [[nodiscard]] kj::Exception toKjException() const {
    return kj::Exception(type_, file_.cStr(), line_, kj::str(to_string(code()), ": ", message_));
  }

protected:
  kj::String message_;
  kj::String file_;
  int line_;
  kj::String function_;
  kj::Exception::Type type_;
};

/**
 * @brief Login failure
 *
 * Intentionally uninformative: the message never says whether the user exists, is
 * disabled or typed a wrong password. The trace id ties the opaque message to the
 * detailed server-side log line.
 */
class InvalidCredentials : public KeywardException {
public:
  explicit InvalidCredentials(kj::StringPtr trace_id,
                              const std::source_location& location = std::source_location::current())
      : KeywardException(kj::str("Could not validate credentials (trace ID: ", trace_id, ")"),
                         kj::Exception::Type::FAILED, location),
        trace_id_(kj::str(trace_id)) {}

  InvalidCredentials(const InvalidCredentials& other)
      : KeywardException(other), trace_id_(kj::str(other.trace_id_)) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::InvalidCredentials;
  }
  [[nodiscard]] kj::StringPtr trace_id() const noexcept {
    return trace_id_;
  }

private:
  kj::String trace_id_;
};

/**
 * @brief Malformed, expired, revoked or wrong-type token
 */
class TokenInvalid : public KeywardException {
public:
  explicit TokenInvalid(TokenError reason,
                        const std::source_location& location = std::source_location::current())
      : KeywardException(kj::str("Invalid token: ", to_string(reason)),
                         kj::Exception::Type::FAILED, location),
        reason_(reason) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::TokenInvalid;
  }
  [[nodiscard]] TokenError reason() const noexcept {
    return reason_;
  }

private:
  TokenError reason_;
};

/**
 * @brief Valid identity, insufficient rights
 */
class PermissionDenied : public KeywardException {
public:
  PermissionDenied(kj::StringPtr permission, kj::StringPtr trace_id,
                   const std::source_location& location = std::source_location::current())
      : KeywardException(kj::str("Not enough permissions (trace ID: ", trace_id, ")"),
                         kj::Exception::Type::FAILED, location),
        permission_(kj::str(permission)), trace_id_(kj::str(trace_id)) {}

  PermissionDenied(const PermissionDenied& other)
      : KeywardException(other), permission_(kj::str(other.permission_)),
        trace_id_(kj::str(other.trace_id_)) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::PermissionDenied;
  }
  [[nodiscard]] kj::StringPtr permission() const noexcept {
    return permission_;
  }
  [[nodiscard]] kj::StringPtr trace_id() const noexcept {
    return trace_id_;
  }

private:
  kj::String permission_;
  kj::String trace_id_;
};

/**
 * @brief Referenced application, user, role or grant does not exist
 */
class NotFound : public KeywardException {
public:
  explicit NotFound(kj::StringPtr message,
                    const std::source_location& location = std::source_location::current())
      : KeywardException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::NotFound;
  }
};

/**
 * @brief Uniqueness violation (duplicate slug, login, role name or grant)
 */
class Conflict : public KeywardException {
public:
  explicit Conflict(kj::StringPtr message,
                    const std::source_location& location = std::source_location::current())
      : KeywardException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::Conflict;
  }
};

/**
 * @brief Invalid input (bad slug, login, permission string, empty password)
 */
class ValidationException : public KeywardException {
public:
  explicit ValidationException(kj::StringPtr message,
                               const std::source_location& location = std::source_location::current())
      : KeywardException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::ValidationError;
  }
};

/**
 * @brief Transient persistence failure; the caller may retry with backoff
 */
class StoreUnavailable : public KeywardException {
public:
  explicit StoreUnavailable(kj::StringPtr message,
                            const std::source_location& location = std::source_location::current())
      : KeywardException(message, kj::Exception::Type::OVERLOADED, location) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::StoreUnavailable;
  }
};

/**
 * @brief Configuration could not be resolved; fatal at startup
 */
class ConfigException : public KeywardException {
public:
  explicit ConfigException(kj::StringPtr message,
                           const std::source_location& location = std::source_location::current())
      : KeywardException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::ConfigurationError;
  }
};

#define KEYWARD_REQUIRE(condition, ...) KJ_REQUIRE(condition, ##__VA_ARGS__)
#define KEYWARD_ASSERT(condition, ...) KJ_ASSERT(condition, ##__VA_ARGS__)

} // namespace keyward::core
