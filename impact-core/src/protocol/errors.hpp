#pragma once

#include <stdexcept>
#include <string>

namespace protocol {

enum class ErrorKind {
  Validation,
  NotFound,
  Authorization,
  StateConflict,
  InsufficientFunds,
  InsufficientShares,
};

inline const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation: return "ValidationError";
  case ErrorKind::NotFound: return "NotFoundError";
  case ErrorKind::Authorization: return "AuthorizationError";
  case ErrorKind::StateConflict: return "StateConflictError";
  case ErrorKind::InsufficientFunds: return "InsufficientFundsError";
  case ErrorKind::InsufficientShares: return "InsufficientSharesError";
  }
  return "ProtocolError";
}

// 业务错误. 在规划阶段抛出, 抛出时尚未修改任何状态
class ProtocolError : public std::runtime_error {
public:
  ProtocolError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

class ValidationError : public ProtocolError {
public:
  explicit ValidationError(const std::string &message)
      : ProtocolError(ErrorKind::Validation, message) {}
};

class NotFoundError : public ProtocolError {
public:
  explicit NotFoundError(const std::string &message)
      : ProtocolError(ErrorKind::NotFound, message) {}
};

class AuthorizationError : public ProtocolError {
public:
  explicit AuthorizationError(const std::string &message)
      : ProtocolError(ErrorKind::Authorization, message) {}
};

class StateConflictError : public ProtocolError {
public:
  explicit StateConflictError(const std::string &message)
      : ProtocolError(ErrorKind::StateConflict, message) {}
};

class InsufficientFundsError : public ProtocolError {
public:
  explicit InsufficientFundsError(const std::string &message)
      : ProtocolError(ErrorKind::InsufficientFunds, message) {}
};

class InsufficientSharesError : public ProtocolError {
public:
  explicit InsufficientSharesError(const std::string &message)
      : ProtocolError(ErrorKind::InsufficientShares, message) {}
};

} // namespace protocol
