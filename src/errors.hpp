#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  None,
  Startup,
  UnsupportedScheme,
  InvalidMagnet,
  InvalidState,
  RpcTimeout,
  Transfer,
  Cancelled,
  NotFound
};

// "StartupError", "InvalidStateError", ...; "" for ErrorKind::None.
const char* error_kind_name(ErrorKind kind);

class DownloadError : public std::runtime_error {
public:
  DownloadError(ErrorKind kind, const std::string& message, bool retryable = false)
    : std::runtime_error(message), kind_(kind), retryable_(retryable) {}

  ErrorKind kind() const { return kind_; }
  bool retryable() const { return retryable_; }

  // "<KindName>: <message>"
  std::string describe() const;

private:
  ErrorKind kind_;
  bool retryable_;
};

class StartupError : public DownloadError {
public:
  explicit StartupError(const std::string& message)
    : DownloadError(ErrorKind::Startup, message, true) {}
};

class UnsupportedSchemeError : public DownloadError {
public:
  explicit UnsupportedSchemeError(const std::string& message)
    : DownloadError(ErrorKind::UnsupportedScheme, message) {}
};

class InvalidMagnetError : public DownloadError {
public:
  explicit InvalidMagnetError(const std::string& message)
    : DownloadError(ErrorKind::InvalidMagnet, message) {}
};

class InvalidStateError : public DownloadError {
public:
  explicit InvalidStateError(const std::string& message)
    : DownloadError(ErrorKind::InvalidState, message) {}
};

class RpcTimeoutError : public DownloadError {
public:
  explicit RpcTimeoutError(const std::string& message)
    : DownloadError(ErrorKind::RpcTimeout, message, true) {}
};

class TransferError : public DownloadError {
public:
  TransferError(const std::string& message, bool retryable = false)
    : DownloadError(ErrorKind::Transfer, message, retryable) {}
};

class CancelledError : public DownloadError {
public:
  explicit CancelledError(const std::string& message)
    : DownloadError(ErrorKind::Cancelled, message) {}
};

class NotFoundError : public DownloadError {
public:
  explicit NotFoundError(const std::string& id)
    : DownloadError(ErrorKind::NotFound, "download not found: " + id) {}
};

// Outcome of an asynchronous backend or coordinator operation.
struct OpStatus {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  bool retryable = false;

  bool ok() const { return kind == ErrorKind::None; }
  std::string describe() const;

  static OpStatus success() { return OpStatus{}; }
  static OpStatus failure(ErrorKind kind, std::string message, bool retryable = false);
  static OpStatus from(const DownloadError& error);
};
