#include "errors.hpp"

#include <utility>

const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::None: return "";
    case ErrorKind::Startup: return "StartupError";
    case ErrorKind::UnsupportedScheme: return "UnsupportedSchemeError";
    case ErrorKind::InvalidMagnet: return "InvalidMagnetError";
    case ErrorKind::InvalidState: return "InvalidStateError";
    case ErrorKind::RpcTimeout: return "RpcTimeoutError";
    case ErrorKind::Transfer: return "TransferError";
    case ErrorKind::Cancelled: return "CancelledError";
    case ErrorKind::NotFound: return "NotFoundError";
  }
  return "UnknownError";
}

std::string DownloadError::describe() const {
  return std::string(error_kind_name(kind_)) + ": " + what();
}

std::string OpStatus::describe() const {
  if(ok()) return std::string();
  return std::string(error_kind_name(kind)) + ": " + message;
}

OpStatus OpStatus::failure(ErrorKind kind, std::string message, bool retryable) {
  OpStatus status;
  status.kind = kind;
  status.message = std::move(message);
  status.retryable = retryable;
  return status;
}

OpStatus OpStatus::from(const DownloadError& error) {
  return failure(error.kind(), error.what(), error.retryable());
}
