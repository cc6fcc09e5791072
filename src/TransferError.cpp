#include "TransferError.hpp"

namespace davsync {

const char *toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::LocalFileNotFound:
    return "local file not found";
  case ErrorKind::Unauthorized:
    return "unauthorized";
  case ErrorKind::Network:
    return "network";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::SessionExpired:
    return "session expired";
  case ErrorKind::ProtocolViolation:
    return "protocol violation";
  case ErrorKind::RetriesExhausted:
    return "retries exhausted";
  case ErrorKind::ServerRejected:
    return "server rejected";
  case ErrorKind::Storage:
    return "storage";
  }
  return "unknown";
}

TransferError errorForStatus(int status, const std::string &what) {
  std::string message = what + " returned HTTP " + std::to_string(status);
  if (status == 401)
    return TransferError(ErrorKind::Unauthorized, message, status);
  return TransferError(ErrorKind::ServerRejected, message, status);
}

TransferResult resultFromError(const TransferError &error) {
  switch (error.kind()) {
  case ErrorKind::LocalFileNotFound:
    return TransferResult::FileNotFound;
  case ErrorKind::Unauthorized:
    return TransferResult::CredentialError;
  case ErrorKind::Network:
  case ErrorKind::RetriesExhausted:
    return TransferResult::NetworkConnection;
  case ErrorKind::Cancelled:
    return TransferResult::Cancelled;
  case ErrorKind::ProtocolViolation:
  case ErrorKind::SessionExpired:
    return TransferResult::ProtocolError;
  case ErrorKind::Storage:
    return TransferResult::Unknown;
  case ErrorKind::ServerRejected:
    break;
  }

  int status = error.httpStatus();
  if (status == 404)
    return TransferResult::FileNotFound;
  if (status == 409 || status == 412)
    return TransferResult::ConflictError;
  if (status == 507 || status == 413)
    return TransferResult::QuotaExceeded;
  if (status >= 500)
    return TransferResult::ServiceUnavailable;
  return TransferResult::Unknown;
}

} // namespace davsync
