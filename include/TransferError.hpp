#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

namespace davsync {

enum class ErrorKind {
  LocalFileNotFound,
  Unauthorized,
  Network,
  Cancelled,
  SessionExpired,
  ProtocolViolation,
  RetriesExhausted,
  ServerRejected,
  Storage
};

/**
 * Single error type raised by drivers and the HTTP layer. Drivers never
 * decide retry vs. failure; TransferWorker::classifyError does.
 */
class TransferError : public std::runtime_error {
public:
  TransferError(ErrorKind kind, const std::string &message, int httpStatus = 0)
      : std::runtime_error(message), m_kind(kind), m_httpStatus(httpStatus) {}

  ErrorKind kind() const { return m_kind; }
  int httpStatus() const { return m_httpStatus; }

private:
  ErrorKind m_kind;
  int m_httpStatus;
};

const char *toString(ErrorKind kind);

// Error for an HTTP response the caller did not expect: 401 is
// Unauthorized, everything else ServerRejected carrying the status.
TransferError errorForStatus(int status, const std::string &what);

TransferResult resultFromError(const TransferError &error);

} // namespace davsync
