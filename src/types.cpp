#include "types.hpp"

namespace davsync {

const char *toString(TransferStatus status) {
  switch (status) {
  case TransferStatus::Enqueued:
    return "ENQUEUED";
  case TransferStatus::InProgress:
    return "IN_PROGRESS";
  case TransferStatus::Succeeded:
    return "SUCCEEDED";
  case TransferStatus::Failed:
    return "FAILED";
  }
  return "UNKNOWN";
}

const char *toString(TransferResult result) {
  switch (result) {
  case TransferResult::Unknown:
    return "UNKNOWN";
  case TransferResult::Ok:
    return "OK";
  case TransferResult::NetworkConnection:
    return "NETWORK_CONNECTION";
  case TransferResult::CredentialError:
    return "CREDENTIAL_ERROR";
  case TransferResult::FileNotFound:
    return "FILE_NOT_FOUND";
  case TransferResult::ConflictError:
    return "CONFLICT_ERROR";
  case TransferResult::QuotaExceeded:
    return "QUOTA_EXCEEDED";
  case TransferResult::ServiceUnavailable:
    return "SERVICE_UNAVAILABLE";
  case TransferResult::ProtocolError:
    return "PROTOCOL_ERROR";
  case TransferResult::Cancelled:
    return "CANCELLED";
  }
  return "UNKNOWN";
}

const char *toString(SyncOutcome outcome) {
  switch (outcome) {
  case SyncOutcome::AlreadySynchronized:
    return "AlreadySynchronized";
  case SyncOutcome::UploadEnqueued:
    return "UploadEnqueued";
  case SyncOutcome::DownloadEnqueued:
    return "DownloadEnqueued";
  case SyncOutcome::ConflictDetected:
    return "ConflictDetected";
  case SyncOutcome::ConflictResolvedWithCopy:
    return "ConflictResolvedWithCopy";
  case SyncOutcome::FileNotFound:
    return "FileNotFound";
  }
  return "Unknown";
}

std::optional<TransferStatus> transferStatusFromString(const std::string &s) {
  if (s == "ENQUEUED")
    return TransferStatus::Enqueued;
  if (s == "IN_PROGRESS")
    return TransferStatus::InProgress;
  if (s == "SUCCEEDED")
    return TransferStatus::Succeeded;
  if (s == "FAILED")
    return TransferStatus::Failed;
  return std::nullopt;
}

} // namespace davsync
