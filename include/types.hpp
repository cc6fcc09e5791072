#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace davsync {

enum class TransferStatus { Enqueued = 0, InProgress = 1, Succeeded = 2, Failed = 3 };

enum class TransferDirection { Upload = 0, Download = 1 };

// What happens to the local source once an upload succeeds.
enum class UploadBehavior { Copy = 0, Move = 1 };

enum class TransferResult {
  Unknown = 0,
  Ok,
  NetworkConnection,
  CredentialError,
  FileNotFound,
  ConflictError,
  QuotaExceeded,
  ServiceUnavailable,
  ProtocolError,
  Cancelled
};

struct TusSession {
  std::string uploadUrl;
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
  std::string metadata;
  std::string checksum;
  std::string resumableVersion;
  std::optional<std::int64_t> expires;
  std::optional<std::string> concat;
};

struct TransferRecord {
  std::int64_t id = 0;
  std::string accountName;
  std::string localPath;
  std::string remotePath;
  std::optional<std::string> spaceId;
  std::string mimeType;
  std::uint64_t fileSize = 0;
  TransferStatus status = TransferStatus::Enqueued;
  std::optional<TransferResult> lastResult;
  TransferDirection direction = TransferDirection::Upload;
  UploadBehavior behavior = UploadBehavior::Copy;
  bool forceOverwrite = false;
  std::optional<std::string> requiredEtag;
  std::int64_t lastModified = 0; // seconds
  std::int64_t createdAt = 0;
  std::optional<std::int64_t> transferEndTimestamp;
  std::optional<std::string> sourcePath;
  // Present iff a resumable session is active.
  std::optional<TusSession> tusSession;
};

struct TusSupport {
  std::string version = "1.0.0";
  std::vector<std::string> extensions;
  std::uint64_t maxChunkSize = 0; // 0: no server limit
  bool httpMethodOverride = false;
  bool creationWithUpload = false;
};

struct ServerCapabilities {
  bool supportsChunking = false;
  std::optional<TusSupport> tus;
};

enum class SyncOutcome {
  AlreadySynchronized,
  UploadEnqueued,
  DownloadEnqueued,
  ConflictDetected,
  ConflictResolvedWithCopy,
  FileNotFound
};

struct SyncDecision {
  SyncOutcome outcome = SyncOutcome::AlreadySynchronized;
  std::optional<std::string> workId;
  std::optional<std::string> remoteEtag;
  std::optional<std::string> conflictCopyPath;
};

// Locally stored metadata for one synchronized file.
struct FileSyncState {
  std::string accountName;
  std::string remotePath;
  std::optional<std::string> spaceId;
  std::optional<std::string> storagePath;
  std::int64_t localModificationTime = 0; // milliseconds
  std::int64_t lastSyncTime = 0;          // milliseconds
  std::string etag;                       // etag at last sync
  std::optional<std::string> etagInConflict;
  std::string mimeType;
};

struct RemoteFileState {
  bool exists = false;
  std::string etag;
};

const char *toString(TransferStatus status);
const char *toString(TransferResult result);
const char *toString(SyncOutcome outcome);
std::optional<TransferStatus> transferStatusFromString(const std::string &s);

} // namespace davsync
