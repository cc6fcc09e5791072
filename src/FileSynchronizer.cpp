#include "FileSynchronizer.hpp"
#include "ChunkReader.hpp"
#include "TransferError.hpp"
#include "WebDavPaths.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace davsync {

namespace {

std::int64_t nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

FileSynchronizer::FileSynchronizer(HttpTransport &transport,
                                   TransferStore &store,
                                   const ClientConfig &config,
                                   EnqueueCallback onEnqueued)
    : m_transport(transport), m_store(store), m_config(config),
      m_onEnqueued(std::move(onEnqueued)) {}

std::string FileSynchronizer::conflictedCopyPath(const std::string &path,
                                                 std::time_t when) {
  std::tm tm{};
  localtime_r(&when, &tm);
  std::ostringstream stamp;
  stamp << std::put_time(&tm, "%Y-%m-%d_%H%M%S");

  fs::path p(path);
  std::string name =
      p.stem().string() + "_conflicted_copy_" + stamp.str() +
      p.extension().string();
  return (p.parent_path() / name).string();
}

RemoteFileState
FileSynchronizer::fetchRemoteState(const FileSyncState &state) {
  HttpRequest head;
  head.method = "HEAD";
  head.url = webdav::joinUrl(m_config.webdavUrl(state.spaceId),
                             webdav::encodePath(state.remotePath));
  auto res = m_transport.execute(head);

  RemoteFileState remote;
  if (res.status == 404)
    return remote;
  if (res.status != 200)
    throw errorForStatus(res.status, "HEAD " + state.remotePath);
  remote.exists = true;
  auto etag = res.header("OC-ETag");
  if (!etag)
    etag = res.header("ETag");
  remote.etag = webdav::stripQuotes(etag.value_or(""));
  return remote;
}

std::string FileSynchronizer::localTargetFor(const FileSyncState &state) const {
  if (state.storagePath && !state.storagePath->empty())
    return *state.storagePath;
  return (fs::path(m_config.localRoot) /
          fs::path(state.remotePath).relative_path())
      .string();
}

std::int64_t FileSynchronizer::insert(const TransferRecord &record) {
  auto id = m_store.insertTransfer(record);
  if (!id)
    throw TransferError(ErrorKind::Storage,
                        "could not create transfer for " + record.remotePath);
  if (m_onEnqueued)
    m_onEnqueued(*id);
  return *id;
}

std::int64_t
FileSynchronizer::enqueueUpload(const FileSyncState &state,
                                const std::string &localPath,
                                std::optional<std::string> requiredEtag) {
  std::error_code ec;
  TransferRecord record;
  record.accountName = state.accountName;
  record.localPath = localPath;
  record.remotePath = state.remotePath;
  record.spaceId = state.spaceId;
  record.mimeType = state.mimeType;
  record.fileSize = fs::file_size(localPath, ec);
  if (ec)
    record.fileSize = 0;
  record.direction = TransferDirection::Upload;
  record.behavior = UploadBehavior::Copy;
  record.forceOverwrite = requiredEtag.has_value();
  record.requiredEtag = std::move(requiredEtag);
  record.lastModified = state.localModificationTime / 1000;
  record.createdAt = nowSeconds();
  return insert(record);
}

std::int64_t FileSynchronizer::enqueueDownload(const FileSyncState &state,
                                               const std::string &localPath) {
  TransferRecord record;
  record.accountName = state.accountName;
  record.localPath = localPath;
  record.remotePath = state.remotePath;
  record.spaceId = state.spaceId;
  record.mimeType = state.mimeType;
  record.direction = TransferDirection::Download;
  record.createdAt = nowSeconds();
  return insert(record);
}

SyncDecision FileSynchronizer::synchronize(
    const FileSyncState &state, std::optional<RemoteFileState> cachedRemote) {
  RemoteFileState remote =
      cachedRemote ? *cachedRemote : fetchRemoteState(state);

  const std::string localPath = localTargetFor(state);
  std::error_code ec;
  SyncInputs inputs;
  inputs.localCopyPresent = state.storagePath && !state.storagePath->empty() &&
                            fs::is_regular_file(*state.storagePath, ec);
  inputs.localModificationTime = state.localModificationTime;
  inputs.lastSyncTime = state.lastSyncTime;
  inputs.lastSyncedEtag = state.etag;
  inputs.remoteExists = remote.exists;
  inputs.remoteEtag = remote.etag;

  SyncDecision decision;
  decision.outcome = decideSync(inputs);
  std::cout << "[Sync] " << state.remotePath << ": "
            << toString(decision.outcome) << std::endl;

  switch (decision.outcome) {
  case SyncOutcome::AlreadySynchronized:
  case SyncOutcome::FileNotFound:
  case SyncOutcome::ConflictResolvedWithCopy:
    break;
  case SyncOutcome::UploadEnqueued:
    decision.workId =
        std::to_string(enqueueUpload(state, localPath, std::nullopt));
    break;
  case SyncOutcome::DownloadEnqueued:
    decision.workId = std::to_string(enqueueDownload(state, localPath));
    break;
  case SyncOutcome::ConflictDetected:
    decision.remoteEtag = remote.etag;
    if (m_config.conflictPolicy == ConflictPolicy::KeepBoth) {
      auto copy = conflictedCopyPath(localPath, std::time(nullptr));
      fs::rename(localPath, copy, ec);
      if (ec) {
        // Keep the local edit; do not download over it.
        std::cerr << "[Sync] Could not rename " << localPath
                  << " for conflict copy: " << ec.message() << std::endl;
        decision = SyncDecision{};
        break;
      }
      decision.outcome = SyncOutcome::ConflictResolvedWithCopy;
      decision.conflictCopyPath = copy;
      decision.workId = std::to_string(enqueueDownload(state, localPath));
    } else if (m_config.conflictPolicy == ConflictPolicy::PreferLocal) {
      decision.outcome = SyncOutcome::UploadEnqueued;
      decision.workId =
          std::to_string(enqueueUpload(state, localPath, remote.etag));
    }
    break;
  }
  return decision;
}

} // namespace davsync
