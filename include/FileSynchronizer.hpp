#pragma once

#include "Config.hpp"
#include "HttpTransport.hpp"
#include "SyncDecisionEngine.hpp"
#include "TransferStore.hpp"
#include <ctime>
#include <functional>
#include <optional>
#include <string>

namespace davsync {

/**
 * FileSynchronizer feeds one file's state through decideSync, applies the
 * configured conflict policy and turns the result into a TransferRecord.
 */
class FileSynchronizer {
public:
  // Invoked with the id of every record the synchronizer creates.
  using EnqueueCallback = std::function<void(std::int64_t)>;

  FileSynchronizer(HttpTransport &transport, TransferStore &store,
                   const ClientConfig &config, EnqueueCallback onEnqueued);

  // HEAD on the remote resource. 404 means it does not exist.
  RemoteFileState fetchRemoteState(const FileSyncState &state);

  // Uses `cachedRemote` when given, otherwise fetches it live.
  SyncDecision synchronize(const FileSyncState &state,
                           std::optional<RemoteFileState> cachedRemote = {});

  // "<stem>_conflicted_copy_<yyyy-MM-dd_HHmmss>[.<ext>]" next to `path`.
  static std::string conflictedCopyPath(const std::string &path,
                                        std::time_t when);

private:
  std::string localTargetFor(const FileSyncState &state) const;
  std::int64_t enqueueUpload(const FileSyncState &state,
                             const std::string &localPath,
                             std::optional<std::string> requiredEtag);
  std::int64_t enqueueDownload(const FileSyncState &state,
                               const std::string &localPath);
  std::int64_t insert(const TransferRecord &record);

  HttpTransport &m_transport;
  TransferStore &m_store;
  const ClientConfig &m_config;
  EnqueueCallback m_onEnqueued;
};

} // namespace davsync
