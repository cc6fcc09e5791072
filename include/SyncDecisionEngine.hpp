#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>

namespace davsync {

struct SyncInputs {
  bool localCopyPresent = false;
  std::int64_t localModificationTime = 0; // ms
  std::int64_t lastSyncTime = 0;          // ms
  std::string lastSyncedEtag;
  bool remoteExists = false;
  std::string remoteEtag;
};

/**
 * Pure decision over local and remote state. Rules, first match wins:
 *  1. no local copy, remote exists     -> DownloadEnqueued
 *  2. remote gone                      -> FileNotFound
 *  3. local modified, etag unchanged   -> UploadEnqueued
 *  4. etag changed, local unmodified   -> DownloadEnqueued
 *  5. both changed                     -> ConflictDetected
 *  6. otherwise                        -> AlreadySynchronized
 */
SyncOutcome decideSync(const SyncInputs &inputs);

bool etagChanged(const std::string &lastSyncedEtag,
                 const std::string &remoteEtag);

} // namespace davsync
