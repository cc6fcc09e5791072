#include "SyncDecisionEngine.hpp"
#include "WebDavPaths.hpp"

namespace davsync {

bool etagChanged(const std::string &lastSyncedEtag,
                 const std::string &remoteEtag) {
  return webdav::stripQuotes(lastSyncedEtag) != webdav::stripQuotes(remoteEtag);
}

SyncOutcome decideSync(const SyncInputs &inputs) {
  if (!inputs.localCopyPresent && inputs.remoteExists)
    return SyncOutcome::DownloadEnqueued;
  if (!inputs.remoteExists)
    return SyncOutcome::FileNotFound;

  const bool localModified =
      inputs.localModificationTime > inputs.lastSyncTime;
  const bool remoteChanged =
      etagChanged(inputs.lastSyncedEtag, inputs.remoteEtag);

  if (localModified && !remoteChanged)
    return SyncOutcome::UploadEnqueued;
  if (remoteChanged && !localModified)
    return SyncOutcome::DownloadEnqueued;
  if (remoteChanged && localModified)
    return SyncOutcome::ConflictDetected;
  return SyncOutcome::AlreadySynchronized;
}

} // namespace davsync
