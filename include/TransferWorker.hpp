#pragma once

#include "CancellationToken.hpp"
#include "Config.hpp"
#include "HttpTransport.hpp"
#include "ProgressChannel.hpp"
#include "TransferError.hpp"
#include "TransferNotifier.hpp"
#include "TransferStore.hpp"
#include "UploadStrategySelector.hpp"

namespace davsync {

enum class WorkOutcome { Success, Retry, Failure };

const char *toString(WorkOutcome outcome);

// The one place deciding whether an error is worth another attempt.
WorkOutcome classifyError(const TransferError &error);

// Copies record.localPath into `stagingDir` and points the record at the
// copy, keeping the original in sourcePath. The copy is removed once the
// upload succeeds. Throws TransferError(LocalFileNotFound).
void stageUploadSource(TransferRecord &record, const std::string &stagingDir);

/**
 * TransferWorker runs one attempt of one TransferRecord and persists how it
 * ended. Drivers throw; the worker classifies, records and notifies.
 */
class TransferWorker {
public:
  TransferWorker(HttpTransport &transport, TransferStore &store,
                 const ClientConfig &config, TransferNotifier &notifier,
                 ProgressChannel *progress = nullptr);

  // `attempt` is 1-based. A retryable error on the last allowed attempt
  // is reported as a failure.
  WorkOutcome run(std::int64_t id, CancellationToken &cancel, int attempt);

private:
  void runUpload(TransferRecord &record, CancellationToken &cancel);
  void runDownload(const TransferRecord &record, CancellationToken &cancel);
  void ensureRemoteParent(const TransferRecord &record,
                          CancellationToken &cancel);
  void cleanupAfterUpload(const TransferRecord &record);
  WorkOutcome handleError(const TransferRecord &record,
                          const TransferError &error, CancellationToken &cancel,
                          int attempt);

  HttpTransport &m_transport;
  TransferStore &m_store;
  const ClientConfig &m_config;
  TransferNotifier &m_notifier;
  ProgressChannel *m_progress;
};

} // namespace davsync
