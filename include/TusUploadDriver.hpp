#pragma once

#include "Config.hpp"
#include "TransferStore.hpp"
#include "TusProtocol.hpp"
#include "UploadJob.hpp"
#include <optional>

namespace davsync {

struct TusUploadStats {
  int patchCalls = 0;
  int backoffRetries = 0;
  bool resumed = false;
  bool sessionCreated = false;
  // Highest offset the server has acknowledged during this run.
  std::uint64_t confirmedOffset = 0;
};

/**
 * TusUploadDriver runs the resumable upload: create, offset resolution,
 * patch loop with in-loop recovery, completion. Every offset the server
 * acknowledges is persisted before the next PATCH.
 *
 * Errors are thrown as TransferError; `stats` is filled in either way.
 */
class TusUploadDriver {
public:
  TusUploadDriver(TusProtocol &protocol, TransferStore &store,
                  const TusOptions &options, std::optional<TusSupport> support);

  void upload(const UploadJob &job, TusUploadStats &stats);

private:
  TusSession createSession(const UploadJob &job, TusUploadStats &stats);
  std::uint64_t resolveOffset(const UploadJob &job, const TusSession &session);
  void persistOffset(std::int64_t id, std::uint64_t offset);
  void backoff(const UploadJob &job, int failures);

  TusProtocol &m_protocol;
  TransferStore &m_store;
  TusOptions m_options;
  std::optional<TusSupport> m_support;
};

} // namespace davsync
