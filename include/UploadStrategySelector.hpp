#pragma once

#include "Config.hpp"
#include "HttpTransport.hpp"
#include "TransferError.hpp"
#include "TransferStore.hpp"
#include "TusUploadDriver.hpp"
#include "UploadJob.hpp"

namespace davsync {

/**
 * Chooses the upload path. An existing session always resumes with TUS;
 * files above the threshold prefer TUS; everything else is a single PUT.
 */
UploadStrategy selectUploadStrategy(std::uint64_t fileSize,
                                    const ServerCapabilities &capabilities,
                                    bool hasSession, std::uint64_t threshold);

// A failed TUS attempt may fall back only if it never confirmed a byte and
// did not resume an earlier session.
bool canFallBack(const TransferError &error, const TusUploadStats &stats,
                 bool hadSession);

class UploadStrategySelector {
public:
  UploadStrategySelector(HttpTransport &transport, TransferStore &store,
                         const ClientConfig &config);

  // Probes TUS on the collection when enabled and merges the configured
  // server limits. A failed probe simply means no TUS.
  ServerCapabilities capabilities(const std::string &collectionUrl,
                                  CancellationToken *cancel = nullptr);

  UploadOutcome upload(const UploadJob &job,
                       const ServerCapabilities &capabilities);

  const TusUploadStats &lastTusStats() const { return m_lastTusStats; }

private:
  // Server limits the probe does not advertise.
  void applyConfiguredLimits(TusSupport &support) const;
  UploadOutcome runFallback(const UploadJob &job,
                            const ServerCapabilities &capabilities);

  HttpTransport &m_transport;
  TransferStore &m_store;
  const ClientConfig &m_config;
  TusUploadStats m_lastTusStats;
};

} // namespace davsync
