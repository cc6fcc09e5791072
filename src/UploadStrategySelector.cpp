#include "UploadStrategySelector.hpp"
#include "ChunkedUploadDriver.hpp"
#include "PlainUploadDriver.hpp"
#include "TusProtocol.hpp"
#include <iostream>
#include <optional>

namespace davsync {

const char *toString(UploadStrategy strategy) {
  switch (strategy) {
  case UploadStrategy::Tus:
    return "tus";
  case UploadStrategy::Chunked:
    return "chunked";
  case UploadStrategy::SinglePut:
    return "put";
  }
  return "unknown";
}

UploadStrategy selectUploadStrategy(std::uint64_t fileSize,
                                    const ServerCapabilities &capabilities,
                                    bool hasSession, std::uint64_t threshold) {
  if (hasSession)
    return UploadStrategy::Tus;
  if (fileSize <= threshold)
    return UploadStrategy::SinglePut;
  if (capabilities.tus)
    return UploadStrategy::Tus;
  if (capabilities.supportsChunking)
    return UploadStrategy::Chunked;
  return UploadStrategy::SinglePut;
}

bool canFallBack(const TransferError &error, const TusUploadStats &stats,
                 bool hadSession) {
  if (hadSession || stats.resumed || stats.confirmedOffset > 0)
    return false;
  switch (error.kind()) {
  case ErrorKind::Unauthorized:
  case ErrorKind::LocalFileNotFound:
  case ErrorKind::Cancelled:
  case ErrorKind::Storage:
    return false;
  default:
    return true;
  }
}

UploadStrategySelector::UploadStrategySelector(HttpTransport &transport,
                                               TransferStore &store,
                                               const ClientConfig &config)
    : m_transport(transport), m_store(store), m_config(config) {}

ServerCapabilities
UploadStrategySelector::capabilities(const std::string &collectionUrl,
                                     CancellationToken *cancel) {
  ServerCapabilities caps;
  caps.supportsChunking = m_config.supportsChunking;
  if (!m_config.probeTus)
    return caps;

  TusProtocol protocol(m_transport);
  caps.tus = protocol.probe(collectionUrl, cancel);
  if (caps.tus)
    applyConfiguredLimits(*caps.tus);
  return caps;
}

void UploadStrategySelector::applyConfiguredLimits(TusSupport &support) const {
  support.maxChunkSize = m_config.tus.serverMaxChunkSize;
  support.httpMethodOverride = m_config.tus.httpMethodOverride;
}

UploadOutcome
UploadStrategySelector::runFallback(const UploadJob &job,
                                    const ServerCapabilities &capabilities) {
  UploadOutcome outcome;
  if (capabilities.supportsChunking && job.length > 0) {
    outcome.strategy = UploadStrategy::Chunked;
    ChunkedUploadDriver driver(m_transport, m_config.uploadsUrl(),
                               m_config.tus.chunkSize);
    outcome.etag = driver.upload(job);
  } else {
    outcome.strategy = UploadStrategy::SinglePut;
    PlainUploadDriver driver(m_transport);
    outcome.etag = driver.upload(job);
  }
  return outcome;
}

UploadOutcome
UploadStrategySelector::upload(const UploadJob &job,
                               const ServerCapabilities &capabilities) {
  const bool hadSession =
      job.existingSession && !job.existingSession->uploadUrl.empty();
  const auto strategy = selectUploadStrategy(
      job.length, capabilities, hadSession, m_config.chunkingThreshold);
  std::cout << "[Upload] Transfer " << job.transferId << " ("
            << job.length << " bytes) via " << toString(strategy) << std::endl;

  if (strategy == UploadStrategy::SinglePut) {
    PlainUploadDriver driver(m_transport);
    UploadOutcome outcome;
    outcome.etag = driver.upload(job);
    return outcome;
  }
  if (strategy == UploadStrategy::Chunked)
    return runFallback(job, capabilities);

  std::optional<TusSupport> support = capabilities.tus;
  if (!support) {
    // Resumed without a probe: the session predates this run.
    support.emplace();
    if (job.existingSession &&
        !job.existingSession->resumableVersion.empty())
      support->version = job.existingSession->resumableVersion;
    applyConfiguredLimits(*support);
  }

  TusProtocol protocol(m_transport);
  TusUploadDriver driver(protocol, m_store, m_config.tus, support);
  m_lastTusStats = TusUploadStats{};
  try {
    driver.upload(job, m_lastTusStats);
    UploadOutcome outcome;
    outcome.strategy = UploadStrategy::Tus;
    return outcome;
  } catch (const TransferError &e) {
    if (!canFallBack(e, m_lastTusStats, hadSession))
      throw;
    std::cerr << "[Upload] TUS failed before any byte was confirmed ("
              << e.what() << "), falling back" << std::endl;
  }

  // Tear down whatever session the failed attempt left behind.
  auto record = m_store.getTransferById(job.transferId);
  if (record && record->tusSession)
    protocol.deleteSession(record->tusSession->uploadUrl);
  if (!m_store.clearTusState(job.transferId))
    throw TransferError(ErrorKind::Storage,
                        "could not clear TUS session before fallback");

  UploadJob plain = job;
  plain.existingSession.reset();
  auto outcome = runFallback(plain, capabilities);
  outcome.fellBack = true;
  return outcome;
}

} // namespace davsync
