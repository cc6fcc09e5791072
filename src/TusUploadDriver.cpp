#include "TusUploadDriver.hpp"
#include "ChunkReader.hpp"
#include "TransferError.hpp"
#include "TusStateMachine.hpp"
#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace davsync {

TusUploadDriver::TusUploadDriver(TusProtocol &protocol, TransferStore &store,
                                 const TusOptions &options,
                                 std::optional<TusSupport> support)
    : m_protocol(protocol), m_store(store), m_options(options),
      m_support(std::move(support)) {}

void TusUploadDriver::persistOffset(std::int64_t id, std::uint64_t offset) {
  if (!m_store.updateTusOffset(id, offset))
    throw TransferError(ErrorKind::Storage,
                        "could not persist TUS offset for transfer " +
                            std::to_string(id));
}

TusSession TusUploadDriver::createSession(const UploadJob &job,
                                          TusUploadStats &stats) {
  ChunkReader reader(job.localPath);
  const std::string checksum = reader.sha256Hex();

  MetadataList metadata{{"filename", job.fileName},
                        {"mimetype", job.mimeType},
                        {"mtime", std::to_string(job.lastModified)},
                        {"checksum", "sha256 " + checksum}};

  TusCreateRequest request;
  request.collectionUrl = job.collectionUrl;
  request.length = job.length;
  request.metadata = metadata;
  if (m_support && m_support->creationWithUpload) {
    auto first = tus::nextChunkSize(0, job.length, m_options.chunkSize,
                                    m_support->maxChunkSize);
    if (first > 0)
      request.firstChunk = FileWindow{job.localPath, 0, first};
  }

  auto created = m_protocol.create(request, job.cancel);
  std::cout << "[TUS] Session created for transfer " << job.transferId << ": "
            << created.uploadUrl << std::endl;

  TusSession session;
  session.uploadUrl = created.uploadUrl;
  session.offset = 0;
  session.length = job.length;
  session.metadata = TusProtocol::serializeMetadata(metadata);
  session.checksum = "sha256:" + checksum;
  session.resumableVersion = TusProtocol::kVersion;
  stats.sessionCreated = true;

  // Must be durable before the first PATCH.
  if (!m_store.updateTusState(job.transferId, session))
    throw TransferError(ErrorKind::Storage,
                        "could not persist TUS session for transfer " +
                            std::to_string(job.transferId));

  if (created.offset) {
    if (!tus::isValidPatchOffset(0, *created.offset, job.length))
      throw TransferError(ErrorKind::ProtocolViolation,
                          "creation-with-upload returned offset " +
                              std::to_string(*created.offset));
    session.offset = *created.offset;
    if (session.offset > 0) {
      persistOffset(job.transferId, session.offset);
      stats.confirmedOffset = session.offset;
    }
  }
  return session;
}

std::uint64_t TusUploadDriver::resolveOffset(const UploadJob &job,
                                             const TusSession &session) {
  try {
    auto serverOffset = m_protocol.queryOffset(session.uploadUrl, job.cancel);
    if (serverOffset > session.length)
      throw TransferError(ErrorKind::ProtocolViolation,
                          "server offset " + std::to_string(serverOffset) +
                              " exceeds length " +
                              std::to_string(session.length));
    if (serverOffset != session.offset) {
      std::cout << "[TUS] Server offset " << serverOffset
                << " replaces persisted " << session.offset << std::endl;
      persistOffset(job.transferId, serverOffset);
    }
    return serverOffset;
  } catch (const TransferError &e) {
    if (e.kind() == ErrorKind::SessionExpired) {
      m_store.clearTusState(job.transferId);
      throw;
    }
    if (e.kind() != ErrorKind::Network)
      throw;
    std::cerr << "[TUS] Offset query failed, continuing from " << session.offset
              << ": " << e.what() << std::endl;
    return session.offset;
  }
}

void TusUploadDriver::backoff(const UploadJob &job, int failures) {
  auto delay = tus::backoffDelay(
      failures, std::chrono::milliseconds(m_options.baseRetryDelayMs),
      std::chrono::milliseconds(m_options.maxRetryDelayMs));
  if (job.cancel) {
    if (job.cancel->waitFor(delay))
      throw TransferError(ErrorKind::Cancelled, "cancelled during backoff");
  } else {
    std::this_thread::sleep_for(delay);
  }
}

void TusUploadDriver::upload(const UploadJob &job, TusUploadStats &stats) {
  TusSession session;
  if (job.existingSession && !job.existingSession->uploadUrl.empty()) {
    session = *job.existingSession;
    stats.resumed = true;
    std::cout << "[TUS] Resuming transfer " << job.transferId << " at "
              << session.offset << "/" << session.length << std::endl;
  } else {
    session = createSession(job, stats);
  }

  const std::uint64_t length = session.length;
  const std::uint64_t serverMax = m_support ? m_support->maxChunkSize : 0;
  const bool methodOverride = m_support && m_support->httpMethodOverride;

  std::uint64_t offset = resolveOffset(job, session);
  stats.confirmedOffset = std::max(stats.confirmedOffset, offset);
  if (job.progress)
    job.progress->update(offset);

  int failures = 0;
  while (offset < length) {
    if (job.cancel && job.cancel->isCancelled())
      throw TransferError(ErrorKind::Cancelled, "upload cancelled");

    const std::uint64_t chunk =
        tus::nextChunkSize(offset, length, m_options.chunkSize, serverMax);
    const std::uint64_t start = offset;

    std::uint64_t newOffset = 0;
    try {
      ++stats.patchCalls;
      newOffset = m_protocol.patch(
          session.uploadUrl, start, FileWindow{job.localPath, start, chunk},
          methodOverride,
          [&job, start](std::uint64_t sent) {
            if (job.progress)
              job.progress->update(start + sent);
          },
          job.cancel);
    } catch (const TransferError &e) {
      if (e.kind() != ErrorKind::Network &&
          e.kind() != ErrorKind::ServerRejected)
        throw;

      ++failures;
      std::cerr << "[TUS] PATCH at " << start << " failed (" << failures << "/"
                << m_options.maxRetries << "): " << e.what() << std::endl;
      if (failures > m_options.maxRetries)
        throw TransferError(ErrorKind::RetriesExhausted,
                            "TUS patch failed " + std::to_string(failures) +
                                " times at offset " + std::to_string(start));

      std::uint64_t serverOffset = start;
      try {
        serverOffset = m_protocol.queryOffset(session.uploadUrl, job.cancel);
      } catch (const TransferError &probeError) {
        if (probeError.kind() == ErrorKind::SessionExpired) {
          m_store.clearTusState(job.transferId);
          throw;
        }
        if (probeError.kind() != ErrorKind::Network)
          throw;
      }

      auto decision = tus::decideRecovery(start, serverOffset, length);
      switch (decision.action) {
      case RecoveryAction::Invalid:
        throw TransferError(ErrorKind::ProtocolViolation,
                            "recovered offset " + std::to_string(serverOffset) +
                                " exceeds length " + std::to_string(length));
      case RecoveryAction::AdoptServerOffset:
        offset = decision.nextOffset;
        persistOffset(job.transferId, offset);
        stats.confirmedOffset = std::max(stats.confirmedOffset, offset);
        failures = 0;
        break;
      case RecoveryAction::RetrySameChunk:
        ++stats.backoffRetries;
        backoff(job, failures);
        break;
      case RecoveryAction::RewindToServer:
        std::cerr << "[TUS] Server lost data, rewinding from " << start
                  << " to " << decision.nextOffset << std::endl;
        offset = decision.nextOffset;
        persistOffset(job.transferId, offset);
        break;
      }
      continue;
    }

    if (!tus::isValidPatchOffset(start, newOffset, length))
      throw TransferError(ErrorKind::ProtocolViolation,
                          "PATCH moved offset from " + std::to_string(start) +
                              " to " + std::to_string(newOffset));
    if (newOffset == start) {
      // Accepted but no bytes stored: same handling as a failed attempt.
      ++failures;
      if (failures > m_options.maxRetries)
        throw TransferError(ErrorKind::RetriesExhausted,
                            "server made no progress at offset " +
                                std::to_string(start));
      ++stats.backoffRetries;
      backoff(job, failures);
      continue;
    }

    offset = newOffset;
    failures = 0;
    persistOffset(job.transferId, offset);
    stats.confirmedOffset = std::max(stats.confirmedOffset, offset);
    if (job.progress)
      job.progress->update(offset);
  }

  // offset == length here, and it came from a server response.
  if (!m_store.clearTusState(job.transferId))
    throw TransferError(ErrorKind::Storage,
                        "could not clear completed TUS session for transfer " +
                            std::to_string(job.transferId));
  std::cout << "[TUS] Transfer " << job.transferId << " completed: " << length
            << " bytes in " << stats.patchCalls << " PATCH calls" << std::endl;
}

} // namespace davsync
