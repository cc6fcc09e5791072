#include "TransferWorker.hpp"
#include "ChunkReader.hpp"
#include "DownloadDriver.hpp"
#include "WebDavPaths.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace davsync {

namespace {

std::int64_t nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void removeQuietly(const std::string &path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec)
    std::cerr << "[Worker] Could not remove " << path << ": " << ec.message()
              << std::endl;
}

} // namespace

const char *toString(WorkOutcome outcome) {
  switch (outcome) {
  case WorkOutcome::Success:
    return "success";
  case WorkOutcome::Retry:
    return "retry";
  case WorkOutcome::Failure:
    return "failure";
  }
  return "unknown";
}

WorkOutcome classifyError(const TransferError &error) {
  switch (error.kind()) {
  case ErrorKind::Network:
  case ErrorKind::Cancelled:
  case ErrorKind::SessionExpired:
  case ErrorKind::Storage:
    return WorkOutcome::Retry;
  case ErrorKind::LocalFileNotFound:
  case ErrorKind::Unauthorized:
  case ErrorKind::ProtocolViolation:
  case ErrorKind::RetriesExhausted:
    return WorkOutcome::Failure;
  case ErrorKind::ServerRejected: {
    int status = error.httpStatus();
    if (status == 408 || status == 429 || status >= 500)
      return WorkOutcome::Retry;
    return WorkOutcome::Failure;
  }
  }
  return WorkOutcome::Failure;
}

void stageUploadSource(TransferRecord &record, const std::string &stagingDir) {
  std::error_code ec;
  fs::create_directories(stagingDir, ec);
  if (ec)
    throw TransferError(ErrorKind::LocalFileNotFound,
                        "cannot create staging directory " + stagingDir +
                            ": " + ec.message());

  const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
  const std::string name = fs::path(record.localPath).filename().string();
  fs::path target;
  int n = 0;
  do {
    target = fs::path(stagingDir) /
             (std::to_string(stamp) + "_" + std::to_string(n++) + "_" + name);
  } while (fs::exists(target, ec));

  fs::copy_file(record.localPath, target, ec);
  if (ec)
    throw TransferError(ErrorKind::LocalFileNotFound,
                        "cannot stage " + record.localPath + ": " +
                            ec.message());
  std::cout << "[Worker] Staged " << record.localPath << " as "
            << target.string() << std::endl;
  // The copy's own mtime is the staging time.
  if (record.lastModified <= 0)
    record.lastModified = ChunkReader::lastModifiedSeconds(record.localPath);
  record.sourcePath = record.localPath;
  record.localPath = target.string();
}

TransferWorker::TransferWorker(HttpTransport &transport, TransferStore &store,
                               const ClientConfig &config,
                               TransferNotifier &notifier,
                               ProgressChannel *progress)
    : m_transport(transport), m_store(store), m_config(config),
      m_notifier(notifier), m_progress(progress) {}

void TransferWorker::ensureRemoteParent(const TransferRecord &record,
                                        CancellationToken &cancel) {
  const std::string base = m_config.webdavUrl(record.spaceId);
  const auto segments = webdav::splitPath(record.remotePath);
  if (segments.size() <= 1)
    return;

  HttpRequest head;
  head.method = "HEAD";
  head.url = webdav::joinUrl(
      base, webdav::encodePath(webdav::parentPath(record.remotePath)));
  head.cancel = &cancel;
  auto res = m_transport.execute(head);
  if (res.status == 200)
    return;
  if (res.status == 401)
    throw errorForStatus(res.status, "HEAD parent folder");

  std::string path;
  for (size_t i = 0; i + 1 < segments.size(); ++i) {
    path += "/" + segments[i];
    HttpRequest mkcol;
    mkcol.method = "MKCOL";
    mkcol.url = webdav::joinUrl(base, webdav::encodePath(path + "/"));
    mkcol.cancel = &cancel;
    auto created = m_transport.execute(mkcol);
    // 405: the collection already exists.
    if (created.status != 201 && created.status != 405)
      throw errorForStatus(created.status, "MKCOL " + path);
    if (created.status == 201)
      std::cout << "[Worker] Created remote folder " << path << std::endl;
  }
}

void TransferWorker::runUpload(TransferRecord &record,
                               CancellationToken &cancel) {
  std::error_code ec;
  if (!fs::is_regular_file(record.localPath, ec))
    throw TransferError(ErrorKind::LocalFileNotFound,
                        "local file does not exist: " + record.localPath);
  const std::uint64_t size = fs::file_size(record.localPath, ec);
  if (ec)
    throw TransferError(ErrorKind::LocalFileNotFound,
                        "cannot read " + record.localPath + ": " +
                            ec.message());

  if (record.tusSession && record.tusSession->length != size) {
    std::cerr << "[Worker] " << record.localPath
              << " changed size since its session was created, starting over"
              << std::endl;
    if (!m_store.clearTusState(record.id))
      throw TransferError(ErrorKind::Storage, "could not clear stale session");
    record.tusSession.reset();
  }

  std::int64_t lastModified = record.lastModified;
  if (lastModified <= 0)
    lastModified = ChunkReader::lastModifiedSeconds(record.localPath);
  if (lastModified <= 0)
    lastModified = nowSeconds();

  ensureRemoteParent(record, cancel);

  const std::string base = m_config.webdavUrl(record.spaceId);
  UploadJob job;
  job.transferId = record.id;
  job.localPath = record.localPath;
  job.remotePath = record.remotePath;
  job.remoteUrl = webdav::joinUrl(base, webdav::encodePath(record.remotePath));
  job.collectionUrl = webdav::joinUrl(
      base, webdav::encodePath(webdav::parentPath(record.remotePath)));
  job.fileName = webdav::baseName(record.remotePath);
  job.mimeType = record.mimeType.empty() ? "application/octet-stream"
                                         : record.mimeType;
  job.length = size;
  job.lastModified = lastModified;
  if (record.forceOverwrite)
    job.requiredEtag = record.requiredEtag;
  job.existingSession = record.tusSession;
  job.cancel = &cancel;

  PercentTracker tracker(m_progress, record.id, size);
  job.progress = &tracker;

  UploadStrategySelector selector(m_transport, m_store, m_config);
  ServerCapabilities caps;
  caps.supportsChunking = m_config.supportsChunking;
  // Resumed sessions keep TUS; small files never need the probe.
  if (!job.existingSession && size > m_config.chunkingThreshold)
    caps = selector.capabilities(job.collectionUrl, &cancel);

  auto outcome = selector.upload(job, caps);
  std::cout << "[Worker] Uploaded " << record.remotePath << " via "
            << toString(outcome.strategy)
            << (outcome.fellBack ? " (fallback)" : "")
            << (outcome.etag ? ", etag " + *outcome.etag : std::string())
            << std::endl;
}

void TransferWorker::runDownload(const TransferRecord &record,
                                 CancellationToken &cancel) {
  DownloadJob job;
  job.transferId = record.id;
  job.remoteUrl = webdav::joinUrl(m_config.webdavUrl(record.spaceId),
                                  webdav::encodePath(record.remotePath));
  job.localPath = record.localPath;
  job.cancel = &cancel;
  PercentTracker tracker(m_progress, record.id, record.fileSize);
  if (record.fileSize > 0)
    job.progress = &tracker;

  DownloadDriver driver(m_transport);
  driver.download(job);
}

void TransferWorker::cleanupAfterUpload(const TransferRecord &record) {
  // localPath is a staged copy when sourcePath is set.
  if (record.sourcePath)
    removeQuietly(record.localPath);
  if (record.behavior == UploadBehavior::Move)
    removeQuietly(record.sourcePath ? *record.sourcePath : record.localPath);
}

WorkOutcome TransferWorker::handleError(const TransferRecord &record,
                                        const TransferError &error,
                                        CancellationToken &cancel,
                                        int attempt) {
  WorkOutcome outcome = classifyError(error);
  std::cerr << "[Worker] Transfer " << record.id << " attempt " << attempt
            << " " << toString(error.kind()) << ": " << error.what() << " -> "
            << toString(outcome) << std::endl;

  if (outcome == WorkOutcome::Retry &&
      (!cancel.isCancelled() && attempt >= m_config.maxAttempts)) {
    std::cerr << "[Worker] Transfer " << record.id << " used all "
              << m_config.maxAttempts << " attempts" << std::endl;
    outcome = WorkOutcome::Failure;
  }

  if (outcome == WorkOutcome::Retry) {
    // Session fields stay so the next attempt resumes.
    if (!m_store.updateTransferStatus(record.id, TransferStatus::Enqueued))
      std::cerr << "[Worker] Could not re-enqueue transfer " << record.id
                << std::endl;
    return outcome;
  }

  if (!m_store.updateTransferWhenFinished(record.id, TransferStatus::Failed,
                                          resultFromError(error), nowSeconds()))
    std::cerr << "[Worker] Could not mark transfer " << record.id << " failed"
              << std::endl;
  m_notifier.transferFailed(record,
                            error.kind() == ErrorKind::Unauthorized
                                ? FailureKind::CredentialsNeeded
                                : FailureKind::Generic,
                            error.what());
  return WorkOutcome::Failure;
}

WorkOutcome TransferWorker::run(std::int64_t id, CancellationToken &cancel,
                                int attempt) {
  auto stored = m_store.getTransferById(id);
  if (!stored) {
    std::cerr << "[Worker] Transfer " << id << " not found" << std::endl;
    return WorkOutcome::Failure;
  }
  TransferRecord record = *stored;
  if (record.status == TransferStatus::Succeeded)
    return WorkOutcome::Success;
  if (record.status == TransferStatus::Failed) {
    std::cerr << "[Worker] Transfer " << id << " is FAILED; retry it first"
              << std::endl;
    return WorkOutcome::Failure;
  }
  if (record.localPath.empty() || record.remotePath.empty()) {
    TransferError invalid(ErrorKind::LocalFileNotFound,
                          "transfer has no local or remote path");
    return handleError(record, invalid, cancel, attempt);
  }

  if (!m_store.updateTransferStatus(id, TransferStatus::InProgress))
    return WorkOutcome::Retry;
  std::cout << "[Worker] Transfer " << id << " attempt " << attempt << ": "
            << (record.direction == TransferDirection::Upload ? "upload "
                                                              : "download ")
            << record.localPath << " <-> " << record.remotePath << std::endl;

  try {
    if (record.direction == TransferDirection::Upload)
      runUpload(record, cancel);
    else
      runDownload(record, cancel);
  } catch (const TransferError &e) {
    return handleError(record, e, cancel, attempt);
  } catch (const std::exception &e) {
    // Anything outside the taxonomy (filesystem, parsing) is not retried.
    TransferError wrapped(ErrorKind::ProtocolViolation, e.what());
    return handleError(record, wrapped, cancel, attempt);
  }

  if (!m_store.updateTransferWhenFinished(id, TransferStatus::Succeeded,
                                          TransferResult::Ok, nowSeconds()))
    std::cerr << "[Worker] Could not mark transfer " << id << " succeeded"
              << std::endl;
  if (record.direction == TransferDirection::Upload)
    cleanupAfterUpload(record);
  m_notifier.transferSucceeded(record);
  return WorkOutcome::Success;
}

} // namespace davsync
