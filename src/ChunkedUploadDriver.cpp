#include "ChunkedUploadDriver.hpp"
#include "TransferError.hpp"
#include "WebDavPaths.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <utility>

#include <picosha2.h>

namespace davsync {

ChunkedUploadDriver::ChunkedUploadDriver(HttpTransport &transport,
                                         std::string uploadsUrl,
                                         std::uint64_t chunkSize)
    : m_transport(transport), m_uploadsUrl(std::move(uploadsUrl)),
      m_chunkSize(chunkSize == 0 ? 1 : chunkSize) {}

std::string ChunkedUploadDriver::stagingName(const std::string &remotePath,
                                             std::int64_t transferId,
                                             std::int64_t timestampMs) {
  std::string hex = picosha2::hash256_hex_string(
      remotePath + "\n" + std::to_string(transferId) + "\n" +
      std::to_string(timestampMs));
  return hex.substr(0, 32);
}

std::string ChunkedUploadDriver::chunkName(std::uint64_t offset) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%015llu",
                static_cast<unsigned long long>(offset));
  return buf;
}

std::optional<std::string> ChunkedUploadDriver::upload(const UploadJob &job) {
  auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                 std::chrono::system_clock::now().time_since_epoch())
                 .count();
  const std::string stagingUrl =
      webdav::joinUrl(m_uploadsUrl,
                      "/" + stagingName(job.remotePath, job.transferId, now));

  // 1. Staging collection
  HttpRequest mkcol;
  mkcol.method = "MKCOL";
  mkcol.url = stagingUrl;
  mkcol.cancel = job.cancel;
  auto res = m_transport.execute(mkcol);
  if (res.status != 201)
    throw errorForStatus(res.status, "MKCOL " + stagingUrl);
  std::cout << "[Chunked] Staging " << job.remotePath << " in " << stagingUrl
            << std::endl;

  // 2. Sequential chunks
  std::uint64_t offset = 0;
  do {
    if (job.cancel && job.cancel->isCancelled())
      throw TransferError(ErrorKind::Cancelled, "upload cancelled");

    const std::uint64_t length = std::min(m_chunkSize, job.length - offset);
    const std::uint64_t start = offset;

    HttpRequest put;
    put.method = "PUT";
    put.url = stagingUrl + "/" + chunkName(start);
    put.cancel = job.cancel;
    put.fileBody = FileWindow{job.localPath, start, length};
    put.headers["OC-Total-Length"] = std::to_string(job.length);
    put.onBytesSent = [&job, start](std::uint64_t sent) {
      if (job.progress)
        job.progress->update(start + sent);
    };

    res = m_transport.execute(put);
    if (res.status != 201 && res.status != 204 && res.status != 200)
      throw errorForStatus(res.status, "PUT chunk at " + std::to_string(start));
    offset += length;
    if (job.progress)
      job.progress->update(offset);
  } while (offset < job.length);

  // 3. Assembly
  HttpRequest move;
  move.method = "MOVE";
  move.url = stagingUrl + "/.file";
  move.cancel = job.cancel;
  move.headers["Destination"] = job.remoteUrl;
  move.headers["OC-Total-Length"] = std::to_string(job.length);
  move.headers["X-OC-Mtime"] = std::to_string(job.lastModified);
  if (job.requiredEtag)
    move.headers["If-Match"] = "\"" + *job.requiredEtag + "\"";

  res = m_transport.execute(move);
  if (res.status != 201 && res.status != 204)
    throw errorForStatus(res.status, "MOVE " + move.url);

  std::cout << "[Chunked] Assembled " << job.remotePath << " (" << job.length
            << " bytes)" << std::endl;
  auto etag = res.header("OC-ETag");
  if (!etag)
    etag = res.header("ETag");
  if (etag)
    return webdav::stripQuotes(*etag);
  return std::nullopt;
}

} // namespace davsync
