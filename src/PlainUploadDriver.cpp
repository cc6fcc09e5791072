#include "PlainUploadDriver.hpp"
#include "TransferError.hpp"
#include "WebDavPaths.hpp"
#include <iostream>

namespace davsync {

PlainUploadDriver::PlainUploadDriver(HttpTransport &transport)
    : m_transport(transport) {}

std::optional<std::string> PlainUploadDriver::upload(const UploadJob &job) {
  if (job.cancel && job.cancel->isCancelled())
    throw TransferError(ErrorKind::Cancelled, "upload cancelled");

  HttpRequest put;
  put.method = "PUT";
  put.url = job.remoteUrl;
  put.cancel = job.cancel;
  put.contentType = job.mimeType;
  put.fileBody = FileWindow{job.localPath, 0, job.length};
  put.headers["OC-Total-Length"] = std::to_string(job.length);
  put.headers["X-OC-Mtime"] = std::to_string(job.lastModified);
  if (job.requiredEtag)
    put.headers["If-Match"] = "\"" + *job.requiredEtag + "\"";
  put.onBytesSent = [&job](std::uint64_t sent) {
    if (job.progress)
      job.progress->update(sent);
  };

  auto res = m_transport.execute(put);
  if (res.status != 200 && res.status != 201 && res.status != 204)
    throw errorForStatus(res.status, "PUT " + job.remotePath);
  if (job.progress)
    job.progress->update(job.length);

  std::cout << "[Upload] PUT " << job.remotePath << " - " << res.status
            << std::endl;
  auto etag = res.header("OC-ETag");
  if (!etag)
    etag = res.header("ETag");
  if (etag)
    return webdav::stripQuotes(*etag);
  return std::nullopt;
}

} // namespace davsync
