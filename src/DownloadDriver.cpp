#include "DownloadDriver.hpp"
#include "TransferError.hpp"
#include "WebDavPaths.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace davsync {

DownloadDriver::DownloadDriver(HttpTransport &transport)
    : m_transport(transport) {}

std::string DownloadDriver::partPath(const std::string &localPath) {
  return localPath + ".part";
}

std::optional<std::string> DownloadDriver::download(const DownloadJob &job) {
  const std::string part = partPath(job.localPath);
  std::error_code ec;
  auto parent = fs::path(job.localPath).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec)
      throw TransferError(ErrorKind::LocalFileNotFound,
                          "cannot create " + parent.string() + ": " +
                              ec.message());
  }

  std::ofstream out(part, std::ios::binary | std::ios::trunc);
  if (!out.is_open())
    throw TransferError(ErrorKind::LocalFileNotFound, "cannot write " + part);

  std::uint64_t received = 0;
  bool writeFailed = false;
  HttpRequest get;
  get.method = "GET";
  get.url = job.remoteUrl;
  get.cancel = job.cancel;
  get.onBodyChunk = [&](const char *data, std::size_t len) {
    out.write(data, static_cast<std::streamsize>(len));
    if (!out) {
      writeFailed = true;
      return false;
    }
    received += len;
    if (job.progress)
      job.progress->update(received);
    return true;
  };

  HttpResponse res;
  try {
    res = m_transport.execute(get);
  } catch (const TransferError &) {
    out.close();
    fs::remove(part, ec);
    if (writeFailed)
      throw TransferError(ErrorKind::LocalFileNotFound,
                          "write failed for " + part);
    throw;
  }
  out.close();

  if (res.status != 200) {
    fs::remove(part, ec);
    throw errorForStatus(res.status, "GET " + job.remoteUrl);
  }
  if (writeFailed || !out) {
    fs::remove(part, ec);
    throw TransferError(ErrorKind::LocalFileNotFound,
                        "write failed for " + part);
  }

  fs::rename(part, job.localPath, ec);
  if (ec) {
    fs::remove(part, ec);
    throw TransferError(ErrorKind::LocalFileNotFound,
                        "cannot move download into " + job.localPath);
  }
  std::cout << "[Download] " << job.remoteUrl << " -> " << job.localPath
            << " (" << received << " bytes)" << std::endl;

  auto etag = res.header("OC-ETag");
  if (!etag)
    etag = res.header("ETag");
  if (etag)
    return webdav::stripQuotes(*etag);
  return std::nullopt;
}

} // namespace davsync
