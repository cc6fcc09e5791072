#pragma once

#include "CancellationToken.hpp"
#include "HttpTransport.hpp"
#include "ProgressChannel.hpp"
#include <optional>
#include <string>

namespace davsync {

struct DownloadJob {
  std::int64_t transferId = 0;
  std::string remoteUrl;
  std::string localPath;
  CancellationToken *cancel = nullptr;
  PercentTracker *progress = nullptr;
};

/**
 * DownloadDriver streams a GET into "<local>.part" and renames it over the
 * target only after the whole body arrived.
 */
class DownloadDriver {
public:
  explicit DownloadDriver(HttpTransport &transport);

  // Returns the etag of the downloaded version, when the server sends one.
  std::optional<std::string> download(const DownloadJob &job);

  static std::string partPath(const std::string &localPath);

private:
  HttpTransport &m_transport;
};

} // namespace davsync
