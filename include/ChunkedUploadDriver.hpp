#pragma once

#include "HttpTransport.hpp"
#include "UploadJob.hpp"
#include <optional>
#include <string>

namespace davsync {

/**
 * ChunkedUploadDriver uploads into a fresh staging collection under the
 * uploads root and assembles the chunks with a MOVE onto the target.
 * A failed attempt leaves its staging collection behind; the next attempt
 * uses a new one.
 */
class ChunkedUploadDriver {
public:
  ChunkedUploadDriver(HttpTransport &transport, std::string uploadsUrl,
                      std::uint64_t chunkSize);

  // Returns the etag of the assembled file, when the server sends one.
  std::optional<std::string> upload(const UploadJob &job);

  // sha256 of remotePath, transfer id and timestamp, first 32 hex digits.
  static std::string stagingName(const std::string &remotePath,
                                 std::int64_t transferId,
                                 std::int64_t timestampMs);
  static std::string chunkName(std::uint64_t offset);

private:
  HttpTransport &m_transport;
  std::string m_uploadsUrl;
  std::uint64_t m_chunkSize;
};

} // namespace davsync
