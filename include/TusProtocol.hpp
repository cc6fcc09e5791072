#pragma once

#include "HttpTransport.hpp"
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace davsync {

using MetadataList = std::vector<std::pair<std::string, std::string>>;

struct TusCreateRequest {
  std::string collectionUrl;
  std::uint64_t length = 0;
  MetadataList metadata;
  // creation-with-upload: bytes sent inline with the POST.
  std::optional<FileWindow> firstChunk;
};

struct TusCreateResult {
  std::string uploadUrl;
  // Set when the server already accepted inline bytes.
  std::optional<std::uint64_t> offset;
};

/**
 * TusProtocol issues the individual TUS 1.0.0 requests. Every call either
 * returns the parsed value or throws TransferError; it keeps no state
 * between calls.
 */
class TusProtocol {
public:
  static constexpr const char *kVersion = "1.0.0";

  explicit TusProtocol(HttpTransport &transport);

  // OPTIONS against the URL with and without a trailing slash. Any failure
  // means "unsupported".
  std::optional<TusSupport> probe(const std::string &collectionUrl,
                                  CancellationToken *cancel = nullptr);

  TusCreateResult create(const TusCreateRequest &request,
                         CancellationToken *cancel = nullptr);

  // HEAD. Throws SessionExpired on 404/410.
  std::uint64_t queryOffset(const std::string &uploadUrl,
                            CancellationToken *cancel = nullptr);

  // Returns the server's new offset from the Upload-Offset header.
  std::uint64_t patch(const std::string &uploadUrl, std::uint64_t offset,
                      const FileWindow &window, bool methodOverride,
                      const std::function<void(std::uint64_t)> &onBytesSent,
                      CancellationToken *cancel = nullptr);

  // Best effort; returns false instead of throwing.
  bool deleteSession(const std::string &uploadUrl);

  // "key b64(value),key b64(value)" for the Upload-Metadata header.
  static std::string encodeMetadataHeader(const MetadataList &metadata);
  // "key=value;key=value" as persisted with the session.
  static std::string serializeMetadata(const MetadataList &metadata);
  static std::string base64Encode(const std::string &data);

private:
  HttpTransport &m_transport;
};

} // namespace davsync
