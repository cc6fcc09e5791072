#pragma once

#include "CancellationToken.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace davsync {

struct CaseInsensitiveLess {
  bool operator()(const std::string &a, const std::string &b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
          return std::tolower(static_cast<unsigned char>(x)) <
                 std::tolower(static_cast<unsigned char>(y));
        });
  }
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

// A byte range of a local file used as a streamed request body.
struct FileWindow {
  std::string path;
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
};

struct HttpRequest {
  std::string method;
  std::string url; // absolute
  Headers headers;
  std::string body;
  std::optional<FileWindow> fileBody;
  std::string contentType;
  // Called with the bytes of the body sent so far in this request.
  std::function<void(std::uint64_t)> onBytesSent;
  // When set, the response body is streamed here instead of being buffered.
  std::function<bool(const char *, std::size_t)> onBodyChunk;
  CancellationToken *cancel = nullptr;
};

struct HttpResponse {
  int status = 0;
  Headers headers;
  std::string body;

  std::optional<std::string> header(const std::string &name) const {
    auto it = headers.find(name);
    if (it == headers.end())
      return std::nullopt;
    return it->second;
  }
};

/**
 * Authenticated HTTP client used by every driver. execute() returns any
 * response the server sends, whatever its status; it throws
 * TransferError(Network) when no response arrives and
 * TransferError(Cancelled) when the request's token was cancelled.
 */
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse execute(const HttpRequest &request) = 0;
};

} // namespace davsync
