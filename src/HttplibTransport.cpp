#include "HttplibTransport.hpp"
#include "ChunkReader.hpp"
#include "TransferError.hpp"
#include "WebDavPaths.hpp"
#include "httplib.h"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace davsync {

namespace {

httplib::Headers toHttplibHeaders(const Headers &headers) {
  httplib::Headers out;
  for (const auto &h : headers)
    out.emplace(h.first, h.second);
  return out;
}

HttpResponse toResponse(const httplib::Response &res) {
  HttpResponse out;
  out.status = res.status;
  for (const auto &h : res.headers)
    out.headers[h.first] = h.second;
  out.body = res.body;
  return out;
}

bool isBodyMethod(const std::string &method) {
  return method == "PUT" || method == "POST" || method == "PATCH";
}

} // namespace

struct HttplibTransport::Impl {
  HttpSettings settings;
  std::mutex mtx;
  std::map<std::pair<std::string, std::thread::id>,
           std::unique_ptr<httplib::Client>>
      clients;

  explicit Impl(const HttpSettings &s) : settings(s) {}

  httplib::Client &clientFor(const std::string &origin) {
    std::lock_guard<std::mutex> lock(mtx);
    auto key = std::make_pair(origin, std::this_thread::get_id());
    auto it = clients.find(key);
    if (it != clients.end())
      return *it->second;

    auto client = std::make_unique<httplib::Client>(origin);
    client->set_connection_timeout(settings.connectionTimeoutSeconds, 0);
    client->set_read_timeout(settings.readTimeoutSeconds, 0);
    client->set_write_timeout(settings.writeTimeoutSeconds, 0);
    client->set_follow_location(true);
    if (settings.bearerToken)
      client->set_bearer_token_auth(*settings.bearerToken);
    else if (settings.username && settings.password)
      client->set_basic_auth(*settings.username, *settings.password);
    auto &ref = *client;
    clients.emplace(key, std::move(client));
    return ref;
  }
};

HttplibTransport::HttplibTransport(const HttpSettings &settings)
    : m_impl(std::make_unique<Impl>(settings)) {}

HttplibTransport::~HttplibTransport() = default;

HttpResponse HttplibTransport::execute(const HttpRequest &request) {
  auto parts = webdav::splitUrl(request.url);
  if (parts.origin.empty())
    throw std::invalid_argument("not an absolute URL: " + request.url);

  auto &client = m_impl->clientFor(parts.origin);
  auto headers = toHttplibHeaders(request.headers);
  const std::string &path = parts.path;

  auto send = [&]() -> httplib::Result {
    if (request.fileBody) {
      if (!isBodyMethod(request.method))
        throw std::invalid_argument(request.method + " cannot carry a body");

      auto reader = std::make_shared<ChunkReader>(request.fileBody->path);
      const FileWindow window = *request.fileBody;
      const std::uint64_t total =
          reader->windowLength(window.offset, window.length);

      httplib::ContentProvider provider =
          [reader, window, total, &request](size_t offset, size_t /*length*/,
                                            httplib::DataSink &sink) {
            if (request.cancel && request.cancel->isCancelled())
              return false;
            std::uint64_t piece = std::min<std::uint64_t>(
                ChunkReader::kPieceSize, total - offset);
            bool written = true;
            reader->streamWindow(window.offset + offset, piece,
                                 [&](const char *data, std::size_t len) {
                                   written = sink.write(data, len);
                                   return written;
                                 });
            if (written && request.onBytesSent)
              request.onBytesSent(offset + piece);
            // Only cancellation stops the provider; a failed sink write
            // surfaces as Error::Write.
            return true;
          };

      std::string contentType = request.contentType.empty()
                                    ? "application/octet-stream"
                                    : request.contentType;
      auto length = static_cast<size_t>(total);
      if (request.method == "PUT")
        return client.Put(path, headers, length, provider, contentType);
      if (request.method == "POST")
        return client.Post(path, headers, length, provider, contentType);
      return client.Patch(path, headers, length, provider, contentType);
    }
    if (request.method == "GET") {
      if (request.onBodyChunk) {
        httplib::ContentReceiver receiver = [&request](const char *data,
                                                       size_t len) {
          if (request.cancel && request.cancel->isCancelled())
            return false;
          return request.onBodyChunk(data, len);
        };
        return client.Get(path, headers, receiver);
      }
      return client.Get(path, headers);
    }
    if (request.method == "HEAD")
      return client.Head(path, headers);
    if (request.method == "OPTIONS")
      return client.Options(path, headers);
    if (request.method == "DELETE")
      return client.Delete(path, headers);
    if (request.method == "PUT")
      return client.Put(path, headers, request.body, request.contentType);
    if (request.method == "POST")
      return client.Post(path, headers, request.body, request.contentType);
    if (request.method == "PATCH")
      return client.Patch(path, headers, request.body, request.contentType);

    // WebDAV verbs (MKCOL, MOVE, PROPFIND) go through the generic sender.
    httplib::Request req;
    req.method = request.method;
    req.path = path;
    req.headers = headers;
    req.body = request.body;
    if (!request.contentType.empty())
      req.set_header("Content-Type", request.contentType);
    return client.send(req);
  };

  auto res = send();

  if (!res) {
    auto err = res.error();
    if (request.cancel && request.cancel->isCancelled())
      throw TransferError(ErrorKind::Cancelled,
                          request.method + " " + request.url + " cancelled");
    std::cerr << "[HTTP] " << request.method << " " << request.url
              << " failed: " << httplib::to_string(err) << std::endl;
    throw TransferError(ErrorKind::Network, request.method + " " +
                                                request.url + ": " +
                                                httplib::to_string(err));
  }
  return toResponse(res.value());
}

} // namespace davsync
