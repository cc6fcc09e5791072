#pragma once

#include "ChunkReader.hpp"
#include "HttpTransport.hpp"
#include "SqliteTransferStore.hpp"
#include "TransferError.hpp"
#include "TransferStore.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace davsync {
namespace testing {

class TempDir {
public:
  TempDir() {
    std::random_device rd;
    m_path = std::filesystem::temp_directory_path() /
             ("davsync_test_" + std::to_string(rd()) + "_" +
              std::to_string(counter()++));
    std::filesystem::create_directories(m_path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
  }

  std::string file(const std::string &name) const {
    return (m_path / name).string();
  }

  std::string write(const std::string &name, const std::string &content) const {
    auto p = file(name);
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p;
  }

private:
  static std::atomic<int> &counter() {
    static std::atomic<int> c{0};
    return c;
  }
  std::filesystem::path m_path;
};

inline std::string patternData(std::size_t size) {
  std::string data(size, '\0');
  for (std::size_t i = 0; i < size; ++i)
    data[i] = static_cast<char>('a' + (i * 7 + i / 251) % 26);
  return data;
}

inline std::string readFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

struct RecordedRequest {
  std::string method;
  std::string url;
  Headers headers;
  std::string body;
};

/**
 * In-process HttpTransport. File bodies are read from disk the way the real
 * transport streams them, then handed to a scripted handler.
 */
class FakeHttpTransport : public HttpTransport {
public:
  using Handler =
      std::function<HttpResponse(const HttpRequest &, const std::string &)>;

  explicit FakeHttpTransport(Handler handler = {})
      : m_handler(std::move(handler)) {}

  void setHandler(Handler handler) { m_handler = std::move(handler); }

  HttpResponse execute(const HttpRequest &request) override {
    if (request.cancel && request.cancel->isCancelled())
      throw TransferError(ErrorKind::Cancelled, "cancelled");

    std::string body = request.body;
    if (request.fileBody) {
      ChunkReader reader(request.fileBody->path);
      body = reader.readWindow(request.fileBody->offset,
                               request.fileBody->length);
      if (request.onBytesSent)
        request.onBytesSent(body.size());
    }
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_requests.push_back({request.method, request.url, request.headers, body});
    }

    HttpResponse res = m_handler ? m_handler(request, body) : HttpResponse{};
    if (request.onBodyChunk && !res.body.empty()) {
      request.onBodyChunk(res.body.data(), res.body.size());
      res.body.clear();
    }
    return res;
  }

  std::vector<RecordedRequest> requests() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requests;
  }

  int count(const std::string &method) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(
        std::count_if(m_requests.begin(), m_requests.end(),
                      [&](const RecordedRequest &r) { return r.method == method; }));
  }

private:
  Handler m_handler;
  std::mutex m_mutex;
  std::vector<RecordedRequest> m_requests;
};

inline HttpResponse response(int status, Headers headers = {},
                             std::string body = {}) {
  HttpResponse res;
  res.status = status;
  res.headers = std::move(headers);
  res.body = std::move(body);
  return res;
}

/**
 * A small WebDAV + TUS server that keeps the bytes it receives, with knobs
 * to inject the failures the upload paths must survive.
 */
class FakeDavServer {
public:
  std::string origin = "http://dav.test";
  std::string tusUploadPath = "/tus/upload-1";

  // Capabilities
  bool advertiseTus = true;
  bool creationWithUpload = false;
  int createStatus = 201;

  // TUS session
  bool sessionExists = false;
  std::uint64_t uploadLength = 0;
  std::string tusData;
  Headers createHeaders;

  // Failure injection, 1-based PATCH call numbers.
  std::set<int> failPatchAt;
  std::size_t partialBytesOnFail = 0;
  std::size_t loseBytesOnFail = 0;
  bool omitPatchOffset = false;
  bool stallPatches = false;
  std::function<std::uint64_t(std::uint64_t)> rewritePatchOffset;
  bool headFails = false;
  // Server limits: 405 for a raw PATCH, 413 for larger bodies.
  bool requireMethodOverride = false;
  std::size_t maxPatchBody = 0;

  // WebDAV
  std::map<std::string, std::string> files; // path -> content
  std::map<std::string, std::map<std::string, std::string>> staging;
  std::set<std::string> collections{"/remote.php/webdav"};
  std::string etag = "etag-1";

  int patchCalls = 0;
  int deleteCalls = 0;

  std::string tusUrl() const { return origin + tusUploadPath; }

  FakeHttpTransport::Handler handler() {
    return [this](const HttpRequest &req, const std::string &body) {
      return handle(req, body);
    };
  }

  HttpResponse handle(const HttpRequest &req, const std::string &body) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string path = req.url.substr(origin.size());

    if (req.method == "OPTIONS") {
      if (!advertiseTus)
        return response(200);
      return response(200, {{"Tus-Version", "1.0.0"},
                            {"Tus-Extension",
                             creationWithUpload
                                 ? "creation,creation-with-upload,termination"
                                 : "creation,termination"}});
    }

    if (path == tusUploadPath)
      return handleTus(req, body);

    if (req.method == "POST" && req.headers.count("Tus-Resumable")) {
      createHeaders = req.headers;
      if (createStatus != 201)
        return response(createStatus);
      sessionExists = true;
      uploadLength = std::stoull(req.headers.at("Upload-Length"));
      tusData = body;
      Headers headers{{"Location", tusUploadPath}};
      if (!body.empty())
        headers["Upload-Offset"] = std::to_string(tusData.size());
      return response(201, headers);
    }

    if (req.method == "MKCOL") {
      auto trimmed = trimSlash(path);
      if (collections.count(trimmed))
        return response(405);
      collections.insert(trimmed);
      if (trimmed.rfind("/remote.php/dav/uploads/", 0) == 0)
        staging[trimmed];
      return response(201);
    }

    if (req.method == "HEAD") {
      auto trimmed = trimSlash(path);
      if (collections.count(trimmed))
        return response(200);
      if (files.count(path))
        return response(200, {{"ETag", "\"" + etag + "\""}});
      return response(404);
    }

    if (req.method == "PUT") {
      auto slash = path.rfind('/');
      auto parent = path.substr(0, slash);
      if (staging.count(parent)) {
        staging[parent][path.substr(slash + 1)] = body;
        return response(201);
      }
      auto ifMatch = req.headers.find("If-Match");
      if (ifMatch != req.headers.end() && ifMatch->second != "\"" + etag + "\"")
        return response(412);
      files[path] = body;
      return response(201, {{"ETag", "\"" + etag + "\""}});
    }

    if (req.method == "MOVE") {
      auto parent = path.substr(0, path.rfind('/'));
      auto it = staging.find(parent);
      if (it == staging.end())
        return response(404);
      std::string assembled;
      for (const auto &chunk : it->second)
        assembled += chunk.second;
      auto dest = req.headers.at("Destination").substr(origin.size());
      files[dest] = assembled;
      staging.erase(it);
      return response(201, {{"OC-ETag", "\"" + etag + "\""}});
    }

    if (req.method == "GET") {
      auto it = files.find(path);
      if (it == files.end())
        return response(404);
      return response(200, {{"ETag", "\"" + etag + "\""}}, it->second);
    }

    return response(405);
  }

private:
  static std::string trimSlash(std::string p) {
    while (p.size() > 1 && p.back() == '/')
      p.pop_back();
    return p;
  }

  HttpResponse handleTus(const HttpRequest &req, const std::string &body) {
    if (req.method == "DELETE") {
      ++deleteCalls;
      sessionExists = false;
      return response(204);
    }
    if (!sessionExists)
      return response(404);

    if (req.method == "HEAD") {
      if (headFails)
        throw TransferError(ErrorKind::Network, "HEAD timed out");
      return response(200,
                      {{"Upload-Offset", std::to_string(tusData.size())},
                       {"Upload-Length", std::to_string(uploadLength)}});
    }

    if (req.method == "PATCH" ||
        (req.method == "POST" && req.headers.count("X-HTTP-Method-Override"))) {
      ++patchCalls;
      if (requireMethodOverride && req.method == "PATCH")
        return response(405);
      if (maxPatchBody > 0 && body.size() > maxPatchBody)
        return response(413);
      auto offset = std::stoull(req.headers.at("Upload-Offset"));
      if (offset != tusData.size())
        return response(409);
      if (failPatchAt.count(patchCalls)) {
        tusData += body.substr(0, std::min(partialBytesOnFail, body.size()));
        tusData.resize(tusData.size() -
                       std::min(loseBytesOnFail, tusData.size()));
        throw TransferError(ErrorKind::Network, "connection reset");
      }
      if (!stallPatches)
        tusData += body;
      if (omitPatchOffset)
        return response(204);
      std::uint64_t reported = tusData.size();
      if (rewritePatchOffset)
        reported = rewritePatchOffset(reported);
      return response(204, {{"Upload-Offset", std::to_string(reported)}});
    }
    return response(405);
  }

  std::mutex m_mutex;
};

// Forwards to another store and remembers every TUS offset write.
class RecordingTransferStore : public TransferStore {
public:
  explicit RecordingTransferStore(TransferStore &inner) : m_inner(inner) {}

  std::vector<std::uint64_t> offsets;
  int clearCalls = 0;
  int sessionWrites = 0;

  std::optional<std::int64_t> insertTransfer(const TransferRecord &r) override {
    return m_inner.insertTransfer(r);
  }
  std::optional<TransferRecord> getTransferById(std::int64_t id) override {
    return m_inner.getTransferById(id);
  }
  std::vector<TransferRecord>
  getTransfersByAccount(const std::string &account) override {
    return m_inner.getTransfersByAccount(account);
  }
  std::vector<TransferRecord> getTransfersByStatus(TransferStatus s) override {
    return m_inner.getTransfersByStatus(s);
  }
  bool updateTransferStatus(std::int64_t id, TransferStatus s) override {
    return m_inner.updateTransferStatus(id, s);
  }
  bool updateTusState(std::int64_t id, const TusSession &session) override {
    ++sessionWrites;
    return m_inner.updateTusState(id, session);
  }
  bool updateTusOffset(std::int64_t id, std::uint64_t offset) override {
    offsets.push_back(offset);
    return m_inner.updateTusOffset(id, offset);
  }
  bool clearTusState(std::int64_t id) override {
    ++clearCalls;
    return m_inner.clearTusState(id);
  }
  bool updateTransferWhenFinished(std::int64_t id, TransferStatus s,
                                  TransferResult r, std::int64_t ts) override {
    return m_inner.updateTransferWhenFinished(id, s, r, ts);
  }
  bool retryTransfer(std::int64_t id) override {
    return m_inner.retryTransfer(id);
  }
  bool deleteTransfer(std::int64_t id) override {
    return m_inner.deleteTransfer(id);
  }

private:
  TransferStore &m_inner;
};

inline std::unique_ptr<SqliteTransferStore> makeMemoryStore() {
  auto store = std::make_unique<SqliteTransferStore>(":memory:");
  store->initializeSchema();
  return store;
}

} // namespace testing
} // namespace davsync
