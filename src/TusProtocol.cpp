#include "TusProtocol.hpp"
#include "TransferError.hpp"
#include "WebDavPaths.hpp"
#include <array>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace davsync {

namespace {

constexpr std::array<char, 64> kAlphabet = {
    'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M',
    'N', 'O', 'P', 'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z',
    'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i', 'j', 'k', 'l', 'm',
    'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v', 'w', 'x', 'y', 'z',
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'};

const char *kOffsetContentType = "application/offset+octet-stream";

std::string trim(const std::string &s) {
  size_t begin = 0, end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

std::vector<std::string> splitList(const std::string &value) {
  std::vector<std::string> out;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty())
      out.push_back(item);
  }
  return out;
}

std::string toLower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::optional<std::uint64_t> parseOffset(const HttpResponse &res) {
  auto header = res.header("Upload-Offset");
  if (!header)
    return std::nullopt;
  auto text = trim(*header);
  if (text.empty() ||
      text.find_first_not_of("0123456789") != std::string::npos)
    return std::nullopt;
  try {
    return static_cast<std::uint64_t>(std::stoull(text));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

} // namespace

TusProtocol::TusProtocol(HttpTransport &transport) : m_transport(transport) {}

std::string TusProtocol::base64Encode(const std::string &data) {
  std::string output;
  output.reserve(((data.size() + 2) / 3) * 4);

  std::uint32_t buffer = 0;
  int bitsCollected = 0;
  for (unsigned char byte : data) {
    buffer = (buffer << 8u) | byte;
    bitsCollected += 8;
    while (bitsCollected >= 6) {
      bitsCollected -= 6;
      output.push_back(kAlphabet[(buffer >> bitsCollected) & 0x3Fu]);
    }
  }
  if (bitsCollected > 0) {
    buffer <<= (6 - bitsCollected);
    output.push_back(kAlphabet[buffer & 0x3Fu]);
  }
  while (output.size() % 4 != 0)
    output.push_back('=');
  return output;
}

std::string TusProtocol::encodeMetadataHeader(const MetadataList &metadata) {
  std::string out;
  for (const auto &entry : metadata) {
    if (!out.empty())
      out += ",";
    out += entry.first + " " + base64Encode(entry.second);
  }
  return out;
}

std::string TusProtocol::serializeMetadata(const MetadataList &metadata) {
  std::string out;
  for (const auto &entry : metadata) {
    if (!out.empty())
      out += ";";
    out += entry.first + "=" + entry.second;
  }
  return out;
}

std::optional<TusSupport> TusProtocol::probe(const std::string &collectionUrl,
                                             CancellationToken *cancel) {
  std::vector<std::string> candidates{collectionUrl};
  if (collectionUrl.empty() || collectionUrl.back() != '/')
    candidates.push_back(collectionUrl + "/");

  for (const auto &endpoint : candidates) {
    HttpRequest req;
    req.method = "OPTIONS";
    req.url = endpoint;
    req.headers["Tus-Resumable"] = kVersion;
    req.cancel = cancel;

    HttpResponse res;
    try {
      res = m_transport.execute(req);
    } catch (const TransferError &e) {
      std::cerr << "[TUS] OPTIONS " << endpoint << " failed: " << e.what()
                << std::endl;
      continue;
    }
    std::cout << "[TUS] OPTIONS " << endpoint << " - " << res.status
              << std::endl;
    if (res.status != 200 && res.status != 204)
      continue;

    bool versionOk = false;
    for (const auto &v : splitList(res.header("Tus-Version").value_or("")))
      versionOk = versionOk || v == kVersion;

    TusSupport support;
    bool creation = false;
    for (const auto &ext :
         splitList(res.header("Tus-Extension").value_or(""))) {
      auto lower = toLower(ext);
      support.extensions.push_back(lower);
      if (lower == "creation")
        creation = true;
      if (lower == "creation-with-upload") {
        creation = true;
        support.creationWithUpload = true;
      }
    }
    if (versionOk && creation)
      return support;
  }
  return std::nullopt;
}

TusCreateResult TusProtocol::create(const TusCreateRequest &request,
                                    CancellationToken *cancel) {
  HttpRequest req;
  req.method = "POST";
  req.url = request.collectionUrl;
  req.cancel = cancel;
  req.contentType = kOffsetContentType;
  req.headers["Tus-Resumable"] = kVersion;
  req.headers["Upload-Length"] = std::to_string(request.length);
  req.headers["Upload-Metadata"] = encodeMetadataHeader(request.metadata);

  bool withUpload = request.firstChunk && request.firstChunk->length > 0;
  if (withUpload) {
    req.headers["Tus-Extension"] = "creation,creation-with-upload";
    req.headers["Upload-Offset"] = "0";
    req.fileBody = request.firstChunk;
  } else {
    req.headers["Tus-Extension"] = "creation";
  }

  auto res = m_transport.execute(req);
  std::cout << "[TUS] Creation [" << request.collectionUrl << "] - "
            << res.status << std::endl;
  if (res.status != 201 && res.status != 200)
    throw errorForStatus(res.status, "TUS create");

  auto location = res.header("Location").value_or("");
  auto resolved = webdav::resolveLocation(request.collectionUrl, location);
  if (resolved.empty())
    throw TransferError(ErrorKind::ProtocolViolation,
                        "TUS create response has no Location header");

  TusCreateResult result;
  result.uploadUrl = resolved;
  if (withUpload)
    result.offset = parseOffset(res);
  return result;
}

std::uint64_t TusProtocol::queryOffset(const std::string &uploadUrl,
                                       CancellationToken *cancel) {
  HttpRequest req;
  req.method = "HEAD";
  req.url = uploadUrl;
  req.headers["Tus-Resumable"] = kVersion;
  req.cancel = cancel;

  auto res = m_transport.execute(req);
  if (res.status == 404 || res.status == 410)
    throw TransferError(ErrorKind::SessionExpired,
                        "TUS session no longer exists: " + uploadUrl,
                        res.status);
  if (res.status != 200 && res.status != 204)
    throw errorForStatus(res.status, "TUS offset query");

  auto offset = parseOffset(res);
  if (!offset)
    throw TransferError(ErrorKind::ProtocolViolation,
                        "HEAD response without a valid Upload-Offset");
  return *offset;
}

std::uint64_t
TusProtocol::patch(const std::string &uploadUrl, std::uint64_t offset,
                   const FileWindow &window, bool methodOverride,
                   const std::function<void(std::uint64_t)> &onBytesSent,
                   CancellationToken *cancel) {
  HttpRequest req;
  req.method = methodOverride ? "POST" : "PATCH";
  req.url = uploadUrl;
  req.cancel = cancel;
  req.contentType = kOffsetContentType;
  req.headers["Tus-Resumable"] = kVersion;
  req.headers["Upload-Offset"] = std::to_string(offset);
  if (methodOverride)
    req.headers["X-HTTP-Method-Override"] = "PATCH";
  req.fileBody = window;
  req.onBytesSent = onBytesSent;

  auto res = m_transport.execute(req);
  if (res.status != 200 && res.status != 204)
    throw errorForStatus(res.status, "TUS patch");

  auto newOffset = parseOffset(res);
  if (!newOffset)
    throw TransferError(ErrorKind::ProtocolViolation,
                        "PATCH response without a valid Upload-Offset");
  return *newOffset;
}

bool TusProtocol::deleteSession(const std::string &uploadUrl) {
  HttpRequest req;
  req.method = "DELETE";
  req.url = uploadUrl;
  req.headers["Tus-Resumable"] = kVersion;
  try {
    auto res = m_transport.execute(req);
    bool ok = res.status == 204 || res.status == 200 || res.status == 404;
    if (!ok)
      std::cerr << "[TUS] DELETE " << uploadUrl << " returned " << res.status
                << std::endl;
    return ok;
  } catch (const TransferError &e) {
    std::cerr << "[TUS] DELETE " << uploadUrl << " failed: " << e.what()
              << std::endl;
    return false;
  }
}

} // namespace davsync
