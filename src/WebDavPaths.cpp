#include "WebDavPaths.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace davsync {
namespace webdav {

std::string urlEncode(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (auto i = value.begin(), n = value.end(); i != n; ++i) {
    std::string::value_type c = (*i);
    // Keep alphanumeric and other safe characters
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      escaped << c;
      continue;
    }
    // Any other characters are percent-encoded
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

std::vector<std::string> splitPath(const std::string &p) {
  std::vector<std::string> segments;
  std::stringstream ss(p);
  std::string item;
  while (std::getline(ss, item, '/')) {
    if (!item.empty())
      segments.push_back(item);
  }
  return segments;
}

std::string encodePath(const std::string &path) {
  std::string out;
  for (const auto &segment : splitPath(path))
    out += "/" + urlEncode(segment);
  if (out.empty() || (!path.empty() && path.back() == '/'))
    out += "/";
  return out;
}

std::string parentPath(const std::string &remotePath) {
  auto segments = splitPath(remotePath);
  if (segments.size() <= 1)
    return "/";
  std::string parent;
  for (size_t i = 0; i + 1 < segments.size(); ++i)
    parent += "/" + segments[i];
  return parent + "/";
}

std::string baseName(const std::string &remotePath) {
  auto segments = splitPath(remotePath);
  return segments.empty() ? std::string() : segments.back();
}

std::string joinUrl(const std::string &base, const std::string &path) {
  std::string left = base;
  while (!left.empty() && left.back() == '/')
    left.pop_back();
  if (path.empty())
    return left;
  if (path.front() == '/')
    return left + path;
  return left + "/" + path;
}

UrlParts splitUrl(const std::string &url) {
  UrlParts parts;
  auto scheme = url.find("://");
  if (scheme == std::string::npos) {
    parts.path = url.empty() ? "/" : url;
    return parts;
  }
  auto pathStart = url.find('/', scheme + 3);
  if (pathStart == std::string::npos) {
    parts.origin = url;
    parts.path = "/";
  } else {
    parts.origin = url.substr(0, pathStart);
    parts.path = url.substr(pathStart);
  }
  return parts;
}

std::string resolveLocation(const std::string &requestUrl,
                            const std::string &location) {
  if (location.empty())
    return "";
  if (location.find("://") != std::string::npos)
    return location;

  auto parts = splitUrl(requestUrl);
  if (location.front() == '/')
    return parts.origin + location;

  // Relative reference: replace the last segment of the request path.
  std::string path = parts.path;
  auto query = path.find('?');
  if (query != std::string::npos)
    path = path.substr(0, query);
  auto slash = path.rfind('/');
  std::string dir = slash == std::string::npos ? "/" : path.substr(0, slash + 1);
  return parts.origin + dir + location;
}

std::string stripQuotes(std::string etag) {
  etag.erase(std::remove(etag.begin(), etag.end(), '"'), etag.end());
  return etag;
}

} // namespace webdav
} // namespace davsync
