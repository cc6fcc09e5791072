#pragma once

#include <string>
#include <vector>

namespace davsync {
namespace webdav {

std::string urlEncode(const std::string &value);

// Percent-encodes every segment of a slash separated path.
std::string encodePath(const std::string &path);

std::string parentPath(const std::string &remotePath);
std::string baseName(const std::string &remotePath);
std::vector<std::string> splitPath(const std::string &p);

std::string joinUrl(const std::string &base, const std::string &path);

// Resolves a Location header against the URL of the request that returned
// it. Returns an empty string when the location is empty.
std::string resolveLocation(const std::string &requestUrl,
                            const std::string &location);

struct UrlParts {
  std::string origin; // scheme://host[:port]
  std::string path;   // starts with '/', includes the query
};
UrlParts splitUrl(const std::string &url);

std::string stripQuotes(std::string etag);

} // namespace webdav
} // namespace davsync
