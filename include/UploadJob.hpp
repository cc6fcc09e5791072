#pragma once

#include "CancellationToken.hpp"
#include "ProgressChannel.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace davsync {

// Everything a driver needs for one upload, with URLs already resolved.
struct UploadJob {
  std::int64_t transferId = 0;
  std::string localPath;
  std::string remotePath;
  std::string remoteUrl;     // absolute URL of the target resource
  std::string collectionUrl; // absolute URL of its parent collection
  std::string fileName;
  std::string mimeType;
  std::uint64_t length = 0;
  std::int64_t lastModified = 0; // seconds
  std::optional<std::string> requiredEtag;
  std::optional<TusSession> existingSession;
  CancellationToken *cancel = nullptr;
  PercentTracker *progress = nullptr;
};

enum class UploadStrategy { Tus, Chunked, SinglePut };

const char *toString(UploadStrategy strategy);

struct UploadOutcome {
  UploadStrategy strategy = UploadStrategy::SinglePut;
  std::optional<std::string> etag;
  bool fellBack = false;
};

} // namespace davsync
