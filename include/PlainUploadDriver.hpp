#pragma once

#include "HttpTransport.hpp"
#include "UploadJob.hpp"
#include <optional>
#include <string>

namespace davsync {

// One PUT of the whole file onto the target URL.
class PlainUploadDriver {
public:
  explicit PlainUploadDriver(HttpTransport &transport);

  std::optional<std::string> upload(const UploadJob &job);

private:
  HttpTransport &m_transport;
};

} // namespace davsync
