#pragma once

#include "Config.hpp"
#include "HttpTransport.hpp"
#include <memory>

namespace davsync {

/**
 * HttplibTransport is the production HttpTransport.
 * Uses cpp-httplib for networking; one client per origin and thread.
 */
class HttplibTransport : public HttpTransport {
public:
  explicit HttplibTransport(const HttpSettings &settings);
  ~HttplibTransport() override;

  HttpResponse execute(const HttpRequest &request) override;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace davsync
