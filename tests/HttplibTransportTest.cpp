#include "HttplibTransport.hpp"
#include "TestSupport.hpp"
#include "TransferError.hpp"
#include "httplib.h"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace davsync;
using davsync::testing::TempDir;

namespace {

// Accepts one connection, reads part of the request, then resets it.
class ResettingServer {
public:
  ResettingServer() {
    m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(m_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    ::listen(m_fd, 1);
    socklen_t len = sizeof(addr);
    ::getsockname(m_fd, reinterpret_cast<sockaddr *>(&addr), &len);
    m_port = ntohs(addr.sin_port);

    m_thread = std::thread([this] {
      int conn = ::accept(m_fd, nullptr, nullptr);
      if (conn < 0)
        return;
      char buf[4096];
      std::size_t got = 0;
      while (got < 64 * 1024) {
        auto n = ::recv(conn, buf, sizeof(buf), 0);
        if (n <= 0)
          break;
        got += static_cast<std::size_t>(n);
      }
      linger reset{1, 0};
      ::setsockopt(conn, SOL_SOCKET, SO_LINGER, &reset, sizeof(reset));
      ::close(conn);
    });
  }

  ~ResettingServer() {
    ::shutdown(m_fd, SHUT_RDWR);
    ::close(m_fd);
    if (m_thread.joinable())
      m_thread.join();
  }

  std::string url(const std::string &path) const {
    return "http://127.0.0.1:" + std::to_string(m_port) + path;
  }

private:
  int m_fd = -1;
  int m_port = 0;
  std::thread m_thread;
};

class LocalServer {
public:
  httplib::Server server;

  void start() {
    m_port = server.bind_to_any_port("127.0.0.1");
    m_thread = std::thread([this] { server.listen_after_bind(); });
    server.wait_until_ready();
  }

  ~LocalServer() {
    server.stop();
    if (m_thread.joinable())
      m_thread.join();
  }

  std::string url(const std::string &path) const {
    return "http://127.0.0.1:" + std::to_string(m_port) + path;
  }

private:
  int m_port = 0;
  std::thread m_thread;
};

ErrorKind failureKind(HttpTransport &transport, const HttpRequest &request) {
  try {
    transport.execute(request);
  } catch (const TransferError &e) {
    return e.kind();
  }
  ADD_FAILURE() << request.method << " " << request.url << " did not fail";
  return ErrorKind::ProtocolViolation;
}

} // namespace

TEST(HttplibTransportTest, StreamsFileWindowAsBody) {
  TempDir dir;
  auto path = dir.write("body.bin", "0123456789");
  std::string received;
  LocalServer local;
  local.server.Patch("/tus/1", [&](const httplib::Request &req,
                                   httplib::Response &res) {
    received = req.body;
    res.status = 204;
    res.set_header("Upload-Offset", "7");
  });
  local.start();

  HttplibTransport transport(HttpSettings{});
  HttpRequest patch;
  patch.method = "PATCH";
  patch.url = local.url("/tus/1");
  patch.fileBody = FileWindow{path, 2, 5};
  std::uint64_t sent = 0;
  patch.onBytesSent = [&](std::uint64_t n) { sent = n; };

  auto res = transport.execute(patch);
  EXPECT_EQ(res.status, 204);
  EXPECT_EQ(res.header("upload-offset").value_or(""), "7");
  EXPECT_EQ(received, "23456");
  EXPECT_EQ(sent, 5u);
}

TEST(HttplibTransportTest, ResetDuringBodyIsNetworkError) {
  TempDir dir;
  auto path = dir.write("big.bin", std::string(32 * 1024 * 1024, 'x'));
  ResettingServer server;

  HttplibTransport transport(HttpSettings{});
  HttpRequest patch;
  patch.method = "PATCH";
  patch.url = server.url("/tus/1");
  patch.fileBody = FileWindow{path, 0, 32 * 1024 * 1024};
  CancellationToken cancel;
  patch.cancel = &cancel;

  EXPECT_EQ(failureKind(transport, patch), ErrorKind::Network);
}

TEST(HttplibTransportTest, CancelledTokenIsCancelled) {
  TempDir dir;
  auto path = dir.write("body.bin", "0123456789");
  LocalServer local;
  local.server.Put("/f", [](const httplib::Request &, httplib::Response &res) {
    res.status = 201;
  });
  local.start();

  HttplibTransport transport(HttpSettings{});
  HttpRequest put;
  put.method = "PUT";
  put.url = local.url("/f");
  put.fileBody = FileWindow{path, 0, 10};
  CancellationToken cancel;
  cancel.cancel();
  put.cancel = &cancel;

  EXPECT_EQ(failureKind(transport, put), ErrorKind::Cancelled);
}

TEST(HttplibTransportTest, RefusedConnectionIsNetworkError) {
  HttpSettings settings;
  settings.connectionTimeoutSeconds = 2;
  HttplibTransport transport(settings);
  HttpRequest head;
  head.method = "HEAD";
  head.url = "http://127.0.0.1:1/remote.php/webdav/";
  EXPECT_EQ(failureKind(transport, head), ErrorKind::Network);
}
