#include "PlainUploadDriver.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace davsync;
using davsync::testing::FakeDavServer;
using davsync::testing::FakeHttpTransport;
using davsync::testing::TempDir;

namespace {

UploadJob jobFor(const FakeDavServer &server, const std::string &path,
                 std::uint64_t length) {
  UploadJob job;
  job.transferId = 1;
  job.localPath = path;
  job.remotePath = "/notes.txt";
  job.remoteUrl = server.origin + "/remote.php/webdav/notes.txt";
  job.mimeType = "text/plain";
  job.length = length;
  job.lastModified = 1700000000;
  return job;
}

} // namespace

TEST(PlainUploadDriverTest, PutsWholeFileWithMetadataHeaders) {
  TempDir dir;
  FakeDavServer server;
  FakeHttpTransport transport(server.handler());
  auto job = jobFor(server, dir.write("notes.txt", "hello"), 5);

  PlainUploadDriver driver(transport);
  auto etag = driver.upload(job);

  ASSERT_TRUE(etag.has_value());
  EXPECT_EQ(*etag, "etag-1");
  auto put = transport.requests().back();
  EXPECT_EQ(put.body, "hello");
  EXPECT_EQ(put.headers.at("OC-Total-Length"), "5");
  EXPECT_EQ(put.headers.at("X-OC-Mtime"), "1700000000");
  EXPECT_EQ(put.headers.count("If-Match"), 0u);
}

TEST(PlainUploadDriverTest, ForceOverwriteSendsIfMatch) {
  TempDir dir;
  FakeDavServer server;
  FakeHttpTransport transport(server.handler());
  auto job = jobFor(server, dir.write("notes.txt", "hello"), 5);
  job.requiredEtag = "stale-etag";

  PlainUploadDriver driver(transport);
  try {
    driver.upload(job);
    FAIL() << "expected precondition failure";
  } catch (const TransferError &e) {
    EXPECT_EQ(e.httpStatus(), 412);
    EXPECT_EQ(resultFromError(e), TransferResult::ConflictError);
  }

  job.requiredEtag = "etag-1";
  EXPECT_NO_THROW(driver.upload(job));
  EXPECT_EQ(transport.requests().back().headers.at("If-Match"), "\"etag-1\"");
}
