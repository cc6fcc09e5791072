#include "DownloadDriver.hpp"
#include "TestSupport.hpp"
#include <filesystem>
#include <gtest/gtest.h>

using namespace davsync;
using davsync::testing::FakeDavServer;
using davsync::testing::FakeHttpTransport;
using davsync::testing::TempDir;

TEST(DownloadDriverTest, WritesPartFileThenRenames) {
  TempDir dir;
  FakeDavServer server;
  server.files["/remote.php/webdav/a.txt"] = "remote content";
  FakeHttpTransport transport(server.handler());

  DownloadJob job;
  job.remoteUrl = server.origin + "/remote.php/webdav/a.txt";
  job.localPath = dir.file("sub/a.txt");

  DownloadDriver driver(transport);
  auto etag = driver.download(job);

  ASSERT_TRUE(etag.has_value());
  EXPECT_EQ(*etag, "etag-1");
  EXPECT_EQ(davsync::testing::readFile(job.localPath), "remote content");
  EXPECT_FALSE(std::filesystem::exists(DownloadDriver::partPath(job.localPath)));
}

TEST(DownloadDriverTest, MissingRemoteLeavesTargetUntouched) {
  TempDir dir;
  FakeDavServer server;
  FakeHttpTransport transport(server.handler());
  DownloadJob job;
  job.remoteUrl = server.origin + "/remote.php/webdav/missing.txt";
  job.localPath = dir.write("missing.txt", "local");

  DownloadDriver driver(transport);
  try {
    driver.download(job);
    FAIL() << "expected failure";
  } catch (const TransferError &e) {
    EXPECT_EQ(e.httpStatus(), 404);
  }
  EXPECT_EQ(davsync::testing::readFile(job.localPath), "local");
  EXPECT_FALSE(std::filesystem::exists(DownloadDriver::partPath(job.localPath)));
}
