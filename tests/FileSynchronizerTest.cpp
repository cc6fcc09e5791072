#include "FileSynchronizer.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <vector>

using namespace davsync;
using davsync::testing::FakeDavServer;
using davsync::testing::FakeHttpTransport;
using davsync::testing::TempDir;

namespace {

class FileSynchronizerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config.serverUrl = server.origin;
    config.localRoot = dir.file("root");
    server.files["/remote.php/webdav/docs/report.pdf"] = "remote bytes";
    store = davsync::testing::makeMemoryStore();
  }

  FileSynchronizer synchronizer() {
    return FileSynchronizer(transport, *store, config,
                            [this](std::int64_t id) { enqueued.push_back(id); });
  }

  FileSyncState stateWithLocalCopy(std::int64_t localMod, std::string etag) {
    FileSyncState state;
    state.accountName = "alice";
    state.remotePath = "/docs/report.pdf";
    state.storagePath = dir.write("report.pdf", "local bytes");
    state.localModificationTime = localMod;
    state.lastSyncTime = 1000;
    state.etag = std::move(etag);
    state.mimeType = "application/pdf";
    return state;
  }

  TempDir dir;
  FakeDavServer server;
  FakeHttpTransport transport{server.handler()};
  ClientConfig config;
  std::unique_ptr<SqliteTransferStore> store;
  std::vector<std::int64_t> enqueued;
};

} // namespace

TEST_F(FileSynchronizerTest, FetchesRemoteStateWithHead) {
  auto sync = synchronizer();
  auto state = stateWithLocalCopy(1000, "etag-1");
  auto remote = sync.fetchRemoteState(state);
  EXPECT_TRUE(remote.exists);
  EXPECT_EQ(remote.etag, "etag-1");

  state.remotePath = "/docs/missing.pdf";
  EXPECT_FALSE(sync.fetchRemoteState(state).exists);
}

TEST_F(FileSynchronizerTest, UnchangedFileNeedsNothing) {
  auto sync = synchronizer();
  auto decision = sync.synchronize(stateWithLocalCopy(1000, "\"etag-1\""));
  EXPECT_EQ(decision.outcome, SyncOutcome::AlreadySynchronized);
  EXPECT_FALSE(decision.workId.has_value());
  EXPECT_TRUE(enqueued.empty());
}

TEST_F(FileSynchronizerTest, RemoteChangeEnqueuesDownload) {
  auto sync = synchronizer();
  auto state = stateWithLocalCopy(1000, "etag-0");
  auto decision = sync.synchronize(state);

  ASSERT_EQ(decision.outcome, SyncOutcome::DownloadEnqueued);
  ASSERT_EQ(enqueued.size(), 1u);
  EXPECT_EQ(decision.workId.value_or(""), std::to_string(enqueued[0]));
  auto record = store->getTransferById(enqueued[0]);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->direction, TransferDirection::Download);
  EXPECT_EQ(record->localPath, *state.storagePath);
  EXPECT_EQ(record->status, TransferStatus::Enqueued);
}

TEST_F(FileSynchronizerTest, LocalChangeEnqueuesUpload) {
  auto sync = synchronizer();
  auto state = stateWithLocalCopy(2000, "etag-1");
  auto decision = sync.synchronize(state);

  ASSERT_EQ(decision.outcome, SyncOutcome::UploadEnqueued);
  auto record = store->getTransferById(enqueued.at(0));
  EXPECT_EQ(record->direction, TransferDirection::Upload);
  EXPECT_EQ(record->fileSize, 11u);
  EXPECT_FALSE(record->forceOverwrite);
  EXPECT_EQ(record->lastModified, 2);
}

TEST_F(FileSynchronizerTest, MissingLocalCopyDownloadsUnderLocalRoot) {
  auto sync = synchronizer();
  FileSyncState state;
  state.accountName = "alice";
  state.remotePath = "/docs/report.pdf";
  auto decision = sync.synchronize(state);

  ASSERT_EQ(decision.outcome, SyncOutcome::DownloadEnqueued);
  auto record = store->getTransferById(enqueued.at(0));
  EXPECT_EQ(record->localPath,
            (std::filesystem::path(config.localRoot) / "docs/report.pdf")
                .string());
}

TEST_F(FileSynchronizerTest, RemoteGoneIsReported) {
  auto sync = synchronizer();
  auto state = stateWithLocalCopy(2000, "etag-1");
  RemoteFileState gone;
  auto decision = sync.synchronize(state, gone);
  EXPECT_EQ(decision.outcome, SyncOutcome::FileNotFound);
  EXPECT_TRUE(enqueued.empty());
  EXPECT_EQ(transport.requests().size(), 0u);
}

TEST_F(FileSynchronizerTest, ReportPolicySurfacesConflict) {
  auto sync = synchronizer();
  auto decision = sync.synchronize(stateWithLocalCopy(2000, "etag-0"));
  EXPECT_EQ(decision.outcome, SyncOutcome::ConflictDetected);
  EXPECT_EQ(decision.remoteEtag.value_or(""), "etag-1");
  EXPECT_TRUE(enqueued.empty());
}

TEST_F(FileSynchronizerTest, KeepBothRenamesLocalAndDownloads) {
  config.conflictPolicy = ConflictPolicy::KeepBoth;
  auto sync = synchronizer();
  auto state = stateWithLocalCopy(2000, "etag-0");
  auto decision = sync.synchronize(state);

  ASSERT_EQ(decision.outcome, SyncOutcome::ConflictResolvedWithCopy);
  ASSERT_TRUE(decision.conflictCopyPath.has_value());
  EXPECT_FALSE(std::filesystem::exists(*state.storagePath));
  EXPECT_EQ(davsync::testing::readFile(*decision.conflictCopyPath),
            "local bytes");
  auto record = store->getTransferById(enqueued.at(0));
  EXPECT_EQ(record->direction, TransferDirection::Download);
  EXPECT_EQ(record->localPath, *state.storagePath);
}

TEST_F(FileSynchronizerTest, PreferLocalOverwritesMatchingEtag) {
  config.conflictPolicy = ConflictPolicy::PreferLocal;
  auto sync = synchronizer();
  auto decision = sync.synchronize(stateWithLocalCopy(2000, "etag-0"));

  ASSERT_EQ(decision.outcome, SyncOutcome::UploadEnqueued);
  auto record = store->getTransferById(enqueued.at(0));
  EXPECT_TRUE(record->forceOverwrite);
  EXPECT_EQ(record->requiredEtag.value_or(""), "etag-1");
}

TEST(ConflictedCopyPathTest, KeepsDirectoryAndExtension) {
  auto copy = FileSynchronizer::conflictedCopyPath("/data/docs/report.pdf",
                                                   1700000000);
  const std::string prefix = "/data/docs/report_conflicted_copy_";
  ASSERT_EQ(copy.rfind(prefix, 0), 0u);
  ASSERT_GE(copy.size(), prefix.size() + 4);
  EXPECT_EQ(copy.substr(copy.size() - 4), ".pdf");
  // yyyy-MM-dd_HHmmss
  auto stamp = copy.substr(prefix.size(), copy.size() - prefix.size() - 4);
  ASSERT_EQ(stamp.size(), 17u);
  EXPECT_EQ(stamp[4], '-');
  EXPECT_EQ(stamp[7], '-');
  EXPECT_EQ(stamp[10], '_');
}

TEST(ConflictedCopyPathTest, NoExtension) {
  auto copy = FileSynchronizer::conflictedCopyPath("/data/Makefile", 0);
  EXPECT_EQ(copy.rfind("/data/Makefile_conflicted_copy_", 0), 0u);
  EXPECT_EQ(copy.find('.'), std::string::npos);
}
