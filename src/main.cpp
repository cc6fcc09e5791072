#include "ChunkReader.hpp"
#include "Config.hpp"
#include "FileSynchronizer.hpp"
#include "HttplibTransport.hpp"
#include "SqliteTransferStore.hpp"
#include "TransferScheduler.hpp"
#include "TransferWorker.hpp"
#include "TusProtocol.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool> running{true};

static void signalHandler(int sig) {
  (void)sig;
  running.store(false);
}

namespace fs = std::filesystem;

namespace {

std::int64_t nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// Returns the value following `flag` in args, or an empty string.
std::string optionValue(const std::vector<std::string> &args,
                        const std::string &flag) {
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag)
      return args[i + 1];
  }
  return "";
}

bool hasFlag(const std::vector<std::string> &args, const std::string &flag) {
  for (const auto &a : args) {
    if (a == flag)
      return true;
  }
  return false;
}

void requireArgs(const davsync::CommandLine &cmd, size_t count,
                 const std::string &usage) {
  if (cmd.args.size() < count)
    throw std::runtime_error("Usage: davsync " + usage);
}

void printRecord(const davsync::TransferRecord &r) {
  std::cout << r.id << "\t" << davsync::toString(r.status) << "\t"
            << (r.direction == davsync::TransferDirection::Upload ? "UP"
                                                                  : "DOWN")
            << "\t" << r.localPath << "\t" << r.remotePath;
  if (r.lastResult)
    std::cout << "\t" << davsync::toString(*r.lastResult);
  if (r.tusSession)
    std::cout << "\ttus " << r.tusSession->offset << "/"
              << r.tusSession->length;
  std::cout << std::endl;
}

// Processes the scheduler until it is idle or a signal arrives.
void drain(davsync::TransferScheduler &scheduler) {
  scheduler.start();
  while (running.load() && scheduler.activeCount() > 0)
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  if (!running.load())
    std::cout << "[Main] Shutdown signal received, stopping transfers"
              << std::endl;
  scheduler.stop();
}

} // namespace

int main(int argc, char *argv[]) {
  // register shutdown signals
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  try {
    davsync::CommandLine cmd = davsync::parseArguments(argc, argv);
    const davsync::ClientConfig &config = cmd.config;

    // 1. Initialize Components
    davsync::SqliteTransferStore store(config.databasePath);
    if (!store.open()) {
      std::cerr << "[Main] Failed to open database." << std::endl;
      return 1;
    }
    store.initializeSchema();

    davsync::HttplibTransport transport(config.http);
    davsync::ProgressChannel progress;
    progress.subscribe([](const davsync::ProgressEvent &e) {
      std::cout << "[Progress] Transfer " << e.transferId << ": " << e.percent
                << "% (" << e.bytesDone << "/" << e.bytesTotal << ")"
                << std::endl;
    });
    davsync::ConsoleNotifier notifier;
    davsync::TransferWorker worker(transport, store, config, notifier,
                                   &progress);
    davsync::TransferScheduler scheduler(
        config.workers, std::chrono::milliseconds(config.retryBaseDelayMs),
        std::chrono::milliseconds(config.retryMaxDelayMs),
        [&worker](std::int64_t id, davsync::CancellationToken &cancel,
                  int attempt) { return worker.run(id, cancel, attempt); });

    // 2. Dispatch command
    if (cmd.command == "upload") {
      requireArgs(cmd, 2,
                  "upload <local> <remote> [--move] [--space <id>] "
                  "[--if-match <etag>] [--mime <type>] [--stage]");
      davsync::TransferRecord record;
      record.accountName = config.account;
      record.localPath = fs::absolute(cmd.args[0]).string();
      record.remotePath = cmd.args[1];
      auto space = optionValue(cmd.args, "--space");
      if (!space.empty())
        record.spaceId = space;
      auto mime = optionValue(cmd.args, "--mime");
      record.mimeType = mime.empty() ? "application/octet-stream" : mime;
      std::error_code ec;
      record.fileSize = fs::file_size(record.localPath, ec);
      if (ec)
        throw std::runtime_error("Cannot read " + record.localPath);
      record.behavior = hasFlag(cmd.args, "--move")
                            ? davsync::UploadBehavior::Move
                            : davsync::UploadBehavior::Copy;
      auto etag = optionValue(cmd.args, "--if-match");
      if (!etag.empty()) {
        record.forceOverwrite = true;
        record.requiredEtag = etag;
      }
      record.createdAt = nowSeconds();
      if (hasFlag(cmd.args, "--stage"))
        davsync::stageUploadSource(record, config.stagingDirectory());
      auto id = store.insertTransfer(record);
      if (!id)
        throw std::runtime_error("Could not create transfer record");
      std::cout << "[Main] Transfer " << *id << " enqueued." << std::endl;
      scheduler.enqueue(*id);
      drain(scheduler);
      auto done = store.getTransferById(*id);
      return done && done->status == davsync::TransferStatus::Succeeded ? 0 : 1;
    }

    if (cmd.command == "download") {
      requireArgs(cmd, 2, "download <remote> <local> [--space <id>]");
      davsync::TransferRecord record;
      record.accountName = config.account;
      record.remotePath = cmd.args[0];
      record.localPath = fs::absolute(cmd.args[1]).string();
      record.direction = davsync::TransferDirection::Download;
      auto space = optionValue(cmd.args, "--space");
      if (!space.empty())
        record.spaceId = space;
      record.createdAt = nowSeconds();
      auto id = store.insertTransfer(record);
      if (!id)
        throw std::runtime_error("Could not create transfer record");
      scheduler.enqueue(*id);
      drain(scheduler);
      auto done = store.getTransferById(*id);
      return done && done->status == davsync::TransferStatus::Succeeded ? 0 : 1;
    }

    if (cmd.command == "sync") {
      requireArgs(cmd, 2,
                  "sync <local> <remote> --last-sync <seconds> --etag <etag> "
                  "[--space <id>]");
      davsync::FileSyncState state;
      state.accountName = config.account;
      state.remotePath = cmd.args[1];
      state.mimeType = "application/octet-stream";
      auto space = optionValue(cmd.args, "--space");
      if (!space.empty())
        state.spaceId = space;
      std::string local = fs::absolute(cmd.args[0]).string();
      state.storagePath = local;
      state.localModificationTime =
          davsync::ChunkReader::lastModifiedSeconds(local) * 1000;
      auto lastSync = optionValue(cmd.args, "--last-sync");
      state.lastSyncTime = lastSync.empty() ? 0 : std::stoll(lastSync) * 1000;
      state.etag = optionValue(cmd.args, "--etag");

      davsync::FileSynchronizer synchronizer(
          transport, store, config,
          [&scheduler](std::int64_t id) { scheduler.enqueue(id); });
      auto decision = synchronizer.synchronize(state);
      std::cout << "[Main] " << davsync::toString(decision.outcome);
      if (decision.workId)
        std::cout << " (transfer " << *decision.workId << ")";
      if (decision.remoteEtag)
        std::cout << " remote etag " << *decision.remoteEtag;
      if (decision.conflictCopyPath)
        std::cout << " local copy kept as " << *decision.conflictCopyPath;
      std::cout << std::endl;
      drain(scheduler);
      return 0;
    }

    if (cmd.command == "list") {
      auto status = optionValue(cmd.args, "--status");
      std::vector<davsync::TransferRecord> records;
      if (status.empty()) {
        records = store.getTransfersByAccount(config.account);
      } else {
        auto parsed = davsync::transferStatusFromString(status);
        if (!parsed)
          throw std::runtime_error("Unknown status: " + status);
        records = store.getTransfersByStatus(*parsed);
      }
      for (const auto &r : records)
        printRecord(r);
      return 0;
    }

    if (cmd.command == "retry") {
      requireArgs(cmd, 1, "retry <id>");
      auto id = std::stoll(cmd.args[0]);
      if (!store.retryTransfer(id)) {
        std::cerr << "[Main] Transfer " << id << " is not FAILED." << std::endl;
        return 1;
      }
      scheduler.enqueue(id);
      drain(scheduler);
      return 0;
    }

    if (cmd.command == "cancel") {
      requireArgs(cmd, 1, "cancel <id>");
      auto id = std::stoll(cmd.args[0]);
      auto record = store.getTransferById(id);
      if (!record) {
        std::cerr << "[Main] Transfer " << id << " not found." << std::endl;
        return 1;
      }
      if (record->tusSession) {
        davsync::TusProtocol protocol(transport);
        protocol.deleteSession(record->tusSession->uploadUrl);
      }
      if (!store.deleteTransfer(id))
        return 1;
      std::cout << "[Main] Transfer " << id << " cancelled." << std::endl;
      return 0;
    }

    if (cmd.command == "run") {
      // Resume anything an earlier process left behind.
      for (auto status : {davsync::TransferStatus::InProgress,
                          davsync::TransferStatus::Enqueued}) {
        for (const auto &r : store.getTransfersByStatus(status)) {
          if (r.accountName == config.account)
            scheduler.enqueue(r.id);
        }
      }
      std::cout << "[Main] " << scheduler.activeCount()
                << " transfers pending." << std::endl;
      drain(scheduler);
      std::cout << "[Main] Finished." << std::endl;
      return 0;
    }

    std::cerr << "[Main] Unknown command: " << cmd.command << std::endl;
    return 1;

  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }
}
