#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace davsync {

enum class ConflictPolicy { Report, KeepBoth, PreferLocal };

struct HttpSettings {
  std::optional<std::string> username;
  std::optional<std::string> password;
  std::optional<std::string> bearerToken;
  int connectionTimeoutSeconds = 30;
  int readTimeoutSeconds = 30;
  int writeTimeoutSeconds = 30;
};

struct TusOptions {
  std::uint64_t chunkSize = 10 * 1024 * 1024;
  int maxRetries = 5;
  std::int64_t baseRetryDelayMs = 250;
  std::int64_t maxRetryDelayMs = 2000;
  // Server capabilities not advertised by the OPTIONS probe.
  std::uint64_t serverMaxChunkSize = 0;
  bool httpMethodOverride = false;
};

struct ClientConfig {
  std::string serverUrl;
  std::string webdavPath = "/remote.php/webdav";
  std::string uploadsPath; // defaults to /remote.php/dav/uploads/<account>
  std::string account;
  HttpSettings http;
  std::string databasePath = "davsync.db";
  // Download target for files that have no local copy yet.
  std::string localRoot = ".";
  // Staged upload copies; empty means <localRoot>/.davsync-staging.
  std::string stagingDir;
  int workers = 2;
  int maxAttempts = 5;
  std::int64_t retryBaseDelayMs = 1000;
  std::int64_t retryMaxDelayMs = 60000;
  std::uint64_t chunkingThreshold = 10 * 1024 * 1024;
  TusOptions tus;
  bool supportsChunking = true;
  bool probeTus = true;
  ConflictPolicy conflictPolicy = ConflictPolicy::Report;

  std::string webdavUrl(const std::optional<std::string> &spaceId) const;
  std::string uploadsUrl() const;
  std::string stagingDirectory() const;
};

struct CommandLine {
  std::string configPath;
  std::string command;
  std::vector<std::string> args;
  ClientConfig config;
};

ClientConfig loadConfigFile(const std::string &path);
void applyConfigJson(ClientConfig &config, const std::string &jsonText);
ConflictPolicy conflictPolicyFromString(const std::string &value);

// Throws std::runtime_error on malformed arguments.
CommandLine parseArguments(int argc, char *argv[]);

} // namespace davsync
