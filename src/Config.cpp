#include "Config.hpp"
#include "WebDavPaths.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace davsync {

std::string ClientConfig::webdavUrl(
    const std::optional<std::string> &spaceId) const {
  if (spaceId && !spaceId->empty())
    return webdav::joinUrl(serverUrl,
                           "/dav/spaces/" + webdav::urlEncode(*spaceId));
  return webdav::joinUrl(serverUrl, webdavPath);
}

std::string ClientConfig::uploadsUrl() const {
  if (!uploadsPath.empty())
    return webdav::joinUrl(serverUrl, uploadsPath);
  return webdav::joinUrl(serverUrl,
                         "/remote.php/dav/uploads/" + webdav::urlEncode(account));
}

std::string ClientConfig::stagingDirectory() const {
  if (!stagingDir.empty())
    return stagingDir;
  return (std::filesystem::path(localRoot) / ".davsync-staging").string();
}

ConflictPolicy conflictPolicyFromString(const std::string &value) {
  if (value == "report")
    return ConflictPolicy::Report;
  if (value == "keep-both")
    return ConflictPolicy::KeepBoth;
  if (value == "prefer-local")
    return ConflictPolicy::PreferLocal;
  throw std::runtime_error("Unknown conflict policy: " + value);
}

void applyConfigJson(ClientConfig &config, const std::string &jsonText) {
  json data;
  try {
    data = json::parse(jsonText);
  } catch (const json::parse_error &e) {
    throw std::runtime_error(std::string("Invalid configuration: ") +
                             e.what());
  }
  if (!data.is_object())
    throw std::runtime_error("Invalid configuration: expected an object");

  try {
    config.serverUrl = data.value("server_url", config.serverUrl);
    config.webdavPath = data.value("webdav_path", config.webdavPath);
    config.uploadsPath = data.value("uploads_path", config.uploadsPath);
    config.account = data.value("account", config.account);
    config.databasePath = data.value("database", config.databasePath);
    config.localRoot = data.value("local_root", config.localRoot);
    config.stagingDir = data.value("staging_dir", config.stagingDir);
    config.workers = data.value("workers", config.workers);
    config.maxAttempts = data.value("max_attempts", config.maxAttempts);
    config.retryBaseDelayMs =
        data.value("retry_base_delay_ms", config.retryBaseDelayMs);
    config.retryMaxDelayMs =
        data.value("retry_max_delay_ms", config.retryMaxDelayMs);
    config.chunkingThreshold =
        data.value("chunking_threshold", config.chunkingThreshold);
    config.supportsChunking =
        data.value("supports_chunking", config.supportsChunking);
    config.probeTus = data.value("probe_tus", config.probeTus);

    config.tus.chunkSize = data.value("tus_chunk_size", config.tus.chunkSize);
    config.tus.maxRetries = data.value("tus_max_retries", config.tus.maxRetries);
    config.tus.baseRetryDelayMs =
        data.value("tus_base_delay_ms", config.tus.baseRetryDelayMs);
    config.tus.maxRetryDelayMs =
        data.value("tus_max_delay_ms", config.tus.maxRetryDelayMs);
    config.tus.serverMaxChunkSize =
        data.value("tus_server_max_chunk_size", config.tus.serverMaxChunkSize);
    config.tus.httpMethodOverride =
        data.value("tus_http_method_override", config.tus.httpMethodOverride);

    if (data.contains("username"))
      config.http.username = data["username"].get<std::string>();
    if (data.contains("password"))
      config.http.password = data["password"].get<std::string>();
    if (data.contains("bearer_token"))
      config.http.bearerToken = data["bearer_token"].get<std::string>();
    config.http.connectionTimeoutSeconds =
        data.value("connection_timeout_s", config.http.connectionTimeoutSeconds);
    config.http.readTimeoutSeconds =
        data.value("read_timeout_s", config.http.readTimeoutSeconds);
    config.http.writeTimeoutSeconds =
        data.value("write_timeout_s", config.http.writeTimeoutSeconds);

    if (data.contains("conflict_policy"))
      config.conflictPolicy =
          conflictPolicyFromString(data["conflict_policy"].get<std::string>());
  } catch (const json::exception &e) {
    throw std::runtime_error(std::string("Invalid configuration value: ") +
                             e.what());
  }

  if (config.workers < 1)
    throw std::runtime_error("workers must be at least 1");
  if (config.maxAttempts < 1)
    throw std::runtime_error("max_attempts must be at least 1");
  if (config.tus.chunkSize == 0)
    throw std::runtime_error("tus_chunk_size must be positive");
}

ClientConfig loadConfigFile(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw std::runtime_error("Cannot open configuration file: " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();

  ClientConfig config;
  applyConfigJson(config, buffer.str());
  return config;
}

CommandLine parseArguments(int argc, char *argv[]) {
  CommandLine cmd;
  int index = 1;

  std::optional<std::string> server, account, database;
  std::optional<int> workers;

  auto requireValue = [&](const std::string &flag) -> std::string {
    if (index >= argc)
      throw std::runtime_error(flag + " requires a value");
    return argv[index++];
  };

  while (index < argc) {
    const std::string arg = argv[index];
    if (arg.rfind("--", 0) != 0)
      break;
    ++index;
    if (arg == "--config") {
      cmd.configPath = requireValue(arg);
    } else if (arg == "--server") {
      server = requireValue(arg);
    } else if (arg == "--account") {
      account = requireValue(arg);
    } else if (arg == "--db") {
      database = requireValue(arg);
    } else if (arg == "--workers") {
      workers = std::stoi(requireValue(arg));
    } else {
      throw std::runtime_error("Unknown argument: " + arg);
    }
  }

  if (index >= argc)
    throw std::runtime_error(
        "Usage: davsync --config <file> [--server <url>] [--account <name>] "
        "[--db <path>] [--workers <n>] <command> [args...]");
  if (cmd.configPath.empty())
    throw std::runtime_error("--config is required");

  cmd.config = loadConfigFile(cmd.configPath);
  if (server)
    cmd.config.serverUrl = *server;
  if (account)
    cmd.config.account = *account;
  if (database)
    cmd.config.databasePath = *database;
  if (workers) {
    if (*workers < 1)
      throw std::runtime_error("--workers must be at least 1");
    cmd.config.workers = *workers;
  }
  if (cmd.config.serverUrl.empty())
    throw std::runtime_error("server_url is not configured");

  cmd.command = argv[index++];
  for (; index < argc; ++index)
    cmd.args.emplace_back(argv[index]);
  return cmd;
}

} // namespace davsync
