#include "SqliteTransferStore.hpp"
#include <iostream>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;

namespace davsync {

namespace {

// Flat row mirror of TransferRecord; enums are stored as integers.
struct TransferRow {
  std::int64_t id = 0;
  std::string accountName;
  std::string localPath;
  std::string remotePath;
  std::optional<std::string> spaceId;
  std::string mimeType;
  std::int64_t fileSize = 0;
  int status = 0;
  std::optional<int> lastResult;
  int direction = 0;
  int behavior = 0;
  bool forceOverwrite = false;
  std::optional<std::string> requiredEtag;
  std::int64_t lastModified = 0;
  std::int64_t createdAt = 0;
  std::optional<std::int64_t> transferEndTimestamp;
  std::optional<std::string> sourcePath;
  std::optional<std::string> tusUploadUrl;
  std::optional<std::int64_t> tusUploadOffset;
  std::optional<std::int64_t> tusUploadLength;
  std::optional<std::string> tusUploadMetadata;
  std::optional<std::string> tusUploadChecksum;
  std::optional<std::string> tusResumableVersion;
  std::optional<std::int64_t> tusUploadExpires;
  std::optional<std::string> tusUploadConcat;
};

TransferRow toRow(const TransferRecord &r) {
  TransferRow row;
  row.id = r.id;
  row.accountName = r.accountName;
  row.localPath = r.localPath;
  row.remotePath = r.remotePath;
  row.spaceId = r.spaceId;
  row.mimeType = r.mimeType;
  row.fileSize = static_cast<std::int64_t>(r.fileSize);
  row.status = static_cast<int>(r.status);
  if (r.lastResult)
    row.lastResult = static_cast<int>(*r.lastResult);
  row.direction = static_cast<int>(r.direction);
  row.behavior = static_cast<int>(r.behavior);
  row.forceOverwrite = r.forceOverwrite;
  row.requiredEtag = r.requiredEtag;
  row.lastModified = r.lastModified;
  row.createdAt = r.createdAt;
  row.transferEndTimestamp = r.transferEndTimestamp;
  row.sourcePath = r.sourcePath;
  if (r.tusSession) {
    const auto &s = *r.tusSession;
    row.tusUploadUrl = s.uploadUrl;
    row.tusUploadOffset = static_cast<std::int64_t>(s.offset);
    row.tusUploadLength = static_cast<std::int64_t>(s.length);
    row.tusUploadMetadata = s.metadata;
    row.tusUploadChecksum = s.checksum;
    row.tusResumableVersion = s.resumableVersion;
    row.tusUploadExpires = s.expires;
    row.tusUploadConcat = s.concat;
  }
  return row;
}

TransferRecord fromRow(const TransferRow &row) {
  TransferRecord r;
  r.id = row.id;
  r.accountName = row.accountName;
  r.localPath = row.localPath;
  r.remotePath = row.remotePath;
  r.spaceId = row.spaceId;
  r.mimeType = row.mimeType;
  r.fileSize = static_cast<std::uint64_t>(row.fileSize);
  r.status = static_cast<TransferStatus>(row.status);
  if (row.lastResult)
    r.lastResult = static_cast<TransferResult>(*row.lastResult);
  r.direction = static_cast<TransferDirection>(row.direction);
  r.behavior = static_cast<UploadBehavior>(row.behavior);
  r.forceOverwrite = row.forceOverwrite;
  r.requiredEtag = row.requiredEtag;
  r.lastModified = row.lastModified;
  r.createdAt = row.createdAt;
  r.transferEndTimestamp = row.transferEndTimestamp;
  r.sourcePath = row.sourcePath;
  if (row.tusUploadUrl && !row.tusUploadUrl->empty()) {
    TusSession s;
    s.uploadUrl = *row.tusUploadUrl;
    s.offset = static_cast<std::uint64_t>(row.tusUploadOffset.value_or(0));
    s.length = static_cast<std::uint64_t>(row.tusUploadLength.value_or(0));
    s.metadata = row.tusUploadMetadata.value_or("");
    s.checksum = row.tusUploadChecksum.value_or("");
    s.resumableVersion = row.tusResumableVersion.value_or("");
    s.expires = row.tusUploadExpires;
    s.concat = row.tusUploadConcat;
    r.tusSession = s;
  }
  return r;
}

void clearSessionColumns(TransferRow &row) {
  row.tusUploadUrl.reset();
  row.tusUploadOffset.reset();
  row.tusUploadLength.reset();
  row.tusUploadMetadata.reset();
  row.tusUploadChecksum.reset();
  row.tusResumableVersion.reset();
  row.tusUploadExpires.reset();
  row.tusUploadConcat.reset();
}

// We define a helper function to create the storage.
// This helps us deduce the complex template type of the storage.
inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_table<TransferRow>(
          "Transfer",
          make_column("id", &TransferRow::id, primary_key().autoincrement()),
          make_column("accountName", &TransferRow::accountName),
          make_column("localPath", &TransferRow::localPath),
          make_column("remotePath", &TransferRow::remotePath),
          make_column("spaceId", &TransferRow::spaceId),
          make_column("mimeType", &TransferRow::mimeType),
          make_column("fileSize", &TransferRow::fileSize),
          make_column("status", &TransferRow::status),
          make_column("lastResult", &TransferRow::lastResult),
          make_column("direction", &TransferRow::direction),
          make_column("behavior", &TransferRow::behavior),
          make_column("forceOverwrite", &TransferRow::forceOverwrite),
          make_column("requiredEtag", &TransferRow::requiredEtag),
          make_column("lastModified", &TransferRow::lastModified),
          make_column("createdAt", &TransferRow::createdAt),
          make_column("transferEndTimestamp",
                      &TransferRow::transferEndTimestamp),
          make_column("sourcePath", &TransferRow::sourcePath),
          make_column("tusUploadUrl", &TransferRow::tusUploadUrl),
          make_column("tusUploadOffset", &TransferRow::tusUploadOffset),
          make_column("tusUploadLength", &TransferRow::tusUploadLength),
          make_column("tusUploadMetadata", &TransferRow::tusUploadMetadata),
          make_column("tusUploadChecksum", &TransferRow::tusUploadChecksum),
          make_column("tusResumableVersion",
                      &TransferRow::tusResumableVersion),
          make_column("tusUploadExpires", &TransferRow::tusUploadExpires),
          make_column("tusUploadConcat", &TransferRow::tusUploadConcat)));
}

// Typedef for easier access within the Impl
using Storage = decltype(create_storage_impl(""));

} // namespace

struct SqliteTransferStore::Impl {
  Storage storage;
  Impl(const std::string &path) : storage(create_storage_impl(path)) {
    storage.open_forever();
  }

  template <typename Fn> bool modify(std::int64_t id, Fn &&fn) {
    return storage.transaction([&] {
      auto row = storage.get_pointer<TransferRow>(id);
      if (!row)
        return false;
      if (!fn(*row))
        return false;
      storage.update(*row);
      return true;
    });
  }
};

SqliteTransferStore::SqliteTransferStore(const std::string &dbPath)
    : m_dbPath(dbPath), m_impl(std::make_unique<Impl>(dbPath)) {}

SqliteTransferStore::~SqliteTransferStore() = default;

bool SqliteTransferStore::open() {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    // Reads the header, so it also works before the schema exists.
    m_impl->storage.pragma.user_version();
    std::cout << "[DB] Database connection verified: " << m_dbPath << std::endl;
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] Cannot open " << m_dbPath << ": " << e.what()
              << std::endl;
    return false;
  }
}

void SqliteTransferStore::initializeSchema() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_impl->storage.sync_schema();
  std::cout << "[DB] Schema synchronized." << std::endl;
}

std::optional<std::int64_t>
SqliteTransferStore::insertTransfer(const TransferRecord &record) {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    auto row = toRow(record);
    // Fresh records never start with a session.
    clearSessionColumns(row);
    return static_cast<std::int64_t>(m_impl->storage.insert(row));
  } catch (const std::exception &e) {
    std::cerr << "[DB] insertTransfer Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

std::optional<TransferRecord>
SqliteTransferStore::getTransferById(std::int64_t id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    auto row = m_impl->storage.get_optional<TransferRow>(id);
    if (!row)
      return std::nullopt;
    return fromRow(*row);
  } catch (const std::exception &e) {
    std::cerr << "[DB] getTransferById Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

std::vector<TransferRecord>
SqliteTransferStore::getTransfersByAccount(const std::string &accountName) {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<TransferRecord> out;
  try {
    auto rows = m_impl->storage.get_all<TransferRow>(
        where(c(&TransferRow::accountName) == accountName),
        order_by(&TransferRow::id));
    for (const auto &row : rows)
      out.push_back(fromRow(row));
  } catch (const std::exception &e) {
    std::cerr << "[DB] getTransfersByAccount Error: " << e.what() << std::endl;
  }
  return out;
}

std::vector<TransferRecord>
SqliteTransferStore::getTransfersByStatus(TransferStatus status) {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<TransferRecord> out;
  try {
    auto rows = m_impl->storage.get_all<TransferRow>(
        where(c(&TransferRow::status) == static_cast<int>(status)),
        order_by(&TransferRow::id));
    for (const auto &row : rows)
      out.push_back(fromRow(row));
  } catch (const std::exception &e) {
    std::cerr << "[DB] getTransfersByStatus Error: " << e.what() << std::endl;
  }
  return out;
}

bool SqliteTransferStore::updateTransferStatus(std::int64_t id,
                                               TransferStatus status) {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    return m_impl->modify(id, [status](TransferRow &row) {
      row.status = static_cast<int>(status);
      return true;
    });
  } catch (const std::exception &e) {
    std::cerr << "[DB] updateTransferStatus Error: " << e.what() << std::endl;
    return false;
  }
}

bool SqliteTransferStore::updateTusState(std::int64_t id,
                                         const TusSession &session) {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    return m_impl->modify(id, [&session](TransferRow &row) {
      row.tusUploadUrl = session.uploadUrl;
      row.tusUploadOffset = static_cast<std::int64_t>(session.offset);
      row.tusUploadLength = static_cast<std::int64_t>(session.length);
      row.tusUploadMetadata = session.metadata;
      row.tusUploadChecksum = session.checksum;
      row.tusResumableVersion = session.resumableVersion;
      row.tusUploadExpires = session.expires;
      row.tusUploadConcat = session.concat;
      return true;
    });
  } catch (const std::exception &e) {
    std::cerr << "[DB] updateTusState Error: " << e.what() << std::endl;
    return false;
  }
}

bool SqliteTransferStore::updateTusOffset(std::int64_t id,
                                          std::uint64_t offset) {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    return m_impl->modify(id, [offset](TransferRow &row) {
      // No session, nothing to advance.
      if (!row.tusUploadUrl)
        return false;
      row.tusUploadOffset = static_cast<std::int64_t>(offset);
      return true;
    });
  } catch (const std::exception &e) {
    std::cerr << "[DB] updateTusOffset Error: " << e.what() << std::endl;
    return false;
  }
}

bool SqliteTransferStore::clearTusState(std::int64_t id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    return m_impl->modify(id, [](TransferRow &row) {
      clearSessionColumns(row);
      return true;
    });
  } catch (const std::exception &e) {
    std::cerr << "[DB] clearTusState Error: " << e.what() << std::endl;
    return false;
  }
}

bool SqliteTransferStore::updateTransferWhenFinished(std::int64_t id,
                                                     TransferStatus status,
                                                     TransferResult result,
                                                     std::int64_t endTimestamp) {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    return m_impl->modify(id, [&](TransferRow &row) {
      row.status = static_cast<int>(status);
      row.lastResult = static_cast<int>(result);
      row.transferEndTimestamp = endTimestamp;
      clearSessionColumns(row);
      return true;
    });
  } catch (const std::exception &e) {
    std::cerr << "[DB] updateTransferWhenFinished Error: " << e.what()
              << std::endl;
    return false;
  }
}

bool SqliteTransferStore::retryTransfer(std::int64_t id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    return m_impl->modify(id, [](TransferRow &row) {
      if (row.status != static_cast<int>(TransferStatus::Failed))
        return false;
      row.status = static_cast<int>(TransferStatus::Enqueued);
      row.transferEndTimestamp.reset();
      return true;
    });
  } catch (const std::exception &e) {
    std::cerr << "[DB] retryTransfer Error: " << e.what() << std::endl;
    return false;
  }
}

bool SqliteTransferStore::deleteTransfer(std::int64_t id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  try {
    m_impl->storage.remove<TransferRow>(id);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] deleteTransfer Error: " << e.what() << std::endl;
    return false;
  }
}

} // namespace davsync
