#pragma once

#include "TransferStore.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace davsync {

class SqliteTransferStore : public TransferStore {
public:
  // ":memory:" keeps the database in memory for the store's lifetime.
  explicit SqliteTransferStore(const std::string &dbPath);
  ~SqliteTransferStore() override;

  // Connection management
  bool open();
  void initializeSchema();

  std::optional<std::int64_t>
  insertTransfer(const TransferRecord &record) override;
  std::optional<TransferRecord> getTransferById(std::int64_t id) override;
  std::vector<TransferRecord>
  getTransfersByAccount(const std::string &accountName) override;
  std::vector<TransferRecord> getTransfersByStatus(TransferStatus status) override;

  bool updateTransferStatus(std::int64_t id, TransferStatus status) override;
  bool updateTusState(std::int64_t id, const TusSession &session) override;
  bool updateTusOffset(std::int64_t id, std::uint64_t offset) override;
  bool clearTusState(std::int64_t id) override;
  bool updateTransferWhenFinished(std::int64_t id, TransferStatus status,
                                  TransferResult result,
                                  std::int64_t endTimestamp) override;
  bool retryTransfer(std::int64_t id) override;
  bool deleteTransfer(std::int64_t id) override;

private:
  std::string m_dbPath;
  std::mutex m_mutex;
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace davsync
