#pragma once

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace davsync {

/**
 * Durable TransferRecord storage. Every mutator is atomic on its own and
 * returns false when the write did not happen.
 */
class TransferStore {
public:
  virtual ~TransferStore() = default;

  // Returns the new record id, or nullopt if the insert failed.
  virtual std::optional<std::int64_t>
  insertTransfer(const TransferRecord &record) = 0;
  virtual std::optional<TransferRecord> getTransferById(std::int64_t id) = 0;
  virtual std::vector<TransferRecord>
  getTransfersByAccount(const std::string &accountName) = 0;
  virtual std::vector<TransferRecord>
  getTransfersByStatus(TransferStatus status) = 0;

  virtual bool updateTransferStatus(std::int64_t id, TransferStatus status) = 0;
  // Writes the whole resumable session in one update.
  virtual bool updateTusState(std::int64_t id, const TusSession &session) = 0;
  virtual bool updateTusOffset(std::int64_t id, std::uint64_t offset) = 0;
  virtual bool clearTusState(std::int64_t id) = 0;
  // Terminal status, result and end time; clears the resumable session.
  virtual bool updateTransferWhenFinished(std::int64_t id, TransferStatus status,
                                          TransferResult result,
                                          std::int64_t endTimestamp) = 0;
  // FAILED -> ENQUEUED. The only way a failed record runs again.
  virtual bool retryTransfer(std::int64_t id) = 0;
  virtual bool deleteTransfer(std::int64_t id) = 0;
};

} // namespace davsync
