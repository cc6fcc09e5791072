#pragma once

#include "types.hpp"
#include <string>

namespace davsync {

enum class FailureKind { CredentialsNeeded, Generic };

// Receives terminal transfer events for the user.
class TransferNotifier {
public:
  virtual ~TransferNotifier() = default;
  virtual void transferSucceeded(const TransferRecord &record) = 0;
  virtual void transferFailed(const TransferRecord &record, FailureKind kind,
                              const std::string &message) = 0;
};

class ConsoleNotifier : public TransferNotifier {
public:
  void transferSucceeded(const TransferRecord &record) override;
  void transferFailed(const TransferRecord &record, FailureKind kind,
                      const std::string &message) override;
};

} // namespace davsync
