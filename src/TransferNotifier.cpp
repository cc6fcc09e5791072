#include "TransferNotifier.hpp"
#include <iostream>

namespace davsync {

void ConsoleNotifier::transferSucceeded(const TransferRecord &record) {
  std::cout << "[Notify] Transfer " << record.id << " finished: "
            << record.remotePath << std::endl;
}

void ConsoleNotifier::transferFailed(const TransferRecord &record,
                                     FailureKind kind,
                                     const std::string &message) {
  if (kind == FailureKind::CredentialsNeeded)
    std::cerr << "[Notify] Sign in again for account " << record.accountName
              << ": transfer " << record.id << " (" << record.remotePath
              << ") was rejected" << std::endl;
  else
    std::cerr << "[Notify] Transfer " << record.id << " ("
              << record.remotePath << ") failed: " << message << std::endl;
}

} // namespace davsync
