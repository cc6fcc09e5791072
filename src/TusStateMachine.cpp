#include "TusStateMachine.hpp"
#include <algorithm>

namespace davsync {

const char *toString(TusState state) {
  switch (state) {
  case TusState::NoSession:
    return "NoSession";
  case TusState::Created:
    return "Created";
  case TusState::Uploading:
    return "Uploading";
  case TusState::Completed:
    return "Completed";
  }
  return "Unknown";
}

namespace tus {

TusState stateOf(const std::optional<TusSession> &session) {
  if (!session || session->uploadUrl.empty())
    return TusState::NoSession;
  if (session->length > 0 && session->offset >= session->length)
    return TusState::Completed;
  if (session->offset == 0)
    return TusState::Created;
  return TusState::Uploading;
}

std::uint64_t nextChunkSize(std::uint64_t offset, std::uint64_t length,
                            std::uint64_t chunkSize, std::uint64_t serverMax) {
  if (offset >= length)
    return 0;
  std::uint64_t size = std::min(chunkSize, length - offset);
  if (serverMax > 0)
    size = std::min(size, serverMax);
  return size;
}

bool isValidPatchOffset(std::uint64_t offset, std::uint64_t newOffset,
                        std::uint64_t length) {
  return newOffset >= offset && newOffset <= length;
}

RecoveryDecision decideRecovery(std::uint64_t localOffset,
                                std::uint64_t serverOffset,
                                std::uint64_t length) {
  RecoveryDecision decision;
  decision.nextOffset = serverOffset;
  if (serverOffset > length)
    decision.action = RecoveryAction::Invalid;
  else if (serverOffset > localOffset)
    decision.action = RecoveryAction::AdoptServerOffset;
  else if (serverOffset == localOffset)
    decision.action = RecoveryAction::RetrySameChunk;
  else
    decision.action = RecoveryAction::RewindToServer;
  return decision;
}

std::chrono::milliseconds backoffDelay(int consecutiveFailures,
                                       std::chrono::milliseconds baseDelay,
                                       std::chrono::milliseconds maxDelay) {
  if (consecutiveFailures <= 0)
    return std::chrono::milliseconds(0);
  // Past 20 doublings every sane base is already above the cap.
  int shift = std::min(consecutiveFailures - 1, 20);
  std::chrono::milliseconds delay(
      baseDelay.count() * (std::chrono::milliseconds::rep{1} << shift));
  return std::min(delay, maxDelay);
}

} // namespace tus
} // namespace davsync
