#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

namespace davsync {

enum class TusState { NoSession, Created, Uploading, Completed };

const char *toString(TusState state);

// What the patch loop does after a failed PATCH and a fresh offset query.
enum class RecoveryAction {
  AdoptServerOffset, // server is ahead: a partial write landed
  RetrySameChunk,    // server confirms our offset: back off and resend
  RewindToServer,    // server lost data: continue from its offset
  Invalid            // server offset is beyond the declared length
};

struct RecoveryDecision {
  RecoveryAction action = RecoveryAction::RetrySameChunk;
  std::uint64_t nextOffset = 0;
};

/**
 * Pure transition functions for the resumable upload. Nothing here touches
 * the network or the store; TusUploadDriver drives them.
 */
namespace tus {

TusState stateOf(const std::optional<TusSession> &session);

// min(chunkSize, remaining, serverMax); a serverMax of 0 means no limit.
std::uint64_t nextChunkSize(std::uint64_t offset, std::uint64_t length,
                            std::uint64_t chunkSize, std::uint64_t serverMax);

// A PATCH result is accepted only if offset <= newOffset <= length.
bool isValidPatchOffset(std::uint64_t offset, std::uint64_t newOffset,
                        std::uint64_t length);

RecoveryDecision decideRecovery(std::uint64_t localOffset,
                                std::uint64_t serverOffset,
                                std::uint64_t length);

// min(maxDelay, baseDelay << (consecutiveFailures - 1))
std::chrono::milliseconds backoffDelay(int consecutiveFailures,
                                       std::chrono::milliseconds baseDelay,
                                       std::chrono::milliseconds maxDelay);

} // namespace tus
} // namespace davsync
