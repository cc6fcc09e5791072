#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace davsync {

struct ProgressEvent {
  std::int64_t transferId = 0;
  int percent = 0;
  std::uint64_t bytesDone = 0;
  std::uint64_t bytesTotal = 0;
};

/**
 * ProgressChannel fans progress events out to subscribers. It has no UI
 * knowledge; callers subscribe with a plain callback.
 */
class ProgressChannel {
public:
  using Listener = std::function<void(const ProgressEvent &)>;

  int subscribe(Listener listener);
  void unsubscribe(int token);
  void publish(const ProgressEvent &event);

private:
  std::mutex m_mutex;
  std::map<int, Listener> m_listeners;
  int m_nextToken = 1;
};

// Converts byte counts into integer percentages and forwards only changes.
class PercentTracker {
public:
  PercentTracker(ProgressChannel *channel, std::int64_t transferId,
                 std::uint64_t total);

  void update(std::uint64_t bytesDone);
  int lastPercent() const { return m_lastPercent; }

  static int percentOf(std::uint64_t done, std::uint64_t total);

private:
  ProgressChannel *m_channel;
  std::int64_t m_transferId;
  std::uint64_t m_total;
  int m_lastPercent = -1;
};

} // namespace davsync
