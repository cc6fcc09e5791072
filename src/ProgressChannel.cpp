#include "ProgressChannel.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace davsync {

int ProgressChannel::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(m_mutex);
  int token = m_nextToken++;
  m_listeners.emplace(token, std::move(listener));
  return token;
}

void ProgressChannel::unsubscribe(int token) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_listeners.erase(token);
}

void ProgressChannel::publish(const ProgressEvent &event) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &entry : m_listeners)
      listeners.push_back(entry.second);
  }
  // Called outside the lock so a listener may unsubscribe itself.
  for (const auto &listener : listeners)
    listener(event);
}

PercentTracker::PercentTracker(ProgressChannel *channel,
                               std::int64_t transferId, std::uint64_t total)
    : m_channel(channel), m_transferId(transferId), m_total(total) {}

int PercentTracker::percentOf(std::uint64_t done, std::uint64_t total) {
  if (total == 0)
    return 100;
  done = std::min(done, total);
  return static_cast<int>((done * 100) / total);
}

void PercentTracker::update(std::uint64_t bytesDone) {
  int percent = percentOf(bytesDone, m_total);
  if (percent == m_lastPercent)
    return;
  m_lastPercent = percent;
  if (!m_channel)
    return;
  ProgressEvent event;
  event.transferId = m_transferId;
  event.percent = percent;
  event.bytesDone = std::min(bytesDone, m_total);
  event.bytesTotal = m_total;
  m_channel->publish(event);
}

} // namespace davsync
