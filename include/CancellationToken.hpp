#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace davsync {

class CancellationToken {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_cancelled.store(true);
    }
    m_cv.notify_all();
  }

  bool isCancelled() const { return m_cancelled.load(); }

  // Sleeps for `delay` unless cancelled first. Returns true if cancelled.
  bool waitFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, delay, [this] { return m_cancelled.load(); });
  }

private:
  std::atomic<bool> m_cancelled{false};
  std::mutex m_mutex;
  std::condition_variable m_cv;
};

} // namespace davsync
