#pragma once

#include "CancellationToken.hpp"
#include "TransferWorker.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace davsync {

/**
 * TransferScheduler is a bounded worker pool keyed by transfer id. An id
 * that is queued, running or waiting for its backoff is active; enqueueing
 * it again is rejected and the existing work is kept.
 */
class TransferScheduler {
public:
  using Runner = std::function<WorkOutcome(std::int64_t id,
                                           CancellationToken &cancel,
                                           int attempt)>;

  TransferScheduler(int workers, std::chrono::milliseconds baseDelay,
                    std::chrono::milliseconds maxDelay, Runner runner);
  ~TransferScheduler();

  void start();
  void stop();

  // False when the id is already active.
  bool enqueue(std::int64_t id);
  // Cooperative: the running attempt sees its token cancelled and the id
  // is not re-queued. False when the id is not active.
  bool cancel(std::int64_t id);
  bool isActive(std::int64_t id);
  std::size_t activeCount();

  void waitUntilIdle();

private:
  struct Entry {
    int attempt = 1;
    bool running = false;
    std::chrono::steady_clock::time_point readyAt;
    std::shared_ptr<CancellationToken> token;
  };

  void workerLoop();

  int m_workerCount;
  std::chrono::milliseconds m_baseDelay;
  std::chrono::milliseconds m_maxDelay;
  Runner m_runner;

  std::mutex m_mutex;
  std::condition_variable m_cv;
  std::condition_variable m_idleCv;
  std::map<std::int64_t, Entry> m_entries;
  std::vector<std::thread> m_threads;
  bool m_running = false;
};

} // namespace davsync
