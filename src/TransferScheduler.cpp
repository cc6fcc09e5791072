#include "TransferScheduler.hpp"
#include "TusStateMachine.hpp"
#include <iostream>
#include <utility>

namespace davsync {

TransferScheduler::TransferScheduler(int workers,
                                     std::chrono::milliseconds baseDelay,
                                     std::chrono::milliseconds maxDelay,
                                     Runner runner)
    : m_workerCount(workers < 1 ? 1 : workers), m_baseDelay(baseDelay),
      m_maxDelay(maxDelay), m_runner(std::move(runner)) {}

TransferScheduler::~TransferScheduler() { stop(); }

void TransferScheduler::start() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_running)
    return;
  m_running = true;
  for (int i = 0; i < m_workerCount; ++i)
    m_threads.emplace_back(&TransferScheduler::workerLoop, this);
  std::cout << "[Scheduler] Started " << m_workerCount << " workers"
            << std::endl;
}

void TransferScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running)
      return;
    m_running = false;
    for (auto &entry : m_entries)
      entry.second.token->cancel();
  }
  m_cv.notify_all();
  for (auto &t : m_threads) {
    if (t.joinable())
      t.join();
  }
  m_threads.clear();
  std::cout << "[Scheduler] Stopped." << std::endl;
}

bool TransferScheduler::enqueue(std::int64_t id) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.count(id)) {
      std::cout << "[Scheduler] Transfer " << id
                << " already active, keeping existing work" << std::endl;
      return false;
    }
    Entry entry;
    entry.readyAt = std::chrono::steady_clock::now();
    entry.token = std::make_shared<CancellationToken>();
    m_entries.emplace(id, std::move(entry));
  }
  m_cv.notify_one();
  return true;
}

bool TransferScheduler::cancel(std::int64_t id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_entries.find(id);
  if (it == m_entries.end())
    return false;
  it->second.token->cancel();
  if (!it->second.running) {
    m_entries.erase(it);
    m_idleCv.notify_all();
  }
  return true;
}

bool TransferScheduler::isActive(std::int64_t id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_entries.count(id) > 0;
}

std::size_t TransferScheduler::activeCount() {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_entries.size();
}

void TransferScheduler::waitUntilIdle() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_idleCv.wait(lock, [this] { return m_entries.empty() || !m_running; });
}

void TransferScheduler::workerLoop() {
  std::unique_lock<std::mutex> lock(m_mutex);
  while (m_running) {
    auto now = std::chrono::steady_clock::now();
    auto next = m_entries.end();
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
      if (it->second.running)
        continue;
      if (next == m_entries.end() || it->second.readyAt < next->second.readyAt)
        next = it;
    }

    if (next == m_entries.end()) {
      m_cv.wait(lock);
      continue;
    }
    if (next->second.readyAt > now) {
      m_cv.wait_until(lock, next->second.readyAt);
      continue;
    }

    const std::int64_t id = next->first;
    next->second.running = true;
    const int attempt = next->second.attempt;
    auto token = next->second.token;

    lock.unlock();
    WorkOutcome outcome = WorkOutcome::Failure;
    try {
      outcome = m_runner(id, *token, attempt);
    } catch (const std::exception &e) {
      std::cerr << "[Scheduler] Transfer " << id << " raised: " << e.what()
                << std::endl;
    }
    lock.lock();

    auto it = m_entries.find(id);
    if (it == m_entries.end())
      continue;
    if (outcome == WorkOutcome::Retry && !token->isCancelled() && m_running) {
      auto delay = tus::backoffDelay(attempt, m_baseDelay, m_maxDelay);
      it->second.attempt = attempt + 1;
      it->second.running = false;
      it->second.readyAt = std::chrono::steady_clock::now() + delay;
      std::cout << "[Scheduler] Transfer " << id << " retry "
                << it->second.attempt << " in " << delay.count() << " ms"
                << std::endl;
      m_cv.notify_all();
    } else {
      m_entries.erase(it);
      m_idleCv.notify_all();
    }
  }
  m_idleCv.notify_all();
}

} // namespace davsync
