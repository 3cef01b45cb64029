#include "Batcher.hpp"
#include <utility>

namespace watchflow {

Batcher::Batcher(std::chrono::milliseconds interval, BatchHandler handler)
    : m_interval(interval.count() > 0 ? interval : kDefaultBatchInterval),
      m_handler(std::move(handler)) {}

void Batcher::push(RawEvent event) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_stopped)
    return;
  m_pending.push_back(std::move(event));
}

bool Batcher::tick() {
  std::lock_guard<std::mutex> emitLock(m_emitMutex);
  EventBatch batch;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped || m_pending.empty())
      return false;
    batch.swap(m_pending);
  }
  if (m_handler)
    m_handler(std::move(batch));
  return true;
}

void Batcher::run() {
  auto nextTick = std::chrono::steady_clock::now() + m_interval;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      if (m_cv.wait_until(lock, nextTick, [this] { return m_stopped; }))
        break;
    }
    tick();

    nextTick += m_interval;
    auto now = std::chrono::steady_clock::now();
    if (nextTick < now)
      nextTick = now + m_interval;
  }
}

void Batcher::stop() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopped = true;
    m_pending.clear();
  }
  m_cv.notify_all();
  // Wait for a handler call that started before the flag was set
  std::lock_guard<std::mutex> emitLock(m_emitMutex);
}

bool Batcher::stopped() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_stopped;
}

bool BatchChannel::push(EventBatch batch) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed)
      return false;
    m_queue.push_back(std::move(batch));
  }
  m_cv.notify_one();
  return true;
}

std::optional<EventBatch> BatchChannel::pop() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_cv.wait(lock, [this] { return m_closed || !m_queue.empty(); });
  if (m_closed)
    return std::nullopt;
  EventBatch batch = std::move(m_queue.front());
  m_queue.pop_front();
  return batch;
}

void BatchChannel::close() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
    m_queue.clear();
  }
  m_cv.notify_all();
}

} // namespace watchflow
