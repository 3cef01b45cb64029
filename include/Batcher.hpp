#pragma once

#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace watchflow {

constexpr std::chrono::milliseconds kDefaultBatchInterval{300};

/**
 * Batcher coalesces raw events into one EventBatch per tick. Empty windows
 * emit nothing. stop() is final: the partial window is discarded and no
 * batch is emitted once it returns.
 *
 * run() drives the ticks from the steady clock; tests can call tick()
 * directly instead.
 */
class Batcher {
public:
  using BatchHandler = std::function<void(EventBatch batch)>;

  Batcher(std::chrono::milliseconds interval, BatchHandler handler);

  // Appends to the current window. Ignored after stop().
  void push(RawEvent event);

  // Closes the current window. Returns true if a batch was emitted.
  bool tick();

  // Ticks every interval until stop() is called.
  void run();

  void stop();
  bool stopped() const;

private:
  std::chrono::milliseconds m_interval;
  BatchHandler m_handler;

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  EventBatch m_pending;
  bool m_stopped = false;

  // Held while the handler runs so stop() can wait it out
  std::mutex m_emitMutex;
};

/**
 * BatchChannel hands finished batches from the Batcher thread to the
 * dispatch loop in emission order.
 */
class BatchChannel {
public:
  // Returns false if the channel is closed.
  bool push(EventBatch batch);

  // Blocks for the next batch. Returns nullopt once closed; batches still
  // queued at close are dropped.
  std::optional<EventBatch> pop();

  void close();

private:
  std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<EventBatch> m_queue;
  bool m_closed = false;
};

} // namespace watchflow
