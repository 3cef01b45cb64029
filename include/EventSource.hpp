#pragma once

#include "types.hpp"
#include <functional>
#include <memory>
#include <string>

namespace watchflow {

/**
 * EventSource is the OS-level notifier behind a Pipeline. Each subscribed
 * directory reports changes to its immediate entries; recursion is the
 * caller's job.
 */
class EventSource {
public:
  using Handler = std::function<void(const RawEvent &event)>;

  virtual ~EventSource() = default;

  // Starts delivering events to handler. Throws SetupError on failure.
  virtual void open(Handler handler) = 0;

  // Returns false if the directory could not be watched.
  virtual bool subscribe(const std::string &path) = 0;

  // Stops delivery and releases OS resources. Safe to call twice.
  virtual void close() = 0;
};

using EventSourceFactory = std::function<std::shared_ptr<EventSource>()>;

} // namespace watchflow
