#pragma once

#include "Batcher.hpp"
#include "EventSource.hpp"
#include "OutputSink.hpp"
#include "WatchSet.hpp"
#include "Workflow.hpp"
#include "WorkflowDispatcher.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace watchflow {

constexpr bool IgnoreHidden = true;
constexpr bool IncludeHidden = false;

struct PipelineOptions {
  std::string name;                      // "<UNNAMED>" when empty
  std::chrono::milliseconds batchInterval = kDefaultBatchInterval;
  bool verbose = false;
  std::shared_ptr<OutputSink> out;       // stdout when null
  std::shared_ptr<OutputSink> err;       // stderr when null
  EventSourceFactory sourceFactory;      // efsw FilesystemWatcher when empty
};

/**
 * RunHandle controls one run of a Pipeline, from start() to stop().
 * stop() may be called from any thread other than the dispatch thread;
 * calls after the first are no-ops.
 */
class RunHandle {
  struct Token {};

public:
  // Only Pipeline can name Token, so handles come from Pipeline::start()
  explicit RunHandle(Token) {}
  ~RunHandle();

  RunHandle(const RunHandle &) = delete;
  RunHandle &operator=(const RunHandle &) = delete;

  // Stops the batcher, closes the event source and joins the run threads.
  // Workflow runs already in progress are allowed to finish.
  void stop();

  // Blocks until stop() has completed.
  void wait();

  bool stopped() const;

  // Number of batches handed to the dispatch loop during this run
  size_t batchCount() const { return m_batches.load(); }

private:
  friend class Pipeline;

  std::shared_ptr<Batcher> m_batcher;
  std::shared_ptr<BatchChannel> m_channel;
  std::shared_ptr<EventSource> m_source;
  std::shared_ptr<WatchSet> m_watchSet;
  std::thread m_batchThread;
  std::thread m_dispatchThread;
  std::atomic<size_t> m_batches{0};

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  bool m_stopping = false;
  bool m_stopped = false;
};

/**
 * Pipeline watches directories, coalesces their change events into batches
 * and runs matching workflows for every event.
 *
 * Watches may be added before or after start(); a directory added while
 * running is subscribed immediately. Directories that appear under a
 * recursive root are picked up by a rescan running alongside dispatch.
 */
class Pipeline {
public:
  explicit Pipeline(PipelineOptions options = {});
  Pipeline(const std::string &name, bool verbose);
  ~Pipeline();

  Pipeline(const Pipeline &) = delete;
  Pipeline &operator=(const Pipeline &) = delete;

  // Throws ResolutionError. Returns the resolved directory.
  std::string watch(const std::string &path);

  // Throws ResolutionError.
  void watchRecursive(const std::string &path, bool ignoreHidden);

  void add(std::shared_ptr<Workflow> workflow);

  // Returns nullptr, after logging, if the event source cannot be set up.
  std::shared_ptr<RunHandle> start();

  // start() then wait(). Returns false if the pipeline could not start.
  bool run();

  void stop();

  // Dispatches one batch on the calling thread as the run loop does.
  void processBatch(const EventBatch &batch);

  const std::string &name() const { return m_name; }
  std::vector<std::string> watches() const;
  std::map<std::string, bool> recursiveRoots() const;
  size_t workflowCount() const;
  bool running() const;

private:
  void dispatchLoop(std::shared_ptr<BatchChannel> channel);
  void spawnRescan(const RawEvent &event);

  std::string m_name;
  PipelineOptions m_options;
  std::shared_ptr<OutputSink> m_out;
  std::shared_ptr<OutputSink> m_err;
  std::shared_ptr<WatchSet> m_watchSet;
  std::unique_ptr<WorkflowDispatcher> m_dispatcher;

  mutable std::mutex m_mutex;
  std::shared_ptr<RunHandle> m_active;
};

} // namespace watchflow
