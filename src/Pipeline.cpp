#include "Pipeline.hpp"
#include "Errors.hpp"
#include "FilesystemWatcher.hpp"
#include <exception>
#include <system_error>

namespace watchflow {

RunHandle::~RunHandle() { stop(); }

void RunHandle::stop() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopping)
      return;
    m_stopping = true;
  }

  if (m_batcher)
    m_batcher->stop();
  if (m_channel)
    m_channel->close();
  if (m_watchSet)
    m_watchSet->detach();
  if (m_source)
    m_source->close();

  if (m_batchThread.joinable())
    m_batchThread.join();
  if (m_dispatchThread.joinable()) {
    if (m_dispatchThread.get_id() == std::this_thread::get_id())
      m_dispatchThread.detach();
    else
      m_dispatchThread.join();
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopped = true;
  }
  m_cv.notify_all();
}

void RunHandle::wait() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_cv.wait(lock, [this] { return m_stopped; });
}

bool RunHandle::stopped() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_stopped;
}

Pipeline::Pipeline(PipelineOptions options)
    : m_name(options.name.empty() ? "<UNNAMED>" : options.name),
      m_options(std::move(options)) {
  m_out = m_options.out ? m_options.out : OutputSink::stdoutSink();
  m_err = m_options.err ? m_options.err : OutputSink::stderrSink();
  m_watchSet = std::make_shared<WatchSet>(m_out, m_options.verbose);
  m_dispatcher =
      std::make_unique<WorkflowDispatcher>(m_out, m_err, m_options.verbose);
}

Pipeline::Pipeline(const std::string &name, bool verbose)
    : Pipeline([&] {
        PipelineOptions o;
        o.name = name;
        o.verbose = verbose;
        return o;
      }()) {}

Pipeline::~Pipeline() { stop(); }

std::string Pipeline::watch(const std::string &path) {
  return m_watchSet->add(path);
}

void Pipeline::watchRecursive(const std::string &path, bool ignoreHidden) {
  m_watchSet->addRecursive(path, ignoreHidden);
}

void Pipeline::add(std::shared_ptr<Workflow> workflow) {
  m_dispatcher->add(std::move(workflow));
}

std::shared_ptr<RunHandle> Pipeline::start() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_active && !m_active->stopped()) {
    m_err->writeLine("[Pipeline] " + m_name + " is already running");
    return m_active;
  }

  if (m_watchSet->targets().empty())
    m_err->writeLine("Pipeline " + m_name + " is not watching anything");
  if (m_dispatcher->size() == 0)
    m_err->writeLine("Pipeline " + m_name + " has no Workflows");

  auto handle = std::make_shared<RunHandle>(RunHandle::Token{});
  RunHandle *h = handle.get();
  handle->m_watchSet = m_watchSet;
  handle->m_channel = std::make_shared<BatchChannel>();
  handle->m_batcher = std::make_shared<Batcher>(
      m_options.batchInterval,
      [h, channel = handle->m_channel](EventBatch batch) {
        if (channel->push(std::move(batch)))
          ++h->m_batches;
      });

  try {
    handle->m_source = m_options.sourceFactory
                           ? m_options.sourceFactory()
                           : std::make_shared<FilesystemWatcher>();
    if (!handle->m_source)
      throw SetupError("no event source");
    handle->m_source->open(
        [batcher = handle->m_batcher](const RawEvent &event) {
          batcher->push(event);
        });
  } catch (const SetupError &e) {
    m_err->writeLine("[Pipeline] " + m_name + ": " + e.what());
    handle->m_source.reset();
    handle->stop();
    return nullptr;
  }

  m_watchSet->attach(handle->m_source);

  try {
    handle->m_batchThread =
        std::thread(&Batcher::run, handle->m_batcher.get());
    handle->m_dispatchThread =
        std::thread(&Pipeline::dispatchLoop, this, handle->m_channel);
  } catch (const std::system_error &e) {
    m_err->writeLine("[Pipeline] " + m_name +
                     ": cannot start threads: " + e.what());
    handle->stop();
    return nullptr;
  }

  if (m_options.verbose)
    m_out->writeLine("[Pipeline] " + m_name + " started");
  m_active = handle;
  return handle;
}

bool Pipeline::run() {
  auto handle = start();
  if (!handle)
    return false;
  handle->wait();
  return true;
}

void Pipeline::stop() {
  std::shared_ptr<RunHandle> handle;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    handle = m_active;
  }
  if (handle)
    handle->stop();
}

void Pipeline::processBatch(const EventBatch &batch) {
  for (const auto &event : batch) {
    spawnRescan(event);
    m_dispatcher->dispatch(event);
  }
}

void Pipeline::dispatchLoop(std::shared_ptr<BatchChannel> channel) {
  while (auto batch = channel->pop())
    processBatch(*batch);
}

void Pipeline::spawnRescan(const RawEvent &event) {
  if (!any(event.op & Op::DirOps))
    return;

  auto rescan = [watchSet = m_watchSet, err = m_err, event]() {
    try {
      watchSet->rescan(event);
    } catch (const std::exception &e) {
      err->writeLine("[Pipeline] rescan of " + event.path +
                     " failed: " + e.what());
    }
  };

  try {
    std::thread(rescan).detach();
  } catch (const std::system_error &e) {
    m_err->writeLine(std::string("[Pipeline] cannot spawn rescan: ") +
                     e.what());
    rescan();
  }
}

std::vector<std::string> Pipeline::watches() const {
  return m_watchSet->targets();
}

std::map<std::string, bool> Pipeline::recursiveRoots() const {
  return m_watchSet->recursiveRoots();
}

size_t Pipeline::workflowCount() const { return m_dispatcher->size(); }

bool Pipeline::running() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_active && !m_active->stopped();
}

} // namespace watchflow
