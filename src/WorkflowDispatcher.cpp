#include "WorkflowDispatcher.hpp"
#include <exception>

namespace watchflow {

WorkflowDispatcher::WorkflowDispatcher(std::shared_ptr<OutputSink> out,
                                       std::shared_ptr<OutputSink> err,
                                       bool verbose)
    : m_out(std::move(out)), m_err(std::move(err)), m_verbose(verbose) {}

void WorkflowDispatcher::add(std::shared_ptr<Workflow> workflow) {
  if (!workflow)
    return;
  std::lock_guard<std::mutex> lock(m_mutex);
  m_workflows.push_back(std::move(workflow));
}

size_t WorkflowDispatcher::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_workflows.size();
}

size_t WorkflowDispatcher::dispatch(const RawEvent &event) {
  if (m_verbose)
    m_out->writeLine("Watcher event " + event.path + " " +
                     opToString(event.op));

  std::vector<std::shared_ptr<Workflow>> workflows;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    workflows = m_workflows;
  }

  size_t matched = 0;
  for (const auto &wf : workflows) {
    try {
      if (!wf->match(event.path, event.op))
        continue;
      ++matched;

      TaskContext ctx;
      ctx.src = event.path;
      ctx.out = m_out;
      ctx.err = m_err;
      ctx.verbose = m_verbose;
      if (!wf->run(ctx) && m_verbose)
        m_out->writeLine("[Dispatcher] " + wf->name() + " failed for " +
                         event.path);
    } catch (const std::exception &e) {
      m_err->writeLine("[Dispatcher] " + wf->name() + " error on " +
                       event.path + ": " + e.what());
    } catch (...) {
      m_err->writeLine("[Dispatcher] " + wf->name() +
                       " raised a non-standard exception on " + event.path);
    }
  }
  return matched;
}

} // namespace watchflow
