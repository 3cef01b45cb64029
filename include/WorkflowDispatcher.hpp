#pragma once

#include "OutputSink.hpp"
#include "Workflow.hpp"
#include "types.hpp"
#include <memory>
#include <mutex>
#include <vector>

namespace watchflow {

/**
 * WorkflowDispatcher runs every registered workflow that matches an event,
 * in registration order, each with a fresh TaskContext. A workflow that
 * fails or throws is reported on the error sink and never stops dispatch.
 */
class WorkflowDispatcher {
public:
  WorkflowDispatcher(std::shared_ptr<OutputSink> out,
                     std::shared_ptr<OutputSink> err, bool verbose);

  void add(std::shared_ptr<Workflow> workflow);
  size_t size() const;

  // Returns the number of workflows that matched.
  size_t dispatch(const RawEvent &event);

private:
  std::shared_ptr<OutputSink> m_out;
  std::shared_ptr<OutputSink> m_err;
  bool m_verbose;

  mutable std::mutex m_mutex;
  std::vector<std::shared_ptr<Workflow>> m_workflows;
};

} // namespace watchflow
