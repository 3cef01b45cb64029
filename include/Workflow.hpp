#pragma once

#include "OutputSink.hpp"
#include "types.hpp"
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace watchflow {

/**
 * TaskContext threads one triggering path through a workflow's task chain.
 * A task sets target to the artifact it produced so the next task can pick
 * it up; buf is scratch space tasks reset before use.
 */
struct TaskContext {
  std::string src;
  std::string target;
  std::shared_ptr<OutputSink> out;
  std::shared_ptr<OutputSink> err;
  std::string buf;
  bool verbose = false;
};

class Workflow {
public:
  virtual ~Workflow() = default;

  virtual const std::string &name() const = 0;
  virtual bool match(const std::string &path, Op op) const = 0;

  // Runs the task chain. Returns false on failure; failures are reported
  // on ctx.err by the workflow itself.
  virtual bool run(TaskContext &ctx) = 0;
};

class Task {
public:
  virtual ~Task() = default;

  // Throws TaskError on failure.
  virtual void run(TaskContext &ctx) = 0;
};

/**
 * TaskWorkflow matches events whose operation intersects its mask and whose
 * path matches any of its patterns (every path when there are none), then
 * runs its tasks in order until one fails.
 */
class TaskWorkflow : public Workflow {
public:
  explicit TaskWorkflow(std::string name, Op ops = Op::All);

  // ECMAScript regex searched against the full path. Throws ConfigError.
  void addPattern(const std::string &pattern);
  void addTask(std::shared_ptr<Task> task);

  // When false, later tasks still run after one fails
  void setStopOnError(bool stop) { m_stopOnError = stop; }

  const std::string &name() const override { return m_name; }
  bool match(const std::string &path, Op op) const override;
  bool run(TaskContext &ctx) override;

private:
  std::string m_name;
  Op m_ops;
  bool m_stopOnError = true;
  std::vector<std::regex> m_patterns;
  std::vector<std::shared_ptr<Task>> m_tasks;
};

/**
 * CommandTask runs a shell command for the triggering path. Arguments may
 * use {src}, {dir} (the directory holding src, or src itself when it is a
 * directory) and {target}. Combined stdout/stderr is captured in ctx.buf and
 * flushed to ctx.out whether or not the command succeeds.
 */
class CommandTask : public Task {
public:
  CommandTask(std::string command, std::vector<std::string> args,
              bool failOnOutput = false);

  void run(TaskContext &ctx) override;

  // The quoted shell command line for ctx
  std::string commandLine(const TaskContext &ctx) const;

private:
  std::string m_command;
  std::vector<std::string> m_args;
  bool m_failOnOutput;
};

} // namespace watchflow
