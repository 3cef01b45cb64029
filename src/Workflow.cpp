#include "Workflow.hpp"
#include "Errors.hpp"
#include <cstdio>
#include <filesystem>
#include <memory>
#include <sys/wait.h>
#include <system_error>

namespace fs = std::filesystem;

namespace watchflow {

namespace {

std::string shellQuote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

void replaceAll(std::string &s, const std::string &from,
                const std::string &to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string sourceDir(const std::string &src) {
  std::error_code ec;
  if (fs::is_directory(src, ec))
    return src;
  return fs::path(src).parent_path().generic_string();
}

} // namespace

TaskWorkflow::TaskWorkflow(std::string name, Op ops)
    : m_name(std::move(name)), m_ops(ops) {}

void TaskWorkflow::addPattern(const std::string &pattern) {
  try {
    m_patterns.emplace_back(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error &e) {
    throw ConfigError("workflow " + m_name + ": bad pattern '" + pattern +
                      "': " + e.what());
  }
}

void TaskWorkflow::addTask(std::shared_ptr<Task> task) {
  if (task)
    m_tasks.push_back(std::move(task));
}

bool TaskWorkflow::match(const std::string &path, Op op) const {
  if (!any(op & m_ops))
    return false;
  if (m_patterns.empty())
    return true;
  for (const auto &re : m_patterns) {
    if (std::regex_search(path, re))
      return true;
  }
  return false;
}

bool TaskWorkflow::run(TaskContext &ctx) {
  bool ok = true;
  for (const auto &task : m_tasks) {
    try {
      task->run(ctx);
    } catch (const TaskError &e) {
      ok = false;
      if (ctx.err)
        ctx.err->writeLine("[Workflow] " + m_name + ": " + e.what());
      if (m_stopOnError)
        break;
    }
  }
  return ok;
}

CommandTask::CommandTask(std::string command, std::vector<std::string> args,
                         bool failOnOutput)
    : m_command(std::move(command)), m_args(std::move(args)),
      m_failOnOutput(failOnOutput) {}

std::string CommandTask::commandLine(const TaskContext &ctx) const {
  std::string dir = sourceDir(ctx.src);
  std::string line = shellQuote(m_command);
  for (std::string arg : m_args) {
    replaceAll(arg, "{src}", ctx.src);
    replaceAll(arg, "{dir}", dir);
    replaceAll(arg, "{target}", ctx.target);
    line += " " + shellQuote(arg);
  }
  return line;
}

void CommandTask::run(TaskContext &ctx) {
  ctx.target = ctx.src;
  ctx.buf.clear();

  if (ctx.out)
    ctx.out->writeLine(m_command + " ... " + sourceDir(ctx.src));

  std::string cmd = commandLine(ctx) + " 2>&1";
  std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"),
                                                pclose);
  if (!pipe)
    throw TaskError("cannot start " + m_command);

  char chunk[4096];
  size_t n;
  while ((n = fread(chunk, 1, sizeof(chunk), pipe.get())) > 0)
    ctx.buf.append(chunk, n);
  int status = pclose(pipe.release());

  if (ctx.out)
    ctx.out->write(ctx.buf);

  if (status == -1)
    throw TaskError(m_command + ": cannot collect exit status");
  if (!WIFEXITED(status))
    throw TaskError(m_command + " terminated abnormally");
  if (WEXITSTATUS(status) != 0)
    throw TaskError(m_command + " exited with status " +
                    std::to_string(WEXITSTATUS(status)));
  if (m_failOnOutput && !ctx.buf.empty())
    throw TaskError(m_command + ": FAIL");

  if (ctx.out)
    ctx.out->writeLine("ok");
}

} // namespace watchflow
