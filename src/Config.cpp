#include "Config.hpp"
#include "Errors.hpp"
#include "Pipeline.hpp"
#include "Workflow.hpp"
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace watchflow {

namespace {

constexpr std::chrono::milliseconds kMaxBatchInterval = std::chrono::hours(24);

template <typename T>
T valueOr(const json &obj, const char *key, const T &fallback) {
  if (!obj.contains(key) || obj[key].is_null())
    return fallback;
  return obj[key].get<T>();
}

WatchConfig parseWatch(const json &item) {
  WatchConfig watch;
  if (item.is_string()) {
    watch.path = item.get<std::string>();
    return watch;
  }
  watch.path = item.at("path").get<std::string>();
  watch.recursive = valueOr<bool>(item, "recursive", false);
  watch.includeHidden = valueOr<bool>(item, "include_hidden", false);
  return watch;
}

TaskConfig parseTask(const json &item) {
  TaskConfig task;
  task.command = item.at("command").get<std::string>();
  task.args = valueOr<std::vector<std::string>>(item, "args", {});
  task.failOnOutput = valueOr<bool>(item, "fail_on_output", false);
  if (task.command.empty())
    throw ConfigError("task command is empty");
  return task;
}

WorkflowConfig parseWorkflow(const json &item) {
  WorkflowConfig wf;
  wf.name = valueOr<std::string>(item, "name", "<UNNAMED>");
  wf.patterns = valueOr<std::vector<std::string>>(item, "patterns", {});
  wf.stopOnError = valueOr<bool>(item, "stop_on_error", true);

  if (item.contains("ops") && !item["ops"].is_null()) {
    wf.ops = Op::None;
    for (const auto &op : item["ops"])
      wf.ops |= parseOp(op.get<std::string>());
  }
  if (item.contains("tasks")) {
    for (const auto &task : item["tasks"])
      wf.tasks.push_back(parseTask(task));
  }
  return wf;
}

} // namespace

PipelineConfig parseConfig(const std::string &text) {
  PipelineConfig config;
  try {
    auto data = json::parse(text);
    if (!data.is_object())
      throw ConfigError("configuration must be a JSON object");

    config.name = valueOr<std::string>(data, "name", "");
    config.verbose = valueOr<bool>(data, "verbose", false);
    if (data.contains("batch_interval_ms") &&
        !data["batch_interval_ms"].is_null()) {
      const json &value = data["batch_interval_ms"];
      if (!value.is_number_integer())
        throw ConfigError("batch_interval_ms must be an integer");
      // Unsigned values above INT64_MAX wrap negative and are rejected too
      int64_t interval = value.get<int64_t>();
      if (interval <= 0 || interval > kMaxBatchInterval.count())
        throw ConfigError("batch_interval_ms must be between 1 and " +
                          std::to_string(kMaxBatchInterval.count()));
      config.batchInterval = std::chrono::milliseconds(interval);
    }

    if (data.contains("watches")) {
      for (const auto &item : data["watches"])
        config.watches.push_back(parseWatch(item));
    }
    if (data.contains("workflows")) {
      for (const auto &item : data["workflows"])
        config.workflows.push_back(parseWorkflow(item));
    }
  } catch (const json::exception &e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }
  return config;
}

PipelineConfig loadConfig(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw ConfigError("cannot open configuration file: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  return parseConfig(ss.str());
}

void addWorkflows(Pipeline &pipeline, const PipelineConfig &config) {
  for (const auto &wfc : config.workflows) {
    auto wf = std::make_shared<TaskWorkflow>(wfc.name, wfc.ops);
    wf->setStopOnError(wfc.stopOnError);
    for (const auto &pattern : wfc.patterns)
      wf->addPattern(pattern);
    for (const auto &tc : wfc.tasks)
      wf->addTask(
          std::make_shared<CommandTask>(tc.command, tc.args, tc.failOnOutput));
    pipeline.add(wf);
  }
}

} // namespace watchflow
