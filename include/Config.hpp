#pragma once

#include "Batcher.hpp"
#include "types.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace watchflow {

class Pipeline;

struct WatchConfig {
  std::string path;
  bool recursive = false;
  bool includeHidden = false;
};

struct TaskConfig {
  std::string command;
  std::vector<std::string> args;
  bool failOnOutput = false;
};

struct WorkflowConfig {
  std::string name;
  std::vector<std::string> patterns;
  Op ops = Op::All;
  bool stopOnError = true;
  std::vector<TaskConfig> tasks;
};

struct PipelineConfig {
  std::string name;
  bool verbose = false;
  std::chrono::milliseconds batchInterval = kDefaultBatchInterval;
  std::vector<WatchConfig> watches;
  std::vector<WorkflowConfig> workflows;
};

// Parse a JSON pipeline description. Throws ConfigError.
PipelineConfig parseConfig(const std::string &text);

// Read and parse a JSON file. Throws ConfigError.
PipelineConfig loadConfig(const std::string &path);

// Registers the configured workflows on pipeline. Watches are left to the
// caller so each ResolutionError can be reported separately.
void addWorkflows(Pipeline &pipeline, const PipelineConfig &config);

} // namespace watchflow
