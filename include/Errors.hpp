#pragma once

#include <stdexcept>
#include <string>

namespace watchflow {

// A watch path could not be canonicalized.
class ResolutionError : public std::runtime_error {
public:
  ResolutionError(const std::string &path, const std::string &reason)
      : std::runtime_error("cannot resolve " + path + ": " + reason),
        m_path(path) {}

  const std::string &path() const { return m_path; }

private:
  std::string m_path;
};

// The event source could not be initialized.
class SetupError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A task in a workflow chain failed.
class TaskError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace watchflow
