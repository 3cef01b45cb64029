#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace watchflow {

/**
 * OutputSink is a shared, append-only text stream. Each call writes its
 * whole argument under one lock, so lines from concurrent writers never
 * interleave.
 */
class OutputSink {
public:
  explicit OutputSink(std::ostream &stream);

  void write(const std::string &text);
  void writeLine(const std::string &line);

  static std::shared_ptr<OutputSink> stdoutSink();
  static std::shared_ptr<OutputSink> stderrSink();

private:
  std::mutex m_mutex;
  std::ostream &m_stream;
};

} // namespace watchflow
