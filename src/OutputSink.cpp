#include "OutputSink.hpp"
#include <iostream>

namespace watchflow {

OutputSink::OutputSink(std::ostream &stream) : m_stream(stream) {}

void OutputSink::write(const std::string &text) {
  if (text.empty())
    return;
  std::lock_guard<std::mutex> lock(m_mutex);
  m_stream << text;
  m_stream.flush();
}

void OutputSink::writeLine(const std::string &line) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_stream << line << '\n';
  m_stream.flush();
}

std::shared_ptr<OutputSink> OutputSink::stdoutSink() {
  static auto sink = std::make_shared<OutputSink>(std::cout);
  return sink;
}

std::shared_ptr<OutputSink> OutputSink::stderrSink() {
  static auto sink = std::make_shared<OutputSink>(std::cerr);
  return sink;
}

} // namespace watchflow
