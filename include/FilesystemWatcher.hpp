#pragma once
#include "EventSource.hpp"
#include <memory>
#include <string>

namespace watchflow {

/**
 * FilesystemWatcher is the efsw-backed EventSource. Every subscription is a
 * non-recursive efsw watch; a move is reported as RENAME on the old path
 * followed by CREATE on the new one.
 */
class FilesystemWatcher : public EventSource {
public:
  FilesystemWatcher();
  ~FilesystemWatcher() override;

  void open(Handler handler) override;
  bool subscribe(const std::string &path) override;
  void close() override;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace watchflow
