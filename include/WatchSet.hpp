#pragma once

#include "EventSource.hpp"
#include "OutputSink.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace watchflow {

/**
 * WatchSet owns the directories a Pipeline watches and the recursive roots
 * whose subtrees are kept under watch as directories appear.
 *
 * All members are safe to call from concurrent rescans. While attached to
 * an EventSource, every newly added directory is subscribed immediately.
 */
class WatchSet {
public:
  WatchSet(std::shared_ptr<OutputSink> out, bool verbose);

  // Resolves and appends path, returning the resolved form. Adding a path
  // that is already watched is a no-op. Throws ResolutionError.
  std::string add(const std::string &path);

  // Records path as a recursive root and adds it with every directory below
  // it. With ignoreHidden, hidden subdirectories and their subtrees are
  // skipped. Unreadable subdirectories are skipped. Throws ResolutionError
  // if path itself cannot be resolved.
  void addRecursive(const std::string &path, bool ignoreHidden);

  // Handles a CREATE/RENAME event for a directory that appeared under a
  // recursive root. Returns true if the directory was added.
  bool rescan(const RawEvent &event);

  void attach(std::shared_ptr<EventSource> source);
  void detach();

  std::vector<std::string> targets() const;
  std::map<std::string, bool> recursiveRoots() const;
  bool contains(const std::string &path) const;

private:
  std::shared_ptr<OutputSink> m_out;
  bool m_verbose;

  mutable std::mutex m_mutex;
  std::vector<std::string> m_targets;
  std::map<std::string, bool> m_recursiveRoots; // root -> ignoreHidden
  std::shared_ptr<EventSource> m_source;
};

} // namespace watchflow
