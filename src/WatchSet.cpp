#include "WatchSet.hpp"
#include "Errors.hpp"
#include "PathUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace watchflow {

WatchSet::WatchSet(std::shared_ptr<OutputSink> out, bool verbose)
    : m_out(out ? std::move(out) : OutputSink::stdoutSink()),
      m_verbose(verbose) {}

std::string WatchSet::add(const std::string &path) {
  std::string resolved;
  try {
    resolved = absPath(path);
  } catch (const ResolutionError &e) {
    if (m_verbose)
      m_out->writeLine(std::string("[WatchSet] ") + e.what());
    throw;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  if (std::find(m_targets.begin(), m_targets.end(), resolved) !=
      m_targets.end()) {
    return resolved;
  }
  m_targets.push_back(resolved);

  if (m_source) {
    bool ok = m_source->subscribe(resolved);
    if (m_verbose)
      m_out->writeLine(ok ? "Watching " + resolved
                          : "[WatchSet] Cannot subscribe " + resolved);
  }
  return resolved;
}

void WatchSet::addRecursive(const std::string &path, bool ignoreHidden) {
  std::string root = absPath(path);
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_recursiveRoots[root] = ignoreHidden;
  }

  std::vector<fs::path> pending{fs::path(root)};
  while (!pending.empty()) {
    fs::path dir = std::move(pending.back());
    pending.pop_back();

    try {
      add(dir.generic_string());
    } catch (const ResolutionError &) {
      // Vanished or unreadable since it was listed
      continue;
    }

    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied,
                              ec);
    if (ec) {
      if (m_verbose)
        m_out->writeLine("[WatchSet] Skipping " + dir.generic_string() + ": " +
                         ec.message());
      continue;
    }

    for (fs::directory_iterator end; it != end;) {
      std::error_code entryEc;
      const auto &entry = *it;
      if (entry.is_directory(entryEc) && !entry.is_symlink(entryEc) &&
          !(ignoreHidden && isHidden(entry.path().string()))) {
        pending.push_back(entry.path());
      }
      it.increment(ec);
      if (ec)
        break;
    }
  }
}

bool WatchSet::rescan(const RawEvent &event) {
  if (!any(event.op) || (event.op & Op::DirOps) != event.op)
    return false;

  std::error_code ec;
  if (!fs::is_directory(event.path, ec))
    return false;

  // Symlinked directories are never followed, as in the initial walk
  if (fs::is_symlink(fs::symlink_status(event.path, ec)) || ec)
    return false;

  // Containment is checked on the real location
  std::string resolved;
  try {
    resolved = absPath(event.path);
  } catch (const ResolutionError &) {
    return false;
  }

  std::map<std::string, bool> roots = recursiveRoots();
  bool hidden = isHidden(resolved);
  for (const auto &root : roots) {
    if (hidden && root.second)
      continue;
    if (!isContained(root.first, resolved))
      continue;

    try {
      addRecursive(resolved, root.second);
    } catch (const ResolutionError &e) {
      if (m_verbose)
        m_out->writeLine(std::string("[WatchSet] ") + e.what());
      return false;
    }
    return true;
  }
  return false;
}

void WatchSet::attach(std::shared_ptr<EventSource> source) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_source = std::move(source);
  if (!m_source)
    return;
  for (const auto &target : m_targets) {
    bool ok = m_source->subscribe(target);
    if (m_verbose)
      m_out->writeLine(ok ? "Watching " + target
                          : "[WatchSet] Cannot subscribe " + target);
  }
}

void WatchSet::detach() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_source.reset();
}

std::vector<std::string> WatchSet::targets() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_targets;
}

std::map<std::string, bool> WatchSet::recursiveRoots() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_recursiveRoots;
}

bool WatchSet::contains(const std::string &path) const {
  std::string key = fs::path(path).lexically_normal().generic_string();
  std::lock_guard<std::mutex> lock(m_mutex);
  return std::find(m_targets.begin(), m_targets.end(), key) != m_targets.end();
}

} // namespace watchflow
