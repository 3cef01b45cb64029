#include "FilesystemWatcher.hpp"
#include "Errors.hpp"
#include <efsw/efsw.hpp>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <system_error>

namespace watchflow {

namespace {

std::string joinPath(const std::string &dir, const std::string &filename) {
  std::string fullPath = dir + filename;
  if (!dir.empty() && dir.back() != '/' && dir.back() != '\\')
    fullPath = dir + "/" + filename;
  return std::filesystem::path(fullPath).lexically_normal().generic_string();
}

} // namespace

struct FilesystemWatcher::Impl : public efsw::FileWatchListener {
  std::unique_ptr<efsw::FileWatcher> watcher;
  std::map<std::string, efsw::WatchID> watches;
  EventSource::Handler handler;
  // efsw holds its own lock while calling handleFileAction, so the handler
  // gets a mutex that is never held across an efsw call.
  std::mutex handlerMtx;
  std::mutex watchMtx;

  void setHandler(EventSource::Handler h) {
    std::lock_guard<std::mutex> lock(handlerMtx);
    handler = std::move(h);
  }

  void emit(const std::string &path, Op op) {
    EventSource::Handler h;
    {
      std::lock_guard<std::mutex> lock(handlerMtx);
      h = handler;
    }
    if (h)
      h(RawEvent{path, op});
  }

  // Implement FileWatchListener
  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename) override {
    std::string fullPath = joinPath(dir, filename);
    switch (action) {
    case efsw::Actions::Add:
      emit(fullPath, Op::Create);
      break;
    case efsw::Actions::Delete:
      emit(fullPath, Op::Remove);
      break;
    case efsw::Actions::Modified:
      emit(fullPath, Op::Write);
      break;
    case efsw::Actions::Moved:
      if (!oldFilename.empty())
        emit(joinPath(dir, oldFilename), Op::Rename);
      emit(fullPath, Op::Create);
      break;
    default:
      break;
    }
  }
};

FilesystemWatcher::FilesystemWatcher() : m_impl(std::make_unique<Impl>()) {}

FilesystemWatcher::~FilesystemWatcher() { close(); }

void FilesystemWatcher::open(Handler handler) {
  std::lock_guard<std::mutex> lock(m_impl->watchMtx);
  if (m_impl->watcher)
    throw SetupError("watcher already open");

  try {
    m_impl->setHandler(std::move(handler));
    m_impl->watcher = std::make_unique<efsw::FileWatcher>();
    m_impl->watcher->watch();
  } catch (const std::system_error &e) {
    m_impl->watcher.reset();
    m_impl->setHandler(nullptr);
    throw SetupError(std::string("cannot start efsw watcher: ") + e.what());
  }
}

bool FilesystemWatcher::subscribe(const std::string &path) {
  std::lock_guard<std::mutex> lock(m_impl->watchMtx);
  if (!m_impl->watcher) {
    std::cerr << "[Watcher] Cannot watch " << path << ": watcher not open"
              << std::endl;
    return false;
  }
  if (m_impl->watches.count(path))
    return true;

  efsw::WatchID id = m_impl->watcher->addWatch(path, m_impl.get(), false);
  if (id < 0) {
    std::cerr << "[Watcher] Failed to watch " << path << ": "
              << efsw::Errors::Log::getLastErrorLog() << std::endl;
    return false;
  }
  m_impl->watches[path] = id;
  return true;
}

void FilesystemWatcher::close() {
  m_impl->setHandler(nullptr);

  std::lock_guard<std::mutex> lock(m_impl->watchMtx);
  if (!m_impl->watcher)
    return;
  for (const auto &w : m_impl->watches)
    m_impl->watcher->removeWatch(w.second);
  m_impl->watches.clear();
  m_impl->watcher.reset();
}

} // namespace watchflow
