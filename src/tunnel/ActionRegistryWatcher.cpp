#include "ActionRegistryWatcher.hpp"

namespace tt {
ActionRegistryWatcher::ActionRegistryWatcher(
    const string& _path, function<void(const ActionManifest&)> _onReload,
    std::chrono::milliseconds _pollInterval)
    : path(_path),
      onReload(_onReload),
      pollInterval(_pollInterval),
      running(false) {
  loadedTime = modificationTime();
}

ActionRegistryWatcher::~ActionRegistryWatcher() { stop(); }

void ActionRegistryWatcher::start() {
  lock_guard<mutex> guard(watchMutex);
  if (running) {
    return;
  }
  running = true;
  watchThread.reset(new thread(&ActionRegistryWatcher::run, this));
}

void ActionRegistryWatcher::stop() {
  {
    lock_guard<mutex> guard(watchMutex);
    if (!running) {
      return;
    }
    running = false;
  }
  watchCondition.notify_all();
  watchThread->join();
  watchThread.reset();
}

void ActionRegistryWatcher::run() {
  el::Helpers::setThreadName("registry-watcher");
  unique_lock<mutex> lock(watchMutex);
  while (!watchCondition.wait_for(lock, pollInterval,
                                  [this] { return !running; })) {
    lock.unlock();
    poll();
    lock.lock();
  }
}

optional<fs::file_time_type> ActionRegistryWatcher::modificationTime() {
  std::error_code ec;
  auto time = fs::last_write_time(path, ec);
  if (ec) {
    return nullopt;
  }
  return time;
}

bool ActionRegistryWatcher::poll() {
  auto time = modificationTime();
  if (!time || time == loadedTime) {
    pendingTime.reset();
    return false;
  }
  if (time != pendingTime) {
    VLOG(1) << path << " changed, waiting for it to settle";
    pendingTime = time;
    return false;
  }
  pendingTime.reset();
  loadedTime = time;

  ActionManifest manifest;
  try {
    manifest = ActionConfig::load(path);
  } catch (const ActionConfigException& ace) {
    LOG(WARNING) << "Not reloading " << path << ": " << ace.what();
    return false;
  }
  LOG(INFO) << "Reloaded " << path << " (" << manifest.registry->size()
            << " actions)";
  onReload(manifest);
  return true;
}
}  // namespace tt
