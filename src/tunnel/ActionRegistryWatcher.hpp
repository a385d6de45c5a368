#ifndef __TT_ACTION_REGISTRY_WATCHER__
#define __TT_ACTION_REGISTRY_WATCHER__

#include "ActionConfig.hpp"
#include "Headers.hpp"

namespace tt {
/**
 * @brief Reloads the action manifest when the file changes on disk.
 *
 * Polls the modification time and waits for it to hold still for one poll
 * before reloading, so an editor's multi-step save produces one reload. A
 * manifest that fails to load is logged and skipped; the callback is only
 * called with a valid manifest.
 */
class ActionRegistryWatcher {
 public:
  ActionRegistryWatcher(
      const string& _path, function<void(const ActionManifest&)> _onReload,
      std::chrono::milliseconds _pollInterval = std::chrono::milliseconds(500));
  ~ActionRegistryWatcher();

  void start();
  void stop();

  /**
   * @brief Runs one polling step.
   * @return true if the manifest was reloaded.
   */
  bool poll();

 protected:
  string path;
  function<void(const ActionManifest&)> onReload;
  std::chrono::milliseconds pollInterval;

  optional<fs::file_time_type> loadedTime;
  optional<fs::file_time_type> pendingTime;

  unique_ptr<thread> watchThread;
  mutex watchMutex;
  condition_variable watchCondition;
  bool running;

  optional<fs::file_time_type> modificationTime();
  void run();
};
}  // namespace tt

#endif  // __TT_ACTION_REGISTRY_WATCHER__
