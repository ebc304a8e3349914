#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "exclusion_filter.hpp"
#include "internal/model/notification.hpp"
#include "tree_walker.hpp"

struct inotify_event;

namespace trailwatch::watch {

/*
  Recursive inotify watch source (Linux).

    IN_CREATE, IN_MOVED_TO       -> appeared
    IN_CLOSE_WRITE               -> changed
    IN_DELETE, IN_MOVED_FROM     -> disappeared

  A directory that appears is watched in turn and the files already in
  it are reported as appeared. A directory that is moved away or
  removed reports disappeared for every file still known below it, so
  a renamed directory resolves file by file like any other move.

  The sink runs on the reader thread and must only hand the notification
  off (e.g. EventLoop::Post).
*/
class InotifyWatcher {
 public:
  struct Options {
    std::vector<std::string> roots;
    WalkLimits               limits;
  };

  using Sink = std::function<void(model::Notification)>;

  InotifyWatcher(Options options, const ExclusionFilter& filter, Sink sink);
  ~InotifyWatcher();

  InotifyWatcher(const InotifyWatcher&)            = delete;
  InotifyWatcher& operator=(const InotifyWatcher&) = delete;

  // Installs the watches and starts the reader thread.
  // Throws util::WatchError when inotify or a root cannot be set up.
  void Start();

  void Stop();

  std::size_t WatchCount() const;

 private:
  struct WatchedDirectory {
    std::string path;
    uint32_t    level = 0;
  };

  void Run();
  void Dispatch(const struct inotify_event& event);

  bool AddWatch(const std::string& directory, uint32_t level);

  // Watches directory and everything below it; returns the files found.
  std::vector<std::string> AddWatchTree(const std::string& directory, uint32_t level);

  // Drops the files and watches below directory; returns the files.
  std::vector<std::string> ForgetTree(const std::string& directory, bool remove_watches);

  void CloseDescriptors();

  Options                options_;
  const ExclusionFilter& filter_;
  Sink                   sink_;

  int fd_      = -1;
  int wake_[2] = {-1, -1};

  std::thread       thread_;
  std::atomic<bool> running_{false};

  mutable std::mutex                        mutex_;
  std::unordered_map<int, WatchedDirectory> watches_;
  std::set<std::string>                     files_;
};

} // namespace trailwatch::watch
