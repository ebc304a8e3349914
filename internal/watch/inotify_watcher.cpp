#include "inotify_watcher.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace trailwatch::watch {

using observability::IntField;
using observability::StringField;

namespace {

constexpr uint32_t kDirectoryMask = IN_CREATE | IN_MOVED_TO | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM | IN_ONLYDIR;

constexpr std::size_t kReadBufferSize = 64 * 1024;

} // namespace

InotifyWatcher::InotifyWatcher(Options options, const ExclusionFilter& filter, Sink sink)
    : options_(std::move(options)), filter_(filter), sink_(std::move(sink)) {
  if (!sink_) {
    throw std::invalid_argument("watcher requires a sink");
  }
}

InotifyWatcher::~InotifyWatcher() {
  Stop();
}

void InotifyWatcher::Start() {
  if (running_) {
    return;
  }

  fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (fd_ < 0) {
    throw util::WatchError(std::string("inotify_init1 failed: ") + std::strerror(errno));
  }
  if (::pipe2(wake_, O_NONBLOCK | O_CLOEXEC) != 0) {
    const int err = errno;
    CloseDescriptors();
    throw util::WatchError(std::string("pipe2 failed: ") + std::strerror(err));
  }

  for (const auto& configured : options_.roots) {
    const auto root = NormalizeRoot(configured);
    if (!AddWatch(root, 0)) {
      CloseDescriptors();
      throw util::WatchError("cannot watch root: " + root);
    }
    auto files = AddWatchTree(root, 0);

    std::lock_guard lock(mutex_);
    files_.insert(files.begin(), files.end());
  }

  TRAILWATCH_LOG_INFO("watching", {IntField("roots", static_cast<int64_t>(options_.roots.size())),
                                   IntField("directories", static_cast<int64_t>(WatchCount()))});

  running_ = true;
  thread_  = std::thread(&InotifyWatcher::Run, this);
}

void InotifyWatcher::Stop() {
  if (running_.exchange(false)) {
    const char byte = 'x';
    if (::write(wake_[1], &byte, 1) < 0 && errno != EAGAIN) {
      TRAILWATCH_LOG_WARN("watcher wake failed", {StringField("error", std::strerror(errno))});
    }
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  CloseDescriptors();
}

void InotifyWatcher::CloseDescriptors() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  for (int& end : wake_) {
    if (end >= 0) {
      ::close(end);
      end = -1;
    }
  }
  std::lock_guard lock(mutex_);
  watches_.clear();
  files_.clear();
}

std::size_t InotifyWatcher::WatchCount() const {
  std::lock_guard lock(mutex_);
  return watches_.size();
}

bool InotifyWatcher::AddWatch(const std::string& directory, uint32_t level) {
  const int wd = ::inotify_add_watch(fd_, directory.c_str(), kDirectoryMask);
  if (wd < 0) {
    TRAILWATCH_LOG_WARN("inotify_add_watch failed", {StringField("path", directory), StringField("error", std::strerror(errno))});
    return false;
  }

  std::lock_guard lock(mutex_);
  watches_[wd] = WatchedDirectory{directory, level};
  return true;
}

std::vector<std::string> InotifyWatcher::AddWatchTree(const std::string& directory, uint32_t level) {
  std::vector<std::string> files;
  WalkTree(
      directory, level, options_.limits, filter_, [this](const std::string& path, uint32_t child_level) { AddWatch(path, child_level); },
      [&files](const std::string& path) { files.push_back(path); });
  return files;
}

std::vector<std::string> InotifyWatcher::ForgetTree(const std::string& directory, bool remove_watches) {
  const std::string prefix = directory + "/";

  std::lock_guard          lock(mutex_);
  std::vector<std::string> files;
  for (auto it = files_.lower_bound(prefix); it != files_.end() && it->compare(0, prefix.size(), prefix) == 0;) {
    files.push_back(*it);
    it = files_.erase(it);
  }

  if (remove_watches) {
    for (auto it = watches_.begin(); it != watches_.end();) {
      const auto& watched = it->second.path;
      if (watched == directory || watched.compare(0, prefix.size(), prefix) == 0) {
        ::inotify_rm_watch(fd_, it->first);
        it = watches_.erase(it);
      } else {
        ++it;
      }
    }
  }
  return files;
}

void InotifyWatcher::Run() {
  alignas(struct inotify_event) char buffer[kReadBufferSize];

  pollfd fds[2];
  fds[0] = {fd_, POLLIN, 0};
  fds[1] = {wake_[0], POLLIN, 0};

  while (running_) {
    const int ready = ::poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR) continue;
      TRAILWATCH_LOG_ERROR("watcher poll failed", {StringField("error", std::strerror(errno))});
      break;
    }
    if (fds[1].revents & POLLIN) {
      break;
    }
    if (!(fds[0].revents & POLLIN)) {
      continue;
    }

    while (true) {
      const ssize_t length = ::read(fd_, buffer, sizeof(buffer));
      if (length < 0) {
        if (errno != EAGAIN && errno != EINTR) {
          TRAILWATCH_LOG_ERROR("watcher read failed", {StringField("error", std::strerror(errno))});
        }
        break;
      }
      if (length == 0) break;

      for (ssize_t offset = 0; offset < length;) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(buffer + offset);
        Dispatch(*event);
        offset += static_cast<ssize_t>(sizeof(struct inotify_event) + event->len);
      }
    }
  }
}

void InotifyWatcher::Dispatch(const struct inotify_event& event) {
  if (event.mask & IN_Q_OVERFLOW) {
    TRAILWATCH_LOG_WARN("inotify queue overflow; notifications lost");
    return;
  }

  WatchedDirectory parent;
  {
    std::lock_guard lock(mutex_);
    auto            it = watches_.find(event.wd);
    if (it == watches_.end()) return;
    if (event.mask & IN_IGNORED) {
      watches_.erase(it);
      return;
    }
    parent = it->second;
  }

  if (event.len == 0) return;

  const std::string path         = parent.path + "/" + event.name;
  const bool        is_directory = (event.mask & IN_ISDIR) != 0;

  if (filter_.IsExcluded(path, is_directory)) return;

  if (is_directory) {
    if ((event.mask & (IN_CREATE | IN_MOVED_TO)) && parent.level + 1 <= options_.limits.max_depth) {
      if (!AddWatch(path, parent.level + 1)) return;
      auto files = AddWatchTree(path, parent.level + 1);
      {
        std::lock_guard lock(mutex_);
        files_.insert(files.begin(), files.end());
      }
      for (auto& file : files) {
        sink_(model::Notification{model::NotificationKind::kAppeared, std::move(file)});
      }
    } else if (event.mask & (IN_DELETE | IN_MOVED_FROM)) {
      // a deleted directory's watches go away with IN_IGNORED
      for (auto& file : ForgetTree(path, (event.mask & IN_MOVED_FROM) != 0)) {
        sink_(model::Notification{model::NotificationKind::kDisappeared, std::move(file)});
      }
    }
    return;
  }

  if (event.mask & (IN_CREATE | IN_MOVED_TO)) {
    {
      std::lock_guard lock(mutex_);
      files_.insert(path);
    }
    sink_(model::Notification{model::NotificationKind::kAppeared, path});
  } else if (event.mask & IN_CLOSE_WRITE) {
    sink_(model::Notification{model::NotificationKind::kChanged, path});
  } else if (event.mask & (IN_DELETE | IN_MOVED_FROM)) {
    {
      std::lock_guard lock(mutex_);
      files_.erase(path);
    }
    sink_(model::Notification{model::NotificationKind::kDisappeared, path});
  }
}

} // namespace trailwatch::watch
