#include <hotview/platform/file_watcher.h>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace hotview::platform {

namespace {

constexpr uint32_t kWatchMask = IN_MODIFY | IN_ATTRIB | IN_CREATE | IN_DELETE |
                                IN_DELETE_SELF | IN_MOVED_FROM | IN_MOVED_TO |
                                IN_MOVE_SELF | IN_CLOSE_WRITE;

WatchEvent::Kind classify(uint32_t mask) {
    if (mask & IN_MODIFY) return WatchEvent::Kind::ContentWrite;
    if (mask & IN_ATTRIB) return WatchEvent::Kind::Attributes;
    if (mask & (IN_ACCESS | IN_OPEN | IN_CLOSE_NOWRITE)) return WatchEvent::Kind::Access;
    if (mask & IN_CREATE) return WatchEvent::Kind::Create;
    if (mask & (IN_DELETE | IN_DELETE_SELF)) return WatchEvent::Kind::Remove;
    if (mask & (IN_MOVED_FROM | IN_MOVED_TO | IN_MOVE_SELF)) return WatchEvent::Kind::Rename;
    return WatchEvent::Kind::Other;
}

std::runtime_error errno_error(const std::string& what) {
    return std::runtime_error(what + ": " + std::strerror(errno));
}

} // anonymous namespace

const char* watch_event_kind_name(WatchEvent::Kind kind) {
    switch (kind) {
        case WatchEvent::Kind::ContentWrite: return "content-write";
        case WatchEvent::Kind::Attributes:   return "attributes";
        case WatchEvent::Kind::Access:       return "access";
        case WatchEvent::Kind::Create:       return "create";
        case WatchEvent::Kind::Remove:       return "remove";
        case WatchEvent::Kind::Rename:       return "rename";
        case WatchEvent::Kind::Other:        return "other";
    }
    return "unknown";
}

FileWatcher::FileWatcher(std::string directory, bool recursive)
    : directory_(std::move(directory)), recursive_(recursive) {}

FileWatcher::~FileWatcher() {
    stop();
}

void FileWatcher::start(Callback callback) {
    if (thread_.joinable()) {
        throw std::runtime_error("FileWatcher already started");
    }

    inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        throw errno_error("inotify_init1 failed");
    }
    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        auto error = errno_error("eventfd failed");
        close_descriptors();
        throw error;
    }

    if (!add_watch(directory_)) {
        auto error = errno_error("cannot watch " + directory_);
        close_descriptors();
        throw error;
    }
    if (recursive_) {
        add_watch_tree(directory_);
    }

    callback_ = std::move(callback);
    thread_ = std::jthread([this](std::stop_token stop) { watch_loop(stop); });
}

void FileWatcher::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        uint64_t one = 1;
        while (::write(wake_fd_, &one, sizeof(one)) < 0 && errno == EINTR) {
        }
        thread_.join();
    }
    close_descriptors();
    std::lock_guard lock(watches_mutex_);
    watches_.clear();
}

size_t FileWatcher::watch_count() const {
    std::lock_guard lock(watches_mutex_);
    return watches_.size();
}

bool FileWatcher::add_watch(const std::string& directory) {
    int wd = ::inotify_add_watch(inotify_fd_, directory.c_str(), kWatchMask | IN_ONLYDIR);
    if (wd < 0) return false;
    std::lock_guard lock(watches_mutex_);
    watches_[wd] = directory;
    return true;
}

void FileWatcher::add_watch_tree(const std::string& directory) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
            // A subdirectory that vanished in the meantime is simply not watched
            add_watch(it->path().string());
        }
    }
}

void FileWatcher::watch_loop(std::stop_token stop) {
    pollfd fds[2] = {
        {inotify_fd_, POLLIN, 0},
        {wake_fd_, POLLIN, 0},
    };

    while (!stop.stop_requested()) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (fds[1].revents & POLLIN) break;
        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) break;
        if (fds[0].revents & POLLIN) {
            drain_events();
        }
    }
}

void FileWatcher::drain_events() {
    alignas(inotify_event) char buffer[4096];

    for (;;) {
        ssize_t n = ::read(inotify_fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            return;  // EAGAIN: drained
        }
        if (n == 0) return;

        for (char* p = buffer; p < buffer + n;) {
            auto* raw = reinterpret_cast<inotify_event*>(p);
            p += sizeof(inotify_event) + raw->len;

            if (raw->mask & IN_IGNORED) {
                std::lock_guard lock(watches_mutex_);
                watches_.erase(raw->wd);
                continue;
            }

            WatchEvent event;
            if (raw->mask & IN_Q_OVERFLOW) {
                event.kind = WatchEvent::Kind::Other;
                event.path = directory_;
            } else {
                std::string dir;
                {
                    std::lock_guard lock(watches_mutex_);
                    auto it = watches_.find(raw->wd);
                    if (it == watches_.end()) continue;
                    dir = it->second;
                }
                event.kind = classify(raw->mask);
                event.path = raw->len > 0 ? dir + "/" + raw->name : dir;

                if (recursive_ && (raw->mask & IN_ISDIR) &&
                    (raw->mask & (IN_CREATE | IN_MOVED_TO))) {
                    add_watch(event.path);
                    add_watch_tree(event.path);
                }
            }

            if (callback_) callback_(event);
        }
    }
}

void FileWatcher::close_descriptors() {
    if (inotify_fd_ >= 0) {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
        wake_fd_ = -1;
    }
}

} // namespace hotview::platform
