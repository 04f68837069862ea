#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

namespace hotview::platform {

struct WatchEvent {
    enum class Kind { ContentWrite, Attributes, Access, Create, Remove, Rename, Other };
    Kind kind = Kind::Other;
    std::string path;
};

const char* watch_event_kind_name(WatchEvent::Kind kind);

// A source of filesystem events. The callback is invoked synchronously on the
// source's own delivery thread and may block; the source does not deliver the
// next event until it returns.
class WatchSource {
public:
    using Callback = std::function<void(const WatchEvent&)>;

    virtual ~WatchSource() = default;

    virtual void start(Callback callback) = 0;
    virtual void stop() = 0;
};

// inotify-backed watcher for a directory and, when recursive, every
// subdirectory below it including ones created after start().
class FileWatcher : public WatchSource {
public:
    explicit FileWatcher(std::string directory, bool recursive = true);
    ~FileWatcher() override;

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    // Throws std::runtime_error if inotify is unavailable or the directory
    // cannot be watched.
    void start(Callback callback) override;
    void stop() override;

    const std::string& directory() const { return directory_; }
    size_t watch_count() const;

private:
    void add_watch_tree(const std::string& directory);
    bool add_watch(const std::string& directory);
    void watch_loop(std::stop_token stop);
    void drain_events();
    void close_descriptors();

    std::string directory_;
    bool recursive_;
    int inotify_fd_ = -1;
    int wake_fd_ = -1;
    Callback callback_;
    std::unordered_map<int, std::string> watches_;
    mutable std::mutex watches_mutex_;
    std::jthread thread_;
};

} // namespace hotview::platform
