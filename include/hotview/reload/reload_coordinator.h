#pragma once
#include <hotview/core/config.h>
#include <hotview/core/diagnostics.h>
#include <hotview/markup/element.h>
#include <hotview/platform/event_loop.h>
#include <hotview/platform/file_watcher.h>
#include <hotview/platform/slot_queue.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace hotview::reload {

enum class ReloadState { Idle, Watching, Reparsing, Failed };

const char* reload_state_name(ReloadState state);

// One successfully parsed tree. Never mutated after publication.
struct TreeSnapshot {
    std::shared_ptr<const markup::Element> root;
    std::string source_path;
    std::chrono::system_clock::time_point parsed_at;
    std::uint64_t generation = 0;
    std::chrono::microseconds parse_duration{0};
};

// Owns the published tree for one markup file. start() parses the file once
// and begins watching its directory; every qualifying change is re-parsed on
// a background thread and, on success, swapped in and announced to the
// subscribers. A failed reparse leaves the previous tree published.
class ReloadCoordinator {
public:
    using Listener = std::function<void()>;
    using SubscriptionId = std::uint64_t;

    // With no source, start() watches the directory containing
    // config.source_path with inotify. With a host loop, notifications are
    // posted to it instead of running on the coordinator thread.
    ReloadCoordinator(core::ReloadConfig config, core::DiagnosticEmitter& diagnostics,
                      std::unique_ptr<platform::WatchSource> source = nullptr,
                      platform::EventLoop* host_loop = nullptr);
    ~ReloadCoordinator();

    ReloadCoordinator(const ReloadCoordinator&) = delete;
    ReloadCoordinator& operator=(const ReloadCoordinator&) = delete;

    // Returns false, staying Idle, if the initial parse or the watch setup
    // fails. A stopped coordinator cannot be restarted.
    bool start();
    void stop();

    // Re-parses synchronously on the calling thread. Returns true if a new
    // snapshot was published.
    bool reload_now();

    std::shared_ptr<const TreeSnapshot> snapshot() const;
    ReloadState state() const { return state_.load(); }
    std::uint64_t reparse_count() const { return reparse_count_.load(); }
    std::optional<std::string> last_error() const;

    SubscriptionId subscribe(Listener listener);
    bool unsubscribe(SubscriptionId id);

    const core::ReloadConfig& config() const { return config_; }

private:
    void on_watch_event(const platform::WatchEvent& event);
    void consume(std::stop_token stop);
    bool wait_until_quiet(std::stop_token stop);
    bool reparse();
    std::shared_ptr<const TreeSnapshot> load_snapshot();
    void publish(std::shared_ptr<const TreeSnapshot> snapshot);
    void notify();
    void record_failure(const std::string& stage, const std::string& message);
    ReloadState resting_state() const;

    core::ReloadConfig config_;
    core::DiagnosticEmitter& diagnostics_;
    std::unique_ptr<platform::WatchSource> source_;
    platform::EventLoop* host_loop_;

    platform::SlotQueue<platform::WatchEvent> queue_;
    std::jthread consumer_;

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const TreeSnapshot> snapshot_;
    std::uint64_t generation_ = 0;

    std::mutex reparse_mutex_;
    std::atomic<ReloadState> state_{ReloadState::Idle};
    std::atomic<std::uint64_t> reparse_count_{0};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};

    mutable std::mutex error_mutex_;
    std::optional<std::string> last_error_;

    std::mutex listeners_mutex_;
    std::map<SubscriptionId, Listener> listeners_;
    SubscriptionId next_subscription_ = 1;
};

} // namespace hotview::reload
